#include "JsonCodec.h"
#include "ValueFormat.h"

using json = nlohmann::json;

namespace {
json scalarToJson(const UAScalar& s) {
    return std::visit([](auto&& x) -> json {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, ByteString>)    return json(toHex(x.bytes, false));
        else if constexpr (std::is_same_v<T, DateTime>) return json(formatDateTime(x.unixMs));
        else if constexpr (std::is_same_v<T, LocalizedText>)
            return json{ {"locale", x.locale}, {"text", x.text} };
        else if constexpr (std::is_same_v<T, NodeIdValue>) return json(x.id);
        else return json(x);
    }, s);
}
} // namespace

json uaValueToJson(const UAValue& v) {
    if (auto s = std::get_if<UAScalar>(&v)) return scalarToJson(*s);
    if (auto a = std::get_if<UAArray>(&v)) {
        json arr = json::array();
        for (const auto& e : *a) arr.push_back(scalarToJson(e));
        return arr;
    }
    return json(nullptr);
}

json broadcastToJson(const BroadcastMessage& m) {
    return json{
        {"node_id",           m.nodeId},
        {"name",              m.name},
        {"data_type",         m.dataType},
        {"value",             m.value},
        {"timestamp",         m.timestamp},
        {"severity",          m.severity},
        {"status_code",       m.rawStatus},
        {"status_name",       m.symbolicName},
        {"sub_code",          m.subCode},
        {"structure_changed", m.structureChanged},
        {"semantics_changed", m.semanticsChanged},
        {"info_bits",         m.infoBits}
    };
}

json nodeAttributesToJson(const NodeAttributes& a) {
    json j{
        {"node_id",      a.nodeId},
        {"name",         a.name},
        {"description",  a.description},
        {"node_class",   a.nodeClass},
        {"data_type",    a.dataType},
        {"access_level", a.accessLevel},
        {"value",        a.value},
        {"value_rank",   a.valueRank}
    };
    if (!a.arrayDimensions.empty()) j["array_dimensions"] = a.arrayDimensions;
    return j;
}

json tagRecordToJson(const TagExportRecord& t) {
    json j{ {"node_id", t.nodeId}, {"name", t.name} };
    if (!t.dataType.empty())    j["data_type"]   = t.dataType;
    if (!t.description.empty()) j["description"] = t.description;
    if (!t.path.empty())        j["path"]        = t.path;
    return j;
}

const char* hubActionName(HubAction a) {
    switch (a) {
        case HubAction::Subscribe:      return "subscribe";
        case HubAction::Unsubscribe:    return "unsubscribe";
        case HubAction::SubscribeAll:   return "subscribe_all";
        case HubAction::UnsubscribeAll: return "unsubscribe_all";
    }
    return "?";
}

bool parseHubControl(const std::string& text, HubControl& out, std::string& err) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        err = std::string("invalid JSON: ") + e.what();
        return false;
    }
    if (!j.is_object() || !j.contains("action") || !j["action"].is_string()) {
        err = "missing 'action'";
        return false;
    }
    const std::string action = j["action"].get<std::string>();
    HubControl c;
    if      (action == "subscribe")       c.action = HubAction::Subscribe;
    else if (action == "unsubscribe")     c.action = HubAction::Unsubscribe;
    else if (action == "subscribe_all")   c.action = HubAction::SubscribeAll;
    else if (action == "unsubscribe_all") c.action = HubAction::UnsubscribeAll;
    else {
        err = "unknown action '" + action + "'";
        return false;
    }

    if (j.contains("node_ids")) {
        const json& ids = j["node_ids"];
        if (!ids.is_array()) {
            err = "'node_ids' must be an array";
            return false;
        }
        for (const auto& id : ids) {
            if (!id.is_string()) {
                err = "'node_ids' must contain strings";
                return false;
            }
            c.nodeIds.push_back(id.get<std::string>());
        }
    }
    if ((c.action == HubAction::Subscribe || c.action == HubAction::Unsubscribe) && c.nodeIds.empty()) {
        err = std::string("'") + hubActionName(c.action) + "' without node ids";
        return false;
    }
    out = std::move(c);
    return true;
}
