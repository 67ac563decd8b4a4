#include "WriteEngine.h"
#include "Logger.h"
#include "ValueFormat.h"
#include "ValueParser.h"
#include <algorithm>

namespace {

constexpr uint8_t kAccessWrite = 0x02;

const BuiltinType kCandidates[] = {
    BuiltinType::ByteString, BuiltinType::Double, BuiltinType::Float,
    BuiltinType::Int64, BuiltinType::Int32, BuiltinType::Int16,
    BuiltinType::UInt64, BuiltinType::UInt32, BuiltinType::UInt16,
    BuiltinType::Boolean, BuiltinType::String
};

std::string describe(const UAValue& v) {
    return tagOf(v) + " " + formatValue(v);
}

bool isConnectionLoss(uint32_t st) {
    const uint32_t code = st & 0xFFFF0000u;
    return code == UaStatus::BadServerNotConnected || code == UaStatus::BadSessionClosed ||
           code == UaStatus::BadConnectionClosed   || code == UaStatus::BadDisconnect;
}

bool scalarOf(const AttributeResult& r, UAScalar& out) {
    if (!UaStatus::isGood(r.status)) return false;
    auto s = std::get_if<UAScalar>(&r.value);
    if (!s) return false;
    out = *s;
    return true;
}

bool readByte(const AttributeResult& r, uint8_t& out) {
    UAScalar s;
    if (!scalarOf(r, s)) return false;
    if (auto b = std::get_if<uint8_t>(&s)) { out = *b; return true; }
    if (auto u = std::get_if<uint32_t>(&s)) { out = static_cast<uint8_t>(*u); return true; }
    return false;
}

} // namespace

WriteOutcome WriteEngine::execute(IProtocolSession& session, const WriteRequest& req,
                                  std::stop_token st) const {
    try {
        return run(session, req, st);
    } catch (const std::exception& e) {
        WriteOutcome out;
        out.error = std::string("unexpected error: ") + e.what();
        logLine(LogLevel::Error, "Write") << req.nodeId << ": " << out.error;
        return out;
    }
}

bool WriteEngine::attempt(IProtocolSession& session, const std::string& nodeId, const UAValue& v,
                          WriteOutcome& out, std::vector<std::string>& tried, uint32_t& status) const {
    const std::string rep = describe(v);
    if (std::find(tried.begin(), tried.end(), rep) != tried.end()) {
        status = UaStatus::BadTypeMismatch;
        return false;
    }
    tried.push_back(rep);
    status = session.writeValue(nodeId, v, opt_.writeTimeout);
    out.attempts.push_back({ rep, status });
    if (UaStatus::isGood(status)) {
        out.writtenAs = rep;
        return true;
    }
    logLine(LogLevel::Warn, "Write") << nodeId << ": write as " << rep << " failed: "
                                     << statusToString(status);
    return false;
}

WriteOutcome WriteEngine::run(IProtocolSession& session, const WriteRequest& req,
                              std::stop_token st) const {
    WriteOutcome out;
    const std::string& id = req.nodeId;

    // 1) Metadaten
    std::vector<AttributeResult> meta;
    const uint32_t rs = session.readAttributes(
        id, { AttributeId::AccessLevel, AttributeId::UserAccessLevel,
              AttributeId::DataType, AttributeId::ValueRank },
        opt_.readTimeout, meta);
    if (!UaStatus::isGood(rs) || meta.size() != 4) {
        out.error = "reading node metadata failed: " + statusToString(rs);
        logLine(LogLevel::Error, "Write") << id << ": " << out.error;
        return out;
    }

    uint8_t access = 0;
    if (!readByte(meta[1], access) && !readByte(meta[0], access)) access = 0;
    if (!(access & kAccessWrite)) {
        out.error = "node is not writable (access: " + formatAccessLevel(access) + ")";
        logLine(LogLevel::Error, "Write") << id << ": " << out.error;
        return out;
    }

    BuiltinType serverType = BuiltinType::Unknown;
    UAScalar dt;
    if (scalarOf(meta[2], dt))
        if (auto nid = std::get_if<NodeIdValue>(&dt)) serverType = builtinFromNodeId(nid->id);

    int32_t valueRank = -1;
    UAScalar vr;
    if (scalarOf(meta[3], vr))
        if (auto r = std::get_if<int32_t>(&vr)) valueRank = *r;

    // 2) Server-Typ vor Hinweis
    const BuiltinType hint = builtinFromName(req.typeHint);
    BuiltinType target = hint;
    if (serverType != BuiltinType::Unknown) {
        if (hint != serverType)
            logLine(LogLevel::Info, "Write") << id << ": using server data type "
                                             << builtinTypeName(serverType) << " instead of hint '"
                                             << req.typeHint << "'";
        target = serverType;
    }
    if (target == BuiltinType::Unknown) {
        out.error = "unknown data type '" + req.typeHint + "'";
        logLine(LogLevel::Error, "Write") << id << ": " << out.error;
        return out;
    }

    // 3) Wert bauen
    UAValue value;
    bool wasBareDouble = false;
    if (valueRank >= 0) {
        if (!isArrayElementTypeSupported(target)) {
            out.error = std::string("unsupported array element type: ") + builtinTypeName(target);
            logLine(LogLevel::Error, "Write") << id << ": " << out.error;
            return out;
        }
        UAArray arr;
        std::string err;
        if (!parseArrayLiteral(req.literal, target, arr, err)) {
            out.error = err;
            logLine(LogLevel::Error, "Write") << id << ": " << out.error;
            return out;
        }
        value = std::move(arr);
    } else {
        std::vector<AttributeResult> probe;
        const uint32_t ps = session.readAttributes(id, { AttributeId::Value }, opt_.probeTimeout, probe);
        UAScalar current;
        if (UaStatus::isGood(ps) && probe.size() == 1 && scalarOf(probe[0], current)) {
            const BuiltinType probed = typeOf(current);
            if (probed != target && probed != BuiltinType::NodeId && probed != BuiltinType::Unknown) {
                logLine(LogLevel::Info, "Write") << id << ": current value is "
                                                 << builtinTypeName(probed) << ", preferring it over "
                                                 << builtinTypeName(target);
                target = probed;
            }
        } else {
            logLine(LogLevel::Debug, "Write") << id << ": value probe unavailable ("
                                              << statusToString(ps) << ")";
        }
        UAScalar s;
        std::string err;
        if (!convertLiteral(req.literal, target, s, err)) {
            out.error = err;
            logLine(LogLevel::Error, "Write") << id << ": conversion failed: " << err;
            return out;
        }
        wasBareDouble = std::holds_alternative<double>(s);
        value = std::move(s);
    }

    // 4) schreiben
    std::vector<std::string> tried;
    uint32_t ws = UaStatus::Good;
    if (attempt(session, id, value, out, tried, ws)) {
        out.success = true;
        logLine(LogLevel::Info, "Write") << id << ": wrote " << out.writtenAs;
        readBack(session, id, out);
        return out;
    }
    if ((ws & 0xFFFF0000u) != UaStatus::BadTypeMismatch) {
        out.error = "write failed: " + statusToString(ws);
        logLine(LogLevel::Error, "Write") << id << ": " << out.error;
        return out;
    }

    // Retry-Leiter bei Typkonflikt
    // nominaler Skalar und Ein-Element-Array nur nach einem skalaren Erstversuch
    std::vector<UAValue> ladder;
    if (auto s = std::get_if<UAScalar>(&value)) {
        UAScalar nominal;
        std::string ignored;
        const bool haveNominal = serverType != BuiltinType::Unknown &&
                                 convertLiteral(req.literal, serverType, nominal, ignored);
        if (haveNominal) ladder.emplace_back(nominal);
        ladder.emplace_back(UAArray{ haveNominal ? nominal : *s });
        if (wasBareDouble)
            ladder.emplace_back(UAScalar{ static_cast<float>(std::get<double>(*s)) });
    }
    for (BuiltinType c : kCandidates) {
        UAScalar cs;
        std::string err;
        if (!convertLiteral(req.literal, c, cs, err)) continue;
        ladder.emplace_back(cs);
        ladder.emplace_back(UAArray{ cs });
    }

    for (const auto& candidate : ladder) {
        if (st.stop_requested()) {
            out.error = "write cancelled";
            logLine(LogLevel::Warn, "Write") << id << ": " << out.error;
            return out;
        }
        if (attempt(session, id, candidate, out, tried, ws)) {
            out.success = true;
            logLine(LogLevel::Info, "Write") << id << ": wrote " << out.writtenAs
                                             << " after type mismatch retry";
            readBack(session, id, out);
            return out;
        }
        if (isConnectionLoss(ws)) {
            out.error = "write aborted: " + statusToString(ws);
            logLine(LogLevel::Error, "Write") << id << ": " << out.error;
            return out;
        }
    }

    out.error = "type mismatch: no representation accepted after " +
                std::to_string(out.attempts.size()) + " attempts";
    logLine(LogLevel::Error, "Write") << id << ": " << out.error;
    return out;
}

void WriteEngine::readBack(IProtocolSession& session, const std::string& nodeId, WriteOutcome& out) const {
    std::vector<AttributeResult> res;
    const uint32_t st = session.readAttributes(nodeId, { AttributeId::Value, AttributeId::DataType },
                                               opt_.readTimeout, res);
    if (!UaStatus::isGood(st) || res.size() != 2) {
        logLine(LogLevel::Warn, "Write") << nodeId << ": read back failed: " << statusToString(st);
        return;
    }
    BuiltinType declared = BuiltinType::Unknown;
    UAScalar dt;
    if (scalarOf(res[1], dt))
        if (auto nid = std::get_if<NodeIdValue>(&dt)) {
            declared = builtinFromNodeId(nid->id);
            out.readBackType = dataTypeNameFromId(nid->id);
        }
    out.readBackValue = UaStatus::isGood(res[0].status) ? formatValue(res[0].value, declared)
                                                        : statusToString(res[0].status);
    logLine(LogLevel::Info, "Write") << nodeId << ": read back " << out.readBackValue
                                     << " (" << out.readBackType << ")";
}
