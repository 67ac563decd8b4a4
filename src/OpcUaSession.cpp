#include "OpcUaSession.h"
#include "Logger.h"
#include "NodeIdUtils.h"
#include "TaskGroup.h"

#include <chrono>
#include <cstring>
#include <type_traits>

// ==== Helpers (datei-lokal) =================================================
namespace {

constexpr const char* kTag = "UA";

inline std::string uaToStdString(const UA_String& s) {
    if (!s.data || s.length == 0) return {};
    return std::string(reinterpret_cast<const char*>(s.data), s.length);
}

inline std::string nodeIdToString(const UA_NodeId& id) {
    UA_String s = UA_STRING_NULL;
    UA_NodeId_print(&id, &s);
    std::string out = uaToStdString(s);
    UA_String_clear(&s);
    return out;
}

inline std::string expandedNodeIdToString(const UA_ExpandedNodeId& id) {
    UA_String s = UA_STRING_NULL;
    UA_ExpandedNodeId_print(&id, &s);
    std::string out = uaToStdString(s);
    UA_String_clear(&s);
    return out;
}

// Kopiert auch eingebettete Nullbytes; leer -> UA_STRING_NULL
UA_String allocString(const std::string& s) {
    UA_String out = UA_STRING_NULL;
    if (s.empty()) return out;
    out.data = static_cast<UA_Byte*>(UA_malloc(s.size()));
    if (!out.data) return out;
    std::memcpy(out.data, s.data(), s.size());
    out.length = s.size();
    return out;
}

void replaceString(UA_String& dst, const std::string& s) {
    UA_String_clear(&dst);
    dst = allocString(s);
}

inline int64_t uaDateTimeToUnixMs(UA_DateTime t) {
    return (t - UA_DATETIME_UNIX_EPOCH) / UA_DATETIME_MSEC;
}

inline UA_DateTime unixMsToUaDateTime(int64_t ms) {
    return static_cast<UA_DateTime>(ms) * UA_DATETIME_MSEC + UA_DATETIME_UNIX_EPOCH;
}

const UA_DataType* uaTypeOf(const UAScalar& s) {
    switch (typeOf(s)) {
        case BuiltinType::Boolean:       return &UA_TYPES[UA_TYPES_BOOLEAN];
        case BuiltinType::SByte:         return &UA_TYPES[UA_TYPES_SBYTE];
        case BuiltinType::Byte:          return &UA_TYPES[UA_TYPES_BYTE];
        case BuiltinType::Int16:         return &UA_TYPES[UA_TYPES_INT16];
        case BuiltinType::UInt16:        return &UA_TYPES[UA_TYPES_UINT16];
        case BuiltinType::Int32:         return &UA_TYPES[UA_TYPES_INT32];
        case BuiltinType::UInt32:        return &UA_TYPES[UA_TYPES_UINT32];
        case BuiltinType::Int64:         return &UA_TYPES[UA_TYPES_INT64];
        case BuiltinType::UInt64:        return &UA_TYPES[UA_TYPES_UINT64];
        case BuiltinType::Float:         return &UA_TYPES[UA_TYPES_FLOAT];
        case BuiltinType::Double:        return &UA_TYPES[UA_TYPES_DOUBLE];
        case BuiltinType::String:        return &UA_TYPES[UA_TYPES_STRING];
        case BuiltinType::ByteString:    return &UA_TYPES[UA_TYPES_BYTESTRING];
        case BuiltinType::DateTime:      return &UA_TYPES[UA_TYPES_DATETIME];
        case BuiltinType::LocalizedText: return &UA_TYPES[UA_TYPES_LOCALIZEDTEXT];
        case BuiltinType::NodeId:        return &UA_TYPES[UA_TYPES_NODEID];
        default:                         return nullptr;
    }
}

// Schreibt s in den (initialisierten) Speicher dst vom Typ uaTypeOf(s)
UA_StatusCode writeScalar(const UAScalar& s, void* dst) {
    return std::visit([dst](auto&& x) -> UA_StatusCode {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, bool>) {
            *static_cast<UA_Boolean*>(dst) = x;
        } else if constexpr (std::is_arithmetic_v<T>) {
            *static_cast<T*>(dst) = x;
        } else if constexpr (std::is_same_v<T, std::string>) {
            *static_cast<UA_String*>(dst) = allocString(x);
            if (!x.empty() && !static_cast<UA_String*>(dst)->data) return UA_STATUSCODE_BADOUTOFMEMORY;
        } else if constexpr (std::is_same_v<T, ByteString>) {
            const std::string raw(x.bytes.begin(), x.bytes.end());
            *static_cast<UA_ByteString*>(dst) = allocString(raw);
            if (!raw.empty() && !static_cast<UA_ByteString*>(dst)->data) return UA_STATUSCODE_BADOUTOFMEMORY;
        } else if constexpr (std::is_same_v<T, DateTime>) {
            *static_cast<UA_DateTime*>(dst) = unixMsToUaDateTime(x.unixMs);
        } else if constexpr (std::is_same_v<T, LocalizedText>) {
            auto* lt = static_cast<UA_LocalizedText*>(dst);
            lt->locale = allocString(x.locale);
            lt->text   = allocString(x.text);
        } else if constexpr (std::is_same_v<T, NodeIdValue>) {
            UA_String txt = allocString(x.id);
            const UA_StatusCode st = UA_NodeId_parse(static_cast<UA_NodeId*>(dst), txt);
            UA_String_clear(&txt);
            return st;
        }
        return UA_STATUSCODE_GOOD;
    }, s);
}

// Liest ein Element vom Typ type; unbekannte Typen werden als Text geliefert
UAScalar readScalar(const void* p, const UA_DataType* type) {
    switch (type->typeKind) {
        case UA_DATATYPEKIND_BOOLEAN:  return static_cast<bool>(*static_cast<const UA_Boolean*>(p));
        case UA_DATATYPEKIND_SBYTE:    return *static_cast<const int8_t*>(p);
        case UA_DATATYPEKIND_BYTE:     return *static_cast<const uint8_t*>(p);
        case UA_DATATYPEKIND_INT16:    return *static_cast<const int16_t*>(p);
        case UA_DATATYPEKIND_UINT16:   return *static_cast<const uint16_t*>(p);
        case UA_DATATYPEKIND_INT32:    return *static_cast<const int32_t*>(p);
        case UA_DATATYPEKIND_UINT32:   return *static_cast<const uint32_t*>(p);
        case UA_DATATYPEKIND_INT64:    return *static_cast<const int64_t*>(p);
        case UA_DATATYPEKIND_UINT64:   return *static_cast<const uint64_t*>(p);
        case UA_DATATYPEKIND_FLOAT:    return *static_cast<const float*>(p);
        case UA_DATATYPEKIND_DOUBLE:   return *static_cast<const double*>(p);
        case UA_DATATYPEKIND_STATUSCODE: return static_cast<uint32_t>(*static_cast<const UA_StatusCode*>(p));
        // Enumerationen (z. B. NodeClass) kommen als Int32
        case UA_DATATYPEKIND_ENUM:     return *static_cast<const int32_t*>(p);
        case UA_DATATYPEKIND_STRING:
        case UA_DATATYPEKIND_XMLELEMENT:
            return uaToStdString(*static_cast<const UA_String*>(p));
        case UA_DATATYPEKIND_BYTESTRING: {
            const auto* bs = static_cast<const UA_ByteString*>(p);
            ByteString out;
            if (bs->data && bs->length) out.bytes.assign(bs->data, bs->data + bs->length);
            return out;
        }
        case UA_DATATYPEKIND_DATETIME:
            return DateTime{ uaDateTimeToUnixMs(*static_cast<const UA_DateTime*>(p)) };
        case UA_DATATYPEKIND_LOCALIZEDTEXT: {
            const auto* lt = static_cast<const UA_LocalizedText*>(p);
            return LocalizedText{ uaToStdString(lt->locale), uaToStdString(lt->text) };
        }
        case UA_DATATYPEKIND_QUALIFIEDNAME:
            return uaToStdString(static_cast<const UA_QualifiedName*>(p)->name);
        case UA_DATATYPEKIND_NODEID:
            return NodeIdValue{ nodeIdToString(*static_cast<const UA_NodeId*>(p)) };
        default: {
            UA_String s = UA_STRING_NULL;
            UA_print(p, type, &s);
            std::string out = uaToStdString(s);
            UA_String_clear(&s);
            return out;
        }
    }
}

class OpcUaMonitoredItem : public IMonitoredItem {
public:
    OpcUaMonitoredItem(std::weak_ptr<OpcUaSession> session, uint32_t monId, std::string nodeId)
        : session_(std::move(session)), monId_(monId), nodeId_(std::move(nodeId)) {}

    ~OpcUaMonitoredItem() override {
        std::string err;
        if (!release(err))
            logLine(LogLevel::Warn, kTag) << "monitored item " << nodeId_ << " not released: " << err;
    }

    bool release(std::string& err) override {
        if (released_) return true;
        released_ = true;
        auto s = session_.lock();
        if (!s) return true;   // Session weg -> Item serverseitig ebenfalls weg
        const uint32_t st = s->deleteMonitoredItem(monId_);
        if (st == UaStatus::Good || st == UaStatus::BadServerNotConnected) return true;
        err = statusToString(st);
        return false;
    }

private:
    std::weak_ptr<OpcUaSession> session_;
    uint32_t    monId_;
    std::string nodeId_;
    bool        released_ = false;
};

} // namespace

// ==== Wertkonvertierung =====================================================
UAValue uaVariantToValue(const UA_Variant& v) {
    if (UA_Variant_isEmpty(&v) || !v.type) return std::monostate{};
    if (UA_Variant_isScalar(&v)) return readScalar(v.data, v.type);

    UAArray arr;
    arr.reserve(v.arrayLength);
    const auto* base = static_cast<const uint8_t*>(v.data);
    for (size_t i = 0; i < v.arrayLength; ++i)
        arr.push_back(readScalar(base + i * v.type->memSize, v.type));
    return arr;
}

UA_StatusCode uaValueToVariant(const UAValue& v, UA_Variant& out) {
    UA_Variant_init(&out);
    if (isNull(v)) return UA_STATUSCODE_GOOD;

    if (auto s = std::get_if<UAScalar>(&v)) {
        const UA_DataType* type = uaTypeOf(*s);
        if (!type) return UA_STATUSCODE_BADDATATYPEIDUNKNOWN;
        void* p = UA_new(type);
        if (!p) return UA_STATUSCODE_BADOUTOFMEMORY;
        const UA_StatusCode st = writeScalar(*s, p);
        if (st != UA_STATUSCODE_GOOD) { UA_delete(p, type); return st; }
        UA_Variant_setScalar(&out, p, type);
        return UA_STATUSCODE_GOOD;
    }

    const auto& arr = std::get<UAArray>(v);
    if (arr.empty()) return UA_STATUSCODE_BADNOTHINGTODO;
    const UA_DataType* type = uaTypeOf(arr.front());
    if (!type) return UA_STATUSCODE_BADDATATYPEIDUNKNOWN;

    void* data = UA_Array_new(arr.size(), type);
    if (!data) return UA_STATUSCODE_BADOUTOFMEMORY;
    auto* base = static_cast<uint8_t*>(data);
    for (size_t i = 0; i < arr.size(); ++i) {
        UA_StatusCode st = UA_STATUSCODE_BADTYPEMISMATCH;
        if (arr[i].index() == arr.front().index())
            st = writeScalar(arr[i], base + i * type->memSize);
        if (st != UA_STATUSCODE_GOOD) {
            UA_Array_delete(data, arr.size(), type);
            return st;
        }
    }
    UA_Variant_setArray(&out, data, arr.size(), type);
    return UA_STATUSCODE_GOOD;
}

// ==== OpcUaSession – Basics =================================================
OpcUaSession::OpcUaSession(UA_Client* client, DataChangeSink sink)
    : client_(client), sink_(std::move(sink)) {}

OpcUaSession::~OpcUaSession() {
    close();
}

void OpcUaSession::startIterate() {
    iterate_ = std::jthread([this](std::stop_token st){ iterateLoop(st); });
}

void OpcUaSession::close() {
    if (iterate_.joinable()) {
        iterate_.request_stop();
        iterate_.join();
    }
    std::lock_guard<std::mutex> lk(mx_);
    if (!client_) return;
    if (subId_) {
        UA_Client_Subscriptions_deleteSingle(client_, subId_);
        subId_ = 0;
    }
    monitored_.clear();
    UA_Client_disconnect(client_);
    UA_Client_delete(client_);
    client_ = nullptr;
    pending_.clear();
    logLine(LogLevel::Debug, kTag) << "session closed";
}

void OpcUaSession::iterateLoop(std::stop_token st) {
    bool reported = false;
    while (!st.stop_requested()) {
        {
            std::lock_guard<std::mutex> lk(mx_);
            if (!client_) break;
            const UA_StatusCode rc = UA_Client_run_iterate(client_, 0);
            if (rc != UA_STATUSCODE_GOOD && !reported) {
                UA_LOG_WARNING(UA_Log_Stdout, UA_LOGCATEGORY_CLIENT,
                               "run_iterate failed: %s", UA_StatusCode_name(rc));
                reported = true;
            } else if (rc == UA_STATUSCODE_GOOD) {
                reported = false;
            }
        }
        dispatchPending();
        if (!TaskGroup::sleepFor(st, std::chrono::milliseconds(20))) break;
    }
}

void OpcUaSession::dispatchPending() {
    std::vector<DataChangeNotification> batch;
    {
        std::lock_guard<std::mutex> lk(mx_);
        batch.swap(pending_);
    }
    if (!sink_) return;
    for (const auto& n : batch) sink_(n);
}

void OpcUaSession::dataChangeHandler(UA_Client*, UA_UInt32, void*,
                                     UA_UInt32, void* monCtx, UA_DataValue* value) {
    auto* ctx = static_cast<MonContext*>(monCtx);
    if (!ctx || !ctx->self || !value) return;

    // läuft innerhalb eines UA_Client-Aufrufs, mx_ ist bereits gehalten
    DataChangeNotification n;
    n.nodeId = ctx->nodeId;
    n.status = value->hasStatus ? value->status : UA_STATUSCODE_GOOD;
    if (value->hasValue) n.value = uaVariantToValue(value->value);
    if (value->hasSourceTimestamp) n.sourceTimestampMs = uaDateTimeToUnixMs(value->sourceTimestamp);
    ctx->self->pending_.push_back(std::move(n));
}

uint32_t OpcUaSession::resolveNodeIdLocked(const std::string& text, UA_NodeId& out) {
    UA_NodeId_init(&out);
    NodeIdParts parts;
    if (!parseNodeId(text, parts)) return UaStatus::BadNodeIdInvalid;

    std::string canonical = text;
    if (!parts.nsUri.empty()) {
        UA_String uri = allocString(parts.nsUri);
        UA_UInt16 idx = 0;
        const UA_StatusCode st = UA_Client_NamespaceGetIndex(client_, &uri, &idx);
        UA_String_clear(&uri);
        if (st != UA_STATUSCODE_GOOD) return UaStatus::BadNodeIdUnknown;
        canonical = "ns=" + std::to_string(idx) + ";" + parts.type + "=" + parts.id;
    }

    UA_String txt = allocString(canonical);
    const UA_StatusCode st = UA_NodeId_parse(&out, txt);
    UA_String_clear(&txt);
    return st == UA_STATUSCODE_GOOD ? UaStatus::Good : UaStatus::BadNodeIdInvalid;
}

void OpcUaSession::setTimeoutLocked(std::chrono::milliseconds timeout) {
    const auto ms = timeout.count() > 0 ? timeout.count() : 1;
    UA_Client_getConfig(client_)->timeout = static_cast<UA_UInt32>(ms);
}

// ==== Browse =================================================================
uint32_t OpcUaSession::browse(const std::string& nodeId,
                              std::chrono::milliseconds timeout,
                              std::vector<BrowseReference>& out) {
    out.clear();
    uint32_t result = UaStatus::Good;
    {
        std::lock_guard<std::mutex> lk(mx_);
        if (!client_) return UaStatus::BadServerNotConnected;

        UA_NodeId nid;
        const uint32_t rs = resolveNodeIdLocked(nodeId, nid);
        if (rs != UaStatus::Good) return rs;
        setTimeoutLocked(timeout);

        UA_BrowseRequest bReq;
        UA_BrowseRequest_init(&bReq);
        bReq.requestedMaxReferencesPerNode = 0;
        bReq.nodesToBrowse = UA_BrowseDescription_new();
        bReq.nodesToBrowseSize = 1;
        bReq.nodesToBrowse[0].nodeId = nid;   // übernimmt den Besitz
        bReq.nodesToBrowse[0].browseDirection = UA_BROWSEDIRECTION_FORWARD;
        bReq.nodesToBrowse[0].referenceTypeId = UA_NODEID_NUMERIC(0, UA_NS0ID_HIERARCHICALREFERENCES);
        bReq.nodesToBrowse[0].includeSubtypes = UA_TRUE;
        bReq.nodesToBrowse[0].resultMask = UA_BROWSERESULTMASK_ALL;

        UA_BrowseResponse bResp = UA_Client_Service_browse(client_, bReq);
        UA_BrowseRequest_clear(&bReq);

        auto collect = [&out](const UA_BrowseResult& r) {
            for (size_t i = 0; i < r.referencesSize; ++i) {
                const UA_ReferenceDescription& rd = r.references[i];
                BrowseReference ref;
                const UA_ExpandedNodeId& xn = rd.nodeId;
                if (xn.serverIndex != 0 || xn.namespaceUri.length > 0)
                    ref.expandedNodeId = expandedNodeIdToString(xn);
                else
                    ref.nodeId = nodeIdToString(xn.nodeId);
                ref.displayName = uaToStdString(rd.displayName.text);
                if (ref.displayName.empty()) ref.displayName = uaToStdString(rd.browseName.name);
                ref.nodeClass = static_cast<NodeClass>(rd.nodeClass);
                out.push_back(std::move(ref));
            }
        };

        result = bResp.responseHeader.serviceResult;
        if (result == UA_STATUSCODE_GOOD) {
            if (bResp.resultsSize != 1) result = UaStatus::BadUnexpectedError;
            else result = bResp.results[0].statusCode;
        }

        UA_ByteString cp = UA_BYTESTRING_NULL;
        if (result == UA_STATUSCODE_GOOD) {
            collect(bResp.results[0]);
            UA_ByteString_copy(&bResp.results[0].continuationPoint, &cp);
        }
        UA_BrowseResponse_clear(&bResp);

        // Fortsetzungspunkte abarbeiten, bis der Server alles geliefert hat
        while (result == UA_STATUSCODE_GOOD && cp.length > 0) {
            UA_BrowseNextRequest nReq;
            UA_BrowseNextRequest_init(&nReq);
            nReq.releaseContinuationPoints = UA_FALSE;
            nReq.continuationPoints = &cp;
            nReq.continuationPointsSize = 1;
            UA_BrowseNextResponse nResp = UA_Client_Service_browseNext(client_, nReq);
            UA_ByteString_clear(&cp);

            result = nResp.responseHeader.serviceResult;
            if (result == UA_STATUSCODE_GOOD) {
                if (nResp.resultsSize != 1) result = UaStatus::BadUnexpectedError;
                else result = nResp.results[0].statusCode;
            }
            if (result == UA_STATUSCODE_GOOD) {
                collect(nResp.results[0]);
                UA_ByteString_copy(&nResp.results[0].continuationPoint, &cp);
            }
            UA_BrowseNextResponse_clear(&nResp);
        }
        UA_ByteString_clear(&cp);
    }
    dispatchPending();
    if (result != UaStatus::Good) {
        out.clear();
        logLine(LogLevel::Debug, kTag) << "browse " << nodeId << " failed: " << statusToString(result);
    }
    return result;
}

// ==== Read / Write ===========================================================
uint32_t OpcUaSession::readAttributes(const std::string& nodeId,
                                      const std::vector<AttributeId>& attrs,
                                      std::chrono::milliseconds timeout,
                                      std::vector<AttributeResult>& out) {
    out.assign(attrs.size(), AttributeResult{});
    if (attrs.empty()) return UaStatus::BadNothingToDo;

    uint32_t result = UaStatus::Good;
    {
        std::lock_guard<std::mutex> lk(mx_);
        if (!client_) return UaStatus::BadServerNotConnected;

        UA_NodeId nid;
        const uint32_t rs = resolveNodeIdLocked(nodeId, nid);
        if (rs != UaStatus::Good) return rs;
        setTimeoutLocked(timeout);

        UA_ReadRequest req;
        UA_ReadRequest_init(&req);
        req.timestampsToReturn = UA_TIMESTAMPSTORETURN_NEITHER;
        req.nodesToRead = static_cast<UA_ReadValueId*>(
            UA_Array_new(attrs.size(), &UA_TYPES[UA_TYPES_READVALUEID]));
        if (!req.nodesToRead) { UA_NodeId_clear(&nid); return UaStatus::BadOutOfMemory; }
        req.nodesToReadSize = attrs.size();
        for (size_t i = 0; i < attrs.size(); ++i) {
            UA_NodeId_copy(&nid, &req.nodesToRead[i].nodeId);
            req.nodesToRead[i].attributeId = static_cast<UA_UInt32>(attrs[i]);
        }
        UA_NodeId_clear(&nid);

        UA_ReadResponse resp = UA_Client_Service_read(client_, req);
        UA_ReadRequest_clear(&req);

        result = resp.responseHeader.serviceResult;
        if (result == UA_STATUSCODE_GOOD && resp.resultsSize != attrs.size())
            result = UaStatus::BadUnexpectedError;
        if (result == UA_STATUSCODE_GOOD) {
            for (size_t i = 0; i < attrs.size(); ++i) {
                const UA_DataValue& dv = resp.results[i];
                out[i].status = dv.hasStatus ? dv.status : UA_STATUSCODE_GOOD;
                if (dv.hasValue) out[i].value = uaVariantToValue(dv.value);
            }
        }
        UA_ReadResponse_clear(&resp);
    }
    dispatchPending();
    return result;
}

uint32_t OpcUaSession::writeValue(const std::string& nodeId,
                                  const UAValue& value,
                                  std::chrono::milliseconds timeout) {
    uint32_t result = UaStatus::Good;
    {
        std::lock_guard<std::mutex> lk(mx_);
        if (!client_) return UaStatus::BadServerNotConnected;

        UA_Variant var;
        const UA_StatusCode cs = uaValueToVariant(value, var);
        if (cs != UA_STATUSCODE_GOOD) return cs;

        UA_NodeId nid;
        const uint32_t rs = resolveNodeIdLocked(nodeId, nid);
        if (rs != UaStatus::Good) { UA_Variant_clear(&var); return rs; }
        setTimeoutLocked(timeout);

        UA_WriteRequest wReq;
        UA_WriteRequest_init(&wReq);
        wReq.nodesToWrite = UA_WriteValue_new();
        wReq.nodesToWriteSize = 1;
        wReq.nodesToWrite[0].nodeId = nid;
        wReq.nodesToWrite[0].attributeId = UA_ATTRIBUTEID_VALUE;
        wReq.nodesToWrite[0].value.hasValue = UA_TRUE;
        wReq.nodesToWrite[0].value.value = var;   // Besitz geht an den Request

        UA_WriteResponse wResp = UA_Client_Service_write(client_, wReq);
        UA_WriteRequest_clear(&wReq);

        result = wResp.responseHeader.serviceResult;
        if (result == UA_STATUSCODE_GOOD)
            result = wResp.resultsSize == 1 ? wResp.results[0] : UaStatus::BadUnexpectedError;
        UA_WriteResponse_clear(&wResp);
    }
    dispatchPending();
    return result;
}

// ==== Subscriptions ==========================================================
uint32_t OpcUaSession::ensureSubscriptionLocked() {
    if (subId_) return UaStatus::Good;

    UA_CreateSubscriptionRequest sReq = UA_CreateSubscriptionRequest_default();
    sReq.requestedPublishingInterval = 100.0;
    sReq.requestedMaxKeepAliveCount  = 20;
    sReq.requestedLifetimeCount      = 60;

    UA_CreateSubscriptionResponse sResp =
        UA_Client_Subscriptions_create(client_, sReq, /*subCtx*/this, nullptr, nullptr);
    const uint32_t st = sResp.responseHeader.serviceResult;
    if (st == UA_STATUSCODE_GOOD) subId_ = sResp.subscriptionId;
    UA_CreateSubscriptionResponse_clear(&sResp);
    return st;
}

std::unique_ptr<IMonitoredItem> OpcUaSession::beginMonitoring(const std::string& nodeId,
                                                              std::string& err) {
    uint32_t monId = 0;
    {
        std::lock_guard<std::mutex> lk(mx_);
        if (!client_) { err = statusToString(UaStatus::BadServerNotConnected); return nullptr; }

        uint32_t st = ensureSubscriptionLocked();
        if (st != UaStatus::Good) {
            err = "subscription: " + statusToString(st);
            return nullptr;
        }

        UA_NodeId nid;
        st = resolveNodeIdLocked(nodeId, nid);
        if (st != UaStatus::Good) { err = statusToString(st); return nullptr; }

        auto ctx = std::make_unique<MonContext>();
        ctx->self = this;
        ctx->nodeId = nodeId;

        UA_MonitoredItemCreateRequest monReq = UA_MonitoredItemCreateRequest_default(nid);
        monReq.requestedParameters.samplingInterval = 100.0;
        monReq.requestedParameters.queueSize        = 1;
        monReq.requestedParameters.discardOldest    = UA_TRUE;

        UA_MonitoredItemCreateResult monRes =
            UA_Client_MonitoredItems_createDataChange(
                client_, subId_, UA_TIMESTAMPSTORETURN_SOURCE, monReq,
                ctx.get(), &OpcUaSession::dataChangeHandler, nullptr);
        UA_NodeId_clear(&monReq.itemToMonitor.nodeId);

        st = monRes.statusCode;
        monId = monRes.monitoredItemId;
        UA_MonitoredItemCreateResult_clear(&monRes);
        if (st != UaStatus::Good) {
            err = statusToString(st);
            return nullptr;
        }
        monitored_.emplace(monId, std::move(ctx));
    }
    dispatchPending();
    logLine(LogLevel::Debug, kTag) << "monitoring " << nodeId << " (monId=" << monId << ")";
    return std::make_unique<OpcUaMonitoredItem>(weak_from_this(), monId, nodeId);
}

uint32_t OpcUaSession::deleteMonitoredItem(uint32_t monId) {
    std::lock_guard<std::mutex> lk(mx_);
    if (!client_) return UaStatus::BadServerNotConnected;
    auto it = monitored_.find(monId);
    if (it == monitored_.end()) return UaStatus::Good;
    const uint32_t st = UA_Client_MonitoredItems_deleteSingle(client_, subId_, monId);
    monitored_.erase(it);
    return st;
}

// ==== OpcUaConnector =========================================================
namespace {

bool waitUntilActivated(UA_Client* client, std::chrono::milliseconds timeout) {
    const auto t0 = std::chrono::steady_clock::now();
    for (;;) {
        UA_SecureChannelState scState;
        UA_SessionState      ssState;
        UA_StatusCode        status;
        (void)UA_Client_run_iterate(client, 50);

        UA_Client_getState(client, &scState, &ssState, &status);
        if (scState == UA_SECURECHANNELSTATE_OPEN &&
            ssState == UA_SESSIONSTATE_ACTIVATED)
            return true;

        if (std::chrono::steady_clock::now() - t0 > timeout)
            return false;
    }
}

UA_ByteString borrowBytes(const std::vector<uint8_t>& v) {
    UA_ByteString b = UA_BYTESTRING_NULL;
    b.length = v.size();
    b.data   = const_cast<UA_Byte*>(v.data());
    return b;
}

} // namespace

std::shared_ptr<IProtocolSession> OpcUaConnector::openSession(const TransportOptions& opts,
                                                              DataChangeSink sink,
                                                              uint32_t& status,
                                                              std::string& err) {
    status = UaStatus::Good;
    UA_Client* client = UA_Client_new();
    if (!client) {
        status = UaStatus::BadOutOfMemory;
        err = "UA_Client_new failed";
        return nullptr;
    }

    UA_ClientConfig* cfg = UA_Client_getConfig(client);
    UA_ClientConfig_setDefault(cfg);

    if (opts.securityMode != SecurityMode::None) {
        UA_StatusCode st = UA_ClientConfig_setDefaultEncryption(
            cfg, borrowBytes(opts.certificateDer), borrowBytes(opts.privateKeyDer),
            /*trustList*/nullptr, 0, /*revocation*/nullptr, 0);
        if (st != UA_STATUSCODE_GOOD) {
            status = st;
            err = std::string("encryption setup failed: ") + UA_StatusCode_name(st);
            UA_Client_delete(client);
            return nullptr;
        }
    }

    cfg->securityMode = static_cast<UA_MessageSecurityMode>(opts.securityMode);
    replaceString(cfg->securityPolicyUri, opts.securityPolicyUri);
    if (!opts.applicationUri.empty())
        replaceString(cfg->clientDescription.applicationUri, opts.applicationUri);
    if (!opts.productUri.empty())
        replaceString(cfg->clientDescription.productUri, opts.productUri);
    cfg->timeout = static_cast<UA_UInt32>(opts.connectTimeout.count());
    cfg->requestedSessionTimeout = static_cast<UA_Double>(opts.sessionTimeout.count());
    cfg->outStandingPublishRequests = 5;

    if (opts.identity == IdentityKind::Username) {
        UA_UserNameIdentityToken* tok = UA_UserNameIdentityToken_new();
        tok->policyId = allocString(opts.userTokenPolicyId);
        tok->userName = allocString(opts.username);
        tok->password = allocString(opts.password);
        UA_ExtensionObject_clear(&cfg->userIdentityToken);
        UA_ExtensionObject_setValue(&cfg->userIdentityToken, tok,
                                    &UA_TYPES[UA_TYPES_USERNAMEIDENTITYTOKEN]);
    }

    logLine(LogLevel::Info, kTag) << "connecting to " << opts.endpointUrl
                                  << " (" << securityModeName(opts.securityMode) << ", "
                                  << opts.securityPolicyUri << ", session '" << opts.sessionName << "')";

    UA_StatusCode st = UA_Client_connect(client, opts.endpointUrl.c_str());
    if (st != UA_STATUSCODE_GOOD) {
        status = st;
        err = std::string("connect failed: ") + UA_StatusCode_name(st);
        UA_Client_delete(client);
        return nullptr;
    }

    if (!waitUntilActivated(client, opts.connectTimeout)) {
        UA_LOG_WARNING(UA_Log_Stdout, UA_LOGCATEGORY_CLIENT,
                       "Session not ACTIVATED within timeout");
        status = UaStatus::BadTimeout;
        err = "session not activated within " + std::to_string(opts.connectTimeout.count()) + " ms";
        UA_Client_disconnect(client);
        UA_Client_delete(client);
        return nullptr;
    }

    auto session = std::make_shared<OpcUaSession>(client, std::move(sink));
    session->startIterate();
    return session;
}
