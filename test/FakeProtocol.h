// FakeProtocol.h – In-Memory-Ersatz für die Protokollschicht (Unit-Tests)
//
// FakeAddressSpace : Knoten mit Klasse, Datentyp, ValueRank, AccessLevel und Wert.
//                    Schreibzugriffe werden streng geprüft (Typ + Skalar/Array), wie
//                    bei einem echten Server -> BadTypeMismatch.
// FakeSession      : IProtocolSession auf einem FakeAddressSpace; zählt Browse-,
//                    Monitor- und Release-Aufrufe je Knoten.
// FakeConnector    : IProtocolConnector; kann die ersten N Verbindungsversuche
//                    scheitern lassen.
#pragma once
#include "IProtocolSession.h"
#include "ValueFormat.h"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct FakeNode {
    std::string id;
    std::string displayName;
    NodeClass   nodeClass = NodeClass::Object;
    BuiltinType dataType = BuiltinType::Unknown;
    int32_t     valueRank = -1;
    uint8_t     access = 0x03;                   // Read | Write
    UAValue     value;
    std::string description;
    std::vector<std::string> children;           // hierarchische Referenzen (auch Zyklen)

    // was der Server beim Schreiben tatsächlich annimmt (Standard: dataType/valueRank)
    std::optional<BuiltinType> acceptType;
    std::optional<bool>        acceptArray;
};

class FakeAddressSpace {
public:
    FakeNode& add(FakeNode n) {
        std::lock_guard<std::mutex> lk(mx);
        auto& slot = nodes[n.id];
        slot = std::move(n);
        return slot;
    }

    FakeNode& folder(const std::string& id, const std::string& name, const std::string& parent = {}) {
        FakeNode n;
        n.id = id;
        n.displayName = name;
        n.nodeClass = NodeClass::Object;
        FakeNode& ref = add(std::move(n));
        if (!parent.empty()) link(parent, id);
        return ref;
    }

    FakeNode& variable(const std::string& id, const std::string& name, BuiltinType type,
                       UAValue value, const std::string& parent = {}) {
        FakeNode n;
        n.id = id;
        n.displayName = name;
        n.nodeClass = NodeClass::Variable;
        n.dataType = type;
        n.value = std::move(value);
        FakeNode& ref = add(std::move(n));
        if (!parent.empty()) link(parent, id);
        return ref;
    }

    void link(const std::string& parent, const std::string& child) {
        std::lock_guard<std::mutex> lk(mx);
        nodes[parent].children.push_back(child);
    }

    std::optional<FakeNode> get(const std::string& id) const {
        std::lock_guard<std::mutex> lk(mx);
        auto it = nodes.find(id);
        if (it == nodes.end()) return std::nullopt;
        return it->second;
    }

    mutable std::mutex mx;
    std::map<std::string, FakeNode> nodes;
};

class FakeSession;

class FakeMonitoredItem : public IMonitoredItem {
public:
    FakeMonitoredItem(std::weak_ptr<FakeSession> s, std::string nodeId)
        : session_(std::move(s)), nodeId_(std::move(nodeId)) {}
    bool release(std::string& err) override;

private:
    std::weak_ptr<FakeSession> session_;
    std::string nodeId_;
    bool released_ = false;
};

class FakeSession : public IProtocolSession, public std::enable_shared_from_this<FakeSession> {
public:
    FakeSession(std::shared_ptr<FakeAddressSpace> space, DataChangeSink sink)
        : space_(std::move(space)), sink_(std::move(sink)) {}

    void close() override {
        std::lock_guard<std::mutex> lk(mx_);
        closed_ = true;
        ++closeCalls;
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lk(mx_);
        return closed_;
    }

    uint32_t browse(const std::string& nodeId, std::chrono::milliseconds,
                    std::vector<BrowseReference>& out) override {
        {
            std::lock_guard<std::mutex> lk(mx_);
            if (closed_) return UaStatus::BadServerNotConnected;
            ++browseCalls[nodeId];
        }
        if (browseDelay.count() > 0) std::this_thread::sleep_for(browseDelay);

        out.clear();
        if (failBrowse.count(nodeId)) return UaStatus::BadNodeIdUnknown;
        auto n = space_->get(nodeId);
        if (!n) return UaStatus::BadNodeIdUnknown;
        for (const auto& cid : n->children) {
            auto c = space_->get(cid);
            if (!c) continue;
            BrowseReference r;
            r.nodeId = c->id;
            r.displayName = c->displayName;
            r.nodeClass = c->nodeClass;
            out.push_back(std::move(r));
        }
        return UaStatus::Good;
    }

    uint32_t readAttributes(const std::string& nodeId, const std::vector<AttributeId>& attrs,
                            std::chrono::milliseconds, std::vector<AttributeResult>& out) override {
        out.assign(attrs.size(), AttributeResult{});
        {
            std::lock_guard<std::mutex> lk(mx_);
            if (closed_) return UaStatus::BadServerNotConnected;
            ++readCalls;
        }
        auto n = space_->get(nodeId);
        if (!n) return UaStatus::BadNodeIdUnknown;

        for (size_t i = 0; i < attrs.size(); ++i) {
            AttributeResult& r = out[i];
            switch (attrs[i]) {
                case AttributeId::NodeId:      r.value = UAScalar{ NodeIdValue{ n->id } }; break;
                case AttributeId::NodeClass:   r.value = UAScalar{ static_cast<int32_t>(n->nodeClass) }; break;
                case AttributeId::BrowseName:  r.value = UAScalar{ n->displayName }; break;
                case AttributeId::DisplayName: r.value = UAScalar{ LocalizedText{ "en-US", n->displayName } }; break;
                case AttributeId::Description: r.value = UAScalar{ LocalizedText{ "", n->description } }; break;
                case AttributeId::Value:
                    if (n->nodeClass != NodeClass::Variable) r.status = UaStatus::BadAttributeIdInvalid;
                    else r.value = n->value;
                    break;
                case AttributeId::DataType:
                    if (n->nodeClass != NodeClass::Variable) r.status = UaStatus::BadAttributeIdInvalid;
                    else r.value = UAScalar{ NodeIdValue{ "i=" + std::to_string(static_cast<int>(n->dataType)) } };
                    break;
                case AttributeId::ValueRank:
                    if (n->nodeClass != NodeClass::Variable) r.status = UaStatus::BadAttributeIdInvalid;
                    else r.value = UAScalar{ n->valueRank };
                    break;
                case AttributeId::ArrayDimensions:
                    if (auto a = std::get_if<UAArray>(&n->value))
                        r.value = UAArray{ UAScalar{ static_cast<uint32_t>(a->size()) } };
                    break;
                case AttributeId::AccessLevel:
                case AttributeId::UserAccessLevel:
                    if (n->nodeClass != NodeClass::Variable) r.status = UaStatus::BadAttributeIdInvalid;
                    else r.value = UAScalar{ n->access };
                    break;
            }
        }
        return UaStatus::Good;
    }

    uint32_t writeValue(const std::string& nodeId, const UAValue& value,
                        std::chrono::milliseconds) override {
        {
            std::lock_guard<std::mutex> lk(mx_);
            if (closed_) return UaStatus::BadServerNotConnected;
            writes.push_back({ nodeId, value });
        }
        std::lock_guard<std::mutex> lk(space_->mx);
        auto it = space_->nodes.find(nodeId);
        if (it == space_->nodes.end()) return UaStatus::BadNodeIdUnknown;
        FakeNode& n = it->second;
        if (!(n.access & 0x02)) return UaStatus::BadNotWritable;

        const BuiltinType want  = n.acceptType.value_or(n.dataType);
        const bool wantArray    = n.acceptArray.value_or(n.valueRank >= 0);
        if (isArray(value) != wantArray || typeOf(value) != want) return UaStatus::BadTypeMismatch;
        n.value = value;
        return UaStatus::Good;
    }

    std::unique_ptr<IMonitoredItem> beginMonitoring(const std::string& nodeId, std::string& err) override {
        std::lock_guard<std::mutex> lk(mx_);
        if (closed_) { err = "closed"; return nullptr; }
        ++monitorCalls[nodeId];
        if (failMonitoring) { err = statusToString(UaStatus::BadTooManyOperations); return nullptr; }
        return std::make_unique<FakeMonitoredItem>(weak_from_this(), nodeId);
    }

    // simuliert eine Data-Change-Notification des Servers
    void emit(const std::string& nodeId, UAValue value, uint32_t status = UaStatus::Good,
              int64_t sourceMs = 0) {
        DataChangeNotification n;
        n.nodeId = nodeId;
        n.value = std::move(value);
        n.status = status;
        n.sourceTimestampMs = sourceMs;
        if (sink_) sink_(n);
    }

    void onRelease(const std::string& nodeId) {
        std::lock_guard<std::mutex> lk(mx_);
        ++releases[nodeId];
    }

    int browseCount(const std::string& id) const {
        std::lock_guard<std::mutex> lk(mx_);
        auto it = browseCalls.find(id);
        return it == browseCalls.end() ? 0 : it->second;
    }

    int releaseCount(const std::string& id) const {
        std::lock_guard<std::mutex> lk(mx_);
        auto it = releases.find(id);
        return it == releases.end() ? 0 : it->second;
    }

    int monitorCount(const std::string& id) const {
        std::lock_guard<std::mutex> lk(mx_);
        auto it = monitorCalls.find(id);
        return it == monitorCalls.end() ? 0 : it->second;
    }

    struct WriteCall { std::string nodeId; UAValue value; };

    // Test-Stellschrauben
    std::chrono::milliseconds browseDelay{0};
    std::map<std::string, bool> failBrowse;
    bool failMonitoring = false;

    // Zähler (unter mx_)
    std::map<std::string, int> browseCalls;
    std::map<std::string, int> monitorCalls;
    std::map<std::string, int> releases;
    std::vector<WriteCall> writes;
    int readCalls = 0;
    int closeCalls = 0;

private:
    std::shared_ptr<FakeAddressSpace> space_;
    DataChangeSink sink_;
    mutable std::mutex mx_;
    bool closed_ = false;
};

inline bool FakeMonitoredItem::release(std::string&) {
    if (released_) return true;
    released_ = true;
    if (auto s = session_.lock()) s->onRelease(nodeId_);
    return true;
}

class FakeConnector : public IProtocolConnector {
public:
    explicit FakeConnector(std::shared_ptr<FakeAddressSpace> space) : space_(std::move(space)) {}

    std::shared_ptr<IProtocolSession> openSession(const TransportOptions& opts, DataChangeSink sink,
                                                  uint32_t& status, std::string& err) override {
        std::lock_guard<std::mutex> lk(mx_);
        ++openCalls;
        lastOptions = opts;
        if (failuresLeft > 0) {
            --failuresLeft;
            status = failStatus;
            err = statusToString(failStatus);
            return nullptr;
        }
        auto s = std::make_shared<FakeSession>(space_, std::move(sink));
        s->browseDelay = browseDelay;
        sessions.push_back(s);
        status = UaStatus::Good;
        return s;
    }

    std::shared_ptr<FakeSession> last() const {
        std::lock_guard<std::mutex> lk(mx_);
        return sessions.empty() ? nullptr : sessions.back();
    }

    int opens() const {
        std::lock_guard<std::mutex> lk(mx_);
        return openCalls;
    }

    int failuresLeft = 0;
    uint32_t failStatus = UaStatus::BadTimeout;
    std::chrono::milliseconds browseDelay{0};
    TransportOptions lastOptions;
    std::vector<std::shared_ptr<FakeSession>> sessions;
    int openCalls = 0;

private:
    std::shared_ptr<FakeAddressSpace> space_;
    mutable std::mutex mx_;
};

// Kleiner Standard-Adressraum: Objects(i=84) -> Demo -> { Int32, Float, ... }
inline std::shared_ptr<FakeAddressSpace> makeDemoSpace() {
    auto s = std::make_shared<FakeAddressSpace>();
    s->folder("i=84", "Root");
    s->folder("i=85", "Objects", "i=84");
    s->folder("ns=1;s=Demo", "Demo", "i=85");
    s->variable("ns=1;s=Demo.Int32", "Int32", BuiltinType::Int32, UAScalar{ int32_t(42) }, "ns=1;s=Demo");
    s->variable("ns=1;s=Demo.Float", "Float", BuiltinType::Float, UAScalar{ 1.5f }, "ns=1;s=Demo");
    s->variable("ns=1;s=Demo.String", "String", BuiltinType::String, UAScalar{ std::string("hello") }, "ns=1;s=Demo");
    return s;
}

// wartet bis pred() wahr ist (max. timeout)
template<class Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto end = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < end) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}
