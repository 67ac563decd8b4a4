#include "Controller.h"
#include "Logger.h"
#include "NodeIdUtils.h"
#include "ValueFormat.h"
#include <deque>
#include <unordered_set>

namespace {
constexpr const char* kRootFolder = "i=84";

Event makeEvent(EventType t, std::any payload = {}) {
    Event ev;
    ev.type = t;
    ev.payload = std::move(payload);
    return ev;
}

const UAScalar* scalarOf(const AttributeResult& r) {
    if (!UaStatus::isGood(r.status)) return nullptr;
    return std::get_if<UAScalar>(&r.value);
}

std::string textOf(const AttributeResult& r) {
    const UAScalar* s = scalarOf(r);
    if (!s) return {};
    if (auto lt = std::get_if<LocalizedText>(s)) return lt->text;
    if (auto str = std::get_if<std::string>(s)) return *str;
    return {};
}

bool byteOf(const AttributeResult& r, uint8_t& out) {
    const UAScalar* s = scalarOf(r);
    if (!s) return false;
    if (auto b = std::get_if<uint8_t>(s)) { out = *b; return true; }
    return false;
}
} // namespace

Controller::Controller(IProtocolConnector& connector, EventBus& bus)
    : Controller(connector, bus, Options{}) {}

Controller::Controller(IProtocolConnector& connector, EventBus& bus, Options opt)
    : connector_(connector),
      bus_(bus),
      opt_(std::move(opt)),
      provisioner_(opt_.provisioner),
      live_(std::make_shared<std::atomic<int>>(0)),
      source_(std::make_shared<BroadcastChannel>(opt_.broadcastCapacity)),
      cache_([this](const std::string& parentId) {
                 bus_.post(makeEvent(EventType::evAddressSpaceUpdated, AddressSpaceUpdatePayload{ parentId }));
             },
             opt_.browseTimeout),
      watches_([this](std::vector<BroadcastMessage> items) {
                   bus_.post(makeEvent(EventType::evWatchListUpdated, WatchListPayload{ std::move(items) }));
               },
               [this](const BroadcastMessage& m) {
                   auto src = broadcastSource();
                   return src && src->tryPush(m);
               },
               opt_.readTimeout),
      writer_(opt_.write) {}

Controller::~Controller() {
    shutdown();
}

const char* Controller::stateName(State s) {
    switch (s) {
        case State::Idle:          return "Idle";
        case State::Connecting:    return "Connecting";
        case State::Connected:     return "Connected";
        case State::Disconnecting: return "Disconnecting";
    }
    return "?";
}

Controller::State Controller::state() const {
    std::lock_guard<std::mutex> lk(mx_);
    return state_;
}

bool Controller::isConnected() const {
    return state() == State::Connected;
}

std::string Controller::endpoint() const {
    std::lock_guard<std::mutex> lk(mx_);
    return endpoint_;
}

std::shared_ptr<IProtocolSession> Controller::currentSession() const {
    std::lock_guard<std::mutex> lk(mx_);
    return state_ == State::Connected ? session_ : nullptr;
}

std::shared_ptr<BroadcastChannel> Controller::broadcastSource() const {
    std::lock_guard<std::mutex> lk(mx_);
    return source_;
}

void Controller::postConnectionState(bool connected, const std::string& endpoint, const std::string& error) {
    bus_.post(makeEvent(EventType::evConnectionStateChanged,
                        ConnectionStatePayload{ connected, endpoint, error }));
}

// ---------------------------------------------------------------------------
// Lebenszyklus
// ---------------------------------------------------------------------------
bool Controller::connect(const ClientConfig& cfg, std::string& err) {
    Logger::setDisabled(cfg.disableLog);

    TransportOptions opts;
    if (!provisioner_.provision(cfg, opts, err)) {
        logLine(LogLevel::Error, "Ctl") << "connection setup rejected: " << err;
        postConnectionState(false, cfg.endpointUrl, err);
        return false;
    }
    const int attempts = cfg.retryAttempts > 0 ? cfg.retryAttempts : 1;
    const auto delay = std::chrono::milliseconds(
        static_cast<int64_t>((cfg.retryDelaySec > 0 ? cfg.retryDelaySec : 0) * 1000));
    return connect(opts, attempts, delay, err);
}

bool Controller::connect(const TransportOptions& opts, int retryAttempts,
                         std::chrono::milliseconds retryDelay, std::string& err) {
    std::shared_ptr<TaskGroup> group;
    uint64_t gen = 0;
    {
        std::lock_guard<std::mutex> lk(mx_);
        if (state_ == State::Connected) {
            logLine(LogLevel::Info, "Ctl") << "already connected to " << endpoint_;
            return true;
        }
        if (state_ != State::Idle) {
            err = "connect already in progress";
            logLine(LogLevel::Warn, "Ctl") << err;
            return false;
        }
        state_ = State::Connecting;
        endpoint_ = opts.endpointUrl;
        if (group_) group_->requestStop();
        group_ = std::make_shared<TaskGroup>(live_);
        group = group_;
        gen = ++generation_;
    }

    const std::stop_token st = group->token();
    const int attempts = retryAttempts > 0 ? retryAttempts : 1;
    std::shared_ptr<IProtocolSession> session;
    std::string lastErr;

    for (int i = 1; i <= attempts && !st.stop_requested(); ++i) {
        logLine(LogLevel::Info, "Ctl") << "connecting to " << opts.endpointUrl
                                       << " (attempt " << i << "/" << attempts << ")";
        uint32_t status = UaStatus::Good;
        std::string e;
        session = connector_.openSession(opts,
                                         [this, gen](const DataChangeNotification& n){ onDataChange(gen, n); },
                                         status, e);
        if (session) break;

        lastErr = e.empty() ? statusToString(status) : e;
        if ((status & 0xFFFF0000u) == UaStatus::BadTimeout)
            logLine(LogLevel::Warn, "Ctl") << "attempt " << i << " timed out: " << lastErr;
        else
            logLine(LogLevel::Warn, "Ctl") << "attempt " << i << " failed: " << lastErr;

        if (i < attempts && !TaskGroup::sleepFor(st, retryDelay)) break;
    }

    if (session && st.stop_requested()) {
        // während des Verbindens abgebrochen
        session->close();
        session.reset();
        lastErr = "connect cancelled";
    }

    if (!session) {
        const bool cancelled = st.stop_requested();
        {
            std::lock_guard<std::mutex> lk(mx_);
            if (group_ == group) group_.reset();
            state_ = State::Idle;
        }
        ++generation_;
        group->requestStop();
        group->join();
        err = cancelled ? std::string("connect cancelled")
                        : "connect failed after " + std::to_string(attempts) +
                          " attempt(s): " + lastErr;
        logLine(LogLevel::Error, "Ctl") << err;
        postConnectionState(false, opts.endpointUrl, err);
        return false;
    }

    {
        std::lock_guard<std::mutex> lk(mx_);
        session_ = session;
        state_ = State::Connected;
    }
    logLine(LogLevel::Info, "Ctl") << "connected to " << opts.endpointUrl
                                   << " (" << securityModeName(opts.securityMode) << ")";
    postConnectionState(true, opts.endpointUrl, {});

    group->spawn("watch-pump", [this, interval = opt_.pumpInterval](std::stop_token pst) {
        while (TaskGroup::sleepFor(pst, interval))
            watches_.publishSnapshot();
    });
    group->spawn("root-browse", [this, session](std::stop_token pst) {
        if (pst.stop_requested()) return;
        cache_.browse(*session, kRootFolder);
    });
    return true;
}

void Controller::onDataChange(uint64_t gen, const DataChangeNotification& n) {
    if (gen != generation_.load()) return;
    watches_.handleDataChange(n);
}

void Controller::disconnect() {
    std::shared_ptr<TaskGroup> group;
    std::shared_ptr<IProtocolSession> session;
    std::string endpoint;
    {
        std::lock_guard<std::mutex> lk(mx_);
        if (state_ == State::Connecting) {
            // connect() rollt selbst zurück
            if (group_) group_->requestStop();
            return;
        }
        if (state_ != State::Connected) return;
        state_ = State::Disconnecting;
        group = group_;
        session = session_;
        endpoint = endpoint_;
    }
    logLine(LogLevel::Info, "Ctl") << "disconnecting from " << endpoint;

    if (group) {
        group->requestStop();
        group->join();
    }
    ++generation_;

    watches_.removeAll();
    if (session) session->close();

    std::shared_ptr<BroadcastChannel> old;
    {
        std::lock_guard<std::mutex> lk(mx_);
        session_.reset();
        group_.reset();
        old = source_;
        source_ = std::make_shared<BroadcastChannel>(opt_.broadcastCapacity);
    }
    if (old) old->close();
    cache_.reset();

    {
        std::lock_guard<std::mutex> lk(mx_);
        state_ = State::Idle;
    }
    postConnectionState(false, endpoint, {});
    bus_.post(makeEvent(EventType::evAddressSpaceReset));
    logLine(LogLevel::Info, "Ctl") << "disconnected";
}

void Controller::shutdown() {
    stopListener();
    disconnect();
}

// ---------------------------------------------------------------------------
// Listener
// ---------------------------------------------------------------------------
void Controller::setListenerHooks(std::function<bool()> start, std::function<void()> stop) {
    std::lock_guard<std::mutex> lk(listenerMx_);
    listenerStart_ = std::move(start);
    listenerStop_  = std::move(stop);
}

void Controller::updateListenerState(const ClientConfig& cfg) {
    std::function<bool()> start;
    {
        std::lock_guard<std::mutex> lk(listenerMx_);
        if (cfg.apiEnabled == listenerRunning_) return;
        if (!cfg.apiEnabled) {
            // Stoppen unten außerhalb des Locks
        } else {
            start = listenerStart_;
        }
    }
    if (!cfg.apiEnabled) {
        stopListener();
        return;
    }
    if (!start) {
        logLine(LogLevel::Warn, "Ctl") << "listener enabled but no start hook installed";
        return;
    }
    const bool ok = start();
    {
        std::lock_guard<std::mutex> lk(listenerMx_);
        listenerRunning_ = ok;
    }
    if (ok) logLine(LogLevel::Info, "Ctl") << "listener started on port " << cfg.apiPort;
    else    logLine(LogLevel::Error, "Ctl") << "listener failed to start on port " << cfg.apiPort;
}

void Controller::stopListener() {
    std::function<void()> stop;
    {
        std::lock_guard<std::mutex> lk(listenerMx_);
        if (!listenerRunning_) return;
        listenerRunning_ = false;
        stop = listenerStop_;
    }
    if (stop) stop();
    logLine(LogLevel::Info, "Ctl") << "listener stopped";
}

bool Controller::listenerRunning() const {
    std::lock_guard<std::mutex> lk(listenerMx_);
    return listenerRunning_;
}

// ---------------------------------------------------------------------------
// Adressraum / Watches
// ---------------------------------------------------------------------------
bool Controller::browse(const std::string& parentId) {
    auto session = currentSession();
    if (!session) {
        logLine(LogLevel::Warn, "Ctl") << "browse " << parentId << ": not connected";
        return false;
    }
    const auto r = cache_.browse(*session, parentId);
    return r == AddressSpaceCache::BrowseResult::Done ||
           r == AddressSpaceCache::BrowseResult::AlreadyInFlight;
}

bool Controller::addWatch(const std::string& nodeId, std::string& err) {
    if (!isValidNodeId(nodeId)) {
        err = "invalid node id '" + nodeId + "'";
        logLine(LogLevel::Warn, "Ctl") << "add watch: " << err;
        return false;
    }
    // Epoche vor der Session lesen: ein removeAll() durch disconnect() danach
    // lässt die Reservierung scheitern statt einen Eintrag der alten Session anzulegen
    const uint64_t epoch = watches_.epoch();
    auto session = currentSession();
    if (!session) {
        err = "not connected";
        logLine(LogLevel::Warn, "Ctl") << "add watch " << nodeId << ": " << err;
        return false;
    }
    return watches_.addWatch(*session, nodeId, epoch, err);
}

bool Controller::removeWatch(const std::string& nodeId) {
    return watches_.removeWatch(nodeId);
}

void Controller::removeAllWatches() {
    watches_.removeAll();
}

// ---------------------------------------------------------------------------
// Lesen / Schreiben / Export
// ---------------------------------------------------------------------------
bool Controller::readNodeAttributes(const std::string& nodeId, NodeAttributes& out, std::string& err) {
    if (!isValidNodeId(nodeId)) {
        err = "invalid node id '" + nodeId + "'";
        return false;
    }
    auto session = currentSession();
    if (!session) {
        err = "not connected";
        return false;
    }

    static const std::vector<AttributeId> attrs = {
        AttributeId::NodeId, AttributeId::NodeClass, AttributeId::DisplayName,
        AttributeId::Description, AttributeId::AccessLevel, AttributeId::UserAccessLevel,
        AttributeId::DataType, AttributeId::Value, AttributeId::ValueRank,
        AttributeId::ArrayDimensions
    };
    std::vector<AttributeResult> r;
    const uint32_t st = session->readAttributes(nodeId, attrs, opt_.readTimeout, r);
    if (!UaStatus::isGood(st) || r.size() != attrs.size()) {
        err = "read failed: " + statusToString(st);
        logLine(LogLevel::Warn, "Ctl") << "read " << nodeId << ": " << err;
        return false;
    }

    NodeAttributes a;
    a.nodeId = nodeId;
    if (const UAScalar* s = scalarOf(r[0]))
        if (auto id = std::get_if<NodeIdValue>(s)) a.nodeId = id->id;
    if (const UAScalar* s = scalarOf(r[1]))
        if (auto nc = std::get_if<int32_t>(s)) a.nodeClass = nodeClassName(static_cast<NodeClass>(*nc));
    a.name = textOf(r[2]);
    if (a.name.empty()) a.name = nodeId;
    a.description = textOf(r[3]);

    uint8_t access = 0;
    if (byteOf(r[5], access) || byteOf(r[4], access))
        a.accessLevel = formatAccessLevel(access);

    BuiltinType declared = BuiltinType::Unknown;
    if (const UAScalar* s = scalarOf(r[6]))
        if (auto id = std::get_if<NodeIdValue>(s)) {
            a.dataType = dataTypeNameFromId(id->id);
            declared = builtinFromNodeId(id->id);
        }
    a.value = UaStatus::isGood(r[7].status) ? formatValue(r[7].value, declared)
                                            : statusToString(r[7].status);
    if (const UAScalar* s = scalarOf(r[8]))
        if (auto vr = std::get_if<int32_t>(s)) a.valueRank = *vr;
    if (UaStatus::isGood(r[9].status))
        if (auto dims = std::get_if<UAArray>(&r[9].value))
            for (const auto& d : *dims)
                if (auto u = std::get_if<uint32_t>(&d)) a.arrayDimensions.push_back(*u);

    out = a;
    bus_.post(makeEvent(EventType::evNodeAttributesUpdated, std::move(a)));
    return true;
}

bool Controller::writeValue(const std::string& nodeId, const std::string& typeHint,
                            const std::string& literal, WriteDoneFn done) {
    if (!isValidNodeId(nodeId)) {
        logLine(LogLevel::Warn, "Ctl") << "write rejected: invalid node id '" << nodeId << "'";
        return false;
    }
    std::shared_ptr<IProtocolSession> session;
    std::shared_ptr<TaskGroup> group;
    {
        std::lock_guard<std::mutex> lk(mx_);
        if (state_ == State::Connected) {
            session = session_;
            group = group_;
        }
    }
    if (!session || !group) {
        logLine(LogLevel::Warn, "Ctl") << "write " << nodeId << ": not connected";
        return false;
    }

    WriteRequest req{ nodeId, typeHint, literal };
    return group->spawn("write " + nodeId,
        [this, session, req, done = std::move(done)](std::stop_token st) {
            const WriteOutcome outcome = writer_.execute(*session, req, st);
            if (done) done(outcome);
        });
}

bool Controller::collectVariableNodes(const std::string& parentId, bool recursive,
                                      std::vector<TagExportRecord>& out, std::string& err) {
    std::shared_ptr<IProtocolSession> session;
    std::stop_token st;
    {
        std::lock_guard<std::mutex> lk(mx_);
        if (state_ == State::Connected && group_) {
            session = session_;
            st = group_->token();
        }
    }
    if (!session) {
        err = "not connected";
        return false;
    }

    const std::string start = parentId.empty() ? std::string(kRootFolder) : parentId;
    const auto deadline = std::chrono::steady_clock::now() + opt_.collectDeadline;

    auto tagRecord = [&](const std::string& id, const std::string& name, const std::string& path) {
        TagExportRecord rec;
        rec.nodeId = id;
        rec.name   = name;
        rec.path   = path;
        std::vector<AttributeResult> r;
        const uint32_t rs = session->readAttributes(
            id, { AttributeId::DataType, AttributeId::Description }, opt_.readTimeout, r);
        if (UaStatus::isGood(rs) && r.size() == 2) {
            if (const UAScalar* s = scalarOf(r[0]))
                if (auto dt = std::get_if<NodeIdValue>(s)) rec.dataType = dataTypeNameFromId(dt->id);
            rec.description = textOf(r[1]);
        }
        return rec;
    };

    // Startknoten selbst kann eine Variable sein
    NodeClass startClass = NodeClass::Unspecified;
    std::string startName = start;
    if (auto n = cache_.node(start)) {
        startClass = n->nodeClass;
        startName  = n->displayName;
    } else {
        std::vector<AttributeResult> r;
        const uint32_t rs = session->readAttributes(
            start, { AttributeId::NodeClass, AttributeId::DisplayName }, opt_.readTimeout, r);
        if (UaStatus::isGood(rs) && r.size() == 2) {
            if (const UAScalar* s = scalarOf(r[0]))
                if (auto nc = std::get_if<int32_t>(s)) startClass = static_cast<NodeClass>(*nc);
            const std::string name = textOf(r[1]);
            if (!name.empty()) startName = name;
        }
    }
    if (startClass == NodeClass::Variable) {
        out.push_back(tagRecord(start, startName, startName));
        logLine(LogLevel::Info, "Ctl") << "collected 1 variable (start node " << start << ")";
        return true;
    }

    struct Pending { std::string id; std::string path; };
    std::deque<Pending> queue{ { start, {} } };
    std::unordered_set<std::string> visited{ start };

    while (!queue.empty()) {
        if (st.stop_requested()) {
            err = "not connected";
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            err = "export traversal timeout";
            logLine(LogLevel::Warn, "Ctl") << "collect under " << start << ": " << err
                                           << " (" << out.size() << " tags so far)";
            return false;
        }
        Pending cur = std::move(queue.front());
        queue.pop_front();

        if (!cache_.browseAndWait(*session, cur.id, deadline, st)) {
            logLine(LogLevel::Debug, "Ctl") << "collect: no children for " << cur.id;
            continue;
        }

        for (const auto& child : cache_.children(cur.id)) {
            if (!visited.insert(child.id).second) continue;
            const std::string path = cur.path.empty() ? child.displayName
                                                      : cur.path + "/" + child.displayName;
            if (child.nodeClass == NodeClass::Variable) {
                out.push_back(tagRecord(child.id, child.displayName, path));
            } else if (recursive && child.hasChildren) {
                queue.push_back({ child.id, path });
            }
        }
    }
    logLine(LogLevel::Info, "Ctl") << "collected " << out.size() << " variable(s) under " << start;
    return true;
}
