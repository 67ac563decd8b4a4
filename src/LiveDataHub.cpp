#include "LiveDataHub.h"
#include "Logger.h"
#include "ValueFormat.h"

namespace {
constexpr const char* kTag = "Hub";
}

void LiveDataHub::Inbox::signal() {
    {
        std::lock_guard<std::mutex> lk(mx);
        signalled = true;
    }
    cv.notify_one();
}

LiveDataHub::LiveDataHub(INodeManager& nodes) : LiveDataHub(nodes, Options{}) {}

LiveDataHub::LiveDataHub(INodeManager& nodes, Options o)
    : nodes_(nodes), opt_(o), inbox_(std::make_shared<Inbox>()) {}

LiveDataHub::~LiveDataHub() {
    stop();
}

bool LiveDataHub::start() {
    if (running_.exchange(true)) return false;
    tasks_ = std::make_unique<TaskGroup>();
    tasks_->spawn("hub-coordinator", [this](std::stop_token st){ run(st); });
    tasks_->spawn("hub-jobs",        [this](std::stop_token st){ runJobs(st); });
    logLine(LogLevel::Info, kTag) << "live data hub started";
    return true;
}

void LiveDataHub::stop() {
    if (!running_.exchange(false)) return;
    tasks_->requestStop();
    tasks_->join();
    tasks_.reset();
    {
        std::lock_guard<std::mutex> lk(jobMx_);
        jobs_.clear();
    }
    {
        std::lock_guard<std::mutex> lk(inbox_->mx);
        inbox_->events.clear();
    }
    logLine(LogLevel::Info, kTag) << "live data hub stopped";
}

// ---------------------------------------------------------------------------
// Eingänge (beliebige Threads)
// ---------------------------------------------------------------------------
void LiveDataHub::post(HubEvent ev) {
    {
        std::lock_guard<std::mutex> lk(inbox_->mx);
        inbox_->events.push_back(std::move(ev));
    }
    inbox_->cv.notify_one();
}

uint64_t LiveDataHub::registerClient(std::shared_ptr<IHubTransport> transport) {
    if (!transport) return 0;
    const uint64_t id = nextId_.fetch_add(1);
    HubEvent ev;
    ev.kind = HubEvent::Kind::Register;
    ev.clientId = id;
    ev.transport = std::move(transport);
    post(std::move(ev));
    return id;
}

void LiveDataHub::unregisterClient(uint64_t id) {
    HubEvent ev;
    ev.kind = HubEvent::Kind::Unregister;
    ev.clientId = id;
    post(std::move(ev));
}

void LiveDataHub::onTransportError(uint64_t id, const std::string& err) {
    logLine(LogLevel::Warn, kTag) << "client " << id << " transport error: " << err;
    unregisterClient(id);
}

void LiveDataHub::onClientMessage(uint64_t id, const std::string& text) {
    HubControl c;
    std::string err;
    if (!parseHubControl(text, c, err)) {
        logLine(LogLevel::Warn, kTag) << "client " << id << ": ignoring control message: " << err;
        return;
    }
    HubEvent ev;
    ev.kind = HubEvent::Kind::Control;
    ev.clientId = id;
    ev.control = std::move(c);
    post(std::move(ev));
}

std::vector<HubClientInfo> LiveDataHub::clients() const {
    std::vector<HubClientInfo> out;
    std::shared_lock<std::shared_mutex> rl(clientsMx_);
    out.reserve(clients_.size());
    for (const auto& [id, c] : clients_) {
        HubClientInfo info;
        info.id = id;
        info.remoteAddress = c.transport->remoteAddress();
        info.subscribeAll = c.all;
        info.nodeIds.assign(c.filter.begin(), c.filter.end());
        out.push_back(std::move(info));
    }
    return out;
}

size_t LiveDataHub::clientCount() const {
    std::shared_lock<std::shared_mutex> rl(clientsMx_);
    return clients_.size();
}

// ---------------------------------------------------------------------------
// Koordinator
// ---------------------------------------------------------------------------
void LiveDataHub::run(std::stop_token st) {
    std::weak_ptr<Inbox> inbox = inbox_;
    auto bind = [inbox](const std::shared_ptr<BroadcastChannel>& ch) {
        if (ch) ch->setNotify([inbox]{ if (auto in = inbox.lock()) in->signal(); });
    };

    std::shared_ptr<BroadcastChannel> src = nodes_.broadcastSource();
    bind(src);
    bool sourceClosed = false;

    while (!st.stop_requested()) {
        std::deque<HubEvent> evs;
        {
            std::unique_lock<std::mutex> lk(inbox_->mx);
            inbox_->cv.wait_for(lk, st, opt_.idleWait,
                                [&]{ return !inbox_->events.empty() || inbox_->signalled; });
            evs.swap(inbox_->events);
            inbox_->signalled = false;
        }
        for (auto& ev : evs) handle(ev);

        if (!src) {
            src = nodes_.broadcastSource();
            bind(src);
            continue;
        }

        BroadcastMessage m;
        while (src->tryPop(m)) fanOut(m);

        if (src->drained()) {
            if (!sourceClosed) {
                closeAll("session ended");
                sourceClosed = true;
            }
            auto fresh = nodes_.broadcastSource();
            if (fresh && fresh != src) {
                src->setNotify({});
                src = std::move(fresh);
                bind(src);
                sourceClosed = false;
                rebinds_.fetch_add(1);
                logLine(LogLevel::Debug, kTag) << "bound to new broadcast channel";
            }
        }
    }

    if (src) src->setNotify({});
    closeAll("hub shutdown");
}

void LiveDataHub::handle(HubEvent& ev) {
    switch (ev.kind) {
        case HubEvent::Kind::Register:
            addClient(ev.clientId, std::move(ev.transport));
            break;
        case HubEvent::Kind::Unregister:
            removeClient(ev.clientId, "unregistered");
            break;
        case HubEvent::Kind::Control:
            applyControl(ev.clientId, ev.control);
            break;
        case HubEvent::Kind::Snapshot: {
            std::shared_lock<std::shared_mutex> rl(clientsMx_);
            auto it = clients_.find(ev.clientId);
            if (it == clients_.end()) break;
            for (const auto& m : ev.snapshot) {
                if (!it->second.all && !it->second.filter.count(m.nodeId)) continue;
                // Snapshot ist best effort: volle Queue verwirft nur diese Nachricht
                if (!it->second.out->tryPush(broadcastToJson(m).dump()))
                    logLine(LogLevel::Debug, kTag) << "client " << ev.clientId
                                                   << ": snapshot for " << m.nodeId << " dropped";
            }
            break;
        }
    }
}

void LiveDataHub::addClient(uint64_t id, std::shared_ptr<IHubTransport> transport) {
    Client c;
    c.id = id;
    c.transport = transport;
    c.out = std::make_shared<BoundedQueue<std::string>>(opt_.clientQueueCapacity);

    if (!tasks_->spawn("hub-writer-" + std::to_string(id),
            [this, id, transport, out = c.out](std::stop_token st) {
                writerLoop(st, id, transport, out);
            })) {
        transport->close();
        return;
    }
    const std::string remote = transport->remoteAddress();
    {
        std::unique_lock<std::shared_mutex> wl(clientsMx_);
        clients_.emplace(id, std::move(c));
    }
    logLine(LogLevel::Info, kTag) << "client " << id << " connected (" << remote << ")";
}

void LiveDataHub::removeClient(uint64_t id, const char* reason) {
    std::shared_ptr<BoundedQueue<std::string>> out;
    {
        std::unique_lock<std::shared_mutex> wl(clientsMx_);
        auto it = clients_.find(id);
        if (it == clients_.end()) return;
        out = it->second.out;
        clients_.erase(it);
    }
    out->close();
    logLine(LogLevel::Info, kTag) << "client " << id << " removed (" << reason << ")";
}

void LiveDataHub::closeAll(const char* reason) {
    std::map<uint64_t, Client> old;
    {
        std::unique_lock<std::shared_mutex> wl(clientsMx_);
        old.swap(clients_);
    }
    for (auto& [id, c] : old) c.out->close();
    if (!old.empty())
        logLine(LogLevel::Info, kTag) << "closed " << old.size() << " client(s): " << reason;
}

void LiveDataHub::applyControl(uint64_t id, const HubControl& c) {
    {
        std::unique_lock<std::shared_mutex> wl(clientsMx_);
        auto it = clients_.find(id);
        if (it == clients_.end()) {
            logLine(LogLevel::Debug, kTag) << "control for unknown client " << id;
            return;
        }
        Client& cl = it->second;
        switch (c.action) {
            case HubAction::Subscribe:
                cl.filter.insert(c.nodeIds.begin(), c.nodeIds.end());
                break;
            case HubAction::Unsubscribe:
                for (const auto& n : c.nodeIds) cl.filter.erase(n);
                break;
            case HubAction::SubscribeAll:
                cl.all = true;
                break;
            case HubAction::UnsubscribeAll:
                cl.all = false;
                break;
        }
    }
    logLine(LogLevel::Debug, kTag) << "client " << id << ": " << hubActionName(c.action)
                                   << " (" << c.nodeIds.size() << " node ids)";

    if (c.action != HubAction::Subscribe) return;

    // Watch anlegen und aktuellen Wert einmalig an diesen Client schicken
    postJob([this, id, ids = c.nodeIds](std::stop_token st) {
        std::vector<BroadcastMessage> snap;
        const DecodedStatus good = decodeStatusCode(UaStatus::Good);
        for (const auto& nid : ids) {
            if (st.stop_requested()) return;
            std::string err;
            if (!nodes_.addWatch(nid, err))
                logLine(LogLevel::Warn, kTag) << "watch for " << nid << " not created: " << err;
            NodeAttributes a;
            if (!nodes_.readNodeAttributes(nid, a, err)) {
                logLine(LogLevel::Debug, kTag) << "snapshot of " << nid << " unavailable: " << err;
                continue;
            }
            BroadcastMessage m;
            m.nodeId       = nid;
            m.name         = a.name;
            m.dataType     = a.dataType;
            m.value        = a.value;
            m.timestamp    = formatClock(nowUnixMs());
            m.severity     = good.severity;
            m.symbolicName = good.symbolicName;
            m.rawStatus    = good.rawCode;
            snap.push_back(std::move(m));
        }
        if (snap.empty()) return;
        HubEvent ev;
        ev.kind = HubEvent::Kind::Snapshot;
        ev.clientId = id;
        ev.snapshot = std::move(snap);
        post(std::move(ev));
    });
}

void LiveDataHub::fanOut(const BroadcastMessage& m) {
    std::string text;
    std::vector<uint64_t> dead;
    {
        std::shared_lock<std::shared_mutex> rl(clientsMx_);
        for (const auto& [id, c] : clients_) {
            if (!c.all && !c.filter.count(m.nodeId)) continue;
            if (text.empty()) text = broadcastToJson(m).dump();
            if (!c.out->tryPush(text)) dead.push_back(id);
        }
    }
    for (uint64_t id : dead) {
        logLine(LogLevel::Warn, kTag) << "client " << id << " cannot keep up, disconnecting";
        removeClient(id, "queue full");
    }
}

// ---------------------------------------------------------------------------
// Writer je Client / Job-Worker
// ---------------------------------------------------------------------------
void LiveDataHub::writerLoop(std::stop_token st, uint64_t id,
                             std::shared_ptr<IHubTransport> transport,
                             std::shared_ptr<BoundedQueue<std::string>> out) {
    for (;;) {
        std::string msg;
        const auto r = out->popWait(msg, st, std::chrono::milliseconds(500));
        if (r == BoundedQueue<std::string>::PopResult::Timeout) continue;
        if (r != BoundedQueue<std::string>::PopResult::Item) break;

        std::string err;
        if (!transport->send(msg, err)) {
            logLine(LogLevel::Warn, kTag) << "client " << id << " write failed: " << err;
            out->close();
            unregisterClient(id);
            break;
        }
    }
    transport->close();
}

void LiveDataHub::postJob(std::function<void(std::stop_token)> job) {
    {
        std::lock_guard<std::mutex> lk(jobMx_);
        jobs_.push_back(std::move(job));
    }
    jobCv_.notify_one();
}

void LiveDataHub::runJobs(std::stop_token st) {
    while (!st.stop_requested()) {
        std::function<void(std::stop_token)> job;
        {
            std::unique_lock<std::mutex> lk(jobMx_);
            if (!jobCv_.wait(lk, st, [&]{ return !jobs_.empty(); })) break;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        try {
            job(st);
        } catch (const std::exception& e) {
            logLine(LogLevel::Warn, kTag) << "job failed: " << e.what();
        }
    }
}
