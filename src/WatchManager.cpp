#include "WatchManager.h"
#include "Logger.h"
#include "ValueFormat.h"

WatchManager::WatchManager(SnapshotFn onSnapshot, BroadcastFn broadcast,
                           std::chrono::milliseconds readTimeout)
    : onSnapshot_(std::move(onSnapshot)),
      broadcast_(std::move(broadcast)),
      readTimeout_(readTimeout) {}

void WatchManager::applyStatus(BroadcastMessage& m, uint32_t status) {
    const DecodedStatus d = decodeStatusCode(status);
    m.severity         = d.severity;
    m.symbolicName     = d.symbolicName;
    m.subCode          = d.subCode;
    m.structureChanged = d.structureChanged;
    m.semanticsChanged = d.semanticsChanged;
    m.infoBits         = d.infoBits;
    m.rawStatus        = d.rawCode;
}

void WatchManager::releaseHandle(const std::string& nodeId, IMonitoredItem& h) {
    std::string err;
    if (!h.release(err))
        logLine(LogLevel::Warn, "Watch") << "releasing monitored item for " << nodeId
                                         << " failed: " << err;
}

bool WatchManager::addWatch(IProtocolSession& session, const std::string& nodeId, std::string& err) {
    return addWatch(session, nodeId, epoch(), err);
}

bool WatchManager::addWatch(IProtocolSession& session, const std::string& nodeId, uint64_t epoch,
                            std::string& err) {
    // Eintrag zuerst reservieren, damit parallele Aufrufe nur einmal monitoren
    {
        std::unique_lock<std::shared_mutex> wl(mx_);
        if (epoch_ != epoch) {
            err = "watch list was reset";
            logLine(LogLevel::Debug, "Watch") << "add " << nodeId << " skipped: " << err;
            return false;
        }
        if (items_.count(nodeId)) return true;
        WatchItem it;
        it.data.nodeId = nodeId;
        it.data.name   = nodeId;
        applyStatus(it.data, UaStatus::BadWaitingForInitialData);
        items_.emplace(nodeId, std::move(it));
    }

    std::vector<AttributeResult> res;
    const uint32_t st = session.readAttributes(
        nodeId, { AttributeId::DisplayName, AttributeId::DataType, AttributeId::Value },
        readTimeout_, res);

    std::string name = nodeId, dataType;
    BuiltinType declared = BuiltinType::Unknown;
    UAValue value;
    uint32_t valueStatus = st;
    if (UaStatus::isGood(st) && res.size() == 3) {
        if (UaStatus::isGood(res[0].status)) {
            if (auto s = std::get_if<UAScalar>(&res[0].value)) {
                if (auto lt = std::get_if<LocalizedText>(s); lt && !lt->text.empty()) name = lt->text;
                else if (auto str = std::get_if<std::string>(s); str && !str->empty()) name = *str;
            }
        }
        if (UaStatus::isGood(res[1].status)) {
            if (auto s = std::get_if<UAScalar>(&res[1].value))
                if (auto id = std::get_if<NodeIdValue>(s)) {
                    dataType = dataTypeNameFromId(id->id);
                    declared = builtinFromNodeId(id->id);
                }
        }
        value       = res[2].value;
        valueStatus = res[2].status;
    } else {
        logLine(LogLevel::Warn, "Watch") << "initial read of " << nodeId << " failed: "
                                         << statusToString(st);
    }

    {
        std::unique_lock<std::shared_mutex> wl(mx_);
        auto it = items_.find(nodeId);
        if (epoch_ != epoch || it == items_.end()) {
            err = "watch removed during setup";
            return false;
        }
        auto& d = it->second.data;
        d.name      = name;
        d.dataType  = dataType;
        d.value     = formatValue(value, declared);
        d.timestamp = formatClock(nowUnixMs());
        applyStatus(d, valueStatus);
        it->second.declared = declared;
    }

    std::string monErr;
    std::unique_ptr<IMonitoredItem> handle = session.beginMonitoring(nodeId, monErr);
    if (!handle) {
        logLine(LogLevel::Warn, "Watch") << "monitoring " << nodeId << " failed: " << monErr
                                         << " (keeping initial value only)";
    } else {
        std::unique_lock<std::shared_mutex> wl(mx_);
        auto it = items_.find(nodeId);
        if (epoch_ == epoch && it != items_.end() && !it->second.handle) {
            it->second.handle = std::move(handle);
        }
    }
    // Eintrag wurde inzwischen entfernt -> Handle sofort wieder freigeben
    if (handle) releaseHandle(nodeId, *handle);

    logLine(LogLevel::Info, "Watch") << "watching " << nodeId << " (" << name << ")";
    publishSnapshot();

    BroadcastMessage msg;
    {
        std::shared_lock<std::shared_mutex> rl(mx_);
        auto it = items_.find(nodeId);
        if (it == items_.end()) return true;
        msg = it->second.data;
    }
    if (broadcast_ && !broadcast_(msg)) dropped_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

bool WatchManager::removeWatch(const std::string& nodeId) {
    std::map<std::string, WatchItem>::node_type nh;
    {
        std::unique_lock<std::shared_mutex> wl(mx_);
        nh = items_.extract(nodeId);
    }
    if (nh.empty()) return false;
    if (nh.mapped().handle) releaseHandle(nodeId, *nh.mapped().handle);
    nh.mapped().handle.reset();
    logLine(LogLevel::Info, "Watch") << "removed " << nodeId;
    publishSnapshot();
    return true;
}

void WatchManager::removeAll() {
    std::map<std::string, WatchItem> old;
    {
        std::unique_lock<std::shared_mutex> wl(mx_);
        old.swap(items_);
        ++epoch_;
    }
    for (auto& [id, item] : old)
        if (item.handle) releaseHandle(id, *item.handle);
    if (!old.empty()) {
        logLine(LogLevel::Info, "Watch") << "removed all " << old.size() << " watches";
        publishSnapshot();
    }
}

void WatchManager::handleDataChange(const DataChangeNotification& n) {
    BroadcastMessage msg;
    std::vector<BroadcastMessage> snap;
    {
        std::unique_lock<std::shared_mutex> wl(mx_);
        auto it = items_.find(n.nodeId);
        if (it == items_.end()) return;
        auto& d = it->second.data;
        d.value     = formatValue(n.value, it->second.declared);
        d.timestamp = formatClock(n.sourceTimestampMs ? n.sourceTimestampMs : nowUnixMs());
        applyStatus(d, n.status);
        msg  = d;
        snap = snapshotLocked();
    }
    if (onSnapshot_) onSnapshot_(std::move(snap));
    if (broadcast_ && !broadcast_(msg)) {
        const uint64_t n_dropped = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
        if (n_dropped == 1 || n_dropped % 100 == 0)
            logLine(LogLevel::Debug, "Watch") << "broadcast channel full, dropped " << n_dropped;
    }
}

std::vector<BroadcastMessage> WatchManager::snapshotLocked() const {
    std::vector<BroadcastMessage> out;
    out.reserve(items_.size());
    for (const auto& [id, item] : items_) out.push_back(item.data);
    return out;
}

uint64_t WatchManager::epoch() const {
    std::shared_lock<std::shared_mutex> rl(mx_);
    return epoch_;
}

std::vector<BroadcastMessage> WatchManager::snapshot() const {
    std::shared_lock<std::shared_mutex> rl(mx_);
    return snapshotLocked();
}

bool WatchManager::contains(const std::string& nodeId) const {
    std::shared_lock<std::shared_mutex> rl(mx_);
    return items_.count(nodeId) != 0;
}

bool WatchManager::isMonitored(const std::string& nodeId) const {
    std::shared_lock<std::shared_mutex> rl(mx_);
    auto it = items_.find(nodeId);
    return it != items_.end() && it->second.handle != nullptr;
}

size_t WatchManager::size() const {
    std::shared_lock<std::shared_mutex> rl(mx_);
    return items_.size();
}

void WatchManager::publishSnapshot() {
    if (onSnapshot_) onSnapshot_(snapshot());
}
