#include "AddressSpaceCache.h"
#include "Logger.h"
#include <algorithm>

AddressSpaceCache::AddressSpaceCache(UpdateFn onUpdate, std::chrono::milliseconds browseTimeout)
    : onUpdate_(std::move(onUpdate)),
      browseTimeout_(browseTimeout),
      maps_(std::make_shared<Maps>()) {}

const char* AddressSpaceCache::resultName(BrowseResult r) {
    switch (r) {
        case BrowseResult::Done:            return "Done";
        case BrowseResult::AlreadyInFlight: return "AlreadyInFlight";
        case BrowseResult::Failed:          return "Failed";
        case BrowseResult::Stale:           return "Stale";
    }
    return "?";
}

AddressSpaceCache::BrowseResult
AddressSpaceCache::browse(IProtocolSession& session, const std::string& parentId) {
    uint64_t myEpoch = 0;
    {
        std::lock_guard<std::mutex> lk(flightMx_);
        if (inFlight_.count(parentId)) {
            logLine(LogLevel::Debug, "Browse") << parentId << " already in flight";
            return BrowseResult::AlreadyInFlight;
        }
        {
            std::shared_lock<std::shared_mutex> rl(mx_);
            myEpoch = epoch_;
        }
        inFlight_[parentId] = myEpoch;
    }

    auto finish = [&](BrowseResult r) {
        {
            std::lock_guard<std::mutex> lk(flightMx_);
            auto it = inFlight_.find(parentId);
            if (it != inFlight_.end() && it->second == myEpoch) inFlight_.erase(it);
        }
        flightCv_.notify_all();
        return r;
    };

    std::vector<BrowseReference> refs;
    const uint32_t st = session.browse(parentId, browseTimeout_, refs);
    if (!UaStatus::isGood(st)) {
        logLine(LogLevel::Warn, "Browse") << "browse of " << parentId << " failed: "
                                          << statusToString(st);
        return finish(BrowseResult::Failed);
    }

    std::vector<AddressSpaceNode> kids;
    kids.reserve(refs.size());
    for (const auto& r : refs) {
        AddressSpaceNode n;
        n.id = !r.nodeId.empty() ? r.nodeId : r.expandedNodeId;
        if (n.id.empty()) continue;
        n.displayName = r.displayName.empty() ? n.id : r.displayName;
        n.nodeClass   = r.nodeClass;
        n.hasChildren = r.nodeClass != NodeClass::Variable && r.nodeClass != NodeClass::Method;
        kids.push_back(std::move(n));
    }
    std::stable_sort(kids.begin(), kids.end(), [](const AddressSpaceNode& a, const AddressSpaceNode& b){
        if (a.displayName != b.displayName) return a.displayName < b.displayName;
        return a.id < b.id;
    });

    {
        std::unique_lock<std::shared_mutex> wl(mx_);
        if (epoch_ != myEpoch) {
            wl.unlock();
            logLine(LogLevel::Debug, "Browse") << "discarding stale result for " << parentId;
            return finish(BrowseResult::Stale);
        }
        std::vector<std::string> ids;
        ids.reserve(kids.size());
        for (auto& k : kids) {
            ids.push_back(k.id);
            maps_->nodes[k.id] = std::move(k);
        }
        maps_->children[parentId] = std::move(ids);
    }

    logLine(LogLevel::Debug, "Browse") << parentId << ": " << refs.size() << " references";
    finish(BrowseResult::Done);
    if (onUpdate_) onUpdate_(parentId);
    return BrowseResult::Done;
}

bool AddressSpaceCache::browseAndWait(IProtocolSession& session, const std::string& parentId,
                                      std::chrono::steady_clock::time_point deadline,
                                      std::stop_token st) {
    // zweiter Versuch, falls der fremde Browse fehlgeschlagen ist
    for (int attempt = 0; attempt < 2; ++attempt) {
        if (hasBeenBrowsed(parentId)) return true;
        const BrowseResult r = browse(session, parentId);
        if (r == BrowseResult::Done)   return true;
        if (r != BrowseResult::AlreadyInFlight) return false;

        std::unique_lock<std::mutex> lk(flightMx_);
        const bool finished = flightCv_.wait_until(lk, st, deadline,
                                                   [&]{ return inFlight_.count(parentId) == 0; });
        if (!finished) return false;
    }
    return hasBeenBrowsed(parentId);
}

bool AddressSpaceCache::hasBeenBrowsed(const std::string& id) const {
    std::shared_lock<std::shared_mutex> rl(mx_);
    return maps_->children.count(id) != 0;
}

bool AddressSpaceCache::isBrowsing(const std::string& id) const {
    std::lock_guard<std::mutex> lk(flightMx_);
    return inFlight_.count(id) != 0;
}

std::vector<AddressSpaceNode> AddressSpaceCache::children(const std::string& parentId) const {
    std::vector<AddressSpaceNode> out;
    std::shared_lock<std::shared_mutex> rl(mx_);
    auto it = maps_->children.find(parentId);
    if (it == maps_->children.end()) return out;
    out.reserve(it->second.size());
    for (const auto& id : it->second) {
        auto n = maps_->nodes.find(id);
        if (n != maps_->nodes.end()) out.push_back(n->second);
    }
    return out;
}

std::optional<AddressSpaceNode> AddressSpaceCache::node(const std::string& id) const {
    std::shared_lock<std::shared_mutex> rl(mx_);
    auto it = maps_->nodes.find(id);
    if (it == maps_->nodes.end()) return std::nullopt;
    return it->second;
}

size_t AddressSpaceCache::nodeCount() const {
    std::shared_lock<std::shared_mutex> rl(mx_);
    return maps_->nodes.size();
}

void AddressSpaceCache::reset() {
    auto fresh = std::make_shared<Maps>();
    {
        std::unique_lock<std::shared_mutex> wl(mx_);
        maps_.swap(fresh);
        ++epoch_;
    }
    {
        std::lock_guard<std::mutex> lk(flightMx_);
        inFlight_.clear();
    }
    flightCv_.notify_all();
    logLine(LogLevel::Debug, "Browse") << "address space cache reset";
}

uint64_t AddressSpaceCache::epoch() const {
    std::shared_lock<std::shared_mutex> rl(mx_);
    return epoch_;
}
