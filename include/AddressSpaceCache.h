// AddressSpaceCache – Cache des Adressraums (ein Browse pro Elternknoten)
//
//  - browse          : genau ein Netzwerk-Browse je Elternknoten gleichzeitig;
//                      weitere Aufrufer bekommen AlreadyInFlight.
//  - browseAndWait   : wartet auf einen laufenden Browse desselben Knotens
//                      (für Traversierungen mit Deadline).
//  - children / node : Lesezugriffe auf den Cache (Kinder nach Anzeigename sortiert).
//  - reset           : neue Epoche, Maps werden komplett ersetzt. Browse-Ergebnisse
//                      aus der alten Epoche werden verworfen.
//
// Nach jedem erfolgreichen Browse wird onUpdate(parentId) außerhalb der Locks gerufen.
#pragma once
#include "IProtocolSession.h"
#include "NodeTypes.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

class AddressSpaceCache {
public:
    enum class BrowseResult { Done, AlreadyInFlight, Failed, Stale };
    using UpdateFn = std::function<void(const std::string& parentId)>;

    explicit AddressSpaceCache(UpdateFn onUpdate = {},
                               std::chrono::milliseconds browseTimeout = std::chrono::seconds(10));

    BrowseResult browse(IProtocolSession& session, const std::string& parentId);

    bool browseAndWait(IProtocolSession& session, const std::string& parentId,
                       std::chrono::steady_clock::time_point deadline,
                       std::stop_token st = {});

    bool hasBeenBrowsed(const std::string& id) const;
    bool isBrowsing(const std::string& id) const;

    std::vector<AddressSpaceNode> children(const std::string& parentId) const;
    std::optional<AddressSpaceNode> node(const std::string& id) const;
    size_t nodeCount() const;

    void reset();
    uint64_t epoch() const;

    static const char* resultName(BrowseResult r);

private:
    struct Maps {
        std::unordered_map<std::string, AddressSpaceNode> nodes;
        std::unordered_map<std::string, std::vector<std::string>> children;
    };

    UpdateFn onUpdate_;
    const std::chrono::milliseconds browseTimeout_;

    mutable std::shared_mutex mx_;
    std::shared_ptr<Maps> maps_;
    uint64_t epoch_ = 1;

    // laufende Browses: parentId -> Epoche in der sie gestartet wurden
    mutable std::mutex flightMx_;
    std::condition_variable_any flightCv_;
    std::unordered_map<std::string, uint64_t> inFlight_;
};
