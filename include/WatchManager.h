// WatchManager – Menge der beobachteten Knoten (Watch-Liste)
//
//  - addWatch        : idempotent; Startwerte per Read, danach MonitoredItem anlegen.
//                      Schlägt das Monitoring fehl, bleibt der Eintrag (nur Startwert).
//  - removeWatch     : Monitoring-Handle freigeben, dann Eintrag verwerfen.
//  - removeAll       : Map unter Lock austauschen, Handles außerhalb freigeben.
//                      Erhöht die Epoche; addWatch mit älterer Epoche wird abgewiesen.
//  - handleDataChange: Wert formatieren, Status zerlegen, Snapshot an Beobachter und
//                      Kopie nicht-blockierend an den Broadcast-Kanal.
//  - publishSnapshot : vom Pump-Task zyklisch aufgerufen (ca. 30 Hz).
//
// Die Snapshot-Liste ist immer nach nodeId sortiert.
#pragma once
#include "IProtocolSession.h"
#include "NodeTypes.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

class WatchManager {
public:
    using SnapshotFn  = std::function<void(std::vector<BroadcastMessage>)>;
    // false = Kanal voll oder geschlossen (Nachricht verworfen)
    using BroadcastFn = std::function<bool(const BroadcastMessage&)>;

    WatchManager(SnapshotFn onSnapshot, BroadcastFn broadcast,
                 std::chrono::milliseconds readTimeout = std::chrono::seconds(5));

    bool addWatch(IProtocolSession& session, const std::string& nodeId, std::string& err);
    // epoch: vor dem Holen der Session gelesen (Controller), siehe epoch()
    bool addWatch(IProtocolSession& session, const std::string& nodeId, uint64_t epoch,
                  std::string& err);
    bool removeWatch(const std::string& nodeId);
    void removeAll();

    void handleDataChange(const DataChangeNotification& n);

    std::vector<BroadcastMessage> snapshot() const;
    bool contains(const std::string& nodeId) const;
    bool isMonitored(const std::string& nodeId) const;
    size_t size() const;
    uint64_t epoch() const;

    void publishSnapshot();

    uint64_t droppedBroadcasts() const { return dropped_.load(std::memory_order_relaxed); }

private:
    struct WatchItem {
        BroadcastMessage data;
        BuiltinType declared = BuiltinType::Unknown;
        std::unique_ptr<IMonitoredItem> handle;
    };

    std::vector<BroadcastMessage> snapshotLocked() const;
    static void applyStatus(BroadcastMessage& m, uint32_t status);
    static void releaseHandle(const std::string& nodeId, IMonitoredItem& h);

    SnapshotFn  onSnapshot_;
    BroadcastFn broadcast_;
    const std::chrono::milliseconds readTimeout_;

    mutable std::shared_mutex mx_;
    std::map<std::string, WatchItem> items_;
    uint64_t epoch_ = 0;   // unter mx_
    std::atomic<uint64_t> dropped_{0};
};
