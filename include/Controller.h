// Controller – Verbindungs-Lebenszyklus und Fassade für Host/UI/Hub
//
// Zustände: Idle -> Connecting -> Connected -> Disconnecting -> Idle
//   connect    : Provisionierung, bis zu retryAttempts Versuche (unterbrechbare Pause),
//                bei Erfolg Watch-Pump starten und Root-Ordner (i=84) browsen.
//                Kein Effekt, wenn bereits Connecting/Connected.
//   disconnect : Generation abbrechen und Tasks joinen, Watches freigeben, Session
//                schließen, Broadcast-Kanal erneuern, Cache ersetzen. Idempotent.
//   shutdown   : externen Listener stoppen, dann disconnect.
//
// Jede Verbindung ist eine Generation (TaskGroup). Kein Hintergrund-Task überlebt
// seine Generation; Data-Change-Callbacks älterer Generationen werden verworfen.
// Zustandsänderungen gehen als Events über den EventBus an die Beobachter.
#pragma once
#include "AddressSpaceCache.h"
#include "ClientConfig.h"
#include "EventBus.h"
#include "INodeManager.h"
#include "IProtocolSession.h"
#include "SecureChannelProvisioner.h"
#include "TaskGroup.h"
#include "WatchManager.h"
#include "WriteEngine.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class Controller : public INodeManager {
public:
    enum class State { Idle, Connecting, Connected, Disconnecting };

    struct Options {
        std::chrono::milliseconds browseTimeout{10000};
        std::chrono::milliseconds readTimeout{5000};
        std::chrono::milliseconds pumpInterval{33};
        std::chrono::milliseconds collectDeadline{30000};
        size_t broadcastCapacity = 64;
        WriteEngine::Options write{};
        SecureChannelProvisioner::Options provisioner{};
    };

    using WriteDoneFn = std::function<void(const WriteOutcome&)>;

    Controller(IProtocolConnector& connector, EventBus& bus);
    Controller(IProtocolConnector& connector, EventBus& bus, Options opt);
    ~Controller() override;

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    // Lebenszyklus
    bool connect(const ClientConfig& cfg, std::string& err);
    bool connect(const TransportOptions& opts, int retryAttempts,
                 std::chrono::milliseconds retryDelay, std::string& err);
    void disconnect();
    void shutdown();

    State state() const;
    bool isConnected() const;
    std::string endpoint() const;
    static const char* stateName(State s);

    // Adressraum
    bool browse(const std::string& parentId);
    bool hasBrowseBeenPerformed(const std::string& id) const { return cache_.hasBeenBrowsed(id); }
    bool isBrowsing(const std::string& id) const { return cache_.isBrowsing(id); }
    std::vector<AddressSpaceNode> addressSpaceChildren(const std::string& parentId) const {
        return cache_.children(parentId);
    }
    std::optional<AddressSpaceNode> node(const std::string& id) const { return cache_.node(id); }

    // Watches
    bool addWatch(const std::string& nodeId, std::string& err) override;
    bool removeWatch(const std::string& nodeId);
    void removeAllWatches();
    std::vector<BroadcastMessage> watchList() const override { return watches_.snapshot(); }

    // Lesen / Schreiben
    bool readNodeAttributes(const std::string& nodeId, NodeAttributes& out, std::string& err) override;
    bool writeValue(const std::string& nodeId, const std::string& typeHint,
                    const std::string& literal, WriteDoneFn done = {});

    bool collectVariableNodes(const std::string& parentId, bool recursive,
                              std::vector<TagExportRecord>& out, std::string& err);

    std::shared_ptr<BroadcastChannel> broadcastSource() const override;

    // extern gehosteter Listener (z. B. HTTP/WebSocket-Host)
    void setListenerHooks(std::function<bool()> start, std::function<void()> stop);
    void updateListenerState(const ClientConfig& cfg);
    bool listenerRunning() const;

    int activeTaskCount() const { return live_->load(); }
    uint64_t generation() const { return generation_.load(); }

private:
    std::shared_ptr<IProtocolSession> currentSession() const;
    void onDataChange(uint64_t gen, const DataChangeNotification& n);
    void postConnectionState(bool connected, const std::string& endpoint, const std::string& error);
    void stopListener();

    IProtocolConnector& connector_;
    EventBus&           bus_;
    const Options       opt_;
    SecureChannelProvisioner provisioner_;

    std::shared_ptr<std::atomic<int>> live_;
    std::atomic<uint64_t> generation_{0};

    mutable std::mutex mx_;
    State state_ = State::Idle;
    std::shared_ptr<IProtocolSession> session_;
    std::shared_ptr<TaskGroup> group_;
    std::shared_ptr<BroadcastChannel> source_;
    std::string endpoint_;

    AddressSpaceCache cache_;
    WatchManager      watches_;
    WriteEngine       writer_;

    mutable std::mutex listenerMx_;
    std::function<bool()> listenerStart_;
    std::function<void()> listenerStop_;
    bool listenerRunning_ = false;
};
