// LiveDataHub – verteilt Live-Werte an beliebig viele externe Clients
//
// Ein einzelner Koordinator-Task besitzt die Client-Menge; nur er fügt Clients hinzu
// oder entfernt sie. Andere Threads (Transport-Leser, Host) reichen Ereignisse ein:
//   registerClient    : neuer Client (Transport), liefert die Client-Id
//   unregisterClient  : Transport geschlossen
//   onClientMessage   : Steuer-JSON {"action": ..., "node_ids": [...]}
//   onTransportError  : wie unregisterClient, mit Log
//
// Pro Client gibt es eine begrenzte Ausgangs-Queue und einen Writer-Task (FIFO je
// Client). Ist die Queue voll, wird der Client geschlossen und entfernt, statt zu puffern.
//
// Der Broadcast-Kanal kommt vom INodeManager. Wird er geschlossen (Disconnect), schließt
// der Hub alle Clients und bindet sich an den neuen Kanal, ohne selbst neu zu starten.
//
// Nebenwirkungen von "subscribe" (Watch anlegen, aktuellen Wert lesen) laufen auf einem
// eigenen Job-Worker, nie im Koordinator.
#pragma once
#include "INodeManager.h"
#include "JsonCodec.h"
#include "TaskGroup.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

struct IHubTransport {
    virtual ~IHubTransport() = default;
    // Blockierendes Senden einer Textnachricht; false + err bei Transportfehler
    virtual bool send(const std::string& text, std::string& err) = 0;
    virtual void close() = 0;
    virtual std::string remoteAddress() const = 0;
};

struct HubClientInfo {
    uint64_t    id = 0;
    std::string remoteAddress;
    bool        subscribeAll = false;
    std::vector<std::string> nodeIds;
};

class LiveDataHub {
public:
    struct Options {
        size_t clientQueueCapacity = 256;
        std::chrono::milliseconds idleWait{100};
    };

    explicit LiveDataHub(INodeManager& nodes);
    LiveDataHub(INodeManager& nodes, Options o);
    ~LiveDataHub();

    LiveDataHub(const LiveDataHub&) = delete;
    LiveDataHub& operator=(const LiveDataHub&) = delete;

    bool start();
    void stop();
    bool running() const { return running_.load(); }

    uint64_t registerClient(std::shared_ptr<IHubTransport> transport);
    void unregisterClient(uint64_t id);
    void onClientMessage(uint64_t id, const std::string& text);
    void onTransportError(uint64_t id, const std::string& err);

    std::vector<HubClientInfo> clients() const;
    size_t clientCount() const;
    uint64_t rebinds() const { return rebinds_.load(); }

private:
    struct Client {
        uint64_t id = 0;
        std::shared_ptr<IHubTransport> transport;
        std::shared_ptr<BoundedQueue<std::string>> out;
        std::set<std::string> filter;
        bool all = false;
    };

    struct HubEvent {
        enum class Kind { Register, Unregister, Control, Snapshot };
        Kind kind = Kind::Register;
        uint64_t clientId = 0;
        std::shared_ptr<IHubTransport> transport;
        HubControl control;
        std::vector<BroadcastMessage> snapshot;
    };

    // Eingang des Koordinators; geteilt mit dem Notify des Broadcast-Kanals, damit ein
    // später Weckruf nach dem Ende des Hubs ins Leere geht
    struct Inbox {
        std::mutex mx;
        std::condition_variable_any cv;
        std::deque<HubEvent> events;
        bool signalled = false;
        void signal();
    };

    void post(HubEvent ev);
    void postJob(std::function<void(std::stop_token)> job);

    void run(std::stop_token st);
    void runJobs(std::stop_token st);
    void writerLoop(std::stop_token st, uint64_t id,
                    std::shared_ptr<IHubTransport> transport,
                    std::shared_ptr<BoundedQueue<std::string>> out);

    void handle(HubEvent& ev);
    void addClient(uint64_t id, std::shared_ptr<IHubTransport> transport);
    void removeClient(uint64_t id, const char* reason);
    void closeAll(const char* reason);
    void applyControl(uint64_t id, const HubControl& c);
    void fanOut(const BroadcastMessage& m);

    INodeManager& nodes_;
    const Options opt_;

    std::unique_ptr<TaskGroup> tasks_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> nextId_{1};
    std::atomic<uint64_t> rebinds_{0};

    // Client-Menge: geschrieben nur vom Koordinator
    mutable std::shared_mutex clientsMx_;
    std::map<uint64_t, Client> clients_;

    std::shared_ptr<Inbox> inbox_;

    std::mutex jobMx_;
    std::condition_variable_any jobCv_;
    std::deque<std::function<void(std::stop_token)>> jobs_;
};
