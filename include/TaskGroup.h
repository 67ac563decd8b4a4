// TaskGroup – Hintergrund-Tasks einer Verbindungs-Generation
//
// Jede Generation (Connect bis Disconnect) besitzt genau eine TaskGroup. Alle Tasks
// bekommen das stop_token der Gruppe; requestStop() + join() beendet die Generation.
// Nach requestStop() werden keine neuen Tasks mehr angenommen.
//
// Der optionale Zähler (shared mit dem Controller) zählt laufende Tasks über alle
// Generationen hinweg.
#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

class TaskGroup {
public:
    using Counter = std::shared_ptr<std::atomic<int>>;

    explicit TaskGroup(Counter live = nullptr);
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    bool spawn(std::string name, std::function<void(std::stop_token)> fn);

    void requestStop() { src_.request_stop(); }
    bool stopRequested() const { return src_.stop_requested(); }
    std::stop_token token() const { return src_.get_token(); }

    // Darf nicht aus einem Task der Gruppe heraus aufgerufen werden.
    void join();

    size_t running() const;

    // Schläft d oder bis Stop angefordert wurde; false = gestoppt
    static bool sleepFor(std::stop_token st, std::chrono::milliseconds d);

private:
    struct Task {
        std::string name;
        std::shared_ptr<std::atomic<bool>> done;
        std::jthread th;
    };

    void reapLocked();

    std::stop_source src_;
    Counter live_;
    mutable std::mutex mx_;
    std::vector<Task> tasks_;
};
