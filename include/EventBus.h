// EventBus – entkoppelt Controller/Watches von UI, Logger und Host
//
//  - subscribe / subscribe_scoped : Observer (weak_ptr) mit Priorität registrieren
//  - post                         : thread-sicher einreihen; verteilt wird in process()
//  - post_now                     : sofort im aufrufenden Thread verteilen
//  - process                      : vom Host-Loop (bzw. Test) gepumpt
//
// Die Queue ist begrenzt (maxQueued); bei Überlauf fällt das älteste Event heraus,
// ein Host der nie pumpt lässt den Speicher also nicht wachsen.
#pragma once
#include "Event.h"
#include "ReactiveObserver.h"
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

struct EventTypeHash {
    size_t operator()(EventType t) const noexcept {
        return static_cast<size_t>(t);
    }
};

// Eindeutiger Schlüssel für eine Subscription:
struct SubscriptionToken {
    EventType type{};
    std::uint64_t id{0};
    explicit operator bool() const noexcept { return id != 0; }
};

// Optionales RAII-Handle (löscht Subscription im Destruktor):
class EventBus; // fwd
class Subscription {
public:
    Subscription() = default;
    Subscription(EventBus* bus, SubscriptionToken tok)
        : bus_(bus), tok_(tok) {}
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept { swap(other); }
    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) { unsubscribe(); swap(other); }
        return *this;
    }
    ~Subscription() { unsubscribe(); }

    SubscriptionToken token() const noexcept { return tok_; }
    void unsubscribe();

private:
    void swap(Subscription& o) noexcept { std::swap(bus_, o.bus_); std::swap(tok_, o.tok_); }
    EventBus* bus_{nullptr};
    SubscriptionToken tok_{};
};

// Observer aus einem Lambda (Host-Code, Tests)
class CallbackObserver : public ReactiveObserver {
public:
    explicit CallbackObserver(std::function<void(const Event&)> fn) : fn_(std::move(fn)) {}
    void onEvent(const Event& ev) override { if (fn_) fn_(ev); }
private:
    std::function<void(const Event&)> fn_;
};

class EventBus {
public:
    explicit EventBus(size_t maxQueued = 1024) : maxQueued_(maxQueued) {}

    static constexpr int kMinPriority = 1;
    static constexpr int kMaxPriority = 4;

    SubscriptionToken subscribe(EventType t,
                                const std::shared_ptr<ReactiveObserver>& obs,
                                int priority = kMinPriority);

    Subscription subscribe_scoped(EventType t,
                                  const std::shared_ptr<ReactiveObserver>& obs,
                                  int priority = kMinPriority) {
        return Subscription(this, subscribe(t, obs, priority));
    }

    void unsubscribe(const SubscriptionToken& tok);

    // Ereignisse einreihen (thread-sicher, asynchron)
    void post(Event ev);

    // Sofort verteilen (synchron; vorsichtig bzgl. Reentranz)
    void post_now(const Event& ev);

    // Warteschlange bearbeiten; maxEvents = Schutz gegen Starvation. Rückgabe: verteilt
    size_t process(size_t maxEvents = 32);

    void clear_queue();
    size_t queued() const;
    std::uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    struct Entry {
        std::weak_ptr<ReactiveObserver> wp;
        std::uint64_t id{0};     // Anmelde-Reihenfolge (kleiner = älter)
        int priority{kMinPriority};
    };

    void dispatch_one(const Event& ev);
    void sweep_dead(EventType t);

    const size_t maxQueued_;
    mutable std::mutex q_mx_;
    std::deque<Event> q_;
    std::mutex mx_;
    std::unordered_map<EventType, std::vector<Entry>, EventTypeHash> listeners_;
    std::atomic<std::uint64_t> nextId_{1};
    std::atomic<std::uint64_t> dropped_{0};
};
