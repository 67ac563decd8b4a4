// BoundedQueue – begrenzte, schließbare MPMC-Queue
//
//  - tryPush   : nie blockierend; false wenn voll oder geschlossen (Aufrufer verwirft)
//  - popWait   : wartet auf Element, Schließen, Stop-Anforderung oder Timeout
//  - close     : weckt alle Wartenden; verbleibende Elemente bleiben abholbar
//  - setNotify : optionaler Weckruf nach push/close (wird außerhalb des Locks gerufen)
//
// Verwendet für den Broadcast-Kanal (WatchManager -> Hub, 64 Einträge) und die
// Ausgangs-Queues der Hub-Clients (256 Einträge).
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>

template<class T>
class BoundedQueue {
public:
    enum class PopResult { Item, Timeout, Closed, Stopped };

    explicit BoundedQueue(size_t capacity) : cap_(capacity ? capacity : 1) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    bool tryPush(T v) {
        std::function<void()> notify;
        {
            std::lock_guard<std::mutex> lk(mx_);
            if (closed_ || q_.size() >= cap_) return false;
            q_.push_back(std::move(v));
            notify = notify_;
        }
        cv_.notify_one();
        if (notify) notify();
        return true;
    }

    bool tryPop(T& out) {
        std::lock_guard<std::mutex> lk(mx_);
        if (q_.empty()) return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    PopResult popWait(T& out, std::stop_token st,
                      std::chrono::milliseconds timeout = std::chrono::hours(24)) {
        std::unique_lock<std::mutex> lk(mx_);
        const bool ready = cv_.wait_for(lk, st, timeout, [&]{ return !q_.empty() || closed_; });
        if (!q_.empty()) {
            out = std::move(q_.front());
            q_.pop_front();
            return PopResult::Item;
        }
        if (closed_) return PopResult::Closed;
        if (st.stop_requested()) return PopResult::Stopped;
        return ready ? PopResult::Closed : PopResult::Timeout;
    }

    void close() {
        std::function<void()> notify;
        {
            std::lock_guard<std::mutex> lk(mx_);
            if (closed_) return;
            closed_ = true;
            notify = notify_;
        }
        cv_.notify_all();
        if (notify) notify();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mx_);
        return closed_;
    }

    // geschlossen und leer: es kommt nichts mehr
    bool drained() const {
        std::lock_guard<std::mutex> lk(mx_);
        return closed_ && q_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mx_);
        return q_.size();
    }

    size_t capacity() const { return cap_; }

    void setNotify(std::function<void()> fn) {
        std::lock_guard<std::mutex> lk(mx_);
        notify_ = std::move(fn);
    }

private:
    const size_t cap_;
    mutable std::mutex mx_;
    std::condition_variable_any cv_;
    std::deque<T> q_;
    bool closed_ = false;
    std::function<void()> notify_;
};
