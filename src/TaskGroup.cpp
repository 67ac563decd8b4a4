#include "TaskGroup.h"
#include "Logger.h"
#include <condition_variable>

TaskGroup::TaskGroup(Counter live) : live_(std::move(live)) {}

TaskGroup::~TaskGroup() {
    requestStop();
    join();
}

bool TaskGroup::spawn(std::string name, std::function<void(std::stop_token)> fn) {
    std::lock_guard<std::mutex> lk(mx_);
    if (src_.stop_requested()) {
        logLine(LogLevel::Debug, "Task") << "generation cancelled, not starting " << name;
        return false;
    }
    reapLocked();

    auto done = std::make_shared<std::atomic<bool>>(false);
    if (live_) live_->fetch_add(1);
    Task t{ name, done, {} };
    t.th = std::jthread([fn = std::move(fn), tok = src_.get_token(), done, live = live_, name]{
        try {
            fn(tok);
        } catch (const std::exception& e) {
            logLine(LogLevel::Warn, "Task") << name << " job failed: " << e.what();
        }
        if (live) live->fetch_sub(1);
        done->store(true);
    });
    tasks_.push_back(std::move(t));
    return true;
}

void TaskGroup::reapLocked() {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->done->load()) {
            if (it->th.joinable()) it->th.join();
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

void TaskGroup::join() {
    std::vector<Task> tasks;
    {
        std::lock_guard<std::mutex> lk(mx_);
        tasks.swap(tasks_);
    }
    for (auto& t : tasks)
        if (t.th.joinable()) t.th.join();
}

size_t TaskGroup::running() const {
    std::lock_guard<std::mutex> lk(mx_);
    size_t n = 0;
    for (const auto& t : tasks_)
        if (!t.done->load()) ++n;
    return n;
}

bool TaskGroup::sleepFor(std::stop_token st, std::chrono::milliseconds d) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lk(m);
    cv.wait_for(lk, st, d, []{ return false; });
    return !st.stop_requested();
}
