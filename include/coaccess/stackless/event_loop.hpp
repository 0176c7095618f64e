#pragma once

#include <stdint.h>

#include <condition_variable>
#include <coroutine>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>
#include <utility>

#include "coaccess/utils/duration.h"
#include "coaccess/utils/logger.h"
#include "coaccess/utils/noncopyable.h"

namespace coaccess {

class EventLoop;

// Cancellable reference to a callback registered with EventLoop::schedule.
class TimerHandle {
   public:
    TimerHandle() = default;

    explicit operator bool() const noexcept { return loop_ != nullptr; }

    // Returns true if the callback was still pending and will now never run.
    bool cancel();

   private:
    friend class EventLoop;

    TimerHandle(EventLoop* loop, uint64_t id) noexcept : loop_(loop), id_(id) {}

    EventLoop* loop_{nullptr};
    uint64_t id_{0};
};

// Runs posted tasks in FIFO order and fires timers once their deadline has
// passed. Posting and scheduling are thread-safe; poll() and run() are meant
// to be called from the one thread that owns the loop.
class EventLoop final : noncopyable {
   public:
    using Task = std::function<void()>;

    EventLoop() = default;
    ~EventLoop() = default;

    void post(std::coroutine_handle<> coro) {
        post([coro] { coro.resume(); });
    }

    void post(Task task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ready_.push_back(std::move(task));
        }
        wakeup_.notify_one();
    }

    [[nodiscard]] TimerHandle schedule(Duration delay, Task callback) {
        uint64_t id = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            id = next_timer_id_++;
            auto [it, inserted] = timers_.insert({Clock::now() + delay, id});
            timer_map_.emplace(id, Timer{it, std::move(callback)});
        }
        COACCESS_LOG("timer register: ", id, " in ", to_string(delay));
        wakeup_.notify_one();
        return TimerHandle{this, id};
    }

    bool cancel(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = timer_map_.find(id);
        if (it == timer_map_.end()) {
            return false;
        }
        COACCESS_LOG("timer unregister: ", id);
        timers_.erase(it->second.position_);
        timer_map_.erase(it);
        return true;
    }

    // Keeps run() from returning while a suspended coroutine is still owed a
    // resumption by another thread.
    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        holds_++;
    }

    // Notifies under the lock: once holds_ drops to zero, run() may return and
    // the loop may be destroyed.
    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        holds_--;
        wakeup_.notify_one();
    }

    size_t pending_timers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return timers_.size();
    }

    // Runs every ready task and expired timer, including the ones they make
    // ready, without ever waiting. Returns the number of callbacks invoked.
    size_t poll() {
        size_t count = 0;
        while (auto task = next_task()) {
            (*task)();
            count++;
        }
        return count;
    }

    // Polls until there is nothing left to run, no timer pending and no held
    // continuation, sleeping until the next deadline or post in between.
    void run() {
        while (true) {
            poll();

            std::unique_lock<std::mutex> lock(mutex_);
            if (!ready_.empty()) {
                continue;
            }
            if (!timers_.empty()) {
                auto deadline = timers_.begin()->first;
                wakeup_.wait_until(lock, deadline, [this, deadline] {
                    return !ready_.empty() || timers_.empty() ||
                           timers_.begin()->first < deadline || Clock::now() >= deadline;
                });
                continue;
            }
            if (holds_ == 0) {
                return;
            }
            wakeup_.wait(lock,
                         [this] { return !ready_.empty() || !timers_.empty() || holds_ == 0; });
        }
    }

   private:
    struct Timer {
        std::set<std::pair<Clock::time_point, uint64_t>>::iterator position_;
        Task callback_;
    };

    std::optional<Task> next_task() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ready_.empty()) {
            auto task = std::move(ready_.front());
            ready_.pop_front();
            return task;
        }
        if (!timers_.empty() && timers_.begin()->first <= Clock::now()) {
            auto id = timers_.begin()->second;
            auto it = timer_map_.find(id);
            auto callback = std::move(it->second.callback_);
            timers_.erase(timers_.begin());
            timer_map_.erase(it);
            COACCESS_LOG("timer expired: ", id);
            return callback;
        }
        return std::nullopt;
    }

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::deque<Task> ready_;
    std::set<std::pair<Clock::time_point, uint64_t>> timers_;
    std::unordered_map<uint64_t, Timer> timer_map_;
    uint64_t next_timer_id_{1};
    size_t holds_{0};
};

inline bool TimerHandle::cancel() {
    if (loop_ == nullptr) {
        return false;
    }
    return std::exchange(loop_, nullptr)->cancel(id_);
}

}  // namespace coaccess
