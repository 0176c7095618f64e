#pragma once

#include <coroutine>
#include <stdexcept>

#include "coaccess/utils/duration.h"
#include "coaccess/utils/logger.h"
#include "event_loop.hpp"
#include "execution.hpp"
#include "promise_concepts.hpp"

namespace coaccess {

// Suspends the awaiting coroutine for `duration` on its execution's event loop,
// or on an explicitly given loop.
struct SleepAwaiter {
    explicit SleepAwaiter(Duration duration, EventLoop* loop = nullptr) noexcept
        : duration_(duration), loop_(loop) {}

    constexpr bool await_ready() const noexcept { return false; }

    template <PromiseExecutionConcept CallerPromiseType>
    void await_suspend(std::coroutine_handle<CallerPromiseType> caller) {
        auto* loop = loop_;
        if (loop == nullptr) {
            auto* execution = caller.promise().get_execution();
            if (execution == nullptr) {
                throw std::logic_error("sleep_for needs an event loop");
            }
            loop = &execution->event_loop();
        }
        COACCESS_LOG("sleep for ", to_string(duration_));
        (void)loop->schedule(duration_, [caller] { caller.resume(); });
    }

    void await_resume() const noexcept {}

    Duration duration_;
    EventLoop* loop_{nullptr};
};

inline SleepAwaiter sleep_for(Duration duration) noexcept { return SleepAwaiter{duration}; }

inline SleepAwaiter sleep_for(EventLoop& loop, Duration duration) noexcept {
    return SleepAwaiter{duration, &loop};
}

}  // namespace coaccess
