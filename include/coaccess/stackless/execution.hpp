#pragma once

#include <atomic>
#include <coroutine>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "coaccess/utils/logger.h"
#include "coaccess/utils/noncopyable.h"
#include "event_loop.hpp"
#include "promise_concepts.hpp"

namespace coaccess {

class Execution;

// Exactly-once handle to a coroutine suspended inside Execution::delimit.
// Copies share the same state, so only the first resume() anywhere wins.
class Continuation {
   public:
    Continuation() = default;

    explicit operator bool() const noexcept { return state_ != nullptr; }

    // Posts the suspended coroutine back onto its execution's event loop. Does
    // nothing if the execution has been destroyed in the meantime.
    void resume();

   private:
    friend class Execution;

    struct State {
        State(Execution* execution, std::coroutine_handle<> coro) noexcept
            : execution_(execution), coro_(coro) {}

        std::mutex mutex_;
        // null once the execution is gone; resuming is then a no-op
        Execution* execution_;
        std::coroutine_handle<> coro_;
        bool resumed_{false};
    };

    Continuation(Execution* execution, std::coroutine_handle<> coro)
        : state_(std::make_shared<State>(execution, coro)) {}

    std::shared_ptr<State> state_;
};

// The context a spawned coroutine tree runs in: the event loop it is resumed
// on, plus a hook that is told when the execution is aborted while one of its
// coroutines is suspended.
class Execution final : noncopyable {
   public:
    using ErrorHook = std::function<void(std::exception_ptr)>;
    using Segment = std::function<void(Continuation)>;

    explicit Execution(EventLoop& loop)
        : loop_(&loop), alive_(std::make_shared<std::atomic<bool>>(true)) {}

    // Drops a continuation that is still outstanding: it will never be resumed,
    // and resumptions already posted to the loop are skipped.
    ~Execution() {
        alive_->store(false);
        std::shared_ptr<Continuation::State> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending = std::move(pending_);
            on_error_ = nullptr;
        }
        if (pending) {
            std::lock_guard<std::mutex> lock(pending->mutex_);
            pending->execution_ = nullptr;
            if (!pending->resumed_) {
                COACCESS_LOG("dropping outstanding continuation");
                loop_->release();
            }
        }
    }

    EventLoop& event_loop() const noexcept { return *loop_; }

    /**
     * Suspends `coro` and hands `segment` the continuation that resumes it.
     *
     * `on_error` stays registered until the continuation is resumed. If the
     * execution is aborted before that, the hook runs exactly once, but never
     * while `segment` is still running: an abort arriving during the segment
     * (or before delimit was even called) is delivered when it returns.
     */
    void delimit(std::coroutine_handle<> coro, ErrorHook on_error, Segment segment) {
        Continuation continuation{this, coro};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            on_error_ = std::move(on_error);
            pending_ = continuation.state_;
            in_segment_ = true;
        }
        loop_->hold();

        segment(std::move(continuation));

        ErrorHook deferred;
        std::exception_ptr cause;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_segment_ = false;
            if (aborted_ && on_error_) {
                deferred = std::exchange(on_error_, nullptr);
                cause = cause_;
            }
        }
        if (deferred) {
            COACCESS_LOG("delivering deferred abort");
            deferred(std::move(cause));
        }
    }

    // Marks the execution as failed with `cause`. Only the first call counts.
    void abort(std::exception_ptr cause) {
        if (!cause) {
            cause = std::make_exception_ptr(std::runtime_error("execution aborted"));
        }
        ErrorHook hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (aborted_) {
                return;
            }
            aborted_ = true;
            cause_ = cause;
            if (!in_segment_) {
                hook = std::exchange(on_error_, nullptr);
            }
        }
        COACCESS_LOG("execution aborted, suspended: ", static_cast<bool>(hook));
        if (hook) {
            hook(std::move(cause));
        }
    }

    bool is_aborted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return aborted_;
    }

   private:
    friend class Continuation;

    void resume(std::coroutine_handle<> coro) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            on_error_ = nullptr;
            pending_.reset();
        }
        // the coroutine may finish and take this execution with it as soon
        // as it is posted
        auto* loop = loop_;
        loop->post([alive = alive_, coro] {
            if (alive->load()) {
                coro.resume();
            }
        });
        loop->release();
    }

    EventLoop* loop_;
    std::shared_ptr<std::atomic<bool>> alive_;
    mutable std::mutex mutex_;
    std::shared_ptr<Continuation::State> pending_;
    ErrorHook on_error_;
    std::exception_ptr cause_{nullptr};
    bool aborted_{false};
    bool in_segment_{false};
};

inline void Continuation::resume() {
    if (!state_) {
        throw std::logic_error("resuming an empty continuation");
    }
    std::lock_guard<std::mutex> lock(state_->mutex_);
    if (state_->resumed_) {
        throw std::logic_error("continuation resumed more than once");
    }
    state_->resumed_ = true;
    if (state_->execution_ == nullptr) {
        return;
    }
    state_->execution_->resume(state_->coro_);
}

// co_await current_execution() yields the execution of the awaiting coroutine
struct GetExecutionAwaiter {
    constexpr bool await_ready() const noexcept { return false; }
    Execution* await_resume() const noexcept { return execution_; }

    template <PromiseExecutionConcept PromiseType>
    bool await_suspend(std::coroutine_handle<PromiseType> h) noexcept {
        execution_ = h.promise().get_execution();
        return false;
    }

    Execution* execution_{nullptr};
};

inline GetExecutionAwaiter current_execution() noexcept { return {}; }

}  // namespace coaccess
