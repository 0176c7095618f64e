#pragma once

#include <coroutine>
#include <exception>
#include <memory>
#include <type_traits>
#include <utility>

#include "coaccess/utils/noncopyable.h"
#include "event_loop.hpp"
#include "execution.hpp"
#include "promise_base.hpp"
#include "promise_concepts.hpp"

namespace coaccess {

// Lazily started operation that can be suspended within a nested coroutine.
// Awaiting it runs it until completion and yields its value or rethrows its
// exception; an Async<void> that finishes is "completed without value".
template <typename T = void>
class [[nodiscard]] Async : noncopyable {
   public:
    struct promise_type;

    struct ResumeCallerAwaiter {
        constexpr bool await_ready() const noexcept { return false; }
        constexpr void await_resume() const noexcept { /* should never be called */ }

        std::coroutine_handle<> await_suspend(
            std::coroutine_handle<promise_type> h) const noexcept {
            if (auto caller = h.promise().get_caller()) {
                return caller;
            }
            return std::noop_coroutine();
        }
    };

    struct promise_base : async_promise_base<T> {
        std::suspend_always initial_suspend() noexcept { return {}; }
        ResumeCallerAwaiter final_suspend() noexcept { return {}; }

        void set_caller(std::coroutine_handle<> handle) noexcept { caller_ = handle; }
        std::coroutine_handle<> get_caller() const noexcept { return caller_; }

       protected:
        std::coroutine_handle<> caller_{};
    };

    constexpr bool await_ready() const noexcept { return false; }

    template <typename CallerPromiseType>
    std::coroutine_handle<> await_suspend(
        std::coroutine_handle<CallerPromiseType> caller) noexcept {
        self_.promise().set_caller(caller);
        if constexpr (PromiseExecutionConcept<CallerPromiseType>) {
            if (auto* execution = caller.promise().get_execution()) {
                self_.promise().set_execution(execution);
            }
        }
        return self_;
    }

    T await_resume()
        requires(!std::is_void_v<T>)
    {
        self_.promise().rethrow_if_exception();
        return self_.promise().get_return_value();
    }

    void await_resume()
        requires(std::is_void_v<T>)
    {
        self_.promise().rethrow_if_exception();
    }

    void set_execution(Execution* execution) noexcept {
        self_.promise().set_execution(execution);
    }

    Async(Async&& other) noexcept : self_(std::exchange(other.self_, nullptr)) {}
    Async& operator=(Async&& other) noexcept {
        if (this != &other) {
            if (self_) {
                self_.destroy();
            }
            self_ = std::exchange(other.self_, nullptr);
        }
        return *this;
    }

    ~Async() {
        if (self_) {
            self_.destroy();
        }
    }

   private:
    explicit Async(promise_type* promise) {
        self_ = std::coroutine_handle<promise_type>::from_promise(*promise);
    }

    std::coroutine_handle<promise_type> self_{nullptr};
};

template <typename T>
struct Async<T>::promise_type : promise_base {
    auto get_return_object() { return Async{this}; }
};

template <typename T>
class AsyncRO;

template <typename T>
AsyncRO<T> spawn_task(Async<T> task, EventLoop& loop);

// Handle to a top-level task started by spawn_task. Owns the task's execution,
// so it has to outlive every suspension of the task.
template <typename T = void>
class AsyncRO : noncopyable {
   public:
    struct promise_type : async_promise_base<T> {
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_always final_suspend() noexcept { return {}; }

        auto get_return_object() { return AsyncRO{this}; }
    };

    AsyncRO(AsyncRO&& other) noexcept
        : self_(std::exchange(other.self_, nullptr)), execution_(std::move(other.execution_)) {}
    AsyncRO& operator=(AsyncRO&& other) noexcept {
        if (this != &other) {
            if (self_) {
                self_.destroy();
            }
            self_ = std::exchange(other.self_, nullptr);
            execution_ = std::move(other.execution_);
        }
        return *this;
    }

    ~AsyncRO() {
        if (self_) {
            self_.destroy();
        }
    }

    bool done() const noexcept { return self_.done(); }

    Execution& execution() const noexcept { return *execution_; }

    T get() {
        self_.promise().rethrow_if_exception();
        if constexpr (!std::is_void_v<T>) {
            return self_.promise().get_return_value();
        }
    }

   private:
    template <typename U>
    friend AsyncRO<U> spawn_task(Async<U> task, EventLoop& loop);

    explicit AsyncRO(promise_type* promise) {
        self_ = std::coroutine_handle<promise_type>::from_promise(*promise);
    }

    std::coroutine_handle<promise_type> self_{nullptr};
    std::unique_ptr<Execution> execution_;
};

namespace detail {

template <typename T>
AsyncRO<T> run_task(Async<T> task, Execution* execution) {
    task.set_execution(execution);
    co_return co_await std::move(task);
}

}  // namespace detail

// Starts `task` on the calling thread in a new execution bound to `loop`; it
// runs until its first suspension and is resumed by `loop` afterwards. Call it
// from the thread that runs `loop`.
template <typename T>
AsyncRO<T> spawn_task(Async<T> task, EventLoop& loop) {
    auto execution = std::make_unique<Execution>(loop);
    auto* raw = execution.get();
    auto handle = detail::run_task(std::move(task), raw);
    handle.execution_ = std::move(execution);
    return handle;
}

}  // namespace coaccess
