#pragma once

#include <atomic>
#include <coroutine>
#include <exception>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

#include "coaccess/utils/duration.h"
#include "coaccess/utils/logger.h"
#include "coaccess/utils/noncopyable.h"
#include "async.hpp"
#include "errors.hpp"
#include "event_loop.hpp"
#include "execution.hpp"
#include "mpsc_queue.hpp"
#include "promise_concepts.hpp"

namespace coaccess {

class ReadWriteAccess;

namespace testing {
struct ReadWriteAccessPeer;
}  // namespace testing

// One demand for read or write access, shared between the coordinator's queue,
// the timeout callback and the coroutine waiting on it.
class AccessRequest final : noncopyable, public std::enable_shared_from_this<AccessRequest> {
   public:
    enum class State { queued, granted, timed_out, cancelled };

    AccessRequest(ReadWriteAccess& access, AccessMode mode, Duration timeout) noexcept
        : access_(access), mode_(mode), timeout_(timeout) {}

    AccessMode mode() const noexcept { return mode_; }
    Duration timeout() const noexcept { return timeout_; }

    // Only meaningful once the waiting coroutine has been resumed.
    State state() const noexcept { return state_.load(std::memory_order_acquire); }
    std::exception_ptr cause() const noexcept { return cause_; }

    // Suspends `caller` on `execution` and enqueues the request.
    void submit(Execution& execution, std::coroutine_handle<> caller);

   private:
    friend class ReadWriteAccess;
    friend class AccessLease;
    friend struct AccessAwaiter;
    friend struct testing::ReadWriteAccessPeer;

    // The grant/timeout/cancel race. Exactly one caller ever sees true.
    bool fire() noexcept { return !fired_.exchange(true, std::memory_order_acq_rel); }

    bool grant();
    void on_timeout();
    void on_abort(std::exception_ptr cause);
    void abandon();
    void relinquish();

    ReadWriteAccess& access_;
    const AccessMode mode_;
    const Duration timeout_;
    std::atomic<bool> fired_{false};
    std::atomic<State> state_{State::queued};
    std::exception_ptr cause_{nullptr};
    Continuation continuation_;
    TimerHandle timeout_handle_;
};

// Releases a granted request's hold on access when the guarded operation ends,
// before its outcome reaches the awaiting coroutine.
class AccessLease final : noncopyable {
   public:
    explicit AccessLease(std::shared_ptr<AccessRequest> request) noexcept
        : request_(std::move(request)) {}
    ~AccessLease() { request_->relinquish(); }

   private:
    std::shared_ptr<AccessRequest> request_;
};

struct AccessAwaiter : noncopyable {
    explicit AccessAwaiter(std::shared_ptr<AccessRequest> request) noexcept
        : request_(std::move(request)) {}

    // The waiting coroutine is being destroyed before it was resumed.
    ~AccessAwaiter() {
        if (waiting_) {
            request_->abandon();
        }
    }

    constexpr bool await_ready() const noexcept { return false; }

    template <typename CallerPromiseType>
    void await_suspend(std::coroutine_handle<CallerPromiseType> caller) {
        Execution* execution = nullptr;
        if constexpr (PromiseExecutionConcept<CallerPromiseType>) {
            execution = caller.promise().get_execution();
        }
        if (execution == nullptr) {
            throw std::logic_error("access requested outside of a spawned execution");
        }
        // the caller may be resumed, and this awaiter destroyed, before submit returns
        auto request = request_;
        waiting_ = true;
        request->submit(*execution, caller);
    }

    void await_resume() {
        waiting_ = false;
        switch (request_->state()) {
            case AccessRequest::State::granted:
                return;
            case AccessRequest::State::timed_out:
                throw AccessTimeoutError(request_->mode(), request_->timeout());
            case AccessRequest::State::cancelled:
                std::rethrow_exception(request_->cause());
            case AccessRequest::State::queued:
                break;
        }
        throw std::logic_error("access request resumed before it was decided");
    }

    std::shared_ptr<AccessRequest> request_;
    bool waiting_{false};
};

/**
 * Coordinates read and write access to a resource among coroutines without
 * blocking any thread.
 *
 * Any number of reads may run at once; a write runs alone. Requests are
 * granted in arrival order: a write waits for the reads queued before it, and
 * reads queued after a waiting write wait for that write. A waiting request
 * gives up with AccessTimeoutError once its timeout elapses (zero waits
 * forever), and one whose execution is aborted is woken with the abort cause.
 *
 * The coordinator must outlive every operation wrapped by it.
 */
class ReadWriteAccess final : noncopyable {
   public:
    explicit ReadWriteAccess(Duration default_timeout = Duration::zero())
        : default_timeout_(default_timeout) {
        if (default_timeout < Duration::zero()) {
            throw std::invalid_argument("default timeout must not be negative");
        }
    }

    Duration default_timeout() const noexcept { return default_timeout_; }

    template <typename T>
    [[nodiscard]] Async<T> read(Async<T> operation) {
        return read(std::move(operation), default_timeout_);
    }

    template <typename T>
    [[nodiscard]] Async<T> read(Async<T> operation, Duration timeout) {
        check_timeout(timeout);
        return guard(AccessMode::read, std::move(operation), timeout);
    }

    template <typename T>
    [[nodiscard]] Async<T> write(Async<T> operation) {
        return write(std::move(operation), default_timeout_);
    }

    template <typename T>
    [[nodiscard]] Async<T> write(Async<T> operation, Duration timeout) {
        check_timeout(timeout);
        return guard(AccessMode::write, std::move(operation), timeout);
    }

    int active_readers() const noexcept { return active_readers_.load(); }
    bool has_pending_write() const noexcept { return pending_write_.load() != nullptr; }
    // True while a drain pass runs, and while a writer runs or waits for readers.
    bool is_draining() const noexcept { return draining_.load(); }

   private:
    friend class AccessRequest;
    friend struct testing::ReadWriteAccessPeer;

    static void check_timeout(Duration timeout) {
        if (timeout < Duration::zero()) {
            throw std::invalid_argument("timeout must not be negative");
        }
    }

    template <typename T>
    Async<T> guard(AccessMode mode, Async<T> operation, Duration timeout);

    void enqueue(std::shared_ptr<AccessRequest> request) {
        queue_.push(std::move(request));
        drain();
    }

    bool start_draining() noexcept {
        bool expected = false;
        return draining_.compare_exchange_strong(expected, true);
    }
    void stop_draining() noexcept { draining_.store(false); }

    void drain();
    bool drain_queue();

    // The caller holds the drain lock on behalf of `writer`, which sits in no
    // slot. Returns true if the lock now stays with a writer, false if `writer`
    // turned out to be abandoned and the caller keeps the lock.
    bool park(std::shared_ptr<AccessRequest> writer);
    // True if readers are still running, so the last of them takes it over.
    bool publish(const std::shared_ptr<AccessRequest>& writer);
    // False if someone else took `writer` out of the slot, and the lock with it.
    bool reclaim(const std::shared_ptr<AccessRequest>& writer);

    void release_reader();
    void release_writer();
    void hand_off(std::shared_ptr<AccessRequest> writer);
    void withdraw(AccessRequest& request);

    const Duration default_timeout_;
    MpscQueue<std::shared_ptr<AccessRequest>> queue_;
    std::atomic<bool> draining_{false};
    std::atomic<int> active_readers_{0};
    // Only ever stored to while holding the drain lock. Whoever takes a writer
    // out of it also takes over the drain lock that writer was holding.
    std::atomic<std::shared_ptr<AccessRequest>> pending_write_;
};

template <typename T>
Async<T> ReadWriteAccess::guard(AccessMode mode, Async<T> operation, Duration timeout) {
    auto request = std::make_shared<AccessRequest>(*this, mode, timeout);
    AccessAwaiter awaiter(request);
    co_await awaiter;
    AccessLease lease(std::move(request));
    co_return co_await std::move(operation);
}

inline void AccessRequest::submit(Execution& execution, std::coroutine_handle<> caller) {
    COACCESS_LOG("submit ", to_string(mode_), " request, timeout ", to_string(timeout_));
    auto self = shared_from_this();
    execution.delimit(
        caller, [self](std::exception_ptr cause) { self->on_abort(std::move(cause)); },
        [self, &execution](Continuation continuation) {
            self->continuation_ = std::move(continuation);
            if (self->timeout_ != Duration::zero()) {
                self->timeout_handle_ = execution.event_loop().schedule(
                    self->timeout_, [self] { self->on_timeout(); });
            }
            self->access_.enqueue(self);
        });
}

// Returns false if a timeout or abort already decided this request. A write
// that wins keeps the drain lock until it relinquishes.
inline bool AccessRequest::grant() {
    if (mode_ == AccessMode::read) {
        access_.active_readers_.fetch_add(1);
    }
    if (!fire()) {
        COACCESS_LOG("skip abandoned ", to_string(mode_), " request");
        if (mode_ == AccessMode::read) {
            access_.active_readers_.fetch_sub(1);
        }
        return false;
    }

    COACCESS_LOG("grant ", to_string(mode_), " access");
    state_.store(State::granted, std::memory_order_release);
    timeout_handle_.cancel();
    continuation_.resume();
    return true;
}

inline void AccessRequest::on_timeout() {
    if (!fire()) {
        return;
    }
    COACCESS_LOG(to_string(mode_), " request timed out after ", to_string(timeout_));
    state_.store(State::timed_out, std::memory_order_release);
    access_.withdraw(*this);
    access_.drain();
    continuation_.resume();
}

inline void AccessRequest::on_abort(std::exception_ptr cause) {
    if (!fire()) {
        return;
    }
    COACCESS_LOG(to_string(mode_), " request cancelled by its execution");
    cause_ = std::move(cause);
    state_.store(State::cancelled, std::memory_order_release);
    timeout_handle_.cancel();
    access_.withdraw(*this);
    access_.drain();
    continuation_.resume();
}

inline void AccessRequest::abandon() {
    if (fire()) {
        COACCESS_LOG(to_string(mode_), " request abandoned by its coroutine");
        state_.store(State::cancelled, std::memory_order_release);
        timeout_handle_.cancel();
        access_.withdraw(*this);
        access_.drain();
        return;
    }
    // the winner publishes its decision right after firing
    State decided = state();
    while (decided == State::queued) {
        std::this_thread::yield();
        decided = state();
    }
    if (decided == State::granted) {
        relinquish();
    }
}

inline void AccessRequest::relinquish() {
    COACCESS_LOG("relinquish ", to_string(mode_), " access");
    if (mode_ == AccessMode::read) {
        access_.release_reader();
    } else {
        access_.release_writer();
    }
}

inline void ReadWriteAccess::drain() {
    while (start_draining()) {
        if (drain_queue()) {
            return;
        }
        auto seen = queue_.size();
        // a stalled push has not been counted yet and drains once it is
        bool stalled = queue_.stalled();
        stop_draining();
        if (!stalled && seen > 0) {
            continue;
        }
        if (queue_.size() == seen) {
            return;
        }
    }
}

// Grants queued requests until the queue runs dry or a writer takes over the
// drain lock. Returns true in the latter case.
inline bool ReadWriteAccess::drain_queue() {
    while (auto next = queue_.pop()) {
        auto request = std::move(*next);
        if (request->mode() == AccessMode::read) {
            request->grant();
            continue;
        }

        if (park(std::move(request))) {
            return true;
        }
    }
    return false;
}

inline bool ReadWriteAccess::park(std::shared_ptr<AccessRequest> writer) {
    if (active_readers_.load() != 0) {
        COACCESS_LOG("park write request until ", active_readers_.load(), " readers finish");
        if (publish(writer)) {
            return true;
        }
        // the last reader left before it could see the parked writer
        if (!reclaim(writer)) {
            // a relinquishing reader or the writer's own withdrawal got there first
            return true;
        }
    }
    // no read is granted while the lock is held, so none is running now
    return writer->grant();
}

inline bool ReadWriteAccess::publish(const std::shared_ptr<AccessRequest>& writer) {
    pending_write_.store(writer);
    return active_readers_.load() != 0;
}

inline bool ReadWriteAccess::reclaim(const std::shared_ptr<AccessRequest>& writer) {
    auto expected = writer;
    return pending_write_.compare_exchange_strong(expected, nullptr);
}

inline void ReadWriteAccess::release_reader() {
    if (active_readers_.fetch_sub(1) == 1) {
        if (auto writer = pending_write_.exchange(nullptr)) {
            hand_off(std::move(writer));
            return;
        }
    }
    drain();
}

inline void ReadWriteAccess::release_writer() {
    stop_draining();
    drain();
}

// `writer` was taken out of the pending slot, along with the drain lock. Readers
// granted after the taker's count reached zero send it back to the slot.
inline void ReadWriteAccess::hand_off(std::shared_ptr<AccessRequest> writer) {
    COACCESS_LOG("hand off to parked write request");
    if (!park(std::move(writer))) {
        stop_draining();
        drain();
    }
}

// Called once `request` has lost interest in access. If it is the parked
// writer, it frees the slot and the drain lock it was holding.
inline void ReadWriteAccess::withdraw(AccessRequest& request) {
    if (request.mode() != AccessMode::write) {
        return;
    }
    auto parked = pending_write_.load();
    if (parked.get() != &request) {
        return;
    }
    if (pending_write_.compare_exchange_strong(parked, nullptr)) {
        COACCESS_LOG("withdraw parked write request");
        stop_draining();
    }
}

}  // namespace coaccess
