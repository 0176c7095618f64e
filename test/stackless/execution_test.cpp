#include "coaccess/stackless/execution.hpp"

#include <gtest/gtest.h>

#include <exception>
#include <functional>
#include <stdexcept>
#include <string>

#include "coaccess/stackless/async.hpp"
#include "coaccess/stackless/event_loop.hpp"

using coaccess::Async;
using coaccess::Continuation;
using coaccess::current_execution;
using coaccess::EventLoop;
using coaccess::Execution;
using coaccess::PromiseExecutionConcept;
using coaccess::spawn_task;

namespace {

struct Tracker {
    Execution* execution{nullptr};
    Continuation continuation;
    int hook_calls{0};
    std::exception_ptr cause{nullptr};
    bool abort_before_delimit{false};
    std::function<void(Tracker&)> on_segment;
};

// Suspends through Execution::delimit. The hook resumes the coroutine so an
// aborted task still runs to completion.
struct DelimitAwaiter {
    Tracker* tracker_;

    constexpr bool await_ready() const noexcept { return false; }

    template <PromiseExecutionConcept PromiseType>
    void await_suspend(std::coroutine_handle<PromiseType> caller) {
        auto* tracker = tracker_;
        caller.promise().get_execution()->delimit(
            caller,
            [tracker](std::exception_ptr cause) {
                tracker->hook_calls++;
                tracker->cause = cause;
                tracker->continuation.resume();
            },
            [tracker](Continuation continuation) {
                tracker->continuation = continuation;
                if (tracker->on_segment) {
                    tracker->on_segment(*tracker);
                }
            });
    }

    void await_resume() const noexcept {}
};

Async<void> suspend_once(Tracker& tracker) {
    tracker.execution = co_await current_execution();
    if (tracker.abort_before_delimit) {
        tracker.execution->abort(std::make_exception_ptr(std::runtime_error("early")));
    }
    co_await DelimitAwaiter{&tracker};
}

std::string message_of(std::exception_ptr cause) {
    try {
        std::rethrow_exception(cause);
    } catch (const std::exception& e) {
        return e.what();
    }
}

}  // namespace

TEST(ExecutionTest, ContinuationResumesOnLoop) {
    EventLoop loop;
    Tracker tracker;
    auto task = spawn_task(suspend_once(tracker), loop);
    ASSERT_FALSE(task.done());
    ASSERT_TRUE(tracker.continuation);

    tracker.continuation.resume();
    EXPECT_FALSE(task.done());
    loop.run();

    EXPECT_TRUE(task.done());
    EXPECT_EQ(tracker.hook_calls, 0);
}

TEST(ExecutionTest, RunWaitsForOutstandingContinuation) {
    EventLoop loop;
    Tracker tracker;
    auto task = spawn_task(suspend_once(tracker), loop);

    loop.post([&] { tracker.continuation.resume(); });
    loop.run();

    EXPECT_TRUE(task.done());
}

TEST(ExecutionTest, AbortInvokesHookOnce) {
    EventLoop loop;
    Tracker tracker;
    auto task = spawn_task(suspend_once(tracker), loop);

    task.execution().abort(std::make_exception_ptr(std::runtime_error("gone")));
    task.execution().abort(std::make_exception_ptr(std::runtime_error("again")));
    loop.run();

    EXPECT_TRUE(task.done());
    EXPECT_TRUE(task.execution().is_aborted());
    EXPECT_EQ(tracker.hook_calls, 1);
    EXPECT_EQ(message_of(tracker.cause), "gone");
}

TEST(ExecutionTest, AbortDuringSegmentIsDeferred) {
    EventLoop loop;
    Tracker tracker;
    bool hook_seen_in_segment = true;
    tracker.on_segment = [&](Tracker& p) {
        p.execution->abort(std::make_exception_ptr(std::runtime_error("during")));
        hook_seen_in_segment = p.hook_calls != 0;
    };

    auto task = spawn_task(suspend_once(tracker), loop);
    EXPECT_FALSE(hook_seen_in_segment);
    EXPECT_EQ(tracker.hook_calls, 1);

    loop.run();
    EXPECT_TRUE(task.done());
}

TEST(ExecutionTest, AbortBeforeDelimitRunsHookAfterSegment) {
    EventLoop loop;
    Tracker tracker;
    tracker.abort_before_delimit = true;

    auto task = spawn_task(suspend_once(tracker), loop);
    EXPECT_TRUE(tracker.continuation);
    EXPECT_EQ(tracker.hook_calls, 1);
    EXPECT_EQ(message_of(tracker.cause), "early");

    loop.run();
    EXPECT_TRUE(task.done());
}

TEST(ExecutionTest, AbortAfterResumeDoesNotInvokeHook) {
    EventLoop loop;
    Tracker tracker;
    auto task = spawn_task(suspend_once(tracker), loop);

    tracker.continuation.resume();
    task.execution().abort(std::make_exception_ptr(std::runtime_error("late")));
    loop.run();

    EXPECT_TRUE(task.done());
    EXPECT_EQ(tracker.hook_calls, 0);
}

TEST(ExecutionTest, AbortWithoutCauseStillCarriesOne) {
    EventLoop loop;
    Tracker tracker;
    auto task = spawn_task(suspend_once(tracker), loop);

    task.execution().abort(nullptr);
    loop.run();

    ASSERT_TRUE(tracker.cause);
    EXPECT_EQ(message_of(tracker.cause), "execution aborted");
}

TEST(ExecutionTest, SecondResumeIsRejected) {
    EventLoop loop;
    Tracker tracker;
    auto task = spawn_task(suspend_once(tracker), loop);

    Continuation copy = tracker.continuation;
    tracker.continuation.resume();
    EXPECT_THROW(copy.resume(), std::logic_error);
    loop.run();
    EXPECT_TRUE(task.done());
}

TEST(ExecutionTest, DestroyedTaskDropsOutstandingContinuation) {
    EventLoop loop;
    Tracker tracker;
    {
        auto task = spawn_task(suspend_once(tracker), loop);
        ASSERT_TRUE(tracker.continuation);
    }

    EXPECT_NO_THROW(tracker.continuation.resume());
    EXPECT_EQ(loop.poll(), 0u);
    loop.run();
    EXPECT_EQ(tracker.hook_calls, 0);
}

TEST(ExecutionTest, DestroyedTaskSkipsPostedResumption) {
    EventLoop loop;
    Tracker tracker;
    {
        auto task = spawn_task(suspend_once(tracker), loop);
        tracker.continuation.resume();
    }

    EXPECT_EQ(loop.poll(), 1u);
    loop.run();
}

TEST(ExecutionTest, EmptyContinuationCannotResume) {
    Continuation empty;
    EXPECT_FALSE(empty);
    EXPECT_THROW(empty.resume(), std::logic_error);
}
