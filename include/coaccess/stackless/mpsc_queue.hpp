#pragma once

#include <stddef.h>

#include <atomic>
#include <memory>
#include <optional>
#include <utility>

#include "coaccess/utils/noncopyable.h"

namespace coaccess {

namespace testing {
struct MpscQueuePeer;
}  // namespace testing

// Unbounded lock-free FIFO after Dmitry Vyukov's intrusive MPSC queue.
//
// push() may be called from any number of threads at once. pop() must only be
// called by one consumer at a time; callers serialize consumers themselves.
// A push that is still linking its node can make pop() report an empty queue
// for a moment, but size() already counts it once push() has returned.
template <typename T>
class MpscQueue final : noncopyable {
   public:
    MpscQueue() : head_(&stub_), tail_(&stub_) {}

    ~MpscQueue() {
        while (pop()) {
        }
    }

    void push(T value) {
        auto node = std::make_unique<Node>();
        node->value_.emplace(std::move(value));
        auto* linked = node.release();
        publish(claim(linked), linked);
        size_.fetch_add(1);
    }

    std::optional<T> pop() {
        Node* tail = tail_;
        Node* next = tail->next_.load(std::memory_order_acquire);
        if (tail == &stub_) {
            if (next == nullptr) {
                return std::nullopt;
            }
            tail_ = next;
            tail = next;
            next = next->next_.load(std::memory_order_acquire);
        }
        if (next != nullptr) {
            tail_ = next;
            return take(tail);
        }
        if (tail != head_.load(std::memory_order_acquire)) {
            // a producer swung head_ but has not linked its node yet
            return std::nullopt;
        }
        publish(claim(&stub_), &stub_);
        next = tail->next_.load(std::memory_order_acquire);
        if (next != nullptr) {
            tail_ = next;
            return take(tail);
        }
        return std::nullopt;
    }

    // Consumer only. True if pop() is held up by a push that has taken its
    // place in the queue but not linked it yet; that push has not been counted
    // by size() either.
    bool stalled() const noexcept {
        return tail_->next_.load(std::memory_order_acquire) == nullptr &&
               head_.load(std::memory_order_acquire) != tail_;
    }

    // Safe from any thread. May be transiently negative while a push races a pop.
    ptrdiff_t size() const noexcept { return size_.load(); }
    bool empty() const noexcept { return size() <= 0; }

   private:
    friend struct testing::MpscQueuePeer;

    struct Node {
        std::atomic<Node*> next_{nullptr};
        std::optional<T> value_{};
    };

    // Returns the node `node` has to be linked behind.
    Node* claim(Node* node) noexcept {
        node->next_.store(nullptr, std::memory_order_relaxed);
        return head_.exchange(node, std::memory_order_acq_rel);
    }

    static void publish(Node* prev, Node* node) noexcept {
        prev->next_.store(node, std::memory_order_release);
    }

    std::optional<T> take(Node* node) {
        std::unique_ptr<Node> owned(node);
        std::optional<T> value = std::move(owned->value_);
        size_.fetch_sub(1);
        return value;
    }

    std::atomic<Node*> head_;
    Node* tail_;
    Node stub_;
    std::atomic<ptrdiff_t> size_{0};
};

}  // namespace coaccess
