#pragma once

/// @file lock_free_queue.hpp
/// @brief Lock-free MPSC queue for tick_structures
///
/// Michael-Scott linked queue. Any number of producers may push; a single
/// consumer pops. Push release-publishes the node, pop acquires it, so
/// everything the producer wrote before push() is visible to the consumer
/// after the matching pop().

#include <atomic>
#include <optional>
#include <cstddef>

namespace tick_structures {

/// Lock-free unbounded queue, multiple producers, single consumer
/// @tparam T Stored value type (must be movable)
template<typename T>
class LockFreeQueue {
private:
    struct Node {
        std::atomic<Node*> next{nullptr};
        std::optional<T> value;

        Node() = default;
        explicit Node(T val) : value(std::move(val)) {}
    };

    alignas(64) std::atomic<Node*> head_;
    alignas(64) std::atomic<Node*> tail_;
    alignas(64) std::atomic<std::size_t> size_{0};

public:
    using value_type = T;
    using size_type = std::size_t;

    LockFreeQueue() {
        Node* sentinel = new Node();
        head_.store(sentinel, std::memory_order_relaxed);
        tail_.store(sentinel, std::memory_order_relaxed);
    }

    ~LockFreeQueue() {
        while (pop().has_value()) {}
        delete head_.load(std::memory_order_relaxed);
    }

    LockFreeQueue(const LockFreeQueue&) = delete;
    LockFreeQueue& operator=(const LockFreeQueue&) = delete;
    LockFreeQueue(LockFreeQueue&&) = delete;
    LockFreeQueue& operator=(LockFreeQueue&&) = delete;

    // =========================================================================
    // Core Operations
    // =========================================================================

    /// Push value to back of queue
    void push(T value) {
        Node* new_node = new Node(std::move(value));
        // Counted before linking so a racing pop never drives size below zero
        size_.fetch_add(1, std::memory_order_relaxed);

        while (true) {
            Node* tail = tail_.load(std::memory_order_acquire);
            Node* next = tail->next.load(std::memory_order_acquire);

            if (tail == tail_.load(std::memory_order_acquire)) {
                if (next == nullptr) {
                    if (tail->next.compare_exchange_weak(
                            next, new_node,
                            std::memory_order_release,
                            std::memory_order_relaxed)) {
                        tail_.compare_exchange_strong(
                            tail, new_node,
                            std::memory_order_release,
                            std::memory_order_relaxed);
                        return;
                    }
                } else {
                    // Tail is falling behind
                    tail_.compare_exchange_weak(
                        tail, next,
                        std::memory_order_release,
                        std::memory_order_relaxed);
                }
            }
        }
    }

    /// Pop value from front of queue (consumer thread only)
    /// @return Value if available, nullopt if empty
    [[nodiscard]] std::optional<T> pop() {
        while (true) {
            Node* head = head_.load(std::memory_order_acquire);
            Node* tail = tail_.load(std::memory_order_acquire);
            Node* next = head->next.load(std::memory_order_acquire);

            if (head != head_.load(std::memory_order_acquire)) {
                continue;
            }

            if (head == tail) {
                if (next == nullptr) {
                    return std::nullopt;
                }
                tail_.compare_exchange_weak(
                    tail, next,
                    std::memory_order_release,
                    std::memory_order_relaxed);
            } else if (next != nullptr) {
                if (head_.compare_exchange_weak(
                        head, next,
                        std::memory_order_acq_rel,
                        std::memory_order_relaxed)) {
                    // next is the new sentinel; its payload moves out
                    std::optional<T> value = std::move(next->value);
                    next->value.reset();
                    delete head;
                    size_.fetch_sub(1, std::memory_order_relaxed);
                    return value;
                }
            }
        }
    }

    // =========================================================================
    // Capacity
    // =========================================================================

    /// @note Snapshot only; may change immediately after the call
    [[nodiscard]] bool empty() const noexcept {
        return size_.load(std::memory_order_relaxed) == 0;
    }

    /// @note Snapshot only; may change immediately after the call
    [[nodiscard]] size_type size() const noexcept {
        return size_.load(std::memory_order_relaxed);
    }
};

} // namespace tick_structures
