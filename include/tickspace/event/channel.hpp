#pragma once

/// @file channel.hpp
/// @brief Cross-thread handoff channel for tick_event
///
/// A worker sends results; the thread that owns their consumer receives them
/// during its own tick. Whatever the sender wrote before send() is visible to
/// the receiver once receive() returns that event.

#include <tickspace/structures/lock_free_queue.hpp>

#include <cstddef>
#include <optional>

namespace tick_event {

/// Typed channel, any number of senders, one receiving thread
template<typename E>
class EventChannel {
public:
    EventChannel() = default;

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    void send(E event) {
        m_queue.push(std::move(event));
    }

    /// Next event in send order, or nullopt when nothing is pending
    [[nodiscard]] std::optional<E> receive() {
        return m_queue.pop();
    }

    /// @note Approximate while senders are active
    [[nodiscard]] bool empty() const noexcept { return m_queue.empty(); }

    /// @note Approximate while senders are active
    [[nodiscard]] std::size_t size() const noexcept { return m_queue.size(); }

private:
    tick_structures::LockFreeQueue<E> m_queue;
};

} // namespace tick_event
