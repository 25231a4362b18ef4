/// @file collision.hpp
/// @brief Contact classification and collision notification for tick_physics

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <cstdint>
#include <vector>

namespace tick_physics {

/// Turns raw contact reports into semantic collision notifications.
///
/// Element/Element contacts go to element listeners; Element/Block contacts
/// go to block listeners with the element always first. Everything else is
/// dropped. Each report yields at most one notification per listener.
class CollisionDispatcher {
public:
    // =========================================================================
    // Listeners
    // =========================================================================

    void on_element_collision(ElementCollisionCallback callback);
    void on_block_collision(BlockCollisionCallback callback);

    [[nodiscard]] std::size_t element_listener_count() const noexcept { return m_element_callbacks.size(); }
    [[nodiscard]] std::size_t block_listener_count() const noexcept { return m_block_callbacks.size(); }

    // =========================================================================
    // Dispatch
    // =========================================================================

    /// Semantic category of a contact
    [[nodiscard]] static ContactClass classify(const ContactReport& contact);

    /// Classify a contact and notify the matching listeners
    /// @return The contact's category
    ContactClass classify_and_notify(const ContactReport& contact);

    /// Dispatch every contact in order
    void dispatch_all(const std::vector<ContactReport>& contacts);

    /// Classified contacts dispatched so far, listeners or not
    [[nodiscard]] std::uint64_t notification_count() const noexcept { return m_notifications; }

private:
    std::vector<ElementCollisionCallback> m_element_callbacks;
    std::vector<BlockCollisionCallback> m_block_callbacks;
    std::uint64_t m_notifications = 0;
};

} // namespace tick_physics
