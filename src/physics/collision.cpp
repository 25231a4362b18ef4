/// @file collision.cpp
/// @brief CollisionDispatcher implementation

#include <tickspace/physics/collision.hpp>
#include <tickspace/physics/body.hpp>
#include <tickspace/core/log.hpp>

namespace tick_physics {

void CollisionDispatcher::on_element_collision(ElementCollisionCallback callback) {
    m_element_callbacks.push_back(std::move(callback));
}

void CollisionDispatcher::on_block_collision(BlockCollisionCallback callback) {
    m_block_callbacks.push_back(std::move(callback));
}

ContactClass CollisionDispatcher::classify(const ContactReport& contact) {
    if (!contact.body_a || !contact.body_b) {
        return ContactClass::Unclassified;
    }

    BodyKind a = contact.body_a->kind();
    BodyKind b = contact.body_b->kind();

    if (a == BodyKind::Element && b == BodyKind::Element) {
        return ContactClass::ElementElement;
    }
    if ((a == BodyKind::Element && b == BodyKind::Block) ||
        (a == BodyKind::Block && b == BodyKind::Element)) {
        return ContactClass::ElementBlock;
    }
    return ContactClass::Unclassified;
}

ContactClass CollisionDispatcher::classify_and_notify(const ContactReport& contact) {
    ContactClass contact_class = classify(contact);

    switch (contact_class) {
        case ContactClass::ElementElement: {
            auto& a = static_cast<ElementRigidBody&>(*contact.body_a);
            auto& b = static_cast<ElementRigidBody&>(*contact.body_b);
            for (auto& callback : m_element_callbacks) {
                callback(a.element(), b.element(), contact.impulse);
            }
            ++m_notifications;
            break;
        }
        case ContactClass::ElementBlock: {
            bool element_first = contact.body_a->kind() == BodyKind::Element;
            const BodyPtr& element_body = element_first ? contact.body_a : contact.body_b;
            const BodyPtr& block_body = element_first ? contact.body_b : contact.body_a;

            auto& element = static_cast<ElementRigidBody&>(*element_body);
            auto& block = static_cast<BlockRigidBody&>(*block_body);
            for (auto& callback : m_block_callbacks) {
                callback(element.element(), block, contact.impulse);
            }
            ++m_notifications;
            break;
        }
        case ContactClass::Unclassified:
            tick_core::physics_logger()->trace("Dropped unclassified contact ({} / {})",
                contact.body_a ? to_string(contact.body_a->kind()) : "null",
                contact.body_b ? to_string(contact.body_b->kind()) : "null");
            break;
    }

    return contact_class;
}

void CollisionDispatcher::dispatch_all(const std::vector<ContactReport>& contacts) {
    for (const auto& contact : contacts) {
        classify_and_notify(contact);
    }
}

} // namespace tick_physics
