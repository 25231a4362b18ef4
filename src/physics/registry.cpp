/// @file registry.cpp
/// @brief RigidBodyRegistry implementation

#include <tickspace/physics/registry.hpp>

#include <algorithm>
#include <iterator>

namespace tick_physics {

bool RigidBodyRegistry::add(const BodyPtr& body) {
    if (!body || contains(body)) {
        return false;
    }

    body->set_in_world(true);
    body->activate();
    m_bodies.push_back(body);
    return true;
}

bool RigidBodyRegistry::remove(const BodyPtr& body) {
    auto it = std::find(m_bodies.begin(), m_bodies.end(), body);
    if (it == m_bodies.end()) {
        return false;
    }

    (*it)->set_in_world(false);
    m_bodies.erase(it);
    return true;
}

void RigidBodyRegistry::clear() {
    for (auto& body : m_bodies) {
        body->set_in_world(false);
    }
    m_bodies.clear();
}

bool RigidBodyRegistry::contains(const BodyPtr& body) const {
    if (!body) {
        return false;
    }
    return std::find(m_bodies.begin(), m_bodies.end(), body) != m_bodies.end();
}

BodyPtr RigidBodyRegistry::find(BodyId id) const {
    auto it = std::find_if(m_bodies.begin(), m_bodies.end(),
        [id](const BodyPtr& body) { return body->id() == id; });
    return it != m_bodies.end() ? *it : nullptr;
}

std::vector<BodyPtr> RigidBodyRegistry::query_by_kind(BodyKind kind) const {
    std::vector<BodyPtr> result;
    std::copy_if(m_bodies.begin(), m_bodies.end(), std::back_inserter(result),
        [kind](const BodyPtr& body) { return body->kind() == kind; });
    return result;
}

} // namespace tick_physics
