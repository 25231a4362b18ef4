/// @file types.cpp
/// @brief Core type implementations for tick_physics

#include <tickspace/physics/types.hpp>

namespace tick_physics {

// =============================================================================
// String Conversions
// =============================================================================

const char* to_string(BodyKind kind) {
    switch (kind) {
        case BodyKind::Element: return "Element";
        case BodyKind::Block: return "Block";
        case BodyKind::Generic: return "Generic";
    }
    return "Unknown";
}

const char* to_string(ContactClass contact_class) {
    switch (contact_class) {
        case ContactClass::ElementElement: return "ElementElement";
        case ContactClass::ElementBlock: return "ElementBlock";
        case ContactClass::Unclassified: return "Unclassified";
    }
    return "Unknown";
}

const char* to_string(SpaceState state) {
    switch (state) {
        case SpaceState::Idle: return "Idle";
        case SpaceState::Preparing: return "Preparing";
        case SpaceState::Solving: return "Solving";
        case SpaceState::Completing: return "Completing";
    }
    return "Unknown";
}

} // namespace tick_physics
