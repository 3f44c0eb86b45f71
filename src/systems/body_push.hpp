#pragma once
#include "../config.hpp"
#include <ecs/ecs.hpp>
#include <cstdint>
#include <optional>

// Shoves loose dynamic bodies the character walks into.
class RigidBodyPush {
public:
    // Hits whose push direction points further down than this are the
    // character standing on the body, not walking into it.
    static constexpr float kMinDirectionY = -0.3f;

    // Contact normals steeper than this belong to a body under the character.
    static constexpr float kSupportNormalY = 0.7f;

    struct Contact {
        ecs::Vec3     move_direction = {0, 0, 0}; // character's travel direction at the hit
        bool          dynamic        = false;
        bool          kinematic      = false;
        std::uint32_t layer          = 0;
    };

    // Travel direction at a contact: straight down onto a supporting body,
    // otherwise the horizontal part of the frame's displacement. The
    // grounded rest velocity never tilts a sideways hit downward.
    static ecs::Vec3 sweep_direction(const ecs::Vec3& displacement, const ecs::Vec3& contact_normal);

    // Horizontal impulse to apply to the contacted body, if it qualifies.
    static std::optional<ecs::Vec3> impulse(const PushSettings& settings, const Contact& contact);
};
