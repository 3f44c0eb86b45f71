#pragma once
#include "components.hpp"
#include <ecs/ecs.hpp>
#include <cstdint>

// ---------------------------------------------------------------------------
// Seams between the controller core and the engine it runs in.
//
// The host implements these over Jolt and Raylib (jolt_collaborators.hpp,
// camera_rig.hpp); the tests implement them with plain fakes.
// ---------------------------------------------------------------------------

// Sphere overlap query against the world. Trigger volumes never count.
class GroundProbe {
public:
    virtual ~GroundProbe() = default;
    virtual bool overlaps(const ecs::Vec3& center, float radius, std::uint32_t layer_mask) const = 0;
};

// Moves the character by `displacement`, resolving it against world
// geometry. Called at most once per frame. Returns the realized velocity.
class CharacterMover {
public:
    virtual ~CharacterMover() = default;
    virtual ecs::Vec3 move(const ecs::Vec3& displacement, float dt) = 0;
};

// One of the two view rigs. ViewModeSystem keeps exactly one of them active.
class CameraRig {
public:
    virtual ~CameraRig() = default;
    virtual void             set_active(bool active) = 0;
    virtual bool             active() const = 0;
    virtual void             set_follow_and_look_target(CameraTargetSlot slot) = 0;
    virtual CameraTargetSlot follow_target() const = 0;
    virtual ecs::Vec3        view_forward() const = 0;
};
