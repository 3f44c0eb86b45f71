#pragma once
#include <ecs/ecs.hpp>
#include <cstdint>
#include <optional>

// No Jolt or Raylib headers in here: every controller stage, the scene
// loader and the tests include this file in the headless core target.

// ---------------------------------------------------------------------------
// Visual authoring
// ---------------------------------------------------------------------------

struct Color4 {
    float r = 1.0f, g = 1.0f, b = 1.0f, a = 1.0f;
};

namespace Colors {
    inline constexpr Color4 White  = {1.0f, 1.0f, 1.0f, 1.0f};
    inline constexpr Color4 Gray   = {0.5f, 0.5f, 0.5f, 1.0f};
    inline constexpr Color4 Orange = {1.0f, 0.6f, 0.1f, 1.0f};
}

enum class ShapeType { Box, Sphere, Capsule };

struct MeshRenderer {
    ShapeType shape_type   = ShapeType::Box;
    Color4    color        = Colors::White;
    ecs::Vec3 scale_offset = {1, 1, 1};
};

// ---------------------------------------------------------------------------
// Physics authoring (consumed by PhysicsSystem / CharacterMotorSystem)
// ---------------------------------------------------------------------------

enum class BodyType { Static, Kinematic, Dynamic };

struct BoxCollider {
    ecs::Vec3 half_extents = {0.5f, 0.5f, 0.5f};
};

struct SphereCollider {
    float radius = 0.5f;
};

struct RigidBodyConfig {
    BodyType type        = BodyType::Dynamic;
    float    mass        = 1.0f;
    float    friction    = 0.5f;
    float    restitution = 0.0f;
    bool     sensor      = false;
};

// Capsule with its feet at the entity origin.
struct CharacterControllerConfig {
    float height          = 1.8f;
    float radius          = 0.4f;
    float mass            = 70.0f;
    float max_slope_angle = 45.0f; // degrees
};

// Object layer indices shared by the ground mask, the push mask and the
// Jolt layer tables in physics_context.hpp.
namespace ObjectLayerIndex {
    inline constexpr std::uint32_t NonMoving = 0;
    inline constexpr std::uint32_t Moving    = 1;
}

// Layers past the mask width never match.
inline constexpr std::uint32_t layer_bit(std::uint32_t layer) { return layer < 32 ? 1u << layer : 0u; }

// ---------------------------------------------------------------------------
// Player intent
// ---------------------------------------------------------------------------

// Pointer deltas are already frame-rate independent; rate devices (sticks)
// report a per-second value that still needs scaling by dt.
enum class LookDevice { Pointer, Rate };

struct PlayerInput {
    ecs::Vec2  move             = {0, 0}; // [-1,1] x [-1,1]
    ecs::Vec2  look             = {0, 0};
    bool       jump             = false;  // latched: set on press, cleared on release or while airborne
    bool       sprint           = false;
    bool       analog_movement  = false;
    LookDevice look_device      = LookDevice::Pointer;
    bool       switch_view_down = false;  // held state of the view toggle key
};

// ---------------------------------------------------------------------------
// Controller state
// ---------------------------------------------------------------------------

enum class ViewMode { FirstPerson, ThirdPerson };

enum class MovementPolicy {
    CharacterRelative, // strafe in the body's own basis, no facing change
    CameraRelative,    // flattened camera basis, facing follows forward/back intent
    WorldRelative      // world axes, facing follows the resolved direction
};

enum class CameraTargetSlot { FirstPersonHead, ThirdPersonPivot };

// Pose the active rig follows and looks through. Angles in degrees,
// positive pitch looks down.
struct CameraTarget {
    ecs::Vec3 offset = {0.0f, 1.6f, 0.0f}; // from the character's feet
    float     pitch  = 0.0f;
    float     yaw    = 0.0f;
};

struct CharacterPose {
    ecs::Vec3 position = {0, 0, 0}; // feet
    float     yaw      = 0.0f;      // body facing, kept in [0, 360)
};

struct GroundState {
    bool grounded = true;
};

struct VerticalState {
    float vertical_velocity      = 0.0f;
    float jump_timeout_remaining = 0.0f;
    float fall_timeout_remaining = 0.0f;
    float terminal_velocity      = 53.0f;
};

struct OrientationState {
    float yaw               = 0.0f; // third-person camera yaw
    float pitch             = 0.0f; // shared by both modes, clamped per mode
    float rotation_velocity = 0.0f; // first-person yaw delta applied this frame
};

struct LocomotionState {
    float     speed             = 0.0f;
    float     animation_blend   = 0.0f;
    float     rotation_velocity = 0.0f; // smooth_damp_angle scratch
    float     target_speed      = 0.0f;
    float     input_magnitude   = 0.0f;
    ecs::Vec3 direction         = {0, 0, 0};
    ecs::Vec3 realized_velocity = {0, 0, 0};
};

// Everything the per-frame controller mutates, owned by the player entity.
struct ControllerState {
    ViewMode         mode = ViewMode::FirstPerson;
    CharacterPose    pose;
    GroundState      ground;
    VerticalState    vertical;
    OrientationState orientation;
    LocomotionState  locomotion;

    std::optional<CameraTarget> first_person_target;
    std::optional<CameraTarget> third_person_target;

    bool switch_was_down = false; // view toggle edge detection
    bool initialized     = false;
};

// Footstep cadence and landing detection (see GaitSystem).
struct GaitState {
    bool  was_grounded    = true;
    float stride_progress = 0.0f;
};

struct PlayerTag {};
struct WorldTag {};
