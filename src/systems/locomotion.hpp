#pragma once
#include "../animation.hpp"
#include "../components.hpp"
#include "../config.hpp"
#include <optional>

// ---------------------------------------------------------------------------
// LocomotionSystem: horizontal speed, movement direction and body facing.
//
// One code path for both view modes; MovementSettings::policy selects how
// the move vector is resolved:
//   CharacterRelative  body basis, strafes, never turns the body
//   CameraRelative     flattened camera basis, body faces forward/back intent
//   WorldRelative      world axes, body faces the travel direction
//
// The pieces are public so tests can drive them without a world.
// ---------------------------------------------------------------------------

class LocomotionSystem {
public:
    // Speed dead-band: closer than this to the goal snaps onto it.
    static constexpr float kSpeedOffset = 0.1f;
    // Character-relative move vectors this short resolve to no direction.
    static constexpr float kDirectionThresholdSq = 0.01f;

    static float target_speed(const PlayerInput& input, const MovementSettings& settings);
    static float input_magnitude(const PlayerInput& input);

    // Linear ramp of `current` toward target * magnitude, at most rate * dt.
    static float step_speed(float current, float target, float magnitude, float rate, float dt);

    // Exponential smoothing of the target speed, zeroed under 0.01.
    static float step_animation_blend(float blend, float target, float rate, float dt);

    // 0..0.5 across [0, move_speed], 0.5..1 across [move_speed, sprint_speed],
    // rounded to two decimals.
    static float normalized_blend(float blend, const MovementSettings& settings);

    struct Basis {
        ecs::Vec3 forward;
        ecs::Vec3 right;
    };

    static Basis character_basis(float body_yaw);
    // Flattened basis of a view direction; falls back to +Z when looking
    // straight up or down.
    static Basis camera_basis(const ecs::Vec3& view_forward);

    static ecs::Vec3 resolve_direction(MovementPolicy policy, const PlayerInput& input,
                                       const Basis& basis);

    // Heading the body should turn toward this frame, if any. Moving
    // backward under CameraRelative keeps the camera-forward heading.
    static std::optional<float> facing_heading(MovementPolicy policy, const PlayerInput& input,
                                               const Basis& basis);

    static ecs::Vec3 displacement(const ecs::Vec3& direction, float speed, float magnitude,
                                  float vertical_velocity, float dt);

    // Runs one frame: speed ramp, animation blend, facing, direction.
    // `view_forward` is the active camera's forward. Returns the displacement
    // to hand to the mover.
    static ecs::Vec3 update(const PlayerInput& input, const MovementSettings& settings,
                            const ecs::Vec3& view_forward, float vertical_velocity, float dt,
                            LocomotionState& state, CharacterPose& pose, AnimationSink* anim);
};
