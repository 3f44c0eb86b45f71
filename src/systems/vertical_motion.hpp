#pragma once
#include "../animation.hpp"
#include "../components.hpp"
#include "../config.hpp"

// Jump, gravity and the grounded/free-fall timeouts. One call per frame,
// before the ground probe refreshes `grounded` (so it sees last frame's).
class VerticalMotionSystem {
public:
    // Velocity held while standing so the mover keeps the capsule pressed
    // onto slopes and steps.
    static constexpr float kGroundedVelocity = -2.0f;

    // Launch speed that peaks at `jump_height` under `gravity` (negative).
    static float launch_velocity(float jump_height, float gravity);

    // Advances `state` by dt. Clears input.jump while airborne. `anim` may be
    // null. Returns true when a jump launched this frame.
    static bool integrate(bool grounded, float dt, const ControllerConfig& config,
                          PlayerInput& input, VerticalState& state, AnimationSink* anim);
};
