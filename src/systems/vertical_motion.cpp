#include "vertical_motion.hpp"
#include <cmath>

float VerticalMotionSystem::launch_velocity(float jump_height, float gravity) {
    return std::sqrt(jump_height * -2.0f * gravity);
}

bool VerticalMotionSystem::integrate(bool grounded, float dt, const ControllerConfig& config,
                                     PlayerInput& input, VerticalState& state,
                                     AnimationSink* anim) {
    bool jumped = false;

    if (grounded) {
        state.fall_timeout_remaining = config.fall_timeout;

        if (anim) {
            anim->set_bool(AnimParam::Jump, false);
            anim->set_bool(AnimParam::FreeFall, false);
        }

        if (state.vertical_velocity < 0.0f)
            state.vertical_velocity = kGroundedVelocity;

        if (input.jump && state.jump_timeout_remaining <= 0.0f) {
            state.vertical_velocity = launch_velocity(config.jump_height, config.gravity);
            jumped = true;
            if (anim) anim->set_bool(AnimParam::Jump, true);
        }

        if (state.jump_timeout_remaining >= 0.0f)
            state.jump_timeout_remaining -= dt;
    } else {
        state.jump_timeout_remaining = config.jump_timeout;

        if (state.fall_timeout_remaining >= 0.0f) {
            state.fall_timeout_remaining -= dt;
        } else if (anim) {
            anim->set_bool(AnimParam::FreeFall, true);
        }

        // A press held through the fall must not fire on touchdown.
        input.jump = false;
    }

    // Semi-implicit Euler; may overshoot terminal by one step.
    if (state.vertical_velocity < state.terminal_velocity)
        state.vertical_velocity += config.gravity * dt;

    if (grounded && !jumped && state.vertical_velocity < kGroundedVelocity)
        state.vertical_velocity = kGroundedVelocity;

    return jumped;
}
