#include "gait.hpp"
#include "../config.hpp"
#include "../events.hpp"
#include "../math_util.hpp"
#include "locomotion.hpp"
#include <algorithm>

using namespace ecs;
using namespace locomotion;

float GaitSystem::clip_weight(float normalized_blend) {
    return std::clamp(normalized_blend * 2.0f, 0.0f, 1.0f);
}

GaitSystem::Step GaitSystem::step(bool grounded, float horizontal_speed, float normalized_blend,
                                  float stride_length, float dt, GaitState& gait) {
    Step out;

    if (grounded && !gait.was_grounded) {
        out.landed           = true;
        out.weight           = 1.0f;
        gait.stride_progress = 0.0f;
    }

    if (grounded && stride_length > 0.0f) {
        gait.stride_progress += horizontal_speed * dt;
        if (gait.stride_progress >= stride_length) {
            gait.stride_progress -= stride_length;
            out.footstep = true;
            if (!out.landed) out.weight = clip_weight(normalized_blend);
        }
    }

    gait.was_grounded = grounded;
    return out;
}

void GaitSystem::Update(World& world, float dt) {
    const auto* config = world.try_resource<ControllerConfig>();
    if (!config) return;

    auto* footsteps = world.try_resource<Events<FootstepEvent>>();
    auto* landings  = world.try_resource<Events<LandEvent>>();

    world.each<ControllerState, GaitState>([&](Entity e, ControllerState& state, GaitState& gait) {
        const ecs::Vec3& v    = state.locomotion.realized_velocity;
        const float speed     = math::length(math::flatten(v));
        const float blend     = LocomotionSystem::normalized_blend(state.locomotion.animation_blend,
                                                                   config->settings_for(state.mode));

        const Step s = step(state.ground.grounded, speed, blend, config->stride_length, dt, gait);

        if (s.landed && landings)
            landings->send({e, state.pose.position, 1.0f});
        if (s.footstep && footsteps)
            footsteps->send({e, state.pose.position, clip_weight(blend)});
    });
}
