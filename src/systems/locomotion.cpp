#include "locomotion.hpp"
#include "../math_util.hpp"
#include <cmath>

using namespace locomotion;

float LocomotionSystem::target_speed(const PlayerInput& input, const MovementSettings& settings) {
    if (input.move.x == 0.0f && input.move.y == 0.0f) return 0.0f;
    return input.sprint ? settings.sprint_speed : settings.move_speed;
}

float LocomotionSystem::input_magnitude(const PlayerInput& input) {
    if (!input.analog_movement) return 1.0f;
    return std::sqrt(input.move.x * input.move.x + input.move.y * input.move.y);
}

float LocomotionSystem::step_speed(float current, float target, float magnitude, float rate, float dt) {
    const float goal = target * magnitude;
    if (std::abs(current - goal) > kSpeedOffset)
        return math::move_towards(current, goal, rate * dt);
    return goal;
}

float LocomotionSystem::step_animation_blend(float blend, float target, float rate, float dt) {
    blend = math::lerp(blend, target, dt * rate);
    return blend < 0.01f ? 0.0f : blend;
}

float LocomotionSystem::normalized_blend(float blend, const MovementSettings& settings) {
    float normalized = 0.0f;
    if (blend > 0.0f) {
        if (blend <= settings.move_speed)
            normalized = math::inverse_lerp(0.0f, settings.move_speed, blend) * 0.5f;
        else
            normalized = 0.5f + math::inverse_lerp(settings.move_speed, settings.sprint_speed, blend) * 0.5f;
    }
    return math::round_to(normalized, 0.01f);
}

LocomotionSystem::Basis LocomotionSystem::character_basis(float body_yaw) {
    return {math::heading_forward(body_yaw), math::heading_right(body_yaw)};
}

LocomotionSystem::Basis LocomotionSystem::camera_basis(const ecs::Vec3& view_forward) {
    const ecs::Vec3 flat = math::normalized(math::flatten(view_forward));
    if (math::length_sq(flat) == 0.0f) return character_basis(0.0f);
    return character_basis(math::heading_of(flat.x, flat.z));
}

ecs::Vec3 LocomotionSystem::resolve_direction(MovementPolicy policy, const PlayerInput& input,
                                              const Basis& basis) {
    ecs::Vec3 dir{0, 0, 0};
    switch (policy) {
        case MovementPolicy::CharacterRelative:
        case MovementPolicy::CameraRelative:
            dir = math::add(math::scale(basis.right, input.move.x), math::scale(basis.forward, input.move.y));
            break;
        case MovementPolicy::WorldRelative: {
            const Basis world = character_basis(0.0f);
            dir = math::add(math::scale(world.right, input.move.x), math::scale(world.forward, input.move.y));
            break;
        }
    }
    if (policy == MovementPolicy::CharacterRelative && math::length_sq(dir) <= kDirectionThresholdSq)
        return {0, 0, 0};
    return math::normalized(dir);
}

std::optional<float> LocomotionSystem::facing_heading(MovementPolicy policy, const PlayerInput& input,
                                                      const Basis& basis) {
    const bool moving = input.move.x != 0.0f || input.move.y != 0.0f;
    switch (policy) {
        case MovementPolicy::CharacterRelative:
            return std::nullopt;

        case MovementPolicy::CameraRelative: {
            if (!moving || std::abs(input.move.y) <= 0.01f) return std::nullopt;
            // Backward intent flips the forward term so the body keeps
            // facing away from the camera instead of turning around.
            const float fwd = input.move.y < -0.01f ? -input.move.y : input.move.y;
            const ecs::Vec3 dir = math::normalized(
                math::add(math::scale(basis.right, input.move.x), math::scale(basis.forward, fwd)));
            return math::heading_of(dir.x, dir.z);
        }

        case MovementPolicy::WorldRelative: {
            if (!moving) return std::nullopt;
            const ecs::Vec3 dir = resolve_direction(policy, input, basis);
            if (math::length_sq(dir) == 0.0f) return std::nullopt;
            return math::heading_of(dir.x, dir.z);
        }
    }
    return std::nullopt;
}

ecs::Vec3 LocomotionSystem::displacement(const ecs::Vec3& direction, float speed, float magnitude,
                                         float vertical_velocity, float dt) {
    ecs::Vec3 out = math::scale(math::normalized(direction), speed * magnitude * dt);
    out.y += vertical_velocity * dt;
    return out;
}

ecs::Vec3 LocomotionSystem::update(const PlayerInput& input, const MovementSettings& settings,
                                   const ecs::Vec3& view_forward, float vertical_velocity, float dt,
                                   LocomotionState& state, CharacterPose& pose, AnimationSink* anim) {
    state.target_speed    = target_speed(input, settings);
    state.input_magnitude = input_magnitude(input);
    state.speed = step_speed(state.speed, state.target_speed, state.input_magnitude,
                             settings.speed_change_rate, dt);
    state.animation_blend = step_animation_blend(state.animation_blend, state.target_speed,
                                                 settings.speed_change_rate, dt);

    const Basis basis = settings.policy == MovementPolicy::CharacterRelative
                            ? character_basis(pose.yaw)
                            : camera_basis(view_forward);

    if (auto heading = facing_heading(settings.policy, input, basis)) {
        const float yaw = math::smooth_damp_angle(pose.yaw, *heading, state.rotation_velocity,
                                                  settings.rotation_smooth_time, dt);
        pose.yaw = math::repeat(yaw, 360.0f);
    }

    state.direction = resolve_direction(settings.policy, input, basis);

    if (anim) {
        anim->set_float(AnimParam::Speed, normalized_blend(state.animation_blend, settings));
        anim->set_float(AnimParam::Direction, input.move.y);
        anim->set_float(AnimParam::MotionSpeed, state.input_magnitude);
    }

    return displacement(state.direction, state.speed, state.input_magnitude, vertical_velocity, dt);
}
