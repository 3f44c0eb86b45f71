#include "camera_filters.hpp"
#include "../math_util.hpp"
#include <algorithm>
#include <cmath>

using namespace locomotion;

ZoomState CameraZoom::initial(const CameraZoomSettings& settings) {
    const float d = std::clamp(settings.default_distance, settings.min_distance, settings.max_distance);
    return {d, d};
}

bool CameraZoom::apply(float scroll, bool reset, const CameraZoomSettings& settings, ZoomState& state) {
    const float before = state.distance;

    if (std::abs(scroll) > 0.01f)
        state.distance = std::clamp(state.distance - scroll * settings.zoom_speed,
                                    settings.min_distance, settings.max_distance);

    if (reset) state.distance = state.default_distance;

    return state.distance != before;
}

ecs::Vec3 HeadFollow::step(const ecs::Vec3& head, bool sprinting, const ecs::Vec2& look,
                           const HeadFollowSettings& settings, float dt, HeadFollowState& state) {
    if (std::abs(look.x) > kLookActivity || std::abs(look.y) > kLookActivity)
        state.look_idle_time = 0.0f;
    else
        state.look_idle_time += dt;

    if (!state.placed) {
        state.position = head;
        state.velocity = {0, 0, 0};
        state.placed   = true;
        return state.position;
    }

    ecs::Vec3 target = state.position;
    if (settings.follow_x) target.x = head.x;
    if (settings.follow_y) target.y = head.y;
    if (settings.follow_z) target.z = head.z;

    const float speed = sprinting ? settings.sprint_smooth_speed : settings.normal_smooth_speed;

    if (math::length(math::sub(target, state.position)) > settings.snap_threshold &&
        state.look_idle_time >= settings.recenter_delay) {
        state.position = target;
        state.velocity = {0, 0, 0};
        return state.position;
    }

    const float smooth_time = 1.0f / std::max(speed, 0.001f);
    state.position.x = math::smooth_damp(state.position.x, target.x, state.velocity.x, smooth_time, dt);
    state.position.y = math::smooth_damp(state.position.y, target.y, state.velocity.y, smooth_time, dt);
    state.position.z = math::smooth_damp(state.position.z, target.z, state.velocity.z, smooth_time, dt);
    return state.position;
}
