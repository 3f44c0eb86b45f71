#pragma once
#include "../config.hpp"
#include <ecs/ecs.hpp>

// Small single-purpose smoothing filters applied to the camera rigs after
// orientation. Neither touches controller state.

// Orbit distance of the third-person rig.
struct ZoomState {
    float distance         = 4.0f;
    float default_distance = 4.0f;
};

class CameraZoom {
public:
    static ZoomState initial(const CameraZoomSettings& settings);

    // Scroll up (positive) pulls the camera in. `reset` restores the default
    // distance. Returns true when the distance changed.
    static bool apply(float scroll, bool reset, const CameraZoomSettings& settings, ZoomState& state);
};

// First-person eye position trailing the head.
struct HeadFollowState {
    ecs::Vec3 position       = {0, 0, 0};
    ecs::Vec3 velocity       = {0, 0, 0};
    float     look_idle_time = 0.0f;
    bool      placed         = false;
};

class HeadFollow {
public:
    static constexpr float kLookActivity = 0.01f;

    // Moves state.position toward `head` on the enabled axes. Smoothing is
    // faster while sprinting; once the gap exceeds the snap threshold and
    // the look input has been idle for the recenter delay it jumps there.
    static ecs::Vec3 step(const ecs::Vec3& head, bool sprinting, const ecs::Vec2& look,
                          const HeadFollowSettings& settings, float dt, HeadFollowState& state);
};
