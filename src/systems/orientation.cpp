#include "orientation.hpp"
#include "../math_util.hpp"

using namespace locomotion;

bool OrientationSystem::look_active(const PlayerInput& input) {
    return input.look.x * input.look.x + input.look.y * input.look.y >= kLookThresholdSq;
}

float OrientationSystem::delta_multiplier(LookDevice device, float dt) {
    return device == LookDevice::Pointer ? 1.0f : dt;
}

void OrientationSystem::first_person(const PlayerInput& input, const MovementSettings& settings,
                                     float dt, OrientationState& orientation, CharacterPose& pose,
                                     CameraTarget* head, Diagnostics* diagnostics) {
    if (!head) {
        if (diagnostics)
            diagnostics->warn_once("first_person_target", "CONTROLLER: first-person camera target is not assigned");
        return;
    }
    if (diagnostics) diagnostics->clear("first_person_target");

    orientation.rotation_velocity = 0.0f;

    if (look_active(input)) {
        const float m = delta_multiplier(input.look_device, dt);
        orientation.pitch            += input.look.y * settings.rotation_speed * m;
        orientation.rotation_velocity = input.look.x * settings.rotation_speed * m;
        pose.yaw = math::repeat(pose.yaw + orientation.rotation_velocity, 360.0f);
    }

    orientation.pitch = math::clamp_angle(orientation.pitch, settings.bottom_clamp, settings.top_clamp);

    head->pitch = orientation.pitch;
    head->yaw   = pose.yaw;
}

void OrientationSystem::third_person(const PlayerInput& input, const MovementSettings& settings,
                                     const ControllerConfig& config, float dt,
                                     OrientationState& orientation, CameraTarget* pivot,
                                     Diagnostics* diagnostics) {
    if (!pivot) {
        if (diagnostics)
            diagnostics->warn_once("third_person_target", "CONTROLLER: third-person camera target is not assigned");
        return;
    }
    if (diagnostics) diagnostics->clear("third_person_target");

    if (look_active(input) && !config.lock_camera_position) {
        const float m = delta_multiplier(input.look_device, dt);
        orientation.yaw   += input.look.x * m;
        orientation.pitch += input.look.y * m;
    }

    orientation.yaw   = math::clamp_angle_unbounded(orientation.yaw);
    orientation.pitch = math::clamp_angle(orientation.pitch, settings.bottom_clamp, settings.top_clamp);

    pivot->pitch = orientation.pitch + config.camera_angle_override;
    pivot->yaw   = orientation.yaw;
}
