#include "camera.hpp"
#include "camera_filters.hpp"
#include "../camera_rig.hpp"
#include "../components.hpp"
#include "../config.hpp"
#include "../diagnostics.hpp"
#include "../input_state.hpp"
#include "../math_util.hpp"
#include "../physics_handles.hpp"
#include <raylib.h>

using namespace ecs;
using namespace locomotion;

// Raylib reports whole wheel notches; the zoom speed is tuned for a tenth.
static constexpr float kWheelNotch = 0.1f;

void CameraSystem::Update(World& world, float dt) {
    auto* rigs   = world.try_resource<CameraRigs>();
    auto* config = world.try_resource<ControllerConfig>();
    if (!rigs || !config) return;

    const auto* record      = world.try_resource<InputRecord>();
    auto*       diagnostics = world.try_resource<Diagnostics>();

    world.single<PlayerTag, PlayerInput, ControllerState>(
        [&](Entity, PlayerTag&, PlayerInput& input, ControllerState& state) {
            const ecs::Vec3& feet = state.pose.position;

            if (!state.first_person_target && !state.third_person_target) {
                if (diagnostics)
                    diagnostics->warn_once("camera_targets", "CAMERA: player has no camera targets, rigs left in place");
                return;
            }

            if (state.first_person_target) {
                const CameraTarget& head = *state.first_person_target;
                const ecs::Vec3 desired  = math::add(feet, head.offset);
                const ecs::Vec3 eye = HeadFollow::step(desired, input.sprint, input.look,
                                                       config->head_follow, dt, rigs->head);
                const ecs::Vec3 look = math::add(eye, math::view_direction(head.yaw, head.pitch));
                rigs->first_person.place(MathBridge::ToRaylib(eye), MathBridge::ToRaylib(look));
            }

            if (state.third_person_target) {
                if (rigs->third_person.active() && record) {
                    const bool reset = record->mouse_buttons_pressed[MOUSE_BUTTON_MIDDLE];
                    if (CameraZoom::apply(record->mouse_wheel * kWheelNotch, reset, config->zoom, rigs->zoom))
                        TraceLog(LOG_DEBUG, "CAMERA: orbit distance %.2f", rigs->zoom.distance);
                }

                const CameraTarget& pivot = *state.third_person_target;
                const ecs::Vec3 center = math::add(feet, pivot.offset);
                const ecs::Vec3 dir    = math::view_direction(pivot.yaw, pivot.pitch);
                const ecs::Vec3 eye    = math::sub(center, math::scale(dir, rigs->zoom.distance));
                rigs->third_person.place(MathBridge::ToRaylib(eye), MathBridge::ToRaylib(center));
            }
        });
}
