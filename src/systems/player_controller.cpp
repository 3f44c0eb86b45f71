#include "player_controller.hpp"
#include "../math_util.hpp"
#include "ground_check.hpp"
#include "locomotion.hpp"
#include "orientation.hpp"
#include "vertical_motion.hpp"
#include "view_mode.hpp"

using namespace locomotion;

void PlayerControllerSystem::initialize(ControllerState& state, const ControllerConfig& config,
                                        const ControllerBindings& bindings) {
    state.mode                            = config.start_mode;
    state.vertical.jump_timeout_remaining = config.jump_timeout;
    state.vertical.fall_timeout_remaining = config.fall_timeout;

    ViewModeSystem::activate(state.mode, bindings.first_person_rig, bindings.third_person_rig,
                             bindings.diagnostics);
    if (state.mode == ViewMode::ThirdPerson)
        state.orientation.yaw = state.pose.yaw;

    state.initialized = true;
}

ecs::Vec3 PlayerControllerSystem::view_forward(const ControllerState& state,
                                               const ControllerConfig& config,
                                               const ControllerBindings& bindings) {
    const CameraRig* rig = state.mode == ViewMode::FirstPerson ? bindings.first_person_rig
                                                               : bindings.third_person_rig;
    if (rig) {
        if (bindings.diagnostics) bindings.diagnostics->clear("view_forward");
        return rig->view_forward();
    }

    if (config.settings_for(state.mode).policy == MovementPolicy::CameraRelative && bindings.diagnostics)
        bindings.diagnostics->warn_once("view_forward",
                                        "CONTROLLER: camera-relative movement without an active rig, using stored yaw");

    const float yaw = state.mode == ViewMode::FirstPerson ? state.pose.yaw : state.orientation.yaw;
    return math::heading_forward(yaw);
}

void PlayerControllerSystem::update(ecs::Entity self, PlayerInput& input, ControllerState& state,
                                    const ControllerConfig& config, const ControllerBindings& bindings,
                                    float dt) {
    if (!state.initialized) initialize(state, config, bindings);

    // 1. View toggle
    if (ViewModeSystem::detect_edge(input.switch_view_down, state.switch_was_down)) {
        const ViewMode next = ViewModeSystem::toggled(state.mode);
        if (ViewModeSystem::apply(next, state, bindings.first_person_rig, bindings.third_person_rig,
                                  bindings.animator, bindings.diagnostics)) {
            if (bindings.view_events) bindings.view_events->send({self, next});
            if (bindings.diagnostics)
                bindings.diagnostics->emit(Diagnostics::Level::Info,
                                           next == ViewMode::FirstPerson ? "CONTROLLER: first-person view"
                                                                         : "CONTROLLER: third-person view");
        }
    }

    const MovementSettings& settings = config.settings_for(state.mode);

    // 2. Vertical motion, against last frame's grounded state
    if (VerticalMotionSystem::integrate(state.ground.grounded, dt, config, input, state.vertical,
                                        bindings.animator)) {
        if (bindings.jump_events)
            bindings.jump_events->send(
                {self, VerticalMotionSystem::launch_velocity(config.jump_height, config.gravity)});
    }

    // 3. Ground probe
    GroundCheckSystem::check(bindings.ground_probe, state.pose, config.grounding, state.ground,
                             bindings.animator, bindings.diagnostics);

    // 4. Locomotion
    const ecs::Vec3 forward = view_forward(state, config, bindings);
    const ecs::Vec3 delta   = LocomotionSystem::update(input, settings, forward,
                                                       state.vertical.vertical_velocity, dt,
                                                       state.locomotion, state.pose, bindings.animator);

    if (!bindings.mover) {
        if (bindings.diagnostics)
            bindings.diagnostics->warn_once("mover", "CONTROLLER: no character mover bound, displacement dropped");
        state.locomotion.realized_velocity = {0, 0, 0};
        return;
    }
    if (bindings.diagnostics) bindings.diagnostics->clear("mover");

    state.locomotion.realized_velocity = bindings.mover->move(delta, dt);
    state.pose.position = math::add(state.pose.position, math::scale(state.locomotion.realized_velocity, dt));
}

void PlayerControllerSystem::late_update(const PlayerInput& input, ControllerState& state,
                                         const ControllerConfig& config,
                                         const ControllerBindings& bindings, float dt) {
    const MovementSettings& settings = config.settings_for(state.mode);

    if (state.mode == ViewMode::FirstPerson) {
        CameraTarget* head = state.first_person_target ? &*state.first_person_target : nullptr;
        OrientationSystem::first_person(input, settings, dt, state.orientation, state.pose, head,
                                        bindings.diagnostics);
    } else {
        CameraTarget* pivot = state.third_person_target ? &*state.third_person_target : nullptr;
        OrientationSystem::third_person(input, settings, config, dt, state.orientation, pivot,
                                        bindings.diagnostics);
    }
}
