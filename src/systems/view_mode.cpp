#include "view_mode.hpp"

bool ViewModeSystem::detect_edge(bool down, bool& was_down) {
    const bool pressed = down && !was_down;
    was_down = down;
    return pressed;
}

ViewMode ViewModeSystem::toggled(ViewMode mode) {
    return mode == ViewMode::FirstPerson ? ViewMode::ThirdPerson : ViewMode::FirstPerson;
}

CameraTargetSlot ViewModeSystem::target_slot(ViewMode mode) {
    return mode == ViewMode::FirstPerson ? CameraTargetSlot::FirstPersonHead
                                         : CameraTargetSlot::ThirdPersonPivot;
}

bool ViewModeSystem::activate(ViewMode mode, CameraRig* first_person, CameraRig* third_person,
                              Diagnostics* diagnostics) {
    CameraRig* incoming = mode == ViewMode::FirstPerson ? first_person : third_person;
    CameraRig* outgoing = mode == ViewMode::FirstPerson ? third_person : first_person;

    if (!incoming) {
        if (diagnostics)
            diagnostics->warn_once("camera_rig", "CONTROLLER: no camera rig bound for the requested view mode");
        return false;
    }
    if (diagnostics) diagnostics->clear("camera_rig");

    if (outgoing) outgoing->set_active(false);
    incoming->set_active(true);
    incoming->set_follow_and_look_target(target_slot(mode));
    return true;
}

void ViewModeSystem::reset_animation(AnimationSink* anim) {
    if (!anim) return;
    anim->set_float(AnimParam::Speed, 0.0f);
    anim->set_float(AnimParam::MotionSpeed, 0.0f);
    anim->set_float(AnimParam::Direction, 0.0f);
    anim->set_bool(AnimParam::Jump, false);
    anim->set_bool(AnimParam::FreeFall, false);
    anim->set_bool(AnimParam::Grounded, true);
}

bool ViewModeSystem::apply(ViewMode mode, ControllerState& state, CameraRig* first_person,
                           CameraRig* third_person, AnimationSink* anim, Diagnostics* diagnostics) {
    if (!activate(mode, first_person, third_person, diagnostics)) return false;
    state.mode = mode;

    if (mode == ViewMode::ThirdPerson)
        state.orientation.yaw = state.pose.yaw;

    reset_animation(anim);
    return true;
}
