#pragma once
#include "../animation.hpp"
#include "../collaborators.hpp"
#include "../components.hpp"
#include "../diagnostics.hpp"

// First/third-person switch. Transitions are instantaneous: on the frame
// the toggle key goes down the rigs swap, the incoming rig is retargeted and
// the animator drops back to a grounded idle.
class ViewModeSystem {
public:
    // True on the frame `down` becomes set. Updates `was_down`.
    static bool detect_edge(bool down, bool& was_down);

    static ViewMode toggled(ViewMode mode);

    static CameraTargetSlot target_slot(ViewMode mode);

    // Enables the rig for `mode`, disables the other and points the active
    // one at its target. Without a rig for `mode` nothing is touched, the
    // gap is reported once and false is returned.
    static bool activate(ViewMode mode, CameraRig* first_person, CameraRig* third_person,
                         Diagnostics* diagnostics);

    static void reset_animation(AnimationSink* anim);

    // Enters `mode`. The third-person yaw snaps to the body facing so the
    // orbit camera starts behind the character. Returns false, leaving the
    // current mode and rigs as they were, when `mode` has no rig.
    static bool apply(ViewMode mode, ControllerState& state, CameraRig* first_person,
                      CameraRig* third_person, AnimationSink* anim, Diagnostics* diagnostics);
};
