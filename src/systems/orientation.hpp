#pragma once
#include "../components.hpp"
#include "../config.hpp"
#include "../diagnostics.hpp"

// Camera yaw/pitch per view mode. Runs in the late-update phase, after the
// character has moved this frame.
class OrientationSystem {
public:
    // Squared look magnitude below which look input is ignored.
    static constexpr float kLookThresholdSq = 0.01f;

    static bool  look_active(const PlayerInput& input);

    // Pointer deltas are per-frame already; rate devices are scaled by dt.
    static float delta_multiplier(LookDevice device, float dt);

    // Pitch into the head target, yaw straight onto the body.
    // Skipped (warned once) without a head target.
    static void first_person(const PlayerInput& input, const MovementSettings& settings, float dt,
                             OrientationState& orientation, CharacterPose& pose,
                             CameraTarget* head, Diagnostics* diagnostics);

    // Free yaw and clamped pitch into the orbit pivot. Look input is ignored
    // while the camera position is locked; the angle override is added to
    // the pivot's pitch only.
    static void third_person(const PlayerInput& input, const MovementSettings& settings,
                             const ControllerConfig& config, float dt,
                             OrientationState& orientation, CameraTarget* pivot,
                             Diagnostics* diagnostics);
};
