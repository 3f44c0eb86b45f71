#pragma once
#include "../animation.hpp"
#include "../collaborators.hpp"
#include "../components.hpp"
#include "../config.hpp"
#include "../diagnostics.hpp"
#include "../events.hpp"
#include <ecs/ecs.hpp>

// Everything the controller talks to outside its own state. Any pointer may
// be null: a missing animator is skipped silently, anything else is
// reported once through `diagnostics` and its stage is skipped.
struct ControllerBindings {
    const GroundProbe*             ground_probe     = nullptr;
    CharacterMover*                mover            = nullptr;
    AnimationSink*                 animator         = nullptr;
    CameraRig*                     first_person_rig = nullptr;
    CameraRig*                     third_person_rig = nullptr;
    Diagnostics*                   diagnostics      = nullptr;
    Events<JumpEvent>*             jump_events      = nullptr;
    Events<ViewModeChangedEvent>*  view_events      = nullptr;
};

// ---------------------------------------------------------------------------
// PlayerControllerSystem: per-frame orchestration of the controller stages.
//
//   update()       logic phase:  view toggle → vertical motion → ground
//                                probe → locomotion → mover
//   late_update()  late phase:   orientation for the active view mode
//
// Engine-free. The host (CharacterMotorSystem) builds the bindings for each
// player entity and calls these once per frame.
// ---------------------------------------------------------------------------

class PlayerControllerSystem {
public:
    // Applies the configured start mode and arms the timeouts. Called by
    // update() on the first frame; safe to call again after a scene reload.
    static void initialize(ControllerState& state, const ControllerConfig& config,
                           const ControllerBindings& bindings);

    static void update(ecs::Entity self, PlayerInput& input, ControllerState& state,
                       const ControllerConfig& config, const ControllerBindings& bindings, float dt);

    static void late_update(const PlayerInput& input, ControllerState& state,
                            const ControllerConfig& config, const ControllerBindings& bindings, float dt);

    // Forward of the active rig, or of the stored yaw when it has none.
    static ecs::Vec3 view_forward(const ControllerState& state, const ControllerConfig& config,
                                  const ControllerBindings& bindings);
};
