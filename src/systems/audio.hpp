#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// AudioSystem: logic phase, after GaitSystem. Plays FootstepEvent,
// LandEvent and JumpEvent clips at the configured footstep volume.
// Gait events from a clip blended below half weight are dropped.
// ---------------------------------------------------------------------------

class AudioSystem {
public:
    static void Update(ecs::World& world, float dt);
};
