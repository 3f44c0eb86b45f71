#pragma once
#include <ecs/ecs.hpp>

// Places both camera rigs from the player's camera targets. Runs in the
// late-update phase after the controller has applied this frame's look
// input, so neither rig trails the body by a frame.
//
// First person: eye trails the head through HeadFollow.
// Third person: orbit at the CameraZoom distance. Scroll and middle-mouse
// reset are read only while that rig is active.
class CameraSystem {
public:
    static void Update(ecs::World& world, float dt);
};
