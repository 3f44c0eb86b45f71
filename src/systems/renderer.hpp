#pragma once
#include <ecs/ecs.hpp>

// Render phase. Update() opens the frame and draws the scene through the
// active camera rig; Present() closes it, so overlays registered in between
// (DebugSystem) land in the same frame.
class RenderSystem {
public:
    static void Update(ecs::World& world);
    static void Present(ecs::World& world);
};
