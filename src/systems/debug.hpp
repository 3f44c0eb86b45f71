#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// DebugSystem: render phase; draws the DebugPanel overlay and the last few
// Diagnostics lines beneath it. F3 toggles visibility.
// ---------------------------------------------------------------------------

class DebugSystem {
public:
    static void Update(ecs::World& world, float dt);
};
