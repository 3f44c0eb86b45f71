#pragma once
#include <ecs/ecs.hpp>

// Pre-update: snapshots keyboard, mouse and gamepads into the InputRecord
// resource and applies the cursor lock (TAB toggles it).
class InputGatherSystem {
public:
    static void Update(ecs::World& world);
};
