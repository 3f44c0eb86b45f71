#pragma once
#include "../pipeline.hpp"
#include "../systems/input_gather.hpp"
#include "../systems/player_input.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputModule
//
// Pre-Update: InputGatherSystem (device snapshot) then PlayerInputSystem
// (PlayerInput for the controller). Install after CoreModule so the config
// poll has run before the input settings are read.
// ---------------------------------------------------------------------------

struct InputModule {
    static void install(ecs::World& /*world*/, locomotion::Pipeline& pipeline) {
        pipeline.add_pre_update([](ecs::World& w, float) { InputGatherSystem::Update(w); });
        pipeline.add_pre_update([](ecs::World& w, float) { PlayerInputSystem::Update(w); });
    }
};
