#pragma once
#include "../pipeline.hpp"
#include "../systems/renderer.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderModule
//
// install() opens the Render phase with RenderSystem::Update; every render
// step added afterwards draws into the same frame. install_present() closes
// the frame and must be the last render step added.
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(ecs::World& /*world*/, locomotion::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Update(w); });
    }

    static void install_present(ecs::World& /*world*/, locomotion::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Present(w); });
    }
};
