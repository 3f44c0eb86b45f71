#pragma once
#include "../debug_panel.hpp"
#include "../diagnostics.hpp"
#include "../pipeline.hpp"
#include "../systems/debug.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// DebugModule
//
// Creates the DebugPanel resource with the "Engine" rows (frame timing,
// entity count, diagnostics backlog) and adds DebugSystem to the Render
// phase. Install after RenderModule (so the
// overlay draws over the scene) and before any module that adds rows.
// ---------------------------------------------------------------------------

struct DebugModule {
    static void install(ecs::World& world, locomotion::Pipeline& pipeline) {
        DebugPanel panel;

        panel.watch("Engine", "FPS", []() {
            return std::to_string(GetFPS());
        });
        panel.watch("Engine", "Frame Time", []() {
            char b[16];
            std::snprintf(b, sizeof(b), "%d ms", (int)(GetFrameTime() * 1000));
            return std::string(b);
        });
        panel.watch("Engine", "Entities", [&world]() {
            return std::to_string(world.count());
        });
        panel.watch("Engine", "Diagnostics", [&world]() {
            const auto* d = world.try_resource<Diagnostics>();
            return d ? std::to_string(d->recent().size()) + " recent" : std::string("-");
        });

        world.set_resource(std::move(panel));
        pipeline.add_render([](ecs::World& w, float dt) { DebugSystem::Update(w, dt); });
    }
};
