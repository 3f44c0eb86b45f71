#pragma once
#include "../camera_rig.hpp"
#include "../config.hpp"
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/camera.hpp"
#include "../systems/camera_filters.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// CameraModule
//
// Creates the CameraRigs resource (zoom seeded from ControllerConfig) and
// adds CameraSystem to the Late-Update phase. Install after ControllerModule
// so the rigs are placed from this frame's camera targets.
// ---------------------------------------------------------------------------

struct CameraModule {
    static void install(ecs::World& world, locomotion::Pipeline& pipeline) {
        CameraRigs rigs;
        if (const auto* config = world.try_resource<ControllerConfig>())
            rigs.zoom = CameraZoom::initial(config->zoom);
        world.set_resource(std::move(rigs));

        pipeline.add_late_update([](ecs::World& w, float dt) { CameraSystem::Update(w, dt); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Camera", "Active Rig", [&world]() {
                auto* r = world.try_resource<CameraRigs>();
                if (!r) return std::string("-");
                return std::string(r->third_person.active() ? "Third Person" : "First Person");
            });
            panel->watch("Camera", "Orbit Distance", [&world]() {
                auto* r = world.try_resource<CameraRigs>();
                if (!r) return std::string("-");
                char b[16];
                std::snprintf(b, sizeof(b), "%.2f", r->zoom.distance);
                return std::string(b);
            });
        }
    }
};
