#pragma once
#include "../debug_panel.hpp"
#include "../physics_context.hpp"
#include "../pipeline.hpp"
#include "../systems/physics.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform_propagation.hpp>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// PhysicsModule
//
// Creates the PhysicsContext resource, installs the rigid-body lifecycle
// hooks and adds the fixed-step simulation plus transform propagation to
// the Physics phase. Adds a "Physics" body-count row when a DebugPanel
// exists. Install before the scene is loaded.
// ---------------------------------------------------------------------------

struct PhysicsModule {
    static void install(ecs::World& world, locomotion::Pipeline& pipeline) {
        PhysicsContext::InitJoltAllocator();
        world.set_resource(std::make_shared<PhysicsContext>());
        PhysicsSystem::Register(world);
        pipeline.add_physics([](ecs::World& w, float dt) {
            PhysicsSystem::Update(w, dt);
            ecs::propagate_transforms(w);
        });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Physics", "Bodies", [&world]() {
                auto* ctx = world.try_resource<std::shared_ptr<PhysicsContext>>();
                if (!ctx || !*ctx) return std::string("-");
                return std::to_string((*ctx)->physics_system->GetNumBodies()) + " / " +
                       std::to_string((*ctx)->physics_system->GetNumActiveBodies(JPH::EBodyType::RigidBody)) + " active";
            });
        }
    }
};
