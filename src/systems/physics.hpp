#pragma once
#include <ecs/ecs.hpp>

// Creates Jolt bodies for RigidBodyConfig entities, steps the simulation at
// the fixed rate and writes dynamic bodies back to their transforms.
class PhysicsSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);
};
