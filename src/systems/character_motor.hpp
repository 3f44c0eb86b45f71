#pragma once
#include <ecs/ecs.hpp>

// Host side of the player controller. Owns the Jolt CharacterVirtual for
// every CharacterControllerConfig entity, binds it (plus the camera rigs,
// animator and event queues) to PlayerControllerSystem and writes the
// resulting pose back to Jolt and the entity transform.
//
//   Update()      logic phase, last step before the fixed physics step
//   LateUpdate()  late-update phase, before CameraSystem
class CharacterMotorSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);
    static void LateUpdate(ecs::World& world, float dt);
};
