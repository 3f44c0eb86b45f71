#pragma once
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// SceneLoader: reads a JSON scene and spawns its entities into a World.
//
// Components are added in lifecycle-safe order (transform, colliders,
// rigid_body / character, then the player controller components) so on_add
// hooks see their sibling data. A "Player" entity gets PlayerInput,
// ControllerState and GaitState; its "controller" block names the camera
// targets and whether it carries an animator.
//
// No Jolt or Raylib dependency: part of the headless core.
// ---------------------------------------------------------------------------

class SceneLoader {
public:
    // False if the file cannot be opened or the scene is malformed.
    static bool load(ecs::World& world, const std::string& path);

    // Same as load() without file I/O.
    static bool load_from_string(ecs::World& world, const std::string& json);

    // Destroys all WorldTag entities and flushes deferred commands.
    static void unload(ecs::World& world);
};
