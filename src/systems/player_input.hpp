#pragma once
#include <ecs/ecs.hpp>

// Pre-update: turns the InputRecord into the player's PlayerInput.
//
// Keyboard/mouse: WASD move, mouse look (while the cursor is locked), SPACE
// jump, LEFT SHIFT sprint, the configured key toggles the view.
// Gamepad: left stick move (analog), right stick look (rate), SOUTH jump,
// left stick click sprint, NORTH toggles the view.
class PlayerInputSystem {
public:
    static void Update(ecs::World& world);
};
