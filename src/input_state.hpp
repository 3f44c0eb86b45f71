#pragma once
#include <raylib.h>
#include <vector>

// Raw device snapshot, refreshed once per frame by InputGatherSystem and
// read by PlayerInputSystem and CameraSystem. Stored as a World resource.

struct GamepadState {
    int   id = -1;
    float axes[8]            = {0};
    bool  buttons[32]        = {false};
    bool  buttons_pressed[32] = {false};
};

struct InputRecord {
    static constexpr int kKeyCount = 512;

    bool keys_down[kKeyCount]    = {false};
    bool keys_pressed[kKeyCount] = {false};

    Vector2 mouse_delta = {0, 0};
    float   mouse_wheel = 0.0f;
    bool    mouse_buttons[8]         = {false};
    bool    mouse_buttons_pressed[8] = {false};

    bool cursor_locked = false;

    std::vector<GamepadState> gamepads;

    bool key_down(int key) const    { return key >= 0 && key < kKeyCount && keys_down[key]; }
    bool key_pressed(int key) const { return key >= 0 && key < kKeyCount && keys_pressed[key]; }
};
