#include "input_gather.hpp"
#include "../config.hpp"
#include "../input_state.hpp"
#include <raylib.h>
#include <string>

// Filters out the virtual "gamepads" some platforms expose for keyboards,
// sensors and audio devices.
static bool IsRealGamepad(int i) {
    if (!IsGamepadAvailable(i)) return false;
    if (GetGamepadAxisCount(i) < 4) return false;

    const char* name = GetGamepadName(i);
    if (!name) return false;
    const std::string n = name;
    const char* blacklist[] = {
        "Keyboard", "Mouse", "Trackpad", "Touchpad",
        "SMC", "Accelerometer", "Mic", "Headset",
        "Video", "Sensor", "Consumer Control", "System Control",
        "Power Button", "Speaker", "HDA Intel", "Apple Internal Keyboard"
    };
    for (const char* b : blacklist) {
        if (n.find(b) != std::string::npos) return false;
    }
    return true;
}

static void apply_cursor_lock(InputRecord& input, bool locked) {
    if (locked == input.cursor_locked) return;
    if (locked) DisableCursor(); else EnableCursor();
    input.cursor_locked = locked;
}

void InputGatherSystem::Update(ecs::World& world) {
    auto* input_ptr = world.try_resource<InputRecord>();
    if (!input_ptr) {
        world.set_resource(InputRecord{});
        input_ptr = world.try_resource<InputRecord>();
        if (const auto* config = world.try_resource<ControllerConfig>())
            apply_cursor_lock(*input_ptr, config->input.cursor_locked);
    }
    auto& input = *input_ptr;

    for (int i = 0; i < InputRecord::kKeyCount; i++) {
        input.keys_down[i]    = IsKeyDown(i);
        input.keys_pressed[i] = IsKeyPressed(i);
    }

    if (input.keys_pressed[KEY_TAB]) apply_cursor_lock(input, !input.cursor_locked);
    if (!IsWindowFocused()) apply_cursor_lock(input, false);

    input.mouse_delta = GetMouseDelta();
    input.mouse_wheel = GetMouseWheelMove();
    for (int i = 0; i < 8; i++) {
        input.mouse_buttons[i]         = IsMouseButtonDown(i);
        input.mouse_buttons_pressed[i] = IsMouseButtonPressed(i);
    }

    input.gamepads.clear();
    for (int i = 0; i < 16; i++) {
        if (!IsRealGamepad(i)) continue;
        GamepadState gp;
        gp.id = i;
        const int axis_count = GetGamepadAxisCount(i);
        for (int a = 0; a < 8 && a < axis_count; a++) gp.axes[a] = GetGamepadAxisMovement(i, a);
        for (int b = 0; b < 32; b++) {
            gp.buttons[b]         = IsGamepadButtonDown(i, b);
            gp.buttons_pressed[b] = IsGamepadButtonPressed(i, b);
        }
        input.gamepads.push_back(gp);
    }
}
