#include "player_input.hpp"
#include "../components.hpp"
#include "../config.hpp"
#include "../input_state.hpp"
#include <cmath>

using namespace ecs;

void PlayerInputSystem::Update(World& world) {
    const auto* record_ptr = world.try_resource<InputRecord>();
    const auto* config_ptr = world.try_resource<ControllerConfig>();
    if (!record_ptr || !config_ptr) return;
    const auto& record   = *record_ptr;
    const auto& settings = config_ptr->input;

    world.each<PlayerTag, PlayerInput>([&](Entity, PlayerTag&, PlayerInput& input) {
        input.move            = {0, 0};
        input.look            = {0, 0};
        input.analog_movement = false;
        input.look_device     = LookDevice::Pointer;

        // 1. Keyboard / mouse
        if (record.keys_down[KEY_W]) input.move.y += 1.0f;
        if (record.keys_down[KEY_S]) input.move.y -= 1.0f;
        if (record.keys_down[KEY_A]) input.move.x -= 1.0f;
        if (record.keys_down[KEY_D]) input.move.x += 1.0f;

        bool jump_pressed = record.keys_pressed[KEY_SPACE];
        bool jump_down    = record.keys_down[KEY_SPACE];
        bool sprint       = record.keys_down[KEY_LEFT_SHIFT];
        bool switch_down  = record.key_down(settings.switch_view_key);

        if (record.cursor_locked) {
            input.look.x = record.mouse_delta.x * settings.mouse_sensitivity;
            input.look.y = record.mouse_delta.y * settings.mouse_sensitivity;
        }

        // 2. Gamepads (a deflected stick overrides the keyboard/mouse axis)
        const float deadzone = settings.stick_deadzone;
        for (const auto& gp : record.gamepads) {
            const float lx = gp.axes[GAMEPAD_AXIS_LEFT_X];
            const float ly = gp.axes[GAMEPAD_AXIS_LEFT_Y];
            const float rx = gp.axes[GAMEPAD_AXIS_RIGHT_X];
            const float ry = gp.axes[GAMEPAD_AXIS_RIGHT_Y];

            if (std::abs(lx) > deadzone || std::abs(ly) > deadzone) {
                input.move            = {lx, -ly};
                input.analog_movement = true;
            }
            if (std::abs(rx) > deadzone || std::abs(ry) > deadzone) {
                input.look        = {rx * settings.stick_look_rate, ry * settings.stick_look_rate};
                input.look_device = LookDevice::Rate;
            }

            jump_pressed |= gp.buttons_pressed[GAMEPAD_BUTTON_RIGHT_FACE_DOWN];
            jump_down    |= gp.buttons[GAMEPAD_BUTTON_RIGHT_FACE_DOWN];
            sprint       |= gp.buttons[GAMEPAD_BUTTON_LEFT_THUMB];
            switch_down  |= gp.buttons[GAMEPAD_BUTTON_RIGHT_FACE_UP];
        }

        // 3. Clamp to the unit disc
        const float mag_sq = input.move.x * input.move.x + input.move.y * input.move.y;
        if (mag_sq > 1.0f) {
            const float mag = std::sqrt(mag_sq);
            input.move.x /= mag;
            input.move.y /= mag;
        }

        // Jump is latched: a press sets it, a release clears it. The vertical
        // integrator also clears it while airborne.
        if (jump_pressed)    input.jump = true;
        else if (!jump_down) input.jump = false;

        input.sprint           = sprint;
        input.switch_view_down = switch_down;
    });
}
