#include "player_input.hpp"
#include "../components.hpp"
#include "../input_state.hpp"
#include <raylib.h>
#include <cmath>

using namespace ecs;

static constexpr float kStickDeadzone = 0.15f;
static constexpr int   kJumpKey       = KEY_SPACE;
static constexpr int   kJumpButton    = GAMEPAD_BUTTON_RIGHT_FACE_DOWN;

static float stick(float value) {
    return std::abs(value) > kStickDeadzone ? value : 0.0f;
}

static void read_keyboard(const InputRecord& record, PlayerInput& input) {
    input.move_input.y += (record.keys_down[KEY_W] ? 1.0f : 0.0f) - (record.keys_down[KEY_S] ? 1.0f : 0.0f);
    input.move_input.x += (record.keys_down[KEY_D] ? 1.0f : 0.0f) - (record.keys_down[KEY_A] ? 1.0f : 0.0f);

    input.jump_pressed = input.jump_pressed || record.keys_pressed[kJumpKey];
    input.jump_held    = input.jump_held    || record.keys_down[kJumpKey];
}

static void read_gamepad(const GamepadState& gp, PlayerInput& input) {
    input.move_input.x += stick(gp.axes[GAMEPAD_AXIS_LEFT_X]);
    input.move_input.y -= stick(gp.axes[GAMEPAD_AXIS_LEFT_Y]); // stick up is negative

    input.jump_pressed = input.jump_pressed || gp.buttons_pressed[kJumpButton];
    input.jump_held    = input.jump_held    || gp.buttons[kJumpButton];
}

void PlayerInputSystem::Update(World& world) {
    const auto* record = world.try_resource<InputRecord>();
    if (!record) return;

    world.single<PlayerInput>([&](Entity, PlayerInput& input) {
        // Per-frame fields only; the view directions persist
        input.move_input   = {0, 0};
        input.jump_pressed = false;
        input.jump_held    = false;

        read_keyboard(*record, input);
        for (const auto& gp : record->gamepads) read_gamepad(gp, input);

        const float mag_sq = input.move_input.x * input.move_input.x +
                             input.move_input.y * input.move_input.y;
        if (mag_sq > 1.0f) {
            const float mag = std::sqrt(mag_sq);
            input.move_input.x /= mag;
            input.move_input.y /= mag;
        }
    });
}
