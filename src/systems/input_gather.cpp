#include "input_gather.hpp"
#include "../input_state.hpp"
#include <raylib.h>
#include <cstring>

static constexpr int kMaxGamepadSlots = 16;
static constexpr int kMaxAxes         = 8;
static constexpr int kMaxButtons      = 32;

// Device names Linux reports as joysticks that are not gamepads.
static const char* const kNotGamepads[] = {
    "Keyboard", "Mouse", "Trackpad", "Touchpad", "Accelerometer", "Sensor",
    "Mic", "Headset", "Speaker", "HDA Intel", "Video", "SMC",
    "Power Button", "Consumer Control", "System Control",
};

static bool looks_like_gamepad(int slot) {
    if (!IsGamepadAvailable(slot) || GetGamepadAxisCount(slot) < 4) return false;

    const char* name = GetGamepadName(slot);
    if (!name) return false;
    for (const char* bad : kNotGamepads) {
        if (std::strstr(name, bad)) return false;
    }
    return true;
}

static GamepadState sample_gamepad(int slot) {
    GamepadState gp;
    gp.id = slot;

    const int axes = GetGamepadAxisCount(slot);
    for (int a = 0; a < kMaxAxes && a < axes; ++a) gp.axes[a] = GetGamepadAxisMovement(slot, a);

    for (int b = 0; b < kMaxButtons; ++b) {
        gp.buttons[b]         = IsGamepadButtonDown(slot, b);
        gp.buttons_pressed[b] = IsGamepadButtonPressed(slot, b);
    }
    return gp;
}

void InputGatherSystem::Update(ecs::World& world) {
    if (!world.try_resource<InputRecord>()) world.set_resource(InputRecord{});
    auto& record = world.resource<InputRecord>();

    for (int key = 0; key < InputRecord::kKeyCount; ++key) {
        record.keys_down[key]    = IsKeyDown(key);
        record.keys_pressed[key] = IsKeyPressed(key);
    }

    const std::size_t had = record.gamepads.size();
    record.gamepads.clear();
    for (int slot = 0; slot < kMaxGamepadSlots; ++slot) {
        if (looks_like_gamepad(slot)) record.gamepads.push_back(sample_gamepad(slot));
    }

    if (record.gamepads.size() != had) {
        TraceLog(LOG_INFO, "INPUT: %d gamepad(s) connected", static_cast<int>(record.gamepads.size()));
    }
}
