#pragma once
#include <vector>

// ---------------------------------------------------------------------------
// InputRecord: this frame's raw device snapshot (World resource).
//
// InputGatherSystem fills it at the start of Pre-Update and
// PlayerInputSystem turns it into PlayerInput. Indices are raylib key,
// axis and button codes, but no raylib type appears here.
// ---------------------------------------------------------------------------

struct GamepadState {
    int   id                      = -1;
    float axes[8]                 = {};
    bool  buttons[32]             = {};
    bool  buttons_pressed[32]     = {};
};

struct InputRecord {
    static constexpr int kKeyCount = 512;

    bool keys_down[kKeyCount]    = {};
    bool keys_pressed[kKeyCount] = {};

    // Only devices that pass the gamepad name/axis check
    std::vector<GamepadState> gamepads;
};
