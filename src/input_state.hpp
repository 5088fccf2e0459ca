#pragma once
#include <vector>

// Raw device snapshot for one frame, filled by InputGatherSystem.
// Indices are raylib key / gamepad button / axis codes.

struct GamepadState {
    int id = -1;
    bool connected = false;
    float axes[8] = {0};
    bool buttons[32] = {false};
};

struct InputRecord {
    // Keyboard
    bool keys_down[512] = {false};
    bool keys_pressed[512] = {false};

    // Gamepads (Filtered/Real only)
    std::vector<GamepadState> gamepads;
};
