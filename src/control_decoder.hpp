#pragma once
#include "components.hpp"
#include "input_event.hpp"
#include <vector>

// ---------------------------------------------------------------------------
// ControlDecoder — turns two consecutive RawControls frames into the ordered
// InputEvent sequence for the current frame.
//
// Pure edge detection (press = up->down, release = down->up); no device or
// engine dependency. Order within a frame: gamepads (slot order), then
// keyboard Accelerate, Stabilisation, Impulse, Force.
// ---------------------------------------------------------------------------

class ControlDecoder {
public:
    static void decode(const RawControls& previous, const RawControls& current,
                       std::vector<InputEvent>& out);

    // Vector sum of the held arrow keys, normalised; (0,0) when they cancel.
    static ecs::Vec2 keyboard_direction(const RawControls& controls);
};
