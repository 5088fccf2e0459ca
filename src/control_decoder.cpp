#include "control_decoder.hpp"
#include "math_util.hpp"

using namespace puck::math;

ecs::Vec2 ControlDecoder::keyboard_direction(const RawControls& c) {
    ecs::Vec2 dir = {0, 0};
    if (c.up)    dir.y += 1.0f;
    if (c.down)  dir.y -= 1.0f;
    if (c.left)  dir.x -= 1.0f;
    if (c.right) dir.x += 1.0f;
    return normalize_or_zero(dir);
}

void ControlDecoder::decode(const RawControls& prev, const RawControls& cur,
                            std::vector<InputEvent>& out) {
    // 1. Gamepads: south press brakes, south release fires along the stick.
    for (int i = 0; i < RawControls::kMaxPads; i++) {
        if (!cur.pad_connected[i]) continue;

        // A pad that just connected has no previous frame to compare against.
        bool was_down = prev.pad_connected[i] && prev.pad_south[i];
        bool is_down  = cur.pad_south[i];

        if (is_down && !was_down) {
            out.push_back(InputEvent::stabilisation());
        }
        if (!is_down && was_down) {
            ecs::Vec2 dir = normalize_or_zero(cur.pad_stick[i]);
            if (!is_zero(dir)) out.push_back(InputEvent::impulse(dir));
        }
    }

    // 2. Keyboard
    if (cur.boost && !prev.boost) {
        out.push_back(InputEvent::accelerate());
    }
    if (cur.brake && !prev.brake) {
        out.push_back(InputEvent::stabilisation());
    }

    ecs::Vec2 dir = keyboard_direction(cur);
    if (!cur.brake && prev.brake && !is_zero(dir)) {
        out.push_back(InputEvent::impulse(dir));
    }
    // Steering thrust only while the brake/charge gesture is not held.
    if (!cur.brake && !is_zero(dir)) {
        out.push_back(InputEvent::force(dir));
    }
}
