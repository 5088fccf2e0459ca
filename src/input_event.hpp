#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputEvent — semantic control action decoded from raw input.
//
// Produced once per frame by PlayerInputSystem (via ControlDecoder) into
// Events<InputEvent>, consumed in emission order by ControlSystem.
// Impulse and Force always carry a unit direction; the decoder never emits
// them with a zero vector.
// ---------------------------------------------------------------------------

struct InputEvent {
    enum class Kind { Impulse, Force, Stabilisation, Accelerate };

    Kind      kind      = Kind::Stabilisation;
    ecs::Vec2 direction = {0, 0};

    static InputEvent impulse(ecs::Vec2 dir) { return {Kind::Impulse, dir}; }
    static InputEvent force(ecs::Vec2 dir)   { return {Kind::Force, dir}; }
    static InputEvent stabilisation()        { return {Kind::Stabilisation, {0, 0}}; }
    static InputEvent accelerate()           { return {Kind::Accelerate, {0, 0}}; }
};

inline const char* to_string(InputEvent::Kind kind) {
    switch (kind) {
        case InputEvent::Kind::Impulse:       return "Impulse";
        case InputEvent::Kind::Force:         return "Force";
        case InputEvent::Kind::Stabilisation: return "Stabilisation";
        case InputEvent::Kind::Accelerate:    return "Accelerate";
    }
    return "?";
}
