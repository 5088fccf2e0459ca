#pragma once
#include <ecs/ecs.hpp>

// Reduces the InputRecord to RawControls on each player, runs ControlDecoder
// against the previous frame and sends the result to Events<InputEvent>.
// Runs in Pre-Update, after InputGatherSystem.
class PlayerInputSystem {
public:
    static void Update(ecs::World& world);
};
