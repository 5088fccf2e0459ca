#pragma once
#include <ecs/ecs.hpp>
#include "../components.hpp"
#include "../events.hpp"
#include "../input_event.hpp"
#include <vector>

// Turns this frame's InputEvents into actuation requests on every player
// ControlBody and updates heat. Runs in the Logic phase; PhysicsSystem
// applies the requests on the following fixed steps.
class ControlSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);

    // Pure control step — no Jolt dependency. Exposed for unit testing.
    // Clears every body's persistent force, ticks the shared cooldown, then
    // applies events in order. Events that were applied (not dropped by the
    // cooldown) are appended to `applied`.
    static void step(float dt, const std::vector<InputEvent>& events,
                     const ControlConstants& k, Cooldown& impulse_cooldown,
                     const std::vector<ControlBody*>& bodies,
                     std::vector<ActuationEvent>& applied);
};
