#pragma once
#include <ecs/ecs.hpp>
#include "../components.hpp"
#include "../events.hpp"

// ---------------------------------------------------------------------------
// EffectSystem — Post-Update; spawns cosmetic EffectBursts for applied
// actuations and collisions, ages existing bursts and destroys expired ones.
//
// Runs after the physics steps so CollisionEvents from this frame are seen.
// No engine dependency; RenderSystem draws the bursts.
// ---------------------------------------------------------------------------

class EffectSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Burst for an applied actuation on a body at body_pos. Impulse and
    // Force puffs sit behind the body (opposite the push direction).
    // Returns false for actions without a cosmetic (Stabilisation).
    static bool burst_for(const ActuationEvent& ev, ecs::Vec2 body_pos,
                          float body_radius, EffectBurst& out);

    static EffectBurst impact_at(ecs::Vec2 point);

    // Advance a burst's age; returns true once it has expired.
    static bool age(EffectBurst& burst, float dt);
};
