#pragma once
#include "../pipeline.hpp"
#include "../systems/effects.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// EffectsModule
//
// Adds EffectSystem to the Post-Update phase, where it sees this frame's
// ActuationEvents (Logic) and CollisionEvents (Physics) before the next
// flush. Install after ControlModule and PhysicsModule have registered
// those queues.
// ---------------------------------------------------------------------------

struct EffectsModule {
    static void install(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_post_update([](ecs::World& w, float dt) { EffectSystem::Update(w, dt); });
    }
};
