#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// PhysicsSystem — owns the Jolt side of every RigidBodyConfig entity.
//
// Register(): on_add<RigidBodyConfig> creates a body constrained to the XY
// plane; on_remove<RigidBodyHandle> destroys it.
// Update() (fixed step): applies ControlBody actuation (damping, one-shot
// impulse, persistent force), steps Jolt, syncs dynamic transforms, writes
// linear velocity back to ControlBody and forwards contacts as
// CollisionEvents.
// ---------------------------------------------------------------------------

class PhysicsSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);
};
