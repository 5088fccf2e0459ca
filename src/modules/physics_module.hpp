#pragma once
#include "../events.hpp"
#include "../physics_context.hpp"
#include "../pipeline.hpp"
#include "../systems/physics.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform_propagation.hpp>
#include <memory>

// ---------------------------------------------------------------------------
// PhysicsModule
//
// Initialises Jolt's allocator, creates the PhysicsContext world resource,
// registers Events<CollisionEvent>, installs PhysicsSystem lifecycle hooks
// (on_add/on_remove) and wires the fixed-step update + transform propagation
// into the Physics phase.
//
// Install before the scene is loaded so the on_add hook creates bodies.
// ---------------------------------------------------------------------------

struct PhysicsModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        PhysicsContext::InitJoltAllocator();
        world.set_resource(std::make_shared<PhysicsContext>());
        world.resource<EventRegistry>().register_queue<CollisionEvent>(world);
        PhysicsSystem::Register(world);
        pipeline.add_physics([](ecs::World& w, float dt) {
            PhysicsSystem::Update(w, dt);
            ecs::propagate_transforms(w);
        });
    }
};
