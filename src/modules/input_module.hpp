#pragma once
#include "../events.hpp"
#include "../input_event.hpp"
#include "../input_state.hpp"
#include "../pipeline.hpp"
#include "../systems/input_gather.hpp"
#include "../systems/player_input.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputModule
//
// Registers the Events<InputEvent> queue (PlayerInputSystem is its emitter)
// and adds InputGatherSystem then PlayerInputSystem to the Pre-Update phase,
// after the EventBus flush.
// ---------------------------------------------------------------------------

struct InputModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(InputRecord{});
        world.resource<EventRegistry>().register_queue<InputEvent>(world);

        pipeline.add_pre_update([](ecs::World& w, float) { InputGatherSystem::Update(w); });
        pipeline.add_pre_update([](ecs::World& w, float) { PlayerInputSystem::Update(w); });
    }
};
