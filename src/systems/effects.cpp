#include "effects.hpp"
#include "../math_util.hpp"
#include <ecs/modules/transform.hpp>
#include <vector>

using namespace ecs;
using namespace puck::math;

bool EffectSystem::burst_for(const ActuationEvent& ev, ecs::Vec2 body_pos,
                             float body_radius, EffectBurst& out) {
    switch (ev.kind) {
        case InputEvent::Kind::Impulse:
            out = {EffectBurst::Kind::Explosion,
                   add(body_pos, scale(ev.direction, -body_radius)), 0.0f, 0.5f, 1.0f};
            return true;
        case InputEvent::Kind::Accelerate:
            out = {EffectBurst::Kind::Explosion, body_pos, 0.0f, 0.5f, 1.0f};
            return true;
        case InputEvent::Kind::Force:
            out = {EffectBurst::Kind::Propulsor,
                   add(body_pos, scale(ev.direction, -body_radius)), 0.0f, 0.5f, 0.15f};
            return true;
        case InputEvent::Kind::Stabilisation:
            return false;
    }
    return false;
}

EffectBurst EffectSystem::impact_at(ecs::Vec2 point) {
    return {EffectBurst::Kind::Impact, point, 0.0f, 0.3f, 0.2f};
}

bool EffectSystem::age(EffectBurst& burst, float dt) {
    burst.age += dt;
    return burst.age >= burst.lifetime;
}

void EffectSystem::Update(World& world, float dt) {
    // 1. Age and expire existing bursts (new ones start next frame at age 0)
    std::vector<Entity> expired;
    world.each<EffectBurst>([&](Entity e, EffectBurst& b) {
        if (age(b, dt)) expired.push_back(e);
    });
    for (auto e : expired) world.destroy(e);

    // 2. Spawn
    const float radius = world.try_resource<ControlConstants>()
                           ? world.resource<ControlConstants>().body_radius
                           : ControlConstants{}.body_radius;

    std::vector<ecs::Vec2> players;
    world.each<PlayerTag, LocalTransform>([&](Entity, PlayerTag&, LocalTransform& lt) {
        players.push_back({lt.position.x, lt.position.y});
    });

    if (const auto* evts = world.try_resource<Events<ActuationEvent>>()) {
        for (const auto& ev : evts->read()) {
            for (const auto& pos : players) {
                EffectBurst b;
                if (burst_for(ev, pos, radius, b)) {
                    world.deferred().create_with(b, WorldTag{});
                }
            }
        }
    }

    if (const auto* evts = world.try_resource<Events<CollisionEvent>>()) {
        for (const auto& ev : evts->read()) {
            if (!ev.involves_player) continue;
            world.deferred().create_with(impact_at(ev.point), WorldTag{});
        }
    }
}
