#include "control.hpp"
#include "../math_util.hpp"

using namespace ecs;
using namespace puck::math;

void ControlSystem::Register(World& world) {
    // SceneLoader replaces both when the scene carries a "control" block.
    if (!world.try_resource<ControlConstants>()) {
        world.set_resource(ControlConstants{});
    }
    if (!world.try_resource<PlayerController>()) {
        const float cooldown_s = world.resource<ControlConstants>().impulse_cooldown;
        world.set_resource(PlayerController{Cooldown{cooldown_s}});
    }
}

void ControlSystem::step(float dt, const std::vector<InputEvent>& events,
                         const ControlConstants& k, Cooldown& impulse_cooldown,
                         const std::vector<ControlBody*>& bodies,
                         std::vector<ActuationEvent>& applied) {
    // A force from the previous tick must not linger once its input stops.
    for (auto* b : bodies) b->force = {0, 0};

    impulse_cooldown.tick(dt);

    for (const auto& ev : events) {
        switch (ev.kind) {
            case InputEvent::Kind::Impulse: {
                if (is_zero(ev.direction)) break;
                if (!impulse_cooldown.ready()) break;
                impulse_cooldown.start();

                const ecs::Vec2 impulse = scale(ev.direction, k.impulse_value);
                for (auto* b : bodies) {
                    b->damping         = k.default_damping;
                    b->impulse         = impulse;
                    b->impulse_pending = true;
                    b->heat.inc(k.impulse_heat);
                }
                applied.push_back({ev.kind, ev.direction});
                break;
            }
            case InputEvent::Kind::Stabilisation: {
                for (auto* b : bodies) {
                    b->damping = k.stabilisation_damping;
                    b->heat.inc(-1.0f);
                }
                applied.push_back({ev.kind, {0, 0}});
                break;
            }
            case InputEvent::Kind::Accelerate: {
                if (!impulse_cooldown.ready()) break;
                impulse_cooldown.start();

                for (auto* b : bodies) {
                    b->impulse         = scale(b->linear_velocity, k.acceleration_value);
                    b->impulse_pending = true;
                    b->heat.inc(k.impulse_heat);
                }
                applied.push_back({ev.kind, {0, 0}});
                break;
            }
            case InputEvent::Kind::Force: {
                if (is_zero(ev.direction)) break;

                const ecs::Vec2 force = scale(ev.direction, k.force_value);
                for (auto* b : bodies) {
                    b->damping = k.default_damping;
                    b->force   = force;
                    b->heat.inc(k.force_heat);
                }
                applied.push_back({ev.kind, ev.direction});
                break;
            }
        }
    }
}

void ControlSystem::Update(World& world, float dt) {
    auto* input  = world.try_resource<Events<InputEvent>>();
    auto* ctrl   = world.try_resource<PlayerController>();
    auto* consts = world.try_resource<ControlConstants>();
    if (!input || !ctrl || !consts) return;

    std::vector<ControlBody*> bodies;
    world.each<PlayerTag, ControlBody>([&](Entity, PlayerTag&, ControlBody& b) {
        bodies.push_back(&b);
    });

    std::vector<ActuationEvent> applied;
    step(dt, input->read(), *consts, ctrl->impulse_cooldown, bodies, applied);

    if (auto* out = world.try_resource<Events<ActuationEvent>>()) {
        for (const auto& ev : applied) out->send(ev);
    }
}
