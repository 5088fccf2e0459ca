#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../pipeline.hpp"
#include "../systems/control.hpp"
#include "../math_util.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// ControlModule
//
// Creates the ControlConstants / PlayerController resources (defaults until
// a scene overrides them), registers Events<ActuationEvent>, adds
// ControlSystem to the Logic phase and the "Control" debug rows.
//
// Install after InputModule: ControlSystem consumes the InputEvents that
// PlayerInputSystem emits earlier in the same frame.
// ---------------------------------------------------------------------------

struct ControlModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        ControlSystem::Register(world);
        world.resource<EventRegistry>().register_queue<ActuationEvent>(world);

        pipeline.add_logic([](ecs::World& w, float dt) { ControlSystem::Update(w, dt); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Control", "Heat", [&world]() {
                std::string r = "-";
                world.each<PlayerTag, ControlBody>([&](ecs::Entity, PlayerTag&, ControlBody& b) {
                    char buf[16];
                    std::snprintf(buf, sizeof(buf), "%.2f", b.heat.amount);
                    r = buf;
                });
                return r;
            });
            panel->watch("Control", "Cooldown", [&world]() {
                auto* ctrl = world.try_resource<PlayerController>();
                if (!ctrl) return std::string("-");
                if (ctrl->impulse_cooldown.ready()) return std::string("ready");
                char buf[16];
                std::snprintf(buf, sizeof(buf), "%.2f s", ctrl->impulse_cooldown.remaining());
                return std::string(buf);
            });
            panel->watch("Control", "Damping", [&world]() {
                std::string r = "-";
                world.each<PlayerTag, ControlBody>([&](ecs::Entity, PlayerTag&, ControlBody& b) {
                    char buf[16];
                    std::snprintf(buf, sizeof(buf), "%.1f", b.damping);
                    r = buf;
                });
                return r;
            });
            panel->watch("Control", "Speed", [&world]() {
                std::string r = "-";
                world.each<PlayerTag, ControlBody>([&](ecs::Entity, PlayerTag&, ControlBody& b) {
                    char buf[16];
                    std::snprintf(buf, sizeof(buf), "%.2f m/s", puck::math::length(b.linear_velocity));
                    r = buf;
                });
                return r;
            });
        }
    }
};
