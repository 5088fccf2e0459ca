#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// DebugSystem — Render-phase system; drives the debug overlay.
//
// No Register() — no lifecycle hooks. Must run between RenderSystem::Begin
// and RenderSystem::Present. Toggle visibility with F3.
// ---------------------------------------------------------------------------

class DebugSystem {
public:
    static void Update(ecs::World& world, float dt);
};
