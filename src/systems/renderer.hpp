#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderSystem — Render phase; draws the arena top-down.
//
// World metres map to screen pixels at PIXELS_PER_METRE, y up, origin at the
// window centre. Player meshes take their colour from heat.
//
// Begin() opens the frame and Present() closes it; every other Render-phase
// system (DebugSystem) draws between the two.
// ---------------------------------------------------------------------------

class RenderSystem {
public:
    static constexpr float PIXELS_PER_METRE = 100.0f;

    static void Begin(ecs::World& world);
    static void Update(ecs::World& world);
    static void Present(ecs::World& world);
};
