#include "renderer.hpp"
#include "../components.hpp"
#include "../math_util.hpp"
#include <ecs/modules/transform.hpp>
#include <raylib.h>
#include <algorithm>

using namespace ecs;

// Convert our engine Color4 to Raylib's Color at draw time.
static inline Color to_raylib(const Color4& c) {
    return Color{
        static_cast<unsigned char>(std::clamp(c.r, 0.0f, 1.0f) * 255.0f),
        static_cast<unsigned char>(std::clamp(c.g, 0.0f, 1.0f) * 255.0f),
        static_cast<unsigned char>(std::clamp(c.b, 0.0f, 1.0f) * 255.0f),
        static_cast<unsigned char>(std::clamp(c.a, 0.0f, 1.0f) * 255.0f),
    };
}

static inline Vector2 to_screen(float x, float y) {
    return {GetScreenWidth()  * 0.5f + x * RenderSystem::PIXELS_PER_METRE,
            GetScreenHeight() * 0.5f - y * RenderSystem::PIXELS_PER_METRE};
}

static Color4 burst_color(EffectBurst::Kind kind, float t) {
    using puck::math::lerp;
    switch (kind) {
        case EffectBurst::Kind::Explosion:
            // yellow -> transparent red
            return {1.0f, lerp(1.0f, 0.0f, t), 0.0f, 1.0f - t};
        case EffectBurst::Kind::Propulsor:
            return {1.0f, lerp(1.0f, 0.0f, t), 0.0f, 1.0f - t};
        case EffectBurst::Kind::Impact:
            return {lerp(0.5f, 0.0f, t), lerp(0.5f, 0.0f, t), lerp(0.5f, 0.0f, t), 1.0f - t};
    }
    return Colors::White;
}

void RenderSystem::Begin(World& /*world*/) {
    BeginDrawing();
    ClearBackground({35, 35, 40, 255});
}

void RenderSystem::Present(World& /*world*/) {
    EndDrawing();
}

void RenderSystem::Update(World& world) {
    const auto* k = world.try_resource<ControlConstants>();

    // 1. Meshes
    world.each<LocalTransform, MeshRenderer>([&](Entity e, LocalTransform& lt, MeshRenderer& mesh) {
        Color4 color = mesh.color;
        if (k) {
            if (auto* body = world.try_get<ControlBody>(e)) {
                color = heat_color(k->cold_color, k->hot_color, body->heat.amount);
            }
        }
        const Color   c = to_raylib(color);
        const Vector2 p = to_screen(lt.position.x, lt.position.y);
        const float   sx = mesh.size.x * PIXELS_PER_METRE;
        const float   sy = mesh.size.y * PIXELS_PER_METRE;

        switch (mesh.shape) {
            case ShapeType::Box:
                DrawRectangleV({p.x - sx, p.y - sy}, {2.0f * sx, 2.0f * sy}, c);
                break;
            case ShapeType::Circle:
                DrawCircleV(p, sx, c);
                break;
            case ShapeType::Ellipse:
                DrawEllipse(static_cast<int>(p.x), static_cast<int>(p.y), sx, sy, c);
                break;
        }
    });

    // 2. Bursts — expanding rings that fade over their lifetime
    world.each<EffectBurst>([&](Entity, EffectBurst& b) {
        const float t = b.lifetime > 0.0f ? std::clamp(b.age / b.lifetime, 0.0f, 1.0f) : 1.0f;
        const float r = puck::math::lerp(0.2f, 1.0f, t) * b.radius * PIXELS_PER_METRE;
        DrawCircleLinesV(to_screen(b.position.x, b.position.y), r, to_raylib(burst_color(b.kind, t)));
    });

    DrawText("Arrows: steer   Space: brake / release to dash   A: boost   R: reset   F3: debug",
             10, GetScreenHeight() - 22, 12, {160, 160, 160, 255});
}
