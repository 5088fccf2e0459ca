#pragma once
#include "cooldown.hpp"
#include "math_util.hpp"
#include <ecs/ecs.hpp>
#include <algorithm>

// Engine-library free: no Jolt or raylib headers here, so the control core
// and the scene loader build in the headless test target.

// ---------------------------------------------------------------------------
// Visuals
// ---------------------------------------------------------------------------

struct Color4 {
    float r = 1.0f, g = 1.0f, b = 1.0f, a = 1.0f;
};

namespace Colors {
    inline constexpr Color4 White  = {1.0f,  1.0f,  1.0f,  1.0f};
    inline constexpr Color4 Orange = {1.0f,  0.63f, 0.0f,  1.0f};
    inline constexpr Color4 Red    = {0.9f,  0.16f, 0.22f, 1.0f};
    inline constexpr Color4 Yellow = {1.0f,  1.0f,  0.0f,  1.0f};
    inline constexpr Color4 Gray   = {0.5f,  0.5f,  0.5f,  1.0f};
}

enum class ShapeType { Box, Circle, Ellipse };

struct MeshRenderer {
    ShapeType shape = ShapeType::Box;
    Color4    color = Colors::White;
    ecs::Vec2 size  = {0.5f, 0.5f}; // half extents (Box) or radii (Circle uses x)
};

// ---------------------------------------------------------------------------
// Physics Configuration (Authoring)
// ---------------------------------------------------------------------------

enum class BodyType { Static, Kinematic, Dynamic };

struct BoxCollider {
    ecs::Vec2 half_extents = {0.5f, 0.5f};
};

struct CircleCollider {
    float radius = 0.5f;
};

// If present, PhysicsSystem creates a Jolt body for this entity, constrained
// to the XY plane.
struct RigidBodyConfig {
    BodyType type          = BodyType::Dynamic;
    float    mass          = 1.0f;
    float    friction      = 0.5f;
    float    restitution   = 0.0f;
    float    linear_damping = 0.0f;
    float    gravity_scale = 1.0f;
    bool     ccd           = false;
};

// ---------------------------------------------------------------------------
// Control
// ---------------------------------------------------------------------------

// Tuning constants for the control step. Loaded from the scene's "control"
// block; members keep their defaults when a key is absent.
struct ControlConstants {
    float default_damping       = 1.0f;
    float stabilisation_damping = 6.0f;
    float impulse_value         = 15.0f;
    float force_value           = 6.0f;
    float acceleration_value    = 0.3f;
    float impulse_cooldown      = 0.5f;  // seconds, shared by Impulse and Accelerate
    float impulse_heat          = 0.2f;
    float force_heat            = 0.01f;
    float body_radius           = 0.3f;  // anchor offset for cosmetic bursts
    Color4 cold_color           = Colors::Orange;
    Color4 hot_color            = Colors::Red;
};

struct HeatState {
    float amount = 0.0f;

    void inc(float delta) { amount = std::clamp(amount + delta, 0.0f, 1.0f); }
};

inline Color4 heat_color(const Color4& cold, const Color4& hot, float amount) {
    using puck::math::lerp;
    return {lerp(cold.r, hot.r, amount), lerp(cold.g, hot.g, amount),
            lerp(cold.b, hot.b, amount), lerp(cold.a, hot.a, amount)};
}

// Actuation target. linear_velocity is written back by PhysicsSystem after
// each step; everything else is written by ControlSystem and applied by
// PhysicsSystem before the next step.
struct ControlBody {
    ecs::Vec2 linear_velocity = {0, 0};
    float     damping         = 1.0f;
    ecs::Vec2 impulse         = {0, 0};
    bool      impulse_pending = false;   // one-shot; PhysicsSystem consumes it
    ecs::Vec2 force           = {0, 0};  // persistent until the next control step
    HeatState heat;
};

// World resource: the player's controller. One cooldown gates both
// Impulse and Accelerate so the two cannot be chained.
struct PlayerController {
    Cooldown impulse_cooldown{ControlConstants{}.impulse_cooldown};
};

// ---------------------------------------------------------------------------
// Gameplay / Input
// ---------------------------------------------------------------------------

// Raw control state for one frame, already reduced from device state.
struct RawControls {
    // Keyboard
    bool up = false, down = false, left = false, right = false;
    bool brake = false;   // Space: press = stabilise, release = fire impulse
    bool boost = false;   // A: press = accelerate

    // Gamepads (index = pad slot)
    static constexpr int kMaxPads = 4;
    bool      pad_connected[kMaxPads] = {false};
    bool      pad_south[kMaxPads]     = {false};
    ecs::Vec2 pad_stick[kMaxPads]     = {};
};

struct PlayerInput {
    RawControls previous;
    RawControls current;
};

// Short-lived cosmetic burst; aged and destroyed by EffectSystem.
struct EffectBurst {
    enum class Kind { Explosion, Propulsor, Impact };

    Kind      kind     = Kind::Explosion;
    ecs::Vec2 position = {0, 0};
    float     age      = 0.0f;
    float     lifetime = 0.5f;
    float     radius   = 0.25f;  // final ring radius in metres
};

struct PlayerTag {};
struct WorldTag {};
