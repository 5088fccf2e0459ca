#include "scene.hpp"
#include "components.hpp"
#include <ecs/modules/transform.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static ecs::Vec2 parse_vec2(const json& j) {
    return {j[0].get<float>(), j[1].get<float>()};
}

static Color4 parse_color4(const json& j) {
    return {j[0].get<float>(), j[1].get<float>(), j[2].get<float>(), j[3].get<float>()};
}

static ShapeType parse_shape(const std::string& s) {
    if (s == "Box")     return ShapeType::Box;
    if (s == "Circle")  return ShapeType::Circle;
    if (s == "Ellipse") return ShapeType::Ellipse;
    throw std::runtime_error("SceneLoader: unknown shape '" + s + "'");
}

static BodyType parse_body_type(const std::string& s) {
    if (s == "Static")    return BodyType::Static;
    if (s == "Dynamic")   return BodyType::Dynamic;
    if (s == "Kinematic") return BodyType::Kinematic;
    throw std::runtime_error("SceneLoader: unknown body type '" + s + "'");
}

static ControlConstants parse_control(const json& c) {
    ControlConstants k;
    k.default_damping       = c.value("default_damping",       k.default_damping);
    k.stabilisation_damping = c.value("stabilisation_damping", k.stabilisation_damping);
    k.impulse_value         = c.value("impulse_value",         k.impulse_value);
    k.force_value           = c.value("force_value",           k.force_value);
    k.acceleration_value    = c.value("acceleration_value",    k.acceleration_value);
    k.impulse_cooldown      = c.value("impulse_cooldown",      k.impulse_cooldown);
    k.impulse_heat          = c.value("impulse_heat",          k.impulse_heat);
    k.force_heat            = c.value("force_heat",            k.force_heat);
    k.body_radius           = c.value("body_radius",           k.body_radius);
    if (c.contains("cold_color")) k.cold_color = parse_color4(c["cold_color"]);
    if (c.contains("hot_color"))  k.hot_color  = parse_color4(c["hot_color"]);

    if (k.impulse_cooldown < 0.0f)
        throw std::runtime_error("SceneLoader: impulse_cooldown must not be negative");
    return k;
}

// ---------------------------------------------------------------------------
// Entity spawning
// ---------------------------------------------------------------------------

static void spawn_entity(ecs::World& world, const json& e, const ControlConstants& k) {
    auto ent = world.create();

    // 1. LocalTransform + WorldTransform (must precede physics hooks).
    //    The arena lives on the XY plane; "angle" rotates about Z (radians).
    if (e.contains("transform")) {
        const auto& t = e["transform"];
        ecs::Vec2 pos   = t.contains("position") ? parse_vec2(t["position"]) : ecs::Vec2{0, 0};
        float     angle = t.value("angle", 0.0f);
        ecs::Quat rot   = {0.0f, 0.0f, std::sin(0.5f * angle), std::cos(0.5f * angle)};
        world.add(ent, ecs::LocalTransform{{pos.x, pos.y, 0.0f}, rot, {1, 1, 1}});
        world.add(ent, ecs::WorldTransform{});
    }

    // 2. Colliders (must precede RigidBodyConfig so PhysicsSystem can read them)
    if (e.contains("box_collider")) {
        world.add(ent, BoxCollider{parse_vec2(e["box_collider"]["half_extents"])});
    }
    if (e.contains("circle_collider")) {
        world.add(ent, CircleCollider{e["circle_collider"]["radius"].get<float>()});
    }

    // 3. Visual representation
    if (e.contains("mesh")) {
        const auto& m = e["mesh"];
        MeshRenderer mesh;
        mesh.shape = parse_shape(m.value("shape", std::string("Box")));
        if (m.contains("color")) mesh.color = parse_color4(m["color"]);
        if (m.contains("size"))  mesh.size  = parse_vec2(m["size"]);
        world.add(ent, mesh);
    }

    // 4. Physics (triggers the on_add lifecycle hook — added after colliders)
    if (e.contains("rigid_body")) {
        const auto& rb = e["rigid_body"];
        RigidBodyConfig cfg;
        cfg.type           = parse_body_type(rb.value("type", std::string("Dynamic")));
        cfg.mass           = rb.value("mass",           1.0f);
        cfg.friction       = rb.value("friction",       0.5f);
        cfg.restitution    = rb.value("restitution",    0.0f);
        cfg.linear_damping = rb.value("linear_damping", 0.0f);
        cfg.gravity_scale  = rb.value("gravity_scale",  1.0f);
        cfg.ccd            = rb.value("ccd",            false);
        world.add(ent, std::move(cfg));
    }

    // 5. Tags and player-specific components
    if (e.contains("tags")) {
        for (const auto& tag : e["tags"]) {
            const std::string t = tag.get<std::string>();
            if (t == "World")  world.add(ent, WorldTag{});
            if (t == "Player") {
                ControlBody body;
                body.damping = k.default_damping;
                world.add(ent, PlayerTag{});
                world.add(ent, PlayerInput{});
                world.add(ent, body);
            }
        }
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool SceneLoader::load_from_string(ecs::World& world, const std::string& json_str) {
    try {
        json scene = json::parse(json_str);

        ControlConstants k;
        if (auto* existing = world.try_resource<ControlConstants>()) k = *existing;
        if (scene.contains("control")) {
            k = parse_control(scene["control"]);
            world.set_resource(k);
            world.set_resource(PlayerController{Cooldown{k.impulse_cooldown}});
        }

        for (const auto& entity_json : scene.at("entities")) {
            spawn_entity(world, entity_json, k);
        }
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool SceneLoader::load(ecs::World& world, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(world, content);
}

void SceneLoader::unload(ecs::World& world) {
    std::vector<ecs::Entity> to_destroy;
    world.each<WorldTag>([&](ecs::Entity e, WorldTag&) { to_destroy.push_back(e); });
    for (auto e : to_destroy) world.destroy(e);
    world.deferred().flush(world);
}
