#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/math_util.hpp"
#include "../src/components.hpp"
#include "../src/events.hpp"
#include "../src/pipeline.hpp"
#include "../src/scene.hpp"
#include "../src/debug_panel.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>
#include <string>
#include <vector>

// scene.cpp, components.hpp and pipeline.hpp have no Jolt or raylib
// dependency, so everything here links against the headless core only.

using namespace puck::math;

TEST_CASE("normalize_or_zero", "[math]") {
    SECTION("Axis-aligned") {
        ecs::Vec2 n = normalize_or_zero({0.0f, -3.0f});
        CHECK_THAT(n.x, Catch::Matchers::WithinAbs(0.0f, 1e-6f));
        CHECK_THAT(n.y, Catch::Matchers::WithinRel(-1.0f));
    }

    SECTION("Diagonal") {
        ecs::Vec2 n = normalize_or_zero({2.0f, 2.0f});
        CHECK_THAT(length(n), Catch::Matchers::WithinRel(1.0f, 1e-5f));
        CHECK_THAT(n.x, Catch::Matchers::WithinRel(n.y));
    }

    SECTION("Zero vector stays zero") {
        ecs::Vec2 n = normalize_or_zero({0.0f, 0.0f});
        CHECK(is_zero(n));
    }
}

TEST_CASE("apply_deadzone", "[math]") {
    CHECK(is_zero(apply_deadzone({0.1f, -0.1f}, 0.15f)));

    ecs::Vec2 v = apply_deadzone({0.1f, 0.6f}, 0.15f);
    CHECK(v.x == 0.1f);   // components are kept once either axis is outside
    CHECK(v.y == 0.6f);
}

TEST_CASE("lerp clamps t", "[math]") {
    CHECK(lerp(2.0f, 4.0f, 0.5f) == 3.0f);
    CHECK(lerp(2.0f, 4.0f, -1.0f) == 2.0f);
    CHECK(lerp(2.0f, 4.0f, 3.0f) == 4.0f);
}

// ---------------------------------------------------------------------------
// Events<T> / EventRegistry
// ---------------------------------------------------------------------------

struct TestEvent { int value; };

TEST_CASE("Events — send and read", "[events]") {
    Events<TestEvent> queue;

    CHECK(queue.empty());
    CHECK(queue.read().empty());

    queue.send({42});
    queue.send({7});

    CHECK_FALSE(queue.empty());
    CHECK(queue.size() == 2);
    REQUIRE(queue.read().size() == 2);
    CHECK(queue.read()[0].value == 42);
    CHECK(queue.read()[1].value == 7);
}

TEST_CASE("Events — clear empties the queue", "[events]") {
    Events<TestEvent> queue;
    queue.send({1});
    queue.send({2});
    queue.clear();

    CHECK(queue.empty());
    CHECK(queue.read().empty());
}

TEST_CASE("Events — clear on empty queue is safe", "[events]") {
    Events<TestEvent> queue;
    queue.clear();

    CHECK(queue.empty());
}

TEST_CASE("EventRegistry — flush_all clears every registered queue", "[events]") {
    ecs::World world;
    EventRegistry registry;
    registry.register_queue<TestEvent>(world);
    registry.register_queue<ActuationEvent>(world);
    CHECK(registry.queue_count() == 2);

    world.resource<Events<TestEvent>>().send({5});
    world.resource<Events<ActuationEvent>>().send({InputEvent::Kind::Stabilisation, {0, 0}});

    registry.flush_all();

    CHECK(world.resource<Events<TestEvent>>().empty());
    CHECK(world.resource<Events<ActuationEvent>>().empty());
}

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

TEST_CASE("Pipeline — fixed steps follow the accumulator", "[pipeline]") {
    ecs::World world;
    ecs::Pipeline pipeline(0.25f);

    int   physics_calls = 0;
    float physics_dt    = 0.0f;
    pipeline.add_physics([&](ecs::World&, float dt) { ++physics_calls; physics_dt = dt; });

    CHECK(pipeline.advance(world, 0.5f) == 2);
    CHECK(physics_calls == 2);
    CHECK(physics_dt == 0.25f);

    // 0.125 carries over; the next 0.125 completes one more step.
    CHECK(pipeline.advance(world, 0.125f) == 0);
    CHECK(pipeline.advance(world, 0.125f) == 1);
}

TEST_CASE("Pipeline — negative dt runs no physics", "[pipeline]") {
    ecs::World world;
    ecs::Pipeline pipeline(0.25f);

    float logic_dt = 1.0f;
    pipeline.add_logic([&](ecs::World&, float dt) { logic_dt = dt; });

    CHECK(pipeline.advance(world, -1.0f) == 0);
    CHECK(logic_dt == 0.0f);
}

TEST_CASE("Pipeline — phases run in order", "[pipeline]") {
    ecs::World world;
    ecs::Pipeline pipeline(0.1f);

    std::vector<std::string> order;
    pipeline.add_post_update([&](ecs::World&, float) { order.push_back("post"); });
    pipeline.add_physics    ([&](ecs::World&, float) { order.push_back("physics"); });
    pipeline.add_logic      ([&](ecs::World&, float) { order.push_back("logic"); });
    pipeline.add_pre_update ([&](ecs::World&, float) { order.push_back("pre"); });

    pipeline.advance(world, 0.1f);

    REQUIRE(order.size() == 4);
    CHECK(order[0] == "pre");
    CHECK(order[1] == "logic");
    CHECK(order[2] == "physics");
    CHECK(order[3] == "post");
}

TEST_CASE("Pipeline — reset_accumulator drops the partial step", "[pipeline]") {
    ecs::World world;
    ecs::Pipeline pipeline(0.25f);

    pipeline.advance(world, 0.2f);
    pipeline.reset_accumulator();
    CHECK(pipeline.advance(world, 0.2f) == 0);
}

// ---------------------------------------------------------------------------
// SceneLoader
// ---------------------------------------------------------------------------

static const char* MINIMAL_SCENE = R"({
  "control": {
    "impulse_value": 20.0,
    "impulse_cooldown": 1.5,
    "default_damping": 2.0
  },
  "entities": [
    {
      "transform": { "position": [1.0, 2.0] },
      "mesh": { "shape": "Box", "color": [0.5, 0.5, 0.5, 1.0], "size": [2.0, 0.1] },
      "box_collider": { "half_extents": [2.0, 0.1] },
      "rigid_body": { "type": "Static", "restitution": 0.9 },
      "tags": ["World"]
    },
    {
      "transform": { "position": [0.0, 0.5] },
      "mesh": { "shape": "Ellipse", "color": [1.0, 0.6, 0.0, 1.0], "size": [0.35, 0.25] },
      "circle_collider": { "radius": 0.3 },
      "rigid_body": { "type": "Dynamic", "mass": 1.0, "gravity_scale": 0.0, "ccd": true },
      "tags": ["Player", "World"]
    }
  ]
})";

TEST_CASE("SceneLoader — correct entity count", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, MINIMAL_SCENE));
    CHECK(world.count() == 2);
}

TEST_CASE("SceneLoader — static entity has correct transform", "[scene]") {
    ecs::World world;
    SceneLoader::load_from_string(world, MINIMAL_SCENE);

    bool found = false;
    world.each<ecs::LocalTransform, BoxCollider>([&](ecs::Entity, ecs::LocalTransform& lt, BoxCollider& box) {
        CHECK_THAT(lt.position.x, Catch::Matchers::WithinAbs(1.0f, 1e-4f));
        CHECK_THAT(lt.position.y, Catch::Matchers::WithinAbs(2.0f, 1e-4f));
        CHECK_THAT(lt.position.z, Catch::Matchers::WithinAbs(0.0f, 1e-4f));
        CHECK_THAT(box.half_extents.x, Catch::Matchers::WithinAbs(2.0f, 1e-4f));
        found = true;
    });
    CHECK(found);
}

TEST_CASE("SceneLoader — control block becomes resources", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, MINIMAL_SCENE));

    const auto& k = world.resource<ControlConstants>();
    CHECK_THAT(k.impulse_value,    Catch::Matchers::WithinAbs(20.0f, 1e-4f));
    CHECK_THAT(k.impulse_cooldown, Catch::Matchers::WithinAbs(1.5f,  1e-4f));
    CHECK_THAT(k.force_value,      Catch::Matchers::WithinAbs(6.0f,  1e-4f)); // default kept

    const auto& pc = world.resource<PlayerController>();
    CHECK(pc.impulse_cooldown.ready());
    CHECK_THAT(pc.impulse_cooldown.duration(), Catch::Matchers::WithinAbs(1.5f, 1e-4f));
}

TEST_CASE("SceneLoader — player entity gets control components", "[scene]") {
    ecs::World world;
    SceneLoader::load_from_string(world, MINIMAL_SCENE);

    int player_count = 0;
    world.each<PlayerTag, PlayerInput, ControlBody>([&](ecs::Entity e, PlayerTag&, PlayerInput&,
                                                        ControlBody& body) {
        CHECK_THAT(body.damping, Catch::Matchers::WithinAbs(2.0f, 1e-4f));
        CHECK(body.heat.amount == 0.0f);

        const auto* cfg = world.try_get<RigidBodyConfig>(e);
        REQUIRE(cfg != nullptr);
        CHECK(cfg->ccd);
        CHECK(cfg->gravity_scale == 0.0f);
        CHECK(world.has<CircleCollider>(e));
        ++player_count;
    });
    CHECK(player_count == 1);
}

TEST_CASE("SceneLoader — malformed JSON returns false", "[scene]") {
    ecs::World world;
    CHECK_FALSE(SceneLoader::load_from_string(world, "{bad json"));
    CHECK(world.count() == 0);
}

TEST_CASE("SceneLoader — negative cooldown is rejected", "[scene]") {
    ecs::World world;
    CHECK_FALSE(SceneLoader::load_from_string(world,
        R"({ "control": { "impulse_cooldown": -1.0 }, "entities": [] })"));
    CHECK(world.try_resource<ControlConstants>() == nullptr);
}

TEST_CASE("SceneLoader — missing file returns false", "[scene]") {
    ecs::World world;
    CHECK_FALSE(SceneLoader::load(world, "does/not/exist.json"));
}

TEST_CASE("SceneLoader — unload destroys world entities", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, MINIMAL_SCENE));
    SceneLoader::unload(world);
    CHECK(world.count() == 0);
}

// ---------------------------------------------------------------------------
// DebugPanel
// ---------------------------------------------------------------------------

TEST_CASE("DebugPanel — watch creates section and row", "[debug]") {
    DebugPanel panel;
    panel.watch("Engine", "FPS", []() { return std::string("60"); });

    REQUIRE(panel.sections().size() == 1);
    CHECK(panel.sections()[0].title == "Engine");
    REQUIRE(panel.sections()[0].rows.size() == 1);
    CHECK(panel.sections()[0].rows[0].label == "FPS");
    CHECK(panel.sections()[0].rows[0].fn() == "60");
}

TEST_CASE("DebugPanel — sections ordered by insertion", "[debug]") {
    DebugPanel panel;
    panel.watch("Engine",  "FPS",  []() { return std::string("60"); });
    panel.watch("Control", "Heat", []() { return std::string("0.20"); });
    panel.watch("Engine",  "Entities", []() { return std::string("6"); });

    REQUIRE(panel.sections().size() == 2);
    CHECK(panel.sections()[0].title == "Engine");
    CHECK(panel.sections()[1].title == "Control");
    CHECK(panel.sections()[0].rows.size() == 2);
    CHECK(panel.row_count() == 3);
    CHECK(panel.find("Control") != nullptr);
    CHECK(panel.find("Audio") == nullptr);
}

TEST_CASE("DebugPanel — provider is called and returns current value", "[debug]") {
    int counter = 0;
    DebugPanel panel;
    panel.watch("Test", "Count", [&counter]() { return std::to_string(counter); });

    CHECK(panel.sections()[0].rows[0].fn() == "0");
    counter = 42;
    CHECK(panel.sections()[0].rows[0].fn() == "42");
}

TEST_CASE("DebugPanel — visible defaults to false, toggle works", "[debug]") {
    DebugPanel panel;
    CHECK_FALSE(panel.visible);
    panel.toggle();
    CHECK(panel.visible);
    panel.toggle();
    CHECK_FALSE(panel.visible);
}
