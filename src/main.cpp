#include "pipeline.hpp"
#include "scene.hpp"
#include "modules/control_module.hpp"
#include "modules/debug_module.hpp"
#include "modules/effects_module.hpp"
#include "modules/event_bus_module.hpp"
#include "modules/input_module.hpp"
#include "modules/physics_module.hpp"
#include "modules/render_module.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <iostream>

static const char* SCENE_PATH = "resources/scenes/arena.json";

static bool load_scene(ecs::World& world) {
    if (!SceneLoader::load(world, SCENE_PATH)) {
        std::cerr << "Failed to load scene: " << SCENE_PATH << std::endl;
        return false;
    }
    std::cout << "Scene loaded: " << SCENE_PATH << std::endl;
    return true;
}

int main() {
  InitWindow(1280, 720, "Puck Arena");
  SetTargetFPS(60);

  ecs::World world;
  ecs::Pipeline pipeline;

  // Module order is pipeline order within each phase.
  EventBusModule::install(world, pipeline);
  RenderModule::install(world, pipeline);
  DebugModule::install(world, pipeline);
  RenderModule::install_present(world, pipeline);
  InputModule::install(world, pipeline);
  ControlModule::install(world, pipeline);
  PhysicsModule::install(world, pipeline);
  EffectsModule::install(world, pipeline);

  if (!load_scene(world)) {
    CloseWindow();
    return 1;
  }

  // --- Main Loop ---
  while (!WindowShouldClose()) {
    if (IsKeyPressed(KEY_R)) {
        SceneLoader::unload(world);
        pipeline.reset_accumulator();
        if (!load_scene(world)) break;
    }

    pipeline.advance(world, GetFrameTime());
    pipeline.render(world);
  }

  SceneLoader::unload(world);
  CloseWindow();
  return 0;
}
