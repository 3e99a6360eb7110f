#include "pipeline.hpp"
#include "scene.hpp"
#include "modules/character_module.hpp"
#include "modules/debug_module.hpp"
#include "modules/event_bus_module.hpp"
#include "modules/input_module.hpp"
#include "modules/physics_module.hpp"
#include "modules/render_module.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <string>

static const char* SCENE_PATH = "resources/scenes/default.json";

static void load_scene(ecs::World& world) {
  std::string error;
  if (!SceneLoader::load(world, SCENE_PATH, &error)) {
    TraceLog(LOG_ERROR, "SCENE: %s", error.c_str());
  }
}

int main() {
  InitWindow(1280, 720, "Tnua Controller - Basis Demo");
  SetTargetFPS(60);

  ecs::World world;
  tnua::Pipeline pipeline;

  // Install order matters:
  //   EventBus first (flush is the first Pre-Update step, registry must exist),
  //   Render before Debug (overlay draws on top of the scene),
  //   Debug before Character (Controller / Tuning rows need the panel),
  //   Physics before Character (character hook needs the PhysicsContext).
  EventBusModule::install(world, pipeline);
  RenderModule::install(world, pipeline);
  DebugModule::install(world, pipeline);
  PhysicsModule::install(world, pipeline);
  CharacterModule::install(world, pipeline);
  InputModule::install(world, pipeline);

  load_scene(world);

  // --- Main Loop ---
  float accumulator = 0.0f;
  const float fixed_dt = 1.0f / 60.0f;

  while (!WindowShouldClose()) {
    float dt = GetFrameTime();

    if (IsKeyPressed(KEY_R)) {
        SceneLoader::unload(world);
        load_scene(world);
    }

    // 1. Input, character stages (sensors -> controls -> bases -> motors)
    pipeline.update(world, dt);

    // 2. Step Physics (Fixed Timestep)
    accumulator += dt;
    while (accumulator >= fixed_dt) {
        pipeline.step_physics(world, fixed_dt);
        accumulator -= fixed_dt;
    }

    // 3. Render
    BeginDrawing();
    pipeline.render(world);
    EndDrawing();
  }

  CloseWindow();
  return 0;
}
