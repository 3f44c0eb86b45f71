#include "diagnostics.hpp"
#include "pipeline.hpp"
#include "scene.hpp"
#include "modules/audio_module.hpp"
#include "modules/camera_module.hpp"
#include "modules/controller_module.hpp"
#include "modules/core_module.hpp"
#include "modules/debug_module.hpp"
#include "modules/input_module.hpp"
#include "modules/physics_module.hpp"
#include "modules/render_module.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>

static const char* SCENE_PATH  = "resources/scenes/default.json";
static const char* CONFIG_PATH = "resources/config/controller.json";

static void trace_sink(Diagnostics::Level level, const std::string& message) {
    switch (level) {
    case Diagnostics::Level::Info:    TraceLog(LOG_INFO,    "%s", message.c_str()); break;
    case Diagnostics::Level::Warning: TraceLog(LOG_WARNING, "%s", message.c_str()); break;
    case Diagnostics::Level::Error:   TraceLog(LOG_ERROR,   "%s", message.c_str()); break;
    }
}

static void load_scene(ecs::World& world) {
    if (!SceneLoader::load(world, SCENE_PATH))
        TraceLog(LOG_ERROR, "SCENE: failed to load %s", SCENE_PATH);
}

int main() {
    InitWindow(1280, 720, "Player Locomotion");
    SetTargetFPS(60);

    ecs::World world;
    locomotion::Pipeline pipeline;

    // Install order is execution order within each phase.
    CoreModule::install(world, pipeline, CONFIG_PATH, trace_sink);
    RenderModule::install(world, pipeline);
    DebugModule::install(world, pipeline);
    InputModule::install(world, pipeline);
    PhysicsModule::install(world, pipeline);
    ControllerModule::install(world, pipeline);
    AudioModule::install(world, pipeline);
    CameraModule::install(world, pipeline);
    RenderModule::install_present(world, pipeline);

    load_scene(world);

    float accumulator = 0.0f;
    const float fixed_dt = 1.0f / 60.0f;

    while (!WindowShouldClose()) {
        const float dt = GetFrameTime();

        if (IsKeyPressed(KEY_R)) {
            SceneLoader::unload(world);
            load_scene(world);
        }

        pipeline.update(world, dt);

        accumulator += dt;
        while (accumulator >= fixed_dt) {
            pipeline.step_physics(world, fixed_dt);
            accumulator -= fixed_dt;
        }

        pipeline.render(world);
    }

    SceneLoader::unload(world);
    AudioModule::shutdown(world);
    CloseWindow();
    return 0;
}
