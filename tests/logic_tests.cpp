#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/animation.hpp"
#include "../src/config.hpp"
#include "../src/debug_panel.hpp"
#include "../src/diagnostics.hpp"
#include "../src/events.hpp"
#include "../src/math_util.hpp"
#include "../src/modules/core_module.hpp"
#include "../src/pipeline.hpp"
#include "../src/scene.hpp"
#include "../src/systems/body_push.hpp"
#include "../src/systems/camera_filters.hpp"
#include "../src/systems/gait.hpp"
#include "../src/systems/locomotion.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

// Everything in this file is engine-free: no Jolt, no Raylib.

using namespace locomotion::math;
using Catch::Matchers::WithinAbs;

// ---------------------------------------------------------------------------
// Angle and scalar helpers
// ---------------------------------------------------------------------------

TEST_CASE("clamp_angle wraps one turn then clamps", "[math]") {
    SECTION("Inside range") {
        CHECK(clamp_angle(10.0f, -90.0f, 90.0f) == 10.0f);
    }

    SECTION("Wraps past a full turn") {
        CHECK_THAT(clamp_angle(370.0f, -90.0f, 90.0f),  WithinAbs(10.0f, 1e-4f));
        CHECK_THAT(clamp_angle(-370.0f, -90.0f, 90.0f), WithinAbs(-10.0f, 1e-4f));
    }

    SECTION("Clamps to the bounds") {
        CHECK(clamp_angle(100.0f, -90.0f, 90.0f) == 90.0f);
        CHECK(clamp_angle(-120.0f, -90.0f, 90.0f) == -90.0f);
    }

    SECTION("Unbounded variant only wraps") {
        CHECK_THAT(clamp_angle_unbounded(361.0f),  WithinAbs(1.0f, 1e-4f));
        CHECK_THAT(clamp_angle_unbounded(-361.0f), WithinAbs(-1.0f, 1e-4f));
        CHECK(clamp_angle_unbounded(200.0f) == 200.0f);
    }
}

TEST_CASE("move_towards never overshoots", "[math]") {
    CHECK_THAT(move_towards(0.0f, 1.0f, 0.3f), WithinAbs(0.3f, 1e-6f));
    CHECK(move_towards(0.9f, 1.0f, 0.3f) == 1.0f);
    CHECK_THAT(move_towards(1.0f, -1.0f, 0.5f), WithinAbs(0.5f, 1e-6f));
}

TEST_CASE("repeat and delta_angle", "[math]") {
    CHECK_THAT(repeat(-10.0f, 360.0f), WithinAbs(350.0f, 1e-3f));
    CHECK_THAT(repeat(370.0f, 360.0f), WithinAbs(10.0f, 1e-3f));
    CHECK_THAT(delta_angle(350.0f, 10.0f), WithinAbs(20.0f, 1e-3f));
    CHECK_THAT(delta_angle(10.0f, 350.0f), WithinAbs(-20.0f, 1e-3f));
}

TEST_CASE("smooth_damp settles on target without overshoot", "[math]") {
    float value = 0.0f, velocity = 0.0f;
    for (int i = 0; i < 200; ++i) {
        value = smooth_damp(value, 1.0f, velocity, 0.1f, 0.02f);
        CHECK(value <= 1.0f);
    }
    CHECK_THAT(value, WithinAbs(1.0f, 1e-3f));
}

TEST_CASE("smooth_damp_angle takes the short way round", "[math]") {
    float velocity = 0.0f;
    const float next = smooth_damp_angle(350.0f, 10.0f, velocity, 0.1f, 0.016f);
    CHECK(next > 350.0f);
}

TEST_CASE("Heading conventions", "[math]") {
    SECTION("Yaw 0 faces +Z") {
        const auto f = heading_forward(0.0f);
        CHECK_THAT(f.x, WithinAbs(0.0f, 1e-6f));
        CHECK_THAT(f.z, WithinAbs(1.0f, 1e-6f));
    }

    SECTION("Right is forward x up") {
        const auto f = heading_forward(30.0f);
        const auto r = heading_right(30.0f);
        const auto c = cross(f, {0.0f, 1.0f, 0.0f});
        CHECK_THAT(r.x, WithinAbs(c.x, 1e-5f));
        CHECK_THAT(r.z, WithinAbs(c.z, 1e-5f));
    }

    SECTION("heading_of inverts heading_forward") {
        const auto f = heading_forward(90.0f);
        CHECK_THAT(heading_of(f.x, f.z), WithinAbs(90.0f, 1e-3f));
    }

    SECTION("Quaternion round trip") {
        CHECK_THAT(yaw_from_quat(quat_from_yaw(30.0f)), WithinAbs(30.0f, 1e-3f));
    }

    SECTION("Positive pitch looks down") {
        CHECK(view_direction(0.0f, 30.0f).y < 0.0f);
    }
}

// ---------------------------------------------------------------------------
// Events<T>
// ---------------------------------------------------------------------------

struct TestEvent { int value; };

TEST_CASE("Events — send and read", "[events]") {
    Events<TestEvent> queue;
    queue.send({1});
    queue.send({2});

    REQUIRE(queue.read().size() == 2);
    CHECK(queue.read()[0].value == 1);
    CHECK(queue.read()[1].value == 2);
}

TEST_CASE("EventRegistry — flush_all clears every registered queue", "[events]") {
    ecs::World world;
    world.set_resource(EventRegistry{});
    auto& registry = world.resource<EventRegistry>();
    registry.register_queue<TestEvent>(world);
    registry.register_queue<JumpEvent>(world);

    world.resource<Events<TestEvent>>().send({7});
    world.resource<Events<JumpEvent>>().send({world.create(), 4.85f});

    registry.flush_all();

    CHECK(world.resource<Events<TestEvent>>().empty());
    CHECK(world.resource<Events<JumpEvent>>().empty());
}

// ---------------------------------------------------------------------------
// DebugPanel
// ---------------------------------------------------------------------------

TEST_CASE("DebugPanel — rows append to an existing section", "[debug]") {
    DebugPanel panel;
    panel.watch("Engine",    "FPS",  []() { return std::string("60"); });
    panel.watch("Character", "View", []() { return std::string("First Person"); });
    panel.watch("Engine",    "Entities", []() { return std::string("9"); });

    REQUIRE(panel.sections().size() == 2);
    CHECK(panel.sections()[0].rows.size() == 2);
    REQUIRE(panel.find("Character") != nullptr);
    CHECK(panel.find("Missing") == nullptr);
}

TEST_CASE("DebugPanel — lines flatten sections in insertion order", "[debug]") {
    DebugPanel panel;
    panel.watch("A", "x", []() { return std::string("1"); });
    panel.watch("B", "y", []() { return std::string("2"); });
    panel.watch("A", "z", []() { return std::string("3"); });

    const std::vector<std::string> expected = {"A", "  x: 1", "  z: 3", "B", "  y: 2"};
    CHECK(panel.lines() == expected);
}

// ---------------------------------------------------------------------------
// Diagnostics
// ---------------------------------------------------------------------------

TEST_CASE("Diagnostics — warn_once reports a key a single time", "[diagnostics]") {
    Diagnostics d;
    int sunk = 0;
    d.sink = [&](Diagnostics::Level level, const std::string&) {
        CHECK(level == Diagnostics::Level::Warning);
        ++sunk;
    };

    d.warn_once("mover", "no mover");
    d.warn_once("mover", "no mover");
    CHECK(sunk == 1);
    CHECK(d.reported("mover"));

    SECTION("clear re-arms the key") {
        d.clear("mover");
        d.warn_once("mover", "no mover");
        CHECK(sunk == 2);
    }
}

TEST_CASE("Diagnostics — recent keeps the newest lines", "[diagnostics]") {
    Diagnostics d;
    d.history_limit = 3;
    for (int i = 0; i < 5; ++i) d.emit(Diagnostics::Level::Info, std::to_string(i));

    REQUIRE(d.recent().size() == 3);
    CHECK(d.recent().front() == "2");
    CHECK(d.recent().back() == "4");
}

// ---------------------------------------------------------------------------
// SceneLoader
// ---------------------------------------------------------------------------

static const char* PLAYER_SCENE = R"({
  "entities": [
    {
      "transform": { "position": [1.0, 2.0, 3.0], "scale": [4.0, 1.0, 4.0] },
      "box_collider": { "half_extents": [2.0, 0.5, 2.0] },
      "rigid_body": { "type": "Static" },
      "tags": ["World"]
    },
    {
      "transform": { "position": [0.0, 1.0, 0.0], "rotation": [0.0, -0.70710678, 0.0, 0.70710678] },
      "character": { "height": 1.8, "radius": 0.3 },
      "controller": {
        "animator": true,
        "camera_targets": {
          "first_person": { "offset": [0.0, 1.6, 0.0] },
          "third_person": { "offset": [0.0, 1.4, 0.0] }
        }
      },
      "tags": ["Player", "World"]
    }
  ]
})";

TEST_CASE("SceneLoader — entity count and static transform", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, PLAYER_SCENE));
    CHECK(world.count() == 2);

    bool found = false;
    world.each<ecs::LocalTransform, BoxCollider>([&](ecs::Entity, ecs::LocalTransform& lt, BoxCollider&) {
        CHECK_THAT(lt.position.x, WithinAbs(1.0f, 1e-4f));
        CHECK_THAT(lt.scale.x,    WithinAbs(4.0f, 1e-4f));
        found = true;
    });
    CHECK(found);
}

TEST_CASE("SceneLoader — player gets the controller components", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, PLAYER_SCENE));

    int players = 0;
    world.each<PlayerTag, PlayerInput, ControllerState, GaitState>(
        [&](ecs::Entity e, PlayerTag&, PlayerInput&, ControllerState& state, GaitState&) {
            ++players;
            CHECK_THAT(state.pose.position.y, WithinAbs(1.0f, 1e-4f));
            CHECK_THAT(state.pose.yaw, WithinAbs(90.0f, 1e-2f));
            CHECK_FALSE(state.initialized);

            REQUIRE(state.first_person_target.has_value());
            REQUIRE(state.third_person_target.has_value());
            CHECK_THAT(state.first_person_target->offset.y, WithinAbs(1.6f, 1e-4f));
            CHECK_THAT(state.third_person_target->offset.y, WithinAbs(1.4f, 1e-4f));

            CHECK(world.try_get<AnimatorParameters>(e) != nullptr);
        });
    CHECK(players == 1);
}

TEST_CASE("SceneLoader — player without a controller block has no camera targets", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, R"({
      "entities": [ { "transform": { "position": [0, 0, 0] }, "tags": ["Player"] } ]
    })"));

    world.each<ControllerState>([&](ecs::Entity e, ControllerState& state) {
        CHECK_FALSE(state.first_person_target.has_value());
        CHECK_FALSE(state.third_person_target.has_value());
        CHECK(world.try_get<AnimatorParameters>(e) == nullptr);
    });
}

TEST_CASE("SceneLoader — malformed input returns false", "[scene]") {
    ecs::World world;

    SECTION("Bad JSON") {
        CHECK_FALSE(SceneLoader::load_from_string(world, "{bad json"));
        CHECK(world.count() == 0);
    }

    SECTION("Capsule shorter than its diameter") {
        CHECK_FALSE(SceneLoader::load_from_string(world, R"({
          "entities": [ { "character": { "height": 0.5, "radius": 0.4 } } ]
        })"));
    }

    SECTION("Unknown shape") {
        CHECK_FALSE(SceneLoader::load_from_string(world, R"({
          "entities": [ { "mesh": { "shape": "Torus" } } ]
        })"));
    }
}

TEST_CASE("SceneLoader — unload removes World-tagged entities", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, PLAYER_SCENE));
    SceneLoader::unload(world);
    CHECK(world.count() == 0);
}

// ---------------------------------------------------------------------------
// ConfigLoader / ConfigWatcher
// ---------------------------------------------------------------------------

TEST_CASE("ConfigLoader — partial file overrides only what it names", "[config]") {
    ControllerConfig config;
    REQUIRE(ConfigLoader::load_from_string(R"({ "jump": { "height": 2.0 }, "start_mode": "ThirdPerson" })", config));

    CHECK(config.jump_height == 2.0f);
    CHECK(config.gravity == -9.81f);
    CHECK(config.start_mode == ViewMode::ThirdPerson);
    CHECK(config.third_person.policy == MovementPolicy::CameraRelative);
}

TEST_CASE("ConfigLoader — per-mode settings and layers", "[config]") {
    ControllerConfig config;
    REQUIRE(ConfigLoader::load_from_string(R"({
      "first_person": { "move_speed": 4.0, "policy": "WorldRelative", "top_clamp": 89, "bottom_clamp": -89 },
      "grounding": { "layers": ["Moving"] },
      "push": { "enabled": false }
    })", config));

    CHECK(config.first_person.move_speed == 4.0f);
    CHECK(config.first_person.policy == MovementPolicy::WorldRelative);
    CHECK(config.settings_for(ViewMode::FirstPerson).top_clamp == 89.0f);
    CHECK(config.grounding.layers == layer_bit(ObjectLayerIndex::Moving));
    CHECK_FALSE(config.push.enabled);
}

TEST_CASE("ConfigLoader — invalid input leaves config untouched", "[config]") {
    ControllerConfig config;

    SECTION("Unknown policy") {
        CHECK_FALSE(ConfigLoader::load_from_string(
            R"({ "jump": { "height": 3.0 }, "first_person": { "policy": "Sideways" } })", config));
    }
    SECTION("Positive gravity") {
        CHECK_FALSE(ConfigLoader::load_from_string(R"({ "jump": { "height": 3.0, "gravity": 9.81 } })", config));
    }
    SECTION("Inverted pitch clamps") {
        CHECK_FALSE(ConfigLoader::load_from_string(
            R"({ "jump": { "height": 3.0 }, "third_person": { "top_clamp": -10, "bottom_clamp": 10 } })", config));
    }
    SECTION("Unknown layer") {
        CHECK_FALSE(ConfigLoader::load_from_string(
            R"({ "jump": { "height": 3.0 }, "grounding": { "layers": ["Water"] } })", config));
    }

    CHECK(config.jump_height == 1.2f);
}

TEST_CASE("ConfigWatcher — reloads on change and keeps values on a bad file", "[config]") {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "locomotion_watcher_test.json";
    {
        std::ofstream out(path);
        out << R"({ "jump": { "height": 1.5 } })";
    }

    ControllerConfig config;
    Diagnostics      diagnostics;
    ConfigWatcher    watcher(path.string(), 0.5f);

    // Before the first interval elapses nothing is read.
    CHECK_FALSE(watcher.poll(0.1f, config, &diagnostics));
    CHECK(config.jump_height == 1.2f);

    int bumps = 0;
    auto bump = [&]() {
        fs::last_write_time(path, fs::file_time_type::clock::now() + std::chrono::seconds(10 * ++bumps));
    };

    {
        std::ofstream out(path);
        out << R"({ "jump": { "height": 2.5 } })";
    }
    bump();
    CHECK(watcher.poll(0.5f, config, &diagnostics));
    CHECK(config.jump_height == 2.5f);

    // Unchanged stamp: no reload.
    CHECK_FALSE(watcher.poll(0.5f, config, &diagnostics));

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    bump();
    CHECK_FALSE(watcher.poll(0.5f, config, &diagnostics));
    CHECK(config.jump_height == 2.5f);
    REQUIRE_FALSE(diagnostics.recent().empty());
    CHECK(diagnostics.recent().back().find("failed to reload") != std::string::npos);

    fs::remove(path);
}

// ---------------------------------------------------------------------------
// Pipeline / CoreModule
// ---------------------------------------------------------------------------

TEST_CASE("Pipeline — phases run in order", "[pipeline]") {
    ecs::World world;
    locomotion::Pipeline pipeline;
    std::vector<std::string> ran;

    pipeline.add_render([&](ecs::World&, float)      { ran.push_back("render"); });
    pipeline.add_physics([&](ecs::World&, float)     { ran.push_back("physics"); });
    pipeline.add_late_update([&](ecs::World&, float) { ran.push_back("late"); });
    pipeline.add_logic([&](ecs::World&, float)       { ran.push_back("logic"); });
    pipeline.add_pre_update([&](ecs::World&, float)  { ran.push_back("pre"); });

    CHECK(pipeline.system_count() == 5);

    const std::vector<std::string> frame_order = {"pre", "logic", "late"};
    pipeline.update(world, 0.016f);
    CHECK(ran == frame_order);

    const std::vector<std::string> full_order = {"pre", "logic", "late", "physics", "render"};
    pipeline.step_physics(world, 1.0f / 60.0f);
    pipeline.render(world);
    CHECK(ran == full_order);
}

TEST_CASE("CoreModule — defaults and a warning when the config file is missing", "[pipeline]") {
    ecs::World world;
    locomotion::Pipeline pipeline;
    int warnings = 0;

    CoreModule::install(world, pipeline, "does/not/exist.json",
                        [&](Diagnostics::Level level, const std::string&) {
                            if (level == Diagnostics::Level::Warning) ++warnings;
                        });

    CHECK(warnings == 1);
    CHECK(world.resource<ControllerConfig>().jump_height == 1.2f);
    CHECK(pipeline.system_count() == 2);

    world.resource<EventRegistry>().register_queue<LandEvent>(world);
    world.resource<Events<LandEvent>>().send({world.create(), {0, 0, 0}, 1.0f});
    pipeline.update(world, 0.016f);
    CHECK(world.resource<Events<LandEvent>>().empty());
}

// ---------------------------------------------------------------------------
// Camera filters
// ---------------------------------------------------------------------------

TEST_CASE("CameraZoom — scroll, clamp and reset", "[camera]") {
    CameraZoomSettings settings;
    settings.zoom_speed       = 10.0f;
    settings.min_distance     = 1.0f;
    settings.max_distance     = 10.0f;
    settings.default_distance = 4.0f;
    ZoomState zoom = CameraZoom::initial(settings);

    SECTION("Scroll up pulls in") {
        CHECK(CameraZoom::apply(0.1f, false, settings, zoom));
        CHECK_THAT(zoom.distance, WithinAbs(3.0f, 1e-4f));
    }
    SECTION("Tiny scroll is ignored") {
        CHECK_FALSE(CameraZoom::apply(0.005f, false, settings, zoom));
    }
    SECTION("Clamped to the limits") {
        CameraZoom::apply(5.0f, false, settings, zoom);
        CHECK(zoom.distance == 1.0f);
        CameraZoom::apply(-5.0f, false, settings, zoom);
        CHECK(zoom.distance == 10.0f);
    }
    SECTION("Reset restores the default") {
        CameraZoom::apply(0.2f, false, settings, zoom);
        CHECK(CameraZoom::apply(0.0f, true, settings, zoom));
        CHECK(zoom.distance == 4.0f);
    }
}

TEST_CASE("CameraZoom — default outside the limits is clamped", "[camera]") {
    CameraZoomSettings settings;
    settings.default_distance = 20.0f;
    CHECK(CameraZoom::initial(settings).distance == settings.max_distance);
}

TEST_CASE("HeadFollow — first step places, idle gap snaps, active look smooths", "[camera]") {
    HeadFollowSettings settings;
    HeadFollowState    state;
    const ecs::Vec2    idle{0.0f, 0.0f};

    const auto placed = HeadFollow::step({0.0f, 1.6f, 0.0f}, false, idle, settings, 1.0f, state);
    CHECK(placed.y == 1.6f);
    CHECK(state.placed);

    SECTION("Idle look snaps across a large gap") {
        const auto p = HeadFollow::step({10.0f, 1.6f, 0.0f}, false, idle, settings, 0.016f, state);
        CHECK(p.x == 10.0f);
    }

    SECTION("Active look keeps smoothing") {
        const auto p = HeadFollow::step({10.0f, 1.6f, 0.0f}, false, {1.0f, 0.0f}, settings, 0.016f, state);
        CHECK(p.x > 0.0f);
        CHECK(p.x < 10.0f);
    }

    SECTION("Disabled axis stays put") {
        settings.follow_y = false;
        const auto p = HeadFollow::step({0.0f, 3.0f, 0.0f}, false, idle, settings, 0.016f, state);
        CHECK(p.y == 1.6f);
    }
}

// ---------------------------------------------------------------------------
// RigidBodyPush
// ---------------------------------------------------------------------------

TEST_CASE("RigidBodyPush — only loose bodies on the push layers", "[push]") {
    PushSettings settings;
    RigidBodyPush::Contact contact;
    contact.move_direction = {1.0f, 0.0f, 0.0f};
    contact.dynamic        = true;
    contact.layer          = ObjectLayerIndex::Moving;

    SECTION("Qualifying hit is horizontal and scaled") {
        contact.move_direction = {0.6f, 0.2f, 0.8f};
        auto impulse = RigidBodyPush::impulse(settings, contact);
        REQUIRE(impulse.has_value());
        CHECK_THAT(impulse->x, WithinAbs(0.6f * settings.strength, 1e-5f));
        CHECK(impulse->y == 0.0f);
        CHECK_THAT(impulse->z, WithinAbs(0.8f * settings.strength, 1e-5f));
    }
    SECTION("Disabled") {
        settings.enabled = false;
        CHECK_FALSE(RigidBodyPush::impulse(settings, contact).has_value());
    }
    SECTION("Static or kinematic") {
        contact.dynamic = false;
        CHECK_FALSE(RigidBodyPush::impulse(settings, contact).has_value());
        contact.dynamic   = true;
        contact.kinematic = true;
        CHECK_FALSE(RigidBodyPush::impulse(settings, contact).has_value());
    }
    SECTION("Layer outside the mask") {
        contact.layer = ObjectLayerIndex::NonMoving;
        CHECK_FALSE(RigidBodyPush::impulse(settings, contact).has_value());
    }
    SECTION("Standing on top") {
        contact.move_direction = {0.0f, -1.0f, 0.0f};
        CHECK_FALSE(RigidBodyPush::impulse(settings, contact).has_value());
    }
}

TEST_CASE("RigidBodyPush — layers past the mask width never match", "[push]") {
    CHECK(layer_bit(31) == 0x80000000u);
    CHECK(layer_bit(32) == 0u);
    CHECK(layer_bit(40) == 0u);

    PushSettings settings;
    settings.layers = 0xFFFFFFFFu;
    RigidBodyPush::Contact contact;
    contact.move_direction = {1.0f, 0.0f, 0.0f};
    contact.dynamic        = true;
    contact.layer          = 40;
    CHECK_FALSE(RigidBodyPush::impulse(settings, contact).has_value());
}

TEST_CASE("RigidBodyPush — walking into a crate while grounded pushes it", "[push]") {
    PushSettings settings;
    const ecs::Vec3 wall_normal{0.0f, 0.0f, -1.0f};

    for (float speed : {2.0f, 4.0f, 5.335f, 6.0f}) {
        const ecs::Vec3 delta = LocomotionSystem::displacement({0.0f, 0.0f, 1.0f}, speed, 1.0f, -2.0f, 0.016f);

        RigidBodyPush::Contact contact;
        contact.move_direction = RigidBodyPush::sweep_direction(delta, wall_normal);
        contact.dynamic        = true;
        contact.layer          = ObjectLayerIndex::Moving;

        CHECK(contact.move_direction.y == 0.0f);
        auto impulse = RigidBodyPush::impulse(settings, contact);
        REQUIRE(impulse.has_value());
        CHECK_THAT(impulse->z, WithinAbs(settings.strength, 1e-5f));
    }
}

TEST_CASE("RigidBodyPush — body under the character is not pushed", "[push]") {
    PushSettings settings;
    const ecs::Vec3 delta = LocomotionSystem::displacement({1.0f, 0.0f, 0.0f}, 4.0f, 1.0f, -2.0f, 0.016f);

    RigidBodyPush::Contact contact;
    contact.move_direction = RigidBodyPush::sweep_direction(delta, {0.0f, 1.0f, 0.0f});
    contact.dynamic        = true;
    contact.layer          = ObjectLayerIndex::Moving;

    CHECK(contact.move_direction.y == -1.0f);
    CHECK_FALSE(RigidBodyPush::impulse(settings, contact).has_value());
}

TEST_CASE("RigidBodyPush — standing still against a body keeps the downward direction", "[push]") {
    const ecs::Vec3 dir = RigidBodyPush::sweep_direction({0.0f, -0.032f, 0.0f}, {1.0f, 0.0f, 0.0f});
    CHECK_THAT(dir.y, WithinAbs(-1.0f, 1e-5f));
}

// ---------------------------------------------------------------------------
// GaitSystem
// ---------------------------------------------------------------------------

TEST_CASE("GaitSystem — landing edge", "[gait]") {
    GaitState gait;
    gait.was_grounded = false;

    const auto s = GaitSystem::step(true, 0.0f, 0.0f, 1.4f, 0.016f, gait);
    CHECK(s.landed);
    CHECK(s.weight == 1.0f);
    CHECK(gait.was_grounded);

    CHECK_FALSE(GaitSystem::step(true, 0.0f, 0.0f, 1.4f, 0.016f, gait).landed);
}

TEST_CASE("GaitSystem — one footstep per stride", "[gait]") {
    GaitState gait;

    CHECK_FALSE(GaitSystem::step(true, 2.0f, 0.5f, 1.4f, 0.5f, gait).footstep);
    const auto s = GaitSystem::step(true, 2.0f, 0.5f, 1.4f, 0.5f, gait);
    CHECK(s.footstep);
    CHECK(s.weight == 1.0f);
    CHECK_THAT(gait.stride_progress, WithinAbs(0.6f, 1e-4f));
}

TEST_CASE("GaitSystem — no footsteps while airborne", "[gait]") {
    GaitState gait;
    for (int i = 0; i < 10; ++i)
        CHECK_FALSE(GaitSystem::step(false, 5.0f, 1.0f, 1.4f, 0.5f, gait).footstep);
}

TEST_CASE("GaitSystem — weak clips fail the weight gate", "[gait]") {
    CHECK_THAT(GaitSystem::clip_weight(0.2f), WithinAbs(0.4f, 1e-5f));
    CHECK(GaitSystem::clip_weight(0.9f) == 1.0f);
    CHECK_FALSE(GaitSystem::passes_weight_gate(GaitSystem::clip_weight(0.2f)));
    CHECK_FALSE(GaitSystem::passes_weight_gate(0.5f));
    CHECK(GaitSystem::passes_weight_gate(0.51f));
}
