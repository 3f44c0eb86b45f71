#pragma once
#include "../animation.hpp"
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../pipeline.hpp"
#include "../systems/character_motor.hpp"
#include "../systems/gait.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// ControllerModule
//
// Registers the character capsule hook and the controller's event queues
// (JumpEvent, ViewModeChangedEvent, FootstepEvent, LandEvent), then wires:
//   Logic:       CharacterMotorSystem::Update → GaitSystem
//   Late-Update: CharacterMotorSystem::LateUpdate (orientation)
// and adds the "Character" and "Animation" debug rows.
//
// Install after PhysicsModule and before AudioModule (which consumes the
// gait events) and CameraModule (whose late step reads the camera targets).
// ---------------------------------------------------------------------------

namespace controller_debug {

inline std::string fmt(const char* format, float v) {
    char b[32];
    std::snprintf(b, sizeof(b), format, v);
    return b;
}

// Runs fn on the player's ControllerState; "-" without a player.
template<typename Fn>
std::string player_row(ecs::World& world, Fn fn) {
    std::string r = "-";
    world.each<PlayerTag, ControllerState>([&](ecs::Entity, PlayerTag&, ControllerState& s) { r = fn(s); });
    return r;
}

} // namespace controller_debug

struct ControllerModule {
    static void install(ecs::World& world, locomotion::Pipeline& pipeline) {
        using controller_debug::fmt;
        using controller_debug::player_row;

        CharacterMotorSystem::Register(world);

        auto& registry = world.resource<EventRegistry>();
        registry.register_queue<JumpEvent>(world);
        registry.register_queue<ViewModeChangedEvent>(world);
        registry.register_queue<FootstepEvent>(world);
        registry.register_queue<LandEvent>(world);

        pipeline.add_logic([](ecs::World& w, float dt) { CharacterMotorSystem::Update(w, dt); });
        pipeline.add_logic([](ecs::World& w, float dt) { GaitSystem::Update(w, dt); });
        pipeline.add_late_update([](ecs::World& w, float dt) { CharacterMotorSystem::LateUpdate(w, dt); });

        auto* panel = world.try_resource<DebugPanel>();
        if (!panel) return;

        panel->watch("Character", "View", [&world]() {
            return player_row(world, [](ControllerState& s) {
                return std::string(s.mode == ViewMode::FirstPerson ? "First Person" : "Third Person");
            });
        });
        panel->watch("Character", "Grounded", [&world]() {
            return player_row(world, [](ControllerState& s) { return std::string(s.ground.grounded ? "yes" : "no"); });
        });
        panel->watch("Character", "Speed", [&world]() {
            return player_row(world, [](ControllerState& s) { return fmt("%.2f m/s", s.locomotion.speed); });
        });
        panel->watch("Character", "Vertical Vel", [&world]() {
            return player_row(world, [](ControllerState& s) { return fmt("%.2f m/s", s.vertical.vertical_velocity); });
        });
        panel->watch("Character", "Jump / Fall T", [&world]() {
            return player_row(world, [](ControllerState& s) {
                char b[48];
                std::snprintf(b, sizeof(b), "%.2f / %.2f", s.vertical.jump_timeout_remaining,
                              s.vertical.fall_timeout_remaining);
                return std::string(b);
            });
        });
        panel->watch("Character", "Body Yaw", [&world]() {
            return player_row(world, [](ControllerState& s) { return fmt("%.1f deg", s.pose.yaw); });
        });
        panel->watch("Camera", "Pitch / Yaw", [&world]() {
            return player_row(world, [](ControllerState& s) {
                char b[48];
                std::snprintf(b, sizeof(b), "%.1f / %.1f", s.orientation.pitch, s.orientation.yaw);
                return std::string(b);
            });
        });

        panel->watch("Animation", "Speed", [&world]() {
            std::string r = "-";
            world.each<AnimatorParameters>([&](ecs::Entity, AnimatorParameters& a) {
                r = fmt("%.2f", a.get_float(AnimParam::Speed));
            });
            return r;
        });
        panel->watch("Animation", "Flags", [&world]() {
            std::string r = "-";
            world.each<AnimatorParameters>([&](ecs::Entity, AnimatorParameters& a) {
                r  = a.get_bool(AnimParam::Grounded) ? "Grounded " : "";
                r += a.get_bool(AnimParam::Jump)     ? "Jump "     : "";
                r += a.get_bool(AnimParam::FreeFall) ? "FreeFall"  : "";
                if (r.empty()) r = "none";
            });
            return r;
        });
    }
};
