#pragma once
#include "components.hpp"
#include <cstdint>
#include <filesystem>
#include <string>

struct Diagnostics;

// ---------------------------------------------------------------------------
// ControllerConfig: designer-tunable values, stored as a World resource.
//
// Read-only for the duration of a frame. ConfigWatcher may replace it
// between frames when the backing JSON file changes on disk.
// ---------------------------------------------------------------------------

struct MovementSettings {
    float          move_speed           = 2.0f;
    float          sprint_speed         = 6.0f;
    float          rotation_speed       = 1.0f;  // first-person look scale
    float          rotation_smooth_time = 0.12f; // facing smooth_damp time
    float          speed_change_rate    = 10.0f;
    float          top_clamp            = 65.0f;
    float          bottom_clamp         = -75.0f;
    MovementPolicy policy               = MovementPolicy::CharacterRelative;
};

struct GroundingSettings {
    float         offset = -0.14f; // probe centre sits at position.y - offset
    float         radius = 0.28f;
    std::uint32_t layers = layer_bit(ObjectLayerIndex::NonMoving) | layer_bit(ObjectLayerIndex::Moving);
};

struct CameraZoomSettings {
    float zoom_speed       = 10.0f;
    float min_distance     = 1.0f;
    float max_distance     = 10.0f;
    float default_distance = 4.0f;
};

struct HeadFollowSettings {
    float     normal_smooth_speed = 10.0f;
    float     sprint_smooth_speed = 20.0f;
    float     snap_threshold      = 0.5f;
    float     recenter_delay      = 0.5f;
    bool      follow_x            = true;
    bool      follow_y            = true;
    bool      follow_z            = true;
};

struct PushSettings {
    bool          enabled  = true;
    float         strength = 1.1f;
    std::uint32_t layers   = layer_bit(ObjectLayerIndex::Moving);
};

struct InputSettings {
    int   switch_view_key   = 67;     // KEY_C
    float mouse_sensitivity = 0.15f;  // degrees per pixel before rotation_speed
    float stick_look_rate   = 120.0f; // degrees per second at full deflection
    float stick_deadzone    = 0.15f;
    bool  cursor_locked     = true;
};

struct ControllerConfig {
    ViewMode         start_mode = ViewMode::FirstPerson;
    MovementSettings first_person;
    MovementSettings third_person{2.0f, 6.0f, 1.0f, 0.12f, 10.0f, 90.0f, -50.0f,
                                  MovementPolicy::CameraRelative};

    float jump_height  = 1.2f;
    float gravity      = -9.81f;
    float jump_timeout = 0.1f;
    float fall_timeout = 0.15f;

    GroundingSettings grounding;

    float camera_angle_override = 0.0f;
    bool  lock_camera_position  = false;
    CameraZoomSettings zoom;
    HeadFollowSettings head_follow;

    float footstep_volume = 0.5f;
    float stride_length   = 1.4f; // metres between footstep events

    PushSettings  push;
    InputSettings input;

    const MovementSettings& settings_for(ViewMode mode) const {
        return mode == ViewMode::FirstPerson ? first_person : third_person;
    }
};

// ---------------------------------------------------------------------------
// ConfigLoader: JSON → ControllerConfig. Keys that are absent keep the
// value already in `config`, so a partial file only overrides what it names.
// `config` is left untouched when parsing fails.
// ---------------------------------------------------------------------------

class ConfigLoader {
public:
    static bool load(const std::string& path, ControllerConfig& config);
    static bool load_from_string(const std::string& json, ControllerConfig& config);
};

// ---------------------------------------------------------------------------
// ConfigWatcher: polls the config file's modification time and reloads it
// between frames. A file that fails to parse is reported and the previous
// config stays in effect.
// ---------------------------------------------------------------------------

class ConfigWatcher {
public:
    explicit ConfigWatcher(std::string path, float poll_interval = 0.5f);

    // Returns true when `config` was replaced.
    bool poll(float dt, ControllerConfig& config, Diagnostics* diagnostics);

    const std::string& path() const { return path_; }

private:
    std::string                     path_;
    float                           poll_interval_;
    float                           elapsed_ = 0.0f;
    std::filesystem::file_time_type last_write_{};
    bool                            has_stamp_ = false;
};
