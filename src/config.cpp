#include "config.hpp"
#include "diagnostics.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static ViewMode parse_view_mode(const std::string& s) {
    if (s == "FirstPerson") return ViewMode::FirstPerson;
    if (s == "ThirdPerson") return ViewMode::ThirdPerson;
    throw std::runtime_error("ConfigLoader: unknown view mode '" + s + "'");
}

static MovementPolicy parse_policy(const std::string& s) {
    if (s == "CharacterRelative") return MovementPolicy::CharacterRelative;
    if (s == "CameraRelative")    return MovementPolicy::CameraRelative;
    if (s == "WorldRelative")     return MovementPolicy::WorldRelative;
    throw std::runtime_error("ConfigLoader: unknown movement policy '" + s + "'");
}

static std::uint32_t parse_layers(const json& j) {
    std::uint32_t mask = 0;
    for (const auto& entry : j) {
        const std::string name = entry.get<std::string>();
        if      (name == "NonMoving") mask |= layer_bit(ObjectLayerIndex::NonMoving);
        else if (name == "Moving")    mask |= layer_bit(ObjectLayerIndex::Moving);
        else throw std::runtime_error("ConfigLoader: unknown layer '" + name + "'");
    }
    return mask;
}

template<typename T>
static void read(const json& j, const char* key, T& out) {
    if (j.contains(key)) out = j.at(key).get<T>();
}

static void read_movement(const json& j, MovementSettings& m) {
    read(j, "move_speed",           m.move_speed);
    read(j, "sprint_speed",         m.sprint_speed);
    read(j, "rotation_speed",       m.rotation_speed);
    read(j, "rotation_smooth_time", m.rotation_smooth_time);
    read(j, "speed_change_rate",    m.speed_change_rate);
    read(j, "top_clamp",            m.top_clamp);
    read(j, "bottom_clamp",         m.bottom_clamp);
    if (j.contains("policy")) m.policy = parse_policy(j.at("policy").get<std::string>());

    if (m.bottom_clamp > m.top_clamp)
        throw std::runtime_error("ConfigLoader: bottom_clamp above top_clamp");
}

static void parse_config(const json& j, ControllerConfig& c) {
    if (j.contains("start_mode")) c.start_mode = parse_view_mode(j.at("start_mode").get<std::string>());
    if (j.contains("first_person")) read_movement(j.at("first_person"), c.first_person);
    if (j.contains("third_person")) read_movement(j.at("third_person"), c.third_person);

    if (j.contains("jump")) {
        const auto& jj = j.at("jump");
        read(jj, "height",       c.jump_height);
        read(jj, "gravity",      c.gravity);
        read(jj, "jump_timeout", c.jump_timeout);
        read(jj, "fall_timeout", c.fall_timeout);
        if (c.gravity >= 0.0f)
            throw std::runtime_error("ConfigLoader: gravity must be negative");
    }

    if (j.contains("grounding")) {
        const auto& g = j.at("grounding");
        read(g, "offset", c.grounding.offset);
        read(g, "radius", c.grounding.radius);
        if (g.contains("layers")) c.grounding.layers = parse_layers(g.at("layers"));
    }

    if (j.contains("camera")) {
        const auto& cam = j.at("camera");
        read(cam, "angle_override", c.camera_angle_override);
        read(cam, "lock_position",  c.lock_camera_position);
        if (cam.contains("zoom")) {
            const auto& z = cam.at("zoom");
            read(z, "speed",   c.zoom.zoom_speed);
            read(z, "min",     c.zoom.min_distance);
            read(z, "max",     c.zoom.max_distance);
            read(z, "default", c.zoom.default_distance);
        }
        if (cam.contains("head_follow")) {
            const auto& h = cam.at("head_follow");
            read(h, "normal_smooth_speed", c.head_follow.normal_smooth_speed);
            read(h, "sprint_smooth_speed", c.head_follow.sprint_smooth_speed);
            read(h, "snap_threshold",      c.head_follow.snap_threshold);
            read(h, "recenter_delay",      c.head_follow.recenter_delay);
            read(h, "follow_x",            c.head_follow.follow_x);
            read(h, "follow_y",            c.head_follow.follow_y);
            read(h, "follow_z",            c.head_follow.follow_z);
        }
    }

    if (j.contains("audio")) {
        const auto& a = j.at("audio");
        read(a, "footstep_volume", c.footstep_volume);
        read(a, "stride_length",   c.stride_length);
    }

    if (j.contains("push")) {
        const auto& p = j.at("push");
        read(p, "enabled",  c.push.enabled);
        read(p, "strength", c.push.strength);
        if (p.contains("layers")) c.push.layers = parse_layers(p.at("layers"));
    }

    if (j.contains("input")) {
        const auto& in = j.at("input");
        read(in, "switch_view_key",   c.input.switch_view_key);
        read(in, "mouse_sensitivity", c.input.mouse_sensitivity);
        read(in, "stick_look_rate",   c.input.stick_look_rate);
        read(in, "stick_deadzone",    c.input.stick_deadzone);
        read(in, "cursor_locked",     c.input.cursor_locked);
    }
}

// ---------------------------------------------------------------------------
// ConfigLoader
// ---------------------------------------------------------------------------

bool ConfigLoader::load_from_string(const std::string& json_str, ControllerConfig& config) {
    try {
        ControllerConfig staged = config;
        parse_config(json::parse(json_str), staged);
        config = staged;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ConfigLoader::load(const std::string& path, ControllerConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(content, config);
}

// ---------------------------------------------------------------------------
// ConfigWatcher
// ---------------------------------------------------------------------------

ConfigWatcher::ConfigWatcher(std::string path, float poll_interval)
    : path_(std::move(path)), poll_interval_(poll_interval) {
    std::error_code ec;
    last_write_ = std::filesystem::last_write_time(path_, ec);
    has_stamp_  = !ec;
}

bool ConfigWatcher::poll(float dt, ControllerConfig& config, Diagnostics* diagnostics) {
    elapsed_ += dt;
    if (elapsed_ < poll_interval_) return false;
    elapsed_ = 0.0f;

    std::error_code ec;
    const auto stamp = std::filesystem::last_write_time(path_, ec);
    if (ec) return false;
    if (has_stamp_ && stamp == last_write_) return false;

    last_write_ = stamp;
    has_stamp_  = true;

    if (!ConfigLoader::load(path_, config)) {
        if (diagnostics)
            diagnostics->emit(Diagnostics::Level::Warning,
                              "CONFIG: failed to reload " + path_ + ", keeping previous values");
        return false;
    }
    if (diagnostics)
        diagnostics->emit(Diagnostics::Level::Info, "CONFIG: reloaded " + path_);
    return true;
}
