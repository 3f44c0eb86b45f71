#pragma once
#include <ecs/ecs.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace locomotion::math {

constexpr float kPi      = 3.1415926535f;
constexpr float kDeg2Rad = kPi / 180.0f;
constexpr float kRad2Deg = 180.0f / kPi;

// ---------------------------------------------------------------------------
// Scalar helpers
// ---------------------------------------------------------------------------

/**
 * @brief Wraps an angle into [-360, 360] with a single correction step, then
 * clamps it into [min, max].
 *
 * Not a general normalizer: inputs are expected to be within roughly two
 * turns of the range. Passing lowest()/max() for the bounds leaves only the
 * wrap.
 */
inline float clamp_angle(float angle, float min, float max) {
    if (angle < -360.0f) angle += 360.0f;
    if (angle >  360.0f) angle -= 360.0f;
    return std::clamp(angle, min, max);
}

inline float clamp_angle_unbounded(float angle) {
    return clamp_angle(angle, std::numeric_limits<float>::lowest(),
                       std::numeric_limits<float>::max());
}

/**
 * @brief Linear step from current toward target, never overshooting.
 */
inline float move_towards(float current, float target, float max_delta) {
    if (std::abs(target - current) <= max_delta) return target;
    return current + (target > current ? max_delta : -max_delta);
}

/**
 * @brief Lerp with t clamped to [0, 1].
 */
inline float lerp(float a, float b, float t) {
    return a + (b - a) * std::clamp(t, 0.0f, 1.0f);
}

inline float inverse_lerp(float a, float b, float value) {
    if (a == b) return 0.0f;
    return std::clamp((value - a) / (b - a), 0.0f, 1.0f);
}

/**
 * @brief Loops t so that it is never larger than length and never smaller than 0.
 */
inline float repeat(float t, float length) {
    return std::clamp(t - std::floor(t / length) * length, 0.0f, length);
}

/**
 * @brief Shortest signed difference between two angles in degrees, in (-180, 180].
 */
inline float delta_angle(float current, float target) {
    float delta = repeat(target - current, 360.0f);
    if (delta > 180.0f) delta -= 360.0f;
    return delta;
}

inline float round_to(float value, float step) {
    return std::round(value / step) * step;
}

/**
 * @brief Critically damped spring toward target (Game Programming Gems 4, 1.10).
 * velocity is caller-owned scratch carried across frames.
 */
inline float smooth_damp(float current, float target, float& velocity,
                         float smooth_time, float dt) {
    smooth_time = std::max(0.0001f, smooth_time);
    const float omega = 2.0f / smooth_time;
    const float x     = omega * dt;
    const float decay = 1.0f / (1.0f + x + 0.48f * x * x + 0.235f * x * x * x);

    const float change    = current - target;
    const float original  = target;
    const float temp      = (velocity + omega * change) * dt;
    velocity              = (velocity - omega * temp) * decay;
    float output          = (current - change) + (change + temp) * decay;

    // Prevent overshooting
    if ((original - current > 0.0f) == (output > original)) {
        output   = original;
        velocity = dt > 0.0f ? (output - original) / dt : 0.0f;
    }
    return output;
}

inline float smooth_damp_angle(float current, float target, float& velocity,
                               float smooth_time, float dt) {
    target = current + delta_angle(current, target);
    return smooth_damp(current, target, velocity, smooth_time, dt);
}

// ---------------------------------------------------------------------------
// Vector helpers (ecs::Vec3 is plain data here)
// ---------------------------------------------------------------------------

inline ecs::Vec3 add(const ecs::Vec3& a, const ecs::Vec3& b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
inline ecs::Vec3 sub(const ecs::Vec3& a, const ecs::Vec3& b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
inline ecs::Vec3 scale(const ecs::Vec3& v, float s)          { return {v.x * s, v.y * s, v.z * s}; }
inline float     dot(const ecs::Vec3& a, const ecs::Vec3& b)  { return a.x * b.x + a.y * b.y + a.z * b.z; }
inline float     length_sq(const ecs::Vec3& v)                { return dot(v, v); }
inline float     length(const ecs::Vec3& v)                   { return std::sqrt(length_sq(v)); }

inline ecs::Vec3 cross(const ecs::Vec3& a, const ecs::Vec3& b) {
    return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}

/**
 * @brief Unit vector, or zero when the input is (near) zero.
 */
inline ecs::Vec3 normalized(const ecs::Vec3& v) {
    const float len = length(v);
    if (len < 1e-5f) return {0.0f, 0.0f, 0.0f};
    return scale(v, 1.0f / len);
}

inline ecs::Vec3 flatten(const ecs::Vec3& v) { return {v.x, 0.0f, v.z}; }

// ---------------------------------------------------------------------------
// Headings
//
// Yaw is measured in degrees about +Y. Yaw 0 faces +Z, and increasing yaw
// turns toward the view-right vector (forward x up), so a positive look.x
// turns the view to the right.
// ---------------------------------------------------------------------------

inline ecs::Vec3 heading_forward(float yaw_deg) {
    const float r = yaw_deg * kDeg2Rad;
    return {-std::sin(r), 0.0f, std::cos(r)};
}

inline ecs::Vec3 heading_right(float yaw_deg) {
    const float r = yaw_deg * kDeg2Rad;
    return {-std::cos(r), 0.0f, -std::sin(r)};
}

/**
 * @brief Yaw in degrees of a horizontal direction; inverse of heading_forward.
 */
inline float heading_of(float dx, float dz) {
    return std::atan2(-dx, dz) * kRad2Deg;
}

/**
 * @brief View direction for a yaw/pitch pair. Positive pitch looks down.
 */
inline ecs::Vec3 view_direction(float yaw_deg, float pitch_deg) {
    const float p = pitch_deg * kDeg2Rad;
    const ecs::Vec3 f = heading_forward(yaw_deg);
    return {f.x * std::cos(p), -std::sin(p), f.z * std::cos(p)};
}

/**
 * @brief Rotation about +Y matching heading_forward(yaw_deg).
 */
inline ecs::Quat quat_from_yaw(float yaw_deg) {
    const float half = -0.5f * yaw_deg * kDeg2Rad;
    return {0.0f, std::sin(half), 0.0f, std::cos(half)};
}

/**
 * @brief Yaw of the +Z axis after rotation by q.
 */
inline float yaw_from_quat(const ecs::Quat& q) {
    const float fx = 2.0f * (q.x * q.z + q.w * q.y);
    const float fz = 1.0f - 2.0f * (q.x * q.x + q.y * q.y);
    return heading_of(fx, fz);
}

} // namespace locomotion::math
