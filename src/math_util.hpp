#pragma once
#include <ecs/ecs.hpp>
#include <cmath>
#include <algorithm>

// ---------------------------------------------------------------------------
// Vector helpers over ecs::Vec3 for the headless controller code.
// Jolt math stays in the physics systems; nothing here pulls in Jolt.
// ---------------------------------------------------------------------------

namespace tnua::math {

inline ecs::Vec3 add(const ecs::Vec3& a, const ecs::Vec3& b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
inline ecs::Vec3 sub(const ecs::Vec3& a, const ecs::Vec3& b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
inline ecs::Vec3 scale(const ecs::Vec3& v, float s)          { return {v.x * s, v.y * s, v.z * s}; }
inline float     dot(const ecs::Vec3& a, const ecs::Vec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
inline float     length_sq(const ecs::Vec3& v)               { return dot(v, v); }
inline float     length(const ecs::Vec3& v)                  { return std::sqrt(length_sq(v)); }

/**
 * @brief Component of v along the (unit) axis.
 */
inline float along(const ecs::Vec3& v, const ecs::Vec3& axis) { return dot(v, axis); }

/**
 * @brief Removes the component of v along the (unit) axis.
 */
inline ecs::Vec3 reject(const ecs::Vec3& v, const ecs::Vec3& axis) {
    return sub(v, scale(axis, dot(v, axis)));
}

/**
 * @brief Returns v / |v|, or zero when v is (nearly) zero.
 */
inline ecs::Vec3 normalized_or_zero(const ecs::Vec3& v) {
    float len = length(v);
    if (len < 0.001f) return {0, 0, 0};
    return scale(v, 1.0f / len);
}

/**
 * @brief Acceleration that moves `current` toward `target` by the given
 * fraction per second, never overshooting within a single frame of `dt`.
 */
inline ecs::Vec3 approach_acceleration(const ecs::Vec3& current, const ecs::Vec3& target,
                                       float rate, float dt) {
    if (dt <= 0.0f) return {0, 0, 0};
    float fraction = std::min(rate * dt, 1.0f);
    return scale(sub(target, current), fraction / dt);
}

} // namespace tnua::math
