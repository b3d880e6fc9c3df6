#pragma once

/// @file intersect.hpp
/// @brief Rays and ray-primitive tests for impulse_math
///
/// Every test returns the distance along the ray and the outward surface
/// normal at the hit. A ray starting inside a solid reports the exit point,
/// except for half-spaces which report a hit at distance zero.

#include "types.hpp"
#include "vec.hpp"
#include "bounds.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>

namespace impulse_math {

// =============================================================================
// Ray
// =============================================================================

/// Half-line with a unit direction. Distances along it are in meters.
struct Ray {
    Vec3 origin = vec3::ZERO;
    Vec3 direction = vec3::NEG_Z;

    constexpr Ray() noexcept = default;

    /// `dir` need not be unit length; a zero `dir` gives an invalid ray
    Ray(const Vec3& orig, const Vec3& dir) noexcept
        : origin(orig), direction(normalize_or_zero(dir)) {}

    [[nodiscard]] Vec3 at(float t) const noexcept { return origin + t * direction; }

    [[nodiscard]] bool is_valid() const noexcept {
        return glm::length2(direction) > consts::EPSILON;
    }
};

/// Distance and outward normal of a ray hit
using RayHit = std::pair<float, Vec3>;

// =============================================================================
// Box
// =============================================================================

/// Slab test against an axis-aligned box
[[nodiscard]] inline std::optional<RayHit> ray_aabb_with_normal(const Ray& ray, const AABB& box) noexcept {
    float t_enter = -consts::MAX_FLOAT;
    float t_exit = consts::MAX_FLOAT;
    int enter_axis = 0;
    int exit_axis = 0;

    for (int axis = 0; axis < 3; ++axis) {
        const float inv = 1.0f / ray.direction[axis];
        float near = (box.min[axis] - ray.origin[axis]) * inv;
        float far = (box.max[axis] - ray.origin[axis]) * inv;
        if (near > far) {
            std::swap(near, far);
        }
        // A NaN slab (parallel ray on the boundary) fails these comparisons
        // and leaves the interval untouched
        if (near > t_enter) {
            t_enter = near;
            enter_axis = axis;
        }
        if (far < t_exit) {
            t_exit = far;
            exit_axis = axis;
        }
    }

    if (t_exit < 0.0f || t_enter > t_exit) {
        return std::nullopt;
    }

    Vec3 normal = vec3::ZERO;
    if (t_enter < 0.0f) {
        normal[exit_axis] = ray.direction[exit_axis] > 0.0f ? 1.0f : -1.0f;
        return RayHit{t_exit, normal};
    }
    normal[enter_axis] = ray.direction[enter_axis] > 0.0f ? -1.0f : 1.0f;
    return RayHit{t_enter, normal};
}

// =============================================================================
// Sphere
// =============================================================================

/// Nearest non-negative distance to the sphere surface
[[nodiscard]] inline std::optional<float> ray_sphere(const Ray& ray, const Vec3& center, float radius) noexcept {
    const Vec3 m = ray.origin - center;
    const float b = glm::dot(m, ray.direction);
    const float c = glm::dot(m, m) - radius * radius;

    // Outside and pointing away
    if (c > 0.0f && b > 0.0f) {
        return std::nullopt;
    }
    const float disc = b * b - c;
    if (disc < 0.0f) {
        return std::nullopt;
    }
    const float root = std::sqrt(disc);
    const float t = -b - root;
    return t >= 0.0f ? t : -b + root;
}

[[nodiscard]] inline std::optional<RayHit> ray_sphere_with_normal(const Ray& ray, const Vec3& center,
                                                                  float radius) noexcept {
    const auto t = ray_sphere(ray, center, radius);
    if (!t) {
        return std::nullopt;
    }
    return RayHit{*t, normalize_or(ray.at(*t) - center, -ray.direction)};
}

// =============================================================================
// Half-space
// =============================================================================

/// Ray against the solid region dot(normal, p) <= offset
[[nodiscard]] inline std::optional<RayHit> ray_half_space(const Ray& ray, const Vec3& normal, float offset) noexcept {
    const float height = glm::dot(normal, ray.origin) - offset;
    if (height <= 0.0f) {
        return RayHit{0.0f, normal};
    }
    const float approach = glm::dot(normal, ray.direction);
    if (approach > -consts::EPSILON) {
        return std::nullopt;
    }
    return RayHit{-height / approach, normal};
}

// =============================================================================
// Capsule
// =============================================================================

/// Capsule of `radius` around the segment [a, b]
[[nodiscard]] inline std::optional<RayHit> ray_capsule_with_normal(const Ray& ray, const Vec3& a, const Vec3& b,
                                                                   float radius) noexcept {
    const Vec3 axis = b - a;
    const float axis_len_sq = glm::dot(axis, axis);
    if (axis_len_sq < consts::EPSILON) {
        return ray_sphere_with_normal(ray, a, radius);
    }

    std::optional<RayHit> best = ray_sphere_with_normal(ray, a, radius);
    if (auto cap = ray_sphere_with_normal(ray, b, radius); cap && (!best || cap->first < best->first)) {
        best = cap;
    }

    // Infinite cylinder: remove the axial part of origin and direction
    const Vec3 rel = ray.origin - a;
    const float dir_along = glm::dot(axis, ray.direction) / axis_len_sq;
    const float rel_along = glm::dot(axis, rel) / axis_len_sq;
    const Vec3 d = ray.direction - dir_along * axis;
    const Vec3 o = rel - rel_along * axis;

    const float qa = glm::dot(d, d);
    if (qa <= consts::EPSILON) {
        return best;  // Parallel to the axis: only the caps can be hit
    }
    const float qb = glm::dot(d, o);
    const float qc = glm::dot(o, o) - radius * radius;
    const float disc = qb * qb - qa * qc;
    if (disc < 0.0f) {
        return best;
    }

    const float root = std::sqrt(disc);
    for (const float t : {(-qb - root) / qa, (-qb + root) / qa}) {
        const float s = rel_along + dir_along * t;
        if (t < 0.0f || s < 0.0f || s > 1.0f) {
            continue;
        }
        if (!best || t < best->first) {
            best = RayHit{t, normalize_or(ray.at(t) - (a + s * axis), -ray.direction)};
        }
        break;
    }
    return best;
}

} // namespace impulse_math
