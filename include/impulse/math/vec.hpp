#pragma once

/// @file vec.hpp
/// @brief Vec3 helpers for impulse_math

#include "types.hpp"
#include <cmath>
#include <utility>

namespace impulse_math {

// =============================================================================
// GLM Forwarders
// =============================================================================

template<typename T>
[[nodiscard]] inline T normalize(const T& v) noexcept { return glm::normalize(v); }

template<typename T>
[[nodiscard]] inline auto dot(const T& a, const T& b) noexcept { return glm::dot(a, b); }

template<typename T>
[[nodiscard]] inline float length(const T& v) noexcept { return glm::length(v); }

template<typename T>
[[nodiscard]] inline float length_squared(const T& v) noexcept { return glm::length2(v); }

[[nodiscard]] inline Vec3 cross(const Vec3& a, const Vec3& b) noexcept { return glm::cross(a, b); }
[[nodiscard]] inline Vec3 min(const Vec3& a, const Vec3& b) noexcept { return glm::min(a, b); }
[[nodiscard]] inline Vec3 max(const Vec3& a, const Vec3& b) noexcept { return glm::max(a, b); }
[[nodiscard]] inline Vec3 abs(const Vec3& v) noexcept { return glm::abs(v); }

[[nodiscard]] inline Vec3 splat3(float v) noexcept { return Vec3(v); }

[[nodiscard]] inline float distance_squared(const Vec3& a, const Vec3& b) noexcept {
    return glm::length2(b - a);
}

[[nodiscard]] inline float min_component(const Vec3& v) noexcept {
    return std::fmin(v.x, std::fmin(v.y, v.z));
}

[[nodiscard]] inline float max_component(const Vec3& v) noexcept {
    return std::fmax(v.x, std::fmax(v.y, v.z));
}

// =============================================================================
// Safe Normalization
// =============================================================================

/// Unit vector along v, or `fallback` when v is (nearly) zero
[[nodiscard]] inline Vec3 normalize_or(const Vec3& v, const Vec3& fallback) noexcept {
    const float len_sq = glm::length2(v);
    return len_sq < consts::EPSILON * consts::EPSILON ? fallback : v / std::sqrt(len_sq);
}

[[nodiscard]] inline Vec3 normalize_or_zero(const Vec3& v) noexcept {
    return normalize_or(v, vec3::ZERO);
}

// =============================================================================
// Contact Frames
// =============================================================================

/// Some unit vector orthogonal to the unit vector n
[[nodiscard]] inline Vec3 any_perpendicular(const Vec3& n) noexcept {
    // Cross with the axis least aligned with n
    const Vec3 axis = std::abs(n.x) > 0.9f ? vec3::Y : vec3::X;
    return glm::normalize(glm::cross(axis, n));
}

/// Friction directions: (t1, t2, n) is a right-handed orthonormal frame
[[nodiscard]] inline std::pair<Vec3, Vec3> tangent_basis(const Vec3& n) noexcept {
    const Vec3 t1 = any_perpendicular(n);
    return {t1, glm::cross(n, t1)};
}

// =============================================================================
// Checks
// =============================================================================

/// False when any component is NaN or infinite
[[nodiscard]] inline bool is_finite(const Vec3& v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

/// Component-wise comparison within `epsilon`
[[nodiscard]] inline bool approx_equal(const Vec3& a, const Vec3& b,
                                       float epsilon = consts::EPSILON) noexcept {
    const Vec3 d = glm::abs(a - b);
    return d.x < epsilon && d.y < epsilon && d.z < epsilon;
}

} // namespace impulse_math
