#pragma once

/// @file quat.hpp
/// @brief Orientation helpers for impulse_math

#include "types.hpp"
#include "vec.hpp"
#include <cmath>

namespace impulse_math {

/// Rotation of `angle` radians about the unit vector `axis`
[[nodiscard]] inline Quat quat_from_axis_angle(const Vec3& axis, float angle) noexcept {
    return glm::angleAxis(angle, axis);
}

/// Rotation whose axis is the direction of `rotation` and angle its length
[[nodiscard]] inline Quat quat_from_rotation_vector(const Vec3& rotation) noexcept {
    const float angle = glm::length(rotation);
    return angle < consts::EPSILON ? quat::IDENTITY : glm::angleAxis(angle, rotation / angle);
}

/// Unit quaternion along q. Zero or non-finite input gives the identity.
[[nodiscard]] inline Quat normalize_or_identity(const Quat& q) noexcept {
    const float len_sq = glm::length2(q);
    if (!std::isfinite(len_sq) || len_sq < consts::EPSILON * consts::EPSILON) {
        return quat::IDENTITY;
    }
    return q / std::sqrt(len_sq);
}

[[nodiscard]] inline Vec3 rotate(const Quat& q, const Vec3& v) noexcept { return q * v; }
[[nodiscard]] inline Vec3 inverse_rotate(const Quat& q, const Vec3& v) noexcept { return glm::conjugate(q) * v; }
[[nodiscard]] inline Mat3 quat_to_mat3(const Quat& q) noexcept { return glm::mat3_cast(q); }

/// Advance orientation q by the rotation vector `omega * dt`.
/// First order: q' = q + 0.5 * (0, w) * q, renormalized.
[[nodiscard]] inline Quat integrate_rotation(const Quat& q, const Vec3& rotation) noexcept {
    const Quat spin(0.0f, rotation.x, rotation.y, rotation.z);
    return normalize_or_identity(q + (spin * q) * 0.5f);
}

/// Rotation vector (small angle) that turns `from` into `to`
[[nodiscard]] inline Vec3 rotation_error(const Quat& from, const Quat& to) noexcept {
    Quat delta = to * glm::conjugate(from);
    // Shortest arc
    if (delta.w < 0.0f) {
        delta = -delta;
    }
    return 2.0f * Vec3(delta.x, delta.y, delta.z);
}

[[nodiscard]] inline bool is_finite(const Quat& q) noexcept {
    return std::isfinite(q.w) && std::isfinite(q.x) && std::isfinite(q.y) && std::isfinite(q.z);
}

/// Same rotation within `epsilon`; q and -q compare equal
[[nodiscard]] inline bool approx_equal(const Quat& a, const Quat& b,
                                       float epsilon = consts::EPSILON) noexcept {
    return std::abs(glm::dot(a, b)) > 1.0f - epsilon;
}

} // namespace impulse_math
