#pragma once

/// @file mat.hpp
/// @brief Inertia tensor helpers for impulse_math

#include "types.hpp"
#include <cmath>

namespace impulse_math {

/// diag(d.x, d.y, d.z)
[[nodiscard]] inline Mat3 mat3_from_diagonal(const Vec3& d) noexcept {
    Mat3 m(0.0f);
    m[0][0] = d.x;
    m[1][1] = d.y;
    m[2][2] = d.z;
    return m;
}

[[nodiscard]] inline Vec3 diagonal(const Mat3& m) noexcept {
    return Vec3(m[0][0], m[1][1], m[2][2]);
}

/// Matrix form of the cross product: skew(a) * b == cross(a, b)
[[nodiscard]] inline Mat3 skew(const Vec3& a) noexcept {
    // GLM is column major
    return Mat3(0.0f, a.z, -a.y,
                -a.z, 0.0f, a.x,
                a.y, -a.x, 0.0f);
}

[[nodiscard]] inline Mat3 outer(const Vec3& a, const Vec3& b) noexcept {
    return glm::outerProduct(a, b);
}

/// Inverse of m. A singular or non-finite m yields the zero matrix, so an
/// axis without inertia simply does not respond.
[[nodiscard]] inline Mat3 inverse_or_zero(const Mat3& m, float min_determinant = 1e-9f) noexcept {
    const float det = glm::determinant(m);
    return (std::isfinite(det) && std::abs(det) >= min_determinant) ? glm::inverse(m) : mat3::ZERO;
}

/// Body-space tensor to world space: R * I * R^T
[[nodiscard]] inline Mat3 rotate_tensor(const Mat3& rotation, const Mat3& tensor) noexcept {
    return rotation * tensor * glm::transpose(rotation);
}

[[nodiscard]] inline bool is_finite(const Mat3& m) noexcept {
    for (int c = 0; c < 3; ++c) {
        if (!std::isfinite(m[c].x) || !std::isfinite(m[c].y) || !std::isfinite(m[c].z)) {
            return false;
        }
    }
    return true;
}

} // namespace impulse_math
