#pragma once

/// @file transform.hpp
/// @brief Rigid transform (rotation then translation) for impulse_math

#include "types.hpp"
#include "vec.hpp"
#include "quat.hpp"

namespace impulse_math {

/// Rigid transform; bodies apply their scale to collider geometry instead
struct Transform {
    Vec3 position = vec3::ZERO;
    Quat rotation = quat::IDENTITY;

    /// Map a local point to the parent space
    [[nodiscard]] Vec3 transform_point(const Vec3& p) const noexcept {
        return position + rotation * p;
    }

    /// Map a local direction to the parent space
    [[nodiscard]] Vec3 transform_vector(const Vec3& v) const noexcept {
        return rotation * v;
    }

    /// Map a parent-space point into local space
    [[nodiscard]] Vec3 inverse_transform_point(const Vec3& p) const noexcept {
        return glm::conjugate(rotation) * (p - position);
    }

    /// Map a parent-space direction into local space
    [[nodiscard]] Vec3 inverse_transform_vector(const Vec3& v) const noexcept {
        return glm::conjugate(rotation) * v;
    }

    /// Compose: apply `child` first, then this transform
    [[nodiscard]] Transform combine(const Transform& child) const noexcept {
        return Transform{transform_point(child.position), normalize_or_identity(rotation * child.rotation)};
    }
};

} // namespace impulse_math
