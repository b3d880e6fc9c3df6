#pragma once

/// @file types.hpp
/// @brief GLM aliases and constants shared by impulse_math and impulse_physics
///
/// Everything is single precision. Quaternions are unit length unless a
/// function says otherwise; GLM stores them as (w, x, y, z).

#define GLM_FORCE_RADIANS
#define GLM_ENABLE_EXPERIMENTAL

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtx/quaternion.hpp>
#include <glm/gtx/norm.hpp>

#include <limits>

namespace impulse_math {

using Vec3 = glm::vec3;
using Mat3 = glm::mat3;
using Quat = glm::quat;

struct Transform;
struct AABB;
struct Ray;

// =============================================================================
// Scalar Constants
// =============================================================================

namespace consts {
    inline constexpr float PI        = 3.14159265358979323846f;
    inline constexpr float TAU       = 6.28318530717958647692f;
    inline constexpr float HALF_PI   = 1.57079632679489661923f;

    /// Below this a length or determinant is treated as zero
    inline constexpr float EPSILON   = 1e-6f;

    /// Geometric tolerance for iterative queries (m)
    inline constexpr float TOLERANCE = 1e-4f;

    inline constexpr float MAX_FLOAT = std::numeric_limits<float>::max();
}

// =============================================================================
// Axes and Identities
// =============================================================================

namespace vec3 {
    inline constexpr Vec3 ZERO  = Vec3(0.0f);
    inline constexpr Vec3 X     = Vec3(1.0f, 0.0f, 0.0f);
    inline constexpr Vec3 Y     = Vec3(0.0f, 1.0f, 0.0f);
    inline constexpr Vec3 Z     = Vec3(0.0f, 0.0f, 1.0f);
    inline constexpr Vec3 NEG_X = Vec3(-1.0f, 0.0f, 0.0f);
    inline constexpr Vec3 NEG_Y = Vec3(0.0f, -1.0f, 0.0f);
    inline constexpr Vec3 NEG_Z = Vec3(0.0f, 0.0f, -1.0f);

    /// Gravity acts along DOWN by default
    inline constexpr Vec3 UP    = Y;
    inline constexpr Vec3 DOWN  = NEG_Y;
}

namespace mat3 {
    inline const Mat3 IDENTITY = Mat3(1.0f);
    inline const Mat3 ZERO     = Mat3(0.0f);
}

namespace quat {
    inline const Quat IDENTITY = Quat(1.0f, 0.0f, 0.0f, 0.0f);
}

} // namespace impulse_math
