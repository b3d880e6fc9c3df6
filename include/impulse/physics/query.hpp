/// @file query.hpp
/// @brief Ray queries for impulse_physics

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "shape.hpp"

#include <impulse/math/vec.hpp>
#include <impulse/math/intersect.hpp>
#include <impulse/math/intersect.hpp>
#include <impulse/math/transform.hpp>

#include <optional>

namespace impulse_physics {

// =============================================================================
// Query Results
// =============================================================================

/// Raycast hit result
struct RaycastHit {
    BodyId body;                                ///< Body that was hit
    impulse_math::Vec3 point{0.0f};             ///< Hit position in world space
    impulse_math::Vec3 normal{0.0f, 1.0f, 0.0f};///< Surface normal at hit
    float distance = 0.0f;                      ///< Distance from ray origin
    float fraction = 0.0f;                      ///< Distance over the query's max distance
};

/// Which bodies a query considers
struct QueryFilter {
    CollisionLayer layer_mask = layers::All;    ///< Accepted collider layers
    bool include_triggers = false;

    /// Check a body against the filter; bodies without collider never pass
    [[nodiscard]] bool accepts(const RigidBody& body) const noexcept;
};

// =============================================================================
// Shape Raycasts
// =============================================================================

/// Cast a world ray against a posed shape.
/// @return Distance and world normal of the nearest hit within max_distance
[[nodiscard]] std::optional<impulse_math::RayHit> raycast_shape(
    const Shape& shape,
    const impulse_math::Transform& transform,
    const impulse_math::Ray& ray,
    float max_distance);

/// Cast a world ray against a body's collider
[[nodiscard]] std::optional<RaycastHit> raycast_body(
    const RigidBody& body,
    const impulse_math::Ray& ray,
    float max_distance);

} // namespace impulse_physics
