/// @file collision.hpp
/// @brief Narrow phase contact generation for impulse_physics
///
/// Pairs with a closed-form answer (sphere, capsule, plane and box against
/// spheres) are solved directly. Remaining convex pairs run GJK/EPA for the
/// normal and then clip the incident feature against the reference face to
/// build up to four points. Compound shapes are split into child pairs,
/// each reported with its own feature id.

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "shape.hpp"
#include "contact.hpp"

#include <impulse/math/vec.hpp>
#include <impulse/math/transform.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace impulse_physics {

// =============================================================================
// Constants
// =============================================================================

/// Points closer than this (but not yet touching) are kept as speculative contacts
constexpr float k_contact_margin = 0.01f;

/// Capsules within this angle cosine of a face are treated as lying on it
constexpr float k_capsule_parallel_cos = 0.3f;

// =============================================================================
// Shape Contact
// =============================================================================

/// Contact geometry between two posed shapes
struct ShapeContact {
    impulse_math::Vec3 normal{0.0f, 1.0f, 0.0f};  ///< Unit normal from A towards B
    std::vector<ContactPoint> points;             ///< point_a, point_b and separation filled
    std::uint32_t feature_id = 0;                 ///< Compound child pair, 0 otherwise
};

/// Feature id of a compound child pair; -1 marks a non-compound side
[[nodiscard]] constexpr std::uint32_t make_feature_id(int child_a, int child_b) noexcept {
    return (static_cast<std::uint32_t>(child_a + 1) << 16) | static_cast<std::uint32_t>(child_b + 1);
}

// =============================================================================
// Closed-form Tests
// =============================================================================

/// Sphere against sphere
[[nodiscard]] std::optional<ShapeContact> collide_sphere_sphere(
    const impulse_math::Vec3& center_a, float radius_a,
    const impulse_math::Vec3& center_b, float radius_b,
    float margin = k_contact_margin);

/// Sphere against capsule segment
[[nodiscard]] std::optional<ShapeContact> collide_sphere_capsule(
    const impulse_math::Vec3& center, float radius,
    const impulse_math::Vec3& seg_a, const impulse_math::Vec3& seg_b, float capsule_radius,
    float margin = k_contact_margin);

/// Capsule against capsule; parallel overlapping capsules get two points
[[nodiscard]] std::optional<ShapeContact> collide_capsule_capsule(
    const impulse_math::Vec3& a0, const impulse_math::Vec3& a1, float radius_a,
    const impulse_math::Vec3& b0, const impulse_math::Vec3& b1, float radius_b,
    float margin = k_contact_margin);

/// Sphere against a box given by its transform and half extents
[[nodiscard]] std::optional<ShapeContact> collide_sphere_box(
    const impulse_math::Vec3& center, float radius,
    const impulse_math::Transform& box, const impulse_math::Vec3& half_extents,
    float margin = k_contact_margin);

/// Convex shape (A) against a half-space (B)
[[nodiscard]] std::optional<ShapeContact> collide_convex_plane(
    const Shape& shape, const impulse_math::Transform& shape_transform,
    const PlaneShape& plane, const impulse_math::Transform& plane_transform,
    float margin = k_contact_margin);

/// General convex pair through GJK/EPA and face clipping
[[nodiscard]] std::optional<ShapeContact> collide_convex(
    const Shape& a, const impulse_math::Transform& ta,
    const Shape& b, const impulse_math::Transform& tb,
    float margin = k_contact_margin);

// =============================================================================
// Dispatch
// =============================================================================

/// Contact between two non-compound shapes, picking the cheapest test for the pair
[[nodiscard]] std::optional<ShapeContact> collide_shapes(
    const Shape& a, const impulse_math::Transform& ta,
    const Shape& b, const impulse_math::Transform& tb,
    float margin = k_contact_margin);

/// All contacts between two colliders, splitting compounds into child pairs.
/// Degenerate shapes produce a warning and no contact.
void collide(const Shape& a, const impulse_math::Transform& ta,
             const Shape& b, const impulse_math::Transform& tb,
             std::vector<ShapeContact>& out,
             float margin = k_contact_margin);

} // namespace impulse_physics
