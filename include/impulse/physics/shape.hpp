/// @file shape.hpp
/// @brief Collision shape definitions for impulse_physics
///
/// Shapes are plain values held in a closed std::variant. Every operation
/// that depends on the shape kind is a free function dispatching with
/// std::visit, so adding a shape kind fails to compile until each operation
/// handles it.

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <impulse/math/vec.hpp>
#include <impulse/math/quat.hpp>
#include <impulse/math/mat.hpp>
#include <impulse/math/bounds.hpp>
#include <impulse/math/transform.hpp>

#include <cstdint>
#include <span>
#include <utility>
#include <variant>
#include <vector>

namespace impulse_physics {

// =============================================================================
// Primitive Shapes
// =============================================================================

/// Sphere centered on the collider origin
struct SphereShape {
    float radius = 0.5f;
};

/// Box that stays aligned with the world axes whatever the body orientation
struct AabbShape {
    impulse_math::Vec3 half_extents{0.5f, 0.5f, 0.5f};
};

/// Oriented box, rotates with its body
struct BoxShape {
    impulse_math::Vec3 half_extents{0.5f, 0.5f, 0.5f};

    /// Create cube with the given edge length
    [[nodiscard]] static BoxShape cube(float size) {
        return BoxShape{impulse_math::splat3(size * 0.5f)};
    }
};

/// Capsule collision shape (segment with hemispherical caps)
struct CapsuleShape {
    float radius = 0.5f;
    float half_height = 0.5f;          ///< Half length of the inner segment
    CapsuleAxis axis = CapsuleAxis::Y;

    /// Unit vector of the segment in local space
    [[nodiscard]] impulse_math::Vec3 axis_vector() const noexcept;

    /// Local segment endpoints (cap centers)
    [[nodiscard]] std::pair<impulse_math::Vec3, impulse_math::Vec3> endpoints() const noexcept;

    /// Total length including caps
    [[nodiscard]] float height() const noexcept { return 2.0f * (half_height + radius); }
};

/// Static half-space: the solid is every point with dot(normal, p) <= offset
struct PlaneShape {
    impulse_math::Vec3 normal{0.0f, 1.0f, 0.0f};
    float offset = 0.0f;

    /// Create XZ ground plane at the given height
    [[nodiscard]] static PlaneShape ground(float height = 0.0f) {
        return PlaneShape{impulse_math::vec3::Y, height};
    }

    /// Get signed distance to point (negative inside the solid)
    [[nodiscard]] float signed_distance(const impulse_math::Vec3& point) const noexcept {
        return impulse_math::dot(normal, point) - offset;
    }
};

// =============================================================================
// Convex Hull Shape
// =============================================================================

/// One face of a convex hull
struct HullFace {
    impulse_math::Vec3 normal;             ///< Outward unit normal
    float offset = 0.0f;                   ///< dot(normal, p) for points on the face
    std::vector<std::uint32_t> indices;    ///< Vertices, counter-clockwise seen from outside
};

/// Convex hull collision shape
struct ConvexHullShape {
    std::vector<impulse_math::Vec3> vertices;  ///< Hull corners only
    std::vector<HullFace> faces;
    impulse_math::Vec3 centroid{0.0f};         ///< Average of the corners

    /// Build the hull of a point cloud.
    /// Interior and duplicate points are discarded. A cloud spanning no
    /// volume yields a hull with no faces, which is reported as degenerate.
    [[nodiscard]] static ConvexHullShape from_points(std::span<const impulse_math::Vec3> points);

    /// Create box-shaped hull
    [[nodiscard]] static ConvexHullShape box(const impulse_math::Vec3& half_extents);

    /// Check if the hull encloses a volume
    [[nodiscard]] bool is_valid() const noexcept { return faces.size() >= 4 && vertices.size() >= 4; }
};

// =============================================================================
// Shape Variant
// =============================================================================

/// Closed set of collision shapes
using Shape = std::variant<
    SphereShape,
    AabbShape,
    BoxShape,
    CapsuleShape,
    ConvexHullShape,
    PlaneShape,
    CompoundShape
>;

/// Union of several child shapes with their own local transforms
struct CompoundShape {
    std::vector<CompoundChild> children;

    /// Add child shape
    CompoundShape& add(Shape shape,
                       const impulse_math::Vec3& position = impulse_math::vec3::ZERO,
                       const impulse_math::Quat& rotation = impulse_math::quat::IDENTITY);
};

/// Child of a compound shape
struct CompoundChild {
    Shape shape;
    impulse_math::Vec3 position{0.0f};
    impulse_math::Quat rotation = impulse_math::quat::IDENTITY;

    [[nodiscard]] impulse_math::Transform local_transform() const noexcept {
        return impulse_math::Transform{position, rotation};
    }
};

namespace detail {

/// Dependent false for exhaustive std::visit chains
template<typename>
inline constexpr bool always_false_v = false;

} // namespace detail

// =============================================================================
// Mass Properties
// =============================================================================

/// Mass distribution of a shape
struct MassProperties {
    float mass = 1.0f;                                         ///< Total mass (kg)
    impulse_math::Vec3 center_of_mass{0.0f};                   ///< Local space center of mass
    impulse_math::Mat3 inertia = impulse_math::mat3::IDENTITY; ///< Local tensor about the shape origin
};

// =============================================================================
// Shape Operations
// =============================================================================

/// Get the tag of a shape
[[nodiscard]] ShapeType shape_type(const Shape& shape) noexcept;

/// Check if the shape is a closed convex solid usable by GJK
[[nodiscard]] bool is_convex(const Shape& shape) noexcept;

/// Check if the shape has finite extent (planes do not)
[[nodiscard]] bool is_bounded(const Shape& shape) noexcept;

/// Check for zero-extent or malformed parameters
[[nodiscard]] bool is_degenerate(const Shape& shape) noexcept;

/// Farthest local point in a local direction
[[nodiscard]] impulse_math::Vec3 local_support(const Shape& shape, const impulse_math::Vec3& direction);

/// Local space bounds
[[nodiscard]] impulse_math::AABB local_bounds(const Shape& shape);

/// World bounds under a transform. AABB shapes ignore the rotation.
[[nodiscard]] impulse_math::AABB world_bounds(const Shape& shape, const impulse_math::Transform& transform);

/// Enclosed volume (zero for planes)
[[nodiscard]] float volume(const Shape& shape);

/// Smallest distance from the shape center to its surface
[[nodiscard]] float min_half_thickness(const Shape& shape);

/// Mass properties for a given total mass
[[nodiscard]] MassProperties compute_mass_properties(const Shape& shape, float mass);

/// Test if a local point is inside the solid
[[nodiscard]] bool contains_point(const Shape& shape, const impulse_math::Vec3& point);

/// Shape with its local geometry stretched by a per-axis factor.
/// Round shapes take the largest relevant factor, so a sphere stays a sphere;
/// hulls and compound child positions are scaled exactly.
[[nodiscard]] Shape scaled(const Shape& shape, const impulse_math::Vec3& scale);

} // namespace impulse_physics
