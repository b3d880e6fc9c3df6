/// @file gjk.hpp
/// @brief Convex intersection (GJK) and penetration depth (EPA) for impulse_physics
///
/// Both algorithms work on the Minkowski difference A - B sampled through
/// the support mappings of two posed convex shapes.

#pragma once

#include "fwd.hpp"
#include "shape.hpp"

#include <impulse/math/vec.hpp>
#include <impulse/math/transform.hpp>

#include <algorithm>
#include <array>
#include <initializer_list>
#include <optional>

namespace impulse_physics {

// =============================================================================
// Tolerances
// =============================================================================

constexpr float k_collision_epsilon = 1e-6f;  // Zero length for directions and normals
constexpr float k_epa_tolerance = 1e-4f;      // Polytope growth below this ends EPA
constexpr float k_gjk_distance_tolerance = 1e-5f;  // Relative distance improvement that ends GJK

constexpr int k_max_gjk_iterations = 64;
constexpr int k_max_epa_iterations = 64;
constexpr std::size_t k_max_epa_faces = 256;

// =============================================================================
// Shape Proxy
// =============================================================================

/// Convex shape placed in the world
struct ShapeProxy {
    const Shape* shape = nullptr;
    impulse_math::Transform transform;

    /// Create proxy; AABB shapes drop the rotation
    [[nodiscard]] static ShapeProxy make(const Shape& shape, const impulse_math::Transform& transform);

    /// World support point in a world direction
    [[nodiscard]] impulse_math::Vec3 support(const impulse_math::Vec3& direction) const;

    /// Get world position of the shape origin
    [[nodiscard]] const impulse_math::Vec3& center() const noexcept { return transform.position; }
};

// =============================================================================
// Simplex
// =============================================================================

/// Vertex of the Minkowski difference A - B with the witness points that produced it
struct SupportPoint {
    impulse_math::Vec3 point{0.0f};
    impulse_math::Vec3 support_a{0.0f};
    impulse_math::Vec3 support_b{0.0f};
};

/// Up to four support points; index 0 is the newest
struct Simplex {
    std::array<SupportPoint, 4> points{};
    int count = 0;

    /// Insert as newest, dropping the oldest when full
    void push_front(const SupportPoint& p) {
        std::copy_backward(points.begin(), points.begin() + std::min(count, 3), points.begin() + std::min(count, 3) + 1);
        points[0] = p;
        count = std::min(count + 1, 4);
    }

    /// Replace the contents, newest first
    void assign(std::initializer_list<SupportPoint> list) {
        count = static_cast<int>(std::min<std::size_t>(list.size(), 4));
        std::copy_n(list.begin(), count, points.begin());
    }

    [[nodiscard]] int size() const noexcept { return count; }
    [[nodiscard]] const SupportPoint& operator[](int i) const { return points[static_cast<std::size_t>(i)]; }
};

// =============================================================================
// Results
// =============================================================================

struct GjkResult {
    bool intersecting = false;
    Simplex simplex;                                  // Encloses the origin when intersecting
    impulse_math::Vec3 direction{1.0f, 0.0f, 0.0f};  // Last search direction
    int iterations = 0;
};

/// Penetration found by EPA
struct Penetration {
    impulse_math::Vec3 normal{0.0f, 1.0f, 0.0f};  ///< Unit normal from A towards B
    float depth = 0.0f;                           ///< Overlap along the normal
    impulse_math::Vec3 point_a{0.0f};             ///< Deepest point of A (world)
    impulse_math::Vec3 point_b{0.0f};             ///< Deepest point of B (world)
};

/// Nearest points of two disjoint shapes
struct Separation {
    float distance = 0.0f;
    impulse_math::Vec3 normal{1.0f, 0.0f, 0.0f};  ///< Unit direction from A towards B
    impulse_math::Vec3 point_a{0.0f};             ///< On the surface of A (world)
    impulse_math::Vec3 point_b{0.0f};             ///< On the surface of B (world)
};

// =============================================================================
// Algorithms
// =============================================================================

/// Support of A - B in @p direction
[[nodiscard]] SupportPoint minkowski_support(const ShapeProxy& a, const ShapeProxy& b,
                                             const impulse_math::Vec3& direction);

/// Boolean overlap; touching shapes count as intersecting
[[nodiscard]] GjkResult gjk(const ShapeProxy& a, const ShapeProxy& b);

/// Distance query; nullopt when the shapes touch or overlap
[[nodiscard]] std::optional<Separation> gjk_distance(const ShapeProxy& a, const ShapeProxy& b);

/// Run EPA from an enclosing GJK simplex; nullopt when the polytope degenerates
[[nodiscard]] std::optional<Penetration> epa(const ShapeProxy& a, const ShapeProxy& b, const Simplex& simplex);

/// GJK followed by EPA
[[nodiscard]] std::optional<Penetration> gjk_epa(const ShapeProxy& a, const ShapeProxy& b);

} // namespace impulse_physics
