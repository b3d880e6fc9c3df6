/// @file contact.hpp
/// @brief Contact manifolds and the warm-start cache for impulse_physics
///
/// A manifold holds up to four points sharing one normal. Manifolds are
/// keyed by the body pair plus a feature id (the sub-shape pair for
/// compound colliders). Between steps the solved impulses are kept in a
/// ContactCache and copied onto the nearest point of the next manifold.

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <impulse/math/vec.hpp>

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace impulse_physics {

// =============================================================================
// Constants
// =============================================================================

/// Most points a manifold keeps
constexpr std::size_t k_max_manifold_points = 4;

// =============================================================================
// Contact Point
// =============================================================================

/// Single contact point
struct ContactPoint {
    impulse_math::Vec3 point_a{0.0f};      ///< Surface point on A (world space)
    impulse_math::Vec3 point_b{0.0f};      ///< Surface point on B (world space)
    impulse_math::Vec3 local_a{0.0f};      ///< point_a in body A space
    impulse_math::Vec3 local_b{0.0f};      ///< point_b in body B space
    float separation = 0.0f;               ///< Signed distance along the normal, negative = overlap

    // Accumulated impulses (warm starting)
    float normal_impulse = 0.0f;
    float tangent_impulse_1 = 0.0f;
    float tangent_impulse_2 = 0.0f;

    /// Midpoint between the two surfaces
    [[nodiscard]] impulse_math::Vec3 position() const noexcept { return (point_a + point_b) * 0.5f; }
};

// =============================================================================
// Contact Manifold
// =============================================================================

/// Contact manifold for one body pair and feature
struct ContactManifold {
    BodyId body_a;
    BodyId body_b;
    std::uint32_t feature_id = 0;                  ///< Sub-shape pair, 0 for simple colliders

    impulse_math::Vec3 normal{0.0f, 1.0f, 0.0f};   ///< Contact normal (A -> B)
    impulse_math::Vec3 tangent_1{1.0f, 0.0f, 0.0f};
    impulse_math::Vec3 tangent_2{0.0f, 0.0f, 1.0f};

    std::vector<ContactPoint> points;

    float friction = 0.5f;              ///< Combined friction
    float restitution = 0.0f;           ///< Combined restitution
    bool is_trigger = false;            ///< True if either collider is a trigger
    bool from_ccd = false;              ///< Synthesized at a time of impact

    /// Get number of points
    [[nodiscard]] std::size_t size() const noexcept { return points.size(); }

    /// Check if empty
    [[nodiscard]] bool empty() const noexcept { return points.empty(); }

    /// Most negative separation (0 when empty)
    [[nodiscard]] float min_separation() const noexcept;

    /// Rebuild the friction directions from the normal
    void update_tangents() noexcept;

    /// Sum of normal impulses applied in the last solve
    [[nodiscard]] float total_normal_impulse() const noexcept;
};

// =============================================================================
// Manifold Key
// =============================================================================

/// Identity of a manifold across steps
struct ManifoldKey {
    BodyId body_a;
    BodyId body_b;
    std::uint32_t feature_id = 0;

    [[nodiscard]] static ManifoldKey of(const ContactManifold& manifold) noexcept {
        return ManifoldKey{manifold.body_a, manifold.body_b, manifold.feature_id};
    }

    bool operator==(const ManifoldKey& other) const noexcept {
        return body_a == other.body_a && body_b == other.body_b && feature_id == other.feature_id;
    }
    bool operator!=(const ManifoldKey& other) const noexcept { return !(*this == other); }
};

} // namespace impulse_physics

template<>
struct std::hash<impulse_physics::ManifoldKey> {
    std::size_t operator()(const impulse_physics::ManifoldKey& key) const noexcept {
        std::size_t h = std::hash<std::uint64_t>{}(key.body_a.value);
        h ^= std::hash<std::uint64_t>{}(key.body_b.value) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<std::uint32_t>{}(key.feature_id) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

namespace impulse_physics {

// =============================================================================
// Material Combine Functions
// =============================================================================

/// Pair friction: geometric mean
[[nodiscard]] float combine_friction(float a, float b) noexcept;

/// Pair restitution: the bouncier of the two
[[nodiscard]] float combine_restitution(float a, float b) noexcept;

// =============================================================================
// Manifold Reduction
// =============================================================================

/// Keep at most four points: the deepest, the one farthest from it, the one
/// spanning the largest triangle with those two, and the one farthest
/// outside that triangle
void reduce_manifold(std::vector<ContactPoint>& points, const impulse_math::Vec3& normal);

// =============================================================================
// Contact Cache
// =============================================================================

/// Accumulated impulses of the previous step, keyed by manifold
class ContactCache {
public:
    explicit ContactCache(float match_tolerance = 0.02f);

    /// Seed each point of `manifold` from the nearest cached point of the same
    /// key within the match tolerance. Unmatched points start at zero.
    /// @return Number of points that were seeded
    std::size_t warm_start(ContactManifold& manifold) const;

    /// Replace the cache with the solved manifolds of this step.
    /// Keys absent from `manifolds` are pruned.
    void store(const std::vector<ContactManifold>& manifolds);

    /// Drop every entry involving a body
    void remove_body(BodyId body);

    /// Clear all entries
    void clear() { m_entries.clear(); }

    /// Check if a key has cached impulses
    [[nodiscard]] bool contains(const ManifoldKey& key) const { return m_entries.count(key) != 0; }

    /// Cached manifold for a key, or nullptr
    [[nodiscard]] const ContactManifold* find(const ManifoldKey& key) const;

    /// Number of cached manifolds
    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }

    [[nodiscard]] float match_tolerance() const noexcept { return m_match_tolerance; }
    void set_match_tolerance(float tolerance) { m_match_tolerance = tolerance; }

private:
    float m_match_tolerance;
    std::unordered_map<ManifoldKey, ContactManifold> m_entries;
};

} // namespace impulse_physics
