/// @file broadphase.hpp
/// @brief Broad phase collision detection using a uniform spatial hash
///
/// Every collider bounds is inserted into each grid cell it overlaps.
/// Candidate pairs are collected per cell, filtered, de-duplicated and
/// confirmed with an exact bounds test.

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <impulse/math/vec.hpp>
#include <impulse/math/bounds.hpp>

#include <array>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace impulse_physics {

// =============================================================================
// Constants
// =============================================================================

/// Thinnest extent a proxy is hashed with
constexpr float k_min_aabb_extent = 1e-3f;

/// Proxies spanning more cells than this are tested against everything
constexpr std::size_t k_max_cells_per_proxy = 4096;

// =============================================================================
// Proxy and Pair
// =============================================================================

/// Broadphase view of one collider
struct BroadphaseProxy {
    BodyId body;
    impulse_math::AABB bounds;
    CollisionMask mask;
    bool immovable = false;     ///< Static or kinematic body
    bool sleeping = false;
    bool trigger = false;
};

/// Unordered body pair, stored with body_a < body_b
struct BodyPair {
    BodyId body_a;
    BodyId body_b;

    /// Create pair with canonical ordering
    [[nodiscard]] static BodyPair make(BodyId a, BodyId b) noexcept {
        return a < b ? BodyPair{a, b} : BodyPair{b, a};
    }

    bool operator==(const BodyPair& other) const noexcept {
        return body_a == other.body_a && body_b == other.body_b;
    }
    bool operator!=(const BodyPair& other) const noexcept { return !(*this == other); }
    bool operator<(const BodyPair& other) const noexcept {
        if (body_a != other.body_a) return body_a < other.body_a;
        return body_b < other.body_b;
    }
};

// =============================================================================
// Spatial Hash Grid
// =============================================================================

/// Uniform spatial hash grid for broad phase
class SpatialHashGrid {
public:
    /// Construct with cell size
    explicit SpatialHashGrid(float cell_size = 2.0f);

    /// Clear all entries
    void clear();

    /// Insert proxy into all overlapping cells; thin bounds are widened first
    void insert(const BroadphaseProxy& proxy);

    /// All filtered pairs whose bounds overlap, sorted, without duplicates
    [[nodiscard]] std::vector<BodyPair> find_pairs() const;

    /// Bodies whose bounds overlap the given box
    void query(const impulse_math::AABB& aabb, std::vector<BodyId>& out_bodies) const;

    /// Check the pair filter (self pairs, immovable pairs, sleeping pairs, masks)
    [[nodiscard]] static bool should_test(const BroadphaseProxy& a, const BroadphaseProxy& b) noexcept;

    /// Get cell size
    [[nodiscard]] float cell_size() const noexcept { return m_cell_size; }

    /// Set cell size (clears grid)
    void set_cell_size(float size);

    /// Number of inserted proxies
    [[nodiscard]] std::size_t proxy_count() const noexcept { return m_proxies.size(); }

    /// Number of occupied cells
    [[nodiscard]] std::size_t cell_count() const noexcept { return m_cells.size(); }

private:
    using CellCoords = std::array<int, 3>;

    [[nodiscard]] CellCoords cell_coords(const impulse_math::Vec3& position) const;
    [[nodiscard]] bool fits_grid(const impulse_math::AABB& aabb) const;
    [[nodiscard]] static std::uint64_t hash_coords(int x, int y, int z);

    template<typename Fn>
    void for_each_cell(const impulse_math::AABB& aabb, Fn&& fn) const;

    float m_cell_size;
    float m_inv_cell_size;
    std::vector<BroadphaseProxy> m_proxies;
    std::vector<std::uint32_t> m_oversized;   ///< Proxies kept out of the grid
    std::unordered_map<std::uint64_t, std::vector<std::uint32_t>> m_cells;
};

} // namespace impulse_physics
