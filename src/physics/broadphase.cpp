/// @file broadphase.cpp
/// @brief Spatial hash broad phase for impulse_physics

#include <impulse/physics/broadphase.hpp>

#include <algorithm>
#include <cmath>

namespace impulse_physics {

SpatialHashGrid::SpatialHashGrid(float cell_size)
    : m_cell_size(cell_size > 0.0f ? cell_size : 2.0f)
    , m_inv_cell_size(1.0f / m_cell_size)
{}

template<typename Fn>
void SpatialHashGrid::for_each_cell(const impulse_math::AABB& aabb, Fn&& fn) const {
    const CellCoords min_cell = cell_coords(aabb.min);
    const CellCoords max_cell = cell_coords(aabb.max);

    for (int x = min_cell[0]; x <= max_cell[0]; ++x) {
        for (int y = min_cell[1]; y <= max_cell[1]; ++y) {
            for (int z = min_cell[2]; z <= max_cell[2]; ++z) {
                fn(hash_coords(x, y, z));
            }
        }
    }
}

void SpatialHashGrid::clear() {
    m_proxies.clear();
    m_oversized.clear();
    m_cells.clear();
}

void SpatialHashGrid::set_cell_size(float size) {
    if (!(size > 0.0f)) {
        return;
    }
    m_cell_size = size;
    m_inv_cell_size = 1.0f / size;
    clear();
}

void SpatialHashGrid::insert(const BroadphaseProxy& proxy) {
    BroadphaseProxy stored = proxy;
    stored.bounds = proxy.bounds.with_min_extent(k_min_aabb_extent);

    const auto index = static_cast<std::uint32_t>(m_proxies.size());
    m_proxies.push_back(stored);

    if (!fits_grid(stored.bounds)) {
        m_oversized.push_back(index);
        return;
    }

    for_each_cell(stored.bounds, [this, index](std::uint64_t key) {
        m_cells[key].push_back(index);
    });
}

bool SpatialHashGrid::should_test(const BroadphaseProxy& a, const BroadphaseProxy& b) noexcept {
    if (a.body == b.body) {
        return false;
    }
    if (a.immovable && b.immovable) {
        return false;
    }
    if (a.sleeping && b.sleeping) {
        return false;
    }
    return can_collide(a.mask, b.mask);
}

std::vector<BodyPair> SpatialHashGrid::find_pairs() const {
    std::vector<BodyPair> pairs;

    auto consider = [this, &pairs](std::uint32_t i, std::uint32_t j) {
        const auto& a = m_proxies[i];
        const auto& b = m_proxies[j];
        if (should_test(a, b) && a.bounds.intersects(b.bounds)) {
            pairs.push_back(BodyPair::make(a.body, b.body));
        }
    };

    for (const auto& [key, indices] : m_cells) {
        for (std::size_t i = 0; i < indices.size(); ++i) {
            for (std::size_t j = i + 1; j < indices.size(); ++j) {
                consider(indices[i], indices[j]);
            }
        }
    }

    // Oversized proxies against every other proxy
    for (std::uint32_t big : m_oversized) {
        for (std::uint32_t other = 0; other < m_proxies.size(); ++other) {
            if (other != big) {
                consider(big, other);
            }
        }
    }

    // Remove duplicates (shared cells, hash collisions, oversized overlap)
    std::sort(pairs.begin(), pairs.end());
    pairs.erase(std::unique(pairs.begin(), pairs.end()), pairs.end());
    return pairs;
}

void SpatialHashGrid::query(const impulse_math::AABB& aabb, std::vector<BodyId>& out_bodies) const {
    out_bodies.clear();
    const impulse_math::AABB bounds = aabb.with_min_extent(k_min_aabb_extent);

    auto consider = [this, &bounds, &out_bodies](std::uint32_t index) {
        if (m_proxies[index].bounds.intersects(bounds)) {
            out_bodies.push_back(m_proxies[index].body);
        }
    };

    if (fits_grid(bounds)) {
        for_each_cell(bounds, [this, &consider](std::uint64_t key) {
            auto it = m_cells.find(key);
            if (it != m_cells.end()) {
                for (std::uint32_t index : it->second) {
                    consider(index);
                }
            }
        });
        for (std::uint32_t index : m_oversized) {
            consider(index);
        }
    } else {
        for (std::uint32_t index = 0; index < m_proxies.size(); ++index) {
            consider(index);
        }
    }

    // Remove duplicates
    std::sort(out_bodies.begin(), out_bodies.end());
    out_bodies.erase(std::unique(out_bodies.begin(), out_bodies.end()), out_bodies.end());
}

SpatialHashGrid::CellCoords SpatialHashGrid::cell_coords(const impulse_math::Vec3& position) const {
    return {
        static_cast<int>(std::floor(position.x * m_inv_cell_size)),
        static_cast<int>(std::floor(position.y * m_inv_cell_size)),
        static_cast<int>(std::floor(position.z * m_inv_cell_size))
    };
}

bool SpatialHashGrid::fits_grid(const impulse_math::AABB& aabb) const {
    double cells = 1.0;
    for (int axis = 0; axis < 3; ++axis) {
        const double lo = std::floor(static_cast<double>(aabb.min[axis]) * m_inv_cell_size);
        const double hi = std::floor(static_cast<double>(aabb.max[axis]) * m_inv_cell_size);
        if (!std::isfinite(lo) || !std::isfinite(hi) || std::abs(lo) > 1e8 || std::abs(hi) > 1e8) {
            return false;
        }
        cells *= (hi - lo + 1.0);
    }
    return cells <= static_cast<double>(k_max_cells_per_proxy);
}

std::uint64_t SpatialHashGrid::hash_coords(int x, int y, int z) {
    constexpr std::uint64_t P1 = 73856093;
    constexpr std::uint64_t P2 = 19349663;
    constexpr std::uint64_t P3 = 83492791;
    return (static_cast<std::uint64_t>(x) * P1) ^
           (static_cast<std::uint64_t>(y) * P2) ^
           (static_cast<std::uint64_t>(z) * P3);
}

} // namespace impulse_physics
