/// @file contact.cpp
/// @brief Contact manifold and warm-start cache implementation

#include <impulse/physics/contact.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace impulse_physics {

using impulse_math::Vec3;

// =============================================================================
// ContactManifold Implementation
// =============================================================================

float ContactManifold::min_separation() const noexcept {
    float result = 0.0f;
    for (const auto& p : points) {
        result = std::min(result, p.separation);
    }
    return result;
}

void ContactManifold::update_tangents() noexcept {
    const auto [t1, t2] = impulse_math::tangent_basis(normal);
    tangent_1 = t1;
    tangent_2 = t2;
}

float ContactManifold::total_normal_impulse() const noexcept {
    float total = 0.0f;
    for (const auto& p : points) {
        total += p.normal_impulse;
    }
    return total;
}

// =============================================================================
// Material Combine
// =============================================================================

float combine_friction(float a, float b) noexcept {
    return std::sqrt(std::max(a, 0.0f) * std::max(b, 0.0f));
}

float combine_restitution(float a, float b) noexcept {
    return std::max(a, b);
}

// =============================================================================
// Manifold Reduction
// =============================================================================

void reduce_manifold(std::vector<ContactPoint>& points, const Vec3& normal) {
    if (points.size() <= k_max_manifold_points) {
        return;
    }

    std::vector<ContactPoint> kept;
    kept.reserve(k_max_manifold_points);
    std::vector<bool> used(points.size(), false);

    auto take = [&](std::size_t index) {
        used[index] = true;
        kept.push_back(points[index]);
    };

    // 1. Deepest point
    std::size_t best = 0;
    for (std::size_t i = 1; i < points.size(); ++i) {
        if (points[i].separation < points[best].separation) {
            best = i;
        }
    }
    take(best);
    const Vec3 p0 = points[best].position();

    // 2. Farthest from the deepest
    float best_score = -1.0f;
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (used[i]) continue;
        const float d = impulse_math::distance_squared(points[i].position(), p0);
        if (d > best_score) {
            best_score = d;
            best = i;
        }
    }
    take(best);
    const Vec3 p1 = points[best].position();

    // 3. Largest triangle area, signed about the normal
    best_score = -1.0f;
    float best_signed = 0.0f;
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (used[i]) continue;
        const float area = impulse_math::dot(impulse_math::cross(p1 - p0, points[i].position() - p0), normal);
        if (std::abs(area) > best_score) {
            best_score = std::abs(area);
            best_signed = area;
            best = i;
        }
    }
    take(best);
    const Vec3 p2 = points[best].position();

    // Orient the triangle counter-clockwise about the normal
    const float winding = best_signed >= 0.0f ? 1.0f : -1.0f;
    const std::array<Vec3, 3> tri = {p0, p1, p2};

    // 4. Farthest outside the triangle
    best_score = -std::numeric_limits<float>::max();
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (used[i]) continue;
        const Vec3 p = points[i].position();
        float outside = 0.0f;
        for (int e = 0; e < 3; ++e) {
            const Vec3& a = tri[e];
            const Vec3& b = tri[(e + 1) % 3];
            const float edge_area = winding * impulse_math::dot(impulse_math::cross(b - a, p - a), normal);
            outside = std::max(outside, -edge_area);
        }
        if (outside > best_score) {
            best_score = outside;
            best = i;
        }
    }
    take(best);

    points = std::move(kept);
}

// =============================================================================
// ContactCache Implementation
// =============================================================================

ContactCache::ContactCache(float match_tolerance)
    : m_match_tolerance(match_tolerance)
{}

std::size_t ContactCache::warm_start(ContactManifold& manifold) const {
    for (auto& p : manifold.points) {
        p.normal_impulse = 0.0f;
        p.tangent_impulse_1 = 0.0f;
        p.tangent_impulse_2 = 0.0f;
    }

    const ContactManifold* previous = find(ManifoldKey::of(manifold));
    if (!previous) {
        return 0;
    }

    const float tol_sq = m_match_tolerance * m_match_tolerance;
    std::vector<bool> claimed(previous->points.size(), false);
    std::size_t matched = 0;

    for (auto& p : manifold.points) {
        int best = -1;
        float best_dist = tol_sq;
        for (std::size_t i = 0; i < previous->points.size(); ++i) {
            if (claimed[i]) continue;
            const auto& old = previous->points[i];
            // Both anchors must stay put on their bodies
            const float d = std::max(impulse_math::distance_squared(old.local_a, p.local_a),
                                     impulse_math::distance_squared(old.local_b, p.local_b));
            if (d <= best_dist) {
                best_dist = d;
                best = static_cast<int>(i);
            }
        }
        if (best < 0) {
            continue;
        }

        const auto& old = previous->points[static_cast<std::size_t>(best)];
        claimed[static_cast<std::size_t>(best)] = true;
        ++matched;

        p.normal_impulse = old.normal_impulse;

        // Carry friction over as a vector so a rotated tangent basis keeps it
        const Vec3 friction = previous->tangent_1 * old.tangent_impulse_1 +
                              previous->tangent_2 * old.tangent_impulse_2;
        p.tangent_impulse_1 = impulse_math::dot(friction, manifold.tangent_1);
        p.tangent_impulse_2 = impulse_math::dot(friction, manifold.tangent_2);
    }

    return matched;
}

void ContactCache::store(const std::vector<ContactManifold>& manifolds) {
    m_entries.clear();
    for (const auto& manifold : manifolds) {
        if (manifold.is_trigger || manifold.empty()) {
            continue;
        }
        m_entries[ManifoldKey::of(manifold)] = manifold;
    }
}

void ContactCache::remove_body(BodyId body) {
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->first.body_a == body || it->first.body_b == body) {
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }
}

const ContactManifold* ContactCache::find(const ManifoldKey& key) const {
    auto it = m_entries.find(key);
    return it != m_entries.end() ? &it->second : nullptr;
}

} // namespace impulse_physics
