#pragma once

/// @file bounds.hpp
/// @brief World-aligned bounding boxes for impulse_math

#include "types.hpp"
#include "vec.hpp"
#include <array>
#include <span>

namespace impulse_math {

/// Box aligned with the world axes. A default constructed box is empty
/// (min above max) and grows as points are added.
struct AABB {
    Vec3 min = Vec3(consts::MAX_FLOAT);
    Vec3 max = Vec3(-consts::MAX_FLOAT);

    constexpr AABB() noexcept = default;
    constexpr AABB(const Vec3& lo, const Vec3& hi) noexcept : min(lo), max(hi) {}

    static AABB from_center_half_extents(const Vec3& center, const Vec3& half) noexcept {
        return {center - half, center + half};
    }

    /// Smallest box holding every point; empty for no points
    static AABB from_points(std::span<const Vec3> points) noexcept {
        AABB box;
        for (const Vec3& p : points) {
            box.expand_to_include(p);
        }
        return box;
    }

    [[nodiscard]] Vec3 center() const noexcept { return 0.5f * (min + max); }
    [[nodiscard]] Vec3 half_extents() const noexcept { return 0.5f * (max - min); }
    [[nodiscard]] Vec3 size() const noexcept { return max - min; }

    [[nodiscard]] float volume() const noexcept {
        const Vec3 s = size();
        return s.x * s.y * s.z;
    }

    /// False for the empty box
    [[nodiscard]] bool is_valid() const noexcept {
        return min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }

    // =========================================================================
    // Growth
    // =========================================================================

    void expand_to_include(const Vec3& p) noexcept {
        min = impulse_math::min(min, p);
        max = impulse_math::max(max, p);
    }

    void expand_to_include(const AABB& other) noexcept {
        min = impulse_math::min(min, other.min);
        max = impulse_math::max(max, other.max);
    }

    [[nodiscard]] AABB union_with(const AABB& other) const noexcept {
        AABB box = *this;
        box.expand_to_include(other);
        return box;
    }

    /// Grown by `margin` on every side
    [[nodiscard]] AABB expanded(float margin) const noexcept {
        return {min - Vec3(margin), max + Vec3(margin)};
    }

    /// Thin axes are widened to `extent` about their midpoint. Keeps flat
    /// and point-like boxes hashable.
    [[nodiscard]] AABB with_min_extent(float extent) const noexcept {
        AABB box = *this;
        for (int axis = 0; axis < 3; ++axis) {
            if (box.max[axis] - box.min[axis] >= extent) {
                continue;
            }
            const float mid = 0.5f * (box.min[axis] + box.max[axis]);
            box.min[axis] = mid - 0.5f * extent;
            box.max[axis] = mid + 0.5f * extent;
        }
        return box;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// Touching counts as overlap
    [[nodiscard]] bool intersects(const AABB& other) const noexcept {
        return min.x <= other.max.x && other.min.x <= max.x &&
               min.y <= other.max.y && other.min.y <= max.y &&
               min.z <= other.max.z && other.min.z <= max.z;
    }

    [[nodiscard]] bool contains_point(const Vec3& p) const noexcept {
        return glm::all(glm::lessThanEqual(min, p)) && glm::all(glm::lessThanEqual(p, max));
    }

    [[nodiscard]] Vec3 closest_point(const Vec3& p) const noexcept {
        return glm::clamp(p, min, max);
    }

    /// Corner i takes max on axis k when bit k of i is set
    [[nodiscard]] std::array<Vec3, 8> corners() const noexcept {
        std::array<Vec3, 8> out{};
        for (int i = 0; i < 8; ++i) {
            out[i] = Vec3((i & 1) ? max.x : min.x,
                          (i & 2) ? max.y : min.y,
                          (i & 4) ? max.z : min.z);
        }
        return out;
    }

    bool operator==(const AABB& other) const noexcept = default;
};

} // namespace impulse_math
