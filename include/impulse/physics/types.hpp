/// @file types.hpp
/// @brief Identifiers, enums and collision filtering for impulse_physics

#pragma once

#include "fwd.hpp"

#include <impulse/math/vec.hpp>
#include <impulse/math/quat.hpp>

#include <compare>
#include <cstdint>
#include <functional>

namespace impulse_physics {

// =============================================================================
// Enumerations
// =============================================================================

enum class BodyType : std::uint8_t {
    Static,     // Immovable, infinite mass
    Kinematic,  // Follows its velocity, infinite mass
    Dynamic,
};

enum class CcdMode : std::uint8_t {
    Discrete,
    Swept,      // Post-integration sweep against the world
};

enum class ShapeType : std::uint8_t {
    Sphere,
    Aabb,       // Ignores body rotation
    Box,
    Capsule,
    ConvexHull,
    Plane,      // Static bodies only
    Compound,
};

/// Local axis a capsule segment runs along
enum class CapsuleAxis : std::uint8_t { X, Y, Z };

enum class JointType : std::uint8_t {
    BallSocket,
    Distance,
    Hinge,
    Fixed,
    Slider,
};

/// Lower case names for log output
[[nodiscard]] const char* to_string(BodyType type);
[[nodiscard]] const char* to_string(CcdMode mode);
[[nodiscard]] const char* to_string(ShapeType type);
[[nodiscard]] const char* to_string(CapsuleAxis axis);
[[nodiscard]] const char* to_string(JointType type);

// =============================================================================
// Identifiers
// =============================================================================

/// Opaque handle issued by PhysicsWorld; 0 is never issued
template<typename Tag>
struct Id {
    std::uint64_t value = 0;

    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0; }
    [[nodiscard]] static constexpr Id invalid() noexcept { return Id{}; }

    constexpr auto operator<=>(const Id&) const noexcept = default;
};

using BodyId = Id<BodyTag>;
using JointId = Id<JointTag>;

// =============================================================================
// Collision Filtering
// =============================================================================

/// Bit set of collision layers
using CollisionLayer = std::uint32_t;

namespace layers {
inline constexpr CollisionLayer Default    = 1u << 0;
inline constexpr CollisionLayer Static     = 1u << 1;
inline constexpr CollisionLayer Dynamic    = 1u << 2;
inline constexpr CollisionLayer Projectile = 1u << 3;
inline constexpr CollisionLayer Debris     = 1u << 4;
inline constexpr CollisionLayer All        = ~0u;
} // namespace layers

/// Which layers a collider sits on and which it accepts contact from
struct CollisionMask {
    CollisionLayer layer = layers::Default;
    CollisionLayer collides_with = layers::All;

    [[nodiscard]] constexpr bool accepts(const CollisionMask& other) const noexcept {
        return (collides_with & other.layer) != 0;
    }
};

/// Contact is generated only when each side accepts the other
[[nodiscard]] constexpr bool can_collide(const CollisionMask& a, const CollisionMask& b) noexcept {
    return a.accepts(b) && b.accepts(a);
}

// =============================================================================
// Physics Statistics
// =============================================================================

/// Counters gathered over the last fixed step
struct PhysicsStats {
    std::uint32_t bodies = 0;
    std::uint32_t awake_bodies = 0;
    std::uint32_t sleeping_bodies = 0;
    std::uint32_t joints = 0;

    std::uint32_t broadphase_pairs = 0;
    std::uint32_t manifolds = 0;
    std::uint32_t contact_points = 0;
    std::uint32_t islands = 0;
    std::uint32_t sleeping_islands = 0;
    std::uint32_t ccd_hits = 0;
    std::uint32_t failed_islands = 0;    ///< Islands whose solve threw and were skipped

    std::uint32_t substeps = 0;          ///< Fixed steps run by the last step() call
    std::uint64_t total_steps = 0;       ///< Fixed steps since creation
};

} // namespace impulse_physics

template<typename Tag>
struct std::hash<impulse_physics::Id<Tag>> {
    std::size_t operator()(const impulse_physics::Id<Tag>& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};
