/// @file ccd.hpp
/// @brief Continuous collision detection for impulse_physics

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "shape.hpp"
#include "collision.hpp"

#include <impulse/math/vec.hpp>
#include <impulse/math/transform.hpp>

#include <cstdint>

namespace impulse_physics {

/// Upper bound on conservative samples along one sweep
constexpr std::uint32_t k_ccd_max_samples = 256;

/// Time of impact result
struct TimeOfImpact {
    enum class State : std::uint8_t {
        Separated,      ///< No contact along the sweep
        Hit,            ///< Contact at t
        Overlapping,    ///< Already touching at the start
        Failed,         ///< Degenerate input, no sweep possible
    };

    State state = State::Separated;
    float t = 1.0f;          ///< Last separated fraction of the motion [0, 1]
    ShapeContact contact;    ///< Contact geometry at t (A -> B)

    [[nodiscard]] bool hit() const noexcept { return state == State::Hit; }
};

/// Compute time of impact between two moving shapes.
/// Each shape translates linearly from its start transform; orientation is held.
/// Motion is sampled no farther apart than the thinner shape, and the first
/// overlapping interval is refined by bisection.
[[nodiscard]] TimeOfImpact compute_toi(
    const Shape& shape_a, const impulse_math::Transform& start_a, const impulse_math::Vec3& translation_a,
    const Shape& shape_b, const impulse_math::Transform& start_b, const impulse_math::Vec3& translation_b,
    std::uint32_t max_iterations = 20);

/// Check whether a body moving this fast should be swept
[[nodiscard]] bool needs_sweep(const RigidBody& body, float velocity_threshold) noexcept;

} // namespace impulse_physics
