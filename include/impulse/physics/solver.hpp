/// @file solver.hpp
/// @brief Sequential impulse contact solver for impulse_physics

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "contact.hpp"

#include <impulse/math/vec.hpp>
#include <impulse/math/quat.hpp>
#include <impulse/math/mat.hpp>

#include <cstdint>
#include <vector>

namespace impulse_physics {

// =============================================================================
// Tuning
// =============================================================================

/// Iteration counts and stabilization terms, copied out of PhysicsWorldConfig per step
struct SolverConfig {
    std::uint32_t velocity_iterations = 10;
    std::uint32_t position_iterations = 3;
    float baumgarte = 0.2f;
    float slop = 0.005f;                 // Penetration left uncorrected
    float max_correction = 0.2f;         // Per position iteration
    float restitution_threshold = 1.0f;  // Closing speed below which contacts do not bounce
    bool warm_starting = true;

    [[nodiscard]] static SolverConfig from_world(const PhysicsWorldConfig& config);
};

// =============================================================================
// Solver Body
// =============================================================================

/// Body state used during solving
struct SolverBody {
    BodyId id;
    impulse_math::Vec3 position{0.0f};
    impulse_math::Quat rotation = impulse_math::quat::IDENTITY;
    impulse_math::Vec3 linear_velocity{0.0f};
    impulse_math::Vec3 angular_velocity{0.0f};
    float inverse_mass = 0.0f;
    impulse_math::Mat3 local_inverse_inertia = impulse_math::mat3::ZERO;
    impulse_math::Mat3 inverse_inertia = impulse_math::mat3::ZERO;   ///< World space

    /// Snapshot a rigid body
    [[nodiscard]] static SolverBody from(const RigidBody& body);

    /// Velocity of a point at world offset r from the body origin
    [[nodiscard]] impulse_math::Vec3 velocity_at(const impulse_math::Vec3& r) const noexcept {
        return linear_velocity + impulse_math::cross(angular_velocity, r);
    }

    /// Apply impulse at world offset r
    void apply_impulse(const impulse_math::Vec3& impulse, const impulse_math::Vec3& r) noexcept {
        linear_velocity += impulse * inverse_mass;
        angular_velocity += inverse_inertia * impulse_math::cross(r, impulse);
    }

    /// Apply angular impulse
    void apply_angular_impulse(const impulse_math::Vec3& impulse) noexcept {
        angular_velocity += inverse_inertia * impulse;
    }

    /// Move by a position impulse at world offset r
    void apply_position_impulse(const impulse_math::Vec3& impulse, const impulse_math::Vec3& r) noexcept;

    /// Rotate by an angular position impulse
    void apply_angular_position_impulse(const impulse_math::Vec3& impulse) noexcept;

    /// Recompute world inverse inertia from the current rotation
    void update_inertia() noexcept;
};

/// Effective mass denominator of a linear row along `dir` at offsets r_a, r_b
[[nodiscard]] float effective_mass_inverse(const SolverBody& a, const SolverBody& b,
                                           const impulse_math::Vec3& r_a, const impulse_math::Vec3& r_b,
                                           const impulse_math::Vec3& dir) noexcept;

/// Effective mass denominator of an angular row along `axis`
[[nodiscard]] float angular_mass_inverse(const SolverBody& a, const SolverBody& b,
                                         const impulse_math::Vec3& axis) noexcept;

// =============================================================================
// Contact Constraint
// =============================================================================

/// Solver rows built from one manifold
struct ContactConstraint {
    ContactManifold* manifold = nullptr;   ///< Source manifold; impulses are written back to it
    int index_a = -1;                      ///< Slots in the island's SolverBody array
    int index_b = -1;

    struct PointData {
        impulse_math::Vec3 r_a{0.0f};       ///< World offset from body A
        impulse_math::Vec3 r_b{0.0f};       ///< World offset from body B
        float normal_mass = 0.0f;           ///< Effective mass for normal
        float tangent_mass_1 = 0.0f;        ///< Effective mass for tangent 1
        float tangent_mass_2 = 0.0f;        ///< Effective mass for tangent 2
        float velocity_bias = 0.0f;         ///< Restitution or speculative target
    };

    std::vector<PointData> points;
};

// =============================================================================
// Contact Solver
// =============================================================================

/// Projected Gauss-Seidel over contact rows with accumulated impulse clamping
class ContactSolver {
public:
    explicit ContactSolver(const SolverConfig& config = {});

    /// Compute effective masses and velocity targets
    void prepare(std::vector<ContactConstraint>& contacts, const std::vector<SolverBody>& bodies, float dt);

    /// Apply the impulses carried over from the previous step
    void warm_start(std::vector<ContactConstraint>& contacts, std::vector<SolverBody>& bodies);

    /// One Gauss-Seidel pass: normal row, then both friction rows, per point.
    /// @return Largest impulse change of the pass
    float solve_velocity(std::vector<ContactConstraint>& contacts, std::vector<SolverBody>& bodies);

    /// One position pass pushing overlaps beyond the slop apart.
    /// @return Deepest separation found before correcting
    float solve_position(std::vector<ContactConstraint>& contacts, std::vector<SolverBody>& bodies);

private:
    SolverConfig m_config;
};

} // namespace impulse_physics
