/// @file solver.cpp
/// @brief Sequential impulse contact solver implementation

#include <impulse/physics/solver.hpp>
#include <impulse/physics/body.hpp>
#include <impulse/physics/config.hpp>

#include <algorithm>
#include <cmath>

namespace impulse_physics {

using impulse_math::Vec3;

namespace {

/// Below this a row is treated as acting on immovable bodies only
constexpr float k_min_effective_mass = 1e-6f;

float inverse_or_zero(float k) {
    return k > k_min_effective_mass ? 1.0f / k : 0.0f;
}

} // anonymous namespace

// =============================================================================
// SolverConfig Implementation
// =============================================================================

SolverConfig SolverConfig::from_world(const PhysicsWorldConfig& config) {
    SolverConfig result;
    result.velocity_iterations = config.solver_iterations;
    result.position_iterations = config.position_iterations;
    result.baumgarte = config.position_correction;
    result.slop = config.slop;
    result.max_correction = config.max_position_correction;
    result.restitution_threshold = config.restitution_threshold;
    result.warm_starting = config.warm_starting;
    return result;
}

// =============================================================================
// SolverBody Implementation
// =============================================================================

SolverBody SolverBody::from(const RigidBody& body) {
    SolverBody result;
    result.id = body.id();
    result.position = body.position();
    result.rotation = body.rotation();
    result.linear_velocity = body.linear_velocity();
    result.angular_velocity = body.angular_velocity();
    result.inverse_mass = body.inverse_mass();
    result.local_inverse_inertia = body.local_inverse_inertia();
    result.inverse_inertia = body.world_inverse_inertia();
    return result;
}

void SolverBody::apply_position_impulse(const Vec3& impulse, const Vec3& r) noexcept {
    if (inverse_mass == 0.0f) {
        return;
    }
    position += impulse * inverse_mass;
    apply_angular_position_impulse(impulse_math::cross(r, impulse));
}

void SolverBody::apply_angular_position_impulse(const Vec3& impulse) noexcept {
    const Vec3 rotation_step = inverse_inertia * impulse;
    if (impulse_math::length_squared(rotation_step) == 0.0f) {
        return;
    }
    rotation = impulse_math::integrate_rotation(rotation, rotation_step);
    update_inertia();
}

void SolverBody::update_inertia() noexcept {
    if (inverse_mass == 0.0f) {
        inverse_inertia = impulse_math::mat3::ZERO;
        return;
    }
    inverse_inertia = impulse_math::rotate_tensor(impulse_math::quat_to_mat3(rotation), local_inverse_inertia);
}

float effective_mass_inverse(const SolverBody& a, const SolverBody& b,
                             const Vec3& r_a, const Vec3& r_b, const Vec3& dir) noexcept {
    const Vec3 ra_x_d = impulse_math::cross(r_a, dir);
    const Vec3 rb_x_d = impulse_math::cross(r_b, dir);
    return a.inverse_mass + b.inverse_mass
        + impulse_math::dot(ra_x_d, a.inverse_inertia * ra_x_d)
        + impulse_math::dot(rb_x_d, b.inverse_inertia * rb_x_d);
}

float angular_mass_inverse(const SolverBody& a, const SolverBody& b, const Vec3& axis) noexcept {
    return impulse_math::dot(axis, a.inverse_inertia * axis) + impulse_math::dot(axis, b.inverse_inertia * axis);
}

// =============================================================================
// ContactSolver Implementation
// =============================================================================

ContactSolver::ContactSolver(const SolverConfig& config)
    : m_config(config)
{}

void ContactSolver::prepare(std::vector<ContactConstraint>& contacts,
                            const std::vector<SolverBody>& bodies,
                            float dt) {
    const float inv_dt = dt > 0.0f ? 1.0f / dt : 0.0f;

    for (auto& contact : contacts) {
        const ContactManifold& m = *contact.manifold;
        const SolverBody& a = bodies[static_cast<std::size_t>(contact.index_a)];
        const SolverBody& b = bodies[static_cast<std::size_t>(contact.index_b)];

        contact.points.resize(m.points.size());
        for (std::size_t i = 0; i < m.points.size(); ++i) {
            const ContactPoint& cp = m.points[i];
            auto& pd = contact.points[i];

            const Vec3 p = cp.position();
            pd.r_a = p - a.position;
            pd.r_b = p - b.position;

            // Compute effective masses
            pd.normal_mass = inverse_or_zero(effective_mass_inverse(a, b, pd.r_a, pd.r_b, m.normal));
            pd.tangent_mass_1 = inverse_or_zero(effective_mass_inverse(a, b, pd.r_a, pd.r_b, m.tangent_1));
            pd.tangent_mass_2 = inverse_or_zero(effective_mass_inverse(a, b, pd.r_a, pd.r_b, m.tangent_2));

            // Speculative points may close the gap but not more
            pd.velocity_bias = cp.separation > 0.0f ? -cp.separation * inv_dt : 0.0f;

            // Restitution bias
            const float v_rel = impulse_math::dot(m.normal, b.velocity_at(pd.r_b) - a.velocity_at(pd.r_a));
            if (v_rel < -m_config.restitution_threshold && m.restitution > 0.0f) {
                pd.velocity_bias = std::max(pd.velocity_bias, -m.restitution * v_rel);
            }
        }
    }
}

void ContactSolver::warm_start(std::vector<ContactConstraint>& contacts, std::vector<SolverBody>& bodies) {
    for (auto& contact : contacts) {
        ContactManifold& m = *contact.manifold;

        if (!m_config.warm_starting) {
            for (auto& cp : m.points) {
                cp.normal_impulse = 0.0f;
                cp.tangent_impulse_1 = 0.0f;
                cp.tangent_impulse_2 = 0.0f;
            }
            continue;
        }

        SolverBody& a = bodies[static_cast<std::size_t>(contact.index_a)];
        SolverBody& b = bodies[static_cast<std::size_t>(contact.index_b)];

        for (std::size_t i = 0; i < m.points.size(); ++i) {
            const ContactPoint& cp = m.points[i];
            const auto& pd = contact.points[i];
            const Vec3 p = m.normal * cp.normal_impulse
                         + m.tangent_1 * cp.tangent_impulse_1
                         + m.tangent_2 * cp.tangent_impulse_2;
            a.apply_impulse(-p, pd.r_a);
            b.apply_impulse(p, pd.r_b);
        }
    }
}

float ContactSolver::solve_velocity(std::vector<ContactConstraint>& contacts, std::vector<SolverBody>& bodies) {
    float residual = 0.0f;

    for (auto& contact : contacts) {
        ContactManifold& m = *contact.manifold;
        SolverBody& a = bodies[static_cast<std::size_t>(contact.index_a)];
        SolverBody& b = bodies[static_cast<std::size_t>(contact.index_b)];

        for (std::size_t i = 0; i < m.points.size(); ++i) {
            ContactPoint& cp = m.points[i];
            const auto& pd = contact.points[i];

            // Normal constraint
            Vec3 dv = b.velocity_at(pd.r_b) - a.velocity_at(pd.r_a);
            const float vn = impulse_math::dot(dv, m.normal);

            float dn = pd.normal_mass * (-vn + pd.velocity_bias);
            const float old_n = cp.normal_impulse;
            cp.normal_impulse = std::max(old_n + dn, 0.0f);
            dn = cp.normal_impulse - old_n;

            const Vec3 pn = m.normal * dn;
            a.apply_impulse(-pn, pd.r_a);
            b.apply_impulse(pn, pd.r_b);
            residual = std::max(residual, std::abs(dn));

            // Friction, bounded by the updated normal impulse
            const float max_friction = m.friction * cp.normal_impulse;

            // Tangent 1
            dv = b.velocity_at(pd.r_b) - a.velocity_at(pd.r_a);
            float dt1 = pd.tangent_mass_1 * -impulse_math::dot(dv, m.tangent_1);
            const float old_t1 = cp.tangent_impulse_1;
            cp.tangent_impulse_1 = std::clamp(old_t1 + dt1, -max_friction, max_friction);
            dt1 = cp.tangent_impulse_1 - old_t1;

            const Vec3 pt1 = m.tangent_1 * dt1;
            a.apply_impulse(-pt1, pd.r_a);
            b.apply_impulse(pt1, pd.r_b);

            // Tangent 2
            dv = b.velocity_at(pd.r_b) - a.velocity_at(pd.r_a);
            float dt2 = pd.tangent_mass_2 * -impulse_math::dot(dv, m.tangent_2);
            const float old_t2 = cp.tangent_impulse_2;
            cp.tangent_impulse_2 = std::clamp(old_t2 + dt2, -max_friction, max_friction);
            dt2 = cp.tangent_impulse_2 - old_t2;

            const Vec3 pt2 = m.tangent_2 * dt2;
            a.apply_impulse(-pt2, pd.r_a);
            b.apply_impulse(pt2, pd.r_b);

            residual = std::max({residual, std::abs(dt1), std::abs(dt2)});
        }
    }

    return residual;
}

float ContactSolver::solve_position(std::vector<ContactConstraint>& contacts, std::vector<SolverBody>& bodies) {
    float min_separation = 0.0f;

    for (auto& contact : contacts) {
        const ContactManifold& m = *contact.manifold;
        SolverBody& a = bodies[static_cast<std::size_t>(contact.index_a)];
        SolverBody& b = bodies[static_cast<std::size_t>(contact.index_b)];

        for (const auto& cp : m.points) {
            const Vec3 r_a = impulse_math::rotate(a.rotation, cp.local_a);
            const Vec3 r_b = impulse_math::rotate(b.rotation, cp.local_b);

            const Vec3 world_a = a.position + r_a;
            const Vec3 world_b = b.position + r_b;

            const float separation = impulse_math::dot(world_b - world_a, m.normal);
            min_separation = std::min(min_separation, separation);

            const float c = std::clamp(m_config.baumgarte * (separation + m_config.slop),
                                       -m_config.max_correction, 0.0f);
            if (c == 0.0f) {
                continue;
            }

            const float k = effective_mass_inverse(a, b, r_a, r_b, m.normal);
            if (k <= k_min_effective_mass) {
                continue;
            }

            const Vec3 p = m.normal * (-c / k);
            a.apply_position_impulse(-p, r_a);
            b.apply_position_impulse(p, r_b);
        }
    }

    return min_separation;
}

} // namespace impulse_physics
