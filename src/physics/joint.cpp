/// @file joint.cpp
/// @brief Joint constraint implementations for impulse_physics

#include <impulse/physics/joint.hpp>
#include <impulse/physics/body.hpp>

#include <algorithm>
#include <cmath>
#include <tuple>

namespace impulse_physics {

using impulse_math::Vec3;
using impulse_math::Quat;
using impulse_math::Mat3;
using impulse_core::Error;
using impulse_core::PhysicsError;

namespace {

/// Linear error left alone by the position pass (m)
constexpr float k_joint_linear_slop = 0.001f;

/// Angular error left alone by the position pass (rad)
constexpr float k_joint_angular_slop = 0.002f;

float safe_inverse(float k) {
    return k > 1e-6f ? 1.0f / k : 0.0f;
}

Vec3 clamp_length(const Vec3& v, float max_length) {
    const float len = impulse_math::length(v);
    return len > max_length ? v * (max_length / len) : v;
}

/// Inverse of the 3x3 point-to-point effective mass
Mat3 point_mass(const SolverBody& a, const SolverBody& b, const Vec3& r_a, const Vec3& r_b) {
    const Mat3 skew_a = impulse_math::skew(r_a);
    const Mat3 skew_b = impulse_math::skew(r_b);
    Mat3 k(a.inverse_mass + b.inverse_mass);
    k -= skew_a * a.inverse_inertia * skew_a;
    k -= skew_b * b.inverse_inertia * skew_b;
    return impulse_math::inverse_or_zero(k);
}

/// Drive the relative velocity of the two anchors to zero
void solve_point(SolverBody& a, SolverBody& b, const Vec3& r_a, const Vec3& r_b,
                 const Mat3& mass, Vec3& accumulated) {
    const Vec3 cdot = b.velocity_at(r_b) - a.velocity_at(r_a);
    const Vec3 impulse = mass * -cdot;
    accumulated += impulse;
    a.apply_impulse(-impulse, r_a);
    b.apply_impulse(impulse, r_b);
}

/// Drive the relative angular velocity to zero
void solve_angular_lock(SolverBody& a, SolverBody& b, const Mat3& mass, Vec3& accumulated) {
    const Vec3 cdot = b.angular_velocity - a.angular_velocity;
    const Vec3 impulse = mass * -cdot;
    accumulated += impulse;
    a.apply_angular_impulse(-impulse);
    b.apply_angular_impulse(impulse);
}

/// One-sided row keeping C >= 0, where cdot is the rate of C.
/// While C > 0 the row only stops the approach that would close the gap within one step.
/// @return Impulse change along the row
float solve_limit_row(float mass, float c, float cdot, float inv_dt, float& accumulated) {
    const float bias = c > 0.0f ? c * inv_dt : 0.0f;
    const float delta = -mass * (cdot + bias);
    const float old = accumulated;
    accumulated = std::max(old + delta, 0.0f);
    return accumulated - old;
}

/// Pull two body-local anchors together
float correct_point(SolverBody& a, SolverBody& b, const Vec3& local_a, const Vec3& local_b,
                    const JointSoftness& softness) {
    const Vec3 r_a = impulse_math::rotate(a.rotation, local_a);
    const Vec3 r_b = impulse_math::rotate(b.rotation, local_b);
    const Vec3 c = (b.position + r_b) - (a.position + r_a);
    const float error = impulse_math::length(c);
    if (error <= k_joint_linear_slop) {
        return error;
    }

    const Vec3 correction = clamp_length(c * softness.correction, softness.max_linear_correction);
    const Vec3 impulse = point_mass(a, b, r_a, r_b) * -correction;
    a.apply_position_impulse(-impulse, r_a);
    b.apply_position_impulse(impulse, r_b);
    return error;
}

/// Rotate both bodies towards rot_b == rot_a * relative
float correct_rotation(SolverBody& a, SolverBody& b, const Quat& relative, const JointSoftness& softness) {
    const Vec3 error = impulse_math::rotation_error(a.rotation * relative, b.rotation);
    const float angle = impulse_math::length(error);
    if (angle <= k_joint_angular_slop) {
        return angle;
    }

    const Vec3 correction = clamp_length(error * softness.correction, softness.max_angular_correction);
    const Vec3 impulse = impulse_math::inverse_or_zero(a.inverse_inertia + b.inverse_inertia) * -correction;
    a.apply_angular_position_impulse(-impulse);
    b.apply_angular_position_impulse(impulse);
    return angle;
}

/// Amount by which `value` lies outside [lower, upper] (signed, 0 inside)
float limit_violation(float value, float lower, float upper) {
    if (value < lower) {
        return value - lower;
    }
    if (value > upper) {
        return value - upper;
    }
    return 0.0f;
}

} // anonymous namespace

// =============================================================================
// JointDesc Implementation
// =============================================================================

JointDesc JointDesc::ball_socket(BodyId a, BodyId b, const Vec3& anchor) {
    JointDesc desc;
    desc.type = JointType::BallSocket;
    desc.body_a = a;
    desc.body_b = b;
    desc.anchor = anchor;
    return desc;
}

JointDesc JointDesc::distance(BodyId a, BodyId b, const Vec3& anchor_a, const Vec3& anchor_b, float rest_length) {
    JointDesc desc;
    desc.type = JointType::Distance;
    desc.body_a = a;
    desc.body_b = b;
    desc.anchor = anchor_a;
    desc.anchor_b = anchor_b;
    desc.rest_length = rest_length;
    return desc;
}

JointDesc JointDesc::hinge(BodyId a, BodyId b, const Vec3& anchor, const Vec3& axis) {
    JointDesc desc;
    desc.type = JointType::Hinge;
    desc.body_a = a;
    desc.body_b = b;
    desc.anchor = anchor;
    desc.axis = axis;
    return desc;
}

JointDesc JointDesc::fixed(BodyId a, BodyId b, const Vec3& anchor) {
    JointDesc desc;
    desc.type = JointType::Fixed;
    desc.body_a = a;
    desc.body_b = b;
    desc.anchor = anchor;
    return desc;
}

JointDesc JointDesc::slider(BodyId a, BodyId b, const Vec3& anchor, const Vec3& axis) {
    JointDesc desc;
    desc.type = JointType::Slider;
    desc.body_a = a;
    desc.body_b = b;
    desc.anchor = anchor;
    desc.axis = axis;
    return desc;
}

impulse_core::Result<void> JointDesc::validate() const {
    if (!body_a.is_valid() || !body_b.is_valid()) {
        return Error(PhysicsError::invalid_joint("both bodies must be set"));
    }
    if (body_a == body_b) {
        return Error(PhysicsError::invalid_joint("joint connects a body to itself"))
            .with_context("body", std::to_string(body_a.value));
    }
    if (!impulse_math::is_finite(anchor) || !impulse_math::is_finite(anchor_b)) {
        return Error(PhysicsError::invalid_joint("anchor is not finite"));
    }
    if (type == JointType::Hinge || type == JointType::Slider) {
        const float len = impulse_math::length(axis);
        if (!std::isfinite(len) || std::abs(len - 1.0f) > 1e-3f) {
            return Error(PhysicsError::invalid_joint("axis must be unit length"))
                .with_context("length", std::to_string(len));
        }
    }
    if (type == JointType::Distance && !std::isfinite(rest_length)) {
        return Error(PhysicsError::invalid_joint("rest length is not finite"));
    }
    if (!(softness.correction > 0.0f && softness.correction <= 1.0f)) {
        return Error(PhysicsError::invalid_joint("correction must be in (0, 1]"))
            .with_context("correction", std::to_string(softness.correction));
    }
    if (!(softness.max_linear_correction > 0.0f) || !std::isfinite(softness.max_linear_correction) ||
        !(softness.max_angular_correction > 0.0f) || !std::isfinite(softness.max_angular_correction)) {
        return Error(PhysicsError::invalid_joint("correction caps must be positive"));
    }
    if (use_limits) {
        if (!std::isfinite(lower_limit) || !std::isfinite(upper_limit) || lower_limit > upper_limit) {
            return Error(PhysicsError::invalid_joint("lower limit exceeds upper limit"));
        }
        if (type == JointType::Distance && lower_limit < 0.0f) {
            return Error(PhysicsError::invalid_joint("distance range must be non-negative"));
        }
    }
    return impulse_core::Ok();
}

// =============================================================================
// BallSocketJoint Implementation
// =============================================================================

BallSocketJoint::BallSocketJoint(JointId id, BodyId a, BodyId b,
                                 const Vec3& local_anchor_a, const Vec3& local_anchor_b)
    : IJointConstraint(id, a, b)
    , m_local_anchor_a(local_anchor_a)
    , m_local_anchor_b(local_anchor_b)
{}

void BallSocketJoint::prepare(const SolverBody& a, const SolverBody& b, float /*dt*/) {
    m_r_a = impulse_math::rotate(a.rotation, m_local_anchor_a);
    m_r_b = impulse_math::rotate(b.rotation, m_local_anchor_b);
    m_mass = point_mass(a, b, m_r_a, m_r_b);
}

void BallSocketJoint::warm_start(SolverBody& a, SolverBody& b) {
    a.apply_impulse(-m_impulse, m_r_a);
    b.apply_impulse(m_impulse, m_r_b);
}

void BallSocketJoint::solve_velocity(SolverBody& a, SolverBody& b) {
    solve_point(a, b, m_r_a, m_r_b, m_mass, m_impulse);
}

float BallSocketJoint::solve_position(SolverBody& a, SolverBody& b) {
    return correct_point(a, b, m_local_anchor_a, m_local_anchor_b, m_softness);
}

// =============================================================================
// DistanceJoint Implementation
// =============================================================================

DistanceJoint::DistanceJoint(JointId id, BodyId a, BodyId b,
                             const Vec3& local_anchor_a, const Vec3& local_anchor_b,
                             float rest_length, bool use_limits, float min_length, float max_length)
    : IJointConstraint(id, a, b)
    , m_local_anchor_a(local_anchor_a)
    , m_local_anchor_b(local_anchor_b)
    , m_rest_length(rest_length)
    , m_use_limits(use_limits)
    , m_min_length(min_length)
    , m_max_length(max_length)
{}

void DistanceJoint::prepare(const SolverBody& a, const SolverBody& b, float dt) {
    m_inv_dt = dt > 0.0f ? 1.0f / dt : 0.0f;
    m_r_a = impulse_math::rotate(a.rotation, m_local_anchor_a);
    m_r_b = impulse_math::rotate(b.rotation, m_local_anchor_b);

    const Vec3 d = (b.position + m_r_b) - (a.position + m_r_a);
    m_length = impulse_math::length(d);
    m_u = m_length > impulse_math::consts::EPSILON ? d / m_length : impulse_math::vec3::UP;
    m_mass = safe_inverse(effective_mass_inverse(a, b, m_r_a, m_r_b, m_u));

    if (m_use_limits) {
        m_impulse = 0.0f;
    } else {
        m_lower_impulse = 0.0f;
        m_upper_impulse = 0.0f;
    }
}

void DistanceJoint::warm_start(SolverBody& a, SolverBody& b) {
    const Vec3 p = m_u * (m_impulse + m_lower_impulse - m_upper_impulse);
    a.apply_impulse(-p, m_r_a);
    b.apply_impulse(p, m_r_b);
}

void DistanceJoint::solve_velocity(SolverBody& a, SolverBody& b) {
    if (!m_use_limits) {
        const float cdot = impulse_math::dot(m_u, b.velocity_at(m_r_b) - a.velocity_at(m_r_a));
        const float delta = -m_mass * cdot;
        m_impulse += delta;
        const Vec3 p = m_u * delta;
        a.apply_impulse(-p, m_r_a);
        b.apply_impulse(p, m_r_b);
        return;
    }

    // Minimum length pushes the anchors apart
    {
        const float cdot = impulse_math::dot(m_u, b.velocity_at(m_r_b) - a.velocity_at(m_r_a));
        const float delta = solve_limit_row(m_mass, m_length - m_min_length, cdot, m_inv_dt, m_lower_impulse);
        const Vec3 p = m_u * delta;
        a.apply_impulse(-p, m_r_a);
        b.apply_impulse(p, m_r_b);
    }

    // Maximum length pulls them together
    {
        const float cdot = impulse_math::dot(m_u, b.velocity_at(m_r_b) - a.velocity_at(m_r_a));
        const float delta = solve_limit_row(m_mass, m_max_length - m_length, -cdot, m_inv_dt, m_upper_impulse);
        const Vec3 p = m_u * -delta;
        a.apply_impulse(-p, m_r_a);
        b.apply_impulse(p, m_r_b);
    }
}

float DistanceJoint::solve_position(SolverBody& a, SolverBody& b) {
    const Vec3 r_a = impulse_math::rotate(a.rotation, m_local_anchor_a);
    const Vec3 r_b = impulse_math::rotate(b.rotation, m_local_anchor_b);
    const Vec3 d = (b.position + r_b) - (a.position + r_a);
    const float length = impulse_math::length(d);
    if (length <= impulse_math::consts::EPSILON) {
        return 0.0f;
    }
    const Vec3 u = d / length;

    const float c = m_use_limits ? limit_violation(length, m_min_length, m_max_length)
                                 : length - m_rest_length;
    if (std::abs(c) <= k_joint_linear_slop) {
        return std::abs(c);
    }

    const float correction = std::clamp(c * m_softness.correction,
                                        -m_softness.max_linear_correction, m_softness.max_linear_correction);
    const float k = effective_mass_inverse(a, b, r_a, r_b, u);
    const Vec3 p = u * (-correction * safe_inverse(k));
    a.apply_position_impulse(-p, r_a);
    b.apply_position_impulse(p, r_b);
    return std::abs(c);
}

void DistanceJoint::reset_impulses() {
    m_impulse = 0.0f;
    m_lower_impulse = 0.0f;
    m_upper_impulse = 0.0f;
}

// =============================================================================
// HingeJoint Implementation
// =============================================================================

HingeJoint::HingeJoint(JointId id, BodyId a, BodyId b,
                       const Vec3& local_anchor_a, const Vec3& local_anchor_b,
                       const Vec3& local_axis_a, const Vec3& local_axis_b,
                       const Vec3& local_ref_a, const Vec3& local_ref_b,
                       bool use_limits, float lower_limit, float upper_limit)
    : IJointConstraint(id, a, b)
    , m_local_anchor_a(local_anchor_a)
    , m_local_anchor_b(local_anchor_b)
    , m_local_axis_a(local_axis_a)
    , m_local_axis_b(local_axis_b)
    , m_local_ref_a(local_ref_a)
    , m_local_ref_b(local_ref_b)
    , m_use_limits(use_limits)
    , m_lower_limit(lower_limit)
    , m_upper_limit(upper_limit)
{}

float HingeJoint::compute_angle(const Quat& rot_a, const Quat& rot_b) const noexcept {
    const Vec3 axis = impulse_math::rotate(rot_a, m_local_axis_a);
    const Vec3 ref_a = impulse_math::rotate(rot_a, m_local_ref_a);
    const Vec3 ref_b = impulse_math::rotate(rot_b, m_local_ref_b);
    return std::atan2(impulse_math::dot(impulse_math::cross(ref_a, ref_b), axis),
                      impulse_math::dot(ref_a, ref_b));
}

void HingeJoint::prepare(const SolverBody& a, const SolverBody& b, float dt) {
    m_inv_dt = dt > 0.0f ? 1.0f / dt : 0.0f;
    m_r_a = impulse_math::rotate(a.rotation, m_local_anchor_a);
    m_r_b = impulse_math::rotate(b.rotation, m_local_anchor_b);
    m_linear_mass = point_mass(a, b, m_r_a, m_r_b);

    m_axis = impulse_math::normalize(impulse_math::rotate(a.rotation, m_local_axis_a));
    std::tie(m_perp1, m_perp2) = impulse_math::tangent_basis(m_axis);

    m_angular_mass_1 = safe_inverse(angular_mass_inverse(a, b, m_perp1));
    m_angular_mass_2 = safe_inverse(angular_mass_inverse(a, b, m_perp2));
    m_axial_mass = safe_inverse(angular_mass_inverse(a, b, m_axis));

    m_angle = compute_angle(a.rotation, b.rotation);

    if (!m_use_limits) {
        m_lower_impulse = 0.0f;
        m_upper_impulse = 0.0f;
    }
}

void HingeJoint::warm_start(SolverBody& a, SolverBody& b) {
    a.apply_impulse(-m_linear_impulse, m_r_a);
    b.apply_impulse(m_linear_impulse, m_r_b);

    const Vec3 angular = m_perp1 * m_angular_impulse_1
                       + m_perp2 * m_angular_impulse_2
                       + m_axis * (m_lower_impulse - m_upper_impulse);
    a.apply_angular_impulse(-angular);
    b.apply_angular_impulse(angular);
}

void HingeJoint::solve_velocity(SolverBody& a, SolverBody& b) {
    // Limits
    if (m_use_limits) {
        float cdot = impulse_math::dot(m_axis, b.angular_velocity - a.angular_velocity);
        float delta = solve_limit_row(m_axial_mass, m_angle - m_lower_limit, cdot, m_inv_dt, m_lower_impulse);
        a.apply_angular_impulse(-m_axis * delta);
        b.apply_angular_impulse(m_axis * delta);

        cdot = impulse_math::dot(m_axis, b.angular_velocity - a.angular_velocity);
        delta = solve_limit_row(m_axial_mass, m_upper_limit - m_angle, -cdot, m_inv_dt, m_upper_impulse);
        a.apply_angular_impulse(m_axis * delta);
        b.apply_angular_impulse(-m_axis * delta);
    }

    // Keep the axes aligned: no rotation about the two perpendiculars
    {
        const Vec3 w = b.angular_velocity - a.angular_velocity;
        const float delta = -m_angular_mass_1 * impulse_math::dot(m_perp1, w);
        m_angular_impulse_1 += delta;
        a.apply_angular_impulse(-m_perp1 * delta);
        b.apply_angular_impulse(m_perp1 * delta);
    }
    {
        const Vec3 w = b.angular_velocity - a.angular_velocity;
        const float delta = -m_angular_mass_2 * impulse_math::dot(m_perp2, w);
        m_angular_impulse_2 += delta;
        a.apply_angular_impulse(-m_perp2 * delta);
        b.apply_angular_impulse(m_perp2 * delta);
    }

    solve_point(a, b, m_r_a, m_r_b, m_linear_mass, m_linear_impulse);
}

float HingeJoint::solve_position(SolverBody& a, SolverBody& b) {
    float max_error = 0.0f;

    // Axis alignment
    {
        const Vec3 axis_a = impulse_math::rotate(a.rotation, m_local_axis_a);
        const Vec3 axis_b = impulse_math::rotate(b.rotation, m_local_axis_b);
        const Vec3 error = impulse_math::cross(axis_a, axis_b);
        const float angle = impulse_math::length(error);
        max_error = std::max(max_error, angle);
        if (angle > k_joint_angular_slop) {
            const Vec3 correction = clamp_length(error * m_softness.correction, m_softness.max_angular_correction);
            const Vec3 impulse = impulse_math::inverse_or_zero(a.inverse_inertia + b.inverse_inertia) * -correction;
            a.apply_angular_position_impulse(-impulse);
            b.apply_angular_position_impulse(impulse);
        }
    }

    // Limits
    if (m_use_limits) {
        const float c = limit_violation(compute_angle(a.rotation, b.rotation), m_lower_limit, m_upper_limit);
        max_error = std::max(max_error, std::abs(c));
        if (std::abs(c) > k_joint_angular_slop) {
            const Vec3 axis = impulse_math::rotate(a.rotation, m_local_axis_a);
            const float correction = std::clamp(c * m_softness.correction,
                                                -m_softness.max_angular_correction, m_softness.max_angular_correction);
            const float lambda = -correction * safe_inverse(angular_mass_inverse(a, b, axis));
            a.apply_angular_position_impulse(-axis * lambda);
            b.apply_angular_position_impulse(axis * lambda);
        }
    }

    max_error = std::max(max_error, correct_point(a, b, m_local_anchor_a, m_local_anchor_b, m_softness));
    return max_error;
}

void HingeJoint::reset_impulses() {
    m_linear_impulse = impulse_math::vec3::ZERO;
    m_angular_impulse_1 = 0.0f;
    m_angular_impulse_2 = 0.0f;
    m_lower_impulse = 0.0f;
    m_upper_impulse = 0.0f;
}

// =============================================================================
// FixedJoint Implementation
// =============================================================================

FixedJoint::FixedJoint(JointId id, BodyId a, BodyId b,
                       const Vec3& local_anchor_a, const Vec3& local_anchor_b,
                       const Quat& relative_rotation)
    : IJointConstraint(id, a, b)
    , m_local_anchor_a(local_anchor_a)
    , m_local_anchor_b(local_anchor_b)
    , m_relative_rotation(relative_rotation)
{}

void FixedJoint::prepare(const SolverBody& a, const SolverBody& b, float /*dt*/) {
    m_r_a = impulse_math::rotate(a.rotation, m_local_anchor_a);
    m_r_b = impulse_math::rotate(b.rotation, m_local_anchor_b);
    m_linear_mass = point_mass(a, b, m_r_a, m_r_b);
    m_angular_mass = impulse_math::inverse_or_zero(a.inverse_inertia + b.inverse_inertia);
}

void FixedJoint::warm_start(SolverBody& a, SolverBody& b) {
    a.apply_impulse(-m_linear_impulse, m_r_a);
    b.apply_impulse(m_linear_impulse, m_r_b);
    a.apply_angular_impulse(-m_angular_impulse);
    b.apply_angular_impulse(m_angular_impulse);
}

void FixedJoint::solve_velocity(SolverBody& a, SolverBody& b) {
    solve_angular_lock(a, b, m_angular_mass, m_angular_impulse);
    solve_point(a, b, m_r_a, m_r_b, m_linear_mass, m_linear_impulse);
}

float FixedJoint::solve_position(SolverBody& a, SolverBody& b) {
    const float angular = correct_rotation(a, b, m_relative_rotation, m_softness);
    const float linear = correct_point(a, b, m_local_anchor_a, m_local_anchor_b, m_softness);
    return std::max(angular, linear);
}

void FixedJoint::reset_impulses() {
    m_linear_impulse = impulse_math::vec3::ZERO;
    m_angular_impulse = impulse_math::vec3::ZERO;
}

// =============================================================================
// SliderJoint Implementation
// =============================================================================

SliderJoint::SliderJoint(JointId id, BodyId a, BodyId b,
                         const Vec3& local_anchor_a, const Vec3& local_anchor_b,
                         const Vec3& local_axis_a, const Quat& relative_rotation,
                         bool use_limits, float lower_limit, float upper_limit)
    : IJointConstraint(id, a, b)
    , m_local_anchor_a(local_anchor_a)
    , m_local_anchor_b(local_anchor_b)
    , m_local_axis_a(local_axis_a)
    , m_relative_rotation(relative_rotation)
    , m_use_limits(use_limits)
    , m_lower_limit(lower_limit)
    , m_upper_limit(upper_limit)
{}

void SliderJoint::prepare(const SolverBody& a, const SolverBody& b, float dt) {
    m_inv_dt = dt > 0.0f ? 1.0f / dt : 0.0f;

    const Vec3 r_a = impulse_math::rotate(a.rotation, m_local_anchor_a);
    m_r_b = impulse_math::rotate(b.rotation, m_local_anchor_b);
    const Vec3 d = (b.position + m_r_b) - (a.position + r_a);
    // Rows act at B's anchor so the lever arm on A includes the travel
    m_r_a = r_a + d;

    m_axis = impulse_math::normalize(impulse_math::rotate(a.rotation, m_local_axis_a));
    std::tie(m_perp1, m_perp2) = impulse_math::tangent_basis(m_axis);

    m_perp_mass_1 = safe_inverse(effective_mass_inverse(a, b, m_r_a, m_r_b, m_perp1));
    m_perp_mass_2 = safe_inverse(effective_mass_inverse(a, b, m_r_a, m_r_b, m_perp2));
    m_axial_mass = safe_inverse(effective_mass_inverse(a, b, m_r_a, m_r_b, m_axis));
    m_angular_mass = impulse_math::inverse_or_zero(a.inverse_inertia + b.inverse_inertia);

    m_translation = impulse_math::dot(d, m_axis);

    if (!m_use_limits) {
        m_lower_impulse = 0.0f;
        m_upper_impulse = 0.0f;
    }
}

void SliderJoint::warm_start(SolverBody& a, SolverBody& b) {
    const Vec3 p = m_perp1 * m_perp_impulse_1
                 + m_perp2 * m_perp_impulse_2
                 + m_axis * (m_lower_impulse - m_upper_impulse);
    a.apply_impulse(-p, m_r_a);
    b.apply_impulse(p, m_r_b);
    a.apply_angular_impulse(-m_angular_impulse);
    b.apply_angular_impulse(m_angular_impulse);
}

void SliderJoint::solve_velocity(SolverBody& a, SolverBody& b) {
    solve_angular_lock(a, b, m_angular_mass, m_angular_impulse);

    if (m_use_limits) {
        float cdot = impulse_math::dot(m_axis, b.velocity_at(m_r_b) - a.velocity_at(m_r_a));
        float delta = solve_limit_row(m_axial_mass, m_translation - m_lower_limit, cdot, m_inv_dt, m_lower_impulse);
        Vec3 p = m_axis * delta;
        a.apply_impulse(-p, m_r_a);
        b.apply_impulse(p, m_r_b);

        cdot = impulse_math::dot(m_axis, b.velocity_at(m_r_b) - a.velocity_at(m_r_a));
        delta = solve_limit_row(m_axial_mass, m_upper_limit - m_translation, -cdot, m_inv_dt, m_upper_impulse);
        p = m_axis * -delta;
        a.apply_impulse(-p, m_r_a);
        b.apply_impulse(p, m_r_b);
    }

    // Perpendicular rows
    {
        const float cdot = impulse_math::dot(m_perp1, b.velocity_at(m_r_b) - a.velocity_at(m_r_a));
        const float delta = -m_perp_mass_1 * cdot;
        m_perp_impulse_1 += delta;
        const Vec3 p = m_perp1 * delta;
        a.apply_impulse(-p, m_r_a);
        b.apply_impulse(p, m_r_b);
    }
    {
        const float cdot = impulse_math::dot(m_perp2, b.velocity_at(m_r_b) - a.velocity_at(m_r_a));
        const float delta = -m_perp_mass_2 * cdot;
        m_perp_impulse_2 += delta;
        const Vec3 p = m_perp2 * delta;
        a.apply_impulse(-p, m_r_a);
        b.apply_impulse(p, m_r_b);
    }
}

float SliderJoint::solve_position(SolverBody& a, SolverBody& b) {
    float max_error = correct_rotation(a, b, m_relative_rotation, m_softness);

    // Correct one direction at a time, re-measuring after each move
    const auto correct_along = [&](const Vec3& local_dir, int which) {
        const Vec3 r_a = impulse_math::rotate(a.rotation, m_local_anchor_a);
        const Vec3 r_b = impulse_math::rotate(b.rotation, m_local_anchor_b);
        const Vec3 d = (b.position + r_b) - (a.position + r_a);
        const Vec3 axis = impulse_math::normalize(impulse_math::rotate(a.rotation, m_local_axis_a));

        Vec3 dir = axis;
        float c = 0.0f;
        if (which == 0) {
            c = m_use_limits ? limit_violation(impulse_math::dot(d, axis), m_lower_limit, m_upper_limit) : 0.0f;
        } else {
            dir = impulse_math::normalize(impulse_math::rotate(a.rotation, local_dir));
            c = impulse_math::dot(d, dir);
        }

        max_error = std::max(max_error, std::abs(c));
        if (std::abs(c) <= k_joint_linear_slop) {
            return;
        }

        const Vec3 lever_a = r_a + d;
        const float correction = std::clamp(c * m_softness.correction,
                                            -m_softness.max_linear_correction, m_softness.max_linear_correction);
        const float lambda = -correction * safe_inverse(effective_mass_inverse(a, b, lever_a, r_b, dir));
        const Vec3 p = dir * lambda;
        a.apply_position_impulse(-p, lever_a);
        b.apply_position_impulse(p, r_b);
    };

    const auto [local_perp1, local_perp2] = impulse_math::tangent_basis(m_local_axis_a);
    correct_along(local_perp1, 1);
    correct_along(local_perp2, 1);
    correct_along(m_local_axis_a, 0);

    return max_error;
}

void SliderJoint::reset_impulses() {
    m_perp_impulse_1 = 0.0f;
    m_perp_impulse_2 = 0.0f;
    m_angular_impulse = impulse_math::vec3::ZERO;
    m_lower_impulse = 0.0f;
    m_upper_impulse = 0.0f;
}

// =============================================================================
// Factory
// =============================================================================

namespace {

std::unique_ptr<IJointConstraint> make_constraint(JointId id, const JointDesc& desc,
                                                  const RigidBody& body_a, const RigidBody& body_b) {
    const impulse_math::Transform ta = body_a.transform();
    const impulse_math::Transform tb = body_b.transform();
    const Vec3 local_a = ta.inverse_transform_point(desc.anchor);
    const Vec3 local_b = tb.inverse_transform_point(desc.anchor);
    const Quat relative = glm::conjugate(ta.rotation) * tb.rotation;

    switch (desc.type) {
        case JointType::BallSocket:
            return std::make_unique<BallSocketJoint>(id, desc.body_a, desc.body_b, local_a, local_b);

        case JointType::Distance: {
            const Vec3 local_end_b = tb.inverse_transform_point(desc.anchor_b);
            const float rest = desc.rest_length < 0.0f
                ? impulse_math::length(desc.anchor_b - desc.anchor)
                : desc.rest_length;
            return std::make_unique<DistanceJoint>(id, desc.body_a, desc.body_b, local_a, local_end_b, rest,
                                                   desc.use_limits, desc.lower_limit, desc.upper_limit);
        }

        case JointType::Hinge: {
            const Vec3 axis = impulse_math::normalize(desc.axis);
            const Vec3 reference = impulse_math::any_perpendicular(axis);
            return std::make_unique<HingeJoint>(
                id, desc.body_a, desc.body_b, local_a, local_b,
                ta.inverse_transform_vector(axis), tb.inverse_transform_vector(axis),
                ta.inverse_transform_vector(reference), tb.inverse_transform_vector(reference),
                desc.use_limits, desc.lower_limit, desc.upper_limit);
        }

        case JointType::Fixed:
            return std::make_unique<FixedJoint>(id, desc.body_a, desc.body_b, local_a, local_b, relative);

        case JointType::Slider:
            return std::make_unique<SliderJoint>(
                id, desc.body_a, desc.body_b, local_a, local_b,
                ta.inverse_transform_vector(impulse_math::normalize(desc.axis)), relative,
                desc.use_limits, desc.lower_limit, desc.upper_limit);
    }

    return nullptr;
}

} // anonymous namespace

std::unique_ptr<IJointConstraint> make_joint(JointId id, const JointDesc& desc,
                                             const RigidBody& body_a, const RigidBody& body_b) {
    auto joint = make_constraint(id, desc, body_a, body_b);
    if (joint) {
        joint->set_softness(desc.softness);
    }
    return joint;
}

} // namespace impulse_physics
