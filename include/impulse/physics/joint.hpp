/// @file joint.hpp
/// @brief Joint constraints for impulse_physics
///
/// Joints are described in world space at creation time; the anchors and
/// axes are then frozen into each body's local frame. Every row keeps an
/// accumulated impulse between steps for warm starting. Limits are a pair of
/// one-sided rows, each clamped like a contact normal and speculative while
/// the limit is not yet reached.

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "solver.hpp"

#include <impulse/math/vec.hpp>
#include <impulse/math/quat.hpp>
#include <impulse/math/mat.hpp>
#include <impulse/core/error.hpp>

#include <memory>

namespace impulse_physics {

// =============================================================================
// Constants
// =============================================================================

/// Default position correction factor of joint rows
constexpr float k_joint_correction = 0.5f;

/// Largest linear joint correction per position iteration (m)
constexpr float k_joint_max_linear_correction = 0.2f;

/// Largest angular joint correction per position iteration (rad)
constexpr float k_joint_max_angular_correction = 0.25f;

/// How hard the position pass pulls a joint back together
struct JointSoftness {
    float correction = k_joint_correction;                          ///< Share of the error removed per iteration, (0, 1]
    float max_linear_correction = k_joint_max_linear_correction;    ///< m
    float max_angular_correction = k_joint_max_angular_correction;  ///< rad
};

// =============================================================================
// Joint Descriptor
// =============================================================================

/// Parameters for creating a joint. Anchor and axis are world space values
/// taken at creation.
struct JointDesc {
    JointType type = JointType::BallSocket;
    BodyId body_a;
    BodyId body_b;

    impulse_math::Vec3 anchor{0.0f};          ///< Shared anchor (distance: anchor on A)
    impulse_math::Vec3 anchor_b{0.0f};        ///< Anchor on B (distance joint only)
    impulse_math::Vec3 axis{0.0f, 1.0f, 0.0f};///< Hinge/slider axis, unit length

    float rest_length = -1.0f;                ///< Distance joint length; negative measures at creation

    bool use_limits = false;                  ///< Hinge angle, slider travel or distance range
    float lower_limit = 0.0f;
    float upper_limit = 0.0f;

    JointSoftness softness;

    /// Free rotation about a shared point
    [[nodiscard]] static JointDesc ball_socket(BodyId a, BodyId b, const impulse_math::Vec3& anchor);

    /// Keep two anchors at a fixed distance (measured now when rest_length < 0)
    [[nodiscard]] static JointDesc distance(BodyId a, BodyId b,
                                            const impulse_math::Vec3& anchor_a,
                                            const impulse_math::Vec3& anchor_b,
                                            float rest_length = -1.0f);

    /// Rotation about one axis through the anchor
    [[nodiscard]] static JointDesc hinge(BodyId a, BodyId b,
                                         const impulse_math::Vec3& anchor,
                                         const impulse_math::Vec3& axis);

    /// No relative motion
    [[nodiscard]] static JointDesc fixed(BodyId a, BodyId b, const impulse_math::Vec3& anchor);

    /// Translation along one axis
    [[nodiscard]] static JointDesc slider(BodyId a, BodyId b,
                                          const impulse_math::Vec3& anchor,
                                          const impulse_math::Vec3& axis);

    /// Enable limits (radians for hinges, meters otherwise)
    JointDesc& with_limits(float lower, float upper) {
        use_limits = true;
        lower_limit = lower;
        upper_limit = upper;
        return *this;
    }

    /// Lower correction makes the joint drift back more slowly
    JointDesc& with_softness(float correction,
                             float max_linear = k_joint_max_linear_correction,
                             float max_angular = k_joint_max_angular_correction) {
        softness = JointSoftness{correction, max_linear, max_angular};
        return *this;
    }

    /// Reject self joints, invalid ids, non-unit axes, inverted limits and
    /// softness outside its range
    [[nodiscard]] impulse_core::Result<void> validate() const;
};

// =============================================================================
// Joint Constraint Base
// =============================================================================

/// Base class for joint constraints
class IJointConstraint {
public:
    IJointConstraint(JointId id, BodyId body_a, BodyId body_b)
        : m_id(id), m_body_a(body_a), m_body_b(body_b) {}
    virtual ~IJointConstraint() = default;

    [[nodiscard]] virtual JointType type() const noexcept = 0;
    [[nodiscard]] JointId id() const noexcept { return m_id; }
    [[nodiscard]] BodyId body_a() const noexcept { return m_body_a; }
    [[nodiscard]] BodyId body_b() const noexcept { return m_body_b; }

    [[nodiscard]] const JointSoftness& softness() const noexcept { return m_softness; }
    void set_softness(const JointSoftness& softness) noexcept { m_softness = softness; }

    /// Compute world frames and effective masses
    virtual void prepare(const SolverBody& a, const SolverBody& b, float dt) = 0;

    /// Apply warm starting impulses
    virtual void warm_start(SolverBody& a, SolverBody& b) = 0;

    /// Solve velocity constraints
    virtual void solve_velocity(SolverBody& a, SolverBody& b) = 0;

    /// Solve position constraints
    /// @return Remaining error (m or rad) before this correction
    virtual float solve_position(SolverBody& a, SolverBody& b) = 0;

    /// Forget accumulated impulses
    virtual void reset_impulses() = 0;

protected:
    JointId m_id;
    BodyId m_body_a;
    BodyId m_body_b;
    JointSoftness m_softness;
};

// =============================================================================
// Ball Socket Joint
// =============================================================================

/// Ball joint - removes the three translations
class BallSocketJoint : public IJointConstraint {
public:
    BallSocketJoint(JointId id, BodyId a, BodyId b,
                    const impulse_math::Vec3& local_anchor_a, const impulse_math::Vec3& local_anchor_b);

    [[nodiscard]] JointType type() const noexcept override { return JointType::BallSocket; }

    void prepare(const SolverBody& a, const SolverBody& b, float dt) override;
    void warm_start(SolverBody& a, SolverBody& b) override;
    void solve_velocity(SolverBody& a, SolverBody& b) override;
    float solve_position(SolverBody& a, SolverBody& b) override;
    void reset_impulses() override { m_impulse = impulse_math::vec3::ZERO; }

    [[nodiscard]] const impulse_math::Vec3& accumulated_impulse() const noexcept { return m_impulse; }

private:
    impulse_math::Vec3 m_local_anchor_a;
    impulse_math::Vec3 m_local_anchor_b;

    impulse_math::Vec3 m_r_a{0.0f};
    impulse_math::Vec3 m_r_b{0.0f};
    impulse_math::Mat3 m_mass = impulse_math::mat3::ZERO;
    impulse_math::Vec3 m_impulse{0.0f};
};

// =============================================================================
// Distance Joint
// =============================================================================

/// Distance joint - one row along the anchor line, optionally a [min, max] range
class DistanceJoint : public IJointConstraint {
public:
    DistanceJoint(JointId id, BodyId a, BodyId b,
                  const impulse_math::Vec3& local_anchor_a, const impulse_math::Vec3& local_anchor_b,
                  float rest_length, bool use_limits, float min_length, float max_length);

    [[nodiscard]] JointType type() const noexcept override { return JointType::Distance; }

    void prepare(const SolverBody& a, const SolverBody& b, float dt) override;
    void warm_start(SolverBody& a, SolverBody& b) override;
    void solve_velocity(SolverBody& a, SolverBody& b) override;
    float solve_position(SolverBody& a, SolverBody& b) override;
    void reset_impulses() override;

    [[nodiscard]] float rest_length() const noexcept { return m_rest_length; }
    [[nodiscard]] float current_length() const noexcept { return m_length; }

private:
    impulse_math::Vec3 m_local_anchor_a;
    impulse_math::Vec3 m_local_anchor_b;
    float m_rest_length;
    bool m_use_limits;
    float m_min_length;
    float m_max_length;

    impulse_math::Vec3 m_r_a{0.0f};
    impulse_math::Vec3 m_r_b{0.0f};
    impulse_math::Vec3 m_u{0.0f, 1.0f, 0.0f};
    float m_length = 0.0f;
    float m_mass = 0.0f;
    float m_inv_dt = 0.0f;
    float m_impulse = 0.0f;          ///< Rigid length row
    float m_lower_impulse = 0.0f;    ///< Minimum length row
    float m_upper_impulse = 0.0f;    ///< Maximum length row
};

// =============================================================================
// Hinge Joint
// =============================================================================

/// Hinge joint - rotation around single axis
class HingeJoint : public IJointConstraint {
public:
    HingeJoint(JointId id, BodyId a, BodyId b,
               const impulse_math::Vec3& local_anchor_a, const impulse_math::Vec3& local_anchor_b,
               const impulse_math::Vec3& local_axis_a, const impulse_math::Vec3& local_axis_b,
               const impulse_math::Vec3& local_ref_a, const impulse_math::Vec3& local_ref_b,
               bool use_limits, float lower_limit, float upper_limit);

    [[nodiscard]] JointType type() const noexcept override { return JointType::Hinge; }

    void prepare(const SolverBody& a, const SolverBody& b, float dt) override;
    void warm_start(SolverBody& a, SolverBody& b) override;
    void solve_velocity(SolverBody& a, SolverBody& b) override;
    float solve_position(SolverBody& a, SolverBody& b) override;
    void reset_impulses() override;

    /// Angle of B relative to A about the axis, as of the last prepare (rad)
    [[nodiscard]] float angle() const noexcept { return m_angle; }

    /// Angle of B relative to A for the given poses
    [[nodiscard]] float compute_angle(const impulse_math::Quat& rot_a, const impulse_math::Quat& rot_b) const noexcept;

private:
    impulse_math::Vec3 m_local_anchor_a;
    impulse_math::Vec3 m_local_anchor_b;
    impulse_math::Vec3 m_local_axis_a;
    impulse_math::Vec3 m_local_axis_b;
    impulse_math::Vec3 m_local_ref_a;      ///< Zero-angle direction on A
    impulse_math::Vec3 m_local_ref_b;      ///< Zero-angle direction on B
    bool m_use_limits;
    float m_lower_limit;
    float m_upper_limit;

    impulse_math::Vec3 m_r_a{0.0f};
    impulse_math::Vec3 m_r_b{0.0f};
    impulse_math::Vec3 m_axis{0.0f, 1.0f, 0.0f};
    impulse_math::Vec3 m_perp1{1.0f, 0.0f, 0.0f};
    impulse_math::Vec3 m_perp2{0.0f, 0.0f, 1.0f};
    impulse_math::Mat3 m_linear_mass = impulse_math::mat3::ZERO;
    float m_angular_mass_1 = 0.0f;
    float m_angular_mass_2 = 0.0f;
    float m_axial_mass = 0.0f;
    float m_angle = 0.0f;
    float m_inv_dt = 0.0f;

    impulse_math::Vec3 m_linear_impulse{0.0f};
    float m_angular_impulse_1 = 0.0f;
    float m_angular_impulse_2 = 0.0f;
    float m_lower_impulse = 0.0f;
    float m_upper_impulse = 0.0f;
};

// =============================================================================
// Fixed Joint
// =============================================================================

/// Fixed joint - maintains relative position and orientation
class FixedJoint : public IJointConstraint {
public:
    FixedJoint(JointId id, BodyId a, BodyId b,
               const impulse_math::Vec3& local_anchor_a, const impulse_math::Vec3& local_anchor_b,
               const impulse_math::Quat& relative_rotation);

    [[nodiscard]] JointType type() const noexcept override { return JointType::Fixed; }

    void prepare(const SolverBody& a, const SolverBody& b, float dt) override;
    void warm_start(SolverBody& a, SolverBody& b) override;
    void solve_velocity(SolverBody& a, SolverBody& b) override;
    float solve_position(SolverBody& a, SolverBody& b) override;
    void reset_impulses() override;

private:
    impulse_math::Vec3 m_local_anchor_a;
    impulse_math::Vec3 m_local_anchor_b;
    impulse_math::Quat m_relative_rotation;    ///< conj(rot_a) * rot_b at creation

    impulse_math::Vec3 m_r_a{0.0f};
    impulse_math::Vec3 m_r_b{0.0f};
    impulse_math::Mat3 m_linear_mass = impulse_math::mat3::ZERO;
    impulse_math::Mat3 m_angular_mass = impulse_math::mat3::ZERO;
    impulse_math::Vec3 m_linear_impulse{0.0f};
    impulse_math::Vec3 m_angular_impulse{0.0f};
};

// =============================================================================
// Slider Joint
// =============================================================================

/// Slider joint - translation along single axis (piston)
class SliderJoint : public IJointConstraint {
public:
    SliderJoint(JointId id, BodyId a, BodyId b,
                const impulse_math::Vec3& local_anchor_a, const impulse_math::Vec3& local_anchor_b,
                const impulse_math::Vec3& local_axis_a, const impulse_math::Quat& relative_rotation,
                bool use_limits, float lower_limit, float upper_limit);

    [[nodiscard]] JointType type() const noexcept override { return JointType::Slider; }

    void prepare(const SolverBody& a, const SolverBody& b, float dt) override;
    void warm_start(SolverBody& a, SolverBody& b) override;
    void solve_velocity(SolverBody& a, SolverBody& b) override;
    float solve_position(SolverBody& a, SolverBody& b) override;
    void reset_impulses() override;

    /// Travel of B's anchor along the axis, as of the last prepare (m)
    [[nodiscard]] float translation() const noexcept { return m_translation; }

private:
    impulse_math::Vec3 m_local_anchor_a;
    impulse_math::Vec3 m_local_anchor_b;
    impulse_math::Vec3 m_local_axis_a;
    impulse_math::Quat m_relative_rotation;
    bool m_use_limits;
    float m_lower_limit;
    float m_upper_limit;

    impulse_math::Vec3 m_r_a{0.0f};            ///< Offset from A to B's anchor
    impulse_math::Vec3 m_r_b{0.0f};
    impulse_math::Vec3 m_axis{1.0f, 0.0f, 0.0f};
    impulse_math::Vec3 m_perp1{0.0f, 1.0f, 0.0f};
    impulse_math::Vec3 m_perp2{0.0f, 0.0f, 1.0f};
    float m_perp_mass_1 = 0.0f;
    float m_perp_mass_2 = 0.0f;
    float m_axial_mass = 0.0f;
    impulse_math::Mat3 m_angular_mass = impulse_math::mat3::ZERO;
    float m_translation = 0.0f;
    float m_inv_dt = 0.0f;

    float m_perp_impulse_1 = 0.0f;
    float m_perp_impulse_2 = 0.0f;
    impulse_math::Vec3 m_angular_impulse{0.0f};
    float m_lower_impulse = 0.0f;
    float m_upper_impulse = 0.0f;
};

// =============================================================================
// Factory
// =============================================================================

/// Build the constraint for a validated descriptor, freezing anchors and
/// axes into the current body frames
[[nodiscard]] std::unique_ptr<IJointConstraint> make_joint(JointId id, const JointDesc& desc,
                                                           const RigidBody& body_a, const RigidBody& body_b);

} // namespace impulse_physics
