/// @file body.cpp
/// @brief Rigidbody implementations for impulse_physics

#include <impulse/physics/body.hpp>

#include <algorithm>
#include <cmath>

namespace impulse_physics {

using impulse_math::Vec3;
using impulse_math::Quat;
using impulse_core::Error;
using impulse_core::PhysicsError;

namespace {

/// Shape standing in for bodies that carry no collider
const Shape& default_inertia_shape() {
    static const Shape shape = SphereShape{0.5f};
    return shape;
}

bool contains_plane(const Shape& shape) {
    if (std::holds_alternative<PlaneShape>(shape)) {
        return true;
    }
    if (const auto* compound = std::get_if<CompoundShape>(&shape)) {
        return std::any_of(compound->children.begin(), compound->children.end(),
                           [](const CompoundChild& c) { return contains_plane(c.shape); });
    }
    return false;
}

bool valid_scale(const Vec3& scale) {
    return impulse_math::is_finite(scale) &&
           impulse_math::min_component(impulse_math::abs(scale)) > impulse_math::consts::EPSILON;
}

bool nested_plane(const Shape& shape) {
    const auto* compound = std::get_if<CompoundShape>(&shape);
    return compound && contains_plane(shape);
}

} // anonymous namespace

// =============================================================================
// RigidBodyDesc Implementation
// =============================================================================

RigidBodyDesc RigidBodyDesc::static_body(const Vec3& pos) {
    RigidBodyDesc desc;
    desc.type = BodyType::Static;
    desc.position = pos;
    return desc;
}

RigidBodyDesc RigidBodyDesc::kinematic_body(const Vec3& pos) {
    RigidBodyDesc desc;
    desc.type = BodyType::Kinematic;
    desc.position = pos;
    return desc;
}

RigidBodyDesc RigidBodyDesc::dynamic_body(const Vec3& pos, float body_mass) {
    RigidBodyDesc desc;
    desc.type = BodyType::Dynamic;
    desc.position = pos;
    desc.mass = body_mass;
    return desc;
}

impulse_core::Result<void> RigidBodyDesc::validate() const {
    if (!impulse_math::is_finite(position) || !impulse_math::is_finite(rotation)) {
        return Error(PhysicsError::invalid_body("non-finite pose"));
    }
    if (glm::length2(rotation) < impulse_math::consts::EPSILON) {
        return Error(PhysicsError::invalid_body("zero rotation quaternion"));
    }
    if (!impulse_math::is_finite(linear_velocity) || !impulse_math::is_finite(angular_velocity)) {
        return Error(PhysicsError::invalid_body("non-finite velocity"));
    }
    if (!valid_scale(scale)) {
        return Error(PhysicsError::invalid_body("scale components must be finite and non-zero"));
    }
    if (type == BodyType::Dynamic && !(std::isfinite(mass) && mass > 0.0f)) {
        return Error(PhysicsError::invalid_body("dynamic body needs a positive mass"));
    }
    if (!(restitution >= 0.0f && restitution <= 1.0f)) {
        return Error(PhysicsError::invalid_body("restitution must be in [0, 1]"));
    }
    if (!(friction >= 0.0f) || !std::isfinite(friction)) {
        return Error(PhysicsError::invalid_body("friction must be non-negative"));
    }
    if (!(linear_damping >= 0.0f) || !(angular_damping >= 0.0f)) {
        return Error(PhysicsError::invalid_body("damping must be non-negative"));
    }
    if (collider) {
        if (nested_plane(collider->shape)) {
            return Error(PhysicsError::invalid_shape("planes cannot be compound children"));
        }
        if (type != BodyType::Static && contains_plane(collider->shape)) {
            return Error(PhysicsError::invalid_shape("planes are only valid on static bodies"));
        }
    }
    return impulse_core::Ok();
}

// =============================================================================
// RigidBody Implementation
// =============================================================================

RigidBody::RigidBody(BodyId id, const RigidBodyDesc& desc)
    : m_id(id)
    , m_type(desc.type)
    , m_user_id(desc.user_id)
    , m_position(desc.position)
    , m_rotation(impulse_math::normalize_or_identity(desc.rotation))
    , m_mass(desc.mass)
    , m_restitution(desc.restitution)
    , m_friction(desc.friction)
    , m_linear_damping(desc.linear_damping)
    , m_angular_damping(desc.angular_damping)
    , m_gravity_scale(desc.gravity_scale)
    , m_unscaled_collider(desc.collider)
    , m_scale(valid_scale(desc.scale) ? desc.scale : impulse_math::splat3(1.0f))
    , m_ccd_mode(desc.ccd_mode)
    , m_can_sleep(desc.can_sleep)
{
    if (m_type != BodyType::Static) {
        m_linear_velocity = desc.linear_velocity;
        m_angular_velocity = desc.angular_velocity;
    }
    m_sleeping = desc.start_asleep && can_sleep();

    apply_scale();
    update_mass_properties();
    save_valid_state();
}

void RigidBody::set_position(const Vec3& pos) {
    m_position = pos;
    wake_up();
}

void RigidBody::set_rotation(const Quat& rot) {
    m_rotation = impulse_math::normalize_or_identity(rot);
    update_world_inertia();
    wake_up();
}

void RigidBody::set_transform(const impulse_math::Transform& t) {
    m_position = t.position;
    m_rotation = impulse_math::normalize_or_identity(t.rotation);
    update_world_inertia();
    wake_up();
}

void RigidBody::set_linear_velocity(const Vec3& vel) {
    if (is_static()) {
        return;
    }
    m_linear_velocity = vel;
    wake_up();
}

void RigidBody::set_angular_velocity(const Vec3& vel) {
    if (is_static()) {
        return;
    }
    m_angular_velocity = vel;
    wake_up();
}

Vec3 RigidBody::velocity_at_point(const Vec3& world_point) const noexcept {
    return m_linear_velocity + impulse_math::cross(m_angular_velocity, world_point - m_position);
}

// =============================================================================
// Forces
// =============================================================================

void RigidBody::apply_force(const Vec3& force) {
    if (!is_dynamic()) {
        return;
    }
    m_force += force;
    wake_up();
}

void RigidBody::apply_force_at_point(const Vec3& force, const Vec3& world_point) {
    if (!is_dynamic()) {
        return;
    }
    m_force += force;
    m_torque += impulse_math::cross(world_point - m_position, force);
    wake_up();
}

void RigidBody::apply_torque(const Vec3& torque) {
    if (!is_dynamic()) {
        return;
    }
    m_torque += torque;
    wake_up();
}

void RigidBody::apply_impulse(const Vec3& impulse) {
    if (!is_dynamic()) {
        return;
    }
    m_linear_velocity += impulse * m_inverse_mass;
    wake_up();
}

void RigidBody::apply_impulse_at_point(const Vec3& impulse, const Vec3& world_point) {
    if (!is_dynamic()) {
        return;
    }
    m_linear_velocity += impulse * m_inverse_mass;
    m_angular_velocity += m_world_inverse_inertia * impulse_math::cross(world_point - m_position, impulse);
    wake_up();
}

void RigidBody::clear_forces() noexcept {
    m_force = Vec3(0.0f);
    m_torque = Vec3(0.0f);
}

// =============================================================================
// Mass
// =============================================================================

void RigidBody::update_mass_properties() {
    if (!is_dynamic()) {
        m_inverse_mass = 0.0f;
        m_local_inverse_inertia = impulse_math::mat3::ZERO;
        m_world_inverse_inertia = impulse_math::mat3::ZERO;
        return;
    }

    const Shape& shape = m_collider && !is_degenerate(m_collider->shape)
        ? m_collider->shape
        : default_inertia_shape();

    MassProperties props = compute_mass_properties(shape, m_mass);
    if (m_collider) {
        // Tensor about the body origin
        const impulse_math::Mat3 r = impulse_math::quat_to_mat3(m_collider->rotation);
        const Vec3 d = m_collider->offset;
        props.inertia = impulse_math::rotate_tensor(r, props.inertia) +
            (impulse_math::mat3::IDENTITY * impulse_math::dot(d, d) - impulse_math::outer(d, d)) * m_mass;
    }

    m_inverse_mass = 1.0f / m_mass;
    m_local_inverse_inertia = impulse_math::inverse_or_zero(props.inertia);
    update_world_inertia();
}

void RigidBody::update_world_inertia() noexcept {
    if (!is_dynamic()) {
        m_world_inverse_inertia = impulse_math::mat3::ZERO;
        return;
    }
    m_world_inverse_inertia = impulse_math::rotate_tensor(impulse_math::quat_to_mat3(m_rotation),
                                                          m_local_inverse_inertia);
}

void RigidBody::set_mass(float mass) {
    if (!is_dynamic() || !(std::isfinite(mass) && mass > 0.0f)) {
        return;
    }
    m_mass = mass;
    update_mass_properties();
    wake_up();
}

// =============================================================================
// Collision
// =============================================================================

void RigidBody::set_collider(std::optional<Collider> collider) {
    m_unscaled_collider = std::move(collider);
    apply_scale();
    update_mass_properties();
    wake_up();
}

void RigidBody::set_scale(const Vec3& scale) {
    if (!valid_scale(scale)) {
        return;
    }
    m_scale = scale;
    apply_scale();
    update_mass_properties();
    wake_up();
}

void RigidBody::apply_scale() {
    m_collider = m_unscaled_collider;
    if (!m_collider || m_scale == impulse_math::splat3(1.0f)) {
        return;
    }
    m_collider->shape = scaled(m_collider->shape, m_scale);
    m_collider->offset *= m_scale;
}

impulse_math::Transform RigidBody::collider_transform() const noexcept {
    if (!m_collider) {
        return transform();
    }
    return transform().combine(m_collider->local_transform());
}

impulse_math::AABB RigidBody::world_bounds() const {
    if (!m_collider) {
        return impulse_math::AABB{};
    }
    return impulse_physics::world_bounds(m_collider->shape, collider_transform());
}

// =============================================================================
// Sleep
// =============================================================================

void RigidBody::set_can_sleep(bool can_sleep) {
    m_can_sleep = can_sleep;
    if (!can_sleep) {
        wake_up();
    }
}

void RigidBody::wake_up() noexcept {
    m_sleeping = false;
    m_sleep_timer = 0.0f;
}

void RigidBody::sleep() noexcept {
    if (!is_dynamic()) {
        return;
    }
    m_sleeping = true;
    m_linear_velocity = Vec3(0.0f);
    m_angular_velocity = Vec3(0.0f);
    clear_forces();
}

// =============================================================================
// Integration support
// =============================================================================

void RigidBody::set_state(const Vec3& pos, const Quat& rot, const Vec3& lin_vel, const Vec3& ang_vel) noexcept {
    m_position = pos;
    m_rotation = rot;
    m_linear_velocity = lin_vel;
    m_angular_velocity = ang_vel;
    update_world_inertia();
}

bool RigidBody::has_finite_state() const noexcept {
    return impulse_math::is_finite(m_position) && impulse_math::is_finite(m_rotation) &&
           impulse_math::is_finite(m_linear_velocity) && impulse_math::is_finite(m_angular_velocity);
}

void RigidBody::save_valid_state() noexcept {
    m_last_valid_position = m_position;
    m_last_valid_rotation = m_rotation;
}

void RigidBody::restore_valid_state() noexcept {
    m_position = m_last_valid_position;
    m_rotation = m_last_valid_rotation;
    m_linear_velocity = Vec3(0.0f);
    m_angular_velocity = Vec3(0.0f);
    clear_forces();
    update_world_inertia();
}

} // namespace impulse_physics
