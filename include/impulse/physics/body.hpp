/// @file body.hpp
/// @brief Rigidbody definitions for impulse_physics

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "shape.hpp"

#include <impulse/math/vec.hpp>
#include <impulse/math/quat.hpp>
#include <impulse/math/mat.hpp>
#include <impulse/math/bounds.hpp>
#include <impulse/math/transform.hpp>
#include <impulse/core/error.hpp>

#include <optional>

namespace impulse_physics {

// =============================================================================
// Collider
// =============================================================================

/// Shape attached to a body, with its placement and filtering
struct Collider {
    Shape shape = SphereShape{};
    impulse_math::Vec3 offset{0.0f};                            ///< Position in body space
    impulse_math::Quat rotation = impulse_math::quat::IDENTITY; ///< Rotation in body space
    bool is_trigger = false;                                    ///< Reports overlaps, no response
    CollisionMask mask;

    /// Placement in body space
    [[nodiscard]] impulse_math::Transform local_transform() const noexcept {
        return impulse_math::Transform{offset, rotation};
    }
};

// =============================================================================
// Body Descriptor
// =============================================================================

/// Parameters for creating a rigidbody
struct RigidBodyDesc {
    BodyType type = BodyType::Dynamic;

    impulse_math::Vec3 position{0.0f};
    impulse_math::Quat rotation = impulse_math::quat::IDENTITY;
    impulse_math::Vec3 linear_velocity{0.0f};
    impulse_math::Vec3 angular_velocity{0.0f};
    impulse_math::Vec3 scale{1.0f};     ///< Per-axis stretch of the collider

    float mass = 1.0f;                  ///< Ignored for static and kinematic bodies
    float restitution = 0.0f;           ///< Bounciness [0, 1]
    float friction = 0.5f;              ///< Coulomb coefficient
    float linear_damping = 0.01f;       ///< Per-second velocity decay
    float angular_damping = 0.05f;      ///< Per-second spin decay
    float gravity_scale = 1.0f;         ///< Gravity multiplier

    CcdMode ccd_mode = CcdMode::Discrete;
    bool can_sleep = true;              ///< Allow body to sleep when at rest
    bool start_asleep = false;          ///< Start in sleeping state

    std::optional<Collider> collider;   ///< Bodies without one never collide
    std::uint64_t user_id = 0;          ///< User identifier (e.g., entity ID)

    /// Create static body descriptor
    [[nodiscard]] static RigidBodyDesc static_body(const impulse_math::Vec3& pos = impulse_math::vec3::ZERO);

    /// Create kinematic body descriptor
    [[nodiscard]] static RigidBodyDesc kinematic_body(const impulse_math::Vec3& pos = impulse_math::vec3::ZERO);

    /// Create dynamic body descriptor
    [[nodiscard]] static RigidBodyDesc dynamic_body(const impulse_math::Vec3& pos = impulse_math::vec3::ZERO,
                                                    float body_mass = 1.0f);

    /// Reject non-finite state, zero scale, bad material values, non-positive
    /// dynamic mass and planes on movable bodies
    [[nodiscard]] impulse_core::Result<void> validate() const;
};

// =============================================================================
// Rigidbody
// =============================================================================

/// Simulated rigid body, owned by a PhysicsWorld
class RigidBody {
public:
    RigidBody(BodyId id, const RigidBodyDesc& desc);

    // =========================================================================
    // Identity
    // =========================================================================

    [[nodiscard]] BodyId id() const noexcept { return m_id; }
    [[nodiscard]] BodyType type() const noexcept { return m_type; }
    [[nodiscard]] bool is_static() const noexcept { return m_type == BodyType::Static; }
    [[nodiscard]] bool is_kinematic() const noexcept { return m_type == BodyType::Kinematic; }
    [[nodiscard]] bool is_dynamic() const noexcept { return m_type == BodyType::Dynamic; }

    /// Static and kinematic bodies are not moved by impulses
    [[nodiscard]] bool is_immovable() const noexcept { return m_type != BodyType::Dynamic; }

    [[nodiscard]] std::uint64_t user_id() const noexcept { return m_user_id; }
    void set_user_id(std::uint64_t id) { m_user_id = id; }

    // =========================================================================
    // Transform
    // =========================================================================

    [[nodiscard]] const impulse_math::Vec3& position() const noexcept { return m_position; }
    [[nodiscard]] const impulse_math::Quat& rotation() const noexcept { return m_rotation; }
    [[nodiscard]] impulse_math::Transform transform() const noexcept {
        return impulse_math::Transform{m_position, m_rotation};
    }

    /// Teleport; wakes the body
    void set_position(const impulse_math::Vec3& pos);
    void set_rotation(const impulse_math::Quat& rot);
    void set_transform(const impulse_math::Transform& t);

    // =========================================================================
    // Velocity
    // =========================================================================

    [[nodiscard]] const impulse_math::Vec3& linear_velocity() const noexcept { return m_linear_velocity; }
    [[nodiscard]] const impulse_math::Vec3& angular_velocity() const noexcept { return m_angular_velocity; }

    /// Set velocities; static bodies ignore them, others wake
    void set_linear_velocity(const impulse_math::Vec3& vel);
    void set_angular_velocity(const impulse_math::Vec3& vel);

    /// Get velocity of a world point attached to the body
    [[nodiscard]] impulse_math::Vec3 velocity_at_point(const impulse_math::Vec3& world_point) const noexcept;

    // =========================================================================
    // Forces
    // =========================================================================

    /// Add force at the body origin, applied over the next fixed step
    void apply_force(const impulse_math::Vec3& force);

    /// Add force at world position
    void apply_force_at_point(const impulse_math::Vec3& force, const impulse_math::Vec3& world_point);

    /// Add torque
    void apply_torque(const impulse_math::Vec3& torque);

    /// Instant velocity change through the body origin
    void apply_impulse(const impulse_math::Vec3& impulse);

    /// Instant velocity change at world position
    void apply_impulse_at_point(const impulse_math::Vec3& impulse, const impulse_math::Vec3& world_point);

    /// Clear all accumulated forces
    void clear_forces() noexcept;

    [[nodiscard]] const impulse_math::Vec3& accumulated_force() const noexcept { return m_force; }
    [[nodiscard]] const impulse_math::Vec3& accumulated_torque() const noexcept { return m_torque; }

    // =========================================================================
    // Mass
    // =========================================================================

    [[nodiscard]] float mass() const noexcept { return m_mass; }

    /// Get inverse mass (0 for static/kinematic)
    [[nodiscard]] float inverse_mass() const noexcept { return m_inverse_mass; }

    /// Body-space inverse inertia tensor
    [[nodiscard]] const impulse_math::Mat3& local_inverse_inertia() const noexcept { return m_local_inverse_inertia; }

    /// World-space inverse inertia as of the last update_world_inertia()
    [[nodiscard]] const impulse_math::Mat3& world_inverse_inertia() const noexcept { return m_world_inverse_inertia; }

    /// Recompute R * I^-1 * R^T from the current orientation
    void update_world_inertia() noexcept;

    /// Change the mass of a dynamic body; rescales inertia
    void set_mass(float mass);

    // =========================================================================
    // Material and damping
    // =========================================================================

    [[nodiscard]] float restitution() const noexcept { return m_restitution; }
    void set_restitution(float e) { m_restitution = e; }
    [[nodiscard]] float friction() const noexcept { return m_friction; }
    void set_friction(float f) { m_friction = f; }

    [[nodiscard]] float linear_damping() const noexcept { return m_linear_damping; }
    void set_linear_damping(float d) { m_linear_damping = d; }
    [[nodiscard]] float angular_damping() const noexcept { return m_angular_damping; }
    void set_angular_damping(float d) { m_angular_damping = d; }
    [[nodiscard]] float gravity_scale() const noexcept { return m_gravity_scale; }
    void set_gravity_scale(float s) { m_gravity_scale = s; }

    // =========================================================================
    // Collision
    // =========================================================================

    [[nodiscard]] bool has_collider() const noexcept { return m_collider.has_value(); }
    [[nodiscard]] const std::optional<Collider>& collider() const noexcept { return m_collider; }

    /// Replace (or remove) the collider; recomputes mass properties
    void set_collider(std::optional<Collider> collider);

    /// Collider as given, before the body scale is applied
    [[nodiscard]] const std::optional<Collider>& unscaled_collider() const noexcept { return m_unscaled_collider; }

    [[nodiscard]] const impulse_math::Vec3& scale() const noexcept { return m_scale; }

    /// Rescale the collider; ignored when a component is zero or not finite
    void set_scale(const impulse_math::Vec3& scale);

    /// World placement of the collider
    [[nodiscard]] impulse_math::Transform collider_transform() const noexcept;

    /// World bounds of the collider (invalid AABB when there is none)
    [[nodiscard]] impulse_math::AABB world_bounds() const;

    [[nodiscard]] bool is_trigger() const noexcept { return m_collider && m_collider->is_trigger; }

    [[nodiscard]] CcdMode ccd_mode() const noexcept { return m_ccd_mode; }
    void set_ccd_mode(CcdMode mode) { m_ccd_mode = mode; }

    /// Set when a contact pushes the body up (normal.y > 0.7)
    [[nodiscard]] bool is_grounded() const noexcept { return m_grounded; }
    void set_grounded(bool grounded) noexcept { m_grounded = grounded; }

    // =========================================================================
    // Sleep
    // =========================================================================

    [[nodiscard]] bool is_sleeping() const noexcept { return m_sleeping; }
    [[nodiscard]] bool can_sleep() const noexcept { return m_can_sleep && is_dynamic(); }
    void set_can_sleep(bool can_sleep);

    /// Wake up; resets the sleep timer
    void wake_up() noexcept;

    /// Put to sleep, zeroing velocities (dynamic bodies only)
    void sleep() noexcept;

    [[nodiscard]] float sleep_timer() const noexcept { return m_sleep_timer; }
    void set_sleep_timer(float t) noexcept { m_sleep_timer = t; }

    // =========================================================================
    // Integration support
    // =========================================================================

    /// Write pose and velocities computed by the solver
    void set_state(const impulse_math::Vec3& pos, const impulse_math::Quat& rot,
                   const impulse_math::Vec3& lin_vel, const impulse_math::Vec3& ang_vel) noexcept;

    /// Check if pose and velocities are all finite
    [[nodiscard]] bool has_finite_state() const noexcept;

    /// Remember the current pose as the last known good one
    void save_valid_state() noexcept;

    /// Return to the last known good pose with zero velocity
    void restore_valid_state() noexcept;

private:
    void update_mass_properties();
    void apply_scale();

    BodyId m_id;
    BodyType m_type;
    std::uint64_t m_user_id = 0;

    // Transform
    impulse_math::Vec3 m_position{0.0f};
    impulse_math::Quat m_rotation = impulse_math::quat::IDENTITY;
    impulse_math::Vec3 m_last_valid_position{0.0f};
    impulse_math::Quat m_last_valid_rotation = impulse_math::quat::IDENTITY;

    // Velocity
    impulse_math::Vec3 m_linear_velocity{0.0f};
    impulse_math::Vec3 m_angular_velocity{0.0f};

    // Forces
    impulse_math::Vec3 m_force{0.0f};
    impulse_math::Vec3 m_torque{0.0f};

    // Mass
    float m_mass = 1.0f;
    float m_inverse_mass = 0.0f;
    impulse_math::Mat3 m_local_inverse_inertia = impulse_math::mat3::ZERO;
    impulse_math::Mat3 m_world_inverse_inertia = impulse_math::mat3::ZERO;

    // Material
    float m_restitution = 0.0f;
    float m_friction = 0.5f;

    // Damping
    float m_linear_damping = 0.01f;
    float m_angular_damping = 0.05f;
    float m_gravity_scale = 1.0f;

    // Collision
    std::optional<Collider> m_unscaled_collider;
    std::optional<Collider> m_collider;        ///< m_unscaled_collider under m_scale
    impulse_math::Vec3 m_scale{1.0f};
    CcdMode m_ccd_mode = CcdMode::Discrete;
    bool m_grounded = false;

    // Sleep
    bool m_sleeping = false;
    bool m_can_sleep = true;
    float m_sleep_timer = 0.0f;
};

// =============================================================================
// Body Builder
// =============================================================================

/// Fluent builder for body descriptors
class BodyBuilder {
public:
    BodyBuilder() = default;

    /// Set body type
    BodyBuilder& type(BodyType t) { m_desc.type = t; return *this; }
    BodyBuilder& static_body() { return type(BodyType::Static); }
    BodyBuilder& kinematic_body() { return type(BodyType::Kinematic); }
    BodyBuilder& dynamic_body() { return type(BodyType::Dynamic); }

    /// Set position
    BodyBuilder& position(const impulse_math::Vec3& p) { m_desc.position = p; return *this; }
    BodyBuilder& position(float x, float y, float z) { return position({x, y, z}); }

    /// Set rotation
    BodyBuilder& rotation(const impulse_math::Quat& r) { m_desc.rotation = r; return *this; }

    /// Set velocities
    BodyBuilder& linear_velocity(const impulse_math::Vec3& v) { m_desc.linear_velocity = v; return *this; }
    BodyBuilder& angular_velocity(const impulse_math::Vec3& v) { m_desc.angular_velocity = v; return *this; }

    /// Set mass
    BodyBuilder& mass(float m) { m_desc.mass = m; return *this; }

    /// Stretch the collider per axis
    BodyBuilder& scale(const impulse_math::Vec3& s) { m_desc.scale = s; return *this; }
    BodyBuilder& scale(float uniform) { return scale(impulse_math::splat3(uniform)); }

    /// Set material
    BodyBuilder& restitution(float e) { m_desc.restitution = e; return *this; }
    BodyBuilder& friction(float f) { m_desc.friction = f; return *this; }

    /// Set damping
    BodyBuilder& linear_damping(float d) { m_desc.linear_damping = d; return *this; }
    BodyBuilder& angular_damping(float d) { m_desc.angular_damping = d; return *this; }

    /// Set gravity scale
    BodyBuilder& gravity_scale(float s) { m_desc.gravity_scale = s; return *this; }

    /// Enable swept collision
    BodyBuilder& continuous(bool enabled = true) {
        m_desc.ccd_mode = enabled ? CcdMode::Swept : CcdMode::Discrete;
        return *this;
    }

    /// Allow/disallow sleep
    BodyBuilder& allow_sleep(bool allow = true) { m_desc.can_sleep = allow; return *this; }

    /// Start asleep
    BodyBuilder& start_asleep(bool asleep = true) { m_desc.start_asleep = asleep; return *this; }

    /// Set user ID
    BodyBuilder& user_id(std::uint64_t id) { m_desc.user_id = id; return *this; }

    /// Attach shape (replaces any previous collider shape)
    BodyBuilder& with_shape(Shape shape) {
        ensure_collider().shape = std::move(shape);
        return *this;
    }

    BodyBuilder& with_sphere(float radius) { return with_shape(SphereShape{radius}); }
    BodyBuilder& with_box(const impulse_math::Vec3& half_extents) { return with_shape(BoxShape{half_extents}); }
    BodyBuilder& with_aabb(const impulse_math::Vec3& half_extents) { return with_shape(AabbShape{half_extents}); }
    BodyBuilder& with_capsule(float radius, float half_height, CapsuleAxis axis = CapsuleAxis::Y) {
        return with_shape(CapsuleShape{radius, half_height, axis});
    }
    BodyBuilder& with_plane(const impulse_math::Vec3& normal, float offset) {
        return with_shape(PlaneShape{normal, offset});
    }

    /// Collider placement in body space
    BodyBuilder& collider_offset(const impulse_math::Vec3& offset, const impulse_math::Quat& rot = impulse_math::quat::IDENTITY) {
        ensure_collider().offset = offset;
        ensure_collider().rotation = rot;
        return *this;
    }

    /// Set as trigger
    BodyBuilder& trigger(bool enabled = true) { ensure_collider().is_trigger = enabled; return *this; }

    /// Set collision layer and filter
    BodyBuilder& layer(CollisionLayer l) { ensure_collider().mask.layer = l; return *this; }
    BodyBuilder& collides_with(CollisionLayer l) { ensure_collider().mask.collides_with = l; return *this; }

    /// Get descriptor
    [[nodiscard]] const RigidBodyDesc& desc() const { return m_desc; }

    /// Build the descriptor
    [[nodiscard]] RigidBodyDesc build() const { return m_desc; }

private:
    Collider& ensure_collider() {
        if (!m_desc.collider) {
            m_desc.collider.emplace();
        }
        return *m_desc.collider;
    }

    RigidBodyDesc m_desc;
};

} // namespace impulse_physics
