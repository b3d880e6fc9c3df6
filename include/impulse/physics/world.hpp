/// @file world.hpp
/// @brief Physics world for impulse_physics

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include "body.hpp"
#include "broadphase.hpp"
#include "contact.hpp"
#include "joint.hpp"
#include "island.hpp"
#include "query.hpp"
#include "events.hpp"

#include <impulse/core/error.hpp>
#include <impulse/math/vec.hpp>
#include <impulse/math/quat.hpp>
#include <impulse/math/transform.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace impulse_physics {

// =============================================================================
// Snapshot
// =============================================================================

/// Read-only copy of one body taken after a step
struct BodySnapshot {
    BodyId id;
    std::uint64_t user_id = 0;
    BodyType type = BodyType::Dynamic;
    impulse_math::Vec3 position{0.0f};
    impulse_math::Quat rotation = impulse_math::quat::IDENTITY;
    impulse_math::Vec3 linear_velocity{0.0f};
    impulse_math::Vec3 angular_velocity{0.0f};
    bool sleeping = false;
    bool grounded = false;
};

/// State of every body at the end of a step, in body id order.
/// Safe to hand to other threads; it shares nothing with the world.
struct WorldSnapshot {
    std::uint64_t step = 0;              ///< Fixed steps simulated when taken
    std::vector<BodySnapshot> bodies;

    /// Find a body, or nullptr
    [[nodiscard]] const BodySnapshot* find(BodyId id) const;
};

// =============================================================================
// Physics World
// =============================================================================

/// Owns every body, joint and cached contact of one simulation.
/// Nothing is shared between worlds; the caller owns the world and passes it
/// by reference. A world must not be mutated while step() runs.
class PhysicsWorld {
public:
    explicit PhysicsWorld(PhysicsWorldConfig config = PhysicsWorldConfig::defaults());
    ~PhysicsWorld();

    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    [[nodiscard]] const PhysicsWorldConfig& config() const noexcept { return m_config; }

    /// Replace the configuration after validating it
    impulse_core::Result<void> set_config(const PhysicsWorldConfig& config);

    [[nodiscard]] const impulse_math::Vec3& gravity() const noexcept { return m_config.gravity; }
    void set_gravity(const impulse_math::Vec3& gravity) { m_config.gravity = gravity; }

    // =========================================================================
    // Bodies
    // =========================================================================

    /// Create a body. Fails on an invalid descriptor.
    [[nodiscard]] impulse_core::Result<BodyId> create_body(const RigidBodyDesc& desc);
    [[nodiscard]] impulse_core::Result<BodyId> create_body(const BodyBuilder& builder);

    /// Remove a body together with its joints and cached contacts
    impulse_core::Result<void> remove_body(BodyId id);

    /// Get a body, or nullptr when the id is unknown
    [[nodiscard]] RigidBody* body(BodyId id);
    [[nodiscard]] const RigidBody* body(BodyId id) const;

    [[nodiscard]] bool has_body(BodyId id) const { return m_index.count(id) != 0; }
    [[nodiscard]] std::size_t body_count() const noexcept { return m_bodies.size(); }

    /// Visit every body in id order
    void for_each_body(const std::function<void(const RigidBody&)>& callback) const;

    // =========================================================================
    // Joints
    // =========================================================================

    /// Create a joint between two existing bodies
    [[nodiscard]] impulse_core::Result<JointId> create_joint(const JointDesc& desc);

    /// Remove a joint
    impulse_core::Result<void> remove_joint(JointId id);

    /// Get a joint, or nullptr
    [[nodiscard]] IJointConstraint* joint(JointId id);
    [[nodiscard]] const IJointConstraint* joint(JointId id) const;

    [[nodiscard]] std::size_t joint_count() const noexcept { return m_joints.size(); }

    // =========================================================================
    // Sleep
    // =========================================================================

    /// Wake a body; the rest of its island follows on the next step
    impulse_core::Result<void> wake_body(BodyId id);

    /// Put a dynamic body and every body of its last island to sleep
    impulse_core::Result<void> sleep_body(BodyId id);

    // =========================================================================
    // Simulation
    // =========================================================================

    /// Advance by dt using fixed steps. Time beyond max_substeps steps is
    /// dropped rather than carried over.
    /// @return Number of fixed steps run
    std::uint32_t step(float dt);

    /// Run exactly one fixed step of config().fixed_dt
    void step_fixed();

    /// Unsimulated time carried to the next step() call
    [[nodiscard]] float accumulator() const noexcept { return m_accumulator; }

    /// Fraction of a fixed step left in the accumulator, for interpolation
    [[nodiscard]] float interpolation_alpha() const noexcept {
        return m_config.fixed_dt > 0.0f ? m_accumulator / m_config.fixed_dt : 0.0f;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// Closest hit along a ray, skipping triggers unless the filter asks for them
    [[nodiscard]] std::optional<RaycastHit> raycast(const impulse_math::Vec3& origin,
                                                    const impulse_math::Vec3& direction,
                                                    float max_distance,
                                                    const QueryFilter& filter = {}) const;

    /// Every hit along a ray, nearest first
    [[nodiscard]] std::vector<RaycastHit> raycast_all(const impulse_math::Vec3& origin,
                                                      const impulse_math::Vec3& direction,
                                                      float max_distance,
                                                      const QueryFilter& filter = {}) const;

    // =========================================================================
    // Events
    // =========================================================================

    void on_collision_enter(CollisionCallback callback) { m_callbacks.on_collision_enter = std::move(callback); }
    void on_collision_stay(CollisionCallback callback) { m_callbacks.on_collision_stay = std::move(callback); }
    void on_collision_exit(CollisionCallback callback) { m_callbacks.on_collision_exit = std::move(callback); }
    void on_trigger_enter(TriggerCallback callback) { m_callbacks.on_trigger_enter = std::move(callback); }
    void on_trigger_stay(TriggerCallback callback) { m_callbacks.on_trigger_stay = std::move(callback); }
    void on_trigger_exit(TriggerCallback callback) { m_callbacks.on_trigger_exit = std::move(callback); }

    // =========================================================================
    // Inspection
    // =========================================================================

    /// Counters of the last fixed step
    [[nodiscard]] const PhysicsStats& stats() const noexcept { return m_stats; }

    /// Copy of every body's state
    [[nodiscard]] WorldSnapshot snapshot() const;

    /// Manifolds of the last fixed step, with their solved impulses
    [[nodiscard]] const std::vector<ContactManifold>& manifolds() const noexcept { return m_manifolds; }

    /// Islands of the last fixed step
    [[nodiscard]] const std::vector<Island>& islands() const noexcept { return m_island_builder.islands(); }

    /// Impulses kept for warm starting
    [[nodiscard]] const ContactCache& contact_cache() const noexcept { return m_cache; }

    /// Remove every body and joint
    void clear();

private:
    void simulate(float dt);

    // Pipeline stages, in execution order
    void update_broadphase();
    void find_contacts();
    void wake_touched_bodies();
    void update_grounded();
    void build_islands();
    void warm_start_contacts();
    void solve_islands(float dt);
    void integrate_kinematic(float dt);
    void guard_non_finite();
    void run_ccd(const std::vector<impulse_math::Transform>& start_poses);
    void update_sleep(float dt);
    void finish_step();
    void dispatch_events();
    void update_stats();

    [[nodiscard]] std::optional<std::size_t> slot_of(BodyId id) const;
    void rebuild_index();

    PhysicsWorldConfig m_config;

    // Bodies in id order; m_index maps ids to slots
    std::vector<std::unique_ptr<RigidBody>> m_bodies;
    BodyIndexMap m_index;
    std::vector<std::unique_ptr<IJointConstraint>> m_joints;
    std::uint64_t m_next_body_id = 1;
    std::uint64_t m_next_joint_id = 1;

    // Per-step state
    SpatialHashGrid m_grid;
    std::vector<BodyPair> m_pairs;
    std::vector<ContactManifold> m_manifolds;
    std::vector<ContactManifold> m_pending_ccd;   ///< Time of impact contacts for the next step
    ContactCache m_cache;
    IslandBuilder m_island_builder;

    // Events
    ContactEventTracker m_tracker;
    EventCallbacks m_callbacks;

    float m_accumulator = 0.0f;
    PhysicsStats m_stats;
};

// =============================================================================
// Free Functions
// =============================================================================

/// Apply `config` to the world when it differs, then advance by dt.
/// An invalid configuration is rejected and the world is not stepped.
/// @return Number of fixed steps run
impulse_core::Result<std::uint32_t> step(PhysicsWorld& world, float dt, const PhysicsWorldConfig& config);

} // namespace impulse_physics
