/// @file world.cpp
/// @brief PhysicsWorld implementation

#include <impulse/physics/world.hpp>
#include <impulse/physics/collision.hpp>
#include <impulse/physics/ccd.hpp>
#include <impulse/core/log.hpp>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <thread>

namespace impulse_physics {

using impulse_core::Error;
using impulse_core::PhysicsError;
using impulse_math::Vec3;
using impulse_math::Quat;
using impulse_math::Transform;

namespace {

/// Contact normals steeper than this count as ground
constexpr float k_ground_normal_y = 0.7f;

/// A swept hit is only acted on when the discrete step would sink this share
/// of the thinner shape into the other
constexpr float k_ccd_min_penetration_fraction = 0.5f;

/// Swap the two halves of a compound feature id
std::uint32_t swap_feature(std::uint32_t feature) noexcept {
    return (feature << 16) | (feature >> 16);
}

/// Fill the body-space anchors of every point
void anchor_points(ContactManifold& manifold, const Transform& ta, const Transform& tb) {
    for (auto& p : manifold.points) {
        p.local_a = ta.inverse_transform_point(p.point_a);
        p.local_b = tb.inverse_transform_point(p.point_b);
    }
}

ContactManifold make_manifold(const RigidBody& a, const RigidBody& b, ShapeContact&& contact) {
    ContactManifold m;
    m.body_a = a.id();
    m.body_b = b.id();
    m.feature_id = contact.feature_id;
    m.normal = contact.normal;
    m.points = std::move(contact.points);
    if (m.points.size() > k_max_manifold_points) {
        reduce_manifold(m.points, m.normal);
    }
    anchor_points(m, a.transform(), b.transform());
    m.friction = combine_friction(a.friction(), b.friction());
    m.restitution = combine_restitution(a.restitution(), b.restitution());
    m.is_trigger = a.is_trigger() || b.is_trigger();
    m.update_tangents();
    return m;
}

bool involves(const ContactManifold& m, BodyId id) noexcept {
    return m.body_a == id || m.body_b == id;
}

} // anonymous namespace

// =============================================================================
// WorldSnapshot Implementation
// =============================================================================

const BodySnapshot* WorldSnapshot::find(BodyId id) const {
    const auto it = std::lower_bound(bodies.begin(), bodies.end(), id,
        [](const BodySnapshot& s, BodyId key) { return s.id < key; });
    return it != bodies.end() && it->id == id ? &*it : nullptr;
}

// =============================================================================
// PhysicsWorld Implementation
// =============================================================================

PhysicsWorld::PhysicsWorld(PhysicsWorldConfig config)
    : m_config(std::move(config))
    , m_grid(m_config.broadphase_cell_size)
    , m_cache(m_config.contact_match_tolerance)
{
    auto valid = m_config.validate();
    if (valid.is_err()) {
        IMPULSE_LOG_WARN("Invalid physics configuration ({}), using defaults", impulse_core::format_error(valid.error()));
        m_config = PhysicsWorldConfig::defaults();
        m_grid.set_cell_size(m_config.broadphase_cell_size);
        m_cache.set_match_tolerance(m_config.contact_match_tolerance);
    }

    IMPULSE_LOG_INFO("Physics world created (fixed_dt {:.5f}s, {} substeps, {} iterations, {})",
                     m_config.fixed_dt, m_config.max_substeps, m_config.solver_iterations,
                     m_config.parallel_islands ? "parallel islands" : "single threaded");
}

PhysicsWorld::~PhysicsWorld() {
    clear();
}

impulse_core::Result<void> PhysicsWorld::set_config(const PhysicsWorldConfig& config) {
    auto valid = config.validate();
    if (valid.is_err()) {
        return valid;
    }
    if (config.broadphase_cell_size != m_config.broadphase_cell_size) {
        m_grid.set_cell_size(config.broadphase_cell_size);
    }
    m_cache.set_match_tolerance(config.contact_match_tolerance);
    m_config = config;
    return impulse_core::Ok();
}

// =============================================================================
// Bodies
// =============================================================================

impulse_core::Result<BodyId> PhysicsWorld::create_body(const RigidBodyDesc& desc) {
    auto valid = desc.validate();
    if (valid.is_err()) {
        return valid.error();
    }

    const BodyId id{m_next_body_id++};
    m_index[id] = m_bodies.size();
    m_bodies.push_back(std::make_unique<RigidBody>(id, desc));

    IMPULSE_LOG_TRACE("Created {} body {}", to_string(desc.type), id.value);
    return id;
}

impulse_core::Result<BodyId> PhysicsWorld::create_body(const BodyBuilder& builder) {
    return create_body(builder.desc());
}

impulse_core::Result<void> PhysicsWorld::remove_body(BodyId id) {
    const auto slot = slot_of(id);
    if (!slot) {
        return Error(PhysicsError::body_not_found(id.value));
    }

    // Bodies resting on or jointed to the removed one must react
    const auto wake_other = [this, id](BodyId a, BodyId b) {
        if (RigidBody* other = body(a == id ? b : a)) {
            other->wake_up();
        }
    };
    for (const auto& m : m_manifolds) {
        if (involves(m, id)) {
            wake_other(m.body_a, m.body_b);
        }
    }
    for (const auto& joint : m_joints) {
        if (joint->body_a() == id || joint->body_b() == id) {
            wake_other(joint->body_a(), joint->body_b());
        }
    }

    m_joints.erase(std::remove_if(m_joints.begin(), m_joints.end(),
        [id](const std::unique_ptr<IJointConstraint>& j) { return j->body_a() == id || j->body_b() == id; }),
        m_joints.end());

    const auto touches = [id](const ContactManifold& m) { return involves(m, id); };
    m_manifolds.erase(std::remove_if(m_manifolds.begin(), m_manifolds.end(), touches), m_manifolds.end());
    m_pending_ccd.erase(std::remove_if(m_pending_ccd.begin(), m_pending_ccd.end(), touches), m_pending_ccd.end());
    m_cache.remove_body(id);

    m_bodies.erase(m_bodies.begin() + static_cast<std::ptrdiff_t>(*slot));
    rebuild_index();

    IMPULSE_LOG_TRACE("Removed body {}", id.value);
    return impulse_core::Ok();
}

RigidBody* PhysicsWorld::body(BodyId id) {
    const auto it = m_index.find(id);
    return it != m_index.end() ? m_bodies[it->second].get() : nullptr;
}

const RigidBody* PhysicsWorld::body(BodyId id) const {
    const auto it = m_index.find(id);
    return it != m_index.end() ? m_bodies[it->second].get() : nullptr;
}

void PhysicsWorld::for_each_body(const std::function<void(const RigidBody&)>& callback) const {
    for (const auto& b : m_bodies) {
        callback(*b);
    }
}

std::optional<std::size_t> PhysicsWorld::slot_of(BodyId id) const {
    const auto it = m_index.find(id);
    if (it == m_index.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PhysicsWorld::rebuild_index() {
    m_index.clear();
    for (std::size_t i = 0; i < m_bodies.size(); ++i) {
        m_index[m_bodies[i]->id()] = i;
    }
}

// =============================================================================
// Joints
// =============================================================================

impulse_core::Result<JointId> PhysicsWorld::create_joint(const JointDesc& desc) {
    auto valid = desc.validate();
    if (valid.is_err()) {
        return valid.error();
    }

    RigidBody* a = body(desc.body_a);
    if (!a) {
        return Error(PhysicsError::body_not_found(desc.body_a.value));
    }
    RigidBody* b = body(desc.body_b);
    if (!b) {
        return Error(PhysicsError::body_not_found(desc.body_b.value));
    }

    const JointId id{m_next_joint_id++};
    m_joints.push_back(make_joint(id, desc, *a, *b));
    a->wake_up();
    b->wake_up();

    IMPULSE_LOG_TRACE("Created {} joint {} between bodies {} and {}",
                      to_string(desc.type), id.value, desc.body_a.value, desc.body_b.value);
    return id;
}

impulse_core::Result<void> PhysicsWorld::remove_joint(JointId id) {
    const auto it = std::find_if(m_joints.begin(), m_joints.end(),
        [id](const std::unique_ptr<IJointConstraint>& j) { return j->id() == id; });
    if (it == m_joints.end()) {
        return Error(PhysicsError::joint_not_found(id.value));
    }

    for (BodyId b : {(*it)->body_a(), (*it)->body_b()}) {
        if (RigidBody* rb = body(b)) {
            rb->wake_up();
        }
    }
    m_joints.erase(it);
    return impulse_core::Ok();
}

IJointConstraint* PhysicsWorld::joint(JointId id) {
    for (auto& j : m_joints) {
        if (j->id() == id) {
            return j.get();
        }
    }
    return nullptr;
}

const IJointConstraint* PhysicsWorld::joint(JointId id) const {
    for (const auto& j : m_joints) {
        if (j->id() == id) {
            return j.get();
        }
    }
    return nullptr;
}

// =============================================================================
// Sleep
// =============================================================================

impulse_core::Result<void> PhysicsWorld::wake_body(BodyId id) {
    RigidBody* b = body(id);
    if (!b) {
        return Error(PhysicsError::body_not_found(id.value));
    }
    if (b->is_sleeping()) {
        IMPULSE_LOG_DEBUG("Body {} woken on request", id.value);
    }
    b->wake_up();
    return impulse_core::Ok();
}

impulse_core::Result<void> PhysicsWorld::sleep_body(BodyId id) {
    const auto slot = slot_of(id);
    if (!slot) {
        return Error(PhysicsError::body_not_found(id.value));
    }
    if (!m_bodies[*slot]->is_dynamic()) {
        return Error(PhysicsError::invalid_body("only dynamic bodies can sleep"))
            .with_context("body", std::to_string(id.value));
    }

    // An awake neighbour would wake the body again on the next step
    m_island_builder.build(m_bodies, m_index, m_manifolds, m_joints);
    const std::size_t island = m_island_builder.island_of(*slot);
    if (island == IslandBuilder::k_no_island) {
        m_bodies[*slot]->sleep();
        return impulse_core::Ok();
    }

    auto& target = m_island_builder.islands()[island];
    for (std::size_t i : target.bodies) {
        m_bodies[i]->sleep();
    }
    target.sleeping = true;

    IMPULSE_LOG_DEBUG("Island of body {} ({} bodies) put to sleep on request", id.value, target.bodies.size());
    return impulse_core::Ok();
}

// =============================================================================
// Simulation
// =============================================================================

std::uint32_t PhysicsWorld::step(float dt) {
    if (!(dt > 0.0f) || !std::isfinite(dt)) {
        m_stats.substeps = 0;
        return 0;
    }

    const float fixed = m_config.fixed_dt;
    m_accumulator += dt;

    std::uint32_t substeps = 0;
    while (m_accumulator >= fixed && substeps < m_config.max_substeps) {
        simulate(fixed);
        m_accumulator -= fixed;
        ++substeps;
    }

    // Drop whole steps beyond max_substeps
    if (m_accumulator >= fixed) {
        const float kept = std::fmod(m_accumulator, fixed);
        IMPULSE_LOG_DEBUG("Dropped {:.4f}s of simulation time after {} substeps",
                          m_accumulator - kept, substeps);
        m_accumulator = kept;
    }

    m_stats.substeps = substeps;
    return substeps;
}

void PhysicsWorld::step_fixed() {
    simulate(m_config.fixed_dt);
    m_stats.substeps = 1;
}

void PhysicsWorld::simulate(float dt) {
    IMPULSE_LOG_SCOPE("PhysicsWorld::simulate");
    m_stats.ccd_hits = 0;
    m_stats.failed_islands = 0;

    std::vector<Transform> start_poses;
    start_poses.reserve(m_bodies.size());
    for (const auto& b : m_bodies) {
        start_poses.push_back(b->transform());
    }

    update_broadphase();
    find_contacts();
    wake_touched_bodies();
    update_grounded();
    build_islands();
    warm_start_contacts();
    solve_islands(dt);
    integrate_kinematic(dt);
    guard_non_finite();
    run_ccd(start_poses);
    update_sleep(dt);
    finish_step();
    dispatch_events();

    ++m_stats.total_steps;
    update_stats();
}

// =============================================================================
// Pipeline Stages
// =============================================================================

void PhysicsWorld::update_broadphase() {
    m_grid.clear();
    for (const auto& b : m_bodies) {
        if (!b->has_collider()) {
            continue;
        }
        BroadphaseProxy proxy;
        proxy.body = b->id();
        proxy.bounds = b->world_bounds();
        proxy.mask = b->collider()->mask;
        proxy.immovable = b->is_immovable();
        proxy.sleeping = b->is_sleeping();
        proxy.trigger = b->is_trigger();
        m_grid.insert(proxy);
    }
    m_pairs = m_grid.find_pairs();
}

void PhysicsWorld::find_contacts() {
    m_manifolds.clear();

    std::vector<ShapeContact> contacts;
    for (const auto& pair : m_pairs) {
        const RigidBody& a = *m_bodies[m_index.at(pair.body_a)];
        const RigidBody& b = *m_bodies[m_index.at(pair.body_b)];

        contacts.clear();
        collide(a.collider()->shape, a.collider_transform(), b.collider()->shape, b.collider_transform(), contacts);
        for (auto& contact : contacts) {
            if (!contact.points.empty()) {
                m_manifolds.push_back(make_manifold(a, b, std::move(contact)));
            }
        }
    }

    // Time of impact contacts the narrowphase did not find again
    for (auto& pending : m_pending_ccd) {
        const RigidBody* a = body(pending.body_a);
        const RigidBody* b = body(pending.body_b);
        if (!a || !b) {
            continue;
        }
        const ManifoldKey key = ManifoldKey::of(pending);
        const bool found = std::any_of(m_manifolds.begin(), m_manifolds.end(),
            [&key](const ContactManifold& m) { return ManifoldKey::of(m) == key; });
        if (found) {
            continue;
        }

        const Transform ta = a->transform();
        const Transform tb = b->transform();
        for (auto& p : pending.points) {
            p.point_a = ta.transform_point(p.local_a);
            p.point_b = tb.transform_point(p.local_b);
            p.separation = impulse_math::dot(p.point_b - p.point_a, pending.normal);
        }
        m_manifolds.push_back(std::move(pending));
    }
    m_pending_ccd.clear();
}

void PhysicsWorld::wake_touched_bodies() {
    // Sleeping bodies touched by awake dynamic bodies are woken through their
    // island; kinematic bodies have no island and wake what they push
    const auto wake_if_pushed = [](RigidBody& sleeper, const RigidBody& other) {
        if (!sleeper.is_sleeping() || !other.is_kinematic()) {
            return;
        }
        if (impulse_math::length_squared(other.linear_velocity()) > 0.0f ||
            impulse_math::length_squared(other.angular_velocity()) > 0.0f) {
            sleeper.wake_up();
            IMPULSE_LOG_DEBUG("Body {} woken by kinematic body {}", sleeper.id().value, other.id().value);
        }
    };

    for (const auto& m : m_manifolds) {
        if (m.is_trigger) {
            continue;
        }
        RigidBody& a = *m_bodies[m_index.at(m.body_a)];
        RigidBody& b = *m_bodies[m_index.at(m.body_b)];
        wake_if_pushed(a, b);
        wake_if_pushed(b, a);
    }
}

void PhysicsWorld::update_grounded() {
    for (const auto& b : m_bodies) {
        if (b->is_dynamic() && !b->is_sleeping()) {
            b->set_grounded(false);
        }
    }

    // The normal points from A to B, so it pushes B along +n and A along -n
    for (const auto& m : m_manifolds) {
        if (m.is_trigger || m.empty()) {
            continue;
        }
        RigidBody& a = *m_bodies[m_index.at(m.body_a)];
        RigidBody& b = *m_bodies[m_index.at(m.body_b)];
        if (b.is_dynamic() && m.normal.y > k_ground_normal_y) {
            b.set_grounded(true);
        }
        if (a.is_dynamic() && -m.normal.y > k_ground_normal_y) {
            a.set_grounded(true);
        }
    }
}

void PhysicsWorld::build_islands() {
    m_island_builder.build(m_bodies, m_index, m_manifolds, m_joints);
    wake_mixed_islands(m_island_builder.islands(), m_bodies);
}

void PhysicsWorld::warm_start_contacts() {
    for (auto& m : m_manifolds) {
        if (!m.is_trigger) {
            m_cache.warm_start(m);
        }
    }
}

void PhysicsWorld::solve_islands(float dt) {
    auto& islands = m_island_builder.islands();

    std::vector<std::size_t> awake;
    for (std::size_t i = 0; i < islands.size(); ++i) {
        if (!islands[i].sleeping) {
            awake.push_back(i);
        }
    }
    if (awake.empty()) {
        return;
    }

    const SolverConfig solver_config = SolverConfig::from_world(m_config);
    const IntegrationSettings settings = IntegrationSettings::from_world(m_config);

    std::uint32_t workers = 1;
    if (m_config.parallel_islands && awake.size() > 1) {
        workers = m_config.worker_threads > 0
            ? m_config.worker_threads
            : std::max(1u, std::thread::hardware_concurrency());
        workers = std::min(workers, static_cast<std::uint32_t>(awake.size()));
    }

    // A failed island is logged and skipped for this step; the others still solve
    std::atomic<std::uint32_t> failed{0};
    const auto solve_guarded = [&](IslandSolver& solver, std::size_t island) {
        try {
            solver.solve(islands[island], m_bodies, m_index, m_manifolds, m_joints, dt);
        } catch (const std::exception& e) {
            failed.fetch_add(1);
            IMPULSE_LOG_WARN("Island {} solve failed: {}", island, e.what());
        }
    };

    if (workers <= 1) {
        IslandSolver solver(solver_config, settings);
        for (std::size_t i : awake) {
            solve_guarded(solver, i);
        }
    } else {
        // Islands share no dynamic body, manifold or joint, so each worker
        // writes only to the ones it claims
        std::atomic<std::size_t> next{0};
        std::vector<std::thread> threads;
        threads.reserve(workers);

        for (std::uint32_t w = 0; w < workers; ++w) {
            threads.emplace_back([&]() {
                IslandSolver solver(solver_config, settings);
                for (std::size_t i = next.fetch_add(1); i < awake.size(); i = next.fetch_add(1)) {
                    solve_guarded(solver, awake[i]);
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    m_stats.failed_islands += failed.load();
    if (failed.load() > 0) {
        IMPULSE_LOG_WARN("{} of {} islands skipped this step", failed.load(), awake.size());
    }
}

void PhysicsWorld::integrate_kinematic(float dt) {
    for (const auto& b : m_bodies) {
        if (!b->is_kinematic()) {
            continue;
        }
        const Vec3 position = b->position() + b->linear_velocity() * dt;
        const Quat rotation = impulse_math::integrate_rotation(b->rotation(), b->angular_velocity() * dt);
        b->set_state(position, rotation, b->linear_velocity(), b->angular_velocity());
    }
}

void PhysicsWorld::guard_non_finite() {
    for (const auto& b : m_bodies) {
        if (b->is_static() || b->has_finite_state()) {
            continue;
        }
        IMPULSE_LOG_WARN("Body {} has a non-finite position or velocity, restoring its last valid pose",
                         b->id().value);
        b->restore_valid_state();
    }
}

void PhysicsWorld::run_ccd(const std::vector<Transform>& start_poses) {
    std::vector<BodyId> candidates;

    for (std::size_t slot = 0; slot < m_bodies.size(); ++slot) {
        RigidBody& moving = *m_bodies[slot];
        if (!needs_sweep(moving, m_config.ccd_velocity_threshold)) {
            continue;
        }

        const Transform& start = start_poses[slot];
        const Vec3 translation = moving.position() - start.position;
        if (impulse_math::length_squared(translation) < impulse_math::consts::EPSILON) {
            continue;
        }

        const Collider& collider = *moving.collider();
        const Transform sweep_start = Transform{start.position, moving.rotation()}.combine(collider.local_transform());
        const impulse_math::AABB swept = world_bounds(collider.shape, sweep_start).union_with(moving.world_bounds());
        m_grid.query(swept, candidates);

        bool found = false;
        bool fallback = false;
        TimeOfImpact best;
        std::size_t best_slot = 0;

        for (BodyId other_id : candidates) {
            const auto other_slot = slot_of(other_id);
            if (!other_slot || *other_slot == slot) {
                continue;
            }
            const RigidBody& other = *m_bodies[*other_slot];
            if (!other.has_collider() || other.is_trigger() ||
                !can_collide(collider.mask, other.collider()->mask)) {
                continue;
            }

            const Transform& other_start_pose = start_poses[*other_slot];
            const Vec3 other_translation = other.position() - other_start_pose.position;
            const Transform other_start = Transform{other_start_pose.position, other.rotation()}
                .combine(other.collider()->local_transform());

            const TimeOfImpact toi = compute_toi(collider.shape, sweep_start, translation,
                                                 other.collider()->shape, other_start, other_translation,
                                                 m_config.ccd_max_iterations);
            switch (toi.state) {
                case TimeOfImpact::State::Hit: {
                    // Shallow hits are left to the discrete contact of the next step
                    const float closing = (1.0f - toi.t) *
                        impulse_math::dot(translation - other_translation, toi.contact.normal);
                    const float thickness = std::min(min_half_thickness(collider.shape),
                                                     min_half_thickness(other.collider()->shape));
                    if (closing < thickness * k_ccd_min_penetration_fraction) {
                        break;
                    }
                    if (!found || toi.t < best.t) {
                        best = toi;
                        best_slot = *other_slot;
                        found = true;
                    }
                    break;
                }
                case TimeOfImpact::State::Overlapping:
                case TimeOfImpact::State::Failed:
                    fallback = true;
                    break;
                case TimeOfImpact::State::Separated:
                    break;
            }
        }

        if (!found) {
            if (fallback) {
                IMPULSE_LOG_DEBUG("CCD for body {} found no time of impact, using discrete contacts",
                                  moving.id().value);
            }
            continue;
        }

        // Roll back to the time of impact
        const RigidBody& other = *m_bodies[best_slot];
        const Vec3 rolled_back = start.position + translation * best.t;
        moving.set_state(rolled_back, moving.rotation(), moving.linear_velocity(), moving.angular_velocity());

        const Vec3 other_translation = other.position() - start_poses[best_slot].position;
        const Transform other_at_toi{start_poses[best_slot].position + other_translation * best.t, other.rotation()};

        ContactManifold m;
        m.normal = best.contact.normal;
        m.points = std::move(best.contact.points);
        m.feature_id = best.contact.feature_id;
        m.friction = combine_friction(moving.friction(), other.friction());
        m.restitution = combine_restitution(moving.restitution(), other.restitution());
        m.from_ccd = true;

        if (moving.id() < other.id()) {
            m.body_a = moving.id();
            m.body_b = other.id();
            anchor_points(m, moving.transform(), other_at_toi);
        } else {
            m.body_a = other.id();
            m.body_b = moving.id();
            m.normal = -m.normal;
            m.feature_id = swap_feature(m.feature_id);
            for (auto& p : m.points) {
                std::swap(p.point_a, p.point_b);
            }
            anchor_points(m, other_at_toi, moving.transform());
        }
        m.update_tangents();
        m_pending_ccd.push_back(std::move(m));
        ++m_stats.ccd_hits;

        IMPULSE_LOG_TRACE("CCD rolled body {} back to t={:.3f} against body {}",
                          moving.id().value, best.t, other.id().value);
    }
}

void PhysicsWorld::update_sleep(float dt) {
    const SleepSettings settings = SleepSettings::from_world(m_config);
    for (auto& island : m_island_builder.islands()) {
        if (!island.sleeping) {
            update_island_sleep(island, m_bodies, settings, dt);
        }
    }
}

void PhysicsWorld::finish_step() {
    m_cache.store(m_manifolds);
    for (const auto& b : m_bodies) {
        b->clear_forces();
        b->save_valid_state();
    }
}

void PhysicsWorld::dispatch_events() {
    const auto is_trigger_body = [this](BodyId id) {
        const RigidBody* b = body(id);
        return b != nullptr && b->is_trigger();
    };

    // Pairs that stopped reporting because both sides are at rest keep their state
    const auto is_dormant = [this](const BodyPair& pair) {
        const RigidBody* a = body(pair.body_a);
        const RigidBody* b = body(pair.body_b);
        if (!a || !b) {
            return false;
        }
        const auto resting = [](const RigidBody& r) { return r.is_sleeping() || r.is_static(); };
        return resting(*a) && resting(*b);
    };

    m_tracker.update(m_manifolds, is_trigger_body, is_dormant);
    m_callbacks.dispatch(m_tracker);
}

void PhysicsWorld::update_stats() {
    m_stats.bodies = static_cast<std::uint32_t>(m_bodies.size());
    m_stats.awake_bodies = 0;
    m_stats.sleeping_bodies = 0;
    for (const auto& b : m_bodies) {
        if (b->is_sleeping()) {
            ++m_stats.sleeping_bodies;
        } else if (!b->is_static()) {
            ++m_stats.awake_bodies;
        }
    }

    m_stats.joints = static_cast<std::uint32_t>(m_joints.size());
    m_stats.broadphase_pairs = static_cast<std::uint32_t>(m_pairs.size());
    m_stats.manifolds = 0;
    m_stats.contact_points = 0;
    for (const auto& m : m_manifolds) {
        if (!m.empty()) {
            ++m_stats.manifolds;
            m_stats.contact_points += static_cast<std::uint32_t>(m.size());
        }
    }
    m_stats.islands = static_cast<std::uint32_t>(m_island_builder.islands().size());
    m_stats.sleeping_islands = static_cast<std::uint32_t>(m_island_builder.sleeping_count());
}

// =============================================================================
// Queries
// =============================================================================

std::optional<RaycastHit> PhysicsWorld::raycast(const Vec3& origin, const Vec3& direction,
                                                float max_distance, const QueryFilter& filter) const {
    if (!(max_distance > 0.0f) || !impulse_math::is_finite(origin) || !impulse_math::is_finite(direction) ||
        impulse_math::length_squared(direction) < impulse_math::consts::EPSILON) {
        return std::nullopt;
    }

    const impulse_math::Ray ray(origin, direction);
    std::optional<RaycastHit> best;
    for (const auto& b : m_bodies) {
        if (!filter.accepts(*b)) {
            continue;
        }
        auto hit = raycast_body(*b, ray, max_distance);
        if (hit && (!best || hit->distance < best->distance)) {
            best = hit;
        }
    }
    return best;
}

std::vector<RaycastHit> PhysicsWorld::raycast_all(const Vec3& origin, const Vec3& direction,
                                                  float max_distance, const QueryFilter& filter) const {
    std::vector<RaycastHit> hits;
    if (!(max_distance > 0.0f) || !impulse_math::is_finite(origin) || !impulse_math::is_finite(direction) ||
        impulse_math::length_squared(direction) < impulse_math::consts::EPSILON) {
        return hits;
    }

    const impulse_math::Ray ray(origin, direction);
    for (const auto& b : m_bodies) {
        if (!filter.accepts(*b)) {
            continue;
        }
        if (auto hit = raycast_body(*b, ray, max_distance)) {
            hits.push_back(*hit);
        }
    }
    std::stable_sort(hits.begin(), hits.end(),
        [](const RaycastHit& x, const RaycastHit& y) { return x.distance < y.distance; });
    return hits;
}

// =============================================================================
// Inspection
// =============================================================================

WorldSnapshot PhysicsWorld::snapshot() const {
    WorldSnapshot snap;
    snap.step = m_stats.total_steps;
    snap.bodies.reserve(m_bodies.size());
    for (const auto& b : m_bodies) {
        BodySnapshot s;
        s.id = b->id();
        s.user_id = b->user_id();
        s.type = b->type();
        s.position = b->position();
        s.rotation = b->rotation();
        s.linear_velocity = b->linear_velocity();
        s.angular_velocity = b->angular_velocity();
        s.sleeping = b->is_sleeping();
        s.grounded = b->is_grounded();
        snap.bodies.push_back(s);
    }
    return snap;
}

void PhysicsWorld::clear() {
    m_joints.clear();
    m_bodies.clear();
    m_index.clear();
    m_manifolds.clear();
    m_pending_ccd.clear();
    m_pairs.clear();
    m_cache.clear();
    m_grid.clear();
    m_tracker.clear();
    m_island_builder = IslandBuilder{};
    m_accumulator = 0.0f;
}

// =============================================================================
// Free Functions
// =============================================================================

impulse_core::Result<std::uint32_t> step(PhysicsWorld& world, float dt, const PhysicsWorldConfig& config) {
    if (!(world.config() == config)) {
        auto applied = world.set_config(config);
        if (applied.is_err()) {
            return applied.error();
        }
    }
    return world.step(dt);
}

} // namespace impulse_physics
