/// @file island.cpp
/// @brief Island building, sleep evaluation and per-island solving

#include <impulse/physics/island.hpp>
#include <impulse/physics/body.hpp>
#include <impulse/physics/joint.hpp>
#include <impulse/physics/config.hpp>
#include <impulse/core/log.hpp>

#include <algorithm>
#include <numeric>

namespace impulse_physics {

using impulse_math::Vec3;

// =============================================================================
// UnionFind Implementation
// =============================================================================

void UnionFind::reset(std::size_t count) {
    m_parent.resize(count);
    std::iota(m_parent.begin(), m_parent.end(), std::size_t{0});
    m_size.assign(count, 1);
}

std::size_t UnionFind::find(std::size_t i) noexcept {
    while (m_parent[i] != i) {
        m_parent[i] = m_parent[m_parent[i]];
        i = m_parent[i];
    }
    return i;
}

void UnionFind::unite(std::size_t a, std::size_t b) noexcept {
    a = find(a);
    b = find(b);
    if (a == b) {
        return;
    }
    if (m_size[a] < m_size[b]) {
        std::swap(a, b);
    }
    m_parent[b] = a;
    m_size[a] += m_size[b];
}

// =============================================================================
// IslandBuilder Implementation
// =============================================================================

void IslandBuilder::build(const std::vector<std::unique_ptr<RigidBody>>& bodies,
                          const BodyIndexMap& index,
                          const std::vector<ContactManifold>& manifolds,
                          const std::vector<std::unique_ptr<IJointConstraint>>& joints) {
    m_islands.clear();
    m_body_island.assign(bodies.size(), k_no_island);
    m_sets.reset(bodies.size());

    // Arena slot of a dynamic body, or k_no_island
    const auto dynamic_slot = [&](BodyId id) {
        const auto it = index.find(id);
        if (it == index.end() || !bodies[it->second]->is_dynamic()) {
            return k_no_island;
        }
        return it->second;
    };

    const auto link = [&](BodyId a, BodyId b) {
        const std::size_t ia = dynamic_slot(a);
        const std::size_t ib = dynamic_slot(b);
        if (ia != k_no_island && ib != k_no_island) {
            m_sets.unite(ia, ib);
        }
    };

    for (const auto& m : manifolds) {
        if (!m.is_trigger && !m.empty()) {
            link(m.body_a, m.body_b);
        }
    }
    for (const auto& joint : joints) {
        link(joint->body_a(), joint->body_b());
    }

    // One island per root, in arena order
    std::vector<std::size_t> root_island(bodies.size(), k_no_island);
    for (std::size_t i = 0; i < bodies.size(); ++i) {
        if (!bodies[i]->is_dynamic()) {
            continue;
        }
        const std::size_t root = m_sets.find(i);
        if (root_island[root] == k_no_island) {
            root_island[root] = m_islands.size();
            m_islands.emplace_back();
        }
        m_body_island[i] = root_island[root];
        m_islands[root_island[root]].bodies.push_back(i);
    }

    // Constraints belong to the island of whichever side is dynamic
    const auto owner = [&](BodyId a, BodyId b) {
        std::size_t slot = dynamic_slot(a);
        if (slot == k_no_island) {
            slot = dynamic_slot(b);
        }
        return slot == k_no_island ? k_no_island : m_body_island[slot];
    };

    for (std::size_t i = 0; i < manifolds.size(); ++i) {
        const auto& m = manifolds[i];
        if (m.is_trigger || m.empty()) {
            continue;
        }
        const std::size_t island = owner(m.body_a, m.body_b);
        if (island != k_no_island) {
            m_islands[island].manifolds.push_back(i);
        }
    }
    for (std::size_t i = 0; i < joints.size(); ++i) {
        const std::size_t island = owner(joints[i]->body_a(), joints[i]->body_b());
        if (island != k_no_island) {
            m_islands[island].joints.push_back(i);
        }
    }

    for (auto& island : m_islands) {
        island.sleeping = std::all_of(island.bodies.begin(), island.bodies.end(),
                                      [&](std::size_t i) { return bodies[i]->is_sleeping(); });
    }
}

std::size_t IslandBuilder::sleeping_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(m_islands.begin(), m_islands.end(),
                                                  [](const Island& island) { return island.sleeping; }));
}

// =============================================================================
// Sleep
// =============================================================================

SleepSettings SleepSettings::from_world(const PhysicsWorldConfig& config) {
    SleepSettings settings;
    settings.enabled = config.sleep_enabled;
    settings.linear_threshold = config.sleep_linear_threshold;
    settings.angular_threshold = config.sleep_angular_threshold;
    settings.time = config.sleep_time;
    return settings;
}

std::size_t wake_mixed_islands(std::vector<Island>& islands,
                               const std::vector<std::unique_ptr<RigidBody>>& bodies) {
    std::size_t woken = 0;
    for (auto& island : islands) {
        if (island.sleeping) {
            continue;
        }
        for (std::size_t i : island.bodies) {
            if (bodies[i]->is_sleeping()) {
                bodies[i]->wake_up();
                ++woken;
            }
        }
    }
    if (woken > 0) {
        IMPULSE_LOG_DEBUG("Woke {} sleeping bodies joined to awake islands", woken);
    }
    return woken;
}

bool update_island_sleep(Island& island,
                         const std::vector<std::unique_ptr<RigidBody>>& bodies,
                         const SleepSettings& settings,
                         float dt) {
    if (island.sleeping || island.bodies.empty()) {
        return false;
    }

    const float lin_sq = settings.linear_threshold * settings.linear_threshold;
    const float ang_sq = settings.angular_threshold * settings.angular_threshold;

    float min_rest = impulse_math::consts::MAX_FLOAT;
    bool allowed = settings.enabled;

    for (std::size_t i : island.bodies) {
        RigidBody& body = *bodies[i];
        if (!body.can_sleep()) {
            body.set_sleep_timer(0.0f);
            allowed = false;
            continue;
        }

        if (impulse_math::length_squared(body.linear_velocity()) < lin_sq &&
            impulse_math::length_squared(body.angular_velocity()) < ang_sq) {
            body.set_sleep_timer(body.sleep_timer() + dt);
        } else {
            body.set_sleep_timer(0.0f);
        }
        min_rest = std::min(min_rest, body.sleep_timer());
    }

    if (!allowed || min_rest < settings.time) {
        return false;
    }

    for (std::size_t i : island.bodies) {
        bodies[i]->sleep();
    }
    island.sleeping = true;
    IMPULSE_LOG_DEBUG("Island of {} bodies fell asleep", island.bodies.size());
    return true;
}

// =============================================================================
// IslandSolver Implementation
// =============================================================================

IntegrationSettings IntegrationSettings::from_world(const PhysicsWorldConfig& config) {
    IntegrationSettings settings;
    settings.gravity = config.gravity;
    settings.max_linear_velocity = config.max_linear_velocity;
    settings.max_angular_velocity = config.max_angular_velocity;
    return settings;
}

IslandSolver::IslandSolver(const SolverConfig& config, const IntegrationSettings& settings)
    : m_config(config)
    , m_settings(settings)
    , m_contact_solver(config)
{}

int IslandSolver::local_index(BodyId id,
                              const std::vector<std::unique_ptr<RigidBody>>& bodies,
                              const BodyIndexMap& index) {
    const auto found = m_local.find(id);
    if (found != m_local.end()) {
        return found->second;
    }

    // Static and kinematic bodies enter as private copies
    const auto it = index.find(id);
    if (it == index.end()) {
        return -1;
    }
    const int local = static_cast<int>(m_bodies.size());
    m_bodies.push_back(SolverBody::from(*bodies[it->second]));
    m_local.emplace(id, local);
    return local;
}

void IslandSolver::integrate_velocities(const std::vector<std::unique_ptr<RigidBody>>& bodies,
                                        const Island& island, float dt) {
    for (std::size_t i = 0; i < island.bodies.size(); ++i) {
        const RigidBody& body = *bodies[island.bodies[i]];
        SolverBody& sb = m_bodies[i];

        // Apply gravity and accumulated forces
        sb.linear_velocity += (m_settings.gravity * body.gravity_scale()
                               + body.accumulated_force() * sb.inverse_mass) * dt;
        sb.angular_velocity += sb.inverse_inertia * body.accumulated_torque() * dt;

        // Apply damping
        sb.linear_velocity *= std::max(0.0f, 1.0f - body.linear_damping() * dt);
        sb.angular_velocity *= std::max(0.0f, 1.0f - body.angular_damping() * dt);
    }
}

void IslandSolver::integrate_positions(std::size_t dynamic_count, float dt) {
    for (std::size_t i = 0; i < dynamic_count; ++i) {
        SolverBody& sb = m_bodies[i];

        // Clamp velocity
        const float speed = impulse_math::length(sb.linear_velocity);
        if (speed > m_settings.max_linear_velocity) {
            sb.linear_velocity *= m_settings.max_linear_velocity / speed;
        }
        const float spin = impulse_math::length(sb.angular_velocity);
        if (spin > m_settings.max_angular_velocity) {
            sb.angular_velocity *= m_settings.max_angular_velocity / spin;
        }

        sb.position += sb.linear_velocity * dt;
        sb.rotation = impulse_math::integrate_rotation(sb.rotation, sb.angular_velocity * dt);
        sb.update_inertia();
    }
}

void IslandSolver::solve(const Island& island,
                         const std::vector<std::unique_ptr<RigidBody>>& bodies,
                         const BodyIndexMap& index,
                         std::vector<ContactManifold>& manifolds,
                         std::vector<std::unique_ptr<IJointConstraint>>& joints,
                         float dt) {
    m_bodies.clear();
    m_contacts.clear();
    m_local.clear();
    m_last_residual = 0.0f;

    // Dynamic members occupy the first slots
    for (std::size_t slot : island.bodies) {
        const RigidBody& body = *bodies[slot];
        m_local.emplace(body.id(), static_cast<int>(m_bodies.size()));
        m_bodies.push_back(SolverBody::from(body));
    }
    const std::size_t dynamic_count = m_bodies.size();

    integrate_velocities(bodies, island, dt);

    // Build contact constraints
    for (std::size_t mi : island.manifolds) {
        ContactManifold& m = manifolds[mi];
        ContactConstraint constraint;
        constraint.manifold = &m;
        constraint.index_a = local_index(m.body_a, bodies, index);
        constraint.index_b = local_index(m.body_b, bodies, index);
        if (constraint.index_a < 0 || constraint.index_b < 0) {
            continue;
        }
        m_contacts.push_back(std::move(constraint));
    }

    // Resolve joint bodies
    struct JointSlot {
        IJointConstraint* joint;
        std::size_t a;
        std::size_t b;
    };
    std::vector<JointSlot> joint_slots;
    joint_slots.reserve(island.joints.size());
    for (std::size_t ji : island.joints) {
        IJointConstraint* joint = joints[ji].get();
        const int a = local_index(joint->body_a(), bodies, index);
        const int b = local_index(joint->body_b(), bodies, index);
        if (a < 0 || b < 0) {
            continue;
        }
        joint_slots.push_back({joint, static_cast<std::size_t>(a), static_cast<std::size_t>(b)});
    }

    // Prepare and warm start
    m_contact_solver.prepare(m_contacts, m_bodies, dt);
    for (auto& js : joint_slots) {
        js.joint->prepare(m_bodies[js.a], m_bodies[js.b], dt);
        if (!m_config.warm_starting) {
            js.joint->reset_impulses();
        }
    }

    m_contact_solver.warm_start(m_contacts, m_bodies);
    for (auto& js : joint_slots) {
        js.joint->warm_start(m_bodies[js.a], m_bodies[js.b]);
    }

    // Velocity iterations: joints and contacts interleaved
    for (std::uint32_t iter = 0; iter < m_config.velocity_iterations; ++iter) {
        for (auto& js : joint_slots) {
            js.joint->solve_velocity(m_bodies[js.a], m_bodies[js.b]);
        }
        m_last_residual = m_contact_solver.solve_velocity(m_contacts, m_bodies);
    }

    integrate_positions(dynamic_count, dt);

    // Position iterations
    for (std::uint32_t iter = 0; iter < m_config.position_iterations; ++iter) {
        for (auto& js : joint_slots) {
            js.joint->solve_position(m_bodies[js.a], m_bodies[js.b]);
        }
        m_contact_solver.solve_position(m_contacts, m_bodies);
    }

    // Write back dynamic members only
    for (std::size_t i = 0; i < dynamic_count; ++i) {
        const SolverBody& sb = m_bodies[i];
        bodies[island.bodies[i]]->set_state(sb.position, sb.rotation, sb.linear_velocity, sb.angular_velocity);
    }
}

} // namespace impulse_physics
