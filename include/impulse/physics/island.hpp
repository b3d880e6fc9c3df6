/// @file island.hpp
/// @brief Simulation islands and sleep management for impulse_physics
///
/// Islands are rebuilt every step from a union-find over the body arena.
/// Only dynamic bodies are vertices; static and kinematic bodies never join
/// two islands together, and a contact with one is owned by the island of
/// the dynamic side.

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "contact.hpp"
#include "solver.hpp"

#include <impulse/math/vec.hpp>

#include <cstdint>
#include <limits>
#include <memory>
#include <unordered_map>
#include <vector>

namespace impulse_physics {

/// Arena slot of every body, keyed by id
using BodyIndexMap = std::unordered_map<BodyId, std::size_t>;

// =============================================================================
// Union Find
// =============================================================================

/// Disjoint-set forest with path halving and union by size
class UnionFind {
public:
    void reset(std::size_t count);

    [[nodiscard]] std::size_t find(std::size_t i) noexcept;
    void unite(std::size_t a, std::size_t b) noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return m_parent.size(); }

private:
    std::vector<std::size_t> m_parent;
    std::vector<std::size_t> m_size;
};

// =============================================================================
// Simulation Island
// =============================================================================

/// Island of interconnected bodies, solved and put to sleep as a unit
struct Island {
    std::vector<std::size_t> bodies;      ///< Arena slots of dynamic members
    std::vector<std::size_t> manifolds;   ///< Indices into the step's manifolds
    std::vector<std::size_t> joints;      ///< Indices into the joint list
    bool sleeping = false;                ///< Every member is asleep
};

// =============================================================================
// Island Builder
// =============================================================================

/// Builds islands of connected bodies
class IslandBuilder {
public:
    static constexpr std::size_t k_no_island = std::numeric_limits<std::size_t>::max();

    /// Build islands from bodies and constraints. Trigger manifolds are not edges.
    void build(const std::vector<std::unique_ptr<RigidBody>>& bodies,
               const BodyIndexMap& index,
               const std::vector<ContactManifold>& manifolds,
               const std::vector<std::unique_ptr<IJointConstraint>>& joints);

    [[nodiscard]] const std::vector<Island>& islands() const noexcept { return m_islands; }
    [[nodiscard]] std::vector<Island>& islands() noexcept { return m_islands; }

    /// Island owning an arena slot, or k_no_island for immovable bodies
    [[nodiscard]] std::size_t island_of(std::size_t body_index) const noexcept {
        return body_index < m_body_island.size() ? m_body_island[body_index] : k_no_island;
    }

    [[nodiscard]] std::size_t sleeping_count() const noexcept;

private:
    UnionFind m_sets;
    std::vector<Island> m_islands;
    std::vector<std::size_t> m_body_island;
};

// =============================================================================
// Sleep
// =============================================================================

/// Sleep thresholds taken from the world configuration
struct SleepSettings {
    bool enabled = true;
    float linear_threshold = 0.01f;    ///< m/s
    float angular_threshold = 0.05f;   ///< rad/s
    float time = 0.5f;                 ///< Rest time before sleeping (s)

    [[nodiscard]] static SleepSettings from_world(const PhysicsWorldConfig& config);
};

/// Wake every member of islands that mix sleeping and awake bodies, so a
/// disturbance on one member reaches the whole island.
/// @return Number of bodies woken
std::size_t wake_mixed_islands(std::vector<Island>& islands,
                               const std::vector<std::unique_ptr<RigidBody>>& bodies);

/// Advance the rest timers of an awake island and put it to sleep once every
/// member has rested for the configured time.
/// @return true if the island fell asleep
bool update_island_sleep(Island& island,
                         const std::vector<std::unique_ptr<RigidBody>>& bodies,
                         const SleepSettings& settings,
                         float dt);

// =============================================================================
// Island Solver
// =============================================================================

/// Velocity integration inputs shared by all islands
struct IntegrationSettings {
    impulse_math::Vec3 gravity{0.0f, -9.81f, 0.0f};
    float max_linear_velocity = 500.0f;
    float max_angular_velocity = 100.0f;

    [[nodiscard]] static IntegrationSettings from_world(const PhysicsWorldConfig& config);
};

/// Solves one awake island: applies forces, solves contacts and joints,
/// integrates positions, corrects positions and writes the result back.
/// Static and kinematic bodies touched by the island are copied, never written.
class IslandSolver {
public:
    IslandSolver(const SolverConfig& config, const IntegrationSettings& settings);

    void solve(const Island& island,
               const std::vector<std::unique_ptr<RigidBody>>& bodies,
               const BodyIndexMap& index,
               std::vector<ContactManifold>& manifolds,
               std::vector<std::unique_ptr<IJointConstraint>>& joints,
               float dt);

    /// Largest impulse change of the last velocity iteration
    [[nodiscard]] float last_residual() const noexcept { return m_last_residual; }

private:
    int local_index(BodyId id, const std::vector<std::unique_ptr<RigidBody>>& bodies, const BodyIndexMap& index);
    void integrate_velocities(const std::vector<std::unique_ptr<RigidBody>>& bodies,
                              const Island& island, float dt);
    void integrate_positions(std::size_t dynamic_count, float dt);

    SolverConfig m_config;
    IntegrationSettings m_settings;
    ContactSolver m_contact_solver;

    std::vector<SolverBody> m_bodies;
    std::vector<ContactConstraint> m_contacts;
    std::unordered_map<BodyId, int> m_local;
    float m_last_residual = 0.0f;
};

} // namespace impulse_physics
