/// @file config.hpp
/// @brief Physics world configuration and its persistence

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <impulse/core/error.hpp>
#include <impulse/math/vec.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace impulse_physics {

// =============================================================================
// Physics World Configuration
// =============================================================================

/// Tunables of a physics world. Every field is a scalar (gravity is three of
/// them), so the record persists as a flat key/value document.
struct PhysicsWorldConfig {
    impulse_math::Vec3 gravity{0.0f, -9.81f, 0.0f};

    /// Stepping
    float fixed_dt = 1.0f / 120.0f;            ///< Simulation step (s)
    std::uint32_t max_substeps = 8;            ///< Fixed steps per step() call

    /// Solver
    std::uint32_t solver_iterations = 10;      ///< Velocity iterations
    std::uint32_t position_iterations = 3;     ///< Position correction iterations
    float position_correction = 0.2f;          ///< Baumgarte factor [0, 1]
    float slop = 0.005f;                       ///< Allowed penetration (m)
    float max_position_correction = 0.2f;      ///< Largest correction per iteration (m)
    float restitution_threshold = 1.0f;        ///< Approach speed enabling bounce (m/s)
    bool warm_starting = true;
    float contact_match_tolerance = 0.02f;     ///< Warm-start point matching radius (m)

    /// Broadphase
    float broadphase_cell_size = 2.0f;         ///< Spatial hash cell edge (m)

    /// Sleeping
    bool sleep_enabled = true;
    float sleep_linear_threshold = 0.01f;      ///< m/s
    float sleep_angular_threshold = 0.05f;     ///< rad/s
    float sleep_time = 0.5f;                   ///< Seconds below thresholds before sleeping

    /// Continuous collision detection
    float ccd_velocity_threshold = 2.0f;       ///< Minimum speed for a sweep (m/s)
    std::uint32_t ccd_max_iterations = 20;     ///< Time of impact bisection steps

    /// Velocity guards
    float max_linear_velocity = 500.0f;        ///< m/s
    float max_angular_velocity = 100.0f;       ///< rad/s

    /// Threading
    bool parallel_islands = false;
    std::uint32_t worker_threads = 0;          ///< 0 = hardware concurrency

    /// Check every field against its valid range
    [[nodiscard]] impulse_core::Result<void> validate() const;

    /// Default configuration
    [[nodiscard]] static PhysicsWorldConfig defaults() { return PhysicsWorldConfig{}; }

    bool operator==(const PhysicsWorldConfig&) const = default;
};

// =============================================================================
// JSON Persistence
// =============================================================================

/// Encode as a flat JSON object
[[nodiscard]] nlohmann::json to_json(const PhysicsWorldConfig& config);

/// Decode a flat JSON object; absent keys keep their defaults
[[nodiscard]] impulse_core::Result<PhysicsWorldConfig> config_from_json(const nlohmann::json& j);

/// Encode as JSON text
[[nodiscard]] std::string to_json_string(const PhysicsWorldConfig& config, int indent = 2);

/// Decode JSON text
[[nodiscard]] impulse_core::Result<PhysicsWorldConfig> parse_config(const std::string& text);

/// Write JSON to a file
[[nodiscard]] impulse_core::Result<void> save_config(const PhysicsWorldConfig& config, const std::string& path);

/// Read JSON from a file
[[nodiscard]] impulse_core::Result<PhysicsWorldConfig> load_config(const std::string& path);

// =============================================================================
// Binary Persistence
// =============================================================================

/// Binary record magic ("IMPC")
constexpr std::uint32_t k_config_magic = 0x43504D49;

/// Binary record revision
constexpr std::uint32_t k_config_version = 1;

/// Encode as a fixed-layout binary record
[[nodiscard]] std::vector<std::uint8_t> to_bytes(const PhysicsWorldConfig& config);

/// Decode a binary record produced by to_bytes
[[nodiscard]] impulse_core::Result<PhysicsWorldConfig> from_bytes(const std::vector<std::uint8_t>& data);

} // namespace impulse_physics
