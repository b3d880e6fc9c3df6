/// @file config.cpp
/// @brief Physics world configuration validation and persistence

#include <impulse/physics/config.hpp>
#include <impulse/core/log.hpp>

#include <bit>
#include <cmath>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace impulse_physics {

using impulse_core::ConfigError;
using impulse_core::Error;
using impulse_core::Result;

// =============================================================================
// Validation
// =============================================================================

Result<void> PhysicsWorldConfig::validate() const {
    auto positive = [](float v) { return std::isfinite(v) && v > 0.0f; };
    auto non_negative = [](float v) { return std::isfinite(v) && v >= 0.0f; };

    if (!impulse_math::is_finite(gravity)) {
        return Error(ConfigError::invalid_value("gravity", "must be finite"));
    }
    if (!positive(fixed_dt)) {
        return Error(ConfigError::invalid_value("fixed_dt", "must be positive"));
    }
    if (max_substeps == 0) {
        return Error(ConfigError::invalid_value("max_substeps", "must be at least 1"));
    }
    if (solver_iterations == 0) {
        return Error(ConfigError::invalid_value("solver_iterations", "must be at least 1"));
    }
    if (!non_negative(position_correction) || position_correction > 1.0f) {
        return Error(ConfigError::invalid_value("position_correction", "must be in [0, 1]"));
    }
    if (!non_negative(slop)) {
        return Error(ConfigError::invalid_value("slop", "must be non-negative"));
    }
    if (!non_negative(max_position_correction)) {
        return Error(ConfigError::invalid_value("max_position_correction", "must be non-negative"));
    }
    if (!non_negative(restitution_threshold)) {
        return Error(ConfigError::invalid_value("restitution_threshold", "must be non-negative"));
    }
    if (!non_negative(contact_match_tolerance)) {
        return Error(ConfigError::invalid_value("contact_match_tolerance", "must be non-negative"));
    }
    if (!positive(broadphase_cell_size)) {
        return Error(ConfigError::invalid_value("broadphase_cell_size", "must be positive"));
    }
    if (!non_negative(sleep_linear_threshold) || !non_negative(sleep_angular_threshold)) {
        return Error(ConfigError::invalid_value("sleep_threshold", "must be non-negative"));
    }
    if (!non_negative(sleep_time)) {
        return Error(ConfigError::invalid_value("sleep_time", "must be non-negative"));
    }
    if (!non_negative(ccd_velocity_threshold)) {
        return Error(ConfigError::invalid_value("ccd_velocity_threshold", "must be non-negative"));
    }
    if (ccd_max_iterations == 0) {
        return Error(ConfigError::invalid_value("ccd_max_iterations", "must be at least 1"));
    }
    if (!positive(max_linear_velocity) || !positive(max_angular_velocity)) {
        return Error(ConfigError::invalid_value("max_velocity", "must be positive"));
    }
    return impulse_core::Ok();
}

// =============================================================================
// JSON Persistence
// =============================================================================

namespace {

/// Visit every field with its persisted key
template<typename Config, typename Visitor>
void visit_fields(Config& c, Visitor&& visit) {
    visit("gravity_x", c.gravity.x);
    visit("gravity_y", c.gravity.y);
    visit("gravity_z", c.gravity.z);
    visit("fixed_dt", c.fixed_dt);
    visit("max_substeps", c.max_substeps);
    visit("solver_iterations", c.solver_iterations);
    visit("position_iterations", c.position_iterations);
    visit("position_correction", c.position_correction);
    visit("slop", c.slop);
    visit("max_position_correction", c.max_position_correction);
    visit("restitution_threshold", c.restitution_threshold);
    visit("warm_starting", c.warm_starting);
    visit("contact_match_tolerance", c.contact_match_tolerance);
    visit("broadphase_cell_size", c.broadphase_cell_size);
    visit("sleep_enabled", c.sleep_enabled);
    visit("sleep_linear_threshold", c.sleep_linear_threshold);
    visit("sleep_angular_threshold", c.sleep_angular_threshold);
    visit("sleep_time", c.sleep_time);
    visit("ccd_velocity_threshold", c.ccd_velocity_threshold);
    visit("ccd_max_iterations", c.ccd_max_iterations);
    visit("max_linear_velocity", c.max_linear_velocity);
    visit("max_angular_velocity", c.max_angular_velocity);
    visit("parallel_islands", c.parallel_islands);
    visit("worker_threads", c.worker_threads);
}

/// Check that a JSON value can be stored in a field of type T
template<typename T>
bool json_type_matches(const nlohmann::json& value) {
    if constexpr (std::is_same_v<T, bool>) {
        return value.is_boolean();
    } else if constexpr (std::is_integral_v<T>) {
        return value.is_number_unsigned() ||
               (value.is_number_integer() && value.get<std::int64_t>() >= 0);
    } else {
        return value.is_number();
    }
}

} // anonymous namespace

nlohmann::json to_json(const PhysicsWorldConfig& config) {
    nlohmann::json j = nlohmann::json::object();
    visit_fields(config, [&j](const char* key, const auto& field) {
        j[key] = field;
    });
    return j;
}

Result<PhysicsWorldConfig> config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error(ConfigError::parse_failed("physics config must be a JSON object"));
    }

    PhysicsWorldConfig config;
    std::string bad_field;

    visit_fields(config, [&j, &bad_field](const char* key, auto& field) {
        using T = std::decay_t<decltype(field)>;
        if (!bad_field.empty() || !j.contains(key)) {
            return;
        }
        const auto& value = j[key];
        if (!json_type_matches<T>(value)) {
            bad_field = key;
            return;
        }
        if constexpr (std::is_same_v<T, float>) {
            field = static_cast<float>(value.template get<double>());
        } else {
            field = value.template get<T>();
        }
    });

    if (!bad_field.empty()) {
        return Error(ConfigError::type_mismatch(bad_field));
    }

    return config;
}

std::string to_json_string(const PhysicsWorldConfig& config, int indent) {
    return to_json(config).dump(indent);
}

Result<PhysicsWorldConfig> parse_config(const std::string& text) {
    try {
        return config_from_json(nlohmann::json::parse(text));
    } catch (const nlohmann::json::exception& e) {
        return Error(ConfigError::parse_failed(e.what()));
    }
}

Result<void> save_config(const PhysicsWorldConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return Error(ConfigError::io_failed(path));
    }
    file << to_json_string(config);
    if (!file.good()) {
        return Error(ConfigError::io_failed(path));
    }
    IMPULSE_LOG_DEBUG("Saved physics config to {}", path);
    return impulse_core::Ok();
}

Result<PhysicsWorldConfig> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Error(ConfigError::io_failed(path));
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    auto result = parse_config(contents.str());
    if (result.is_err()) {
        result.error().with_context("path", path);
    }
    return result;
}

// =============================================================================
// Binary Persistence
// =============================================================================

namespace {

/// Little-endian writer for fixed-layout records
class BinaryWriter {
public:
    void write(float value) {
        write(std::bit_cast<std::uint32_t>(value));
    }

    void write(bool value) {
        m_data.push_back(value ? 1 : 0);
    }

    void write(std::uint32_t value) {
        for (int shift = 0; shift < 32; shift += 8) {
            m_data.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
        }
    }

    [[nodiscard]] std::vector<std::uint8_t> take_data() { return std::move(m_data); }

private:
    std::vector<std::uint8_t> m_data;
};

/// Little-endian reader; reads past the end fail the whole record
class BinaryReader {
public:
    explicit BinaryReader(const std::vector<std::uint8_t>& data)
        : m_data(data)
    {}

    bool read(float& value) {
        std::uint32_t bits = 0;
        if (!read(bits)) return false;
        value = std::bit_cast<float>(bits);
        return true;
    }

    bool read(bool& value) {
        if (m_pos + 1 > m_data.size()) return false;
        value = m_data[m_pos++] != 0;
        return true;
    }

    bool read(std::uint32_t& value) {
        if (m_pos + 4 > m_data.size()) return false;
        value = 0;
        for (int i = 0; i < 4; ++i) {
            value |= static_cast<std::uint32_t>(m_data[m_pos++]) << (8 * i);
        }
        return true;
    }

private:
    const std::vector<std::uint8_t>& m_data;
    std::size_t m_pos = 0;
};

} // anonymous namespace

std::vector<std::uint8_t> to_bytes(const PhysicsWorldConfig& config) {
    BinaryWriter writer;
    writer.write(k_config_magic);
    writer.write(k_config_version);
    visit_fields(config, [&writer](const char*, const auto& field) {
        writer.write(field);
    });
    return writer.take_data();
}

Result<PhysicsWorldConfig> from_bytes(const std::vector<std::uint8_t>& data) {
    BinaryReader reader(data);

    std::uint32_t magic = 0;
    std::uint32_t version = 0;
    if (!reader.read(magic) || !reader.read(version)) {
        return Error(ConfigError::truncated(8, data.size()));
    }
    if (magic != k_config_magic) {
        return Error(ConfigError::parse_failed("not a physics config record"));
    }
    if (version != k_config_version) {
        return Error(ConfigError::unsupported_version(version));
    }

    PhysicsWorldConfig config;
    bool complete = true;
    visit_fields(config, [&reader, &complete](const char*, auto& field) {
        if (complete && !reader.read(field)) {
            complete = false;
        }
    });

    if (!complete) {
        return Error(ConfigError::truncated(to_bytes(PhysicsWorldConfig{}).size(), data.size()));
    }

    return config;
}

} // namespace impulse_physics
