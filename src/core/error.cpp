/// @file error.cpp
/// @brief Error payload factories and formatting

#include <impulse/core/error.hpp>

#include <algorithm>
#include <sstream>

namespace impulse_core {

namespace {

ErrorCode code_for(PhysicsError::Kind kind) {
    switch (kind) {
        case PhysicsError::Kind::BodyNotFound:
        case PhysicsError::Kind::JointNotFound:
            return ErrorCode::NotFound;
        case PhysicsError::Kind::InvalidBody:
        case PhysicsError::Kind::InvalidShape:
        case PhysicsError::Kind::InvalidJoint:
            return ErrorCode::InvalidArgument;
    }
    return ErrorCode::Unknown;
}

ErrorCode code_for(ConfigError::Kind kind) {
    switch (kind) {
        case ConfigError::Kind::InvalidValue: return ErrorCode::ValidationError;
        case ConfigError::Kind::ParseFailed:
        case ConfigError::Kind::TypeMismatch:
        case ConfigError::Kind::Truncated:
            return ErrorCode::ParseError;
        case ConfigError::Kind::UnsupportedVersion: return ErrorCode::IncompatibleVersion;
        case ConfigError::Kind::IoFailed: return ErrorCode::IOError;
    }
    return ErrorCode::Unknown;
}

} // anonymous namespace

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::IncompatibleVersion: return "IncompatibleVersion";
    }
    return "Unknown";
}

// =============================================================================
// PhysicsError
// =============================================================================

PhysicsError PhysicsError::body_not_found(std::uint64_t id) {
    return {Kind::BodyNotFound, "no body with id " + std::to_string(id), id};
}

PhysicsError PhysicsError::joint_not_found(std::uint64_t id) {
    return {Kind::JointNotFound, "no joint with id " + std::to_string(id), id};
}

PhysicsError PhysicsError::invalid_body(std::string reason) {
    return {Kind::InvalidBody, std::move(reason), 0};
}

PhysicsError PhysicsError::invalid_shape(std::string reason) {
    return {Kind::InvalidShape, std::move(reason), 0};
}

PhysicsError PhysicsError::invalid_joint(std::string reason) {
    return {Kind::InvalidJoint, std::move(reason), 0};
}

// =============================================================================
// ConfigError
// =============================================================================

ConfigError ConfigError::invalid_value(std::string field_name, const std::string& reason) {
    std::string message = field_name + " " + reason;
    return {Kind::InvalidValue, std::move(message), std::move(field_name)};
}

ConfigError ConfigError::parse_failed(const std::string& reason) {
    return {Kind::ParseFailed, "malformed document: " + reason, {}};
}

ConfigError ConfigError::type_mismatch(std::string field_name) {
    std::string message = field_name + " has the wrong type";
    return {Kind::TypeMismatch, std::move(message), std::move(field_name)};
}

ConfigError ConfigError::truncated(std::size_t needed, std::size_t available) {
    return {Kind::Truncated,
            "record needs " + std::to_string(needed) + " bytes, got " + std::to_string(available),
            {}};
}

ConfigError ConfigError::unsupported_version(std::uint32_t found) {
    return {Kind::UnsupportedVersion, "record version " + std::to_string(found) + " is not supported", {}};
}

ConfigError ConfigError::io_failed(const std::string& path) {
    return {Kind::IoFailed, "cannot access " + path, {}};
}

// =============================================================================
// Error
// =============================================================================

Error::Error(PhysicsError err) : m_code(code_for(err.kind)), m_payload(std::move(err)) {}

Error::Error(ConfigError err) : m_code(code_for(err.kind)), m_payload(std::move(err)) {}

const std::string& Error::message() const noexcept {
    if (const auto* text = std::get_if<std::string>(&m_payload)) {
        return *text;
    }
    if (const auto* physics = std::get_if<PhysicsError>(&m_payload)) {
        return physics->message;
    }
    return std::get_if<ConfigError>(&m_payload)->message;
}

Error& Error::with_context(const std::string& key, std::string value) {
    auto it = std::find_if(m_context.begin(), m_context.end(),
                           [&key](const ContextEntry& entry) { return entry.first == key; });
    if (it != m_context.end()) {
        it->second = std::move(value);
    } else {
        m_context.emplace_back(key, std::move(value));
    }
    return *this;
}

const std::string* Error::get_context(const std::string& key) const noexcept {
    for (const auto& entry : m_context) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

std::string format_error(const Error& error) {
    std::ostringstream out;
    out << '[' << error_code_name(error.code()) << "] " << error.message();

    if (const auto* physics = error.as<PhysicsError>(); physics && physics->object_id != 0) {
        out << " (id " << physics->object_id << ')';
    } else if (const auto* config = error.as<ConfigError>(); config && !config->field.empty()) {
        out << " (field " << config->field << ')';
    }

    if (!error.context().empty()) {
        out << " {";
        bool first = true;
        for (const auto& [key, value] : error.context()) {
            out << (first ? "" : ", ") << key << '=' << value;
            first = false;
        }
        out << '}';
    }
    return out.str();
}

} // namespace impulse_core
