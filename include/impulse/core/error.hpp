#pragma once

/// @file error.hpp
/// @brief Error values and Result<T, E> for impulse

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace impulse_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// Coarse category shared by every error payload
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    IOError,
    ParseError,
    ValidationError,
    IncompatibleVersion,
};

[[nodiscard]] const char* error_code_name(ErrorCode code) noexcept;

// =============================================================================
// Domain payloads
// =============================================================================

/// Rejected body, shape or joint edits
struct PhysicsError {
    enum class Kind : std::uint8_t {
        BodyNotFound,
        JointNotFound,
        InvalidBody,
        InvalidShape,
        InvalidJoint,
    };

    Kind kind;
    std::string message;
    std::uint64_t object_id = 0;  // 0 when the error is not about a live object

    [[nodiscard]] static PhysicsError body_not_found(std::uint64_t id);
    [[nodiscard]] static PhysicsError joint_not_found(std::uint64_t id);
    [[nodiscard]] static PhysicsError invalid_body(std::string reason);
    [[nodiscard]] static PhysicsError invalid_shape(std::string reason);
    [[nodiscard]] static PhysicsError invalid_joint(std::string reason);
};

/// Configuration validation and encoding failures
struct ConfigError {
    enum class Kind : std::uint8_t {
        InvalidValue,
        ParseFailed,
        TypeMismatch,
        Truncated,
        UnsupportedVersion,
        IoFailed,
    };

    Kind kind;
    std::string message;
    std::string field;  // Offending field, empty for whole-document errors

    [[nodiscard]] static ConfigError invalid_value(std::string field_name, const std::string& reason);
    [[nodiscard]] static ConfigError parse_failed(const std::string& reason);
    [[nodiscard]] static ConfigError type_mismatch(std::string field_name);
    [[nodiscard]] static ConfigError truncated(std::size_t needed, std::size_t available);
    [[nodiscard]] static ConfigError unsupported_version(std::uint32_t found);
    [[nodiscard]] static ConfigError io_failed(const std::string& path);
};

// =============================================================================
// Error
// =============================================================================

/// A categorized error with a payload and ordered key/value context
class Error {
public:
    using Payload = std::variant<PhysicsError, ConfigError, std::string>;
    using ContextEntry = std::pair<std::string, std::string>;

    Error() : Error(ErrorCode::Unknown, std::string("Unknown error")) {}
    Error(PhysicsError err);
    Error(ConfigError err);
    Error(std::string message) : Error(ErrorCode::Unknown, std::move(message)) {}
    Error(const char* message) : Error(ErrorCode::Unknown, std::string(message)) {}
    Error(ErrorCode code, std::string message) : m_code(code), m_payload(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Human readable message of the payload
    [[nodiscard]] const std::string& message() const noexcept;

    template<typename T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(m_payload);
    }

    /// Payload as T, or nullptr when it holds something else
    template<typename T>
    [[nodiscard]] const T* as() const noexcept {
        return std::get_if<T>(&m_payload);
    }

    [[nodiscard]] const Payload& payload() const noexcept { return m_payload; }

    /// Attach context; an existing key is overwritten in place
    Error& with_context(const std::string& key, std::string value);

    [[nodiscard]] const std::string* get_context(const std::string& key) const noexcept;

    /// Context entries in insertion order
    [[nodiscard]] const std::vector<ContextEntry>& context() const noexcept { return m_context; }

private:
    ErrorCode m_code;
    Payload m_payload;
    std::vector<ContextEntry> m_context;
};

/// One-line rendering: "[Code] message (detail) {key=value, ...}"
[[nodiscard]] std::string format_error(const Error& error);

/// Thrown by Result::unwrap on an error result
class BadResultAccess : public std::runtime_error {
public:
    explicit BadResultAccess(const std::string& what) : std::runtime_error(what) {}
};

// =============================================================================
// Result<T, E>
// =============================================================================

template<typename T, typename E = Error>
class Result {
    static_assert(!std::is_same_v<T, E>, "Result value and error types must differ");

public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_state(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : m_state(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_state.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_state.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] T& value() & { return std::get<0>(m_state); }
    [[nodiscard]] const T& value() const& { return std::get<0>(m_state); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_state)); }

    [[nodiscard]] E& error() & { return std::get<1>(m_state); }
    [[nodiscard]] const E& error() const& { return std::get<1>(m_state); }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(m_state) : std::move(fallback);
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }

    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] T& unwrap() & {
        check();
        return value();
    }

    [[nodiscard]] T&& unwrap() && {
        check();
        return std::move(*this).value();
    }

    /// Transform the value, passing errors through
    template<typename F>
    auto map(F&& func) && -> Result<std::invoke_result_t<F, T&&>, E> {
        using U = std::invoke_result_t<F, T&&>;
        if (is_ok()) {
            return Result<U, E>(std::forward<F>(func)(std::move(*this).value()));
        }
        return Result<U, E>(std::get<1>(std::move(m_state)));
    }

    /// Continue with a Result-returning function on success
    template<typename F>
    auto and_then(F&& func) && -> std::invoke_result_t<F, T&&> {
        using Next = std::invoke_result_t<F, T&&>;
        if (is_ok()) {
            return std::forward<F>(func)(std::move(*this).value());
        }
        return Next(std::get<1>(std::move(m_state)));
    }

    /// Recover from an error with a Result-returning function
    template<typename F>
    Result or_else(F&& func) && {
        if (is_ok()) {
            return std::move(*this);
        }
        return std::forward<F>(func)(std::get<1>(std::move(m_state)));
    }

private:
    void check() const {
        if (is_ok()) {
            return;
        }
        if constexpr (std::is_same_v<E, Error>) {
            throw BadResultAccess("unwrap on error result: " + format_error(std::get<1>(m_state)));
        } else {
            throw BadResultAccess("unwrap on error result");
        }
    }

    std::variant<T, E> m_state;
};

/// Success-or-error without a value
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : m_error(std::move(error)), m_failed(true) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_failed; }
    [[nodiscard]] bool is_err() const noexcept { return m_failed; }
    explicit operator bool() const noexcept { return !m_failed; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    void unwrap() const {
        if (!m_failed) {
            return;
        }
        if constexpr (std::is_same_v<E, Error>) {
            throw BadResultAccess("unwrap on error result: " + format_error(m_error));
        } else {
            throw BadResultAccess("unwrap on error result");
        }
    }

private:
    E m_error{};
    bool m_failed = false;
};

template<typename T>
[[nodiscard]] Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

[[nodiscard]] inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
[[nodiscard]] Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

} // namespace impulse_core
