#pragma once

/// @file log.hpp
/// @brief Library logger for impulse
///
/// All impulse messages go through one named spdlog logger ("impulse") so a
/// host application can route, silence or capture them without touching the
/// spdlog default logger.

#include <impulse/core/error.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#define IMPULSE_LOG_TRACE(...) ::impulse_core::logger()->trace(__VA_ARGS__)
#define IMPULSE_LOG_DEBUG(...) ::impulse_core::logger()->debug(__VA_ARGS__)
#define IMPULSE_LOG_INFO(...) ::impulse_core::logger()->info(__VA_ARGS__)
#define IMPULSE_LOG_WARN(...) ::impulse_core::logger()->warn(__VA_ARGS__)
#define IMPULSE_LOG_ERROR(...) ::impulse_core::logger()->error(__VA_ARGS__)

namespace impulse_core {

inline constexpr const char* LOGGER_NAME = "impulse";

/// Sink setup for the library logger
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
    bool console = true;
    std::string file_path;                         // Rotating file sink when non-empty
    std::size_t max_file_size = 4 * 1024 * 1024;
    std::size_t max_files = 3;
    std::vector<spdlog::sink_ptr> extra_sinks;     // Host-provided sinks, appended last
};

/// Rebuild the library logger from @p config
/// @return ConfigError::io_failed when the log file cannot be opened; the
///         previous logger stays active in that case
Result<void> configure_logging(const LogConfig& config);

/// The library logger, created with a console sink on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

/// "trace", "debug", "info", "warn", "error", "off" (case sensitive)
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text);

/// Traces entry and exit of a block with its duration
class LogScope {
public:
    explicit LogScope(const char* name);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    const char* m_name;
    std::chrono::steady_clock::time_point m_start;
};

#define IMPULSE_LOG_SCOPE_CONCAT_(a, b) a##b
#define IMPULSE_LOG_SCOPE_NAME_(line) IMPULSE_LOG_SCOPE_CONCAT_(impulse_log_scope_, line)
#define IMPULSE_LOG_SCOPE(name) ::impulse_core::LogScope IMPULSE_LOG_SCOPE_NAME_(__LINE__)(name)

} // namespace impulse_core
