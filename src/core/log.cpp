/// @file log.cpp
/// @brief Library logger setup

#include <impulse/core/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>

namespace impulse_core {

namespace {

/// Readers load the current logger without locking; the mutex only
/// serializes creation and replacement
struct LoggerSlot {
    std::mutex write_mutex;
    std::atomic<std::shared_ptr<spdlog::logger>> current;
};

LoggerSlot& slot() {
    static LoggerSlot instance;
    return instance;
}

std::shared_ptr<spdlog::logger> make_default_logger() {
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto log = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(console));
    log->set_pattern(LogConfig{}.pattern);
    log->set_level(LogConfig{}.level);
    return log;
}

} // anonymous namespace

Result<void> configure_logging(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (!config.file_path.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, config.max_file_size, config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            return Error(ConfigError::io_failed(config.file_path)).with_context("reason", e.what());
        }
    }
    sinks.insert(sinks.end(), config.extra_sinks.begin(), config.extra_sinks.end());

    auto log = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    log->set_pattern(config.pattern);
    log->set_level(config.level);
    log->flush_on(spdlog::level::warn);

    auto& s = slot();
    std::lock_guard<std::mutex> lock(s.write_mutex);
    if (auto previous = s.current.exchange(std::move(log), std::memory_order_acq_rel)) {
        previous->flush();
    }
    return Ok();
}

std::shared_ptr<spdlog::logger> logger() {
    auto& s = slot();
    if (auto log = s.current.load(std::memory_order_acquire)) {
        return log;
    }

    std::lock_guard<std::mutex> lock(s.write_mutex);
    auto log = s.current.load(std::memory_order_acquire);
    if (!log) {
        log = make_default_logger();
        s.current.store(log, std::memory_order_release);
    }
    return log;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text) {
    if (text == "trace") return spdlog::level::trace;
    if (text == "debug") return spdlog::level::debug;
    if (text == "info") return spdlog::level::info;
    if (text == "warn") return spdlog::level::warn;
    if (text == "error") return spdlog::level::err;
    if (text == "off") return spdlog::level::off;
    return std::nullopt;
}

// =============================================================================
// LogScope
// =============================================================================

LogScope::LogScope(const char* name)
    : m_name(name)
    , m_start(std::chrono::steady_clock::now())
{
    IMPULSE_LOG_TRACE("enter {}", m_name);
}

LogScope::~LogScope() {
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    IMPULSE_LOG_TRACE("leave {} ({} us)", m_name, elapsed.count());
}

} // namespace impulse_core
