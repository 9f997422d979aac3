#pragma once

/// @file log.hpp
/// @brief Named spdlog loggers for stratum
///
/// Every module logs through its own named logger. Console output goes to
/// stderr so that reports written to stdout stay machine-readable; with a
/// log directory configured each logger also writes `<dir>/<name>.log`.

#include <spdlog/spdlog.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

#define STRATUM_CONCAT_IMPL(a, b) a##b
#define STRATUM_CONCAT(a, b) STRATUM_CONCAT_IMPL(a, b)

namespace stratum_core {

// =============================================================================
// Configuration
// =============================================================================

/// Logging setup chosen by the command line or config file
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string log_directory;  ///< Non-empty: add a rotating file sink per logger
};

/// Apply a configuration to all current and future loggers
void configure_logging(const LogConfig& config);

/// Flush and forget all loggers
void shutdown_logging();

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// "stratum_core": tool-level messages
std::shared_ptr<spdlog::logger> core_logger();

/// "registry": layer table construction
std::shared_ptr<spdlog::logger> registry_logger();

/// "validator": validation runs and violations
std::shared_ptr<spdlog::logger> validator_logger();

/// "deferred": unit loading and deferred resolution
std::shared_ptr<spdlog::logger> deferred_logger();

// =============================================================================
// Levels
// =============================================================================

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Name accepted by parse_log_level
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Logging
// =============================================================================

/// Log `message {key="value", ...}` on a named logger
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

/// Traces entry and exit (with duration) of a scope at trace level
class LogScope {
public:
    LogScope(std::string name, const std::string& logger_name);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define STRATUM_LOG_SCOPE(name, logger_name) \
    ::stratum_core::LogScope STRATUM_CONCAT(stratum_log_scope_, __LINE__)(name, logger_name)

} // namespace stratum_core
