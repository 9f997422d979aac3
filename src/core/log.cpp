/// @file log.cpp
/// @brief Named logger table over spdlog

#include <stratum/core/log.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <mutex>
#include <sstream>
#include <utility>
#include <vector>

namespace stratum_core {

namespace {

constexpr std::size_t kMaxLogFileSize = 4 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

struct LoggerTable {
    std::mutex mutex;
    LogConfig config;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
};

LoggerTable& logger_table() {
    static LoggerTable table;
    return table;
}

/// Sinks for one logger; a file sink that cannot be opened is skipped and
/// the reason stored in `file_error`
std::vector<spdlog::sink_ptr> make_sinks(
    const std::string& name, const LogConfig& config, std::string& file_error) {

    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
    sinks.push_back(std::move(console));

    if (!config.log_directory.empty()) {
        auto path = std::filesystem::path(config.log_directory) / (name + ".log");
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), kMaxLogFileSize, kMaxLogFiles);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    return sinks;
}

void warn_file_sink_failed(const std::shared_ptr<spdlog::logger>& logger, const std::string& reason) {
    logger->warn("Logging to file disabled for '{}': {}", logger->name(), reason);
}

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& table = logger_table();
    std::vector<std::pair<std::shared_ptr<spdlog::logger>, std::string>> failures;

    {
        std::lock_guard<std::mutex> lock(table.mutex);
        table.config = config;

        // Loggers created before configuration get the new sinks too
        for (auto& [name, logger] : table.loggers) {
            std::string file_error;
            logger->sinks() = make_sinks(name, table.config, file_error);
            logger->set_level(table.config.level);
            if (!file_error.empty()) {
                failures.emplace_back(logger, std::move(file_error));
            }
        }
    }

    for (const auto& [logger, reason] : failures) {
        warn_file_sink_failed(logger, reason);
    }
}

void shutdown_logging() {
    auto& table = logger_table();
    std::lock_guard<std::mutex> lock(table.mutex);

    for (auto& [name, logger] : table.loggers) {
        logger->flush();
    }
    table.loggers.clear();
}

// =============================================================================
// Named Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& table = logger_table();
    std::shared_ptr<spdlog::logger> logger;
    std::string file_error;

    {
        std::lock_guard<std::mutex> lock(table.mutex);
        auto it = table.loggers.find(name);
        if (it != table.loggers.end()) {
            return it->second;
        }

        auto sinks = make_sinks(name, table.config, file_error);
        logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(table.config.level);
        table.loggers.emplace(name, logger);
    }

    if (!file_error.empty()) {
        warn_file_sink_failed(logger, file_error);
    }
    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    return get_logger("stratum_core");
}

std::shared_ptr<spdlog::logger> registry_logger() {
    return get_logger("registry");
}

std::shared_ptr<spdlog::logger> validator_logger() {
    return get_logger("validator");
}

std::shared_ptr<spdlog::logger> deferred_logger() {
    return get_logger("deferred");
}

// =============================================================================
// Levels
// =============================================================================

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    static const std::map<std::string, spdlog::level::level_enum> levels = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    };

    auto it = levels.find(str);
    if (it == levels.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Structured Logging
// =============================================================================

void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields) {

    auto logger = get_logger(logger_name);
    if (!logger->should_log(level)) {
        return;
    }

    std::ostringstream oss;
    oss << message;
    if (!fields.empty()) {
        const char* separator = " {";
        for (const auto& [key, value] : fields) {
            oss << separator << key << "=\"" << value << "\"";
            separator = ", ";
        }
        oss << "}";
    }

    logger->log(level, oss.str());
}

LogScope::LogScope(std::string name, const std::string& logger_name)
    : m_name(std::move(name))
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now()) {
    m_logger->trace("enter {}", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("leave {} ({}us)", m_name, elapsed.count());
}

} // namespace stratum_core
