#pragma once

/// @file check.hpp
/// @brief Build/test gate: validate a reference graph and report
///
/// Configuration is layered:
/// - built-in defaults (canonical graph, report output, warn level)
/// - an optional JSON config file (--config FILE)
/// - command-line flags (highest priority)
///
/// Config file keys: "graph", "format", "log_level", "log_directory", "root".

#include "fwd.hpp"
#include <stratum/core/error.hpp>

#include <spdlog/common.h>

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace stratum_layering {

// =============================================================================
// Exit Codes
// =============================================================================

inline constexpr int kExitOk = 0;          ///< No violations
inline constexpr int kExitViolations = 1;  ///< At least one layer violation
inline constexpr int kExitUsage = 2;       ///< Bad input, config or arguments

// =============================================================================
// OutputFormat
// =============================================================================

/// What the check prints to stdout
enum class OutputFormat : std::uint8_t {
    Report,  ///< Violation lines only (nothing on success)
    Dot,     ///< GraphViz rendering of the graph
    Tree,    ///< Eager dependency tree(s)
    Layers,  ///< The layer table
    Json,    ///< The graph in its JSON input format
};

/// Get format name
[[nodiscard]] const char* output_format_name(OutputFormat format) noexcept;

/// Parse format name
[[nodiscard]] bool output_format_from_string(const std::string& str, OutputFormat& out) noexcept;

// =============================================================================
// CheckConfig
// =============================================================================

/// Configuration of one check run
struct CheckConfig {
    std::filesystem::path graph_path;                    ///< Empty: canonical reference graph
    OutputFormat format = OutputFormat::Report;
    spdlog::level::level_enum log_level = spdlog::level::warn;
    std::string log_directory;                           ///< Non-empty: also log to files here
    std::string tree_root;                               ///< Root for Tree output (empty: all top types)
    bool show_help = false;

    /// Overlay values from a JSON config string onto this config
    [[nodiscard]] stratum_core::Result<void> apply_json(const std::string& json_str);

    /// Overlay values from a JSON config file onto this config
    [[nodiscard]] stratum_core::Result<void> apply_json_file(const std::filesystem::path& path);

    /// Build a config from command-line arguments (argv[0] is skipped)
    [[nodiscard]] static stratum_core::Result<CheckConfig> from_args(
        const std::vector<std::string>& args);
};

/// Usage text for the command-line tool
[[nodiscard]] std::string check_usage(const std::string& program);

// =============================================================================
// Running
// =============================================================================

/// Run a check
///
/// @param config Run configuration
/// @param out Receives the selected output
/// @param err Receives violation lines (non-report formats) and errors
/// @return kExitOk, kExitViolations or kExitUsage
[[nodiscard]] int run_check(const CheckConfig& config, std::ostream& out, std::ostream& err);

} // namespace stratum_layering
