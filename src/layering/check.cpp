/// @file check.cpp
/// @brief Build/test gate implementation

#include <stratum/layering/check.hpp>
#include <stratum/layering/canonical.hpp>
#include <stratum/layering/graph.hpp>
#include <stratum/layering/registry.hpp>
#include <stratum/layering/validator.hpp>
#include <stratum/core/log.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>
#include <ostream>
#include <sstream>

namespace stratum_layering {

// =============================================================================
// OutputFormat
// =============================================================================

const char* output_format_name(OutputFormat format) noexcept {
    switch (format) {
        case OutputFormat::Report: return "report";
        case OutputFormat::Dot: return "dot";
        case OutputFormat::Tree: return "tree";
        case OutputFormat::Layers: return "layers";
        case OutputFormat::Json: return "json";
        default: return "unknown";
    }
}

bool output_format_from_string(const std::string& str, OutputFormat& out) noexcept {
    if (str == "report" || str == "text") { out = OutputFormat::Report; return true; }
    if (str == "dot") { out = OutputFormat::Dot; return true; }
    if (str == "tree") { out = OutputFormat::Tree; return true; }
    if (str == "layers") { out = OutputFormat::Layers; return true; }
    if (str == "json") { out = OutputFormat::Json; return true; }
    return false;
}

// =============================================================================
// CheckConfig
// =============================================================================

namespace {

stratum_core::Error config_error(const std::string& message) {
    return stratum_core::Error(stratum_core::ErrorCode::InvalidArgument, message);
}

stratum_core::Result<void> set_format(CheckConfig& config, const std::string& value) {
    if (!output_format_from_string(value, config.format)) {
        return stratum_core::Err(config_error("Unknown output format: " + value));
    }
    return stratum_core::Ok();
}

stratum_core::Result<void> set_log_level(CheckConfig& config, const std::string& value) {
    auto level = stratum_core::parse_log_level(value);
    if (!level) {
        return stratum_core::Err(config_error("Unknown log level: " + value));
    }
    config.log_level = *level;
    return stratum_core::Ok();
}

} // anonymous namespace

stratum_core::Result<void> CheckConfig::apply_json(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return stratum_core::Err(stratum_core::Error(stratum_core::ErrorCode::ParseError,
            std::string("Config parse error: ") + e.what()));
    }

    if (!j.is_object()) {
        return stratum_core::Err(stratum_core::Error(stratum_core::ErrorCode::ParseError,
            "Config must be a JSON object"));
    }

    if (j.contains("graph") && j["graph"].is_string()) {
        graph_path = j["graph"].get<std::string>();
    }
    if (j.contains("format") && j["format"].is_string()) {
        auto result = set_format(*this, j["format"].get<std::string>());
        if (!result) {
            return result;
        }
    }
    if (j.contains("log_level") && j["log_level"].is_string()) {
        auto result = set_log_level(*this, j["log_level"].get<std::string>());
        if (!result) {
            return result;
        }
    }
    if (j.contains("log_directory") && j["log_directory"].is_string()) {
        log_directory = j["log_directory"].get<std::string>();
    }
    if (j.contains("root") && j["root"].is_string()) {
        tree_root = j["root"].get<std::string>();
    }

    return stratum_core::Ok();
}

stratum_core::Result<void> CheckConfig::apply_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return stratum_core::Err(stratum_core::Error(stratum_core::ErrorCode::IOError,
            "Failed to open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return apply_json(buffer.str());
}

stratum_core::Result<CheckConfig> CheckConfig::from_args(const std::vector<std::string>& args) {
    CheckConfig config;

    auto value_of = [&args](std::size_t& i) -> std::optional<std::string> {
        if (i + 1 >= args.size()) {
            return std::nullopt;
        }
        return args[++i];
    };

    // The config file is applied first so flags override it wherever they appear
    for (std::size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "--config") {
            auto path = value_of(i);
            if (!path) {
                return stratum_core::Err<CheckConfig>(config_error("--config requires a value"));
            }
            auto result = config.apply_json_file(*path);
            if (!result) {
                return stratum_core::Err<CheckConfig>(result.error());
            }
        }
    }

    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            continue;
        }
        if (arg == "--config") {
            ++i;
            continue;
        }
        if (arg != "--graph" && arg != "--format" && arg != "--log-level" &&
            arg != "--log-dir" && arg != "--root") {
            return stratum_core::Err<CheckConfig>(config_error("Unknown argument: " + arg));
        }

        auto value = value_of(i);
        if (!value) {
            return stratum_core::Err<CheckConfig>(config_error(arg + " requires a value"));
        }

        if (arg == "--graph") {
            config.graph_path = *value;
        } else if (arg == "--format") {
            auto result = set_format(config, *value);
            if (!result) {
                return stratum_core::Err<CheckConfig>(result.error());
            }
        } else if (arg == "--log-level") {
            auto result = set_log_level(config, *value);
            if (!result) {
                return stratum_core::Err<CheckConfig>(result.error());
            }
        } else if (arg == "--log-dir") {
            config.log_directory = *value;
        } else {
            config.tree_root = *value;
        }
    }

    return stratum_core::Ok(std::move(config));
}

std::string check_usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "\n"
        << "Validates the eager references of an entity type graph against the layer table.\n"
        << "Without --graph the audited canonical reference graph is checked.\n"
        << "\n"
        << "Options:\n"
        << "  --graph FILE       JSON reference graph to validate\n"
        << "  --format FORMAT    report (default), dot, tree, layers, json\n"
        << "  --root TYPE        root type for tree output\n"
        << "  --config FILE      JSON config file (flags override it)\n"
        << "  --log-level LEVEL  trace, debug, info, warn (default), error, off\n"
        << "  --log-dir DIR      also write logs to DIR\n"
        << "  -h, --help         show this help\n"
        << "\n"
        << "Exit status: 0 no violations, 1 layer violations, 2 invalid input.\n";
    return oss.str();
}

// =============================================================================
// Running
// =============================================================================

namespace {

void write_trees(const EntityTypeGraph& graph, const LayerRegistry& registry,
                 const std::string& root, std::ostream& out) {
    if (!root.empty()) {
        out << graph.format_dependency_tree(root, registry);
        return;
    }
    for (const auto& name : graph.type_names()) {
        if (graph.eager_dependents(name).empty()) {
            out << graph.format_dependency_tree(name, registry);
        }
    }
}

} // anonymous namespace

int run_check(const CheckConfig& config, std::ostream& out, std::ostream& err) {
    const auto& registry = LayerRegistry::canonical();
    auto logger = stratum_core::validator_logger();

    EntityTypeGraph loaded;
    const EntityTypeGraph* graph = &canonical_reference_graph();

    if (!config.graph_path.empty()) {
        auto result = EntityTypeGraph::load(config.graph_path);
        if (!result) {
            err << stratum_core::build_error_chain(result.error()) << "\n";
            return kExitUsage;
        }
        loaded = std::move(*result);
        graph = &loaded;
        logger->info("Loaded reference graph '{}' ({} types, {} eager, {} deferred)",
            config.graph_path.string(), loaded.size(), loaded.eager_count(), loaded.deferred_count());
    }

    auto report = DependencyValidator(registry).validate(*graph);
    if (!report) {
        err << stratum_core::build_error_chain(report.error()) << "\n";
        return kExitUsage;
    }

    switch (config.format) {
        case OutputFormat::Report:
            out << report->format();
            break;
        case OutputFormat::Dot:
            out << graph->to_dot_graph(registry);
            break;
        case OutputFormat::Tree:
            write_trees(*graph, registry, config.tree_root, out);
            break;
        case OutputFormat::Layers:
            out << registry.format_table();
            break;
        case OutputFormat::Json:
            out << graph->to_json_string() << "\n";
            break;
    }

    if (report->empty()) {
        return kExitOk;
    }
    if (config.format != OutputFormat::Report) {
        err << report->format();
    }
    return kExitViolations;
}

} // namespace stratum_layering
