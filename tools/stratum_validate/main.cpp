/// @file main.cpp
/// @brief stratum_validate: layer-order gate for build and test pipelines
///
/// Validates the eager references of the entity type graph against the layer
/// table. Prints nothing and exits 0 when every eager reference points to a
/// strictly lower layer; otherwise prints one line per violation and exits 1.

#include <stratum/layering/check.hpp>
#include <stratum/core/error.hpp>
#include <stratum/core/log.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv, argv + argc);
    const std::string program = args.empty() ? "stratum_validate" : args.front();

    auto config = stratum_layering::CheckConfig::from_args(args);
    if (!config) {
        std::cerr << stratum_core::build_error_chain(config.error()) << "\n\n"
                  << stratum_layering::check_usage(program);
        return stratum_layering::kExitUsage;
    }

    if (config->show_help) {
        std::cout << stratum_layering::check_usage(program);
        return stratum_layering::kExitOk;
    }

    stratum_core::LogConfig log_config;
    log_config.level = config->log_level;
    log_config.log_directory = config->log_directory;
    stratum_core::configure_logging(log_config);

    stratum_core::core_logger()->debug("Checking {} ({} output, log level {})",
        config->graph_path.empty() ? std::string("canonical reference graph") : config->graph_path.string(),
        stratum_layering::output_format_name(config->format),
        stratum_core::log_level_name(config->log_level));

    int status = stratum_layering::run_check(*config, std::cout, std::cerr);

    stratum_core::shutdown_logging();
    return status;
}
