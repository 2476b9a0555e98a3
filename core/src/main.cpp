// itemvault server
// Config-based item service with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    std::string config_path = "itemvault.yaml";  // Default

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: itemvault-server [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: itemvault.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n\n";
            std::cerr << "Environment:\n";
            std::cerr << "  " << itemvault::runtime::kTableEnvVar << "  Overrides store.table\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path)) {
        // Using cerr here as logger might not be configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("itemvault starting...");
    LOG_INFO("Loading config: " << config_path);

    itemvault::runtime::ServiceConfig config;
    std::string error;

    if (!itemvault::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    itemvault::logging::Logger::set_level(itemvault::logging::string_to_level(config.logging.level));

    itemvault::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    itemvault::runtime::SignalHandler::install();

    LOG_INFO("Service Ready");
    LOG_INFO("  Store: " << runtime.get_store().describe());
    LOG_INFO("  HTTP: " << config.http.bind << ":" << runtime.http_port());

    // Blocks until SIGINT/SIGTERM
    runtime.run();

    LOG_INFO("Shutdown complete");
    return 0;
}
