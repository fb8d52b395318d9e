// hubsync runtime
// Config-based runtime with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    std::string config_path = "hubsync-runtime.yaml";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: hubsync-runtime [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: hubsync-runtime.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path)) {
        // Logger is not configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    hubsync::logging::Logger::init(hubsync::logging::Level::LVL_INFO);
    LOG_INFO("hubsync runtime starting...");
    LOG_INFO("Loading config: " << config_path);

    hubsync::runtime::RuntimeConfig config;
    std::string error;

    if (!hubsync::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    hubsync::logging::Logger::set_level(hubsync::logging::string_to_level(config.logging.level));

    // Install before initialize so a Ctrl+C during startup is not lost
    hubsync::runtime::SignalHandler::install();

    hubsync::runtime::Runtime runtime(config);
    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    LOG_INFO("Runtime Ready");
    LOG_INFO("  Devices: " << runtime.get_coordinator().device_count());
    LOG_INFO("  Polling: " << config.polling.interval_ms << "ms");

    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
