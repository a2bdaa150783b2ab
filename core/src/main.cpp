// Pulse Runtime
// Supervises the analysis worker and serves its status over HTTP

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

namespace {
constexpr const char *kDefaultConfigPath = "pulse-runtime.yaml";
}

int main(int argc, char **argv) {
    std::string config_path = kDefaultConfigPath;
    bool explicit_config = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            explicit_config = true;
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
            explicit_config = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: pulse-runtime [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: " << kDefaultConfigPath << ")\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    pulse::runtime::RuntimeConfig config;
    std::string error;

    if (std::filesystem::exists(config_path)) {
        if (!pulse::runtime::load_config(config_path, config, error)) {
            std::cerr << "ERROR: Failed to load config: " << error << "\n";
            return 1;
        }
    } else if (explicit_config) {
        // Logger level not configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        return 1;
    }

    pulse::runtime::apply_env_overrides(config);

    if (!pulse::runtime::validate_config(config, error)) {
        std::cerr << "ERROR: Invalid config: " << error << "\n";
        return 1;
    }

    pulse::logging::Logger::init(pulse::logging::string_to_level(config.logging.level));

    LOG_INFO("Pulse Runtime starting...");
    if (std::filesystem::exists(config_path)) {
        LOG_INFO("Loaded config: " << config_path);
    } else {
        LOG_INFO("No config file at " << config_path << ", using defaults");
    }

    pulse::runtime::SignalHandler::install();

    pulse::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        runtime.shutdown();
        if (pulse::runtime::SignalHandler::is_shutdown_requested()) {
            LOG_INFO("Shutdown requested during startup: " << error);
            return 0;
        }
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    LOG_INFO("Runtime Ready");
    LOG_INFO("  Worker: " << config.worker.command);
    LOG_INFO("  Health: " << config.worker.health_check_url);
    LOG_INFO("  Max restarts: " << config.worker.max_restarts);

    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
