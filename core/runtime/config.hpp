#pragma once

#include <string>
#include <vector>

#include "../worker/worker_config.hpp"

namespace pulse {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

// Diagnostics HTTP server (http: in YAML)
struct HttpConfig {
    bool enabled = true;             // HTTP server enabled
    std::string bind = "127.0.0.1";  // Bind address
    int port = 8090;                 // HTTP port
    int thread_pool_size = 4;        // Worker thread pool size
};

struct RuntimeConfig {
    HttpConfig http;
    worker::WorkerConfig worker;
    LoggingConfig logging;
};

// Loads configuration from a YAML file (missing keys keep their defaults)
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Applies PULSE_WORKER_* environment variables on top of the loaded values
void apply_env_overrides(RuntimeConfig &config);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace pulse
