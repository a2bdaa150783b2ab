#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include "../logging/logger.hpp"

namespace pulse {
namespace runtime {

namespace {

void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &valid_keys) {
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
            LOG_WARN("[Config] Unknown key: '" << (section.empty() ? key : section + "." + key)
                                               << "' (will be ignored)");
        }
    }
}

void load_worker_section(const YAML::Node &node, worker::WorkerConfig &worker) {
    warn_unknown_keys(node, "worker",
                      {"command", "args", "script_path", "max_restarts", "initial_restart_delay_ms",
                       "poll_interval_ms", "restart_count_reset_ms", "health_check"});

    if (node["command"]) {
        worker.command = node["command"].as<std::string>();
    }

    // script_path is shorthand for a single-element args list
    if (node["script_path"]) {
        worker.args = {node["script_path"].as<std::string>()};
    }
    if (node["args"]) {
        worker.args.clear();
        for (const auto &arg : node["args"]) {
            worker.args.push_back(arg.as<std::string>());
        }
    }

    if (node["max_restarts"]) {
        worker.max_restarts = node["max_restarts"].as<int>();
    }
    if (node["initial_restart_delay_ms"]) {
        worker.initial_restart_delay_ms = node["initial_restart_delay_ms"].as<int>();
    }
    if (node["poll_interval_ms"]) {
        worker.poll_interval_ms = node["poll_interval_ms"].as<int>();
    }
    if (node["restart_count_reset_ms"]) {
        worker.restart_count_reset_ms = node["restart_count_reset_ms"].as<int>();
    }

    if (node["health_check"]) {
        const auto &hc = node["health_check"];
        warn_unknown_keys(hc, "worker.health_check", {"url", "timeout_ms", "max_retries", "retry_delay_ms"});

        if (hc["url"]) {
            worker.health_check_url = hc["url"].as<std::string>();
        }
        if (hc["timeout_ms"]) {
            worker.health_check_timeout_ms = hc["timeout_ms"].as<int>();
        }
        if (hc["max_retries"]) {
            worker.health_check_max_retries = hc["max_retries"].as<int>();
        }
        if (hc["retry_delay_ms"]) {
            worker.health_check_retry_delay_ms = hc["retry_delay_ms"].as<int>();
        }
    }
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.enabled) {
        if (config.http.port < 1 || config.http.port > 65535) {
            error = "HTTP port must be between 1 and 65535";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
    }

    // Validate worker settings
    const auto &worker = config.worker;
    if (worker.command.empty()) {
        error = "worker.command must not be empty";
        return false;
    }
    if (worker.max_restarts < 0) {
        error = "worker.max_restarts must be >= 0";
        return false;
    }
    // 2^30 * delay would already exceed any useful backoff
    if (worker.max_restarts > 30) {
        error = "worker.max_restarts must be <= 30";
        return false;
    }
    if (worker.initial_restart_delay_ms < 0) {
        error = "worker.initial_restart_delay_ms must be >= 0";
        return false;
    }
    if (worker.poll_interval_ms < 1) {
        error = "worker.poll_interval_ms must be >= 1";
        return false;
    }
    if (worker.restart_count_reset_ms < 0) {
        error = "worker.restart_count_reset_ms must be >= 0 (0 disables the reset)";
        return false;
    }
    // The probe client is built without TLS; the worker listens on loopback
    if (worker.health_check_url.rfind("http://", 0) != 0) {
        error = "worker.health_check.url must start with http://";
        return false;
    }
    if (worker.health_check_timeout_ms < 1) {
        error = "worker.health_check.timeout_ms must be >= 1";
        return false;
    }
    if (worker.health_check_max_retries < 1) {
        error = "worker.health_check.max_retries must be >= 1";
        return false;
    }
    if (worker.health_check_retry_delay_ms < 0) {
        error = "worker.health_check.retry_delay_ms must be >= 0";
        return false;
    }

    // Validate Logging settings
    const auto &level = config.logging.level;
    if (level != "debug" && level != "info" && level != "warn" && level != "error") {
        error = "Invalid log level: " + level;
        return false;
    }

    return true;
}

void apply_env_overrides(RuntimeConfig &config) {
    if (const char *command = std::getenv("PULSE_WORKER_COMMAND")) {
        if (*command != '\0') {
            config.worker.command = command;
            LOG_INFO("[Config] worker.command overridden from PULSE_WORKER_COMMAND");
        }
    }
    if (const char *script = std::getenv("PULSE_WORKER_SCRIPT")) {
        if (*script != '\0') {
            config.worker.args = {script};
            LOG_INFO("[Config] worker.args overridden from PULSE_WORKER_SCRIPT");
        }
    }
    if (const char *url = std::getenv("PULSE_WORKER_HEALTH_URL")) {
        if (*url != '\0') {
            config.worker.health_check_url = url;
            LOG_INFO("[Config] worker.health_check.url overridden from PULSE_WORKER_HEALTH_URL");
        }
    }
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        if (yaml.IsNull()) {
            // Empty file: all defaults
            return validate_config(config, error);
        }
        if (!yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        warn_unknown_keys(yaml, "", {"http", "worker", "logging"});

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            if (http["enabled"]) {
                config.http.enabled = http["enabled"].as<bool>();
            }
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
        }

        if (yaml["worker"]) {
            load_worker_section(yaml["worker"], config.worker);
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
        if (config.http.enabled) {
            http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
        }
        LOG_INFO(http_msg.str());
        LOG_INFO("[Config] Worker: " << config.worker.command << " (max_restarts=" << config.worker.max_restarts
                                     << ", health=" << config.worker.health_check_url << ")");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace pulse
