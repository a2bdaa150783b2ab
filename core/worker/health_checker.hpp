#pragma once

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "i_health_probe.hpp"
#include "shutdown_signal.hpp"
#include "worker_errors.hpp"

namespace pulse {
namespace worker {

/**
 * @brief HTTP GET liveness probe backed by cpp-httplib
 *
 * Ready means: a 2xx response whose body parses as JSON. The body is
 * returned as opaque diagnostics; no field is required.
 */
class HttpHealthProbe : public IHealthProbe {
public:
    ProbeResult probe(const std::string &url, std::chrono::milliseconds timeout) override;

    // Split "http://host:port/path" into {"http://host:port", "/path"}.
    // Returns false if the URL has no scheme or host.
    static bool split_url(const std::string &url, std::string &base, std::string &path);
};

/**
 * @brief Readiness checks against the worker's health endpoint
 *
 * Thread-safe: holds no mutable state of its own, so is_healthy() callers and
 * the startup wait can probe concurrently.
 */
class HealthChecker {
public:
    HealthChecker(std::shared_ptr<IHealthProbe> probe, std::string url, std::chrono::milliseconds timeout);

    // One probe with the configured URL and timeout
    ProbeResult probe_once() const;

    /**
     * @brief Probe until ready, the retry budget is spent, or shutdown fires
     *
     * Probes up to max_retries times, sleeping retry_delay (fixed) between
     * attempts. The sleep is interruptible by `signal`.
     *
     * @param diagnostics Receives the body of the successful probe
     * @return OK, HEALTH_CHECK_TIMEOUT or CANCELLED
     */
    WorkerStatus wait_until_ready(int max_retries, std::chrono::milliseconds retry_delay, const ShutdownSignal &signal,
                                  nlohmann::json &diagnostics) const;

    const std::string &url() const { return url_; }

private:
    std::shared_ptr<IHealthProbe> probe_;
    std::string url_;
    std::chrono::milliseconds timeout_;
};

}  // namespace worker
}  // namespace pulse
