#include "health_checker.hpp"

#include <httplib.h>

#include "logging/logger.hpp"

namespace pulse {
namespace worker {

bool HttpHealthProbe::split_url(const std::string &url, std::string &base, std::string &path) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return false;
    }

    const auto host_start = scheme_end + 3;
    const auto path_start = url.find('/', host_start);
    if (path_start == host_start || host_start >= url.size()) {
        return false;
    }

    if (path_start == std::string::npos) {
        base = url;
        path = "/";
    } else {
        base = url.substr(0, path_start);
        path = url.substr(path_start);
    }
    return true;
}

ProbeResult HttpHealthProbe::probe(const std::string &url, std::chrono::milliseconds timeout) {
    ProbeResult result;

    std::string base;
    std::string path;
    if (!split_url(url, base, path)) {
        result.error = "Invalid health check URL: " + url;
        return result;
    }

    httplib::Client client(base);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);

    const auto start = std::chrono::steady_clock::now();
    auto response = client.Get(path);
    const auto elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();

    if (!response) {
        result.error = "Request failed after " + std::to_string(elapsed_ms) +
                       "ms: " + httplib::to_string(response.error());
        return result;
    }

    result.http_status = response->status;
    LOG_DEBUG("[Health] " << url << " -> HTTP " << response->status << " in " << elapsed_ms << "ms");

    if (response->status < 200 || response->status >= 300) {
        result.error = "Health check failed with HTTP status " + std::to_string(response->status);
        return result;
    }

    auto body = nlohmann::json::parse(response->body, nullptr, false);
    if (body.is_discarded()) {
        result.error = "Health check response is not valid JSON";
        return result;
    }

    result.ready = true;
    result.diagnostics = std::move(body);
    return result;
}

HealthChecker::HealthChecker(std::shared_ptr<IHealthProbe> probe, std::string url, std::chrono::milliseconds timeout)
    : probe_(std::move(probe)), url_(std::move(url)), timeout_(timeout) {}

ProbeResult HealthChecker::probe_once() const { return probe_->probe(url_, timeout_); }

WorkerStatus HealthChecker::wait_until_ready(int max_retries, std::chrono::milliseconds retry_delay,
                                             const ShutdownSignal &signal, nlohmann::json &diagnostics) const {
    LOG_INFO("[Health] Waiting for worker at " << url_ << " (up to " << max_retries << " probes, "
                                               << retry_delay.count() << "ms apart)");

    const auto start = std::chrono::steady_clock::now();
    const auto budget = retry_delay * max_retries;

    for (int attempt = 1; attempt <= max_retries; ++attempt) {
        if (signal.is_triggered()) {
            return WorkerStatus::failure(WorkerError::CANCELLED, "Worker startup cancelled due to shutdown");
        }

        // Slow probes (each up to the probe timeout) must not stretch startup past the budget
        if (attempt > 1 && budget.count() > 0 && std::chrono::steady_clock::now() - start > budget) {
            LOG_ERROR("[Health] Startup budget of " << budget.count() << "ms exhausted");
            break;
        }

        ProbeResult result = probe_once();
        if (result.ready) {
            LOG_INFO("[Health] Worker is ready (attempt " << attempt << "/" << max_retries << ")");
            if (result.diagnostics.is_object()) {
                if (result.diagnostics.contains("libraries")) {
                    LOG_INFO("[Health]   libraries: " << result.diagnostics["libraries"].dump());
                }
                if (result.diagnostics.contains("primary_detector")) {
                    LOG_INFO("[Health]   primary_detector: " << result.diagnostics["primary_detector"].dump());
                }
            }
            diagnostics = std::move(result.diagnostics);
            return WorkerStatus::success();
        }

        LOG_WARN("[Health] Attempt " << attempt << "/" << max_retries << ": worker not ready yet: " << result.error);

        if (attempt < max_retries) {
            if (signal.wait_for(retry_delay)) {
                return WorkerStatus::failure(WorkerError::CANCELLED, "Worker startup cancelled due to shutdown");
            }
        }
    }

    return WorkerStatus::failure(WorkerError::HEALTH_CHECK_TIMEOUT,
                                 "Worker failed to become healthy after " + std::to_string(max_retries) + " attempts");
}

}  // namespace worker
}  // namespace pulse
