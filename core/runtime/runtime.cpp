#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"
#include "worker/shutdown_signal.hpp"

namespace pulse {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing Pulse");

    if (!init_worker(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_worker(std::string &error) {
    supervisor_ = std::make_unique<worker::WorkerSupervisor>(config_.worker);

    // run() is not polling yet; a signal during the health wait must still
    // cancel it.
    worker::ShutdownSignal start_returned;
    std::thread signal_watcher([this, &start_returned]() {
        while (!start_returned.wait_for(std::chrono::milliseconds(100))) {
            if (SignalHandler::is_shutdown_requested()) {
                LOG_INFO("[Runtime] Signal received during worker startup, cancelling");
                worker::WorkerStatus status = supervisor_->shutdown();
                if (!status.ok()) {
                    LOG_ERROR("[Runtime] Worker shutdown failed: " << status.message);
                }
                return;
            }
        }
    });

    worker::WorkerStatus status = supervisor_->start();
    start_returned.trigger();
    signal_watcher.join();

    if (!status.ok()) {
        error = "Worker failed to start (" + std::string(worker::worker_error_to_string(status.code)) +
                "): " + status.message;
        return false;
    }

    auto snap = supervisor_->snapshot();
    LOG_INFO("[Runtime] Worker ready (pid=" << (snap.pid ? *snap.pid : -1) << ")");
    return true;
}

bool Runtime::init_http(std::string &error) {
    if (config_.http.enabled) {
        LOG_INFO("[Runtime] Creating HTTP server");
        http_server_ = std::make_unique<http::HttpServer>(config_.http, *supervisor_);

        std::string http_error;
        if (!http_server_->start(http_error)) {
            error = "HTTP server failed to start: " + http_error;
            return false;
        }
        LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << http_server_->get_port());
    } else {
        LOG_INFO("[Runtime] HTTP server disabled in config");
    }
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    // Supervision happens on the supervisor's own thread; this loop only
    // waits for a stop request.
    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }
    }

    LOG_INFO("[Runtime] Main loop exited");
}

void Runtime::shutdown() {
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }

    if (supervisor_) {
        worker::WorkerStatus status = supervisor_->shutdown();
        if (!status.ok()) {
            LOG_ERROR("[Runtime] Worker shutdown failed: " << status.message);
        }
    }
}

}  // namespace runtime
}  // namespace pulse
