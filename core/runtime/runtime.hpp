#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "http/server.hpp"
#include "worker/worker_supervisor.hpp"

namespace pulse {
namespace runtime {

class Runtime {
public:
    Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Start the worker (blocks until it is healthy), then the HTTP server.
    // SIGINT/SIGTERM during the wait shuts the worker down and fails with
    // a CANCELLED error.
    bool initialize(std::string &error);

    // Main runtime loop (blocking)
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stop HTTP, then kill the worker. Safe to call multiple times.
    void shutdown();

    worker::WorkerSupervisor &get_supervisor() { return *supervisor_; }
    http::HttpServer *get_http_server() { return http_server_.get(); }

private:
    bool init_worker(std::string &error);
    bool init_http(std::string &error);

    RuntimeConfig config_;

    std::unique_ptr<worker::WorkerSupervisor> supervisor_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace pulse
