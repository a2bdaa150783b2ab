#pragma once

#include <httplib.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "runtime/config.hpp"

namespace pulse {
namespace worker {
class WorkerSupervisor;
}

namespace http {

/**
 * @brief Diagnostics HTTP server for the worker supervisor
 *
 * Read-only adapter that exposes supervisor state over REST. It never
 * mutates the supervisor; start/shutdown stay with the runtime.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - snapshot() and is_healthy() are thread-safe on the supervisor side
 *
 * Routes:
 * - GET /v0/worker/status  supervisor snapshot
 * - GET /v0/worker/health  ad-hoc probe, 200 or 503
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, worker::WorkerSupervisor &supervisor);
    ~HttpServer();

    /**
     * @brief Bind and start the server thread
     *
     * Port 0 binds an ephemeral port; get_port() reports the one chosen.
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    // Safe to call multiple times
    void stop();

    bool is_running() const { return running_.load(); }
    int get_port() const { return port_; }

private:
    void setup_routes();

    // Route handlers (implemented in handlers/worker_handlers.cpp)
    void handle_get_worker_status(const httplib::Request &req, httplib::Response &res);
    void handle_get_worker_health(const httplib::Request &req, httplib::Response &res);

    runtime::HttpConfig config_;
    int port_ = 0;

    worker::WorkerSupervisor &supervisor_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace http
}  // namespace pulse
