#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>

#include "health_checker.hpp"
#include "shutdown_signal.hpp"
#include "worker_config.hpp"
#include "worker_errors.hpp"
#include "worker_process.hpp"

namespace pulse {
namespace worker {

enum class LifecycleState { NOT_STARTED, SPAWNING, AWAITING_HEALTH, RUNNING, RESTARTING, FAILED, SHUTTING_DOWN, TERMINATED };

const char *lifecycle_state_to_string(LifecycleState state);

// WorkerSupervisor owns the analysis worker's OS-level lifecycle.
//
// start() spawns the worker and blocks until it answers its health endpoint.
// A monitoring thread then polls liveness and respawns crashed workers with
// exponential backoff until the restart budget is spent. shutdown() kills the
// worker and stops the monitor; it never waits out a pending backoff.
//
// start(), shutdown(), is_healthy() and snapshot() are safe to call from any
// thread.
class WorkerSupervisor {
public:
    // Immutable copy of supervision state for diagnostics
    struct SupervisorSnapshot {
        LifecycleState state = LifecycleState::NOT_STARTED;
        int restart_count = 0;
        int max_restarts = 0;
        int spawn_count = 0;                  // Successful spawns, initial one included
        std::optional<int> pid;               // nullopt when no worker process is held
        std::optional<int64_t> uptime_ms;     // Age of the current worker process
        int64_t last_backoff_ms = 0;          // Delay used by the most recent restart
        bool shutting_down = false;
    };

    // A null probe selects the HTTP probe against config.health_check_url
    explicit WorkerSupervisor(const WorkerConfig &config, std::shared_ptr<IHealthProbe> probe = nullptr);
    ~WorkerSupervisor();

    WorkerSupervisor(const WorkerSupervisor &) = delete;
    WorkerSupervisor &operator=(const WorkerSupervisor &) = delete;

    // Spawn, start monitoring, then block until ready.
    // Errors: SPAWN_FAILED, HEALTH_CHECK_TIMEOUT, CANCELLED.
    // A second call after a successful start is a no-op.
    WorkerStatus start();

    // One uncached probe. Always false once shutdown has begun.
    bool is_healthy() const;

    // Kill the worker, stop the monitor. Idempotent.
    WorkerStatus shutdown();

    SupervisorSnapshot snapshot() const;

    // Body of the probe that completed start(); null before that
    nlohmann::json last_diagnostics() const;

    const WorkerConfig &config() const { return config_; }

private:
    void monitor_loop();
    bool spawn_locked(std::string &error);

    const WorkerConfig config_;
    HealthChecker health_checker_;
    ShutdownSignal shutdown_signal_;

    mutable std::mutex mutex_;  // Guards everything below
    std::unique_ptr<WorkerProcess> child_;
    int restart_count_ = 0;
    int spawn_count_ = 0;
    int64_t last_backoff_ms_ = 0;
    bool started_ = false;
    bool ready_ = false;
    bool shutting_down_ = false;
    LifecycleState state_ = LifecycleState::NOT_STARTED;
    nlohmann::json diagnostics_;
    std::thread monitor_thread_;

    std::mutex shutdown_mutex_;  // Serializes shutdown() callers
    bool terminated_ = false;
};

}  // namespace worker
}  // namespace pulse
