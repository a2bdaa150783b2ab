#include "worker_supervisor.hpp"

#include "logging/logger.hpp"
#include "restart_policy.hpp"

namespace pulse {
namespace worker {

const char *lifecycle_state_to_string(LifecycleState state) {
    switch (state) {
        case LifecycleState::NOT_STARTED:
            return "NOT_STARTED";
        case LifecycleState::SPAWNING:
            return "SPAWNING";
        case LifecycleState::AWAITING_HEALTH:
            return "AWAITING_HEALTH";
        case LifecycleState::RUNNING:
            return "RUNNING";
        case LifecycleState::RESTARTING:
            return "RESTARTING";
        case LifecycleState::FAILED:
            return "FAILED";
        case LifecycleState::SHUTTING_DOWN:
            return "SHUTTING_DOWN";
        case LifecycleState::TERMINATED:
            return "TERMINATED";
    }
    return "UNKNOWN";
}

WorkerSupervisor::WorkerSupervisor(const WorkerConfig &config, std::shared_ptr<IHealthProbe> probe)
    : config_(config),
      health_checker_(probe ? std::move(probe) : std::make_shared<HttpHealthProbe>(), config.health_check_url,
                      std::chrono::milliseconds(config.health_check_timeout_ms)) {}

WorkerSupervisor::~WorkerSupervisor() {
    auto status = shutdown();
    if (!status.ok()) {
        LOG_WARN("[Supervisor] Shutdown during destruction failed: " << status.message);
    }
}

WorkerStatus WorkerSupervisor::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return WorkerStatus::failure(WorkerError::CANCELLED, "Supervisor has been shut down");
        }
        if (ready_) {
            LOG_INFO("[Supervisor] Worker supervisor already started, skipping duplicate start");
            return WorkerStatus::success();
        }

        if (started_) {
            // Spawned by an earlier start() whose health wait failed; the monitor owns the worker now
            LOG_INFO("[Supervisor] Worker already spawned, waiting for readiness again");
        } else {
            LOG_INFO("[Supervisor] Starting worker supervisor");
            state_ = LifecycleState::SPAWNING;

            std::string error;
            if (!spawn_locked(error)) {
                state_ = LifecycleState::NOT_STARTED;
                return WorkerStatus::failure(WorkerError::SPAWN_FAILED, "Failed to spawn worker: " + error);
            }

            started_ = true;
            state_ = LifecycleState::AWAITING_HEALTH;
            monitor_thread_ = std::thread(&WorkerSupervisor::monitor_loop, this);
        }
    }

    nlohmann::json diagnostics;
    WorkerStatus status =
        health_checker_.wait_until_ready(config_.health_check_max_retries,
                                         std::chrono::milliseconds(config_.health_check_retry_delay_ms),
                                         shutdown_signal_, diagnostics);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!status.ok()) {
        LOG_ERROR("[Supervisor] Worker startup failed: " << status.message);
        return status;
    }

    ready_ = true;
    diagnostics_ = std::move(diagnostics);
    if (state_ == LifecycleState::AWAITING_HEALTH) {
        state_ = LifecycleState::RUNNING;
    }
    LOG_INFO("[Supervisor] Worker started and healthy");
    return status;
}

bool WorkerSupervisor::is_healthy() const {
    if (shutdown_signal_.is_triggered()) {
        return false;
    }

    const auto start = std::chrono::steady_clock::now();
    ProbeResult result = health_checker_.probe_once();
    const auto elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();

    if (result.ready) {
        LOG_DEBUG("[Supervisor] Worker is healthy (check took " << elapsed_ms << "ms)");
    } else {
        LOG_WARN("[Supervisor] Worker health check failed after " << elapsed_ms << "ms: " << result.error);
    }
    return result.ready;
}

WorkerStatus WorkerSupervisor::shutdown() {
    std::lock_guard<std::mutex> guard(shutdown_mutex_);
    if (terminated_) {
        return WorkerStatus::success();
    }

    std::unique_ptr<WorkerProcess> child;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        state_ = LifecycleState::SHUTTING_DOWN;
        child = std::move(child_);
    }

    LOG_INFO("[Supervisor] Shutting down worker");
    shutdown_signal_.trigger();

    WorkerStatus status = WorkerStatus::success();
    if (child) {
        if (child->terminate()) {
            LOG_INFO("[Supervisor] Worker terminated (" << child->exit_description() << ")");
        } else {
            status = WorkerStatus::failure(WorkerError::TERMINATE_FAILED,
                                           "Failed to terminate worker: " + child->last_error());
            LOG_ERROR("[Supervisor] " << status.message);
        }
        child.reset();
    } else {
        LOG_INFO("[Supervisor] No worker process to terminate");
    }

    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = LifecycleState::TERMINATED;
    }
    terminated_ = true;

    LOG_INFO("[Supervisor] Worker shutdown completed");
    return status;
}

WorkerSupervisor::SupervisorSnapshot WorkerSupervisor::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    SupervisorSnapshot snap;
    snap.state = state_;
    snap.restart_count = restart_count_;
    snap.max_restarts = config_.max_restarts;
    snap.spawn_count = spawn_count_;
    snap.last_backoff_ms = last_backoff_ms_;
    snap.shutting_down = shutting_down_;

    if (child_) {
        snap.pid = static_cast<int>(child_->pid());
        snap.uptime_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                               child_->started_at())
                             .count();
    }
    return snap;
}

nlohmann::json WorkerSupervisor::last_diagnostics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return diagnostics_;
}

bool WorkerSupervisor::spawn_locked(std::string &error) {
    auto process = std::make_unique<WorkerProcess>(config_.command, config_.args);
    if (!process->spawn()) {
        error = process->last_error();
        return false;
    }
    child_ = std::move(process);
    ++spawn_count_;
    return true;
}

void WorkerSupervisor::monitor_loop() {
    LOG_INFO("[Supervisor] Monitoring loop started (poll every " << config_.poll_interval_ms << "ms)");

    const auto poll_interval = std::chrono::milliseconds(config_.poll_interval_ms);
    const auto initial_delay = std::chrono::milliseconds(config_.initial_restart_delay_ms);

    while (true) {
        bool needs_restart = false;
        std::unique_ptr<WorkerProcess> dead;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutting_down_) {
                break;
            }

            if (!child_) {
                needs_restart = true;
            } else if (child_->has_exited()) {
                LOG_ERROR("[Supervisor] Worker (PID=" << child_->pid() << ") exited: " << child_->exit_description());
                dead = std::move(child_);
                state_ = LifecycleState::RESTARTING;
                needs_restart = true;
            } else if (config_.restart_count_reset_ms > 0 && restart_count_ > 0) {
                const auto up_for = std::chrono::steady_clock::now() - child_->started_at();
                if (up_for >= std::chrono::milliseconds(config_.restart_count_reset_ms)) {
                    LOG_INFO("[Supervisor] Worker stable for " << config_.restart_count_reset_ms
                                                               << "ms, resetting restart count (was "
                                                               << restart_count_ << ")");
                    restart_count_ = 0;
                }
            }
        }

        // Joins the dead worker's log forwarders; done outside the lock
        dead.reset();

        if (needs_restart) {
            std::chrono::milliseconds delay{0};
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (shutting_down_) {
                    break;
                }

                if (!restart_policy::may_restart(restart_count_, config_.max_restarts)) {
                    LOG_ERROR("[Supervisor] Maximum restart attempts (" << config_.max_restarts
                                                                        << ") reached. No longer attempting restarts.");
                    state_ = LifecycleState::FAILED;
                    break;
                }

                ++restart_count_;
                delay = restart_policy::delay_for_attempt(restart_count_, initial_delay);
                last_backoff_ms_ = delay.count();
                state_ = LifecycleState::RESTARTING;
                LOG_WARN("[Supervisor] Attempting restart " << restart_count_ << "/" << config_.max_restarts
                                                            << " in " << delay.count() << "ms");
            }

            if (shutdown_signal_.wait_for(delay)) {
                LOG_DEBUG("[Supervisor] Restart aborted: shutdown requested during backoff");
                break;
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (shutting_down_) {
                    LOG_DEBUG("[Supervisor] Restart aborted: shutdown requested");
                    break;
                }

                state_ = LifecycleState::SPAWNING;
                std::string error;
                if (spawn_locked(error)) {
                    state_ = ready_ ? LifecycleState::RUNNING : LifecycleState::AWAITING_HEALTH;
                    LOG_INFO("[Supervisor] Worker restarted successfully (PID=" << child_->pid() << ")");
                } else {
                    state_ = LifecycleState::RESTARTING;
                    LOG_ERROR("[Supervisor] Failed to restart worker: " << error);
                }
            }
        }

        if (shutdown_signal_.wait_for(poll_interval)) {
            LOG_INFO("[Supervisor] Monitoring loop received shutdown notification");
            break;
        }
    }

    LOG_INFO("[Supervisor] Monitoring loop ended");
}

}  // namespace worker
}  // namespace pulse
