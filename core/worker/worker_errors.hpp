#pragma once

#include <string>

namespace pulse {
namespace worker {

/**
 * @brief Failure taxonomy of the worker supervision subsystem
 *
 * - SPAWN_FAILED: the OS could not create the worker process
 * - HEALTH_CHECK_TIMEOUT: the worker never became ready within the startup budget
 * - HEALTH_CHECK_FAILED: a single probe failed (retried internally)
 * - CANCELLED: a wait or restart was aborted because shutdown was requested
 * - RESTART_EXHAUSTED: the restart budget is spent; only logged, never returned from start()
 * - TERMINATE_FAILED: the worker could not be killed or reaped
 */
enum class WorkerError {
    OK,
    SPAWN_FAILED,
    HEALTH_CHECK_TIMEOUT,
    HEALTH_CHECK_FAILED,
    CANCELLED,
    RESTART_EXHAUSTED,
    TERMINATE_FAILED
};

inline const char *worker_error_to_string(WorkerError code) {
    switch (code) {
        case WorkerError::OK:
            return "OK";
        case WorkerError::SPAWN_FAILED:
            return "SPAWN_FAILED";
        case WorkerError::HEALTH_CHECK_TIMEOUT:
            return "HEALTH_CHECK_TIMEOUT";
        case WorkerError::HEALTH_CHECK_FAILED:
            return "HEALTH_CHECK_FAILED";
        case WorkerError::CANCELLED:
            return "CANCELLED";
        case WorkerError::RESTART_EXHAUSTED:
            return "RESTART_EXHAUSTED";
        case WorkerError::TERMINATE_FAILED:
            return "TERMINATE_FAILED";
    }
    return "UNKNOWN";
}

// Result of a supervisor operation: code plus human-readable detail
struct WorkerStatus {
    WorkerError code = WorkerError::OK;
    std::string message;

    bool ok() const { return code == WorkerError::OK; }

    static WorkerStatus success() { return WorkerStatus{}; }
    static WorkerStatus failure(WorkerError code, const std::string &message) { return WorkerStatus{code, message}; }
};

}  // namespace worker
}  // namespace pulse
