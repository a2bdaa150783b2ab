#pragma once

#include <sys/types.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "log_forwarder.hpp"

namespace pulse {
namespace worker {

// WorkerProcess owns exactly one OS process of the analysis worker.
// Responsibilities:
// - Spawn with stdin on /dev/null and stdout/stderr piped into LogForwarders
// - Non-blocking exit detection
// - Unconditional kill of the worker's process group, followed by a reap
//
// The worker runs in its own process group so that helpers started by its
// launcher (e.g. a shell wrapper) die with it and release the pipes.
class WorkerProcess {
public:
    WorkerProcess(const std::string &command, const std::vector<std::string> &args);
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess &) = delete;
    WorkerProcess &operator=(const WorkerProcess &) = delete;

    // Create the process and start log forwarding.
    // Returns false on failure (see last_error()). Only callable once.
    bool spawn();

    // Non-blocking check. Reaps the child if it has exited and kills
    // whatever is left in its process group.
    bool has_exited();

    // SIGKILL the process group, wait for exit, drain the log pipes.
    // Returns false if the kill or the reap failed.
    bool terminate();

    pid_t pid() const { return pid_; }
    const std::string &last_error() const { return error_; }

    // Human-readable exit reason ("exit code 1", "signal 9"); empty while running
    std::string exit_description() const;

    std::chrono::steady_clock::time_point started_at() const { return started_at_; }

private:
    bool wait_for_exit();
    void record_exit(int status);
    void kill_leftover_group();
    void stop_forwarders();

    std::string command_;
    std::vector<std::string> args_;
    std::string error_;

    pid_t pid_ = -1;
    bool reaped_ = false;
    int exit_status_ = 0;
    std::chrono::steady_clock::time_point started_at_;

    std::unique_ptr<LogForwarder> stdout_forwarder_;
    std::unique_ptr<LogForwarder> stderr_forwarder_;
};

}  // namespace worker
}  // namespace pulse
