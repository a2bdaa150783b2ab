#include "worker_process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>

#include "logging/logger.hpp"

namespace pulse {
namespace worker {

namespace {

void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

}  // namespace

WorkerProcess::WorkerProcess(const std::string &command, const std::vector<std::string> &args)
    : command_(command), args_(args) {}

WorkerProcess::~WorkerProcess() {
    if (pid_ > 0 && !reaped_) {
        terminate();
    }
    stop_forwarders();
}

bool WorkerProcess::spawn() {
    if (pid_ > 0) {
        error_ = "Worker already spawned (PID=" + std::to_string(pid_) + ")";
        return false;
    }
    if (command_.empty()) {
        error_ = "Worker command is empty";
        return false;
    }

    std::string cmdline = command_;
    for (const auto &arg : args_) {
        cmdline += " " + arg;
    }
    LOG_INFO("[Worker] Spawning: " << cmdline);

    // argv must be built before fork: the child may only make async-signal-safe calls
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(command_.c_str()));
    for (const auto &arg : args_) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // Reports exec errno back to the parent

    if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stdout pipe: " + std::string(std::strerror(errno));
        return false;
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stderr pipe: " + std::string(std::strerror(errno));
        close_pair(stdout_pipe);
        return false;
    }
    if (pipe2(exec_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create exec status pipe: " + std::string(std::strerror(errno));
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return false;
    }

    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) {
        error_ = "Failed to open /dev/null: " + std::string(std::strerror(errno));
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        error_ = "Fork failed: " + std::string(std::strerror(errno));
        close(devnull);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return false;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        dup2(devnull, STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        execvp(argv[0], argv.data());

        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process. Also set the group here so kill(-pid) works even if
    // we get scheduled before the child runs setpgid.
    setpgid(pid, pid);

    close(devnull);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        // exec failed: the child has already _exit()ed, reap it
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        error_ = "Failed to execute '" + command_ + "': " + std::strerror(exec_errno);
        LOG_ERROR("[Worker] " << error_);
        return false;
    }

    pid_ = pid;
    reaped_ = false;
    started_at_ = std::chrono::steady_clock::now();
    error_.clear();

    stdout_forwarder_ = std::make_unique<LogForwarder>("worker:stdout", stdout_pipe[0], logging::Level::LVL_INFO);
    stderr_forwarder_ = std::make_unique<LogForwarder>("worker:stderr", stderr_pipe[0], logging::Level::LVL_WARN);
    stdout_forwarder_->start();
    stderr_forwarder_->start();

    LOG_INFO("[Worker] Process spawned successfully (PID=" << pid_ << ")");
    return true;
}

bool WorkerProcess::has_exited() {
    if (pid_ <= 0 || reaped_) {
        return true;
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
        return false;
    }
    if (result == pid_) {
        record_exit(status);
        kill_leftover_group();
        return true;
    }

    // ECHILD or similar: the process is gone and cannot be inspected
    error_ = "waitpid failed: " + std::string(std::strerror(errno));
    reaped_ = true;
    return true;
}

bool WorkerProcess::terminate() {
    if (pid_ <= 0) {
        return true;
    }
    if (reaped_) {
        stop_forwarders();
        return true;
    }

    LOG_INFO("[Worker] Killing worker (PID=" << pid_ << ")");

    bool ok = true;
    if (kill(-pid_, SIGKILL) < 0 && kill(pid_, SIGKILL) < 0 && errno != ESRCH) {
        error_ = "kill failed: " + std::string(std::strerror(errno));
        LOG_ERROR("[Worker] " << error_);
        ok = false;
    }

    if (!wait_for_exit()) {
        ok = false;
    }

    stop_forwarders();
    return ok;
}

bool WorkerProcess::wait_for_exit() {
    while (true) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, 0);
        if (result == pid_) {
            record_exit(status);
            return true;
        }
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == ECHILD) {
                reaped_ = true;
                return true;
            }
            error_ = "waitpid failed: " + std::string(std::strerror(errno));
            LOG_ERROR("[Worker] " << error_);
            return false;
        }
    }
}

void WorkerProcess::kill_leftover_group() {
    // The group ID stays reserved while any member is alive, so this cannot
    // hit an unrelated process. Survivors would hold the log pipes open.
    if (kill(-pid_, SIGKILL) == 0) {
        LOG_WARN("[Worker] Killed processes left behind in group " << pid_);
    } else if (errno != ESRCH) {
        LOG_WARN("[Worker] Failed to kill process group " << pid_ << ": " << std::strerror(errno));
    }
}

void WorkerProcess::record_exit(int status) {
    reaped_ = true;
    exit_status_ = status;
}

void WorkerProcess::stop_forwarders() {
    if (stdout_forwarder_) {
        stdout_forwarder_->stop();
    }
    if (stderr_forwarder_) {
        stderr_forwarder_->stop();
    }
}

std::string WorkerProcess::exit_description() const {
    if (!reaped_) {
        return "";
    }
    if (WIFEXITED(exit_status_)) {
        return "exit code " + std::to_string(WEXITSTATUS(exit_status_));
    }
    if (WIFSIGNALED(exit_status_)) {
        return "signal " + std::to_string(WTERMSIG(exit_status_));
    }
    return "unknown status " + std::to_string(exit_status_);
}

}  // namespace worker
}  // namespace pulse
