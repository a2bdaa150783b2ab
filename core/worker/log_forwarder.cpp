#include "log_forwarder.hpp"

#include <errno.h>
#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <cstring>

namespace pulse {
namespace worker {

namespace {
constexpr int kPollTimeoutMs = 100;
constexpr size_t kReadChunk = 4096;
}  // namespace

LogForwarder::LogForwarder(std::string tag, int fd, logging::Level level)
    : tag_(std::move(tag)), fd_(fd), level_(level) {}

LogForwarder::~LogForwarder() {
    stop();
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

void LogForwarder::start() {
    if (running_.load() || fd_ < 0) {
        return;
    }
    running_.store(true);
    thread_ = std::thread(&LogForwarder::read_loop, this);
}

void LogForwarder::stop() {
    stop_requested_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void LogForwarder::emit(const std::string &line) {
    // Strip CR from CRLF-terminated output
    if (!line.empty() && line.back() == '\r') {
        LOG_INTERNAL(level_, "[" << tag_ << "] " << line.substr(0, line.size() - 1));
    } else {
        LOG_INTERNAL(level_, "[" << tag_ << "] " << line);
    }
    lines_forwarded_.fetch_add(1);
}

void LogForwarder::read_loop() {
    std::string pending;
    char buf[kReadChunk];
    bool draining = false;
    std::chrono::steady_clock::time_point drain_deadline;

    while (true) {
        if (stop_requested_.load()) {
            if (!draining) {
                draining = true;
                drain_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kStopDrainMs);
            } else if (std::chrono::steady_clock::now() >= drain_deadline) {
                LOG_WARN("[" << tag_ << "] pipe still busy after " << kStopDrainMs << "ms, abandoning it");
                break;
            }
        }

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int result = poll(&pfd, 1, kPollTimeoutMs);
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("[" << tag_ << "] poll failed: " << std::strerror(errno));
            break;
        }
        if (result == 0) {
            // Nothing buffered: only leave when the owner asked us to
            if (stop_requested_.load()) {
                break;
            }
            continue;
        }

        ssize_t n = read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            LOG_WARN("[" << tag_ << "] read failed: " << std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;  // EOF: writer closed the pipe
        }

        pending.append(buf, static_cast<size_t>(n));

        size_t start = 0;
        size_t newline;
        while ((newline = pending.find('\n', start)) != std::string::npos) {
            emit(pending.substr(start, newline - start));
            start = newline + 1;
        }
        pending.erase(0, start);

        if (pending.size() >= kMaxLineLength) {
            emit(pending);
            pending.clear();
        }
    }

    if (!pending.empty()) {
        emit(pending);
    }

    close(fd_);
    fd_ = -1;
    running_.store(false);
}

}  // namespace worker
}  // namespace pulse
