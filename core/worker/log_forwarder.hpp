#pragma once

#include <atomic>
#include <string>
#include <thread>

#include "logging/logger.hpp"

namespace pulse {
namespace worker {

// LogForwarder drains one output pipe of the worker into the logger.
//
// Each complete line is logged as "[<tag>] <line>" at the configured level.
// A trailing partial line is flushed when the pipe closes. The forwarder
// exits on EOF without notifying anybody; stop() is only needed when the
// owner wants to bound the wait after the writer has been killed.
class LogForwarder {
public:
    // Takes ownership of `fd`; it is closed when the reader thread exits.
    LogForwarder(std::string tag, int fd, logging::Level level);
    ~LogForwarder();

    LogForwarder(const LogForwarder &) = delete;
    LogForwarder &operator=(const LogForwarder &) = delete;

    void start();

    // Read whatever is still buffered in the pipe, then exit and join.
    // Gives up after kStopDrainMs if another process keeps writing.
    void stop();

    bool is_running() const { return running_.load(); }
    size_t lines_forwarded() const { return lines_forwarded_.load(); }
    const std::string &tag() const { return tag_; }

    static constexpr size_t kMaxLineLength = 64 * 1024;
    static constexpr int kStopDrainMs = 500;

private:
    void read_loop();
    void emit(const std::string &line);

    std::string tag_;
    int fd_;
    logging::Level level_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<size_t> lines_forwarded_{0};
};

}  // namespace worker
}  // namespace pulse
