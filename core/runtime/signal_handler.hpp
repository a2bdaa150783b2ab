#pragma once

#include <atomic>

namespace pulse {
namespace runtime {

// Latches SIGINT/SIGTERM into an atomic flag polled by the runtime loop
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Test hook: clear the latched flag
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace pulse
