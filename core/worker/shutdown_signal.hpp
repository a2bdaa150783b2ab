#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace pulse {
namespace worker {

// One-shot latching wake-up shared by every sleeper in the supervisor.
// Once triggered it stays triggered; all current and future waits return
// immediately.
class ShutdownSignal {
public:
    ShutdownSignal() = default;

    ShutdownSignal(const ShutdownSignal &) = delete;
    ShutdownSignal &operator=(const ShutdownSignal &) = delete;

    void trigger();

    bool is_triggered() const;

    // Sleep for up to `duration`. Returns true if the signal fired (before or
    // during the wait), false if the full duration elapsed.
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool triggered_ = false;
};

}  // namespace worker
}  // namespace pulse
