#include "shutdown_signal.hpp"

namespace pulse {
namespace worker {

namespace {
// steady_clock::now() + milliseconds::max() overflows; longer waits are chunked
constexpr std::chrono::hours kMaxWaitChunk{24};
}  // namespace

void ShutdownSignal::trigger() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        triggered_ = true;
    }
    cv_.notify_all();
}

bool ShutdownSignal::is_triggered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return triggered_;
}

bool ShutdownSignal::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    auto remaining = duration;
    while (remaining.count() > 0) {
        auto chunk = remaining < kMaxWaitChunk ? remaining
                                               : std::chrono::duration_cast<std::chrono::milliseconds>(kMaxWaitChunk);
        if (cv_.wait_for(lock, chunk, [this] { return triggered_; })) {
            return true;
        }
        remaining -= chunk;
    }
    return triggered_;
}

}  // namespace worker
}  // namespace pulse
