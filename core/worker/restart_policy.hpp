#pragma once

#include <chrono>

namespace pulse {
namespace worker {

// Stateless backoff arithmetic for worker restarts.
//
// delay_for_attempt(n) = initial_delay * 2^(n-1) for attempt n >= 1.
// Growth is bounded in practice by max_restarts (default 3 -> largest delay
// is 4x the initial delay). The result saturates at milliseconds::max()
// instead of overflowing for pathological inputs.
namespace restart_policy {

std::chrono::milliseconds delay_for_attempt(int attempt, std::chrono::milliseconds initial_delay);

inline bool may_restart(int restart_count, int max_restarts) { return restart_count < max_restarts; }

}  // namespace restart_policy

}  // namespace worker
}  // namespace pulse
