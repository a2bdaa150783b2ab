#include "restart_policy.hpp"

#include <limits>

namespace pulse {
namespace worker {
namespace restart_policy {

std::chrono::milliseconds delay_for_attempt(int attempt, std::chrono::milliseconds initial_delay) {
    using Rep = std::chrono::milliseconds::rep;

    if (attempt < 1 || initial_delay.count() <= 0) {
        return std::chrono::milliseconds(0);
    }

    const Rep max_rep = std::numeric_limits<Rep>::max();
    Rep delay = initial_delay.count();
    for (int i = 1; i < attempt; ++i) {
        if (delay > max_rep / 2) {
            return std::chrono::milliseconds::max();
        }
        delay *= 2;
    }
    return std::chrono::milliseconds(delay);
}

}  // namespace restart_policy
}  // namespace worker
}  // namespace pulse
