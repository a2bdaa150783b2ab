#pragma once

#include <string>
#include <vector>

namespace pulse {
namespace worker {

struct WorkerConfig {
    std::string command = "python3";                                 // Resolved through PATH
    std::vector<std::string> args{"python_scripts/async_server.py"};  // Script path plus extra arguments

    int max_restarts = 3;                 // Cumulative restart budget for the supervisor lifetime
    int initial_restart_delay_ms = 2000;  // Backoff for restart attempt 1, doubled per attempt
    int poll_interval_ms = 5000;          // Liveness poll period of the monitoring loop

    std::string health_check_url = "http://127.0.0.1:8001/health";
    int health_check_timeout_ms = 30000;      // Per-probe connect/read timeout
    int health_check_max_retries = 12;        // Probes attempted by start() before giving up
    int health_check_retry_delay_ms = 30000;  // Fixed delay between startup probes

    // Continuous uptime after which restart_count is reset to zero.
    // 0 keeps the counter monotonic for the whole supervisor lifetime.
    int restart_count_reset_ms = 0;
};

}  // namespace worker
}  // namespace pulse
