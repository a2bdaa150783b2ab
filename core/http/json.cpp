#include "json.hpp"

namespace pulse {
namespace http {

nlohmann::json encode_supervisor_snapshot(const worker::WorkerSupervisor::SupervisorSnapshot &snap) {
    nlohmann::json j = {{"state", worker::lifecycle_state_to_string(snap.state)},
                        {"restart_count", snap.restart_count},
                        {"max_restarts", snap.max_restarts},
                        {"spawn_count", snap.spawn_count},
                        {"last_backoff_ms", snap.last_backoff_ms},
                        {"shutting_down", snap.shutting_down}};

    j["pid"] = snap.pid ? nlohmann::json(*snap.pid) : nlohmann::json(nullptr);
    j["uptime_ms"] = snap.uptime_ms ? nlohmann::json(*snap.uptime_ms) : nlohmann::json(nullptr);
    j["restarts_exhausted"] = snap.state == worker::LifecycleState::FAILED;
    return j;
}

}  // namespace http
}  // namespace pulse
