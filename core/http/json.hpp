#pragma once

#include <nlohmann/json.hpp>

#include "worker/worker_supervisor.hpp"

namespace pulse {
namespace http {

/**
 * @brief JSON encoding of supervisor state
 *
 * Optional fields (pid, uptime_ms) are encoded as null when absent so
 * clients can distinguish "no worker" from zero.
 */
nlohmann::json encode_supervisor_snapshot(const worker::WorkerSupervisor::SupervisorSnapshot &snap);

}  // namespace http
}  // namespace pulse
