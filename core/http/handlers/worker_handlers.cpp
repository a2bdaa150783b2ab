#include <chrono>

#include "../../worker/worker_supervisor.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace pulse {
namespace http {

//=============================================================================
// GET /v0/worker/status
//=============================================================================
void HttpServer::handle_get_worker_status(const httplib::Request &, httplib::Response &res) {
    auto snap = supervisor_.snapshot();

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"worker", encode_supervisor_snapshot(snap)},
                               {"diagnostics", supervisor_.last_diagnostics()},
                               {"health_check_url", supervisor_.config().health_check_url}};

    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/worker/health
//=============================================================================
void HttpServer::handle_get_worker_health(const httplib::Request &, httplib::Response &res) {
    const auto start = std::chrono::steady_clock::now();
    const bool healthy = supervisor_.is_healthy();
    const auto elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();

    if (!healthy) {
        nlohmann::json response = make_error_response(StatusCode::UNAVAILABLE, "Worker is not healthy");
        response["healthy"] = false;
        response["check_ms"] = elapsed_ms;
        send_json(res, StatusCode::UNAVAILABLE, response);
        return;
    }

    nlohmann::json response = {
        {"status", make_status(StatusCode::OK)}, {"healthy", true}, {"check_ms", elapsed_ms}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace pulse
