#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

namespace pulse {
namespace worker {

// Outcome of a single liveness probe
struct ProbeResult {
    bool ready = false;
    int http_status = 0;        // 0 when no HTTP response was received
    nlohmann::json diagnostics;  // Parsed response body (free-form) when ready
    std::string error;           // Set when !ready
};

// Interface for the liveness probe to enable mocking
class IHealthProbe {
public:
    virtual ~IHealthProbe() = default;

    virtual ProbeResult probe(const std::string &url, std::chrono::milliseconds timeout) = 0;
};

}  // namespace worker
}  // namespace pulse
