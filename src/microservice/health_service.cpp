/**
 * @file health_service.cpp
 * @brief Health service implementation
 */

#include <loadscaler/microservice/health_service.hpp>

namespace loadscaler::microservice {

HealthService::HealthService() = default;

bool HealthService::is_alive() const {
    return true;  // If we're running, we're alive
}

bool HealthService::is_ready() const {
    return ready_.load(std::memory_order_relaxed);
}

HealthResponse HealthService::get_health() const {
    HealthResponse response;
    response.refresh_successes = successes_.load(std::memory_order_relaxed);
    response.refresh_failures = failures_.load(std::memory_order_relaxed);
    response.consecutive_failures = consecutive_failures_.load(std::memory_order_relaxed);
    response.last_success_ms = last_success_ms_.load(std::memory_order_relaxed);

    if (!is_ready()) {
        response.status = HealthStatus::UNHEALTHY;
        response.message = "Service not ready";
    } else if (response.refresh_successes == 0) {
        response.status = HealthStatus::DEGRADED;
        response.message = "No load snapshot collected yet, serving defaults";
    } else if (response.consecutive_failures > 0) {
        response.status = HealthStatus::DEGRADED;
        response.message = "Last " + std::to_string(response.consecutive_failures) +
                           " refresh(es) failed, serving stale snapshot";
    } else {
        response.status = HealthStatus::HEALTHY;
        response.message = "OK";
    }

    return response;
}

void HealthService::set_ready(bool ready) {
    ready_.store(ready, std::memory_order_relaxed);
}

void HealthService::record_refresh_success(uint64_t timestamp_ms) {
    successes_.fetch_add(1, std::memory_order_relaxed);
    consecutive_failures_.store(0, std::memory_order_relaxed);
    last_success_ms_.store(timestamp_ms, std::memory_order_relaxed);
}

void HealthService::record_refresh_failure() {
    failures_.fetch_add(1, std::memory_order_relaxed);
    consecutive_failures_.fetch_add(1, std::memory_order_relaxed);
}

const char* HealthService::toString(HealthStatus status) {
    switch (status) {
        case HealthStatus::HEALTHY:    return "HEALTHY";
        case HealthStatus::DEGRADED:   return "DEGRADED";
        case HealthStatus::UNHEALTHY:  return "UNHEALTHY";
        case HealthStatus::UNKNOWN:
        default:                       return "UNKNOWN";
    }
}

} // namespace loadscaler::microservice
