/**
 * @file health_service.hpp
 * @brief Health check service for LoadScaler
 *
 * Tracks process readiness and the outcome of the most recent refresh tick
 * for liveness/readiness probes and the gRPC health service.
 */

#pragma once

#include <string>
#include <atomic>
#include <cstdint>

namespace loadscaler::microservice {

/**
 * @brief Health status enumeration
 */
enum class HealthStatus {
    UNKNOWN,
    HEALTHY,
    DEGRADED,
    UNHEALTHY
};

/**
 * @brief Health check response
 */
struct HealthResponse {
    HealthStatus status;
    std::string message;
    uint64_t refresh_successes;
    uint64_t refresh_failures;
    uint64_t consecutive_failures;
    uint64_t last_success_ms;   // 0 = never
};

/**
 * @brief Health service for LoadScaler
 *
 * A failing refresh loop degrades health but never readiness: the cached
 * snapshot keeps being served.
 */
class HealthService {
public:
    HealthService();
    ~HealthService() = default;

    /**
     * @brief Liveness check - is the process alive?
     */
    bool is_alive() const;

    /**
     * @brief Readiness check - is the scaler endpoint accepting queries?
     */
    bool is_ready() const;

    /**
     * @brief Get detailed health status
     */
    HealthResponse get_health() const;

    void set_ready(bool ready);

    /**
     * @brief Called by the refresh loop after a snapshot was published
     */
    void record_refresh_success(uint64_t timestamp_ms);

    /**
     * @brief Called by the refresh loop after a failed tick
     */
    void record_refresh_failure();

    static const char* toString(HealthStatus status);

private:
    std::atomic<bool> ready_{false};
    std::atomic<uint64_t> successes_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> consecutive_failures_{0};
    std::atomic<uint64_t> last_success_ms_{0};
};

} // namespace loadscaler::microservice
