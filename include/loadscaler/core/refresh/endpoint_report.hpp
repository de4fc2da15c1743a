#pragma once

#include <cstdint>
#include <string>

namespace LoadScaler {

/**
 * @struct EndpointReport
 * @brief Raw forward-pass counters reported by one fleet member
 */
struct EndpointReport {
    std::string endpoint_id;

    uint64_t request_active_slots = 0;
    uint64_t request_total_slots = 0;
    uint64_t kv_active_blocks = 0;
    uint64_t kv_total_blocks = 0;
    uint64_t num_requests_waiting = 0;
    double gpu_cache_usage_perc = 0.0;
    double gpu_prefix_cache_hit_rate = 0.0;
};

} // namespace LoadScaler
