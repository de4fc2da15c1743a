#pragma once

#include <stdexcept>
#include <vector>

#include <loadscaler/core/refresh/endpoint_report.hpp>
#include <loadscaler/core/snapshot/load_snapshot.hpp>

namespace LoadScaler {

class ReductionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Reduces raw member reports to a single LoadSnapshot.
 * collected_at_ms is stamped by the caller.
 */
class LoadReducer {
public:
    virtual ~LoadReducer() = default;
    virtual LoadSnapshot reduce(const std::vector<EndpointReport>& reports) const = 0;
};

/**
 * Load = KV-cache blocks in use per worker.
 *
 * load_avg is the mean of kv_active_blocks over all reports, load_std its
 * population standard deviation.
 */
class KvLoadReducer final : public LoadReducer {
public:
    LoadSnapshot reduce(const std::vector<EndpointReport>& reports) const override;
};

} // namespace LoadScaler
