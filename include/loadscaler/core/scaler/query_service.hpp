#pragma once

#include <string>
#include <unordered_set>

#include <loadscaler/core/config/app_config.hpp>
#include <loadscaler/core/scaler/scaler_types.hpp>
#include <loadscaler/core/snapshot/snapshot_store.hpp>

namespace LoadScaler {

/**
 * Server side of the external scaler protocol.
 *
 * Handlers only ever read the snapshot cache; they never trigger a fleet
 * scan and never fail because of one.
 */
class QueryService {
public:
    QueryService(const AppConfig::ScalerConfig& config, const SnapshotReader& snapshots);

    QueryService(const QueryService&) = delete;
    QueryService& operator=(const QueryService&) = delete;

    /**
     * Always active: the fleet must never be scaled to zero.
     */
    QueryStatus isActive(const ScaledObjectRef& ref, IsActiveResponse* response) const;

    /**
     * Push-based activity is not supported, always UNIMPLEMENTED.
     */
    QueryStatus streamIsActive(const ScaledObjectRef& ref) const;

    /**
     * One spec per supported metric; target from the per-object threshold
     * override, else the configured default.
     */
    QueryStatus getMetricSpec(const ScaledObjectRef& ref, GetMetricSpecResponse* response) const;

    /**
     * Current value of a supported metric. Before the first successful refresh
     * this is 0 ("no load"), never an error.
     */
    QueryStatus getMetrics(const GetMetricsRequest& request, GetMetricsResponse* response) const;

    /**
     * Routes a call to its handler (one handler per operation)
     */
    DispatchResult dispatch(const ScalerCall& call) const;

    bool isSupportedMetric(const std::string& name) const;
    double resolveThreshold(const ScaledObjectRef& ref) const;

private:
    AppConfig::ScalerConfig config_;
    std::unordered_set<std::string> supported_;
    const SnapshotReader& snapshots_;
};

} // namespace LoadScaler
