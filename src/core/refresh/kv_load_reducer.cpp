#include <loadscaler/core/refresh/load_reducer.hpp>

#include <cmath>
#include <string>

using namespace LoadScaler;

LoadSnapshot KvLoadReducer::reduce(const std::vector<EndpointReport>& reports) const {
    if (reports.empty()) {
        throw ReductionError("no endpoint reports to reduce");
    }

    double sum = 0.0;
    for (const auto& report : reports) {
        if (!std::isfinite(report.gpu_cache_usage_perc) ||
            !std::isfinite(report.gpu_prefix_cache_hit_rate)) {
            throw ReductionError("non-finite counter in report from " + report.endpoint_id);
        }
        if (report.kv_total_blocks > 0 && report.kv_active_blocks > report.kv_total_blocks) {
            throw ReductionError("kv_active_blocks exceeds kv_total_blocks for " + report.endpoint_id);
        }
        sum += static_cast<double>(report.kv_active_blocks);
    }

    const double n = static_cast<double>(reports.size());
    const double mean = sum / n;

    double variance = 0.0;
    for (const auto& report : reports) {
        double diff = static_cast<double>(report.kv_active_blocks) - mean;
        variance += diff * diff;
    }
    variance /= n;

    LoadSnapshot snapshot;
    snapshot.load_avg = mean;
    snapshot.load_std = std::sqrt(variance);
    snapshot.endpoint_count = reports.size();
    return snapshot;
}
