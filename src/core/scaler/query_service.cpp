#include <loadscaler/core/scaler/query_service.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <optional>

using namespace LoadScaler;

namespace {

constexpr const char* kStreamIsActiveUnsupported =
    "StreamIsActive is not implemented for this external scaler. Use pull-based scaling instead.";

// Whole-string, finite, non-negative; anything else is "no override"
std::optional<double> parseThreshold(const std::string& text) {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text.front()))) {
        return std::nullopt;
    }
    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    if (!std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    return value;
}

} // namespace

QueryService::QueryService(const AppConfig::ScalerConfig& config, const SnapshotReader& snapshots)
    : config_(config), snapshots_(snapshots) {
    // Keep declaration order for GetMetricSpec, drop duplicates
    std::vector<std::string> ordered;
    for (const auto& name : config_.metric_names) {
        if (supported_.insert(name).second) {
            ordered.push_back(name);
        }
    }
    config_.metric_names = std::move(ordered);

    spdlog::info("[QueryService] Serving {} metric(s), default threshold {} (metadata key '{}')",
                 config_.metric_names.size(), config_.default_threshold, config_.threshold_key);
}

bool QueryService::isSupportedMetric(const std::string& name) const {
    return supported_.count(name) > 0;
}

double QueryService::resolveThreshold(const ScaledObjectRef& ref) const {
    auto it = ref.scaler_metadata.find(config_.threshold_key);
    if (it == ref.scaler_metadata.end()) {
        return config_.default_threshold;
    }
    auto parsed = parseThreshold(it->second);
    if (!parsed) {
        spdlog::debug("[QueryService] Ignoring invalid {}='{}' for {}/{}, using default {}",
                      config_.threshold_key, it->second, ref.ns, ref.name, config_.default_threshold);
        return config_.default_threshold;
    }
    return *parsed;
}

QueryStatus QueryService::isActive(const ScaledObjectRef& ref, IsActiveResponse* response) const {
    spdlog::debug("[QueryService] IsActive check for {}/{} - always returning true to prevent scaling to zero",
                  ref.ns, ref.name);
    response->result = true;
    return QueryStatus::Ok();
}

QueryStatus QueryService::streamIsActive(const ScaledObjectRef& ref) const {
    spdlog::debug("[QueryService] StreamIsActive called for {}/{} but not implemented", ref.ns, ref.name);
    return QueryStatus::Unimplemented(kStreamIsActiveUnsupported);
}

QueryStatus QueryService::getMetricSpec(const ScaledObjectRef& ref, GetMetricSpecResponse* response) const {
    const double threshold = resolveThreshold(ref);
    spdlog::debug("[QueryService] Providing metric specs for scaled object: {}/{} with threshold: {}",
                  ref.ns, ref.name, threshold);

    response->metric_specs.clear();
    response->metric_specs.reserve(config_.metric_names.size());
    for (const auto& name : config_.metric_names) {
        response->metric_specs.push_back(MetricSpec{name, threshold});
    }
    return QueryStatus::Ok();
}

QueryStatus QueryService::getMetrics(const GetMetricsRequest& request, GetMetricsResponse* response) const {
    if (!isSupportedMetric(request.metric_name)) {
        return QueryStatus::InvalidArgument("Unknown metric: " + request.metric_name);
    }

    LoadSnapshot current;
    if (auto snapshot = snapshots_.read()) {
        current = *snapshot;
    } else {
        spdlog::debug("[QueryService] No metrics snapshot available, returning default metrics");
    }

    response->metric_values.clear();
    response->metric_values.push_back(MetricValue{request.metric_name, current.load_avg});
    return QueryStatus::Ok();
}

DispatchResult QueryService::dispatch(const ScalerCall& call) const {
    struct Visitor {
        const QueryService& service;

        DispatchResult operator()(const IsActiveCall& c) const {
            IsActiveResponse response;
            auto status = service.isActive(c.ref, &response);
            return {ScalerOperation::IS_ACTIVE, status, response};
        }
        DispatchResult operator()(const StreamIsActiveCall& c) const {
            return {ScalerOperation::STREAM_IS_ACTIVE, service.streamIsActive(c.ref), std::monostate{}};
        }
        DispatchResult operator()(const GetMetricSpecCall& c) const {
            GetMetricSpecResponse response;
            auto status = service.getMetricSpec(c.ref, &response);
            return {ScalerOperation::GET_METRIC_SPEC, status, std::move(response)};
        }
        DispatchResult operator()(const GetMetricsCall& c) const {
            GetMetricsResponse response;
            auto status = service.getMetrics(c.request, &response);
            if (!status.ok()) {
                return {ScalerOperation::GET_METRICS, status, std::monostate{}};
            }
            return {ScalerOperation::GET_METRICS, status, std::move(response)};
        }
    };
    return std::visit(Visitor{*this}, call);
}

namespace LoadScaler {

const char* toString(ScalerOperation op) {
    switch (op) {
        case ScalerOperation::IS_ACTIVE:         return "IsActive";
        case ScalerOperation::STREAM_IS_ACTIVE:  return "StreamIsActive";
        case ScalerOperation::GET_METRIC_SPEC:   return "GetMetricSpec";
        case ScalerOperation::GET_METRICS:       return "GetMetrics";
        default:                                 return "Unknown";
    }
}

const char* toString(StatusCode code) {
    switch (code) {
        case StatusCode::OK:                return "OK";
        case StatusCode::INVALID_ARGUMENT:  return "INVALID_ARGUMENT";
        case StatusCode::UNIMPLEMENTED:     return "UNIMPLEMENTED";
        default:                            return "UNKNOWN";
    }
}

} // namespace LoadScaler
