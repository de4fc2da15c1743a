#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace LoadScaler {

// ============================================================================
// Scaler protocol messages (wire-independent)
// ============================================================================

struct ScaledObjectRef {
    std::string name;
    std::string ns;
    std::unordered_map<std::string, std::string> scaler_metadata;
};

struct GetMetricsRequest {
    ScaledObjectRef scaled_object;
    std::string metric_name;
};

struct MetricSpec {
    std::string metric_name;
    double target_size = 0.0;
};

struct MetricValue {
    std::string metric_name;
    double value = 0.0;
};

struct IsActiveResponse {
    bool result = false;
};

struct GetMetricSpecResponse {
    std::vector<MetricSpec> metric_specs;
};

struct GetMetricsResponse {
    std::vector<MetricValue> metric_values;
};

enum class StatusCode : uint8_t {
    OK = 0,
    INVALID_ARGUMENT = 1,
    UNIMPLEMENTED = 2
};

/**
 * Request-level outcome. Never used for internal refresh failures.
 */
struct QueryStatus {
    StatusCode code = StatusCode::OK;
    std::string message;

    static QueryStatus Ok() { return {}; }
    static QueryStatus InvalidArgument(std::string msg) { return {StatusCode::INVALID_ARGUMENT, std::move(msg)}; }
    static QueryStatus Unimplemented(std::string msg) { return {StatusCode::UNIMPLEMENTED, std::move(msg)}; }

    bool ok() const { return code == StatusCode::OK; }
};

// ============================================================================
// Closed operation set
// ============================================================================

enum class ScalerOperation : uint8_t {
    IS_ACTIVE = 0,
    STREAM_IS_ACTIVE = 1,
    GET_METRIC_SPEC = 2,
    GET_METRICS = 3
};

struct IsActiveCall { ScaledObjectRef ref; };
struct StreamIsActiveCall { ScaledObjectRef ref; };
struct GetMetricSpecCall { ScaledObjectRef ref; };
struct GetMetricsCall { GetMetricsRequest request; };

// Alternative index == ScalerOperation value
using ScalerCall = std::variant<IsActiveCall, StreamIsActiveCall, GetMetricSpecCall, GetMetricsCall>;
using ScalerReply = std::variant<std::monostate, IsActiveResponse, GetMetricSpecResponse, GetMetricsResponse>;

struct DispatchResult {
    ScalerOperation operation;
    QueryStatus status;
    ScalerReply reply;   // monostate unless status.ok()
};

inline ScalerOperation operationOf(const ScalerCall& call) {
    return static_cast<ScalerOperation>(call.index());
}

const char* toString(ScalerOperation op);
const char* toString(StatusCode code);

} // namespace LoadScaler
