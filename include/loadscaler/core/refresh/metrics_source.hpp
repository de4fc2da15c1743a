#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include <loadscaler/core/refresh/endpoint_report.hpp>

namespace LoadScaler {

/**
 * Thrown when no fleet member could be read (transport error, timeout, empty fleet)
 */
class CollectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Source of raw per-member load reports.
 *
 * Implementations must return (or throw) within `timeout`; a stuck member
 * must never hold the refresh loop past its budget.
 */
class MetricsSource {
public:
    virtual ~MetricsSource() = default;

    virtual std::vector<EndpointReport> collect(const std::string& component,
                                                const std::string& endpoint,
                                                std::chrono::milliseconds timeout) = 0;

    virtual const char* name() const = 0;
};

} // namespace LoadScaler
