#pragma once

#include <cstddef>
#include <cstdint>

namespace LoadScaler {

/**
 * @struct LoadSnapshot
 * @brief Result of one fleet load reduction
 *
 * Built once by the refresh loop and never modified after publication.
 * A default-constructed snapshot is the "no load" answer served before the
 * first successful refresh.
 */
struct LoadSnapshot {
    double load_avg = 0.0;
    double load_std = 0.0;          // informational only
    size_t endpoint_count = 0;      // diagnostics only
    uint64_t collected_at_ms = 0;   // monotonic, 0 = never collected
};

} // namespace LoadScaler
