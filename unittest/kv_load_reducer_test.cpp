// ============================================================================
// KV LOAD REDUCER UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <loadscaler/core/refresh/load_reducer.hpp>

using namespace LoadScaler;

namespace {

EndpointReport report(const std::string& id, uint64_t active, uint64_t total = 0) {
    EndpointReport r;
    r.endpoint_id = id;
    r.kv_active_blocks = active;
    r.kv_total_blocks = total;
    return r;
}

} // namespace

TEST(KvLoadReducer, EmptyInputIsAnError) {
    KvLoadReducer reducer;
    EXPECT_THROW(reducer.reduce({}), ReductionError);
}

TEST(KvLoadReducer, SingleEndpoint) {
    KvLoadReducer reducer;
    auto s = reducer.reduce({report("w0", 42, 100)});
    EXPECT_DOUBLE_EQ(s.load_avg, 42.0);
    EXPECT_DOUBLE_EQ(s.load_std, 0.0);
    EXPECT_EQ(s.endpoint_count, 1u);
}

TEST(KvLoadReducer, MeanAndPopulationStdDev) {
    KvLoadReducer reducer;
    // 2, 4, 4, 4, 5, 5, 7, 9 -> mean 5, population std 2
    std::vector<EndpointReport> reports;
    for (uint64_t v : {2, 4, 4, 4, 5, 5, 7, 9}) {
        reports.push_back(report("w" + std::to_string(reports.size()), v));
    }
    auto s = reducer.reduce(reports);
    EXPECT_DOUBLE_EQ(s.load_avg, 5.0);
    EXPECT_DOUBLE_EQ(s.load_std, 2.0);
    EXPECT_EQ(s.endpoint_count, 8u);
    EXPECT_EQ(s.collected_at_ms, 0u);  // stamped by the refresh loop
}

TEST(KvLoadReducer, ActiveAboveTotalIsMalformed) {
    KvLoadReducer reducer;
    EXPECT_THROW(reducer.reduce({report("w0", 10, 100), report("w1", 200, 100)}), ReductionError);
}

TEST(KvLoadReducer, UnknownTotalIsAccepted) {
    KvLoadReducer reducer;
    // kv_total_blocks == 0 means the worker did not report capacity
    auto s = reducer.reduce({report("w0", 10), report("w1", 30)});
    EXPECT_DOUBLE_EQ(s.load_avg, 20.0);
    EXPECT_DOUBLE_EQ(s.load_std, 10.0);
}

TEST(KvLoadReducer, NonFiniteGaugeIsMalformed) {
    KvLoadReducer reducer;
    auto r = report("w0", 1, 10);
    r.gpu_cache_usage_perc = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(reducer.reduce({r}), ReductionError);
}
