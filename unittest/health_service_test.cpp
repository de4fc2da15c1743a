// ============================================================================
// HEALTH SERVICE UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <loadscaler/microservice/health_service.hpp>

using namespace loadscaler::microservice;

TEST(HealthService, UnhealthyUntilReady) {
    HealthService health;
    EXPECT_TRUE(health.is_alive());
    EXPECT_FALSE(health.is_ready());
    EXPECT_EQ(health.get_health().status, HealthStatus::UNHEALTHY);
}

TEST(HealthService, DegradedBeforeFirstSnapshot) {
    HealthService health;
    health.set_ready(true);

    auto report = health.get_health();
    EXPECT_EQ(report.status, HealthStatus::DEGRADED);
    EXPECT_EQ(report.refresh_successes, 0u);
    EXPECT_EQ(report.last_success_ms, 0u);
}

TEST(HealthService, HealthyAfterSuccessfulRefresh) {
    HealthService health;
    health.set_ready(true);
    health.record_refresh_success(1234);

    auto report = health.get_health();
    EXPECT_EQ(report.status, HealthStatus::HEALTHY);
    EXPECT_EQ(report.message, "OK");
    EXPECT_EQ(report.last_success_ms, 1234u);
}

TEST(HealthService, FailuresDegradeUntilNextSuccess) {
    HealthService health;
    health.set_ready(true);
    health.record_refresh_success(10);
    health.record_refresh_failure();
    health.record_refresh_failure();

    auto report = health.get_health();
    EXPECT_EQ(report.status, HealthStatus::DEGRADED);
    EXPECT_EQ(report.consecutive_failures, 2u);
    EXPECT_EQ(report.refresh_failures, 2u);
    EXPECT_EQ(report.last_success_ms, 10u);
    // Readiness is unaffected by refresh outcomes
    EXPECT_TRUE(health.is_ready());

    health.record_refresh_success(20);
    report = health.get_health();
    EXPECT_EQ(report.status, HealthStatus::HEALTHY);
    EXPECT_EQ(report.consecutive_failures, 0u);
    EXPECT_EQ(report.refresh_failures, 2u);
    EXPECT_EQ(report.refresh_successes, 2u);
}

TEST(HealthService, ToString) {
    EXPECT_STREQ(HealthService::toString(HealthStatus::HEALTHY), "HEALTHY");
    EXPECT_STREQ(HealthService::toString(HealthStatus::DEGRADED), "DEGRADED");
    EXPECT_STREQ(HealthService::toString(HealthStatus::UNHEALTHY), "UNHEALTHY");
    EXPECT_STREQ(HealthService::toString(HealthStatus::UNKNOWN), "UNKNOWN");
}
