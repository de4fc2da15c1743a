#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include <loadscaler/core/config/app_config.hpp>
#include <loadscaler/core/refresh/load_reducer.hpp>
#include <loadscaler/core/refresh/metrics_source.hpp>
#include <loadscaler/core/snapshot/snapshot_store.hpp>

namespace loadscaler::microservice {
class HealthService;
}

namespace LoadScaler {

/**
 * Refresh tick state machine:
 * IDLE -> COLLECTING -> REDUCING -> PUBLISHING -> IDLE
 */
enum class RefreshState : uint8_t {
    IDLE = 0,
    COLLECTING = 1,
    REDUCING = 2,
    PUBLISHING = 3
};

/**
 * Background task that keeps the SnapshotStore fed.
 *
 * A failed tick is logged and skipped; the previous snapshot stays in the
 * store. The loop only ends on stop().
 */
class RefreshLoop {
public:
    struct Dependencies {
        MetricsSource* source = nullptr;
        const LoadReducer* reducer = nullptr;
        SnapshotStore* store = nullptr;
        loadscaler::microservice::HealthService* health = nullptr;  // optional
    };

    RefreshLoop(const AppConfig::MonitorConfig& config, Dependencies deps);
    ~RefreshLoop() noexcept;

    RefreshLoop(const RefreshLoop&) = delete;
    RefreshLoop& operator=(const RefreshLoop&) = delete;

    /**
     * Runs the first tick immediately, then one per refresh interval
     */
    void start();
    void stop();
    bool isRunning() const { return running_.load(std::memory_order_acquire); }

    /**
     * One synchronous collect/reduce/publish cycle
     * @return true if a new snapshot was published
     */
    bool runOnce();

    RefreshState getState() const { return state_.load(std::memory_order_acquire); }
    static const char* toString(RefreshState state);

    uint64_t ticks() const { return ticks_.load(std::memory_order_relaxed); }
    uint64_t successes() const { return successes_.load(std::memory_order_relaxed); }
    uint64_t failures() const { return failures_.load(std::memory_order_relaxed); }

private:
    void loop();
    void setState(RefreshState next) { state_.store(next, std::memory_order_release); }
    void recordFailure(const char* stage, const char* reason);

    AppConfig::MonitorConfig config_;
    Dependencies deps_;

    std::atomic<RefreshState> state_{RefreshState::IDLE};
    std::atomic<bool> running_{false};
    std::thread worker_thread_;

    // For interruptible sleep during shutdown
    mutable std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;

    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> successes_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace LoadScaler
