#include <loadscaler/core/refresh/refresh_loop.hpp>
#include <loadscaler/core/utils/clock.hpp>
#include <loadscaler/microservice/health_service.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>

using namespace LoadScaler;

RefreshLoop::RefreshLoop(const AppConfig::MonitorConfig& config, Dependencies deps)
    : config_(config), deps_(deps) {
    if (!deps_.source || !deps_.reducer || !deps_.store) {
        throw std::invalid_argument("RefreshLoop requires a metrics source, a reducer and a snapshot store");
    }
    spdlog::info("[RefreshLoop] Initialized: source={}, subject={}/{}, interval={}ms, timeout={}ms",
                 deps_.source->name(), config_.component, config_.endpoint,
                 config_.refresh_interval_ms, config_.collect_timeout_ms);
}

RefreshLoop::~RefreshLoop() noexcept {
    stop();
}

void RefreshLoop::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    worker_thread_ = std::thread(&RefreshLoop::loop, this);
    spdlog::info("[RefreshLoop] Started (interval: {}ms)", config_.refresh_interval_ms);
}

void RefreshLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        running_.store(false, std::memory_order_release);
    }
    sleep_cv_.notify_all();  // Wake up sleeping thread immediately
    if (worker_thread_.joinable()) {
        worker_thread_.join();
        spdlog::info("[RefreshLoop] Stopped after {} ticks ({} ok, {} failed)",
                     ticks(), successes(), failures());
    }
}

void RefreshLoop::loop() {
    const auto interval = std::chrono::milliseconds(config_.refresh_interval_ms);

    while (running_.load(std::memory_order_acquire)) {
        runOnce();

        // Interruptible sleep: wait for the interval OR until stop() is called
        std::unique_lock<std::mutex> lock(sleep_mutex_);
        sleep_cv_.wait_for(lock, interval, [this]() {
            return !running_.load(std::memory_order_acquire);
        });
    }
}

bool RefreshLoop::runOnce() {
    ticks_.fetch_add(1, std::memory_order_relaxed);
    const auto timeout = std::chrono::milliseconds(config_.collect_timeout_ms);

    // COLLECTING
    setState(RefreshState::COLLECTING);
    std::vector<EndpointReport> reports;
    const auto started = std::chrono::steady_clock::now();
    try {
        reports = deps_.source->collect(config_.component, config_.endpoint, timeout);
    } catch (const std::exception& e) {
        recordFailure("collect", e.what());
        return false;
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (elapsed > timeout) {
        spdlog::warn("[RefreshLoop] Collection took {}ms, budget is {}ms",
                     elapsed.count(), timeout.count());
    }
    if (reports.empty()) {
        recordFailure("collect", "no endpoints reported");
        return false;
    }

    // REDUCING
    setState(RefreshState::REDUCING);
    LoadSnapshot snapshot;
    try {
        snapshot = deps_.reducer->reduce(reports);
    } catch (const std::exception& e) {
        recordFailure("reduce", e.what());
        return false;
    }
    snapshot.collected_at_ms = Clock::now_ms();

    // PUBLISHING
    setState(RefreshState::PUBLISHING);
    deps_.store->publish(snapshot);
    successes_.fetch_add(1, std::memory_order_relaxed);
    if (deps_.health) {
        deps_.health->record_refresh_success(snapshot.collected_at_ms);
    }
    spdlog::debug("[RefreshLoop] Updated snapshot: load_avg={:.4f}, load_std={:.4f}, endpoints={}",
                  snapshot.load_avg, snapshot.load_std, snapshot.endpoint_count);

    setState(RefreshState::IDLE);
    return true;
}

void RefreshLoop::recordFailure(const char* stage, const char* reason) {
    failures_.fetch_add(1, std::memory_order_relaxed);
    if (deps_.health) {
        deps_.health->record_refresh_failure();
    }
    // Keep serving the last successful snapshot
    spdlog::warn("[RefreshLoop] Failed to {} worker metrics: {}", stage, reason);
    setState(RefreshState::IDLE);
}

const char* RefreshLoop::toString(RefreshState state) {
    switch (state) {
        case RefreshState::IDLE:        return "IDLE";
        case RefreshState::COLLECTING:  return "COLLECTING";
        case RefreshState::REDUCING:    return "REDUCING";
        case RefreshState::PUBLISHING:  return "PUBLISHING";
        default:                        return "UNKNOWN";
    }
}
