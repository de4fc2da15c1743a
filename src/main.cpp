#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>

#include <loadscaler/core/config/loader.hpp>
#include <loadscaler/core/ingest/http_scrape_source.hpp>
#include <loadscaler/core/refresh/load_reducer.hpp>
#include <loadscaler/core/refresh/refresh_loop.hpp>
#include <loadscaler/core/scaler/query_service.hpp>
#include <loadscaler/core/snapshot/snapshot_store.hpp>
#include <loadscaler/microservice/grpc_gateway.hpp>
#include <loadscaler/microservice/health_service.hpp>

using loadscaler::microservice::GrpcConfig;
using loadscaler::microservice::GrpcGateway;
using loadscaler::microservice::HealthService;
using loadscaler::microservice::HealthStatus;

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int) {
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("LoadScaler v1.0.0 starting...");
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    auto config = ConfigLoader::loadConfig(configPath);
    spdlog::set_level(spdlog::level::from_str(config.logging.level));
    return config;
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    // Order matters for destruction: readers/writers before the store
    std::unique_ptr<LoadScaler::SnapshotStore> store;
    std::unique_ptr<HealthService> health;
    std::unique_ptr<LoadScaler::HttpScrapeSource> source;
    std::unique_ptr<LoadScaler::KvLoadReducer> reducer;
    std::unique_ptr<LoadScaler::RefreshLoop> refreshLoop;
    std::unique_ptr<LoadScaler::QueryService> queries;
    std::unique_ptr<GrpcGateway> gateway;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config) {
    Components c;

    c.store = std::make_unique<LoadScaler::SnapshotStore>();
    c.health = std::make_unique<HealthService>();

    // Fleet collection
    if (config.monitor.members.empty()) {
        spdlog::warn("No fleet members configured, every refresh will fail and defaults will be served");
    }
    c.source = std::make_unique<LoadScaler::HttpScrapeSource>(config.monitor.members);
    c.reducer = std::make_unique<LoadScaler::KvLoadReducer>();

    LoadScaler::RefreshLoop::Dependencies deps;
    deps.source = c.source.get();
    deps.reducer = c.reducer.get();
    deps.store = c.store.get();
    deps.health = c.health.get();
    c.refreshLoop = std::make_unique<LoadScaler::RefreshLoop>(config.monitor, deps);

    // Scaler endpoint
    c.queries = std::make_unique<LoadScaler::QueryService>(config.scaler, *c.store);

    GrpcConfig grpcConfig;
    grpcConfig.host = config.server.host;
    grpcConfig.port = config.server.port;
    grpcConfig.max_message_size = config.server.max_message_size;
    c.gateway = std::make_unique<GrpcGateway>(grpcConfig, *c.queries);

    return c;
}

static bool startComponents(Components& c) {
    spdlog::info("Starting components...");

    c.refreshLoop->start();

    if (!c.gateway->start()) {
        spdlog::error("gRPC gateway failed to start on {}", c.gateway->get_address());
        return false;
    }
    c.health->set_ready(true);

    spdlog::info("All components started successfully");
    return true;
}

static void stopComponents(Components& c) {
    spdlog::info("=== SHUTDOWN SEQUENCE ===");

    // Stop in reverse order of start
    if (c.health) c.health->set_ready(false);
    if (c.gateway) c.gateway->stop();
    if (c.refreshLoop) c.refreshLoop->stop();

    if (c.health) {
        auto report = c.health->get_health();
        spdlog::info("Refresh totals: {} ok, {} failed", report.refresh_successes, report.refresh_failures);
    }

    spdlog::info("=== SHUTDOWN COMPLETE ===");
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    try {
        // Load configuration
        auto config = loadConfiguration(argc, argv);
        spdlog::info("Configuration loaded successfully ({} {})", config.app_name, config.version);

        // Initialize all components
        auto components = initializeComponents(config);

        // Start all components
        if (!startComponents(components)) {
            stopComponents(components);
            return EXIT_FAILURE;
        }

        spdlog::info("LoadScaler running. Press Ctrl+C to shutdown.");

        // Main loop
        auto lastStatus = HealthStatus{};
        while (g_running.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));

            auto report = components.health->get_health();
            if (report.status != lastStatus) {
                spdlog::info("Health: {} ({})", HealthService::toString(report.status), report.message);
                lastStatus = report.status;
            }
        }
        spdlog::info("Shutdown signal received");

        // Graceful shutdown
        stopComponents(components);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("LoadScaler terminated gracefully");
    return EXIT_SUCCESS;
}
