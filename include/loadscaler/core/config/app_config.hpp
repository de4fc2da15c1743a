#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace AppConfig {

struct MonitorConfig {
    std::string component = "llm-worker";
    std::string endpoint = "load_metrics";
    uint32_t refresh_interval_ms = 5000;
    uint32_t collect_timeout_ms = 300;
    std::vector<std::string> members;   // base URLs of fleet members
};

struct ScalerConfig {
    double default_threshold = 0.7;
    std::string threshold_key = "loadAvgThreshold";
    std::vector<std::string> metric_names{"llm_load_avg"};
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 9090;
    size_t max_message_size = 4 * 1024 * 1024;  // 4MB
};

struct LoggingConfig {
    std::string level = "info";
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    MonitorConfig monitor;
    ScalerConfig scaler;
    ServerConfig server;
    LoggingConfig logging;
};

} // namespace AppConfig
