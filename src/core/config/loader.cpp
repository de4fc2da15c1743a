#include <loadscaler/core/config/loader.hpp>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace {

YAML::Node requireNode(const YAML::Node& parent, const char* key, const std::string& path) {
    YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        throw std::runtime_error("Missing required config field: " + path);
    }
    return node;
}

template <typename T>
T readAs(const YAML::Node& node, const std::string& path) {
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion& e) {
        throw std::runtime_error("Invalid type for config field " + path + ": " + e.what());
    }
}

template <typename T>
T readRequired(const YAML::Node& parent, const char* key, const std::string& path) {
    return readAs<T>(requireNode(parent, key, path), path);
}

template <typename T>
T readOptional(const YAML::Node& parent, const char* key, const std::string& path, const T& fallback) {
    YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return fallback;
    }
    return readAs<T>(node, path);
}

std::vector<std::string> readStringList(const YAML::Node& parent, const char* key,
                                        const std::string& path,
                                        const std::vector<std::string>& fallback) {
    YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return fallback;
    }
    if (!node.IsSequence()) {
        throw std::runtime_error("Invalid type for config field " + path + ": expected a list");
    }
    std::vector<std::string> out;
    out.reserve(node.size());
    for (const auto& item : node) {
        out.push_back(readAs<std::string>(item, path));
    }
    return out;
}

void loadMonitor(const YAML::Node& root, AppConfig::MonitorConfig& monitor) {
    YAML::Node node = requireNode(root, "monitor", "monitor");

    monitor.component = readRequired<std::string>(node, "component", "monitor.component");
    monitor.endpoint = readRequired<std::string>(node, "endpoint", "monitor.endpoint");

    int64_t interval = readOptional<int64_t>(node, "refresh_interval_ms", "monitor.refresh_interval_ms",
                                             monitor.refresh_interval_ms);
    int64_t timeout = readOptional<int64_t>(node, "collect_timeout_ms", "monitor.collect_timeout_ms",
                                            monitor.collect_timeout_ms);
    if (interval <= 0 || interval > UINT32_MAX) {
        throw std::runtime_error("Invalid value for monitor.refresh_interval_ms: " + std::to_string(interval));
    }
    if (timeout <= 0 || timeout > UINT32_MAX) {
        throw std::runtime_error("Invalid value for monitor.collect_timeout_ms: " + std::to_string(timeout));
    }
    monitor.refresh_interval_ms = static_cast<uint32_t>(interval);
    monitor.collect_timeout_ms = static_cast<uint32_t>(timeout);

    if (monitor.component.empty() || monitor.endpoint.empty()) {
        throw std::runtime_error("Invalid value: monitor.component and monitor.endpoint must not be empty");
    }
    if (monitor.collect_timeout_ms >= monitor.refresh_interval_ms) {
        spdlog::warn("[Config] collect_timeout_ms ({}) >= refresh_interval_ms ({}), ticks may run back to back",
                     monitor.collect_timeout_ms, monitor.refresh_interval_ms);
    }

    monitor.members = readStringList(node, "members", "monitor.members", monitor.members);
}

void loadScaler(const YAML::Node& root, AppConfig::ScalerConfig& scaler) {
    YAML::Node node = root["scaler"];
    if (!node || node.IsNull()) {
        return;  // all defaults
    }

    scaler.default_threshold = readOptional<double>(node, "default_threshold", "scaler.default_threshold",
                                                    scaler.default_threshold);
    if (!std::isfinite(scaler.default_threshold) || scaler.default_threshold < 0.0) {
        throw std::runtime_error("Invalid value for scaler.default_threshold: " +
                                 std::to_string(scaler.default_threshold));
    }

    scaler.threshold_key = readOptional<std::string>(node, "threshold_key", "scaler.threshold_key",
                                                     scaler.threshold_key);
    if (scaler.threshold_key.empty()) {
        throw std::runtime_error("Invalid value: scaler.threshold_key must not be empty");
    }

    scaler.metric_names = readStringList(node, "metric_names", "scaler.metric_names", scaler.metric_names);
    if (scaler.metric_names.empty()) {
        throw std::runtime_error("Invalid value: scaler.metric_names must list at least one metric");
    }
    for (const auto& name : scaler.metric_names) {
        if (name.empty()) {
            throw std::runtime_error("Invalid value: scaler.metric_names contains an empty name");
        }
    }

    if (node["cache_ttl_sec"]) {
        spdlog::warn("[Config] scaler.cache_ttl_sec is no longer used; the last successful snapshot is served until the next one");
    }
}

void loadServer(const YAML::Node& root, AppConfig::ServerConfig& server) {
    YAML::Node node = requireNode(root, "server", "server");

    server.host = readOptional<std::string>(node, "host", "server.host", server.host);
    int64_t port = readRequired<int64_t>(node, "port", "server.port");
    if (port <= 0 || port > 65535) {
        throw std::runtime_error("Invalid value for server.port: " + std::to_string(port));
    }
    server.port = static_cast<uint16_t>(port);

    int64_t max_msg = readOptional<int64_t>(node, "max_message_size", "server.max_message_size",
                                            static_cast<int64_t>(server.max_message_size));
    if (max_msg <= 0) {
        throw std::runtime_error("Invalid value for server.max_message_size: " + std::to_string(max_msg));
    }
    server.max_message_size = static_cast<size_t>(max_msg);
}

void loadLogging(const YAML::Node& root, AppConfig::LoggingConfig& logging) {
    YAML::Node node = root["logging"];
    if (!node || node.IsNull()) {
        return;
    }
    logging.level = readOptional<std::string>(node, "level", "logging.level", logging.level);
    if (spdlog::level::from_str(logging.level) == spdlog::level::off && logging.level != "off") {
        throw std::runtime_error("Invalid value for logging.level: " + logging.level);
    }
}

} // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    std::ifstream probe(filepath);
    if (!probe.good()) {
        throw std::runtime_error("Config file not found: " + filepath);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config file " + filepath + ": " + e.what());
    }

    AppConfig::AppConfiguration config;
    config.app_name = readRequired<std::string>(root, "app_name", "app_name");
    config.version = readOptional<std::string>(root, "version", "version", "0.0.0");

    loadMonitor(root, config.monitor);
    loadScaler(root, config.scaler);
    loadServer(root, config.server);
    loadLogging(root, config.logging);

    spdlog::debug("[Config] Loaded {}: monitor={}/{} every {}ms, {} member(s), listen={}:{}",
                  filepath, config.monitor.component, config.monitor.endpoint,
                  config.monitor.refresh_interval_ms, config.monitor.members.size(),
                  config.server.host, config.server.port);
    return config;
}
