#pragma once
#include <loadscaler/core/config/app_config.hpp>
#include <string>

class ConfigLoader {
public:
    /**
     * @throws std::runtime_error on missing file, missing required field,
     *         wrong field type or invalid value
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
};
