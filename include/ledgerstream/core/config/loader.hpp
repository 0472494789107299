#pragma once
#include <ledgerstream/core/config/app_config.hpp>
#include <string>

/**
 * Reads the YAML application config. Throws std::runtime_error on a missing
 * file, a missing required field, a wrongly typed field or an out-of-range value.
 */
class ConfigLoader {
public:
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
};
