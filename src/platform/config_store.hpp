#ifndef PLATFORM_CONFIG_STORE_HPP
#define PLATFORM_CONFIG_STORE_HPP

#include "core/models.hpp"

#include <string>

struct ConfigLoadResult {
    bool success = false;
    std::string error;
    AppConfig config;
};

// JSON persistence of the wheel tree and settings. Loading validates the
// tree, so everything handed to the navigator is well-formed.
class ConfigStore {
public:
    static std::string default_path();
    static AppConfig default_config();

    static ConfigLoadResult load(const std::string& path);
    static ConfigLoadResult parse(const std::string& json);

    static bool save(const std::string& path, const AppConfig& config, std::string& error);
    static std::string serialize(const AppConfig& config);
};

#endif
