#pragma once

#include <cstddef>
#include <string>

class ConfigManager;

namespace labels
{

// [engine] section of config.toml
struct EngineConfig
{
    std::string default_locale = "en";
    std::size_t key_max_length = 48;
    std::size_t pattern_cache_capacity = 4096;
    bool track_usage = true;
    std::string time_zone = "UTC";

    static constexpr std::size_t kMinKeyLength = 16;

    // Registers the [engine] loader; values are refreshed on every load().
    bool registerWith(ConfigManager& config);
};

} // namespace labels
