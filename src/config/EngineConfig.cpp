#include "EngineConfig.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace labels
{

bool EngineConfig::registerWith(ConfigManager& config)
{
    TableCallbacks callbacks;
    callbacks.load = [this](const toml::table& section)
    {
        EngineConfig defaults;
        default_locale = section["default_locale"].value_or(defaults.default_locale);
        track_usage = section["track_usage"].value_or(defaults.track_usage);
        time_zone = section["time_zone"].value_or(defaults.time_zone);

        const int64_t key_length = section["key_max_length"].value_or(static_cast<int64_t>(defaults.key_max_length));
        if (key_length < static_cast<int64_t>(kMinKeyLength))
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "engine.key_max_length too small, using minimum",
                                                std::to_string(key_length) + " < " + std::to_string(kMinKeyLength));
            key_max_length = kMinKeyLength;
        }
        else
        {
            key_max_length = static_cast<std::size_t>(key_length);
        }

        const int64_t capacity =
            section["pattern_cache_capacity"].value_or(static_cast<int64_t>(defaults.pattern_cache_capacity));
        pattern_cache_capacity = capacity > 0 ? static_cast<std::size_t>(capacity) : defaults.pattern_cache_capacity;

        if (default_locale.empty())
            default_locale = defaults.default_locale;
        if (time_zone.empty())
            time_zone = defaults.time_zone;

        PLOG_DEBUG << "[EngineConfig] default_locale=" << default_locale << " key_max_length=" << key_max_length
                   << " pattern_cache_capacity=" << pattern_cache_capacity << " track_usage=" << track_usage
                   << " time_zone=" << time_zone;
    };

    return config.registerTable("engine", std::move(callbacks),
                                { "default_locale", "key_max_length", "pattern_cache_capacity", "track_usage",
                                  "time_zone" });
}

} // namespace labels
