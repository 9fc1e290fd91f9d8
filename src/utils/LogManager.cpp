#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "Diagnostics.hpp"

#include <filesystem>
#include <fstream>
#include <set>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace utils
{

namespace
{

std::set<int> g_registered_instances;

template <int InstanceId>
void silenceLogger()
{
    if (auto logger = plog::get<InstanceId>())
    {
        logger->setMaxSeverity(plog::none);
    }
}

} // namespace

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
bool LogManager::s_console = false;
plog::Severity LogManager::s_default_level = plog::info;
std::string LogManager::s_log_directory = "logs";
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const std::string& config_path)
{
    if (s_initialized)
        return true;

    if (!ReadConfig(config_path))
        return false;

    PrepareLogDirectory();

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    // plog keeps raw appender pointers for the lifetime of the process, so an
    // instance is wired exactly once.
    if (!g_registered_instances.insert(InstanceId).second)
    {
        if (auto logger = plog::get<InstanceId>())
        {
            logger->setMaxSeverity(config.level_override.value_or(s_default_level));
        }
        return true;
    }

    try
    {
        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count);

        plog::Severity level = config.level_override.value_or(s_default_level);

        plog::init<InstanceId>(level, file_appender.get());

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_appenders.push_back(std::move(file_appender));
        return true;
    }
    catch (const std::exception& ex)
    {
        g_registered_instances.erase(InstanceId);
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<Diagnostics::kLogInstance>(const LoggerConfig&);

void LogManager::Shutdown()
{
    // Appenders stay alive: plog cannot detach them, so loggers are muted instead.
    silenceLogger<0>();
    silenceLogger<Diagnostics::kLogInstance>();
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

bool LogManager::IsAppendMode() { return s_append_logs; }

bool LogManager::ConsoleEnabled() { return s_console; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

const std::string& LogManager::LogDirectory() { return s_log_directory; }

void LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    std::filesystem::create_directories(s_log_directory, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message());
    }
}

bool LogManager::ReadConfig(const std::string& config_path)
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return true;

    try
    {
        auto cfg = toml::parse_file(config_path);
        if (auto logging = cfg["logging"].as_table())
        {
            if (auto append = (*logging)["append_logs"].value<bool>())
            {
                s_append_logs = *append;
            }
            if (auto console = (*logging)["console"].value<bool>())
            {
                s_console = *console;
            }
            if (auto dir = (*logging)["directory"].value<std::string>())
            {
                if (!dir->empty())
                    s_log_directory = *dir;
            }
            if (auto level = (*logging)["level"].value<int64_t>())
            {
                int level_int = static_cast<int>(*level);
                if (level_int >= 0 && level_int <= 6)
                {
                    s_default_level = static_cast<plog::Severity>(level_int);
                }
            }
        }

        if (auto diagnostics = cfg["diagnostics"].as_table())
        {
            if (auto verbose = (*diagnostics)["verbose"].value<bool>())
            {
                Diagnostics::SetVerbose(*verbose);
            }
            if (auto trace = (*diagnostics)["trace"].as_array())
            {
                for (const auto& node : *trace)
                {
                    auto name = node.value<std::string>();
                    auto stage = name ? Diagnostics::ParseStage(*name) : std::nullopt;
                    if (!stage)
                    {
                        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unknown trace stage ignored",
                                                     name ? *name : std::string("<not a string>"));
                        continue;
                    }
                    Diagnostics::SetVerbose(*stage, true);
                }
            }
            if (auto preview = (*diagnostics)["max_preview"].value<int64_t>())
            {
                if (*preview > 0)
                    Diagnostics::SetMaxPreview(static_cast<std::size_t>(*preview));
            }
        }

        return true;
    }
    catch (const toml::parse_error& pe)
    {
        // Logging falls back to defaults; the config manager reports the details.
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Logging settings ignored, config has errors",
                                     std::string(pe.description()));
        return true;
    }
}

} // namespace utils
