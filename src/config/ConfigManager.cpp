#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <filesystem>
#include <fstream>
#include <chrono>
#include <sstream>

namespace fs = std::filesystem;

static long long file_mtime_ms(const fs::path& p)
{
    std::error_code ec;
    auto tp = fs::last_write_time(p, ec);
    if (ec)
        return 0;
    auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        tp - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::milliseconds>(sctp.time_since_epoch()).count();
}

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
    last_mtime_ = file_mtime_ms(config_path_);
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path == path)
        {
            for (const auto& key : ownedKeys)
            {
                for (const auto& existingKey : handler.ownedKeys)
                {
                    if (key == existingKey)
                    {
                        last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
                        PLOG_ERROR << last_error_;
                        return false;
                    }
                }
            }
        }
    }

    handlers_.push_back({path, std::move(cb), std::move(ownedKeys)});
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        return apply(toml::table{});
    }

    try
    {
        bool ok = apply(toml::parse(ifs, config_path_));
        last_mtime_ = file_mtime_ms(config_path_);
        return ok;
    }
    catch (const toml::parse_error& pe)
    {
        reportParseError(pe, config_path_);
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& toml_text)
{
    last_error_.clear();
    try
    {
        return apply(toml::parse(toml_text));
    }
    catch (const toml::parse_error& pe)
    {
        reportParseError(pe, "<string>");
        return false;
    }
}

bool ConfigManager::reloadIfChanged()
{
    fs::path p(config_path_);
    auto mtime = file_mtime_ms(p);
    if (mtime == 0 || mtime == last_mtime_)
        return false;

    if (load())
    {
        PLOG_INFO << "Config reloaded from " << config_path_;
        return true;
    }
    else
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Failed to reload configuration",
                                            last_error_.empty() ? std::string("See logs for details") : last_error_);
        return false;
    }
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

bool ConfigManager::apply(toml::table parsed)
{
    root_ = std::make_unique<toml::table>(std::move(parsed));

    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(*root_, handler.path);
        if (section)
        {
            for (const auto& [key, value] : *section)
            {
                bool owned = false;
                for (const auto& ownedKey : handler.ownedKeys)
                {
                    if (key.str() == ownedKey)
                    {
                        owned = true;
                        break;
                    }
                }
                if (!owned && !value.is_table())
                {
                    PLOG_WARNING << "Unknown key '" << key.str() << "' in section '" << handler.path << "' ignored";
                }
            }
            handler.callbacks.load(*section);
        }
        else
        {
            toml::table empty;
            handler.callbacks.load(empty);
        }
    }
    return true;
}

void ConfigManager::reportParseError(const toml::parse_error& pe, const std::string& source)
{
    last_error_ = std::string("config parse error: ") + std::string(pe.description());
    PLOG_WARNING << last_error_;

    std::string error_details;
    if (pe.source().begin.line > 0)
    {
        error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
    }
    else
    {
        error_details = std::string(pe.description());
    }

    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Configuration file has errors. Using defaults for invalid entries.",
                                        error_details + "\nFile: " + source);
}

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path) const
{
    if (path.empty())
        return &root;

    std::istringstream ss(path);
    std::string segment;
    const toml::table* current = &root;

    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
        {
            PLOG_WARNING << "Invalid path segment (empty) in path: " << path;
            return nullptr;
        }

        auto it = current->find(segment);
        if (it == current->end())
            return nullptr;

        auto* tbl = it->second.as_table();
        if (!tbl)
        {
            PLOG_WARNING << "Path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }

        current = tbl;
    }

    return current;
}
