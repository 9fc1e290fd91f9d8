#pragma once

#include <string>
#include <memory>
#include <functional>
#include <vector>

#include <toml++/toml.h>

// Load callback of one config section. Receives an empty table when the
// section is absent so owners fall back to their defaults.
struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // A missing file is not an error: every section gets its defaults.
    bool load();
    bool loadFromString(const std::string& toml_text);
    bool reloadIfChanged();

    const toml::table& root() const;
    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    bool apply(toml::table parsed);
    void reportParseError(const toml::parse_error& pe, const std::string& source);
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;
    long long last_mtime_ = 0;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
