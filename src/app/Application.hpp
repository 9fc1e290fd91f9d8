#pragma once

#include "config/EngineConfig.hpp"
#include "model/Label.hpp"
#include "pattern/Argument.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

class ConfigManager;

namespace labels
{
class InMemoryLabelStore;
class Renderer;
}

// labelkit command line tool: renders one label (or a raw pattern) against
// an in-memory store optionally seeded from a JSON label file.
class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    struct CliOptions
    {
        std::string config_path = "config.toml";
        std::optional<std::string> labels_path;
        std::string name_space = "default";
        std::string category = "general";
        std::string locale;
        std::optional<std::string> connector;
        std::optional<labels::InterfaceType> interface_type;
        std::optional<std::string> key;
        bool raw = false;
        bool export_labels = false;
        bool verbose = false;
        bool help = false;
        std::optional<std::string> text;
        std::vector<std::string> args;
    };

    bool parseCommandLineArgs(std::string& outError);
    bool initializeLogging();
    bool initializeConfig();
    bool loadLabels();
    int renderText();
    void printUsage() const;
    void cleanup();

    static pattern::Argument toArgument(const std::string& text);

    std::unique_ptr<ConfigManager> config_;
    labels::EngineConfig engine_config_;
    std::unique_ptr<labels::InMemoryLabelStore> store_;
    std::unique_ptr<labels::Renderer> renderer_;
    CliOptions options_;

    int argc_ = 0;
    char** argv_ = nullptr;
};
