#include "Application.hpp"

#include "config/ConfigManager.hpp"
#include "model/LabelErrors.hpp"
#include "render/Renderer.hpp"
#include "store/InMemoryLabelStore.hpp"
#include "store/LabelImporter.hpp"
#include "utils/Diagnostics.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <charconv>
#include <cstdint>
#include <iostream>
#include <system_error>

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

bool takeValue(int argc, char** argv, int& i, std::string& out)
{
    if (i + 1 >= argc)
        return false;
    out = argv[++i];
    return true;
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

int Application::run()
{
    std::string error;
    if (!parseCommandLineArgs(error))
    {
        std::cerr << "labelkit: " << error << "\n";
        printUsage();
        return kExitUsage;
    }
    if (options_.help)
    {
        printUsage();
        return kExitOk;
    }

    if (!initializeLogging() || !initializeConfig() || !loadLabels())
        return kExitFailure;

    if (options_.export_labels)
    {
        std::cout << labels::LabelImporter::serialize(labels::LabelImporter::exportAll(*store_)) << "\n";
        return kExitOk;
    }

    return renderText();
}

bool Application::parseCommandLineArgs(std::string& outError)
{
    bool options_done = false;
    for (int i = 1; i < argc_; ++i)
    {
        const std::string arg = argv_[i];
        if (!options_done && arg.size() > 1 && arg[0] == '-')
        {
            std::string value;
            if (arg == "--")
            {
                options_done = true;
                continue;
            }
            if (arg == "-h" || arg == "--help")
            {
                options_.help = true;
                continue;
            }
            if (arg == "--raw")
            {
                options_.raw = true;
                continue;
            }
            if (arg == "--export")
            {
                options_.export_labels = true;
                continue;
            }
            if (arg == "--verbose")
            {
                options_.verbose = true;
                continue;
            }

            if (!takeValue(argc_, argv_, i, value))
            {
                outError = "option " + arg + " needs a value";
                return false;
            }
            if (arg == "--config")
                options_.config_path = value;
            else if (arg == "--labels")
                options_.labels_path = value;
            else if (arg == "--ns")
                options_.name_space = value;
            else if (arg == "--category")
                options_.category = value;
            else if (arg == "--locale")
                options_.locale = value;
            else if (arg == "--connector")
                options_.connector = value;
            else if (arg == "--key")
                options_.key = value;
            else if (arg == "--interface")
            {
                options_.interface_type = labels::parseInterfaceType(value);
                if (!options_.interface_type)
                {
                    outError = "unknown interface '" + value + "' (expected text or voice)";
                    return false;
                }
            }
            else
            {
                outError = "unknown option " + arg;
                return false;
            }
            continue;
        }

        if (!options_.text)
            options_.text = arg;
        else
            options_.args.push_back(arg);
    }

    if (!options_.help && !options_.export_labels && !options_.text)
    {
        outError = "missing TEXT";
        return false;
    }
    return true;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(options_.config_path))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    const std::string& dir = utils::LogManager::LogDirectory();
    utils::LogManager::RegisterLogger<0>({ .name = "main",
                                           .filepath = dir + "/labelkit.log",
                                           .append_override = std::nullopt,
                                           .level_override = std::nullopt,
                                           .max_file_size = 10 * 1024 * 1024,
                                           .backup_count = 3,
                                           .add_console_appender = utils::LogManager::ConsoleEnabled() });

    utils::LogManager::RegisterLogger<utils::Diagnostics::kLogInstance>({ .name = "diagnostics",
                                                                          .filepath = dir + "/diagnostics.log",
                                                                          .append_override = std::nullopt,
                                                                          .level_override = std::nullopt,
                                                                          .max_file_size = 10 * 1024 * 1024,
                                                                          .backup_count = 3,
                                                                          .add_console_appender = false });

    if (options_.verbose)
        utils::Diagnostics::SetVerbose(true);
    return true;
}

bool Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(options_.config_path);
    engine_config_.registerWith(*config_);
    if (!config_->load())
    {
        // Parse errors were reported; continue on defaults.
        PLOG_WARNING << "Using default engine settings: " << config_->lastError();
    }

    store_ = std::make_unique<labels::InMemoryLabelStore>();
    renderer_ = std::make_unique<labels::Renderer>(*store_, nullptr, labels::Renderer::Options::from(engine_config_));
    PLOG_INFO << "labelkit ready (default locale " << engine_config_.default_locale << ")";
    return true;
}

bool Application::loadLabels()
{
    if (!options_.labels_path)
        return true;

    std::vector<labels::LabelRecord> records;
    std::string error;
    if (!labels::LabelImporter::parseFile(*options_.labels_path, records, error))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Could not load label file", error);
        std::cerr << "labelkit: " << error << "\n";
        return false;
    }

    try
    {
        labels::LabelImporter::merge(*store_, records);
    }
    catch (const labels::LabelError& e)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Store, "Could not import labels", e.what());
        std::cerr << "labelkit: " << e.what() << "\n";
        return false;
    }
    return true;
}

int Application::renderText()
{
    pattern::Arguments args;
    args.reserve(options_.args.size());
    for (const auto& value : options_.args)
        args.push_back(toArgument(value));

    try
    {
        if (options_.raw)
        {
            std::cout << renderer_->raw(*options_.text, options_.locale, args) << "\n";
            return kExitOk;
        }

        labels::LabelRequest request = options_.key
                                           ? labels::LabelRequest::withKey(options_.name_space, *options_.key,
                                                                           *options_.text)
                                           : labels::LabelRequest::text(options_.name_space, options_.category,
                                                                        *options_.text);
        labels::RequestContext context{ options_.locale, options_.connector, options_.interface_type };
        std::cout << renderer_->render(request, context, args) << "\n";
        return kExitOk;
    }
    catch (const labels::LabelError& e)
    {
        PLOG_ERROR << "Render failed: " << e.what();
        std::cerr << "labelkit: " << e.what() << "\n";
        return kExitFailure;
    }
}

pattern::Argument Application::toArgument(const std::string& text)
{
    const char* first = text.data();
    const char* last = text.data() + text.size();

    std::int64_t integer = 0;
    auto [int_end, int_ec] = std::from_chars(first, last, integer);
    if (int_ec == std::errc() && int_end == last)
        return pattern::Argument(integer);

    double number = 0.0;
    auto [dbl_end, dbl_ec] = std::from_chars(first, last, number);
    if (dbl_ec == std::errc() && dbl_end == last)
        return pattern::Argument(number);

    return pattern::Argument(text);
}

void Application::printUsage() const
{
    std::cout << "usage: labelkit [options] TEXT [ARG...]\n"
                 "       labelkit [--labels FILE] --export\n"
                 "\n"
                 "  --config FILE       configuration file (default config.toml)\n"
                 "  --labels FILE       seed the store from a JSON label file\n"
                 "  --ns NAME           label namespace (default 'default')\n"
                 "  --category NAME     label category (default 'general')\n"
                 "  --key KEY           explicit label key\n"
                 "  --locale TAG        request locale\n"
                 "  --connector NAME    request channel\n"
                 "  --interface MODE    text or voice\n"
                 "  --raw               format TEXT directly, without the store\n"
                 "  --export            print the store as JSON\n"
                 "  --verbose           write resolution traces to the diagnostics log\n"
                 "\n"
                 "Numeric ARG values are passed as numbers.\n";
}

void Application::cleanup()
{
    renderer_.reset();
    store_.reset();
    config_.reset();
    if (utils::LogManager::IsInitialized())
        utils::LogManager::Shutdown();
}
