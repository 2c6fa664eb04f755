#include "Application.hpp"

#include "../config/CatalogLoader.hpp"
#include "../config/ConfigManager.hpp"
#include "../matching/Diagnostics.hpp"
#include "../matching/ProductMatcher.hpp"
#include "../monitor/ConsoleNotificationSink.hpp"
#include "../monitor/MessageMonitor.hpp"
#include "../monitor/MessageReader.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"

#include <cstring>
#include <iostream>
#include <string>

#include <plog/Log.h>

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

int Application::run()
{
    switch (parseCommandLineArgs())
    {
    case ArgsResult::Help:
        printUsage(std::cout);
        return 0;
    case ArgsResult::Invalid:
        printUsage(std::cerr);
        return 1;
    case ArgsResult::Ok:
        break;
    }

    // Parsed before logging so the configured log file is used; errors stay queued
    const bool config_ok = initializeConfig();

    if (!initializeLogging())
    {
        std::cerr << "dealwatch: failed to initialize logging\n";
        summarizeErrors();
        return 1;
    }

    if (!config_ok)
    {
        std::cerr << "dealwatch: " << config_->lastError() << "\n";
        summarizeErrors();
        return 1;
    }

    if (!buildMonitor())
    {
        summarizeErrors();
        return 1;
    }

    int rc = history_path_ ? runHistory() : runStream(std::cin);
    if (summarizeErrors() != 0)
        rc = 1;
    return rc;
}

Application::ArgsResult Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        const char* arg = argv_[i];
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
        {
            return ArgsResult::Help;
        }
        else if (std::strcmp(arg, "--config") == 0)
        {
            if (i + 1 >= argc_)
            {
                std::cerr << "dealwatch: --config requires a path\n";
                return ArgsResult::Invalid;
            }
            config_path_ = argv_[++i];
        }
        else if (std::strcmp(arg, "--history") == 0)
        {
            if (i + 1 >= argc_)
            {
                std::cerr << "dealwatch: --history requires a file\n";
                return ArgsResult::Invalid;
            }
            history_path_ = argv_[++i];

            // Optional LIMIT right after the file
            if (i + 1 < argc_ && argv_[i + 1][0] != '-')
            {
                try
                {
                    long long limit = std::stoll(argv_[i + 1]);
                    if (limit < 0)
                    {
                        std::cerr << "dealwatch: history limit must not be negative\n";
                        return ArgsResult::Invalid;
                    }
                    history_limit_ = static_cast<std::size_t>(limit);
                    ++i;
                }
                catch (const std::exception&)
                {
                    std::cerr << "dealwatch: invalid history limit '" << argv_[i + 1] << "'\n";
                    return ArgsResult::Invalid;
                }
            }
        }
        else
        {
            std::cerr << "dealwatch: unknown argument '" << arg << "'\n";
            return ArgsResult::Invalid;
        }
    }
    return ArgsResult::Ok;
}

void Application::printUsage(std::ostream& out) const
{
    out << "Usage: dealwatch [--config PATH] [--history FILE [LIMIT]]\n"
           "\n"
           "  --config PATH          configuration file (default: config.toml)\n"
           "  --history FILE [LIMIT] scan the last LIMIT messages of FILE (default: 100, 0 = all)\n"
           "\n"
           "Without --history, messages are read from standard input, one per line.\n";
}

bool Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(config_path_);

    bool registered = config_->onSection("",
                                         [this](const toml::table& root)
                                         {
                                             CatalogLoader::deserialize(root, matcher_config_);
                                             CatalogLoader::deserializeMonitoring(root, settings_);
                                         });
    registered = config_->onSection("global", [this](const toml::table& t) { log_settings_.readGlobal(t); }) &&
                 registered;
    registered = config_->onSection("app.debug", [this](const toml::table& t) { log_settings_.readDebug(t); }) &&
                 registered;

    return registered && config_->load();
}

bool Application::initializeLogging()
{
    utils::LogManager::Configure(log_settings_);

    const bool main_ok = utils::LogManager::Attach<0>({ .name = "main",
                                                        .file = settings_.log_file,
                                                        .echo_to_console = true });
    const bool diagnostics_ok = utils::LogManager::Attach<matching::Diagnostics::kLogInstance>(
        { .name = "diagnostics", .file = "logs/matching.log" });

    matching::Diagnostics::SetVerbose(log_settings_.level >= plog::debug);

    if (!main_ok)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "Main log file is not writable",
                                          settings_.log_file);
        return false;
    }
    if (!diagnostics_ok)
        PLOG_WARNING << "Matching diagnostics will not be written to a file";
    return true;
}

bool Application::buildMonitor()
{
    matcher_ = std::make_shared<const matching::ProductMatcher>(matcher_config_);
    if (matcher_->productCount() == 0)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "No products configured",
                                          "File: " + config_path_);
        return false;
    }

    sink_ = std::make_unique<monitor::ConsoleNotificationSink>(std::cout);
    monitor_ = std::make_unique<monitor::MessageMonitor>(matcher_, settings_, *sink_);

    PLOG_INFO << "Monitoring " << matcher_->productCount() << " products";
    return true;
}

int Application::runHistory()
{
    PLOG_INFO << "Checking message history: " << *history_path_ << " (limit " << history_limit_ << ")";
    auto messages = monitor::MessageReader::readFile(*history_path_, history_limit_);
    if (messages.empty())
    {
        PLOG_WARNING << "No messages to scan in " << *history_path_;
    }
    monitor_->scanHistory(messages);
    return 0;
}

int Application::runStream(std::istream& in)
{
    PLOG_INFO << "Reading messages from standard input";

    monitor::ScanStats stats;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line))
    {
        ++line_number;
        if (config_->reloadIfChanged())
            applyReload();

        if (auto message = monitor::MessageReader::parseLine(line, line_number))
            monitor_->processMessage(*message, &stats);
    }

    monitor::log_scan_stats("Input closed", stats);
    return 0;
}

void Application::applyReload()
{
    auto matcher = std::make_shared<const matching::ProductMatcher>(matcher_config_);
    if (matcher->productCount() == 0)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Reloaded configuration has no products, keeping previous catalog",
                                            "File: " + config_path_);
        return;
    }

    matcher_ = std::move(matcher);
    monitor_->reconfigure(matcher_, settings_);
    PLOG_INFO << "Catalog reloaded: " << matcher_->productCount() << " products";
}

int Application::summarizeErrors() const
{
    const utils::ErrorTally tally = utils::ErrorReporter::Tally();
    if (tally.warnings + tally.errors + tally.fatals > 0)
    {
        PLOG_INFO << "Run finished with " << tally.warnings << " warning(s), " << tally.errors << " error(s)"
                  << (tally.hasFatal() ? " and a fatal error" : "");
    }
    return tally.hasFatal() ? 1 : 0;
}

void Application::cleanup()
{
    monitor_.reset();
    sink_.reset();
    matcher_.reset();
    utils::LogManager::Shutdown();
}
