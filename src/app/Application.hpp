#pragma once

#include "../matching/MatchingTypes.hpp"
#include "../monitor/MonitorTypes.hpp"
#include "../utils/LogManager.hpp"

#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <string>

class ConfigManager;

namespace matching
{
class ProductMatcher;
}

namespace monitor
{
class INotificationSink;
class MessageMonitor;
} // namespace monitor

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    // 0 on success, 1 on invalid arguments, configuration failure or a fatal error
    int run();

private:
    enum class ArgsResult
    {
        Ok,
        Help,
        Invalid
    };

    ArgsResult parseCommandLineArgs();
    void printUsage(std::ostream& out) const;

    bool initializeConfig();
    bool initializeLogging();
    bool buildMonitor();

    int runHistory();
    int runStream(std::istream& in);

    void applyReload();
    int summarizeErrors() const;
    void cleanup();

    int argc_;
    char** argv_;

    std::string config_path_ = "config.toml";
    std::optional<std::string> history_path_;
    std::size_t history_limit_ = 100;

    std::unique_ptr<ConfigManager> config_;
    matching::MatcherConfig matcher_config_;
    monitor::MonitorSettings settings_;
    utils::LogSettings log_settings_;

    std::shared_ptr<const matching::ProductMatcher> matcher_;
    std::unique_ptr<monitor::INotificationSink> sink_;
    std::unique_ptr<monitor::MessageMonitor> monitor_;
};
