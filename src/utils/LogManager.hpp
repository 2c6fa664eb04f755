#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include <toml++/toml.h>

namespace utils
{

// Process-wide logging options taken from the configuration file
struct LogSettings
{
    bool append = true;
    plog::Severity level = plog::info;

    // [global] append_logs
    void readGlobal(const toml::table& global);

    // [app.debug] logging_level, plog severity 0-6
    void readDebug(const toml::table& debug);
};

// One plog instance writing to a rolling file
struct LogTarget
{
    std::string name;
    std::string file;
    bool echo_to_console = false;
    std::size_t max_file_bytes = 10 * 1024 * 1024;
    int max_files = 3;
};

class LogManager
{
public:
    static void Configure(const LogSettings& settings);
    [[nodiscard]] static const LogSettings& Settings();

    // Routes plog instance `Instance` to `target`; false if the file cannot be prepared
    template <int Instance>
    static bool Attach(const LogTarget& target);

    // Silences every attached instance. Appenders live until exit because
    // plog keeps raw pointers to them; attach each instance only once.
    static void Shutdown();

private:
    static bool PrepareFile(const LogTarget& target);

    static LogSettings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
    static std::vector<std::function<void()>> s_silencers;
};

template <int Instance>
bool LogManager::Attach(const LogTarget& target)
{
    if (!PrepareFile(target))
        return false;

    auto file = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
        target.file.c_str(), target.max_file_bytes, target.max_files);
    auto& logger = plog::init<Instance>(s_settings.level, file.get());
    logger.setMaxSeverity(s_settings.level);
    s_appenders.push_back(std::move(file));

    if (target.echo_to_console)
    {
        auto console = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
        logger.addAppender(console.get());
        s_appenders.push_back(std::move(console));
    }

    s_silencers.push_back(
        []
        {
            if (auto* instance = plog::get<Instance>())
                instance->setMaxSeverity(plog::none);
        });
    return true;
}

} // namespace utils
