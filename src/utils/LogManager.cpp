#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

namespace utils
{

LogSettings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;
std::vector<std::function<void()>> LogManager::s_silencers;

void LogSettings::readGlobal(const toml::table& global)
{
    if (auto value = global["append_logs"].value<bool>())
        append = *value;
}

void LogSettings::readDebug(const toml::table& debug)
{
    auto value = debug["logging_level"].value<int64_t>();
    if (!value)
        return;

    if (*value < plog::none || *value > plog::verbose)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "logging_level out of range, keeping default",
                                     "[app.debug].logging_level = " + std::to_string(*value));
        return;
    }
    level = static_cast<plog::Severity>(*value);
}

void LogManager::Configure(const LogSettings& settings) { s_settings = settings; }

const LogSettings& LogManager::Settings() { return s_settings; }

bool LogManager::PrepareFile(const LogTarget& target)
{
    const std::filesystem::path path(target.file);

    std::error_code ec;
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Cannot create log directory for " + target.name,
                                   path.parent_path().string() + ": " + ec.message());
        return false;
    }

    if (!s_settings.append)
    {
        std::ofstream truncate(path, std::ios::trunc);
        if (!truncate)
        {
            ErrorReporter::ReportError(ErrorCategory::Initialization, "Cannot open log file for " + target.name,
                                       path.string());
            return false;
        }
    }
    return true;
}

void LogManager::Shutdown()
{
    for (const auto& silence : s_silencers)
        silence();
    s_silencers.clear();
}

} // namespace utils
