#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace fs = std::filesystem;

ConfigManager::ConfigManager(fs::path path)
    : path_(std::move(path))
{
}

bool ConfigManager::onSection(const std::string& section, SectionHandler handler)
{
    if (!handlers_.emplace(section, std::move(handler)).second)
    {
        last_error_ = "section '" + section + "' already has a handler";
        PLOG_ERROR << "ConfigManager: " << last_error_;
        return false;
    }
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();

    auto mtime = modifiedAt(path_);
    if (!mtime)
        return fail("configuration file not found: " + path_.string(), "File: " + path_.string());
    seen_mtime_ = mtime;

    toml::table parsed;
    try
    {
        parsed = toml::parse_file(path_.string());
    }
    catch (const toml::parse_error& err)
    {
        const auto line = err.source().begin.line;
        return fail("config parse error: " + std::string(err.description()),
                    path_.string() + (line > 0 ? ":" + std::to_string(line) : std::string()));
    }

    document_ = std::move(parsed);
    dispatch();
    PLOG_DEBUG << "ConfigManager: loaded " << path_.string() << " (" << handlers_.size() << " handlers)";
    return true;
}

bool ConfigManager::reloadIfChanged()
{
    auto mtime = modifiedAt(path_);
    if (!mtime || mtime == seen_mtime_)
        return false;

    if (!load())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration change ignored, keeping the previous settings",
                                            last_error_);
        return false;
    }

    PLOG_INFO << "Configuration reloaded from " << path_.string();
    return true;
}

bool ConfigManager::fail(std::string error, const std::string& details)
{
    last_error_ = std::move(error);
    utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, last_error_, details);
    return false;
}

void ConfigManager::dispatch() const
{
    static const toml::table empty;
    for (const auto& [section, handler] : handlers_)
    {
        const toml::table* table = findSection(document_, section);
        handler(table ? *table : empty);
    }
}

const toml::table* ConfigManager::findSection(const toml::table& root, std::string_view dotted)
{
    const toml::table* current = &root;
    while (!dotted.empty())
    {
        const auto dot = dotted.find('.');
        const std::string_view key = dotted.substr(0, dot);
        dotted = dot == std::string_view::npos ? std::string_view{} : dotted.substr(dot + 1);

        current = (*current)[key].as_table();
        if (!current)
            return nullptr;
    }
    return current;
}

std::optional<fs::file_time_type> ConfigManager::modifiedAt(const fs::path& path)
{
    std::error_code ec;
    auto mtime = fs::last_write_time(path, ec);
    if (ec)
        return std::nullopt;
    return mtime;
}
