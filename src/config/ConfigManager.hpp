#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <toml++/toml.h>

/**
 * @brief Owns the parsed configuration file and fans its sections out.
 *
 * Handlers subscribe to a dotted section path ("" for the whole document,
 * "app.debug" for a nested table). Every successful load() or reload calls
 * each handler once with its section, or with an empty table when the
 * section is absent, so handlers fall back to their defaults.
 */
class ConfigManager
{
public:
    using SectionHandler = std::function<void(const toml::table& section)>;

    explicit ConfigManager(std::filesystem::path path = "config.toml");

    // False if `section` already has a handler
    bool onSection(const std::string& section, SectionHandler handler);

    // False if the file is missing or malformed; handlers are not called then
    bool load();

    // Reloads when the modification time moved. A broken file keeps the
    // previous document and is not retried until it changes again.
    bool reloadIfChanged();

    [[nodiscard]] const toml::table& root() const noexcept { return document_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& lastError() const noexcept { return last_error_; }

private:
    bool fail(std::string error, const std::string& details);
    void dispatch() const;

    static const toml::table* findSection(const toml::table& root, std::string_view dotted);
    static std::optional<std::filesystem::file_time_type> modifiedAt(const std::filesystem::path& path);

    std::filesystem::path path_;
    toml::table document_;
    std::map<std::string, SectionHandler> handlers_;
    std::optional<std::filesystem::file_time_type> seen_mtime_;
    std::string last_error_;
};
