#include "MatchRepository.hpp"

#include "../utils/ErrorReporter.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;

namespace monitor
{

namespace
{
json to_json(const MatchRecord& record)
{
    json j;
    j["timestamp"] = record.timestamp;
    j["product_name"] = record.product_name;
    j["matched_keywords"] = record.matched_keywords;
    j["price"] = record.price ? json(*record.price) : json(nullptr);
    j["currency"] = record.currency;
    j["channel_name"] = record.channel_name;
    j["message_text"] = record.message_text;
    j["message_link"] = record.message_link;
    j["message_id"] = record.message_id;
    j["chat_id"] = record.chat_id;
    j["date"] = record.date ? json(*record.date) : json(nullptr);
    return j;
}

MatchRecord from_json(const json& j)
{
    MatchRecord record;
    record.timestamp = j.value("timestamp", "");
    record.product_name = j.value("product_name", "");
    if (j.contains("matched_keywords") && j["matched_keywords"].is_array())
        record.matched_keywords = j["matched_keywords"].get<std::vector<std::string>>();
    if (j.contains("price") && j["price"].is_number())
        record.price = j["price"].get<double>();
    record.currency = j.value("currency", "");
    record.channel_name = j.value("channel_name", "");
    record.message_text = j.value("message_text", "");
    record.message_link = j.value("message_link", "");
    if (j.contains("message_id") && j["message_id"].is_number_integer())
        record.message_id = j["message_id"].get<std::int64_t>();
    if (j.contains("chat_id"))
    {
        if (j["chat_id"].is_string())
            record.chat_id = j["chat_id"].get<std::string>();
        else if (j["chat_id"].is_number_integer())
            record.chat_id = std::to_string(j["chat_id"].get<std::int64_t>());
    }
    if (j.contains("date") && j["date"].is_string())
        record.date = j["date"].get<std::string>();
    return record;
}
} // namespace

MatchRepository::MatchRepository(std::string path)
    : path_(std::move(path))
{
}

bool MatchRepository::load()
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec))
    {
        records_.clear();
        return true;
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Storage, "Failed to read stored matches",
                                            "Path: " + path_);
        return false;
    }

    try
    {
        json doc = json::parse(file);
        if (!doc.is_array())
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Storage, "Stored matches are not a JSON array",
                                                "Path: " + path_);
            return false;
        }

        std::vector<MatchRecord> loaded;
        loaded.reserve(doc.size());
        for (const auto& item : doc)
        {
            if (item.is_object())
                loaded.push_back(from_json(item));
        }
        records_ = std::move(loaded);
        PLOG_INFO << "MatchRepository: loaded " << records_.size() << " matches from " << path_;
        return true;
    }
    catch (const json::exception& e)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Storage, "Failed to parse stored matches",
                                            "Path: " + path_ + " | Error: " + e.what());
        return false;
    }
}

bool MatchRepository::save(MatchRecord record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(std::move(record));
    return writeLocked();
}

std::vector<MatchRecord> MatchRepository::records() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

bool MatchRepository::writeLocked() const
{
    namespace fs = std::filesystem;

    std::error_code ec;
    auto parent_path = fs::path(path_).parent_path();
    if (!parent_path.empty())
    {
        fs::create_directories(parent_path, ec);
        if (ec)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Storage,
                                              "Failed to create directory for match file",
                                              "Path: " + parent_path.string() + " | Error: " + ec.message());
            return false;
        }
    }

    json doc = json::array();
    for (const auto& record : records_)
        doc.push_back(to_json(record));

    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc | std::ios::binary);
        if (!file.is_open())
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Storage, "Failed to write match file",
                                              "Path: " + tmp_path);
            return false;
        }

        // Invalid UTF-8 in message text is replaced rather than aborting the dump
        file << doc.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
        if (!file.good())
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Storage, "Error writing match file",
                                              "Path: " + tmp_path);
            return false;
        }
    }

    fs::rename(tmp_path, path_, ec);
    if (ec)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Storage, "Failed to replace match file",
                                          "Path: " + path_ + " | Error: " + ec.message());
        return false;
    }

    PLOG_DEBUG << "MatchRepository: saved match to " << path_;
    return true;
}

} // namespace monitor
