#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace monitor
{

struct MatchRecord
{
    std::string timestamp; // local time the match was recorded
    std::string product_name;
    std::vector<std::string> matched_keywords;
    std::optional<double> price;
    std::string currency;
    std::string channel_name;
    std::string message_text;
    std::string message_link;
    std::int64_t message_id = 0;
    std::string chat_id;
    std::optional<std::string> date; // message date, ISO-8601
};

// Stores matches as a pretty-printed JSON array, rewritten on every save
class MatchRepository
{
public:
    explicit MatchRepository(std::string path = "logs/matches.json");

    // Reads previously stored records; a missing file is an empty history
    bool load();
    bool save(MatchRecord record);

    std::vector<MatchRecord> records() const;
    const std::string& path() const { return path_; }

private:
    bool writeLocked() const;

    std::string path_;
    mutable std::mutex mutex_;
    std::vector<MatchRecord> records_;
};

} // namespace monitor
