#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace monitor
{

using Clock = std::chrono::system_clock;

struct InboundMessage
{
    std::int64_t id = 0;
    std::string text;
    std::optional<Clock::time_point> date; // UTC
    std::string channel_name;
    std::string chat_id;
    std::string link;
};

struct NotificationSettings
{
    bool enabled = true;
    bool include_link = true;
    bool include_keywords = true;
    int delay_ms = 500;                   // pause between notifications of one message
    std::size_t max_message_length = 500; // bytes of message text in a notification
};

struct MonitorSettings
{
    bool save_matches = true;
    std::string matches_file = "logs/matches.json";
    std::string log_file = "logs/monitor.log";
    int max_age_days = 0; // 0 disables the age filter
    NotificationSettings notifications;
};

struct ScanStats
{
    std::size_t messages_scanned = 0;
    std::size_t matches_found = 0;
    std::size_t messages_skipped_old = 0;
    std::size_t messages_no_text = 0;
    std::size_t messages_no_match = 0;

    ScanStats& operator+=(const ScanStats& other)
    {
        messages_scanned += other.messages_scanned;
        matches_found += other.matches_found;
        messages_skipped_old += other.messages_skipped_old;
        messages_no_text += other.messages_no_text;
        messages_no_match += other.messages_no_match;
        return *this;
    }
};

} // namespace monitor
