#include "MessageMonitor.hpp"

#include "DateTime.hpp"
#include "../matching/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <chrono>
#include <thread>
#include <unordered_map>

#include <plog/Log.h>

namespace monitor
{

namespace
{
std::string join_keywords(const std::vector<std::string>& keywords)
{
    std::string out;
    for (const auto& keyword : keywords)
    {
        if (!out.empty())
            out += ", ";
        out += keyword;
    }
    return out;
}

std::string date_label(const InboundMessage& message)
{
    return message.date ? format_datetime_utc(*message.date) : std::string("unknown");
}
} // namespace

MessageMonitor::MessageMonitor(std::shared_ptr<const matching::ProductMatcher> matcher, MonitorSettings settings,
                               INotificationSink& sink)
    : matcher_(std::move(matcher))
    , settings_(std::move(settings))
    , formatter_(settings_.notifications)
    , sink_(sink)
    , repository_(std::make_unique<MatchRepository>(settings_.matches_file))
    , now_([] { return Clock::now(); })
{
    if (settings_.max_age_days > 0)
        PLOG_INFO << "Age filtering enabled: only messages from the past " << settings_.max_age_days
                  << " days are processed";
}

void MessageMonitor::reconfigure(std::shared_ptr<const matching::ProductMatcher> matcher, MonitorSettings settings)
{
    matcher_ = std::move(matcher);
    if (settings.matches_file != settings_.matches_file)
        repository_ = std::make_unique<MatchRepository>(settings.matches_file);
    settings_ = std::move(settings);
    formatter_ = NotificationFormatter(settings_.notifications);
}

bool MessageMonitor::isTooOld(const InboundMessage& message) const
{
    if (settings_.max_age_days <= 0 || !message.date)
        return false;

    const auto cutoff = now_() - std::chrono::hours(24) * settings_.max_age_days;
    return *message.date < cutoff;
}

std::size_t MessageMonitor::processMessage(const InboundMessage& message, ScanStats* stats)
{
    try
    {
        if (stats)
            ++stats->messages_scanned;

        if (isTooOld(message))
        {
            PLOG_DEBUG << "Msg #" << message.id << " (" << date_label(message) << ") skipped: too old";
            if (stats)
                ++stats->messages_skipped_old;
            return 0;
        }

        if (message.text.empty())
        {
            PLOG_DEBUG << "Msg #" << message.id << " (" << date_label(message) << ") skipped: no text";
            if (stats)
                ++stats->messages_no_text;
            return 0;
        }

        PLOG_INFO << "Msg #" << message.id << " (" << date_label(message)
                  << "): " << matching::Diagnostics::Preview(message.text);

        const auto results = matcher_->matchMessage(message.text);
        if (results.empty())
        {
            PLOG_INFO << "   no product matches";
            if (stats)
                ++stats->messages_no_match;
            return 0;
        }

        PLOG_INFO << "   found " << results.size() << " product match(es)";
        PLOG_DEBUG << "Full message content:\n" << message.text;

        for (std::size_t i = 0; i < results.size(); ++i)
        {
            const auto& result = results[i];
            PLOG_INFO << "   [" << (i + 1) << "/" << results.size() << "] " << result.product_name
                      << " (keywords: " << join_keywords(result.matched_keywords) << ")";
            if (result.price)
                PLOG_INFO << "       price: " << NotificationFormatter::formatPrice(*result.price, result.currency);

            const bool sent = notify(result, message);

            // Spacing between consecutive notifications of one message
            if (sent && i + 1 < results.size() && settings_.notifications.delay_ms > 0)
                std::this_thread::sleep_for(std::chrono::milliseconds(settings_.notifications.delay_ms));

            if (settings_.save_matches)
                persist(result, message);

            if (stats)
                ++stats->matches_found;
        }

        return results.size();
    }
    catch (const std::exception& e)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Unknown, "Error processing message",
                                          "Msg #" + std::to_string(message.id) + ": " + e.what());
        return 0;
    }
}

bool MessageMonitor::notify(const matching::MatchResult& result, const InboundMessage& message)
{
    if (!result.notify || !settings_.notifications.enabled)
        return false;

    if (!sink_.send(formatter_.format(result, message), result, message))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Notification, "Failed to deliver notification",
                                            "Product: " + result.product_name + " | Msg #" +
                                                std::to_string(message.id));
        return false;
    }

    PLOG_INFO << "       notification sent";
    return true;
}

void MessageMonitor::persist(const matching::MatchResult& result, const InboundMessage& message)
{
    MatchRecord record;
    record.timestamp = local_timestamp_iso();
    record.product_name = result.product_name;
    record.matched_keywords = result.matched_keywords;
    record.price = result.price;
    record.currency = matching::currency_symbol(result.currency);
    record.channel_name = message.channel_name;
    record.message_text = message.text;
    record.message_link = message.link;
    record.message_id = message.id;
    record.chat_id = message.chat_id;
    if (message.date)
        record.date = format_iso8601_utc(*message.date);

    if (!repository_->save(std::move(record)))
        PLOG_WARNING << "   match for " << result.product_name << " was not saved";
}

ScanStats MessageMonitor::scanHistory(const std::vector<InboundMessage>& messages)
{
    std::vector<std::string> channel_order;
    std::unordered_map<std::string, ScanStats> per_channel;

    for (const auto& message : messages)
    {
        const std::string channel = message.channel_name.empty() ? std::string("(unnamed)") : message.channel_name;
        auto it = per_channel.find(channel);
        if (it == per_channel.end())
        {
            channel_order.push_back(channel);
            it = per_channel.emplace(channel, ScanStats{}).first;
        }
        processMessage(message, &it->second);
    }

    ScanStats overall;
    for (const auto& channel : channel_order)
    {
        const auto& stats = per_channel[channel];
        log_scan_stats("Channel " + channel, stats);
        overall += stats;
    }

    log_scan_stats("History scan complete", overall);
    if (overall.matches_found > 0 && settings_.save_matches)
        PLOG_INFO << "Saved " << overall.matches_found << " match(es) to " << repository_->path();

    return overall;
}

void log_scan_stats(const std::string& title, const ScanStats& stats)
{
    PLOG_INFO << title;
    PLOG_INFO << "   scanned: " << stats.messages_scanned << " messages";
    PLOG_INFO << "   matches: " << stats.matches_found << " product match(es)";
    PLOG_INFO << "   skipped (too old): " << stats.messages_skipped_old;
    PLOG_INFO << "   skipped (no text): " << stats.messages_no_text;
    PLOG_INFO << "   no match: " << stats.messages_no_match;
}

} // namespace monitor
