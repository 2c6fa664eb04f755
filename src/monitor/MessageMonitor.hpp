#pragma once

#include "INotificationSink.hpp"
#include "MatchRepository.hpp"
#include "MonitorTypes.hpp"
#include "NotificationFormatter.hpp"
#include "../matching/ProductMatcher.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace monitor
{

/**
 * @brief Runs inbound messages through the product matcher and acts on results.
 *
 * For every message: count it, drop it when older than max_age_days or when it
 * has no text, match it, then notify and persist each result in catalog order.
 * A failure while handling one message is logged and never stops the caller.
 */
class MessageMonitor
{
public:
    using NowFn = std::function<Clock::time_point()>;

    MessageMonitor(std::shared_ptr<const matching::ProductMatcher> matcher, MonitorSettings settings,
                   INotificationSink& sink);

    // Returns the number of product matches; stats may be null
    std::size_t processMessage(const InboundMessage& message, ScanStats* stats = nullptr);

    // Per-channel and overall statistics are logged; the overall totals are returned
    ScanStats scanHistory(const std::vector<InboundMessage>& messages);

    // Swaps in a rebuilt matcher and settings after a configuration reload
    void reconfigure(std::shared_ptr<const matching::ProductMatcher> matcher, MonitorSettings settings);

    void setClock(NowFn now) { now_ = std::move(now); }

    const MonitorSettings& settings() const { return settings_; }
    const MatchRepository& repository() const { return *repository_; }

private:
    bool isTooOld(const InboundMessage& message) const;
    bool notify(const matching::MatchResult& result, const InboundMessage& message);
    void persist(const matching::MatchResult& result, const InboundMessage& message);

    std::shared_ptr<const matching::ProductMatcher> matcher_;
    MonitorSettings settings_;
    NotificationFormatter formatter_;
    INotificationSink& sink_;
    std::unique_ptr<MatchRepository> repository_;
    NowFn now_;
};

// Writes a statistics block to the main log
void log_scan_stats(const std::string& title, const ScanStats& stats);

} // namespace monitor
