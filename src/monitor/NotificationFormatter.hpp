#pragma once

#include "MonitorTypes.hpp"
#include "../matching/MatchingTypes.hpp"

#include <string>

namespace monitor
{

// Renders one product match as the text of a notification
class NotificationFormatter
{
public:
    explicit NotificationFormatter(NotificationSettings settings);

    [[nodiscard]] std::string format(const matching::MatchResult& result, const InboundMessage& message) const;

    // "12.50€" for euro, "$12.50" otherwise
    [[nodiscard]] static std::string formatPrice(double value, matching::Currency currency);

    [[nodiscard]] std::string truncateMessage(const std::string& text) const;

    const NotificationSettings& settings() const { return settings_; }

private:
    NotificationSettings settings_;
};

} // namespace monitor
