#pragma once

#include "MonitorTypes.hpp"
#include "../matching/MatchingTypes.hpp"

#include <string>

namespace monitor
{

// Delivers a rendered notification. Returns false when delivery failed.
class INotificationSink
{
public:
    virtual ~INotificationSink() = default;
    virtual bool send(const std::string& text, const matching::MatchResult& result,
                      const InboundMessage& message) = 0;
};

} // namespace monitor
