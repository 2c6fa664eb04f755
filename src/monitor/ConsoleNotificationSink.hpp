#pragma once

#include "INotificationSink.hpp"

#include <mutex>
#include <ostream>

namespace monitor
{

// Writes notifications to a stream, separated by a rule line
class ConsoleNotificationSink : public INotificationSink
{
public:
    explicit ConsoleNotificationSink(std::ostream& out);

    bool send(const std::string& text, const matching::MatchResult& result, const InboundMessage& message) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace monitor
