#include "ConsoleNotificationSink.hpp"

#include <string>

namespace monitor
{

ConsoleNotificationSink::ConsoleNotificationSink(std::ostream& out)
    : out_(out)
{
}

bool ConsoleNotificationSink::send(const std::string& text, const matching::MatchResult&, const InboundMessage&)
{
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << std::string(70, '=') << "\n" << text << "\n" << std::string(70, '=') << std::endl;
    return out_.good();
}

} // namespace monitor
