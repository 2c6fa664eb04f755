#include "NotificationFormatter.hpp"

#include "DateTime.hpp"
#include "../matching/TextUtils.hpp"

#include <iomanip>
#include <sstream>

namespace monitor
{

NotificationFormatter::NotificationFormatter(NotificationSettings settings)
    : settings_(std::move(settings))
{
}

std::string NotificationFormatter::format(const matching::MatchResult& result, const InboundMessage& message) const
{
    std::ostringstream out;
    out << "Found: " << result.product_name << "\n\n";

    if (!message.channel_name.empty())
        out << "Channel: " << message.channel_name << "\n";

    if (message.date)
        out << "Posted: " << format_datetime_utc(*message.date) << "\n";

    if (settings_.include_keywords && !result.matched_keywords.empty())
    {
        out << "Keywords: ";
        for (std::size_t i = 0; i < result.matched_keywords.size(); ++i)
        {
            if (i > 0)
                out << ", ";
            out << result.matched_keywords[i];
        }
        out << "\n";
    }

    // A zero price carries no information
    if (result.price && *result.price != 0.0)
        out << "Price: " << formatPrice(*result.price, result.currency) << "\n";

    out << "\nMessage:\n" << truncateMessage(message.text);

    if (settings_.include_link && !message.link.empty())
        out << "\n\nLink: " << message.link;

    return out.str();
}

std::string NotificationFormatter::formatPrice(double value, matching::Currency currency)
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    if (currency == matching::Currency::Euro)
        ss << value << matching::currency_symbol(currency);
    else
        ss << matching::currency_symbol(currency) << value;
    return ss.str();
}

std::string NotificationFormatter::truncateMessage(const std::string& text) const
{
    if (text.size() <= settings_.max_message_length)
        return text;

    std::string out = text.substr(0, matching::utf8_prefix_length(text, settings_.max_message_length));
    out += "...";
    return out;
}

} // namespace monitor
