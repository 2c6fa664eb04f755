#include "DateTime.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace monitor
{

namespace
{
std::string format_tm(const std::tm& tm, const char* fmt)
{
    std::ostringstream ss;
    ss << std::put_time(&tm, fmt);
    return ss.str();
}

std::tm to_utc_tm(Clock::time_point tp)
{
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    return tm_buf;
}

bool read_two_digits(const std::string& s, std::size_t pos, int& out)
{
    if (pos + 2 > s.size() || !std::isdigit(static_cast<unsigned char>(s[pos])) ||
        !std::isdigit(static_cast<unsigned char>(s[pos + 1])))
        return false;
    out = (s[pos] - '0') * 10 + (s[pos + 1] - '0');
    return true;
}
} // namespace

std::optional<Clock::time_point> parse_iso8601(const std::string& text)
{
    if (text.size() < 19)
        return std::nullopt;

    std::string head = text.substr(0, 19);
    if (head[10] == ' ')
        head[10] = 'T';

    std::tm tm_buf{};
    std::istringstream ss(head);
    ss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail())
        return std::nullopt;

    std::size_t pos = 19;
    if (pos < text.size() && text[pos] == '.')
    {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
            ++pos;
    }

    long offset_seconds = 0;
    if (pos < text.size())
    {
        char sign = text[pos];
        if (sign == 'Z' || sign == 'z')
        {
            ++pos;
        }
        else if (sign == '+' || sign == '-')
        {
            int hours = 0;
            int minutes = 0;
            if (!read_two_digits(text, pos + 1, hours))
                return std::nullopt;
            std::size_t min_pos = pos + 3;
            if (min_pos < text.size() && text[min_pos] == ':')
                ++min_pos;
            if (!read_two_digits(text, min_pos, minutes))
                return std::nullopt;
            offset_seconds = (hours * 3600L + minutes * 60L) * (sign == '-' ? -1 : 1);
            pos = min_pos + 2;
        }
        if (pos != text.size())
            return std::nullopt;
    }

    std::time_t t = timegm(&tm_buf);
    if (t == static_cast<std::time_t>(-1))
        return std::nullopt;

    return Clock::from_time_t(t - offset_seconds);
}

std::string format_iso8601_utc(Clock::time_point tp)
{
    return format_tm(to_utc_tm(tp), "%Y-%m-%dT%H:%M:%S") + "+00:00";
}

std::string format_datetime_utc(Clock::time_point tp)
{
    return format_tm(to_utc_tm(tp), "%Y-%m-%d %H:%M:%S");
}

std::string local_timestamp_iso()
{
    std::time_t t = Clock::to_time_t(Clock::now());
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    return format_tm(tm_buf, "%Y-%m-%dT%H:%M:%S");
}

} // namespace monitor
