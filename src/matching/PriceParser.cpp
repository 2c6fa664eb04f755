#include "PriceParser.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <string_view>
#include <system_error>

namespace matching
{

namespace
{

constexpr char kNbspLead = '\xC2';
constexpr char kNbspTrail = '\xA0';

bool is_nbsp_at(std::string_view s, std::size_t i)
{
    return i + 1 < s.size() && s[i] == kNbspLead && s[i + 1] == kNbspTrail;
}

bool all_digits(std::string_view s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](char c)
                                     {
                                         return c >= '0' && c <= '9';
                                     });
}

std::string_view trim(std::string_view s)
{
    while (!s.empty())
    {
        if (std::isspace(static_cast<unsigned char>(s.front())))
            s.remove_prefix(1);
        else if (is_nbsp_at(s, 0))
            s.remove_prefix(2);
        else
            break;
    }
    while (!s.empty())
    {
        if (std::isspace(static_cast<unsigned char>(s.back())))
            s.remove_suffix(1);
        else if (s.size() >= 2 && is_nbsp_at(s, s.size() - 2))
            s.remove_suffix(2);
        else
            break;
    }
    return s;
}

// Drops '.', ',', ASCII whitespace and U+00A0
std::string strip_separators(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i)
    {
        char c = s[i];
        if (c == '.' || c == ',' || std::isspace(static_cast<unsigned char>(c)))
            continue;
        if (is_nbsp_at(s, i))
        {
            ++i;
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::optional<double> to_double(const std::string& number)
{
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), value);
    if (ec != std::errc() || ptr != number.data() + number.size())
        return std::nullopt;
    return value;
}

// Position of the decimal separator, or npos when the string has no decimal part
std::size_t find_decimal_separator(std::string_view s)
{
    const std::size_t last_dot = s.rfind('.');
    const std::size_t last_comma = s.rfind(',');

    std::size_t candidate = std::string_view::npos;
    if (last_dot != std::string_view::npos && (last_comma == std::string_view::npos || last_dot > last_comma))
        candidate = last_dot;
    else if (last_comma != std::string_view::npos)
        candidate = last_comma;

    // a leading separator never starts a fraction
    if (candidate == std::string_view::npos || candidate == 0)
        return std::string_view::npos;

    std::string_view fraction = s.substr(candidate + 1);
    if (fraction.size() < 1 || fraction.size() > 2 || !all_digits(fraction))
        return std::string_view::npos;

    return candidate;
}

} // anonymous namespace

std::optional<double> parse_price_string(const std::string& price_str)
{
    std::string_view cleaned = trim(price_str);
    if (cleaned.empty())
        return std::nullopt;

    const std::size_t decimal_pos = find_decimal_separator(cleaned);
    if (decimal_pos != std::string_view::npos)
    {
        std::string int_part = strip_separators(cleaned.substr(0, decimal_pos));
        if (int_part.empty())
            int_part = "0";
        if (!all_digits(int_part))
            return std::nullopt;

        std::string number = int_part;
        number.push_back('.');
        number.append(cleaned.substr(decimal_pos + 1));
        return to_double(number);
    }

    std::string digits = strip_separators(cleaned);
    if (!all_digits(digits))
        return std::nullopt;
    return to_double(digits);
}

Currency detect_currency(const std::string& matched_text)
{
    struct CurrencyTokens
    {
        Currency currency;
        std::array<const char*, 4> tokens;
    };

    // checked in order; the first group with a hit wins
    static const std::array<CurrencyTokens, 2> groups = { {
        { Currency::Euro, { "€", "eur", "евро", nullptr } },
        { Currency::Dollar, { "$", "usd", "dollar", "доллар" } },
    } };

    const std::string lowered = to_lower_utf8(matched_text);
    for (const auto& group : groups)
    {
        for (const char* token : group.tokens)
        {
            if (token && lowered.find(token) != std::string::npos)
                return group.currency;
        }
    }
    return Currency::Unknown;
}

} // namespace matching
