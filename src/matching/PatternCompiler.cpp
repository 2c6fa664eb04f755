#include "PatternCompiler.hpp"

#include <cstdint>

#include <utf8proc.h>

namespace matching
{

namespace
{

constexpr char32_t kReplacementChar = 0xFFFD;

// ASCII character with the same classification as `c`, so the base traits
// can answer class queries for any code point.
wchar_t ascii_stand_in(wchar_t c)
{
    const auto cp = static_cast<std::uint32_t>(c);
    if (cp < 0x80)
        return c;

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LT:
        return L'A';
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
        return L'a';
    case UTF8PROC_CATEGORY_ND:
        return L'0';
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return L' ';
    case UTF8PROC_CATEGORY_PC:
    case UTF8PROC_CATEGORY_PD:
    case UTF8PROC_CATEGORY_PS:
    case UTF8PROC_CATEGORY_PE:
    case UTF8PROC_CATEGORY_PI:
    case UTF8PROC_CATEGORY_PF:
    case UTF8PROC_CATEGORY_PO:
    case UTF8PROC_CATEGORY_SM:
    case UTF8PROC_CATEGORY_SC:
    case UTF8PROC_CATEGORY_SK:
    case UTF8PROC_CATEGORY_SO:
        return L'!';
    default:
        // marks, formats, private use: classed like a control character
        return L'\x7F';
    }
}

void append_code_point(std::wstring& out, char32_t cp)
{
    if constexpr (sizeof(wchar_t) == 2)
    {
        if (cp > 0xFFFF)
        {
            cp -= 0x10000;
            out.push_back(static_cast<wchar_t>(0xD800 + (cp >> 10)));
            out.push_back(static_cast<wchar_t>(0xDC00 + (cp & 0x3FF)));
            return;
        }
    }
    out.push_back(static_cast<wchar_t>(cp));
}

} // anonymous namespace

wchar_t UnicodeRegexTraits::translate_nocase(wchar_t c) const
{
    return static_cast<wchar_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(c)));
}

bool UnicodeRegexTraits::isctype(wchar_t c, char_class_type f) const
{
    return std::regex_traits<wchar_t>::isctype(ascii_stand_in(c), f);
}

std::wstring to_code_points(const std::string& utf8)
{
    std::wstring out;
    out.reserve(utf8.size());

    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8.data());
    const auto len = static_cast<utf8proc_ssize_t>(utf8.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t cp = 0;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &cp);
        if (bytes <= 0)
        {
            append_code_point(out, kReplacementChar);
            ++pos;
            continue;
        }
        append_code_point(out, static_cast<char32_t>(cp));
        pos += bytes;
    }
    return out;
}

std::string to_utf8(const std::wstring& code_points)
{
    std::string out;
    out.reserve(code_points.size());

    for (std::size_t i = 0; i < code_points.size(); ++i)
    {
        auto cp = static_cast<std::uint32_t>(code_points[i]);
        if constexpr (sizeof(wchar_t) == 2)
        {
            if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < code_points.size())
            {
                const auto low = static_cast<std::uint32_t>(code_points[i + 1]);
                if (low >= 0xDC00 && low <= 0xDFFF)
                {
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    ++i;
                }
            }
        }

        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t written = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (written <= 0)
            written = utf8proc_encode_char(static_cast<utf8proc_int32_t>(kReplacementChar), buffer);
        out.append(reinterpret_cast<const char*>(buffer), static_cast<std::size_t>(written));
    }
    return out;
}

std::string escape_regex(const std::string& s)
{
    static const std::string special = R"(\.^$|()[]*+?{})";
    std::string out;
    out.reserve(s.size() * 2);
    for (char c : s)
    {
        if (special.find(c) != std::string::npos)
        {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::string whole_word_pattern(const std::string& pattern)
{
    return "\\b(?:" + pattern + ")\\b";
}

PatternResult compile_pattern(const std::string& pattern, bool case_insensitive)
{
    PatternResult result;

    auto flags = std::regex_constants::ECMAScript;
    if (case_insensitive)
    {
        flags |= std::regex_constants::icase;
    }

    try
    {
        result.regex.emplace(to_code_points(pattern), flags);
    }
    catch (const std::regex_error& ex)
    {
        result.regex.reset();
        result.error = PatternError::InvalidSyntax;
        result.message = ex.what();
    }
    return result;
}

SearchOutcome search_pattern(const UnicodeRegex& re, const std::wstring& text, UnicodeMatch* match)
{
    SearchOutcome outcome;
    try
    {
        if (match)
            outcome.found = std::regex_search(text, *match, re);
        else
            outcome.found = std::regex_search(text, re);
    }
    catch (const std::regex_error& ex)
    {
        // error_complexity / error_stack on pathological patterns
        outcome.found = false;
        outcome.error = PatternError::EvaluationFailed;
        outcome.message = ex.what();
    }
    return outcome;
}

SearchOutcome search_pattern(const UnicodeRegex& re, const std::string& text)
{
    const std::wstring code_points = to_code_points(text);
    return search_pattern(re, code_points);
}

} // namespace matching
