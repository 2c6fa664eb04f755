#pragma once

#include <cstddef>
#include <string>

#include <utf8proc.h>

namespace matching
{

/// Rewrites every decodable codepoint through `fn` (char32_t -> char32_t).
/// Bytes that do not form valid UTF-8 are copied through untouched.
template <typename Fn>
std::string transform_codepoints(const std::string& text, Fn&& fn)
{
    std::string out;
    out.reserve(text.size());

    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    const auto len = static_cast<utf8proc_ssize_t>(text.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint = 0;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            out.push_back(text[static_cast<std::size_t>(pos)]);
            ++pos;
            continue;
        }

        const char32_t mapped = fn(static_cast<char32_t>(codepoint));
        if (mapped == static_cast<char32_t>(codepoint))
        {
            out.append(text, static_cast<std::size_t>(pos), static_cast<std::size_t>(bytes));
        }
        else
        {
            utf8proc_uint8_t buffer[4];
            utf8proc_ssize_t written = utf8proc_encode_char(static_cast<utf8proc_int32_t>(mapped), buffer);
            out.append(reinterpret_cast<const char*>(buffer), static_cast<std::size_t>(written));
        }
        pos += bytes;
    }

    return out;
}

/// Unicode lowercase, codepoint by codepoint
[[nodiscard]] std::string to_lower_utf8(const std::string& text);

/// Largest prefix length <= max_bytes that does not split a UTF-8 sequence
[[nodiscard]] std::size_t utf8_prefix_length(const std::string& text, std::size_t max_bytes);

} // namespace matching
