#include "TextUtils.hpp"

namespace matching
{

std::string to_lower_utf8(const std::string& text)
{
    if (text.empty())
        return text;

    return transform_codepoints(text,
                                [](char32_t cp)
                                {
                                    return static_cast<char32_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(cp)));
                                });
}

std::size_t utf8_prefix_length(const std::string& text, std::size_t max_bytes)
{
    if (text.size() <= max_bytes)
        return text.size();

    std::size_t len = max_bytes;
    // step back over continuation bytes so the cut lands on a lead byte
    while (len > 0 && (static_cast<unsigned char>(text[len]) & 0xC0) == 0x80)
        --len;
    return len;
}

} // namespace matching
