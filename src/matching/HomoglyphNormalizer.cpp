#include "HomoglyphNormalizer.hpp"
#include "TextUtils.hpp"

#include <unordered_map>

namespace matching
{

namespace
{

const std::unordered_map<char32_t, char32_t>& homoglyph_table()
{
    static const std::unordered_map<char32_t, char32_t> table = {
        // Uppercase
        { U'А', U'A' }, { U'В', U'B' }, { U'Е', U'E' }, { U'К', U'K' },
        { U'М', U'M' }, { U'Н', U'H' }, { U'О', U'O' }, { U'Р', U'P' },
        { U'С', U'C' }, { U'Т', U'T' }, { U'Х', U'X' }, { U'У', U'Y' },
        { U'І', U'I' }, { U'Ѕ', U'S' }, { U'Ј', U'J' },
        // Lowercase
        { U'а', U'a' }, { U'е', U'e' }, { U'о', U'o' }, { U'р', U'p' },
        { U'с', U'c' }, { U'у', U'y' }, { U'х', U'x' }, { U'і', U'i' },
        { U'ѕ', U's' }, { U'ј', U'j' },
    };
    return table;
}

} // anonymous namespace

char32_t HomoglyphNormalizer::canonical(char32_t cp) noexcept
{
    // everything in the table lives in the Cyrillic block
    if (cp < U'\u0400' || cp > U'\u04FF')
        return cp;

    const auto& table = homoglyph_table();
    auto it = table.find(cp);
    return it == table.end() ? cp : it->second;
}

std::string HomoglyphNormalizer::normalize(const std::string& text) const
{
    if (text.empty())
        return text;

    return transform_codepoints(text, &HomoglyphNormalizer::canonical);
}

std::string HomoglyphNormalizer::foldCase(const std::string& text) const
{
    return to_lower_utf8(text);
}

std::string HomoglyphNormalizer::prepare(const std::string& text, bool case_sensitive) const
{
    std::string normalized = normalize(text);
    return case_sensitive ? normalized : foldCase(normalized);
}

} // namespace matching
