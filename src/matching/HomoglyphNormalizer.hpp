#pragma once

#include "ITextNormalizer.hpp"

namespace matching
{

/**
 * @brief Maps Cyrillic letters that render like Latin letters onto Latin.
 *
 * Catches listings spelled with mixed alphabets to dodge filters
 * (e.g. "iРhоnе" with Cyrillic Р, о, е). Characters outside the table,
 * including malformed UTF-8 bytes, pass through unchanged.
 */
class HomoglyphNormalizer : public ITextNormalizer
{
public:
    HomoglyphNormalizer() = default;
    ~HomoglyphNormalizer() override = default;

    [[nodiscard]] std::string normalize(const std::string& text) const override;
    [[nodiscard]] std::string foldCase(const std::string& text) const override;
    [[nodiscard]] std::string prepare(const std::string& text, bool case_sensitive) const override;

    // Canonical counterpart of a single codepoint (identity when not in the table)
    [[nodiscard]] static char32_t canonical(char32_t cp) noexcept;
};

} // namespace matching
