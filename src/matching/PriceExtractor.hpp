#pragma once

#include "MatchingTypes.hpp"
#include "PatternCompiler.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace matching
{

/**
 * @brief Finds the first qualifying price in a raw message.
 *
 * Each configured template has its {price} placeholder replaced by the
 * numeric sub-pattern and is compiled once, case-insensitively over code
 * points (so "Цена" and "ЕВРО" match lowercase templates). Templates
 * are tried in configuration order against the raw (non-normalized) text:
 * the first one whose capture parses to a value >= its min_value wins and
 * later templates are never evaluated. Templates that fail to compile stay
 * in place but are skipped.
 */
class PriceExtractor
{
public:
    PriceExtractor(const std::vector<PricePattern>& patterns, const std::string& number_regex);

    [[nodiscard]] std::optional<PriceInfo> extract(const std::string& raw_text) const;

    [[nodiscard]] std::size_t patternCount() const noexcept { return patterns_.size(); }
    [[nodiscard]] std::size_t usablePatternCount() const noexcept;

    // Replaces every {price} placeholder in `pattern`
    [[nodiscard]] static std::string expandTemplate(const std::string& pattern, const std::string& number_regex);

private:
    struct CompiledPricePattern
    {
        PricePattern config;
        std::string expanded;
        std::optional<UnicodeRegex> regex;
    };

    std::vector<CompiledPricePattern> patterns_;
};

} // namespace matching
