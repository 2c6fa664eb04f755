#pragma once

#include "MatchingTypes.hpp"

#include <optional>
#include <string>

namespace matching
{

/**
 * @brief Parses a captured price string whose separators follow an unknown locale.
 *
 * The later of the rightmost '.' and ',' is the decimal separator when exactly
 * one or two digits follow it; every other separator and whitespace (including
 * U+00A0) is a thousands separator and is dropped. So "1,234.56", "1.234,56",
 * "1234,56" and "1 234.56" all read as 1234.56, while "1,234" reads as 1234.
 *
 * @return The value, or std::nullopt when no number remains.
 */
[[nodiscard]] std::optional<double> parse_price_string(const std::string& price_str);

/**
 * @brief Detects the currency mentioned in a matched price span.
 *
 * Euro tokens (€, EUR, евро) are checked before dollar tokens
 * ($, USD, dollar, доллар); comparison is case-insensitive.
 */
[[nodiscard]] Currency detect_currency(const std::string& matched_text);

} // namespace matching
