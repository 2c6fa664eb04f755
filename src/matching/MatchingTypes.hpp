#pragma once

#include <optional>
#include <string>
#include <vector>

namespace matching
{

// Data contracts shared by the matching engine and its callers.
// Everything here is plain data; configuration types are read-only for a run.

enum class Currency
{
    Unknown,
    Euro,
    Dollar
};

// Display symbol for a currency ("" when unknown)
[[nodiscard]] inline const char* currency_symbol(Currency currency) noexcept
{
    switch (currency)
    {
    case Currency::Euro:
        return "€";
    case Currency::Dollar:
        return "$";
    default:
        return "";
    }
}

struct PriceRange
{
    double min = 0.0;
    std::optional<double> max; // unbounded when empty

    [[nodiscard]] bool contains(double value) const noexcept
    {
        return value >= min && (!max || value <= *max);
    }
};

struct Product
{
    std::string name = "Unknown";
    std::vector<std::string> keywords;         // at least one must match
    std::vector<std::string> exclude_keywords; // none may match
    std::optional<PriceRange> price_range;
    bool notify = true;
};

struct PricePattern
{
    std::string pattern;     // template containing the {price} placeholder
    double min_value = 0.0;
    std::string description; // diagnostics only
};

struct MatchingSettings
{
    bool case_sensitive = false;
    bool whole_word = false;
    bool pattern_matching_enabled = true;
};

inline constexpr const char* kPricePlaceholder = "{price}";
inline constexpr const char* kDefaultPriceNumberRegex = R"((\d{1,4}(?:[,\s]\d{3})*(?:[.,]\d{1,2})?))";

// Complete engine configuration as loaded from the config file
struct MatcherConfig
{
    MatchingSettings settings;
    std::vector<Product> products;
    std::vector<PricePattern> price_patterns;
    std::string price_number_regex = kDefaultPriceNumberRegex;
};

struct PriceInfo
{
    double value = 0.0;
    Currency currency = Currency::Unknown;
};

struct MatchResult
{
    std::string product_name;
    std::vector<std::string> matched_keywords; // catalog order
    std::optional<double> price;
    Currency currency = Currency::Unknown;
    bool notify = true;
};

} // namespace matching
