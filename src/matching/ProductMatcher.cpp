#include "ProductMatcher.hpp"
#include "Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace matching
{

ProductMatcher::ProductMatcher(MatcherConfig config)
    : ProductMatcher(std::move(config), std::make_unique<HomoglyphNormalizer>())
{
}

ProductMatcher::ProductMatcher(MatcherConfig config, std::unique_ptr<ITextNormalizer> normalizer)
    : config_(std::move(config))
    , normalizer_(std::move(normalizer))
    , keyword_matcher_(config_.settings, *normalizer_)
    , price_extractor_(config_.price_patterns, config_.price_number_regex)
{
    compileCatalog();
}

ProductMatcher::~ProductMatcher() = default;

void ProductMatcher::compileCatalog()
{
    bool needs_prices = false;

    products_.reserve(config_.products.size());
    for (const auto& product : config_.products)
    {
        CompiledProduct compiled;
        compiled.product = &product;

        compiled.keywords.reserve(product.keywords.size());
        for (const auto& keyword : product.keywords)
            compiled.keywords.push_back(keyword_matcher_.prepare(keyword));

        compiled.exclude_keywords.reserve(product.exclude_keywords.size());
        for (const auto& keyword : product.exclude_keywords)
            compiled.exclude_keywords.push_back(keyword_matcher_.prepare(keyword));

        if (product.price_range)
            needs_prices = true;

        products_.push_back(std::move(compiled));
    }

    if (needs_prices && price_extractor_.usablePatternCount() == 0)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "No usable price patterns configured",
                                            "Products with a price_range will never match");
    }

    PLOG_INFO_(Diagnostics::kLogInstance) << "[ProductMatcher] " << products_.size() << " products, "
                                          << price_extractor_.patternCount() << " price patterns";
}

std::vector<MatchResult> ProductMatcher::matchMessage(const std::string& message_text) const
{
    std::vector<MatchResult> results;
    if (message_text.empty())
        return results;

    const MatchText normalized(normalizer_->prepare(message_text, config_.settings.case_sensitive));

    for (const auto& product : products_)
    {
        if (auto result = matchProduct(product, normalized, message_text))
            results.push_back(std::move(*result));
    }
    return results;
}

std::optional<PriceInfo> ProductMatcher::extractPrice(const std::string& message_text) const
{
    return price_extractor_.extract(message_text);
}

std::optional<MatchResult> ProductMatcher::matchProduct(const CompiledProduct& compiled,
                                                        const MatchText& normalized_text,
                                                        const std::string& raw_text) const
{
    const Product& product = *compiled.product;

    std::vector<std::string> matched_keywords;
    for (const auto& keyword : compiled.keywords)
    {
        if (keyword_matcher_.matches(normalized_text, keyword))
            matched_keywords.push_back(keyword.keyword);
    }

    if (matched_keywords.empty())
        return std::nullopt;

    for (const auto& keyword : compiled.exclude_keywords)
    {
        if (keyword_matcher_.matches(normalized_text, keyword))
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance)
                << "[ProductMatcher] '" << product.name << "' excluded due to keyword: " << keyword.keyword;
            return std::nullopt;
        }
    }

    MatchResult result;
    result.product_name = product.name;
    result.notify = product.notify;

    if (product.price_range)
    {
        auto price = price_extractor_.extract(raw_text);
        if (!price)
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance)
                << "[ProductMatcher] '" << product.name << "' has a price range but no price was found";
            return std::nullopt;
        }

        const PriceRange& range = *product.price_range;
        if (!range.contains(price->value))
        {
            if (Diagnostics::IsVerbose())
            {
                PLOG_INFO_(Diagnostics::kLogInstance)
                    << "[ProductMatcher] '" << product.name << "' price " << price->value << " outside range "
                    << range.min << "-" << (range.max ? std::to_string(*range.max) : std::string("inf"));
            }
            return std::nullopt;
        }

        result.price = price->value;
        result.currency = price->currency;
    }

    result.matched_keywords = std::move(matched_keywords);
    return result;
}

} // namespace matching
