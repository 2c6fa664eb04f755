#pragma once

#include "HomoglyphNormalizer.hpp"
#include "KeywordMatcher.hpp"
#include "MatchingTypes.hpp"
#include "PriceExtractor.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace matching
{

/**
 * @brief Evaluates a message against every configured product.
 *
 * Keywords and price patterns are compiled once at construction; after that
 * the matcher is immutable, so matchMessage() may run concurrently for
 * different messages.
 */
class ProductMatcher
{
public:
    explicit ProductMatcher(MatcherConfig config);
    ProductMatcher(MatcherConfig config, std::unique_ptr<ITextNormalizer> normalizer);
    ~ProductMatcher();

    ProductMatcher(const ProductMatcher&) = delete;
    ProductMatcher& operator=(const ProductMatcher&) = delete;

    // One result per qualifying product, in catalog order
    [[nodiscard]] std::vector<MatchResult> matchMessage(const std::string& message_text) const;

    [[nodiscard]] std::optional<PriceInfo> extractPrice(const std::string& message_text) const;

    [[nodiscard]] const MatcherConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::size_t productCount() const noexcept { return products_.size(); }

private:
    struct CompiledProduct
    {
        const Product* product = nullptr;
        std::vector<CompiledKeyword> keywords;
        std::vector<CompiledKeyword> exclude_keywords;
    };

    [[nodiscard]] std::optional<MatchResult> matchProduct(const CompiledProduct& product,
                                                          const MatchText& normalized_text,
                                                          const std::string& raw_text) const;
    void compileCatalog();

    MatcherConfig config_;
    std::unique_ptr<ITextNormalizer> normalizer_;
    KeywordMatcher keyword_matcher_;
    PriceExtractor price_extractor_;
    std::vector<CompiledProduct> products_;
};

} // namespace matching
