#pragma once

#include "ITextNormalizer.hpp"
#include "MatchingTypes.hpp"
#include "PatternCompiler.hpp"

#include <optional>
#include <string>

namespace matching
{

// How a keyword is evaluated against normalized text
enum class KeywordMode
{
    Pattern,        // regular expression, optionally wrapped in \b...\b
    BoundedLiteral, // escaped literal between word boundaries
    Substring       // plain containment
};

struct CompiledKeyword
{
    std::string keyword;    // as configured
    std::string normalized; // look-alikes mapped, case folded per settings
    KeywordMode mode = KeywordMode::Substring;
    std::optional<UnicodeRegex> regex;
};

// Normalized message text, kept as UTF-8 for literal search and as code
// points for pattern search
struct MatchText
{
    explicit MatchText(std::string normalized)
        : utf8(std::move(normalized))
        , code_points(to_code_points(utf8))
    {
    }

    std::string utf8;
    std::wstring code_points;
};

/**
 * @brief Decides whether a normalized keyword occurs in normalized text.
 *
 * With pattern matching enabled the keyword is treated as an ECMAScript
 * regular expression evaluated over code points, so word boundaries and
 * classes hold for Cyrillic as well as Latin text. A keyword that fails to compile, or whose evaluation
 * trips the regex engine's limits, degrades to literal matching and the
 * degradation is reported instead of propagated.
 *
 * All methods are const and safe to call from multiple threads.
 */
class KeywordMatcher
{
public:
    KeywordMatcher(MatchingSettings settings, const ITextNormalizer& normalizer);

    // Applies the same normalization the message text receives
    [[nodiscard]] std::string normalizeKeyword(const std::string& keyword) const;

    // Normalizes and compiles a configured keyword once, reporting bad patterns
    [[nodiscard]] CompiledKeyword prepare(const std::string& keyword) const;

    [[nodiscard]] bool matches(const MatchText& text, const CompiledKeyword& keyword) const;
    [[nodiscard]] bool matches(const std::string& normalized_text, const CompiledKeyword& keyword) const;

    // Ad-hoc form: compiles `normalized_keyword` for this call only
    [[nodiscard]] bool matches(const std::string& normalized_text, const std::string& normalized_keyword) const;

    [[nodiscard]] const MatchingSettings& settings() const noexcept { return settings_; }

private:
    [[nodiscard]] CompiledKeyword compile(const std::string& keyword, std::string normalized, bool report) const;
    [[nodiscard]] CompiledKeyword compileLiteral(const std::string& keyword, std::string normalized) const;
    [[nodiscard]] bool matchLiteral(const MatchText& text, const std::string& normalized_keyword) const;

    MatchingSettings settings_;
    const ITextNormalizer& normalizer_;
};

} // namespace matching
