#include <catch2/catch_test_macros.hpp>
#include "matching/HomoglyphNormalizer.hpp"
#include "matching/KeywordMatcher.hpp"
#include "matching/PatternCompiler.hpp"
#include "utils/ErrorReporter.hpp"

#include <algorithm>

using namespace matching;

namespace
{
MatchingSettings make_settings(bool whole_word, bool patterns = true, bool case_sensitive = false)
{
    MatchingSettings settings;
    settings.whole_word = whole_word;
    settings.pattern_matching_enabled = patterns;
    settings.case_sensitive = case_sensitive;
    return settings;
}

bool has_matching_warning(const std::vector<utils::ErrorReport>& reports)
{
    return std::any_of(reports.begin(), reports.end(),
                       [](const utils::ErrorReport& r)
                       {
                           return r.category == utils::ErrorCategory::Matching &&
                                  r.severity == utils::ErrorSeverity::Warning;
                       });
}
} // namespace

TEST_CASE("KeywordMatcher - Substring semantics by default", "[matching][keyword]")
{
    HomoglyphNormalizer normalizer;
    KeywordMatcher matcher(make_settings(false), normalizer);

    auto keyword = matcher.prepare("phone");
    REQUIRE(keyword.mode == KeywordMode::Pattern);

    REQUIRE(matcher.matches("selling my iphone", keyword));
    REQUIRE(matcher.matches("phone case", keyword));
    REQUIRE_FALSE(matcher.matches("tablet for sale", keyword));
}

TEST_CASE("KeywordMatcher - Whole word", "[matching][keyword]")
{
    HomoglyphNormalizer normalizer;
    KeywordMatcher matcher(make_settings(true), normalizer);

    auto keyword = matcher.prepare("phone");

    SECTION("Inside a longer word does not count")
    {
        REQUIRE_FALSE(matcher.matches("selling my iphone", keyword));
    }

    SECTION("Delimited by spaces or punctuation counts")
    {
        REQUIRE(matcher.matches("a phone for sale", keyword));
        REQUIRE(matcher.matches("phone, barely used", keyword));
    }

    SECTION("Alternation stays inside the boundaries")
    {
        auto alt = matcher.prepare("ps5|xbox");
        REQUIRE(matcher.matches("new xbox here", alt));
        REQUIRE(matcher.matches("ps5 digital", alt));
        REQUIRE_FALSE(matcher.matches("xboxone", alt));
        REQUIRE_FALSE(matcher.matches("ps55", alt));
    }
}

TEST_CASE("KeywordMatcher - Word boundaries follow Unicode letters", "[matching][keyword]")
{
    HomoglyphNormalizer normalizer;
    KeywordMatcher matcher(make_settings(true), normalizer);

    SECTION("Cyrillic keyword as a whole word")
    {
        auto keyword = matcher.prepare("айфон");
        REQUIRE(matcher.matches(normalizer.prepare("продам айфон дешево", false), keyword));
        REQUIRE(matcher.matches(normalizer.prepare("Айфон, почти новый", false), keyword));
        REQUIRE_FALSE(matcher.matches(normalizer.prepare("продам айфоны", false), keyword));
    }

    SECTION("Latin keyword glued to Cyrillic letters is not a whole word")
    {
        auto keyword = matcher.prepare("phone");
        REQUIRE_FALSE(matcher.matches(normalizer.prepare("phoneкупить", false), keyword));
        REQUIRE_FALSE(matcher.matches(normalizer.prepare("купитьphone", false), keyword));
        REQUIRE(matcher.matches(normalizer.prepare("купить phone сегодня", false), keyword));
    }

    SECTION("Bounded literal fallback uses the same boundaries")
    {
        KeywordMatcher literal(make_settings(true, false), normalizer);
        auto keyword = literal.prepare("ноутбук");
        REQUIRE(keyword.mode == KeywordMode::BoundedLiteral);
        REQUIRE(literal.matches(normalizer.prepare("игровой ноутбук", false), keyword));
        REQUIRE_FALSE(literal.matches(normalizer.prepare("ноутбуки оптом", false), keyword));
    }
}

TEST_CASE("KeywordMatcher - Regular expression keywords", "[matching][keyword]")
{
    HomoglyphNormalizer normalizer;
    KeywordMatcher matcher(make_settings(false), normalizer);

    auto keyword = matcher.prepare("iphone\\s*1[2-5]");
    REQUIRE(matcher.matches("iphone 13 pro", keyword));
    REQUIRE(matcher.matches("iphone15", keyword));
    REQUIRE_FALSE(matcher.matches("iphone 11", keyword));
}

TEST_CASE("KeywordMatcher - Invalid pattern falls back to literal matching", "[matching][keyword]")
{
    utils::ErrorReporter::ClearErrors();

    HomoglyphNormalizer normalizer;
    KeywordMatcher matcher(make_settings(false), normalizer);

    auto keyword = matcher.prepare("iphone (pro");
    REQUIRE(keyword.mode == KeywordMode::Substring);
    REQUIRE(has_matching_warning(utils::ErrorReporter::GetPendingErrors()));

    SECTION("Literal text still matches")
    {
        REQUIRE(matcher.matches("brand new iphone (pro max)", keyword));
    }

    SECTION("Absent literal does not match")
    {
        REQUIRE_FALSE(matcher.matches("brand new iphone pro", keyword));
    }

    SECTION("Ad-hoc evaluation degrades the same way")
    {
        REQUIRE(matcher.matches("need [abc here", std::string("[abc")));
        REQUIRE_FALSE(matcher.matches("need abc here", std::string("[abc")));
    }
}

TEST_CASE("KeywordMatcher - Pattern matching disabled", "[matching][keyword]")
{
    HomoglyphNormalizer normalizer;

    SECTION("Metacharacters are literal")
    {
        KeywordMatcher matcher(make_settings(false, false), normalizer);
        auto keyword = matcher.prepare("a.c");
        REQUIRE(keyword.mode == KeywordMode::Substring);
        REQUIRE(matcher.matches("xa.cx", keyword));
        REQUIRE_FALSE(matcher.matches("abc", keyword));
    }

    SECTION("Whole word uses a bounded literal")
    {
        KeywordMatcher matcher(make_settings(true, false), normalizer);
        auto keyword = matcher.prepare("ps5");
        REQUIRE(keyword.mode == KeywordMode::BoundedLiteral);
        REQUIRE(matcher.matches("ps5 console", keyword));
        REQUIRE_FALSE(matcher.matches("ps55 console", keyword));
    }
}

TEST_CASE("KeywordMatcher - Keywords are normalized like message text", "[matching][keyword]")
{
    HomoglyphNormalizer normalizer;

    SECTION("Case-insensitive")
    {
        KeywordMatcher matcher(make_settings(false), normalizer);
        auto keyword = matcher.prepare("iPhone");
        REQUIRE(keyword.normalized == "iphone");
        REQUIRE(matcher.matches(normalizer.prepare("IPHONE 14", false), keyword));
    }

    SECTION("Look-alikes in the keyword are mapped too")
    {
        KeywordMatcher matcher(make_settings(false), normalizer);
        auto keyword = matcher.prepare("іРhоnе");
        REQUIRE(keyword.normalized == "iphone");
    }

    SECTION("Case-sensitive keeps case on both sides")
    {
        KeywordMatcher matcher(make_settings(false, true, true), normalizer);
        auto keyword = matcher.prepare("iPhone");
        REQUIRE(matcher.matches(normalizer.prepare("new iPhone", true), keyword));
        REQUIRE_FALSE(matcher.matches(normalizer.prepare("new IPHONE", true), keyword));
    }
}

TEST_CASE("PatternCompiler - Escaping and compilation", "[matching][keyword]")
{
    SECTION("Escaped metacharacters compile and match literally")
    {
        const std::string literal = "c++ (v1.0) [x] {y} ^$|*?";
        auto result = compile_pattern(escape_regex(literal));
        REQUIRE(result.ok());
        REQUIRE(search_pattern(*result.regex, "learn " + literal + " now").found);
    }

    SECTION("Syntax errors are returned, not thrown")
    {
        auto result = compile_pattern("(unclosed");
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error == PatternError::InvalidSyntax);
        REQUIRE_FALSE(result.regex.has_value());
        REQUIRE_FALSE(result.message.empty());
    }

    SECTION("Whole-word wrapper")
    {
        REQUIRE(whole_word_pattern("a|b") == "\\b(?:a|b)\\b");
    }

    SECTION("Classes and case folding cover Cyrillic")
    {
        auto word = compile_pattern("^\\w+$");
        REQUIRE(word.ok());
        REQUIRE(search_pattern(*word.regex, std::string("цена")).found);

        auto folded = compile_pattern("цена", true);
        REQUIRE(folded.ok());
        REQUIRE(search_pattern(*folded.regex, std::string("ЦЕНА: 300")).found);

        auto spaced = compile_pattern("1\\s000");
        REQUIRE(search_pattern(*spaced.regex, std::string("1\u00A0000")).found);
    }

    SECTION("UTF-8 conversion keeps every code point")
    {
        const std::string text = "цена 300€ \U0001F4F1";
        const std::wstring code_points = to_code_points(text);
        REQUIRE(to_utf8(code_points) == text);
        REQUIRE(to_code_points("ц").size() == 1);
    }
}
