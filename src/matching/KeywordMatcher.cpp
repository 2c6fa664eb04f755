#include "KeywordMatcher.hpp"
#include "Diagnostics.hpp"
#include "PatternCompiler.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace matching
{

KeywordMatcher::KeywordMatcher(MatchingSettings settings, const ITextNormalizer& normalizer)
    : settings_(settings)
    , normalizer_(normalizer)
{
}

std::string KeywordMatcher::normalizeKeyword(const std::string& keyword) const
{
    return normalizer_.prepare(keyword, settings_.case_sensitive);
}

CompiledKeyword KeywordMatcher::prepare(const std::string& keyword) const
{
    return compile(keyword, normalizeKeyword(keyword), true);
}

CompiledKeyword KeywordMatcher::compile(const std::string& keyword, std::string normalized, bool report) const
{
    if (!settings_.pattern_matching_enabled)
        return compileLiteral(keyword, std::move(normalized));

    // Validate the bare pattern first so the \b(?:...) wrapper cannot
    // balance an otherwise malformed keyword.
    PatternResult compiled = compile_pattern(normalized);
    if (compiled.ok() && settings_.whole_word)
        compiled = compile_pattern(whole_word_pattern(normalized));

    if (!compiled.ok())
    {
        if (report)
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Matching,
                                                "Invalid keyword pattern, using literal matching",
                                                "keyword='" + keyword + "' error=" + compiled.message);
        }
        else
        {
            PLOG_WARNING_(Diagnostics::kLogInstance)
                << "[KeywordMatcher] invalid pattern '" << keyword << "': " << compiled.message;
        }
        return compileLiteral(keyword, std::move(normalized));
    }

    CompiledKeyword out;
    out.keyword = keyword;
    out.normalized = std::move(normalized);
    out.mode = KeywordMode::Pattern;
    out.regex = std::move(compiled.regex);
    return out;
}

CompiledKeyword KeywordMatcher::compileLiteral(const std::string& keyword, std::string normalized) const
{
    CompiledKeyword out;
    out.keyword = keyword;
    out.normalized = std::move(normalized);
    out.mode = KeywordMode::Substring;

    if (settings_.whole_word)
    {
        PatternResult bounded = compile_pattern(whole_word_pattern(escape_regex(out.normalized)));
        if (bounded.ok())
        {
            out.mode = KeywordMode::BoundedLiteral;
            out.regex = std::move(bounded.regex);
        }
    }
    return out;
}

bool KeywordMatcher::matches(const MatchText& text, const CompiledKeyword& keyword) const
{
    if (keyword.mode == KeywordMode::Substring || !keyword.regex)
        return text.utf8.find(keyword.normalized) != std::string::npos;

    SearchOutcome outcome = search_pattern(*keyword.regex, text.code_points);
    if (outcome.error == PatternError::None)
        return outcome.found;

    PLOG_WARNING_(Diagnostics::kLogInstance)
        << "[KeywordMatcher] evaluation failed for '" << keyword.keyword << "': " << outcome.message
        << " -> literal fallback";
    return matchLiteral(text, keyword.normalized);
}

bool KeywordMatcher::matches(const std::string& normalized_text, const CompiledKeyword& keyword) const
{
    return matches(MatchText(normalized_text), keyword);
}

bool KeywordMatcher::matches(const std::string& normalized_text, const std::string& normalized_keyword) const
{
    return matches(MatchText(normalized_text), compile(normalized_keyword, normalized_keyword, false));
}

bool KeywordMatcher::matchLiteral(const MatchText& text, const std::string& normalized_keyword) const
{
    if (settings_.whole_word)
    {
        PatternResult bounded = compile_pattern(whole_word_pattern(escape_regex(normalized_keyword)));
        if (bounded.ok())
        {
            SearchOutcome outcome = search_pattern(*bounded.regex, text.code_points);
            if (outcome.error == PatternError::None)
                return outcome.found;
        }
    }
    return text.utf8.find(normalized_keyword) != std::string::npos;
}

} // namespace matching
