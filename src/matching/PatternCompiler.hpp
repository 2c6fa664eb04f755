#pragma once

#include <optional>
#include <regex>
#include <string>

namespace matching
{

/**
 * @brief regex_traits that understand Unicode code points.
 *
 * Patterns and subjects are searched as sequences of code points (one
 * wchar_t each, surrogate pairs where wchar_t is 16-bit). Character classes
 * (\w, \d, \s, [[:alpha:]], and therefore \b) classify non-ASCII code points
 * by their Unicode general category, and icase compares Unicode lowercase,
 * so Cyrillic words behave exactly like Latin ones.
 */
class UnicodeRegexTraits : public std::regex_traits<wchar_t>
{
public:
    [[nodiscard]] wchar_t translate_nocase(wchar_t c) const;
    [[nodiscard]] bool isctype(wchar_t c, char_class_type f) const;
};

using UnicodeRegex = std::basic_regex<wchar_t, UnicodeRegexTraits>;
using UnicodeMatch = std::match_results<std::wstring::const_iterator>;

enum class PatternError
{
    None,
    InvalidSyntax,    // std::regex refused to compile the pattern
    EvaluationFailed  // compiled, but searching blew the engine's limits
};

struct PatternResult
{
    std::optional<UnicodeRegex> regex;
    PatternError error = PatternError::None;
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return error == PatternError::None; }
};

struct SearchOutcome
{
    bool found = false;
    PatternError error = PatternError::None;
    std::string message;
};

// UTF-8 <-> code point sequence; invalid bytes decode to U+FFFD
[[nodiscard]] std::wstring to_code_points(const std::string& utf8);
[[nodiscard]] std::string to_utf8(const std::wstring& code_points);

// Escapes ECMAScript metacharacters so `s` matches literally
[[nodiscard]] std::string escape_regex(const std::string& s);

// Wraps a pattern in word-boundary assertions
[[nodiscard]] std::string whole_word_pattern(const std::string& pattern);

// Compiles a UTF-8 ECMAScript pattern; syntax errors are returned, never thrown
[[nodiscard]] PatternResult compile_pattern(const std::string& pattern, bool case_insensitive = false);

// Runs regex_search; `match` (optional) receives the groups on success
[[nodiscard]] SearchOutcome search_pattern(const UnicodeRegex& re, const std::wstring& text,
                                           UnicodeMatch* match = nullptr);

[[nodiscard]] SearchOutcome search_pattern(const UnicodeRegex& re, const std::string& text);

} // namespace matching
