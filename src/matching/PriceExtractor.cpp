#include "PriceExtractor.hpp"
#include "Diagnostics.hpp"
#include "PatternCompiler.hpp"
#include "PriceParser.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <plog/Log.h>

namespace matching
{

namespace
{

const std::string& label_of(const PricePattern& pattern)
{
    static const std::string unknown = "unknown";
    return pattern.description.empty() ? unknown : pattern.description;
}

} // anonymous namespace

PriceExtractor::PriceExtractor(const std::vector<PricePattern>& patterns, const std::string& number_regex)
{
    const std::string& numeric = number_regex.empty() ? std::string(kDefaultPriceNumberRegex) : number_regex;

    patterns_.reserve(patterns.size());
    for (const auto& pattern : patterns)
    {
        CompiledPricePattern entry;
        entry.config = pattern;

        if (pattern.pattern.empty())
        {
            PLOG_WARNING_(Diagnostics::kLogInstance)
                << "[PriceExtractor] empty pattern template skipped: " << label_of(pattern);
            patterns_.push_back(std::move(entry));
            continue;
        }

        entry.expanded = expandTemplate(pattern.pattern, numeric);
        PatternResult compiled = compile_pattern(entry.expanded, true);
        if (compiled.ok())
        {
            entry.regex = std::move(compiled.regex);
        }
        else
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Matching, "Invalid price pattern skipped",
                                                "pattern='" + entry.expanded + "' description='" +
                                                    label_of(pattern) + "' error=" + compiled.message);
        }
        patterns_.push_back(std::move(entry));
    }

    if (patterns_.empty())
        PLOG_WARNING_(Diagnostics::kLogInstance) << "[PriceExtractor] No price patterns configured";
    else
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[PriceExtractor] Loaded " << patterns_.size() << " price patterns";
}

std::size_t PriceExtractor::usablePatternCount() const noexcept
{
    return static_cast<std::size_t>(std::count_if(patterns_.begin(), patterns_.end(),
                                                  [](const CompiledPricePattern& p)
                                                  {
                                                      return p.regex.has_value();
                                                  }));
}

std::string PriceExtractor::expandTemplate(const std::string& pattern, const std::string& number_regex)
{
    const std::string placeholder = kPricePlaceholder;
    std::string out;
    out.reserve(pattern.size() + number_regex.size());

    std::size_t pos = 0;
    while (true)
    {
        std::size_t hit = pattern.find(placeholder, pos);
        if (hit == std::string::npos)
        {
            out.append(pattern, pos, std::string::npos);
            break;
        }
        out.append(pattern, pos, hit - pos);
        out.append(number_regex);
        pos = hit + placeholder.size();
    }
    return out;
}

std::optional<PriceInfo> PriceExtractor::extract(const std::string& raw_text) const
{
    const std::wstring text = to_code_points(raw_text);

    for (const auto& entry : patterns_)
    {
        if (!entry.regex)
            continue;

        UnicodeMatch match;
        SearchOutcome outcome = search_pattern(*entry.regex, text, &match);
        if (outcome.error != PatternError::None)
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance)
                << "[PriceExtractor] pattern '" << entry.expanded << "' failed: " << outcome.message;
            continue;
        }
        if (!outcome.found)
            continue;

        if (match.size() < 2 || !match[1].matched)
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance)
                << "[PriceExtractor] pattern '" << entry.expanded << "' has no numeric capture";
            continue;
        }

        const std::string captured = to_utf8(match[1].str());
        std::optional<double> value = parse_price_string(captured);
        if (!value)
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "[PriceExtractor] unparsable price string '" << captured << "'";
            continue;
        }

        if (*value < entry.config.min_value)
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "[PriceExtractor] price " << *value << " below min_value "
                                                   << entry.config.min_value << ", trying next pattern";
            continue;
        }

        PriceInfo info;
        info.value = *value;
        info.currency = detect_currency(to_utf8(match[0].str()));

        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[PriceExtractor] price " << info.value << " "
                                               << currency_symbol(info.currency)
                                               << " extracted using pattern: " << label_of(entry.config);
        return info;
    }

    PLOG_DEBUG_(Diagnostics::kLogInstance) << "[PriceExtractor] no price found in message";
    return std::nullopt;
}

} // namespace matching
