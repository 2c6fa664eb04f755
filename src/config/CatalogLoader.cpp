#include "CatalogLoader.hpp"

#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace
{
void warn_entry(const std::string& message, const std::string& details)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, message, details);
}
} // namespace

void CatalogLoader::deserialize(const toml::table& root, matching::MatcherConfig& config)
{
    config = matching::MatcherConfig{};

    if (auto* m = root["matching"].as_table())
    {
        if (auto v = (*m)["case_sensitive"].value<bool>())
            config.settings.case_sensitive = *v;
        if (auto v = (*m)["whole_word"].value<bool>())
            config.settings.whole_word = *v;
        if (auto v = (*m)["regex_enabled"].value<bool>())
            config.settings.pattern_matching_enabled = *v;
    }

    if (auto* f = root["price_number_format"].as_table())
    {
        if (auto v = (*f)["regex"].value<std::string>())
        {
            if (v->empty())
                warn_entry("Empty price number format, using default", "[price_number_format].regex");
            else
                config.price_number_regex = *v;
        }
    }

    if (auto* patterns = root["price_patterns"].as_array())
    {
        std::size_t index = 0;
        for (const auto& node : *patterns)
        {
            if (auto* tbl = node.as_table())
            {
                matching::PricePattern pattern;
                if (deserializePricePattern(*tbl, index, pattern))
                    config.price_patterns.push_back(std::move(pattern));
            }
            else
            {
                warn_entry("Ignoring price pattern that is not a table", "price_patterns[" + std::to_string(index) + "]");
            }
            ++index;
        }
    }

    if (auto* products = root["products"].as_array())
    {
        std::size_t index = 0;
        for (const auto& node : *products)
        {
            if (auto* tbl = node.as_table())
            {
                matching::Product product;
                if (deserializeProduct(*tbl, index, product))
                    config.products.push_back(std::move(product));
            }
            else
            {
                warn_entry("Ignoring product that is not a table", "products[" + std::to_string(index) + "]");
            }
            ++index;
        }
    }

    PLOG_INFO << "Catalog loaded: " << config.products.size() << " products, " << config.price_patterns.size()
              << " price patterns";
}

void CatalogLoader::deserializeMonitoring(const toml::table& root, monitor::MonitorSettings& settings)
{
    settings = monitor::MonitorSettings{};

    if (auto* m = root["monitoring"].as_table())
    {
        if (auto v = (*m)["save_matches"].value<bool>())
            settings.save_matches = *v;
        if (auto v = (*m)["matches_file"].value<std::string>())
            settings.matches_file = *v;
        if (auto v = (*m)["log_file"].value<std::string>())
            settings.log_file = *v;
        if (auto v = (*m)["max_age_days"].value<int>())
            settings.max_age_days = *v < 0 ? 0 : *v;
    }

    if (auto* n = root["notifications"].as_table())
    {
        auto& out = settings.notifications;
        if (auto v = (*n)["enabled"].value<bool>())
            out.enabled = *v;
        if (auto v = (*n)["include_link"].value<bool>())
            out.include_link = *v;
        if (auto v = (*n)["include_keywords"].value<bool>())
            out.include_keywords = *v;
        if (auto v = (*n)["delay_ms"].value<int>())
            out.delay_ms = *v < 0 ? 0 : *v;
        if (auto v = (*n)["max_message_length"].value<int64_t>())
        {
            if (*v > 0)
                out.max_message_length = static_cast<std::size_t>(*v);
            else
                warn_entry("Invalid notification message length, using default",
                           "[notifications].max_message_length=" + std::to_string(*v));
        }
    }
}

bool CatalogLoader::deserializeProduct(const toml::table& t, std::size_t index, matching::Product& product)
{
    const std::string context = "products[" + std::to_string(index) + "]";

    if (auto v = t["name"].value<std::string>(); v && !v->empty())
        product.name = *v;
    else
        warn_entry("Product without a name", context);

    product.keywords = readStringList(t["keywords"], context + ".keywords");
    product.exclude_keywords = readStringList(t["exclude_keywords"], context + ".exclude_keywords");

    if (auto v = t["notify"].value<bool>())
        product.notify = *v;

    if (auto* range = t["price_range"].as_table())
    {
        // An empty table means no price constraint
        if (!range->empty())
        {
            matching::PriceRange price_range;
            if (auto v = (*range)["min"].value<double>())
                price_range.min = *v;
            if (auto v = (*range)["max"].value<double>())
                price_range.max = *v;

            if (price_range.max && *price_range.max < price_range.min)
            {
                warn_entry("Price range maximum is below its minimum, the product can never match",
                           context + " (" + product.name + ")");
            }
            product.price_range = price_range;
        }
    }
    else if (t.contains("price_range"))
    {
        warn_entry("Ignoring price range that is not a table", context + " (" + product.name + ")");
    }

    if (product.keywords.empty())
    {
        warn_entry("Skipping product without keywords", context + " (" + product.name + ")");
        return false;
    }

    return true;
}

bool CatalogLoader::deserializePricePattern(const toml::table& t, std::size_t index,
                                            matching::PricePattern& pattern)
{
    const std::string context = "price_patterns[" + std::to_string(index) + "]";

    auto v = t["pattern"].value<std::string>();
    if (!v || v->empty())
    {
        warn_entry("Skipping price pattern without a pattern string", context);
        return false;
    }
    pattern.pattern = *v;

    if (auto min = t["min_value"].value<double>())
        pattern.min_value = *min;
    if (auto desc = t["description"].value<std::string>())
        pattern.description = *desc;

    if (pattern.pattern.find(matching::kPricePlaceholder) == std::string::npos)
    {
        // Without the placeholder there is no capture group to parse
        warn_entry("Price pattern has no {price} placeholder", context + " pattern=" + pattern.pattern);
    }

    return true;
}

std::vector<std::string> CatalogLoader::readStringList(const toml::node_view<const toml::node>& node,
                                                       const std::string& context)
{
    std::vector<std::string> out;
    if (!node)
        return out;

    auto* arr = node.as_array();
    if (!arr)
    {
        warn_entry("Expected an array of strings", context);
        return out;
    }

    for (const auto& item : *arr)
    {
        auto value = item.value<std::string>();
        if (!value)
        {
            warn_entry("Ignoring non-string entry", context);
            continue;
        }
        if (value->empty())
        {
            warn_entry("Ignoring empty keyword", context);
            continue;
        }
        out.push_back(*value);
    }
    return out;
}
