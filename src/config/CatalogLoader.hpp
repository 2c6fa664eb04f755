#pragma once

#include "../matching/MatchingTypes.hpp"
#include "../monitor/MonitorTypes.hpp"

#include <toml++/toml.h>

// Maps config.toml onto the engine and monitor settings.
// Bad entries are skipped or defaulted with a warning; loading never aborts.
class CatalogLoader
{
public:
    // [matching], [price_number_format], [[price_patterns]], [[products]]
    static void deserialize(const toml::table& root, matching::MatcherConfig& config);

    // [monitoring], [notifications]
    static void deserializeMonitoring(const toml::table& root, monitor::MonitorSettings& settings);

private:
    static bool deserializeProduct(const toml::table& t, std::size_t index, matching::Product& product);
    static bool deserializePricePattern(const toml::table& t, std::size_t index, matching::PricePattern& pattern);
    static std::vector<std::string> readStringList(const toml::node_view<const toml::node>& node,
                                                   const std::string& context);
};
