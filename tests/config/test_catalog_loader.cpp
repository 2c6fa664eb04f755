#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "config/CatalogLoader.hpp"
#include "utils/ErrorReporter.hpp"

#include <string_view>

using Catch::Matchers::WithinAbs;

namespace
{
constexpr std::string_view kCatalog = R"toml(
[matching]
case_sensitive = true
whole_word = true
regex_enabled = false

[price_number_format]
regex = '(\d+)'

[[price_patterns]]
pattern = '\$\s*{price}'
min_value = 10
description = "dollar prefix"

[[price_patterns]]
pattern = '{price}\s*€'

[[products]]
name = "Phone"
keywords = ["iphone", "pixel", ""]
exclude_keywords = ["case"]
price_range = { min = 100, max = 899.5 }
notify = false

[[products]]
name = "Console"
keywords = ["ps5"]
price_range = {}

[[products]]
name = "Camera"
keywords = ["camera"]
price_range = { min = 300 }

[[products]]
name = "Broken"
keywords = []
)toml";
} // namespace

TEST_CASE("CatalogLoader - Reads matching settings, patterns and products", "[config]")
{
    utils::ErrorReporter::ClearErrors();

    matching::MatcherConfig config;
    CatalogLoader::deserialize(toml::parse(kCatalog), config);

    SECTION("Settings")
    {
        REQUIRE(config.settings.case_sensitive);
        REQUIRE(config.settings.whole_word);
        REQUIRE_FALSE(config.settings.pattern_matching_enabled);
        REQUIRE(config.price_number_regex == R"((\d+))");
    }

    SECTION("Price patterns keep their order")
    {
        REQUIRE(config.price_patterns.size() == 2);
        REQUIRE(config.price_patterns[0].pattern == R"(\$\s*{price})");
        REQUIRE_THAT(config.price_patterns[0].min_value, WithinAbs(10.0, 1e-9));
        REQUIRE(config.price_patterns[0].description == "dollar prefix");
        REQUIRE_THAT(config.price_patterns[1].min_value, WithinAbs(0.0, 1e-9));
    }

    SECTION("Products")
    {
        REQUIRE(config.products.size() == 3);

        const auto& phone = config.products[0];
        REQUIRE(phone.name == "Phone");
        REQUIRE(phone.keywords == std::vector<std::string>{ "iphone", "pixel" });
        REQUIRE(phone.exclude_keywords == std::vector<std::string>{ "case" });
        REQUIRE_FALSE(phone.notify);
        REQUIRE(phone.price_range.has_value());
        REQUIRE_THAT(phone.price_range->min, WithinAbs(100.0, 1e-9));
        REQUIRE(phone.price_range->max.has_value());
        REQUIRE_THAT(*phone.price_range->max, WithinAbs(899.5, 1e-9));

        const auto& console = config.products[1];
        REQUIRE(console.notify);
        REQUIRE_FALSE(console.price_range.has_value());

        const auto& camera = config.products[2];
        REQUIRE(camera.price_range.has_value());
        REQUIRE_THAT(camera.price_range->min, WithinAbs(300.0, 1e-9));
        REQUIRE_FALSE(camera.price_range->max.has_value());
    }

    SECTION("Skipped entries are reported")
    {
        auto errors = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 2); // empty keyword, product without keywords
        for (const auto& e : errors)
            REQUIRE(e.category == utils::ErrorCategory::Configuration);
    }
}

TEST_CASE("CatalogLoader - Defaults for an empty document", "[config]")
{
    matching::MatcherConfig config;
    config.products.emplace_back();

    CatalogLoader::deserialize(toml::table{}, config);

    REQUIRE(config.products.empty());
    REQUIRE(config.price_patterns.empty());
    REQUIRE_FALSE(config.settings.case_sensitive);
    REQUIRE_FALSE(config.settings.whole_word);
    REQUIRE(config.settings.pattern_matching_enabled);
    REQUIRE(config.price_number_regex == matching::kDefaultPriceNumberRegex);
}

TEST_CASE("CatalogLoader - Malformed entries never abort loading", "[config]")
{
    utils::ErrorReporter::ClearErrors();

    constexpr std::string_view doc = R"toml(
[[price_patterns]]
description = "missing pattern"

[[products]]
keywords = ["tablet", 42]
price_range = "cheap"

[[products]]
name = "Bike"
keywords = "bike"
)toml";

    matching::MatcherConfig config;
    CatalogLoader::deserialize(toml::parse(doc), config);

    REQUIRE(config.price_patterns.empty());
    REQUIRE(config.products.size() == 1);
    REQUIRE(config.products[0].name == "Unknown");
    REQUIRE(config.products[0].keywords == std::vector<std::string>{ "tablet" });
    REQUIRE_FALSE(config.products[0].price_range.has_value());
    REQUIRE(utils::ErrorReporter::HasPendingErrors());
    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("CatalogLoader - Monitoring and notification settings", "[config]")
{
    SECTION("Defaults")
    {
        monitor::MonitorSettings settings;
        CatalogLoader::deserializeMonitoring(toml::table{}, settings);

        REQUIRE(settings.save_matches);
        REQUIRE(settings.matches_file == "logs/matches.json");
        REQUIRE(settings.log_file == "logs/monitor.log");
        REQUIRE(settings.max_age_days == 0);
        REQUIRE(settings.notifications.enabled);
        REQUIRE(settings.notifications.include_link);
        REQUIRE(settings.notifications.include_keywords);
        REQUIRE(settings.notifications.delay_ms == 500);
        REQUIRE(settings.notifications.max_message_length == 500);
    }

    SECTION("Configured values")
    {
        constexpr std::string_view doc = R"toml(
[monitoring]
save_matches = false
matches_file = "data/found.json"
log_file = "data/monitor.log"
max_age_days = 7

[notifications]
enabled = false
include_link = false
include_keywords = false
delay_ms = -20
max_message_length = 120
)toml";

        monitor::MonitorSettings settings;
        CatalogLoader::deserializeMonitoring(toml::parse(doc), settings);

        REQUIRE_FALSE(settings.save_matches);
        REQUIRE(settings.matches_file == "data/found.json");
        REQUIRE(settings.log_file == "data/monitor.log");
        REQUIRE(settings.max_age_days == 7);
        REQUIRE_FALSE(settings.notifications.enabled);
        REQUIRE_FALSE(settings.notifications.include_link);
        REQUIRE_FALSE(settings.notifications.include_keywords);
        REQUIRE(settings.notifications.delay_ms == 0);
        REQUIRE(settings.notifications.max_message_length == 120);
    }
}
