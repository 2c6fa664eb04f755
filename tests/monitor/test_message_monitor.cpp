#include <catch2/catch_test_macros.hpp>
#include "monitor/DateTime.hpp"
#include "monitor/MessageMonitor.hpp"
#include "utils/ErrorReporter.hpp"

#include <filesystem>
#include <stdexcept>

using namespace monitor;
namespace fs = std::filesystem;

namespace
{
struct SentNotification
{
    std::string text;
    std::string product_name;
    std::int64_t message_id = 0;
};

class RecordingSink : public INotificationSink
{
public:
    bool send(const std::string& text, const matching::MatchResult& result, const InboundMessage& message) override
    {
        if (fail_next)
        {
            fail_next = false;
            return false;
        }
        if (throw_next)
        {
            throw_next = false;
            throw std::runtime_error("sink exploded");
        }
        sent.push_back({ text, result.product_name, message.id });
        return true;
    }

    std::vector<SentNotification> sent;
    bool fail_next = false;
    bool throw_next = false;
};

class TempDir
{
public:
    TempDir()
        : path_(fs::temp_directory_path() / "dealwatch_test_monitor")
    {
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

std::shared_ptr<const matching::ProductMatcher> make_matcher()
{
    matching::MatcherConfig config;

    matching::Product phone;
    phone.name = "Phone";
    phone.keywords = { "phone" };
    phone.exclude_keywords = { "broken" };
    phone.price_range = matching::PriceRange{ 100.0, 500.0 };
    config.products.push_back(phone);

    matching::Product iphone;
    iphone.name = "iPhone";
    iphone.keywords = { "iphone" };
    config.products.push_back(iphone);

    matching::Product quiet;
    quiet.name = "Charger";
    quiet.keywords = { "charger" };
    quiet.notify = false;
    config.products.push_back(quiet);

    matching::PricePattern dollar;
    dollar.pattern = R"(\$\s*{price})";
    config.price_patterns.push_back(dollar);

    return std::make_shared<const matching::ProductMatcher>(config);
}

MonitorSettings make_settings(const fs::path& dir)
{
    MonitorSettings settings;
    settings.matches_file = (dir / "matches.json").string();
    settings.notifications.delay_ms = 0;
    return settings;
}

InboundMessage make_message(std::int64_t id, std::string text, std::string channel = "deals")
{
    InboundMessage message;
    message.id = id;
    message.text = std::move(text);
    message.channel_name = std::move(channel);
    return message;
}
} // namespace

TEST_CASE("MessageMonitor - Matches are notified and saved in catalog order", "[monitor]")
{
    TempDir dir;
    RecordingSink sink;
    MessageMonitor monitor(make_matcher(), make_settings(dir.path()), sink);

    ScanStats stats;
    REQUIRE(monitor.processMessage(make_message(1, "iphone for $250"), &stats) == 2);

    REQUIRE(sink.sent.size() == 2);
    REQUIRE(sink.sent[0].product_name == "Phone");
    REQUIRE(sink.sent[1].product_name == "iPhone");
    REQUIRE(sink.sent[0].text.rfind("Found: Phone", 0) == 0);

    auto records = monitor.repository().records();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].product_name == "Phone");
    REQUIRE(records[0].currency == "$");
    REQUIRE(records[0].channel_name == "deals");
    REQUIRE(fs::exists(dir.path() / "matches.json"));

    REQUIRE(stats.messages_scanned == 1);
    REQUIRE(stats.matches_found == 2);
    REQUIRE(stats.messages_no_match == 0);
}

TEST_CASE("MessageMonitor - Skips and counters", "[monitor]")
{
    TempDir dir;
    RecordingSink sink;
    MessageMonitor monitor(make_matcher(), make_settings(dir.path()), sink);
    ScanStats stats;

    SECTION("No text")
    {
        REQUIRE(monitor.processMessage(make_message(1, ""), &stats) == 0);
        REQUIRE(stats.messages_no_text == 1);
    }

    SECTION("No match")
    {
        REQUIRE(monitor.processMessage(make_message(2, "broken phone $200"), &stats) == 0);
        REQUIRE(stats.messages_no_match == 1);
        REQUIRE(sink.sent.empty());
    }

    SECTION("Statistics are optional")
    {
        REQUIRE(monitor.processMessage(make_message(3, "iphone")) == 1);
    }

    REQUIRE(monitor.repository().records().size() == sink.sent.size());
}

TEST_CASE("MessageMonitor - Notification switches", "[monitor]")
{
    TempDir dir;
    RecordingSink sink;

    SECTION("Product notify flag")
    {
        MessageMonitor monitor(make_matcher(), make_settings(dir.path()), sink);
        REQUIRE(monitor.processMessage(make_message(1, "usb-c charger")) == 1);
        REQUIRE(sink.sent.empty());
        REQUIRE(monitor.repository().records().size() == 1);
    }

    SECTION("Notifications disabled globally")
    {
        auto settings = make_settings(dir.path());
        settings.notifications.enabled = false;
        MessageMonitor monitor(make_matcher(), settings, sink);
        REQUIRE(monitor.processMessage(make_message(1, "iphone")) == 1);
        REQUIRE(sink.sent.empty());
    }

    SECTION("Saving disabled")
    {
        auto settings = make_settings(dir.path());
        settings.save_matches = false;
        MessageMonitor monitor(make_matcher(), settings, sink);
        REQUIRE(monitor.processMessage(make_message(1, "iphone")) == 1);
        REQUIRE(monitor.repository().records().empty());
        REQUIRE_FALSE(fs::exists(dir.path() / "matches.json"));
    }

    SECTION("Failed delivery is reported and the match is still saved")
    {
        utils::ErrorReporter::ClearErrors();
        MessageMonitor monitor(make_matcher(), make_settings(dir.path()), sink);
        sink.fail_next = true;
        REQUIRE(monitor.processMessage(make_message(1, "iphone")) == 1);
        REQUIRE(monitor.repository().records().size() == 1);

        auto errors = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].category == utils::ErrorCategory::Notification);
    }
}

TEST_CASE("MessageMonitor - Age filter", "[monitor]")
{
    TempDir dir;
    RecordingSink sink;
    auto settings = make_settings(dir.path());
    settings.max_age_days = 2;

    MessageMonitor monitor(make_matcher(), settings, sink);
    const auto now = *parse_iso8601("2024-05-10T12:00:00Z");
    monitor.setClock([now] { return now; });

    ScanStats stats;

    auto old_message = make_message(1, "iphone");
    old_message.date = parse_iso8601("2024-05-07T12:00:00Z");
    REQUIRE(monitor.processMessage(old_message, &stats) == 0);
    REQUIRE(stats.messages_skipped_old == 1);

    auto recent = make_message(2, "iphone");
    recent.date = parse_iso8601("2024-05-09T12:00:00Z");
    REQUIRE(monitor.processMessage(recent, &stats) == 1);

    auto undated = make_message(3, "iphone");
    REQUIRE(monitor.processMessage(undated, &stats) == 1);

    REQUIRE(stats.messages_scanned == 3);
    REQUIRE(stats.matches_found == 2);
}

TEST_CASE("MessageMonitor - A failing message does not stop processing", "[monitor]")
{
    TempDir dir;
    RecordingSink sink;
    MessageMonitor monitor(make_matcher(), make_settings(dir.path()), sink);

    utils::ErrorReporter::ClearErrors();
    sink.throw_next = true;
    REQUIRE(monitor.processMessage(make_message(1, "iphone")) == 0);
    REQUIRE(utils::ErrorReporter::HasPendingErrors());
    utils::ErrorReporter::ClearErrors();

    REQUIRE(monitor.processMessage(make_message(2, "iphone")) == 1);
    REQUIRE(sink.sent.size() == 1);
    REQUIRE(sink.sent[0].message_id == 2);
}

TEST_CASE("MessageMonitor - History scan aggregates per channel", "[monitor]")
{
    TempDir dir;
    RecordingSink sink;
    MessageMonitor monitor(make_matcher(), make_settings(dir.path()), sink);

    std::vector<InboundMessage> history = {
        make_message(1, "iphone $250", "deals"),
        make_message(2, "", "deals"),
        make_message(3, "laptop", "market"),
        make_message(4, "charger", "market"),
    };

    ScanStats overall = monitor.scanHistory(history);
    REQUIRE(overall.messages_scanned == 4);
    REQUIRE(overall.matches_found == 3);
    REQUIRE(overall.messages_no_text == 1);
    REQUIRE(overall.messages_no_match == 1);
    REQUIRE(sink.sent.size() == 2);
}

TEST_CASE("MessageMonitor - Reconfigure swaps the catalog", "[monitor]")
{
    TempDir dir;
    RecordingSink sink;
    MessageMonitor monitor(make_matcher(), make_settings(dir.path()), sink);

    matching::MatcherConfig config;
    matching::Product laptop;
    laptop.name = "Laptop";
    laptop.keywords = { "laptop" };
    config.products.push_back(laptop);

    auto settings = make_settings(dir.path());
    settings.matches_file = (dir.path() / "other.json").string();
    monitor.reconfigure(std::make_shared<const matching::ProductMatcher>(config), settings);

    REQUIRE(monitor.processMessage(make_message(1, "iphone")) == 0);
    REQUIRE(monitor.processMessage(make_message(2, "gaming laptop")) == 1);
    REQUIRE(monitor.repository().path() == settings.matches_file);
    REQUIRE(fs::exists(dir.path() / "other.json"));
}
