#include <gtest/gtest.h>
#include "control/control_processor.hpp"
#include "core/clock.hpp"

using namespace surge;
using namespace surge::control;

namespace {

/// In-memory store that records persisted snapshots
class RecordingStore : public SettingsStore {
public:
    Result<Settings, Error> load() override {
        if (!saved) {
            return Result<Settings, Error>::Err(Error::io_error("nothing saved"));
        }
        return Result<Settings, Error>::Ok(*saved);
    }

    Result<bool, Error> persist(const Settings& settings) override {
        ++persist_calls;
        if (fail) {
            return Result<bool, Error>::Err(Error::io_error("disk full"));
        }
        saved = settings;
        return Result<bool, Error>::Ok(true);
    }

    std::optional<Settings> saved;
    int persist_calls = 0;
    bool fail = false;
};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

class ControlProcessorTest : public ::testing::Test {
protected:
    TunableSettings settings;
    AlertEngine alerts;
    RecordingStore store;
    ManualClock clock{1700000000.0};
    ControlProcessor processor{settings, alerts, store, clock, "btcusdt"};

    std::string reply(std::string_view text) {
        auto r = processor.handle(text);
        EXPECT_TRUE(r.has_value()) << "no reply to " << text;
        return r.value_or("");
    }
};

TEST_F(ControlProcessorTest, SetZThresholdAppliesAndPersists) {
    EXPECT_EQ(reply("/z 3.5"), "✅ Z-score threshold set to: 3.5");

    EXPECT_DOUBLE_EQ(settings.snapshot().z_threshold, 3.5);
    ASSERT_TRUE(store.saved.has_value());
    EXPECT_DOUBLE_EQ(store.saved->z_threshold, 3.5);
}

TEST_F(ControlProcessorTest, OutOfRangeRejectedAndPreviousKept) {
    ASSERT_EQ(reply("/z 4"), "✅ Z-score threshold set to: 4");

    EXPECT_EQ(reply("/z 25"), "❌ Z-score must be between 0.5 and 20");

    EXPECT_DOUBLE_EQ(settings.snapshot().z_threshold, 4.0);
    EXPECT_EQ(store.persist_calls, 1);
}

TEST_F(ControlProcessorTest, MalformedArgumentGivesUsage) {
    EXPECT_EQ(reply("/z abc"), "❌ Usage: /z 3.5");
    EXPECT_EQ(reply("/cooldown"), "❌ Usage: /cooldown 60");
    EXPECT_EQ(store.persist_calls, 0);
}

TEST_F(ControlProcessorTest, OtherSetters) {
    EXPECT_EQ(reply("/vol 2.5"), "✅ Volume multiplier set to: 2.5x");
    EXPECT_EQ(reply("/cooldown 120"), "✅ Cooldown set to: 120 seconds");
    EXPECT_EQ(reply("/whale 250000"), "✅ Whale threshold set to: $250,000");

    auto s = settings.snapshot();
    EXPECT_DOUBLE_EQ(s.volume_ratio_threshold, 2.5);
    EXPECT_EQ(s.cooldown_seconds, 120);
    EXPECT_DOUBLE_EQ(s.whale_threshold, 250000.0);
    EXPECT_EQ(store.persist_calls, 3);
}

TEST_F(ControlProcessorTest, RangeMessagesQuoteLimits) {
    EXPECT_EQ(reply("/vol 0.5"), "❌ Volume must be between 1 and 100");
    EXPECT_EQ(reply("/cooldown 5"), "❌ Cooldown must be between 10 and 3600 seconds");
    EXPECT_EQ(reply("/whale 500"), "❌ Whale threshold must be at least $10000");
}

TEST_F(ControlProcessorTest, PauseAndResumePersist) {
    EXPECT_TRUE(contains(reply("/pause"), "Alerts paused"));
    EXPECT_TRUE(settings.snapshot().paused);
    ASSERT_TRUE(store.saved.has_value());
    EXPECT_TRUE(store.saved->paused);

    EXPECT_TRUE(contains(reply("/resume"), "Alerts resumed"));
    EXPECT_FALSE(settings.snapshot().paused);
    EXPECT_FALSE(store.saved->paused);
}

TEST_F(ControlProcessorTest, PersistFailureStillConfirms) {
    store.fail = true;

    EXPECT_EQ(reply("/z 5"), "✅ Z-score threshold set to: 5");
    EXPECT_DOUBLE_EQ(settings.snapshot().z_threshold, 5.0);
}

TEST_F(ControlProcessorTest, UnrecognizedGetsNoReply) {
    EXPECT_FALSE(processor.handle("hello there").has_value());
    EXPECT_FALSE(processor.handle("/bogus").has_value());
}

TEST_F(ControlProcessorTest, StatusReportsSettingsAndCounters) {
    clock.advance(2 * 3600 + 5 * 60);
    ASSERT_TRUE(alerts.evaluate(
        MetricsSnapshot{.recent_volume = 1000.0, .baseline_average = 100.0,
                        .z_score = 5.0, .is_whale = false, .price = 42000.0},
        settings.snapshot(), clock.now() - 90.0).has_value());
    alerts.record_price(42000.5);

    auto text = reply("/status");

    EXPECT_TRUE(contains(text, "BTCUSDT"));
    EXPECT_TRUE(contains(text, "Z-Score Threshold: 3"));
    EXPECT_TRUE(contains(text, "Volume Multiplier: 2x"));
    EXPECT_TRUE(contains(text, "Cooldown: 60s"));
    EXPECT_TRUE(contains(text, "Whale Threshold: $100,000"));
    EXPECT_TRUE(contains(text, "Active"));
    EXPECT_TRUE(contains(text, "Alerts sent: 1"));
    EXPECT_TRUE(contains(text, "Uptime: 2h 5m"));
    EXPECT_TRUE(contains(text, "Last alert: 1m ago"));
    EXPECT_TRUE(contains(text, "Price: $42000.50"));
}

TEST_F(ControlProcessorTest, StartMatchesStatus) {
    EXPECT_EQ(reply("/start"), reply("/status"));
}

TEST_F(ControlProcessorTest, StatusShowsPaused) {
    reply("/pause");
    EXPECT_TRUE(contains(reply("/status"), "Paused"));
}

TEST_F(ControlProcessorTest, StatsAndHelpAndTest) {
    auto stats = reply("/stats");
    EXPECT_TRUE(contains(stats, "Total alerts: 0"));
    EXPECT_TRUE(contains(stats, "Last alert: None"));

    auto help = reply("/help");
    EXPECT_TRUE(contains(help, "/z &lt;value&gt;"));
    EXPECT_TRUE(contains(help, "/whale"));

    EXPECT_TRUE(contains(reply("/test"), "Test Alert"));
}
