#include <gtest/gtest.h>

#include "binance/feed_handler.hpp"
#include "control/control_processor.hpp"
#include "core/clock.hpp"
#include "network/ssl_context.hpp"
#include "settings/settings_store.hpp"
#include "settings/tunable_settings.hpp"
#include "trade/alert_engine.hpp"
#include "trade/volume_monitor.hpp"

#include <boost/asio/io_context.hpp>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstdio>
#include <mutex>
#include <thread>
#include <variant>

using namespace surge;

namespace {

/// Scratch file name unique to the running test, so parallel runs don't collide
std::string per_test_file(const char* suffix) {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    return std::string(info->test_suite_name()) + "_" + info->name() + suffix;
}

/// Records every message and reports it delivered
class RecordingSink : public output::NotificationSink {
public:
    void send(std::string text, CompletionHandler on_complete) override {
        {
            std::lock_guard lock(mutex_);
            messages_.push_back(std::move(text));
        }
        if (on_complete) {
            on_complete(true);
        }
    }

    std::vector<std::string> messages() const {
        std::lock_guard lock(mutex_);
        return messages_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
};

/// Reports every send as failed
class FailingSink : public output::NotificationSink {
public:
    void send(std::string /*text*/, CompletionHandler on_complete) override {
        ++attempts;
        if (on_complete) {
            on_complete(false);
        }
    }

    int attempts = 0;
};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

// ============================================================================
// Pipeline Integration Tests
// ============================================================================

class PipelineIntegrationTest : public ::testing::Test {
protected:
    static constexpr EpochSeconds kStart = 1000.0;

    std::string settings_path = per_test_file("_settings.json");

    TunableSettings settings;
    AlertEngine alerts;
    RecordingSink sink;
    JsonSettingsStore store{settings_path};
    ManualClock clock{1700000000.0};
    control::ControlProcessor processor{settings, alerts, store, clock, "btcusdt"};
    VolumeMonitor monitor{3600, settings, alerts, sink, "btcusdt"};

    void TearDown() override {
        std::remove(settings_path.c_str());
        std::remove((settings_path + ".tmp").c_str());
    }

    TradeOutcome trade(EpochSeconds t, Notional notional) {
        return monitor.process_trade(TradeSample{t, 1.0, notional});
    }

    /// 60 flat trades of 100 at t, t+1, ... ; never alerts
    EpochSeconds baseline(EpochSeconds t) {
        for (int i = 0; i < 60; ++i) {
            auto outcome = trade(t + i, 100.0);
            EXPECT_FALSE(outcome.alert.has_value());
        }
        return t + 60;
    }

    std::string command(std::string_view text) {
        return processor.handle(text).value_or("");
    }
};

TEST_F(PipelineIntegrationTest, SpikeRaisesHighVolumeAlert) {
    auto t = baseline(kStart);

    auto outcome = trade(t, 1000000.0);

    ASSERT_TRUE(outcome.metrics.has_value());
    EXPECT_NEAR(outcome.metrics->z_score, 7.618, 0.01);
    ASSERT_TRUE(outcome.alert.has_value());
    EXPECT_EQ(outcome.alert->kind, AlertKind::HighVolume);
    EXPECT_NEAR(outcome.alert->volume_ratio, 59.66, 0.01);

    auto state = alerts.state();
    EXPECT_EQ(state.alert_count, 1u);
    EXPECT_EQ(state.whale_count, 0u);
    EXPECT_DOUBLE_EQ(state.last_alert_timestamp, t);

    auto sent = sink.messages();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_TRUE(contains(sent[0], "HIGH VOLUME ALERT #1"));
    EXPECT_EQ(monitor.undelivered_count(), 0u);
}

TEST_F(PipelineIntegrationTest, CooldownIsSharedAndMeasuredInTradeTime) {
    auto t = baseline(kStart);
    ASSERT_TRUE(trade(t, 1000000.0).alert.has_value());
    const EpochSeconds alerted_at = t;

    // The next trade still qualifies as a whale but falls inside the cooldown
    command("/vol 100");
    auto suppressed = trade(alerted_at + 1, 100.0);
    ASSERT_TRUE(suppressed.metrics.has_value());
    EXPECT_TRUE(suppressed.metrics->is_whale);
    EXPECT_GE(suppressed.metrics->z_score, AlertEngine::kWhaleZScoreGate);
    EXPECT_FALSE(suppressed.alert.has_value());

    // Flush the spike out of the baseline window
    t = baseline(alerted_at + 2);
    command("/vol 2");
    ASSERT_GE(t - alerted_at, 60.0);

    // Past the cooldown the same spike alerts again
    auto outcome = trade(t, 1000000.0);
    ASSERT_TRUE(outcome.alert.has_value());
    EXPECT_EQ(outcome.alert->kind, AlertKind::HighVolume);
    EXPECT_EQ(outcome.alert->sequence, 2u);

    EXPECT_EQ(alerts.state().alert_count, 2u);
    EXPECT_EQ(alerts.state().whale_count, 0u);
    EXPECT_EQ(sink.messages().size(), 2u);
}

TEST_F(PipelineIntegrationTest, WhaleWhenVolumeRatioIsOutOfReach) {
    EXPECT_EQ(command("/vol 100"), "✅ Volume multiplier set to: 100x");

    auto t = baseline(kStart);
    auto outcome = trade(t, 150000.0);

    ASSERT_TRUE(outcome.metrics.has_value());
    EXPECT_TRUE(outcome.metrics->is_whale);
    EXPECT_NEAR(outcome.metrics->z_score, 7.627, 0.01);
    ASSERT_TRUE(outcome.alert.has_value());
    EXPECT_EQ(outcome.alert->kind, AlertKind::Whale);

    EXPECT_EQ(alerts.state().whale_count, 1u);
    EXPECT_EQ(alerts.state().alert_count, 0u);
    auto sent = sink.messages();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_TRUE(contains(sent[0], "WHALE DETECTED #1"));
}

TEST_F(PipelineIntegrationTest, RejectedCommandLeavesDecisionsUnchanged) {
    auto reply = command("/z 25");
    EXPECT_EQ(reply.rfind("❌", 0), 0u);
    EXPECT_DOUBLE_EQ(settings.snapshot().z_threshold, 3.0);

    auto t = baseline(kStart);
    auto outcome = trade(t, 1000000.0);

    ASSERT_TRUE(outcome.alert.has_value());
    EXPECT_DOUBLE_EQ(outcome.alert->settings.z_threshold, 3.0);
}

TEST_F(PipelineIntegrationTest, AcceptedCommandAppliesToNextTrade) {
    // z 7.6 spike no longer clears the HighVolume gate but is still a whale
    EXPECT_EQ(command("/z 8"), "✅ Z-score threshold set to: 8");

    auto t = baseline(kStart);
    auto outcome = trade(t, 1000000.0);

    ASSERT_TRUE(outcome.alert.has_value());
    EXPECT_EQ(outcome.alert->kind, AlertKind::Whale);
    EXPECT_DOUBLE_EQ(outcome.alert->settings.z_threshold, 8.0);
}

TEST_F(PipelineIntegrationTest, PauseSuppressesAlertsWithoutStartingCooldown) {
    command("/pause");
    auto t = baseline(kStart);
    EXPECT_FALSE(trade(t, 1000000.0).alert.has_value());
    EXPECT_DOUBLE_EQ(alerts.state().last_alert_timestamp, 0.0);

    // Let the spike leave the window before resuming
    t = baseline(t + 1);
    command("/resume");

    auto outcome = trade(t, 1000000.0);
    ASSERT_TRUE(outcome.alert.has_value());
    EXPECT_EQ(outcome.alert->sequence, 1u);
}

TEST_F(PipelineIntegrationTest, StatusReflectsPipelineState) {
    auto t = baseline(kStart);
    ASSERT_TRUE(trade(t, 1000000.0).alert.has_value());

    auto status = command("/status");

    EXPECT_TRUE(contains(status, "Alerts sent: 1"));
    EXPECT_TRUE(contains(status, "Whale detections: 0"));
    EXPECT_TRUE(contains(status, "Price: $1.00"));
    EXPECT_TRUE(contains(status, "Volume (3 trades): $1,000,200"));
}

TEST_F(PipelineIntegrationTest, BurstOfThreeSpikesAlertsOnce) {
    FailingSink failing;
    VolumeMonitor failing_monitor{3600, settings, alerts, failing, "btcusdt"};

    EpochSeconds t = kStart;
    for (int i = 0; i < 60; ++i, t += 1) {
        EXPECT_FALSE(failing_monitor.process_trade(TradeSample{t, 1.0, 100.0}).alert.has_value());
    }

    int fired = 0;
    for (int i = 0; i < 3; ++i, t += 1) {
        if (failing_monitor.process_trade(TradeSample{t, 1.0, 1000000.0}).alert) {
            ++fired;
        }
    }
    for (int i = 0; i < 59; ++i, t += 1) {
        if (failing_monitor.process_trade(TradeSample{t, 1.0, 100.0}).alert) {
            ++fired;
        }
    }

    EXPECT_EQ(fired, 1);
    EXPECT_EQ(alerts.state().alert_count, 1u);
    EXPECT_EQ(alerts.state().whale_count, 0u);
    EXPECT_DOUBLE_EQ(alerts.state().last_alert_timestamp, kStart + 60);

    // A failed send neither retries nor rolls back the decision
    EXPECT_EQ(failing.attempts, 1);
    EXPECT_EQ(failing_monitor.undelivered_count(), 1u);
}

TEST_F(PipelineIntegrationTest, DuplicateAndBackwardTimestamps) {
    VolumeMonitor small{61, settings, alerts, sink, "btcusdt"};

    for (int i = 0; i < 100; ++i) {
        EXPECT_FALSE(small.process_trade(TradeSample{500.0, 1.0, 100.0}).alert.has_value());
    }
    for (int i = 0; i < 100; ++i) {
        EXPECT_FALSE(small.process_trade(TradeSample{400.0 - i, 1.0, 100.0}).alert.has_value());
    }
    EXPECT_EQ(small.buffer().size(), 61u);

    auto first = small.process_trade(TradeSample{5.0, 1.0, 1000000.0});
    ASSERT_TRUE(first.alert.has_value());
    EXPECT_DOUBLE_EQ(first.alert->timestamp, 5.0);

    // Earlier than the last alert: still inside the cooldown
    auto earlier = small.process_trade(TradeSample{4.0, 1.0, 1000000.0});
    ASSERT_TRUE(earlier.metrics.has_value());
    EXPECT_TRUE(earlier.metrics->is_whale);
    EXPECT_FALSE(earlier.alert.has_value());

    EXPECT_EQ(small.buffer().size(), 61u);
    EXPECT_EQ(alerts.state().alert_count, 1u);
    EXPECT_EQ(alerts.state().whale_count, 0u);
    EXPECT_DOUBLE_EQ(alerts.state().last_alert_timestamp, 5.0);
}

TEST_F(PipelineIntegrationTest, ChangesSurviveRestart) {
    command("/cooldown 120");
    command("/whale 250000");
    command("/pause");

    auto persisted = store.load();
    ASSERT_TRUE(persisted.is_ok()) << persisted.error().message;

    TunableSettings restarted;
    EXPECT_EQ(restarted.restore(persisted.value()), 0u);

    auto snapshot = restarted.snapshot();
    EXPECT_EQ(snapshot.cooldown_seconds, 120);
    EXPECT_DOUBLE_EQ(snapshot.whale_threshold, 250000.0);
    EXPECT_TRUE(snapshot.paused);
    EXPECT_DOUBLE_EQ(snapshot.z_threshold, 3.0);
}

TEST_F(PipelineIntegrationTest, CommandsWhileIngesting) {
    std::atomic<bool> done{false};
    std::atomic<int> decisions{0};

    std::thread ingest([&] {
        EpochSeconds t = baseline(kStart);
        for (int round = 0; round < 20; ++round) {
            auto outcome = trade(t, 1000000.0);
            if (outcome.alert) {
                // Each decision sees one coherent snapshot
                double z = outcome.alert->settings.z_threshold;
                EXPECT_TRUE(z == 3.0 || z == 4.0 || z == 2.5) << z;
                ++decisions;
            }
            // Spike ages out of the window 61s later, past the cooldown
            t = baseline(t + 1);
        }
        done.store(true);
    });

    int i = 0;
    while (!done.load()) {
        command(i++ % 2 == 0 ? "/z 4" : "/z 2.5");
        (void)command("/status");
    }
    ingest.join();

    EXPECT_EQ(command("/z 3"), "✅ Z-score threshold set to: 3");
    EXPECT_DOUBLE_EQ(settings.snapshot().z_threshold, 3.0);
    EXPECT_EQ(decisions.load(), 20);
    EXPECT_EQ(alerts.state().alert_count, 20u);
}

// ============================================================================
// Feed -> monitor
// ============================================================================

TEST(FeedToMonitorTest, RawMessagesDriveAlerts) {
    boost::asio::io_context ioc;
    Config config = Config::defaults();

    TunableSettings settings;
    AlertEngine alerts;
    RecordingSink sink;
    VolumeMonitor monitor{config.engine.buffer_capacity, settings, alerts, sink, config.network.symbol};

    std::size_t trades = 0;
    auto feed = std::make_shared<binance::FeedHandler>(
        ioc, network::create_ssl_context(false), config,
        [&](FeedEvent event) {
            if (auto* msg = std::get_if<TradeMsg>(&event)) {
                ++trades;
                (void)monitor.process_trade(msg->trade);
            }
        });

    auto message = [](std::uint64_t t_ms, const char* qty) {
        return fmt::format(
            R"({{"e":"aggTrade","E":{0},"s":"BTCUSDT","a":1,"p":"1","q":"{1}","T":{0},"m":false}})",
            t_ms, qty);
    };

    for (std::uint64_t i = 0; i < 60; ++i) {
        feed->on_ws_message(message(1000000 + i * 1000, "100"));
    }
    feed->on_ws_message("{\"e\":\"aggTrade\"}");
    feed->on_ws_message(message(1060000, "1000000"));

    EXPECT_EQ(trades, 61u);
    EXPECT_EQ(feed->rejected_count(), 1u);
    EXPECT_EQ(monitor.buffer().size(), 61u);
    EXPECT_EQ(alerts.state().alert_count, 1u);
    EXPECT_DOUBLE_EQ(alerts.state().last_alert_timestamp, 1060.0);
    ASSERT_EQ(sink.messages().size(), 1u);
    EXPECT_TRUE(contains(sink.messages()[0], "HIGH VOLUME ALERT #1"));
}
