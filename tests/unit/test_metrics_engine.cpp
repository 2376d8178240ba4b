#include <gtest/gtest.h>
#include "trade/metrics_engine.hpp"
#include <cmath>
#include <vector>

using namespace surge;

namespace {

constexpr double kWhale = 100000.0;

/// Append `count` trades of the given notional (price 1)
void fill(RollingBuffer& buffer, std::size_t count, double notional, double start_t = 0.0) {
    for (std::size_t i = 0; i < count; ++i) {
        buffer.append(TradeSample{start_t + static_cast<double>(i), 1.0, notional});
    }
}

std::vector<TradeSample> samples_of(std::initializer_list<double> notionals) {
    std::vector<TradeSample> result;
    for (double n : notionals) {
        result.push_back(TradeSample{0.0, 1.0, n});
    }
    return result;
}

}  // namespace

TEST(MetricsEngineTest, AbsentBelowBaselineWindow) {
    RollingBuffer buffer(3600);
    fill(buffer, 59, 100.0);

    EXPECT_FALSE(MetricsEngine::compute(buffer, kWhale).has_value());
}

TEST(MetricsEngineTest, PresentAtBaselineWindow) {
    RollingBuffer buffer(3600);
    fill(buffer, 60, 100.0);

    EXPECT_TRUE(MetricsEngine::compute(buffer, kWhale).has_value());
}

TEST(MetricsEngineTest, FlatWindowHasZeroZScore) {
    RollingBuffer buffer(3600);
    fill(buffer, 60, 1234.5);

    auto m = MetricsEngine::compute(buffer, kWhale);
    ASSERT_TRUE(m.has_value());

    EXPECT_EQ(m->z_score, 0.0);
    EXPECT_DOUBLE_EQ(m->recent_volume, 3 * 1234.5);
    EXPECT_DOUBLE_EQ(m->baseline_average, 1234.5);
    EXPECT_FALSE(m->is_whale);
}

TEST(MetricsEngineTest, RecentVolumeSumsLastThree) {
    RollingBuffer buffer(3600);
    fill(buffer, 57, 100.0);
    buffer.append(TradeSample{57.0, 100.0, 2.0});   // 200
    buffer.append(TradeSample{58.0, 100.0, 3.0});   // 300
    buffer.append(TradeSample{59.0, 101.0, 4.0});   // 404

    auto m = MetricsEngine::compute(buffer, kWhale);
    ASSERT_TRUE(m.has_value());

    EXPECT_DOUBLE_EQ(m->recent_volume, 904.0);
    EXPECT_DOUBLE_EQ(m->price, 101.0);
}

TEST(MetricsEngineTest, BaselineUsesOnlyLastSixty) {
    RollingBuffer buffer(3600);
    fill(buffer, 100, 1.0e6);          // Old, huge trades
    fill(buffer, 60, 100.0, 100.0);    // Recent, small trades

    auto m = MetricsEngine::compute(buffer, kWhale);
    ASSERT_TRUE(m.has_value());

    EXPECT_DOUBLE_EQ(m->baseline_average, 100.0);
    EXPECT_EQ(m->z_score, 0.0);
}

TEST(MetricsEngineTest, SpikeProducesHighZScore) {
    RollingBuffer buffer(3600);
    fill(buffer, 60, 100.0);
    buffer.append(TradeSample{60.0, 100.0, 10000.0});   // 1,000,000 notional

    auto m = MetricsEngine::compute(buffer, kWhale);
    ASSERT_TRUE(m.has_value());

    EXPECT_DOUBLE_EQ(m->recent_volume, 1000200.0);
    EXPECT_NEAR(m->baseline_average, 16765.0, 1e-6);
    EXPECT_NEAR(m->z_score, 7.618, 0.01);
    EXPECT_TRUE(m->is_whale);
}

TEST(MetricsEngineTest, WhaleFlagIsStrictlyGreater) {
    RollingBuffer buffer(3600);
    fill(buffer, 60, 100.0);

    auto at = MetricsEngine::compute(buffer, 300.0);
    auto below = MetricsEngine::compute(buffer, 299.0);
    ASSERT_TRUE(at && below);

    EXPECT_FALSE(at->is_whale);
    EXPECT_TRUE(below->is_whale);
}

TEST(MetricsEngineTest, ComputeIsDeterministic) {
    RollingBuffer buffer(3600);
    for (int i = 0; i < 80; ++i) {
        buffer.append(TradeSample{static_cast<double>(i), 100.0 + i, 1.0 + (i % 7)});
    }

    auto a = MetricsEngine::compute(buffer, kWhale);
    auto b = MetricsEngine::compute(buffer, kWhale);
    ASSERT_TRUE(a && b);

    EXPECT_EQ(a->recent_volume, b->recent_volume);
    EXPECT_EQ(a->baseline_average, b->baseline_average);
    EXPECT_EQ(a->z_score, b->z_score);
}

TEST(MetricsEngineTest, SampleStdDevUsesBesselCorrection) {
    // Values 2,4,4,4,5,5,7,9: population stdev 2, sample stdev sqrt(32/7)
    auto samples = samples_of({2, 4, 4, 4, 5, 5, 7, 9});
    EXPECT_NEAR(MetricsEngine::sample_std_dev(samples), std::sqrt(32.0 / 7.0), 1e-12);
}

TEST(MetricsEngineTest, SampleStdDevDegenerateInputs) {
    EXPECT_EQ(MetricsEngine::sample_std_dev({}), 0.0);
    EXPECT_EQ(MetricsEngine::sample_std_dev(samples_of({42})), 0.0);
    EXPECT_EQ(MetricsEngine::sample_std_dev(samples_of({0.1, 0.1, 0.1})), 0.0);
}
