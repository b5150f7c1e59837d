#include <gtest/gtest.h>
#include "../test_helpers.hpp"
#include "signal_ngin/backtest/score_backtest.hpp"

using namespace signal_ngin;
using namespace signal_ngin::backtest;
using signal_ngin::testing::falling_bars;
using signal_ngin::testing::random_walk_bars;
using signal_ngin::testing::rising_bars;

class ScoreBacktestTest : public signal_ngin::testing::TestBase {
protected:
    ScoreBacktestConfig config_from(size_t start, double threshold = 70.0) const {
        ScoreBacktestConfig config;
        config.start_index = start;
        config.threshold = threshold;
        return config;
    }
};

TEST_F(ScoreBacktestTest, ZeroHorizonIsRejected) {
    ScoreBacktestConfig config;
    config.horizon = 0;
    auto result = run_score_backtest(rising_bars(50), config);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ScoreBacktestTest, EmptySeriesGivesEmptyReport) {
    auto result = run_score_backtest({}, ScoreBacktestConfig());
    ASSERT_TRUE(result.is_ok());
    const auto& report = result.value();
    EXPECT_EQ(report.bars, 0u);
    EXPECT_TRUE(report.events.empty());
    EXPECT_FALSE(report.profit_factor.has_value());
    ASSERT_EQ(report.curve.size(), 7u);
    for (const auto& point : report.curve) {
        EXPECT_EQ(point.events, 0u);
    }
}

TEST_F(ScoreBacktestTest, MalformedSeriesIsRejected) {
    auto bars = rising_bars(120);
    bars[90].time = bars[89].time;
    auto result = run_score_backtest(bars, config_from(80));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(ScoreBacktestTest, SteadyRiseProducesWinningEvents) {
    auto bars = rising_bars(120);
    auto result = run_score_backtest(bars, config_from(80));
    ASSERT_TRUE(result.is_ok());
    const auto& report = result.value();

    // entries 80..109 have a full 10-bar forward window
    ASSERT_EQ(report.events.size(), 30u);
    EXPECT_EQ(report.events.front().index, 80u);
    EXPECT_EQ(report.events.back().index, 109u);
    EXPECT_DOUBLE_EQ(report.events.front().score, 75.0);
    EXPECT_NEAR(report.events.front().forward_return, 10.0 / 180.0, 1e-12);
    EXPECT_EQ(report.events.front().time, bars[80].time);

    EXPECT_DOUBLE_EQ(report.win_rate, 100.0);
    EXPECT_GT(report.avg_forward, 0.0);
    EXPECT_DOUBLE_EQ(report.avg_loss, 0.0);
    EXPECT_FALSE(report.profit_factor.has_value());

    EXPECT_DOUBLE_EQ(report.score_avg, 75.0);
    EXPECT_DOUBLE_EQ(report.pct_above_70, 100.0);
    EXPECT_EQ(report.recent_scores.size(), 40u);
}

TEST_F(ScoreBacktestTest, CurveCountsShrinkWithThreshold) {
    auto result = run_score_backtest(rising_bars(120), config_from(80));
    ASSERT_TRUE(result.is_ok());
    const auto& curve = result.value().curve;

    ASSERT_EQ(curve.size(), 7u);
    EXPECT_DOUBLE_EQ(curve.front().threshold, 30.0);
    EXPECT_EQ(curve.front().events, 30u);
    EXPECT_EQ(curve[4].events, 30u);  // 70
    EXPECT_EQ(curve[5].events, 0u);   // 80
    for (size_t i = 1; i < curve.size(); ++i) {
        EXPECT_LE(curve[i].events, curve[i - 1].events);
    }
}

TEST_F(ScoreBacktestTest, DecliningSeriesNeverTriggers) {
    auto result = run_score_backtest(falling_bars(120), config_from(80));
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().events.empty());
    EXPECT_DOUBLE_EQ(result.value().win_rate, 0.0);
    EXPECT_DOUBLE_EQ(result.value().score_avg, 0.0);
}

TEST_F(ScoreBacktestTest, MixedOutcomesHaveProfitFactor) {
    auto result = run_score_backtest(random_walk_bars(200, 13), config_from(80, 0.0));
    ASSERT_TRUE(result.is_ok());
    const auto& report = result.value();

    EXPECT_EQ(report.events.size(), 110u);
    EXPECT_GT(report.win_rate, 0.0);
    EXPECT_LT(report.win_rate, 100.0);
    EXPECT_GT(report.avg_win, 0.0);
    EXPECT_LT(report.avg_loss, 0.0);
    ASSERT_TRUE(report.profit_factor.has_value());
    EXPECT_NEAR(*report.profit_factor, report.avg_win / -report.avg_loss, 1e-9);
}

TEST_F(ScoreBacktestTest, DefaultStartIndexIsCappedAt80) {
    ScoreBacktestConfig config;
    config.threshold = 0.0;
    config.horizon = 1;

    auto small = run_score_backtest(rising_bars(50), config);
    ASSERT_TRUE(small.is_ok());
    // start 10, entries 10..48
    EXPECT_EQ(small.value().events.front().index, 10u);
    EXPECT_EQ(small.value().events.size(), 39u);

    auto large = run_score_backtest(rising_bars(500), config);
    ASSERT_TRUE(large.is_ok());
    EXPECT_EQ(large.value().events.front().index, 80u);
}

TEST_F(ScoreBacktestTest, ConfigSortsCurveThresholds) {
    nlohmann::json j;
    j["curve_thresholds"] = {90, 30, 30, 60};
    j["start_index"] = 12;
    j["horizon"] = 5;

    ScoreBacktestConfig config;
    config.from_json(j);
    EXPECT_EQ(config.curve_thresholds, (std::vector<double>{30, 60, 90}));
    ASSERT_TRUE(config.start_index.has_value());
    EXPECT_EQ(*config.start_index, 12u);
    EXPECT_EQ(config.horizon, 5u);

    j["start_index"] = nullptr;
    config.from_json(j);
    EXPECT_FALSE(config.start_index.has_value());
}
