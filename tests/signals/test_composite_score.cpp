#include <gtest/gtest.h>
#include <vector>
#include "../test_helpers.hpp"
#include "signal_ngin/signals/composite_score.hpp"

using namespace signal_ngin;
using namespace signal_ngin::signals;
using namespace signal_ngin::testing;

class CompositeScoreTest : public TestBase {};

TEST_F(CompositeScoreTest, SteadyUptrendCollectsTrendComponents) {
    SignalScorer scorer;
    auto state = scorer.score(rising_bars(80));
    ASSERT_TRUE(state.is_ok()) << state.error()->what();

    const auto& s = state.value();
    EXPECT_EQ(s.pivot_now, Trend::BULLISH);
    EXPECT_EQ(s.ripster_bias, Trend::BULLISH);
    EXPECT_EQ(s.saty_direction, TradeDirection::LONG);
    EXPECT_EQ(s.ichimoku_regime, Trend::BULLISH);
    EXPECT_FALSE(s.squeeze.on);

    EXPECT_DOUBLE_EQ(s.components.get(ScoreIndicator::PIVOT_RIBBON), 20.0);
    EXPECT_DOUBLE_EQ(s.components.get(ScoreIndicator::RIPSTER_3450), 20.0);
    EXPECT_DOUBLE_EQ(s.components.get(ScoreIndicator::SATY_TRIGGER), 20.0);
    EXPECT_DOUBLE_EQ(s.components.get(ScoreIndicator::ICHIMOKU), 15.0);
    EXPECT_DOUBLE_EQ(s.components.get(ScoreIndicator::SQUEEZE_ON), 0.0);
    EXPECT_DOUBLE_EQ(s.score, 75.0);
    EXPECT_DOUBLE_EQ(s.score, s.components.total());
    EXPECT_EQ(s.time, rising_bars(80).back().time);
}

TEST_F(CompositeScoreTest, DowntrendScoresZero) {
    SignalScorer scorer;
    auto state = scorer.score(falling_bars(80));
    ASSERT_TRUE(state.is_ok());
    EXPECT_DOUBLE_EQ(state.value().score, 0.0);
    EXPECT_EQ(state.value().pivot_now, Trend::BEARISH);
}

TEST_F(CompositeScoreTest, FlatBaseEarnsSqueezeOnOnly) {
    SignalScorer scorer;
    auto state = scorer.score(flat_bars(60));
    ASSERT_TRUE(state.is_ok());
    EXPECT_TRUE(state.value().squeeze.on);
    EXPECT_DOUBLE_EQ(state.value().score, 10.0);
}

TEST_F(CompositeScoreTest, EmptyWindowScoresZero) {
    SignalScorer scorer;
    auto state = scorer.score({});
    ASSERT_TRUE(state.is_ok());
    EXPECT_DOUBLE_EQ(state.value().score, 0.0);
}

TEST_F(CompositeScoreTest, MalformedWindowIsRejected) {
    auto bars = rising_bars(40);
    bars[20].time = bars[19].time;
    SignalScorer scorer;
    auto state = scorer.score(bars);
    ASSERT_TRUE(state.is_error());
    EXPECT_EQ(state.error()->code(), ErrorCode::INVALID_DATA);
    EXPECT_TRUE(scorer.score_history(bars).is_error());
}

TEST_F(CompositeScoreTest, HistoryMatchesPerPrefixScores) {
    auto bars = random_walk_bars(120, 17, 0.001, 0.01);
    SignalScorer scorer;
    auto history = scorer.score_history(bars, 60);
    ASSERT_TRUE(history.is_ok());
    ASSERT_EQ(history.value().size(), 60u);

    for (size_t i = 60; i < bars.size(); i += 7) {
        std::vector<Bar> prefix(bars.begin(), bars.begin() + i + 1);
        auto single = scorer.score(prefix);
        ASSERT_TRUE(single.is_ok());
        const auto& incremental = history.value()[i - 60];
        EXPECT_DOUBLE_EQ(incremental.score, single.value().score) << "index " << i;
        EXPECT_EQ(incremental.pivot_now, single.value().pivot_now);
        EXPECT_EQ(incremental.squeeze.on, single.value().squeeze.on);
        EXPECT_EQ(incremental.time, bars[i].time);
    }
}

TEST_F(CompositeScoreTest, ScoresStayWithinBounds) {
    auto bars = random_walk_bars(300, 5, 0.0005, 0.02);
    SignalScorer scorer;
    auto history = scorer.score_history(bars);
    ASSERT_TRUE(history.is_ok());
    for (const auto& state : history.value()) {
        EXPECT_GE(state.score, 0.0);
        EXPECT_LE(state.score, 100.0);
    }
}

TEST_F(CompositeScoreTest, FiredContributionDecays) {
    ScoreWeights weights;
    EXPECT_DOUBLE_EQ(weights.fired_contribution(0), 25.0);
    EXPECT_DOUBLE_EQ(weights.fired_contribution(1), 21.0);
    EXPECT_DOUBLE_EQ(weights.fired_contribution(5), 5.0);
    EXPECT_DOUBLE_EQ(weights.fired_contribution(6), 0.0);
    EXPECT_DOUBLE_EQ(weights.fired_contribution(-1), 0.0);
}

TEST_F(CompositeScoreTest, BullishReleaseAddsFiredComponent) {
    std::vector<double> closes(40, 100.0);
    closes.push_back(103.0);
    closes.push_back(106.0);
    SignalScorer scorer;
    auto state = scorer.score(make_bars(closes));
    ASSERT_TRUE(state.is_ok());

    EXPECT_TRUE(state.value().squeeze.fired);
    EXPECT_DOUBLE_EQ(state.value().components.get(ScoreIndicator::SQUEEZE_FIRED), 25.0);
    EXPECT_DOUBLE_EQ(state.value().components.get(ScoreIndicator::SQUEEZE_ON), 0.0);
}

TEST_F(CompositeScoreTest, IndicatorNames) {
    EXPECT_EQ(to_string(ScoreIndicator::PIVOT_RIBBON), "pivot_ribbon");
    EXPECT_EQ(to_string(ScoreIndicator::CONSENSUS), "consensus");
    EXPECT_EQ(ALL_SCORE_INDICATORS.size(), SCORE_INDICATOR_COUNT);
}
