#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <random>
#include <vector>
#include "../test_helpers.hpp"
#include "signal_ngin/regime/advanced_detector.hpp"

using namespace signal_ngin;
using namespace signal_ngin::regime;
using signal_ngin::testing::random_walk_bars;
using signal_ngin::testing::rising_bars;

namespace {

// 150 calm returns followed by 150 wild ones
std::vector<Bar> calm_then_wild_bars() {
    std::mt19937 gen(7);
    std::normal_distribution<> calm(0.0, 0.002);
    std::normal_distribution<> wild(0.0, 0.03);

    std::vector<double> closes{100.0};
    for (int i = 0; i < 300; ++i) {
        double r = i < 150 ? calm(gen) : wild(gen);
        closes.push_back(closes.back() * std::exp(r));
    }

    auto bars = signal_ngin::testing::make_bars(closes, 0.0);
    for (auto& bar : bars) {
        bar.high = std::max(bar.open, bar.close) + 0.1;
        bar.low = std::min(bar.open, bar.close) - 0.1;
    }
    return bars;
}

}  // namespace

class AdvancedDetectorTest : public signal_ngin::testing::TestBase {};

TEST_F(AdvancedDetectorTest, LabelsStatesByVolatilityRank) {
    Eigen::VectorXd means(3);
    means << 0.0, 0.0, 0.0;
    Eigen::VectorXd stds(3);
    stds << 0.03, 0.01, 0.02;

    auto labels = label_states_by_volatility(means, stds, HMMFeature::LOG_RETURNS);
    ASSERT_EQ(labels.size(), 3u);
    EXPECT_EQ(labels[0], VolatilityRegime::HIGH_VOLATILITY);
    EXPECT_EQ(labels[1], VolatilityRegime::LOW_VOLATILITY);
    EXPECT_EQ(labels[2], VolatilityRegime::MODERATE);

    Eigen::VectorXd abs_means(2);
    abs_means << 0.02, 0.001;
    auto by_mean = label_states_by_volatility(abs_means, stds.head(2), HMMFeature::ABSOLUTE_RETURNS);
    EXPECT_EQ(by_mean[0], VolatilityRegime::HIGH_VOLATILITY);
    EXPECT_EQ(by_mean[1], VolatilityRegime::LOW_VOLATILITY);
}

TEST_F(AdvancedDetectorTest, HmmRegimeNeedsLookbackBars) {
    auto result = detect_regime_hmm(random_walk_bars(100, 3));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().regime, VolatilityRegime::UNKNOWN);
    EXPECT_DOUBLE_EQ(result.value().confidence, 0.0);
    EXPECT_EQ(result.value().current_state, -1);
}

TEST_F(AdvancedDetectorTest, HmmRegimeSeesVolatileTail) {
    HMMRegimeOptions options;
    options.num_states = 2;
    options.lookback = 301;
    options.seed = 11u;

    auto result = detect_regime_hmm(calm_then_wild_bars(), options);
    ASSERT_TRUE(result.is_ok());
    const auto& hmm = result.value();
    EXPECT_EQ(hmm.regime, VolatilityRegime::HIGH_VOLATILITY);
    EXPECT_EQ(hmm.states.size(), 300u);
    ASSERT_EQ(hmm.probabilities.size(), 2u);
    EXPECT_NEAR(hmm.probabilities[0] + hmm.probabilities[1], 1.0, 1e-6);
    EXPECT_GE(hmm.confidence, 50.0);
    EXPECT_EQ(hmm.transition.rows(), 2);
}

TEST_F(AdvancedDetectorTest, GarchRegimeShortWindowIsUnknown) {
    auto result = detect_volatility_regime_garch(random_walk_bars(50, 3));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().regime, VolatilityRegime::UNKNOWN);
    EXPECT_DOUBLE_EQ(result.value().confidence, 0.0);
}

TEST_F(AdvancedDetectorTest, PersistenceVerdictFollowsHurst) {
    auto result = classify_trend_persistence(random_walk_bars(400, 21));
    ASSERT_TRUE(result.is_ok());
    const auto& persistence = result.value();
    EXPECT_NEAR(persistence.confidence, std::abs(persistence.hurst_exponent - 0.5) * 200.0, 1e-9);

    if (persistence.hurst_exponent > 0.6) {
        EXPECT_EQ(persistence.regime, PersistenceRegime::TRENDING);
    } else if (persistence.hurst_exponent < 0.4) {
        EXPECT_EQ(persistence.regime, PersistenceRegime::MEAN_REVERTING);
    } else {
        EXPECT_EQ(persistence.regime, PersistenceRegime::RANDOM);
        EXPECT_EQ(persistence.interpretation, "Random walk behavior");
    }
}

TEST_F(AdvancedDetectorTest, ShortWindowIsUnknown) {
    auto bars = rising_bars(30);
    auto result = detect_regime_advanced(bars);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().regime, AdvancedRegime::UNKNOWN);
    EXPECT_DOUBLE_EQ(result.value().confidence, 0.0);
    EXPECT_EQ(result.value().time, bars.back().time);
}

TEST_F(AdvancedDetectorTest, MinimumWindowGetsHurstReading) {
    std::vector<double> closes;
    for (int i = 0; i < 100; ++i) closes.push_back(i % 2 == 0 ? 100.0 : 102.0);
    auto bars = signal_ngin::testing::make_bars(closes);

    AdvancedDetectorConfig config;
    config.hmm_seed = 5u;
    ASSERT_EQ(bars.size(), static_cast<size_t>(config.min_bars));

    auto result = detect_regime_advanced(bars, config);
    ASSERT_TRUE(result.is_ok());
    EXPECT_NEAR(result.value().analysis.hurst_exponent, 0.0, 1e-9);
    EXPECT_EQ(result.value().regime, AdvancedRegime::MEAN_REVERTING);
    EXPECT_DOUBLE_EQ(result.value().confidence, 100.0);
    EXPECT_EQ(result.value().interpretation.trend, "Mean reverting");
}

TEST_F(AdvancedDetectorTest, SeededDetectionIsDeterministic) {
    AdvancedDetectorConfig config;
    config.hmm_seed = 5u;
    auto bars = random_walk_bars(300, 9);

    auto first = detect_regime_advanced(bars, config);
    auto second = detect_regime_advanced(bars, config);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    EXPECT_EQ(first.value().regime, second.value().regime);
    EXPECT_DOUBLE_EQ(first.value().confidence, second.value().confidence);
    EXPECT_EQ(first.value().analysis.hmm_state, second.value().analysis.hmm_state);
    EXPECT_DOUBLE_EQ(first.value().analysis.hurst_exponent,
                     second.value().analysis.hurst_exponent);

    EXPECT_NE(first.value().regime, AdvancedRegime::UNKNOWN);
    EXPECT_GE(first.value().confidence, 0.0);
    EXPECT_LE(first.value().confidence, 100.0);
    EXPECT_FALSE(first.value().interpretation.trend.empty());
}

TEST_F(AdvancedDetectorTest, RejectsMalformedWindow) {
    auto bars = random_walk_bars(150, 4);
    bars[20].low = bars[20].high + 1.0;

    auto result = detect_regime_advanced(bars);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(AdvancedDetectorTest, ConfigRoundTripKeepsSeed) {
    AdvancedDetectorConfig config;
    config.hmm_seed = 17u;
    config.min_bars = 120;

    AdvancedDetectorConfig restored;
    restored.from_json(config.to_json());
    ASSERT_TRUE(restored.hmm_seed.has_value());
    EXPECT_EQ(*restored.hmm_seed, 17u);
    EXPECT_EQ(restored.min_bars, 120);

    auto j = config.to_json();
    j["hmm_seed"] = nullptr;
    restored.from_json(j);
    EXPECT_FALSE(restored.hmm_seed.has_value());
}
