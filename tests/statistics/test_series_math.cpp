#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "../test_helpers.hpp"
#include "signal_ngin/statistics/hurst.hpp"
#include "signal_ngin/statistics/series_math.hpp"

using namespace signal_ngin;
using namespace signal_ngin::statistics;

class SeriesMathTest : public ::testing::Test {
protected:
    std::vector<double> ramp_{1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
};

TEST_F(SeriesMathTest, SmaWarmupAndValues) {
    auto out = sma(ramp_, 3);
    ASSERT_EQ(out.size(), ramp_.size());
    EXPECT_FALSE(is_defined(out[0]));
    EXPECT_FALSE(is_defined(out[1]));
    EXPECT_DOUBLE_EQ(out[2], 2.0);
    EXPECT_DOUBLE_EQ(out[9], 9.0);
}

TEST_F(SeriesMathTest, SmaPropagatesUndefinedInputs) {
    std::vector<double> values{1, 2, UNDEFINED_VALUE, 4, 5, 6};
    auto out = sma(values, 2);
    EXPECT_DOUBLE_EQ(out[1], 1.5);
    EXPECT_FALSE(is_defined(out[2]));
    EXPECT_FALSE(is_defined(out[3]));
    EXPECT_DOUBLE_EQ(out[4], 4.5);
}

TEST_F(SeriesMathTest, EmaSeedsWithSmaThenRecurses) {
    auto out = ema(ramp_, 4);
    EXPECT_FALSE(is_defined(out[2]));
    EXPECT_DOUBLE_EQ(out[3], 2.5);

    double k = 2.0 / 5.0;
    double expected = 2.5;
    for (size_t i = 4; i < ramp_.size(); ++i) {
        expected = ramp_[i] * k + expected * (1.0 - k);
        EXPECT_NEAR(out[i], expected, 1e-12);
    }
}

TEST_F(SeriesMathTest, EmaSkipsLeadingUndefinedValues) {
    std::vector<double> values{UNDEFINED_VALUE, UNDEFINED_VALUE, 2, 4, 6, 8};
    auto out = ema(values, 2);
    EXPECT_FALSE(is_defined(out[2]));
    EXPECT_DOUBLE_EQ(out[3], 3.0);
    EXPECT_NEAR(out[4], 6.0 * (2.0 / 3.0) + 3.0 / 3.0, 1e-12);
}

TEST_F(SeriesMathTest, ShortInputStaysUndefined) {
    auto out = sma({1.0, 2.0}, 5);
    EXPECT_FALSE(is_defined(out[0]));
    EXPECT_FALSE(is_defined(out[1]));
    EXPECT_TRUE(ema({}, 3).empty());
}

TEST_F(SeriesMathTest, DescriptiveStatistics) {
    std::vector<double> values{2, 4, 4, 4, 5, 5, 7, 9};
    EXPECT_DOUBLE_EQ(mean(values), 5.0);
    EXPECT_DOUBLE_EQ(variance(values), 4.0);
    EXPECT_DOUBLE_EQ(std_dev(values), 2.0);
    EXPECT_DOUBLE_EQ(median(values), 4.5);
    EXPECT_DOUBLE_EQ(median({3, 1, 2}), 2.0);
    EXPECT_TRUE(std::isnan(mean({})));
}

TEST_F(SeriesMathTest, CorrelationAndAutocorrelation) {
    std::vector<double> doubled;
    for (double v : ramp_) doubled.push_back(2.0 * v);
    EXPECT_NEAR(correlation(ramp_, doubled), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(correlation(ramp_, std::vector<double>(10, 3.0)), 0.0);

    std::vector<double> alternating;
    for (int i = 0; i < 20; ++i) alternating.push_back(i % 2 == 0 ? 1.0 : -1.0);
    EXPECT_NEAR(autocorrelation(alternating, 1), -19.0 / 20.0, 1e-12);
    EXPECT_DOUBLE_EQ(autocorrelation(alternating, 25), 0.0);
    EXPECT_DOUBLE_EQ(autocorrelation(std::vector<double>(10, 1.0), 1), 0.0);
}

TEST_F(SeriesMathTest, Returns) {
    std::vector<double> prices{100, 110, 99};
    auto simple = simple_returns(prices);
    ASSERT_EQ(simple.size(), 2u);
    EXPECT_NEAR(simple[0], 0.1, 1e-12);
    EXPECT_NEAR(simple[1], -0.1, 1e-12);

    auto logs = log_returns(prices);
    EXPECT_NEAR(logs[0], std::log(1.1), 1e-12);
    EXPECT_DOUBLE_EQ(log_returns({100, 0, 100})[0], 0.0);
    EXPECT_TRUE(log_returns({100}).empty());
}

TEST_F(SeriesMathTest, RollingWindows) {
    auto highs = rolling_max(ramp_, 3);
    auto lows = rolling_min(ramp_, 3);
    auto spread = rolling_std(std::vector<double>(5, 2.0), 3);
    EXPECT_FALSE(is_defined(highs[1]));
    EXPECT_DOUBLE_EQ(highs[4], 5.0);
    EXPECT_DOUBLE_EQ(lows[4], 3.0);
    EXPECT_DOUBLE_EQ(spread[4], 0.0);
}

TEST_F(SeriesMathTest, RegressionSlope) {
    EXPECT_NEAR(linear_regression_slope(ramp_), 1.0, 1e-12);
    EXPECT_NEAR(linear_regression_slope({5, 5, 5}), 0.0, 1e-12);
    EXPECT_TRUE(std::isnan(linear_regression_slope({1.0})));

    auto slopes = rolling_slope(ramp_, 4);
    EXPECT_FALSE(is_defined(slopes[2]));
    EXPECT_NEAR(slopes[3], 1.0, 1e-12);
}

TEST_F(SeriesMathTest, PercentileRankCountsStrictlyBelow) {
    std::vector<double> reference{1, 2, 3, 4};
    EXPECT_DOUBLE_EQ(percentile_rank(reference, 3.0), 50.0);
    EXPECT_DOUBLE_EQ(percentile_rank(reference, 10.0), 100.0);
    EXPECT_DOUBLE_EQ(percentile_rank({}, 1.0), 50.0);
}

TEST_F(SeriesMathTest, EmaOfConstantSeries) {
    const int period = 10;
    std::vector<double> constant(60, 7.5);
    auto out = ema(constant, period);

    ASSERT_EQ(out.size(), constant.size());
    for (int i = 0; i < period - 1; ++i) {
        EXPECT_FALSE(is_defined(out[i])) << "index " << i;
    }
    for (size_t i = period - 1; i < out.size(); ++i) {
        ASSERT_TRUE(is_defined(out[i])) << "index " << i;
        EXPECT_NEAR(out[i], 7.5, 1e-12);
    }
}

TEST_F(SeriesMathTest, DeterministicAcrossCalls) {
    auto walk = signal_ngin::testing::closes_of(signal_ngin::testing::random_walk_bars(400, 31));

    EXPECT_TRUE(signal_ngin::testing::same_series(sma(walk, 20), sma(walk, 20)));
    EXPECT_TRUE(signal_ngin::testing::same_series(ema(walk, 21), ema(walk, 21)));

    auto returns = log_returns(walk);
    double first = calculate_hurst_exponent(returns);
    double second = calculate_hurst_exponent(returns);
    EXPECT_EQ(first, second);
}
