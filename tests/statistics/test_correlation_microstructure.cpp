#include <gtest/gtest.h>
#include <vector>
#include "../test_helpers.hpp"
#include "signal_ngin/statistics/correlation.hpp"
#include "signal_ngin/statistics/microstructure.hpp"

using namespace signal_ngin;
using namespace signal_ngin::statistics;

TEST(CorrelationTest, RollingCorrelationOfScaledSeries) {
    std::vector<double> x{1, 3, 2, 5, 4, 6, 8, 7};
    std::vector<double> y;
    for (double v : x) y.push_back(2.0 * v + 1.0);

    auto rolling = rolling_correlation(x, y, 4);
    ASSERT_EQ(rolling.size(), 5u);
    for (double c : rolling) EXPECT_NEAR(c, 1.0, 1e-12);
    EXPECT_TRUE(rolling_correlation(x, y, 20).empty());
}

TEST(CorrelationTest, DccFlagsCorrelationBreakdown) {
    std::vector<double> a, b;
    for (int i = 0; i < 60; ++i) {
        double v = (i % 3) - 1.0;
        a.push_back(v);
        b.push_back(i < 50 ? v : -v);
    }
    auto dcc = calculate_dcc(a, b, 10);
    EXPECT_EQ(dcc.series.size(), 51u);
    EXPECT_NEAR(dcc.current_correlation, -1.0, 1e-9);
    EXPECT_EQ(dcc.regime, CorrelationRegime::LOW_CORRELATION);
    EXPECT_EQ(to_string(dcc.regime), "low_correlation");
}

TEST(CorrelationTest, BetaAgainstMarket) {
    std::vector<double> market{0.01, -0.02, 0.015, 0.005, -0.01};
    std::vector<double> asset;
    for (double r : market) asset.push_back(1.5 * r);
    EXPECT_NEAR(calculate_beta(asset, market), 1.5, 1e-12);
    EXPECT_DOUBLE_EQ(calculate_beta(asset, std::vector<double>(5, 0.01)), 1.0);
}

TEST(MicrostructureTest, RollSpreadFromBidAskBounce) {
    std::vector<double> bounce;
    for (int i = 0; i < 40; ++i) bounce.push_back(i % 2 == 0 ? 100.0 : 101.0);
    EXPECT_NEAR(roll_spread(bounce), 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(roll_spread({100.0, 101.0}), 0.0);

    std::vector<double> trend{100, 101, 102, 103, 104};
    EXPECT_DOUBLE_EQ(roll_spread(trend), 0.0);
}

TEST(MicrostructureTest, AmihudIlliquidity) {
    std::vector<Bar> bars{Bar(1, 100.0, 101.5, 99.5, 101.0, 1000.0),
                          Bar(2, 101.0, 101.5, 100.5, 101.0, 1000.0)};
    double first = (1.0 / 100.0) / (101.0 * 1000.0 / 1e6);
    EXPECT_NEAR(amihud_illiquidity(bars), first / 2.0, 1e-12);

    bars[0].volume = 0.0;
    bars[1].volume = 0.0;
    EXPECT_DOUBLE_EQ(amihud_illiquidity(bars), 0.0);
}

TEST(MicrostructureTest, OrderFlowImbalanceSigns) {
    std::vector<Bar> bars{Bar(1, 10, 11, 9, 10.5, 100), Bar(2, 10.5, 11, 9, 10.0, 100),
                          Bar(3, 10, 11, 9, 10.0, 100), Bar(4, 10, 11, 9, 10.5, 0)};
    auto flow = order_flow_imbalance(bars);
    ASSERT_EQ(flow.size(), 4u);
    EXPECT_DOUBLE_EQ(flow[0], 1.0);
    EXPECT_DOUBLE_EQ(flow[1], -1.0);
    EXPECT_DOUBLE_EQ(flow[2], 0.0);
    EXPECT_DOUBLE_EQ(flow[3], 0.0);
}
