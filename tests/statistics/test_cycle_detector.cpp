#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "signal_ngin/statistics/cycle_detector.hpp"
#include "signal_ngin/statistics/numeric_utils.hpp"

using namespace signal_ngin::statistics;

class CycleDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 0; i < 200; ++i) {
            sine_.push_back(std::sin(2.0 * M_PI * i / 8.0));
        }
    }

    std::vector<double> sine_;
};

TEST_F(CycleDetectorTest, FindsPeriodOfSine) {
    auto cycle = detect_dominant_cycle(sine_, 5, 50);
    EXPECT_EQ(cycle.period, 8);
    EXPECT_NEAR(cycle.strength, 0.96, 1e-9);
    EXPECT_EQ(cycle.interpretation, "Strong cycle detected");
}

TEST_F(CycleDetectorTest, ConstantSeriesHasNoCycle) {
    auto cycle = detect_dominant_cycle(std::vector<double>(100, 2.0));
    EXPECT_EQ(cycle.period, 5);
    EXPECT_DOUBLE_EQ(cycle.strength, 0.0);
    EXPECT_EQ(cycle.interpretation, "Weak or no cycle");
}

TEST_F(CycleDetectorTest, SpectrumCoversPeriodsBelowHalfLength) {
    auto result = detect_cycles_spectral(sine_, 3);
    ASSERT_EQ(result.spectrum.size(), 98u);
    EXPECT_EQ(result.spectrum.front().period, 2);
    EXPECT_EQ(result.spectrum.back().period, 99);

    ASSERT_EQ(result.dominant_cycles.size(), 3u);
    EXPECT_GE(result.dominant_cycles[0].power, result.dominant_cycles[1].power);
    EXPECT_GE(result.dominant_cycles[1].power, result.dominant_cycles[2].power);
    EXPECT_EQ(result.dominant_cycles[0].period % 4, 0);
}

TEST_F(CycleDetectorTest, TinySeriesHasEmptySpectrum) {
    auto result = detect_cycles_spectral({1.0, 2.0, 3.0});
    EXPECT_TRUE(result.spectrum.empty());
    EXPECT_TRUE(result.dominant_cycles.empty());
}
