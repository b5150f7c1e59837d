#include <gtest/gtest.h>
#include <optional>
#include <vector>
#include "../test_helpers.hpp"
#include "signal_ngin/indicators/overlays.hpp"
#include "signal_ngin/indicators/squeeze.hpp"

using namespace signal_ngin;
using namespace signal_ngin::indicators;
using namespace signal_ngin::testing;

class SqueezeTest : public TestBase {};

TEST_F(SqueezeTest, StateMachineTransitions) {
    std::vector<std::optional<bool>> readings{std::nullopt, true, true, false,
                                              false,        false, true};
    IndicatorSeries momentum{UNDEFINED_VALUE, 0.1, 0.2, 0.5, 0.4, -0.3, 0.0};

    auto states = scan_squeeze(readings, momentum);
    ASSERT_EQ(states.size(), readings.size());

    EXPECT_FALSE(states[0].on);
    EXPECT_FALSE(states[0].fired);
    EXPECT_FALSE(states[0].fired_bars_ago.has_value());

    EXPECT_TRUE(states[1].on);
    EXPECT_TRUE(states[2].on);

    EXPECT_FALSE(states[3].on);
    EXPECT_TRUE(states[3].fired);
    EXPECT_EQ(states[3].direction, TradeDirection::LONG);
    ASSERT_TRUE(states[3].fired_bars_ago.has_value());
    EXPECT_EQ(*states[3].fired_bars_ago, 0);

    EXPECT_FALSE(states[4].fired);
    EXPECT_EQ(*states[4].fired_bars_ago, 1);
    EXPECT_EQ(states[4].direction, TradeDirection::LONG);
    EXPECT_EQ(*states[5].fired_bars_ago, 2);

    EXPECT_TRUE(states[6].on);
    EXPECT_FALSE(states[6].fired_bars_ago.has_value());
    EXPECT_EQ(states[6].direction, TradeDirection::NONE);
}

TEST_F(SqueezeTest, ReleaseDirectionFollowsMomentumSign) {
    std::vector<std::optional<bool>> readings{true, false};
    EXPECT_EQ(current_squeeze(readings, {0.0, -2.0}).direction, TradeDirection::SHORT);
    EXPECT_EQ(current_squeeze(readings, {0.0, 0.0}).direction, TradeDirection::NONE);
    EXPECT_EQ(current_squeeze(readings, {0.0, UNDEFINED_VALUE}).direction,
              TradeDirection::NONE);
}

TEST_F(SqueezeTest, EmptyWindowIsOff) {
    auto state = current_squeeze({}, {});
    EXPECT_FALSE(state.on);
    EXPECT_FALSE(state.fired);
}

TEST_F(SqueezeTest, BreakoutFromFlatBaseFiresLong) {
    std::vector<double> closes(40, 100.0);
    closes.push_back(103.0);
    closes.push_back(106.0);
    auto bars = make_bars(closes);

    auto bands = ttm_bands(bars);
    auto states = scan_squeeze(bands.squeeze_on, bands.momentum);

    EXPECT_TRUE(states[39].on);
    EXPECT_TRUE(states[40].on);
    const auto& release = states[41];
    EXPECT_FALSE(release.on);
    EXPECT_TRUE(release.fired);
    EXPECT_EQ(release.direction, TradeDirection::LONG);
    EXPECT_EQ(release.fired_bars_ago, std::optional<int>(0));
}
