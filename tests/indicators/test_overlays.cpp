#include <gtest/gtest.h>
#include <vector>
#include "../test_helpers.hpp"
#include "signal_ngin/indicators/overlays.hpp"
#include "signal_ngin/indicators/squeeze.hpp"
#include "signal_ngin/indicators/volatility.hpp"
#include "signal_ngin/statistics/series_math.hpp"

using namespace signal_ngin;
using namespace signal_ngin::indicators;
using namespace signal_ngin::testing;

class OverlaysTest : public TestBase {};

TEST_F(OverlaysTest, EmaCloudMatchesManualRecursion) {
    auto bars = rising_bars(30);
    auto close = closes_of(bars);
    auto cloud = ema_cloud(close, 8, 21);

    double expected = (100.0 + 107.0) / 2.0;  // SMA of the first eight closes
    EXPECT_FALSE(is_defined(cloud.fast[6]));
    EXPECT_DOUBLE_EQ(cloud.fast[7], expected);
    double k = 2.0 / 9.0;
    for (size_t i = 8; i < close.size(); ++i) {
        expected = close[i] * k + expected * (1.0 - k);
    }
    EXPECT_NEAR(cloud.fast.back(), expected, 1e-9);
    EXPECT_FALSE(is_defined(cloud.slow[19]));
    EXPECT_TRUE(is_defined(cloud.slow[20]));
}

TEST_F(OverlaysTest, TrueRangeAndWilderAtr) {
    auto bars = rising_bars(30);
    auto tr = true_range(bars);
    EXPECT_DOUBLE_EQ(tr[0], 1.0);
    EXPECT_DOUBLE_EQ(tr[1], 1.5);

    auto series = atr(bars, 14);
    EXPECT_FALSE(is_defined(series[12]));
    EXPECT_NEAR(series[13], (1.0 + 13 * 1.5) / 14.0, 1e-12);
    EXPECT_NEAR(series[14], (series[13] * 13 + 1.5) / 14.0, 1e-12);
    EXPECT_TRUE(atr(rising_bars(5), 14).size() == 5u);
}

TEST_F(OverlaysTest, IchimokuLinesAndDisplacement) {
    auto bars = rising_bars(80);
    auto cloud = ichimoku(bars);

    EXPECT_EQ(cloud.shift, 26);
    ASSERT_EQ(cloud.span_a.size(), 106u);
    ASSERT_EQ(cloud.chikou.size(), 80u);

    EXPECT_DOUBLE_EQ(cloud.tenkan[8], (108.5 + 99.5) / 2.0);
    EXPECT_DOUBLE_EQ(cloud.kijun[25], (125.5 + 99.5) / 2.0);
    EXPECT_DOUBLE_EQ(cloud.span_a[25 + 26], (cloud.tenkan[25] + cloud.kijun[25]) / 2.0);
    EXPECT_FALSE(is_defined(cloud.span_b[50 + 26]));
    EXPECT_DOUBLE_EQ(cloud.span_b[51 + 26], (151.5 + 99.5) / 2.0);
    EXPECT_DOUBLE_EQ(cloud.chikou[0], bars[26].close);

    // Price running above a rising cloud
    EXPECT_EQ(ichimoku_regime_at(cloud, bars[79].close, 79), Trend::BULLISH);
    EXPECT_EQ(ichimoku_regime_at(cloud, 0.0, 79), Trend::BEARISH);
    EXPECT_EQ(ichimoku_regime_at(cloud, 100.0, 10), Trend::NEUTRAL);
}

TEST_F(OverlaysTest, PivotRibbonFollowsTrendDirection) {
    auto up = pivot_ribbon(closes_of(rising_bars(60)));
    EXPECT_EQ(up.states[32], Trend::NEUTRAL);
    EXPECT_EQ(up.states[59], Trend::BULLISH);

    auto down = pivot_ribbon(closes_of(falling_bars(60)));
    EXPECT_EQ(down.states[59], Trend::BEARISH);

    auto flat = pivot_ribbon(closes_of(flat_bars(60)));
    EXPECT_EQ(flat.states[59], Trend::NEUTRAL);
}

TEST_F(OverlaysTest, SatyLevelsAnchorOnPriorClose) {
    auto bars = rising_bars(30);
    auto atr_series = atr(bars, 14);
    auto levels = saty_atr_levels(bars, 14);

    ASSERT_TRUE(levels.valid);
    EXPECT_DOUBLE_EQ(levels.pivot, 128.0);
    EXPECT_DOUBLE_EQ(levels.atr, atr_series[28]);
    for (size_t k = 0; k < SATY_MULTIPLES.size(); ++k) {
        EXPECT_NEAR(levels.up[k], 128.0 + SATY_MULTIPLES[k] * levels.atr, 1e-12);
        EXPECT_NEAR(levels.down[k], 128.0 - SATY_MULTIPLES[k] * levels.atr, 1e-12);
    }
    EXPECT_NEAR(levels.range_used, 1.5 / levels.atr, 1e-12);
    EXPECT_EQ(levels.direction, TradeDirection::LONG);

    auto falling = saty_atr_levels(falling_bars(30), 14);
    EXPECT_EQ(falling.direction, TradeDirection::SHORT);
}

TEST_F(OverlaysTest, SatyLevelsWithZeroAtrHaveNoDirection) {
    auto bars = make_bars(std::vector<double>(20, 50.0), 0.0);
    auto levels = saty_atr_levels(bars, 14);
    EXPECT_TRUE(levels.valid);
    EXPECT_DOUBLE_EQ(levels.atr, 0.0);
    EXPECT_DOUBLE_EQ(levels.range_used, 0.0);
    EXPECT_EQ(levels.direction, TradeDirection::NONE);

    EXPECT_FALSE(saty_atr_levels(rising_bars(10), 14).valid);
}

TEST_F(OverlaysTest, FlatSeriesSitsInSqueeze) {
    auto bars = flat_bars(40);
    auto bands = ttm_bands(bars);

    EXPECT_FALSE(bands.squeeze_on[18].has_value());
    for (size_t i = 19; i < bars.size(); ++i) {
        ASSERT_TRUE(bands.squeeze_on[i].has_value());
        EXPECT_TRUE(*bands.squeeze_on[i]) << "index " << i;
        EXPECT_NEAR(bands.momentum[i], 0.0, 1e-12);
    }
    EXPECT_DOUBLE_EQ(bands.kc_upper[39], 100.0 + 1.5 * 1.0);
}

TEST_F(OverlaysTest, RipsterBias) {
    auto up = ripster_bias(closes_of(rising_bars(60)));
    EXPECT_EQ(up[48], Trend::NEUTRAL);
    EXPECT_EQ(up[59], Trend::BULLISH);
    EXPECT_EQ(ripster_bias(closes_of(falling_bars(60)))[59], Trend::BEARISH);
}

TEST_F(OverlaysTest, ComputeOverlaysBundlesEverything) {
    auto bars = rising_bars(80);
    OverlayConfig config;
    auto bundle = compute_overlays(bars, config);
    ASSERT_TRUE(bundle.is_ok());

    const auto& b = bundle.value();
    EXPECT_EQ(b.ema_clouds.size(), config.ema_clouds.size());
    EXPECT_EQ(b.atr.size(), bars.size());
    EXPECT_EQ(b.ripster.size(), bars.size());
    EXPECT_EQ(b.ttm.squeeze_on.size(), bars.size());
    EXPECT_TRUE(b.saty.valid);
}

TEST_F(OverlaysTest, ComputeOverlaysRejectsMalformedBars) {
    auto bars = rising_bars(30);
    bars[10].low = bars[10].high + 1.0;
    auto bundle = compute_overlays(bars, OverlayConfig());
    ASSERT_TRUE(bundle.is_error());
    EXPECT_EQ(bundle.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(OverlaysTest, ConfigRoundTrip) {
    OverlayConfig config;
    config.ema_clouds = {{3, 7}};
    config.kc_multiplier = 2.0;

    OverlayConfig restored;
    restored.from_json(config.to_json());
    ASSERT_EQ(restored.ema_clouds.size(), 1u);
    EXPECT_EQ(restored.ema_clouds[0].first, 3);
    EXPECT_EQ(restored.ema_clouds[0].second, 7);
    EXPECT_DOUBLE_EQ(restored.kc_multiplier, 2.0);
}

TEST_F(OverlaysTest, DeterministicAcrossCalls) {
    auto bars = random_walk_bars(200, 17);

    auto first = ichimoku(bars);
    auto second = ichimoku(bars);
    EXPECT_TRUE(same_series(first.tenkan, second.tenkan));
    EXPECT_TRUE(same_series(first.kijun, second.kijun));
    EXPECT_TRUE(same_series(first.span_a, second.span_a));
    EXPECT_TRUE(same_series(first.span_b, second.span_b));
    EXPECT_TRUE(same_series(first.chikou, second.chikou));

    auto bands = ttm_bands(bars);
    auto again = ttm_bands(bars);
    EXPECT_TRUE(same_series(bands.bb_upper, again.bb_upper));
    EXPECT_TRUE(same_series(bands.kc_lower, again.kc_lower));
    EXPECT_TRUE(same_series(bands.momentum, again.momentum));
    EXPECT_EQ(bands.squeeze_on, again.squeeze_on);

    auto states = scan_squeeze(bands.squeeze_on, bands.momentum);
    auto replay = scan_squeeze(again.squeeze_on, again.momentum);
    ASSERT_EQ(states.size(), replay.size());
    for (size_t i = 0; i < states.size(); ++i) {
        EXPECT_EQ(states[i].on, replay[i].on);
        EXPECT_EQ(states[i].fired, replay[i].fired);
        EXPECT_EQ(states[i].direction, replay[i].direction);
        EXPECT_EQ(states[i].fired_bars_ago, replay[i].fired_bars_ago);
    }
}
