// include/signal_ngin/indicators/overlays.hpp
#pragma once

#include <array>
#include <optional>
#include <utility>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {
namespace indicators {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Periods and multipliers for every overlay calculator
 */
struct OverlayConfig : public ConfigBase {
    // fast/slow EMA pairs
    std::vector<std::pair<int, int>> ema_clouds{{8, 21}, {5, 12}, {8, 9}, {34, 50}};

    int tenkan_period{9};
    int kijun_period{26};
    int senkou_b_period{52};

    int ribbon_fast{8};
    int ribbon_mid{21};
    int ribbon_slow{34};

    int atr_period{14};  // SATY levels

    int squeeze_period{20};
    double bb_multiplier{2.0};
    double kc_multiplier{1.5};
    int momentum_period{20};

    int ripster_fast{34};
    int ripster_slow{50};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

// ============================================================================
// Overlay Records
// ============================================================================

struct EmaCloud {
    int fast_period{8};
    int slow_period{21};
    IndicatorSeries fast;
    IndicatorSeries slow;
};

/**
 * @brief Ichimoku lines
 * span_a and span_b hold bars.size() + shift entries: the value computed at
 * bar i is plotted at index i + shift. chikou holds close[i + shift] at i.
 */
struct IchimokuCloud {
    IndicatorSeries tenkan;
    IndicatorSeries kijun;
    IndicatorSeries span_a;
    IndicatorSeries span_b;
    IndicatorSeries chikou;
    int shift{26};
};

struct PivotRibbon {
    IndicatorSeries fast;
    IndicatorSeries mid;
    IndicatorSeries slow;
    std::vector<Trend> states;
};

constexpr std::array<double, 5> SATY_MULTIPLES{0.236, 0.618, 1.0, 1.236, 1.618};

/**
 * @brief ATR levels around the prior close for one bar
 */
struct SatyLevels {
    bool valid{false};
    Price pivot{0.0};
    double atr{0.0};
    std::array<Price, 5> up{};
    std::array<Price, 5> down{};
    double range_used{0.0};  // fraction of one ATR used by the bar's excursion
    TradeDirection direction{TradeDirection::NONE};
};

/**
 * @brief Bollinger / Keltner bands and regression momentum
 * squeeze_on is empty inside the warmup, true when Bollinger lies fully
 * inside Keltner.
 */
struct TtmBands {
    IndicatorSeries basis;
    IndicatorSeries bb_upper;
    IndicatorSeries bb_lower;
    IndicatorSeries kc_upper;
    IndicatorSeries kc_lower;
    IndicatorSeries momentum;
    std::vector<std::optional<bool>> squeeze_on;
};

struct OverlayBundle {
    std::vector<EmaCloud> ema_clouds;
    IchimokuCloud ichimoku;
    PivotRibbon pivot_ribbon;
    IndicatorSeries atr;
    SatyLevels saty;  // as of the last bar
    TtmBands ttm;
    std::vector<Trend> ripster;
};

// ============================================================================
// Calculators
// ============================================================================

EmaCloud ema_cloud(const std::vector<double>& close, int fast = 8, int slow = 21);

IchimokuCloud ichimoku(const std::vector<Bar>& bars, int tenkan_period = 9,
                       int kijun_period = 26, int senkou_b_period = 52);

/**
 * @brief Cloud verdict for the bar at index
 * @return BULLISH above both spans plotted at index, BEARISH below both,
 *         NEUTRAL inside the cloud or when a span is undefined
 */
Trend ichimoku_regime_at(const IchimokuCloud& cloud, double close, size_t index);

/**
 * @brief EMA trio with a per-bar verdict
 *
 * Bullish when fast > mid > slow, close > mid and the fast EMA rose on the
 * bar; bearish is the mirror image; anything else is neutral.
 */
PivotRibbon pivot_ribbon(const std::vector<double>& close, int fast = 8, int mid = 21,
                         int slow = 34);

/**
 * @brief SATY levels for the bar at index
 *
 * The pivot is the previous bar's close and the ATR is taken as of the
 * previous bar. Direction is LONG once close clears pivot + 0.236 ATR and
 * SHORT below pivot - 0.236 ATR.
 *
 * @param atr_series Output of atr(bars, period) for the same bars
 */
SatyLevels saty_levels_at(const std::vector<Bar>& bars, const IndicatorSeries& atr_series,
                          size_t index);

SatyLevels saty_atr_levels(const std::vector<Bar>& bars, int atr_period = 14);

TtmBands ttm_bands(const std::vector<Bar>& bars, int period = 20, double bb_multiplier = 2.0,
                   double kc_multiplier = 1.5, int momentum_period = 20);

/**
 * @brief 34/50 EMA bias: bullish when fast > slow and close is above both
 */
std::vector<Trend> ripster_bias(const std::vector<double>& close, int fast = 34, int slow = 50);

/**
 * @brief Run every overlay calculator over a validated bar window
 * @return INVALID_DATA if the window violates the input contract
 */
Result<OverlayBundle> compute_overlays(const std::vector<Bar>& bars,
                                       const OverlayConfig& config = OverlayConfig());

}  // namespace indicators
}  // namespace signal_ngin
