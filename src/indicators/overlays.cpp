// src/indicators/overlays.cpp

#include "signal_ngin/indicators/overlays.hpp"
#include <algorithm>
#include <cmath>
#include "signal_ngin/core/bar_validation.hpp"
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/indicators/volatility.hpp"
#include "signal_ngin/statistics/series_math.hpp"

namespace signal_ngin {
namespace indicators {

namespace {

IndicatorSeries rolling_midpoint(const std::vector<double>& high, const std::vector<double>& low,
                                 int period) {
    IndicatorSeries hi = statistics::rolling_max(high, period);
    IndicatorSeries lo = statistics::rolling_min(low, period);
    IndicatorSeries mid(high.size(), UNDEFINED_VALUE);
    for (size_t i = 0; i < mid.size(); ++i) {
        if (is_defined(hi[i]) && is_defined(lo[i])) {
            mid[i] = (hi[i] + lo[i]) / 2.0;
        }
    }
    return mid;
}

}  // namespace

// ============================================================================
// OverlayConfig
// ============================================================================

nlohmann::json OverlayConfig::to_json() const {
    nlohmann::json j;
    j["ema_clouds"] = nlohmann::json::array();
    for (const auto& [fast, slow] : ema_clouds) {
        j["ema_clouds"].push_back({fast, slow});
    }
    j["tenkan_period"] = tenkan_period;
    j["kijun_period"] = kijun_period;
    j["senkou_b_period"] = senkou_b_period;
    j["ribbon_fast"] = ribbon_fast;
    j["ribbon_mid"] = ribbon_mid;
    j["ribbon_slow"] = ribbon_slow;
    j["atr_period"] = atr_period;
    j["squeeze_period"] = squeeze_period;
    j["bb_multiplier"] = bb_multiplier;
    j["kc_multiplier"] = kc_multiplier;
    j["momentum_period"] = momentum_period;
    j["ripster_fast"] = ripster_fast;
    j["ripster_slow"] = ripster_slow;
    return j;
}

void OverlayConfig::from_json(const nlohmann::json& j) {
    if (j.contains("ema_clouds")) {
        ema_clouds.clear();
        for (const auto& pair : j.at("ema_clouds")) {
            ema_clouds.emplace_back(pair.at(0).get<int>(), pair.at(1).get<int>());
        }
    }
    if (j.contains("tenkan_period"))
        tenkan_period = j.at("tenkan_period").get<int>();
    if (j.contains("kijun_period"))
        kijun_period = j.at("kijun_period").get<int>();
    if (j.contains("senkou_b_period"))
        senkou_b_period = j.at("senkou_b_period").get<int>();
    if (j.contains("ribbon_fast"))
        ribbon_fast = j.at("ribbon_fast").get<int>();
    if (j.contains("ribbon_mid"))
        ribbon_mid = j.at("ribbon_mid").get<int>();
    if (j.contains("ribbon_slow"))
        ribbon_slow = j.at("ribbon_slow").get<int>();
    if (j.contains("atr_period"))
        atr_period = j.at("atr_period").get<int>();
    if (j.contains("squeeze_period"))
        squeeze_period = j.at("squeeze_period").get<int>();
    if (j.contains("bb_multiplier"))
        bb_multiplier = j.at("bb_multiplier").get<double>();
    if (j.contains("kc_multiplier"))
        kc_multiplier = j.at("kc_multiplier").get<double>();
    if (j.contains("momentum_period"))
        momentum_period = j.at("momentum_period").get<int>();
    if (j.contains("ripster_fast"))
        ripster_fast = j.at("ripster_fast").get<int>();
    if (j.contains("ripster_slow"))
        ripster_slow = j.at("ripster_slow").get<int>();
}

// ============================================================================
// Calculators
// ============================================================================

EmaCloud ema_cloud(const std::vector<double>& close, int fast, int slow) {
    EmaCloud cloud;
    cloud.fast_period = fast;
    cloud.slow_period = slow;
    cloud.fast = statistics::ema(close, fast);
    cloud.slow = statistics::ema(close, slow);
    return cloud;
}

IchimokuCloud ichimoku(const std::vector<Bar>& bars, int tenkan_period, int kijun_period,
                       int senkou_b_period) {
    const size_t n = bars.size();
    const std::vector<double> high = highs(bars);
    const std::vector<double> low = lows(bars);

    IchimokuCloud cloud;
    cloud.shift = kijun_period;
    cloud.tenkan = rolling_midpoint(high, low, tenkan_period);
    cloud.kijun = rolling_midpoint(high, low, kijun_period);
    IndicatorSeries span_b = rolling_midpoint(high, low, senkou_b_period);

    const size_t shift = static_cast<size_t>(std::max(kijun_period, 0));
    cloud.span_a.assign(n + shift, UNDEFINED_VALUE);
    cloud.span_b.assign(n + shift, UNDEFINED_VALUE);
    cloud.chikou.assign(n, UNDEFINED_VALUE);

    for (size_t i = 0; i < n; ++i) {
        if (is_defined(cloud.tenkan[i]) && is_defined(cloud.kijun[i])) {
            cloud.span_a[i + shift] = (cloud.tenkan[i] + cloud.kijun[i]) / 2.0;
        }
        cloud.span_b[i + shift] = span_b[i];
        if (i >= shift) {
            cloud.chikou[i - shift] = bars[i].close;
        }
    }
    return cloud;
}

Trend ichimoku_regime_at(const IchimokuCloud& cloud, double close, size_t index) {
    if (index >= cloud.span_a.size() || index >= cloud.span_b.size())
        return Trend::NEUTRAL;
    double a = cloud.span_a[index];
    double b = cloud.span_b[index];
    if (!is_defined(a) || !is_defined(b))
        return Trend::NEUTRAL;
    if (close > std::max(a, b))
        return Trend::BULLISH;
    if (close < std::min(a, b))
        return Trend::BEARISH;
    return Trend::NEUTRAL;
}

PivotRibbon pivot_ribbon(const std::vector<double>& close, int fast, int mid, int slow) {
    PivotRibbon ribbon;
    ribbon.fast = statistics::ema(close, fast);
    ribbon.mid = statistics::ema(close, mid);
    ribbon.slow = statistics::ema(close, slow);
    ribbon.states.assign(close.size(), Trend::NEUTRAL);

    for (size_t i = 1; i < close.size(); ++i) {
        double f = ribbon.fast[i];
        double m = ribbon.mid[i];
        double s = ribbon.slow[i];
        double f_prev = ribbon.fast[i - 1];
        if (!is_defined(f) || !is_defined(m) || !is_defined(s) || !is_defined(f_prev))
            continue;

        if (f > m && m > s && close[i] > m && f > f_prev) {
            ribbon.states[i] = Trend::BULLISH;
        } else if (f < m && m < s && close[i] < m && f < f_prev) {
            ribbon.states[i] = Trend::BEARISH;
        }
    }
    return ribbon;
}

SatyLevels saty_levels_at(const std::vector<Bar>& bars, const IndicatorSeries& atr_series,
                          size_t index) {
    SatyLevels levels;
    if (index == 0 || index >= bars.size() || index > atr_series.size())
        return levels;

    levels.pivot = bars[index - 1].close;
    levels.atr = atr_series[index - 1];
    if (!is_defined(levels.atr)) {
        levels.atr = 0.0;
        return levels;
    }

    levels.valid = true;
    for (size_t k = 0; k < SATY_MULTIPLES.size(); ++k) {
        levels.up[k] = levels.pivot + SATY_MULTIPLES[k] * levels.atr;
        levels.down[k] = levels.pivot - SATY_MULTIPLES[k] * levels.atr;
    }

    // Zero ATR leaves no room to measure against
    if (levels.atr <= 0.0)
        return levels;

    const Bar& bar = bars[index];
    double excursion = std::max(std::abs(bar.high - levels.pivot), std::abs(levels.pivot - bar.low));
    levels.range_used = excursion / levels.atr;

    if (bar.close >= levels.up[0]) {
        levels.direction = TradeDirection::LONG;
    } else if (bar.close <= levels.down[0]) {
        levels.direction = TradeDirection::SHORT;
    }
    return levels;
}

SatyLevels saty_atr_levels(const std::vector<Bar>& bars, int atr_period) {
    if (bars.empty())
        return SatyLevels();
    return saty_levels_at(bars, atr(bars, atr_period), bars.size() - 1);
}

TtmBands ttm_bands(const std::vector<Bar>& bars, int period, double bb_multiplier,
                   double kc_multiplier, int momentum_period) {
    const size_t n = bars.size();
    const std::vector<double> close = closes(bars);

    TtmBands bands;
    bands.basis = statistics::sma(close, period);
    IndicatorSeries dev = statistics::rolling_std(close, period);
    IndicatorSeries avg_range = statistics::sma(true_range(bars), period);
    bands.momentum = statistics::rolling_slope(close, momentum_period);

    bands.bb_upper.assign(n, UNDEFINED_VALUE);
    bands.bb_lower.assign(n, UNDEFINED_VALUE);
    bands.kc_upper.assign(n, UNDEFINED_VALUE);
    bands.kc_lower.assign(n, UNDEFINED_VALUE);
    bands.squeeze_on.assign(n, std::nullopt);

    for (size_t i = 0; i < n; ++i) {
        if (!is_defined(bands.basis[i]) || !is_defined(dev[i]) || !is_defined(avg_range[i]))
            continue;
        bands.bb_upper[i] = bands.basis[i] + bb_multiplier * dev[i];
        bands.bb_lower[i] = bands.basis[i] - bb_multiplier * dev[i];
        bands.kc_upper[i] = bands.basis[i] + kc_multiplier * avg_range[i];
        bands.kc_lower[i] = bands.basis[i] - kc_multiplier * avg_range[i];
        bands.squeeze_on[i] =
            bands.bb_upper[i] <= bands.kc_upper[i] && bands.bb_lower[i] >= bands.kc_lower[i];
    }
    return bands;
}

std::vector<Trend> ripster_bias(const std::vector<double>& close, int fast, int slow) {
    IndicatorSeries ema_fast = statistics::ema(close, fast);
    IndicatorSeries ema_slow = statistics::ema(close, slow);
    std::vector<Trend> bias(close.size(), Trend::NEUTRAL);

    for (size_t i = 0; i < close.size(); ++i) {
        if (!is_defined(ema_fast[i]) || !is_defined(ema_slow[i]))
            continue;
        if (ema_fast[i] > ema_slow[i] && close[i] > ema_fast[i]) {
            bias[i] = Trend::BULLISH;
        } else if (ema_fast[i] < ema_slow[i] && close[i] < ema_fast[i]) {
            bias[i] = Trend::BEARISH;
        }
    }
    return bias;
}

Result<OverlayBundle> compute_overlays(const std::vector<Bar>& bars, const OverlayConfig& config) {
    auto valid = validate_bars(bars, "Overlays");
    if (valid.is_error()) {
        return make_error<OverlayBundle>(valid.error()->code(), valid.error()->what(),
                                         "Overlays");
    }

    const std::vector<double> close = closes(bars);
    OverlayBundle bundle;

    for (const auto& [fast, slow] : config.ema_clouds) {
        bundle.ema_clouds.push_back(ema_cloud(close, fast, slow));
    }
    bundle.ichimoku =
        ichimoku(bars, config.tenkan_period, config.kijun_period, config.senkou_b_period);
    bundle.pivot_ribbon =
        pivot_ribbon(close, config.ribbon_fast, config.ribbon_mid, config.ribbon_slow);
    bundle.atr = atr(bars, config.atr_period);
    if (!bars.empty()) {
        bundle.saty = saty_levels_at(bars, bundle.atr, bars.size() - 1);
    }
    bundle.ttm = ttm_bands(bars, config.squeeze_period, config.bb_multiplier,
                           config.kc_multiplier, config.momentum_period);
    bundle.ripster = ripster_bias(close, config.ripster_fast, config.ripster_slow);

    return Result<OverlayBundle>(std::move(bundle));
}

}  // namespace indicators
}  // namespace signal_ngin
