// src/regime/rule_classifier.cpp

#include "signal_ngin/regime/rule_classifier.hpp"
#include <algorithm>
#include <cmath>
#include "signal_ngin/core/bar_validation.hpp"
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/indicators/overlays.hpp"
#include "signal_ngin/indicators/volatility.hpp"
#include "signal_ngin/statistics/series_math.hpp"

namespace signal_ngin {
namespace regime {

namespace {

constexpr const char* INSUFFICIENT_DATA_TEXT = "Insufficient data for regime detection";

struct EmaStack {
    double price;
    double e8;
    double e21;
    double e34;
    double e50;
    bool defined;
};

EmaStack ema_stack(const std::vector<double>& close) {
    EmaStack stack{0.0, 0.0, 0.0, 0.0, 0.0, false};
    if (close.size() < 50)
        return stack;
    const size_t last = close.size() - 1;
    stack.price = close[last];
    stack.e8 = statistics::ema(close, 8)[last];
    stack.e21 = statistics::ema(close, 21)[last];
    stack.e34 = statistics::ema(close, 34)[last];
    stack.e50 = statistics::ema(close, 50)[last];
    stack.defined = is_defined(stack.e8) && is_defined(stack.e21) && is_defined(stack.e34) &&
                    is_defined(stack.e50);
    return stack;
}

double range_percent(const std::vector<Bar>& bars, int window) {
    const size_t count = std::min(bars.size(), static_cast<size_t>(std::max(window, 1)));
    if (count == 0)
        return 0.0;
    double hi = bars[bars.size() - count].high;
    double lo = bars[bars.size() - count].low;
    double close_sum = 0.0;
    for (size_t i = bars.size() - count; i < bars.size(); ++i) {
        hi = std::max(hi, bars[i].high);
        lo = std::min(lo, bars[i].low);
        close_sum += bars[i].close;
    }
    double avg_close = close_sum / count;
    return avg_close != 0.0 ? (hi - lo) / avg_close * 100.0 : 0.0;
}

std::optional<CloudFactors> cloud_factors(const std::vector<Bar>& bars) {
    indicators::IchimokuCloud cloud = indicators::ichimoku(bars);
    const size_t last = bars.size() - 1;
    double a = cloud.span_a[last];
    double b = cloud.span_b[last];
    if (!is_defined(a) || !is_defined(b))
        return std::nullopt;

    CloudFactors factors;
    double price = bars[last].close;
    factors.above_cloud = price > std::max(a, b);
    factors.below_cloud = price < std::min(a, b);
    factors.in_cloud = !factors.above_cloud && !factors.below_cloud;
    factors.cloud_color = a > b ? "green" : "red";
    return factors;
}

}  // namespace

// ============================================================================
// RuleClassifierConfig
// ============================================================================

nlohmann::json RuleClassifierConfig::to_json() const {
    nlohmann::json j;
    j["min_bars"] = min_bars;
    j["adx_period"] = adx_period;
    j["adx_trend_threshold"] = adx_trend_threshold;
    j["adx_range_threshold"] = adx_range_threshold;
    j["atr_period"] = atr_period;
    j["atr_lookback"] = atr_lookback;
    j["high_volatility_percentile"] = high_volatility_percentile;
    j["volume_lookback"] = volume_lookback;
    j["low_volume_percentile"] = low_volume_percentile;
    j["range_window"] = range_window;
    j["use_ichimoku_filter"] = use_ichimoku_filter;
    return j;
}

void RuleClassifierConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_bars"))
        min_bars = j.at("min_bars").get<int>();
    if (j.contains("adx_period"))
        adx_period = j.at("adx_period").get<int>();
    if (j.contains("adx_trend_threshold"))
        adx_trend_threshold = j.at("adx_trend_threshold").get<double>();
    if (j.contains("adx_range_threshold"))
        adx_range_threshold = j.at("adx_range_threshold").get<double>();
    if (j.contains("atr_period"))
        atr_period = j.at("atr_period").get<int>();
    if (j.contains("atr_lookback"))
        atr_lookback = j.at("atr_lookback").get<int>();
    if (j.contains("high_volatility_percentile"))
        high_volatility_percentile = j.at("high_volatility_percentile").get<double>();
    if (j.contains("volume_lookback"))
        volume_lookback = j.at("volume_lookback").get<int>();
    if (j.contains("low_volume_percentile"))
        low_volume_percentile = j.at("low_volume_percentile").get<double>();
    if (j.contains("range_window"))
        range_window = j.at("range_window").get<int>();
    if (j.contains("use_ichimoku_filter"))
        use_ichimoku_filter = j.at("use_ichimoku_filter").get<bool>();
}

// ============================================================================
// Inputs
// ============================================================================

IndicatorSeries adx(const std::vector<Bar>& bars, int period) {
    IndicatorSeries out(bars.size(), UNDEFINED_VALUE);
    if (bars.size() < 2 || period <= 0)
        return out;

    const size_t m = bars.size() - 1;
    std::vector<double> tr(m), plus_dm(m), minus_dm(m);
    for (size_t i = 1; i < bars.size(); ++i) {
        const Bar& cur = bars[i];
        const Bar& prev = bars[i - 1];
        tr[i - 1] = std::max({cur.high - cur.low, std::abs(cur.high - prev.close),
                              std::abs(cur.low - prev.close)});

        double up_move = cur.high - prev.high;
        double down_move = prev.low - cur.low;
        plus_dm[i - 1] = (up_move > down_move && up_move > 0.0) ? up_move : 0.0;
        minus_dm[i - 1] = (down_move > up_move && down_move > 0.0) ? down_move : 0.0;
    }

    IndicatorSeries smooth_tr = statistics::ema(tr, period);
    IndicatorSeries smooth_plus = statistics::ema(plus_dm, period);
    IndicatorSeries smooth_minus = statistics::ema(minus_dm, period);

    std::vector<double> dx(m, UNDEFINED_VALUE);
    for (size_t i = 0; i < m; ++i) {
        if (!is_defined(smooth_tr[i]))
            continue;
        if (smooth_tr[i] <= 0.0) {
            dx[i] = 0.0;
            continue;
        }
        double pdi = smooth_plus[i] / smooth_tr[i] * 100.0;
        double mdi = smooth_minus[i] / smooth_tr[i] * 100.0;
        double sum = pdi + mdi;
        dx[i] = sum == 0.0 ? 0.0 : std::abs(pdi - mdi) / sum * 100.0;
    }

    IndicatorSeries smoothed = statistics::ema(dx, period);
    for (size_t i = 0; i < m; ++i) {
        out[i + 1] = smoothed[i];
    }
    return out;
}

double current_adx(const std::vector<Bar>& bars, int period) {
    IndicatorSeries series = adx(bars, period);
    if (series.empty() || !is_defined(series.back()))
        return 0.0;
    return series.back();
}

double atr_percentile(const std::vector<Bar>& bars, int period, int lookback) {
    if (lookback <= 0 || bars.size() < static_cast<size_t>(lookback))
        return 50.0;

    IndicatorSeries tr = indicators::true_range(bars);
    std::vector<double> recent(tr.end() - lookback, tr.end());
    IndicatorSeries rolling = statistics::sma(recent, period);

    double current = rolling.back();
    if (!is_defined(current))
        return 50.0;

    std::vector<double> reference;
    for (size_t i = 0; i + 1 < rolling.size(); ++i) {
        if (is_defined(rolling[i]))
            reference.push_back(rolling[i]);
    }
    return statistics::percentile_rank(reference, current);
}

double volume_percentile(const std::vector<Bar>& bars, int lookback) {
    if (lookback <= 0 || bars.size() < static_cast<size_t>(lookback) + 1)
        return 50.0;

    std::vector<double> reference;
    reference.reserve(lookback);
    for (size_t i = bars.size() - 1 - lookback; i + 1 < bars.size(); ++i) {
        reference.push_back(bars[i].volume);
    }
    return statistics::percentile_rank(reference, bars.back().volume);
}

bool bullish_ema_alignment(const std::vector<double>& close) {
    EmaStack s = ema_stack(close);
    return s.defined && s.price > s.e8 && s.e8 > s.e21 && s.e21 > s.e34 && s.e34 > s.e50;
}

bool bearish_ema_alignment(const std::vector<double>& close) {
    EmaStack s = ema_stack(close);
    return s.defined && s.price < s.e8 && s.e8 < s.e21 && s.e21 < s.e34 && s.e34 < s.e50;
}

// ============================================================================
// Classification
// ============================================================================

Result<RegimeClassification> classify_market_regime(const std::vector<Bar>& bars,
                                                    const RuleClassifierConfig& config) {
    auto valid = validate_bars(bars, "RuleClassifier");
    if (valid.is_error()) {
        return make_error<RegimeClassification>(valid.error()->code(), valid.error()->what(),
                                                "RuleClassifier");
    }

    RegimeClassification result;
    if (bars.size() < static_cast<size_t>(config.min_bars) || bars.empty()) {
        DEBUG("Rule classifier needs " << config.min_bars << " bars, got " << bars.size());
        result.recommendation = INSUFFICIENT_DATA_TEXT;
        return Result<RegimeClassification>(std::move(result));
    }

    const std::vector<double> close = closes(bars);
    RegimeFactors& f = result.factors;

    double adx_value = current_adx(bars, config.adx_period);
    f.adx = adx_value;
    f.trend_strength = adx_value > config.adx_trend_threshold
                           ? "strong"
                           : (adx_value > config.adx_range_threshold ? "moderate" : "weak");

    f.bullish_alignment = bullish_ema_alignment(close);
    f.bearish_alignment = bearish_ema_alignment(close);
    f.cloud = cloud_factors(bars);

    f.atr_percentile = atr_percentile(bars, config.atr_period, config.atr_lookback);
    f.volatility = f.atr_percentile > config.high_volatility_percentile
                       ? "high"
                       : (f.atr_percentile > 50.0 ? "moderate" : "low");

    f.volume_percentile = volume_percentile(bars, config.volume_lookback);
    f.volume = f.volume_percentile > 70.0
                   ? "high"
                   : (f.volume_percentile > config.low_volume_percentile ? "average" : "low");

    f.range_percent = range_percent(bars, config.range_window);

    bool cloud_allows_bull = !config.use_ichimoku_filter || (f.cloud && f.cloud->above_cloud);
    bool cloud_allows_bear = !config.use_ichimoku_filter || (f.cloud && f.cloud->below_cloud);
    bool volume_ok = f.volume_percentile > config.low_volume_percentile;

    if (adx_value > config.adx_trend_threshold && f.bullish_alignment && cloud_allows_bull &&
        volume_ok) {
        result.regime = MarketRegime::TRENDING_BULL;
        result.confidence = std::min(100.0, adx_value + 20.0);
        result.recommendation =
            "Strong uptrend. Focus on pullback entries and trend continuation. Avoid "
            "counter-trend shorts.";
    } else if (adx_value > config.adx_trend_threshold && f.bearish_alignment &&
               cloud_allows_bear && volume_ok) {
        result.regime = MarketRegime::TRENDING_BEAR;
        result.confidence = std::min(100.0, adx_value + 20.0);
        result.recommendation =
            "Strong downtrend. Focus on rally fades and trend continuation. Avoid "
            "counter-trend longs.";
    } else if (f.atr_percentile > config.high_volatility_percentile) {
        result.regime = MarketRegime::HIGH_VOLATILITY;
        result.confidence = f.atr_percentile;
        result.recommendation =
            "High volatility environment. Use tighter stops and smaller position sizes. Expect "
            "whipsaws.";
    } else if (f.volume_percentile < config.low_volume_percentile) {
        result.regime = MarketRegime::LOW_LIQUIDITY;
        result.confidence = 100.0 - f.volume_percentile;
        result.recommendation =
            "Low volume conditions. Be cautious with entries/exits. Spreads may be wider.";
    } else if (adx_value < config.adx_range_threshold) {
        result.regime = MarketRegime::RANGING;
        result.confidence = (config.adx_range_threshold - adx_value) * 5.0;
        result.recommendation =
            "Choppy, sideways market. Trade support/resistance. Avoid trend-following "
            "strategies.";
    } else {
        result.regime = MarketRegime::WEAK_TREND;
        result.confidence = 50.0;
        result.recommendation =
            "Unclear trend. Wait for stronger signals before committing to directional trades.";
    }
    result.confidence = std::clamp(std::round(result.confidence), 0.0, 100.0);

    DEBUG("Rule classifier: " << to_string(result.regime) << " (" << result.confidence
                              << "%), ADX " << adx_value);
    return Result<RegimeClassification>(std::move(result));
}

}  // namespace regime
}  // namespace signal_ngin
