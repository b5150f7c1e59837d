// include/signal_ngin/regime/rule_classifier.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/regime/regime_types.hpp"

namespace signal_ngin {
namespace regime {

/**
 * @brief Thresholds for the rule-based regime classifier
 */
struct RuleClassifierConfig : public ConfigBase {
    int min_bars{50};
    int adx_period{14};
    double adx_trend_threshold{25.0};
    double adx_range_threshold{20.0};
    int atr_period{14};
    int atr_lookback{100};
    double high_volatility_percentile{80.0};
    int volume_lookback{20};
    double low_volume_percentile{30.0};
    int range_window{20};
    bool use_ichimoku_filter{false};  // require price beyond the cloud to call a trend

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Price position relative to the Ichimoku cloud at the last bar
 */
struct CloudFactors {
    bool above_cloud{false};
    bool below_cloud{false};
    bool in_cloud{false};
    std::string cloud_color;  // "green" when span A is above span B
};

/**
 * @brief Measurements behind a rule-based classification
 */
struct RegimeFactors {
    double adx{0.0};
    std::string trend_strength;  // strong / moderate / weak
    bool bullish_alignment{false};
    bool bearish_alignment{false};
    double atr_percentile{50.0};
    std::string volatility;  // high / moderate / low
    double volume_percentile{50.0};
    std::string volume;  // high / average / low
    double range_percent{0.0};
    std::optional<CloudFactors> cloud;
};

struct RegimeClassification {
    MarketRegime regime{MarketRegime::UNKNOWN};
    double confidence{0.0};
    RegimeFactors factors;
    std::string recommendation;
};

/**
 * @brief Average directional index aligned with bars
 *
 * True range and directional movement are EMA-smoothed over period, and
 * ADX is the EMA of DX. Index 0 has no prior bar and stays undefined.
 */
IndicatorSeries adx(const std::vector<Bar>& bars, int period = 14);

/**
 * @brief Last defined ADX value, 0 when the window is too short
 */
double current_adx(const std::vector<Bar>& bars, int period = 14);

/**
 * @brief Rank of the latest rolling mean true range among the earlier
 *        values inside the last lookback bars
 * @return 0-100, or 50 when fewer than lookback bars are available
 */
double atr_percentile(const std::vector<Bar>& bars, int period = 14, int lookback = 100);

/**
 * @brief Share of the previous lookback volumes below the latest volume
 * @return 0-100, or 50 when fewer than lookback + 1 bars are available
 */
double volume_percentile(const std::vector<Bar>& bars, int lookback = 20);

// price > EMA8 > EMA21 > EMA34 > EMA50 at the last bar, and the mirror
bool bullish_ema_alignment(const std::vector<double>& close);
bool bearish_ema_alignment(const std::vector<double>& close);

/**
 * @brief Classify the current regime of a bar window
 *
 * First match wins: trending_bull, trending_bear, high_volatility,
 * low_liquidity, ranging, weak_trend. Windows shorter than min_bars give
 * unknown with confidence 0.
 *
 * @return INVALID_DATA if the window violates the input contract
 */
Result<RegimeClassification> classify_market_regime(
    const std::vector<Bar>& bars, const RuleClassifierConfig& config = RuleClassifierConfig());

}  // namespace regime
}  // namespace signal_ngin
