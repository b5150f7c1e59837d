// include/signal_ngin/regime/advanced_detector.hpp
#pragma once

#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/regime/regime_types.hpp"
#include "signal_ngin/statistics/garch.hpp"

namespace signal_ngin {
namespace regime {

// ============================================================================
// HMM Regime
// ============================================================================

enum class HMMFeature {
    LOG_RETURNS,
    ABSOLUTE_RETURNS
};

struct HMMRegimeOptions {
    int num_states{3};
    int lookback{252};
    int iterations{30};
    HMMFeature feature{HMMFeature::LOG_RETURNS};
    std::optional<unsigned int> seed;  // unset: a fresh random start every call
};

struct HMMRegimeResult {
    VolatilityRegime regime{VolatilityRegime::UNKNOWN};
    double confidence{0.0};
    int current_state{-1};
    std::vector<double> probabilities;  // state occupancy at the last bar
    std::vector<int> states;            // Viterbi path over the lookback
    std::vector<VolatilityRegime> state_labels;
    Eigen::MatrixXd transition;
};

/**
 * @brief Label HMM states by volatility rank
 *
 * States are ranked by emission std for log returns and by emission mean
 * for absolute returns. The lowest rank is low_volatility, the highest
 * high_volatility and everything between moderate.
 */
std::vector<VolatilityRegime> label_states_by_volatility(const Eigen::VectorXd& means,
                                                         const Eigen::VectorXd& stds,
                                                         HMMFeature feature);

/**
 * @brief Fit an HMM to the last lookback bars and decode the current state
 * @return INVALID_DATA for a malformed window; too few bars or a failed fit
 *         give unknown with confidence 0
 */
Result<HMMRegimeResult> detect_regime_hmm(const std::vector<Bar>& bars,
                                          const HMMRegimeOptions& options = HMMRegimeOptions());

// ============================================================================
// GARCH Regime
// ============================================================================

using VolatilityRegimeResult = statistics::GarchRegime;

/**
 * @brief GARCH volatility regime of the log returns of the last lookback bars
 * @return INVALID_DATA for a malformed window; too few bars give unknown
 *         with confidence 0
 */
Result<VolatilityRegimeResult> detect_volatility_regime_garch(
    const std::vector<Bar>& bars, int lookback = 252,
    const statistics::GARCHConfig& config = statistics::GARCHConfig());

// ============================================================================
// Trend Persistence
// ============================================================================

struct PersistenceResult {
    PersistenceRegime regime{PersistenceRegime::RANDOM};
    double hurst_exponent{0.5};
    double confidence{0.0};  // |H - 0.5| * 200
    std::string interpretation;
};

/**
 * @brief Hurst exponent of close-to-close log returns, with verdict
 *        (H > 0.6 trending, H < 0.4 mean reverting)
 */
Result<PersistenceResult> classify_trend_persistence(const std::vector<Bar>& bars);

// ============================================================================
// Combined Detector
// ============================================================================

struct AdvancedDetectorConfig : public ConfigBase {
    int min_bars{100};
    double trending_hurst{0.6};
    double mean_reverting_hurst{0.4};
    int hmm_states{3};
    int hmm_iterations{20};
    std::optional<unsigned int> hmm_seed;
    double cusum_threshold{3.0};
    int cycle_min_period{5};
    int cycle_max_period{50};
    int illiquidity_window{20};
    int spread_window{100};
    statistics::GARCHConfig garch;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

struct AdvancedAnalysis {
    double hurst_exponent{0.5};
    VolatilityRegime volatility_regime{VolatilityRegime::UNKNOWN};
    double volatility_percentile{0.0};
    std::optional<int> hmm_state;
    VolatilityRegime hmm_regime{VolatilityRegime::UNKNOWN};
    bool change_point_detected{false};
    std::optional<size_t> last_change_point;
    int dominant_cycle{0};
    double cycle_strength{0.0};
    double illiquidity{0.0};
    double bid_ask_spread{0.0};
};

struct AdvancedInterpretation {
    std::string trend;
    std::string volatility;
    std::string cycle;
    std::string liquidity;
};

struct AdvancedRegimeResult {
    AdvancedRegime regime{AdvancedRegime::UNKNOWN};
    double confidence{0.0};
    AdvancedAnalysis analysis;
    AdvancedInterpretation interpretation;
    EpochSeconds time{0};  // last bar of the analysed window
};

/**
 * @brief Combine Hurst, GARCH, HMM, CUSUM, cycle and liquidity analysis
 *
 * trending when H is above trending_hurst and volatility is not high,
 * mean_reverting when H is below mean_reverting_hurst, then
 * high_volatility, otherwise neutral. Fewer than min_bars bars give unknown
 * with confidence 0.
 *
 * @return INVALID_DATA for a malformed window
 */
Result<AdvancedRegimeResult> detect_regime_advanced(
    const std::vector<Bar>& bars, const AdvancedDetectorConfig& config = AdvancedDetectorConfig());

}  // namespace regime
}  // namespace signal_ngin
