// src/regime/advanced_detector.cpp

#include "signal_ngin/regime/advanced_detector.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include "signal_ngin/core/bar_validation.hpp"
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/statistics/change_point.hpp"
#include "signal_ngin/statistics/cycle_detector.hpp"
#include "signal_ngin/statistics/hmm.hpp"
#include "signal_ngin/statistics/hurst.hpp"
#include "signal_ngin/statistics/microstructure.hpp"
#include "signal_ngin/statistics/series_math.hpp"

namespace signal_ngin {
namespace regime {

namespace {

std::vector<Bar> tail(const std::vector<Bar>& bars, size_t count) {
    count = std::min(count, bars.size());
    return std::vector<Bar>(bars.end() - count, bars.end());
}

std::vector<double> tail(const std::vector<double>& values, size_t count) {
    count = std::min(count, values.size());
    return std::vector<double>(values.end() - count, values.end());
}

template <typename T>
Result<T> reject_invalid(const std::vector<Bar>& bars, const std::string& component,
                         bool& rejected) {
    auto valid = validate_bars(bars, component);
    rejected = valid.is_error();
    if (rejected) {
        return make_error<T>(valid.error()->code(), valid.error()->what(), component);
    }
    return Result<T>(T());
}

std::string trend_text(double hurst, double trending, double mean_reverting) {
    if (hurst > trending)
        return "Persistent trending";
    if (hurst < mean_reverting)
        return "Mean reverting";
    return "Random";
}

void read_optional_seed(const nlohmann::json& j, const std::string& key,
                        std::optional<unsigned int>& seed) {
    if (!j.contains(key))
        return;
    if (j.at(key).is_null()) {
        seed.reset();
    } else {
        seed = j.at(key).get<unsigned int>();
    }
}

}  // namespace

// ============================================================================
// HMM Regime
// ============================================================================

std::vector<VolatilityRegime> label_states_by_volatility(const Eigen::VectorXd& means,
                                                         const Eigen::VectorXd& stds,
                                                         HMMFeature feature) {
    const int k = static_cast<int>(stds.size());
    std::vector<int> order(k);
    std::iota(order.begin(), order.end(), 0);

    const Eigen::VectorXd& key = feature == HMMFeature::LOG_RETURNS ? stds : means;
    std::stable_sort(order.begin(), order.end(), [&key](int a, int b) { return key(a) < key(b); });

    std::vector<VolatilityRegime> labels(k, VolatilityRegime::MODERATE);
    if (k < 2)
        return labels;
    labels[order.front()] = VolatilityRegime::LOW_VOLATILITY;
    labels[order.back()] = VolatilityRegime::HIGH_VOLATILITY;
    return labels;
}

Result<HMMRegimeResult> detect_regime_hmm(const std::vector<Bar>& bars,
                                          const HMMRegimeOptions& options) {
    bool rejected = false;
    auto checked = reject_invalid<HMMRegimeResult>(bars, "HMMRegime", rejected);
    if (rejected)
        return checked;

    HMMRegimeResult result;
    if (options.lookback < 2 || bars.size() < static_cast<size_t>(options.lookback)) {
        DEBUG("HMM regime needs " << options.lookback << " bars, got " << bars.size());
        return Result<HMMRegimeResult>(std::move(result));
    }

    std::vector<double> observations = statistics::log_returns(closes(tail(bars, options.lookback)));
    if (options.feature == HMMFeature::ABSOLUTE_RETURNS) {
        for (double& r : observations) r = std::abs(r);
    }

    statistics::HMMConfig config;
    config.num_states = options.num_states;
    config.max_iterations = options.iterations;
    config.seed = options.seed;
    statistics::HiddenMarkovModel model(config);

    auto fitted = model.fit(observations);
    if (fitted.is_error()) {
        DEBUG("HMM regime degraded to unknown: " << fitted.error()->what());
        return Result<HMMRegimeResult>(std::move(result));
    }
    auto states = model.decode(observations);
    auto gamma = model.state_probabilities(observations);
    if (states.is_error() || gamma.is_error()) {
        DEBUG("HMM decoding failed, regime unknown");
        return Result<HMMRegimeResult>(std::move(result));
    }

    const auto& params = model.parameters();
    const Eigen::MatrixXd& probs = gamma.value();
    result.states = states.value();
    result.current_state = result.states.back();
    result.transition = params.transition;
    result.state_labels = label_states_by_volatility(params.means, params.stds, options.feature);
    for (int j = 0; j < probs.cols(); ++j) {
        result.probabilities.push_back(probs(probs.rows() - 1, j));
    }
    result.regime = result.state_labels[result.current_state];
    result.confidence = std::round(result.probabilities[result.current_state] * 100.0);
    return Result<HMMRegimeResult>(std::move(result));
}

// ============================================================================
// GARCH Regime
// ============================================================================

Result<VolatilityRegimeResult> detect_volatility_regime_garch(const std::vector<Bar>& bars,
                                                              int lookback,
                                                              const statistics::GARCHConfig& config) {
    bool rejected = false;
    auto checked = reject_invalid<VolatilityRegimeResult>(bars, "GARCHRegime", rejected);
    if (rejected)
        return checked;

    if (lookback < 2 || bars.size() < static_cast<size_t>(lookback)) {
        DEBUG("GARCH regime needs " << lookback << " bars, got " << bars.size());
        return Result<VolatilityRegimeResult>(VolatilityRegimeResult());
    }

    std::vector<double> returns = statistics::log_returns(closes(tail(bars, lookback)));
    statistics::GarchModel model(config);
    auto detected = model.detect_regime(returns);
    if (detected.is_error()) {
        DEBUG("GARCH regime degraded to unknown: " << detected.error()->what());
        return Result<VolatilityRegimeResult>(VolatilityRegimeResult());
    }
    return detected;
}

// ============================================================================
// Trend Persistence
// ============================================================================

Result<PersistenceResult> classify_trend_persistence(const std::vector<Bar>& bars) {
    bool rejected = false;
    auto checked = reject_invalid<PersistenceResult>(bars, "TrendPersistence", rejected);
    if (rejected)
        return checked;

    PersistenceResult result;
    result.hurst_exponent =
        statistics::calculate_hurst_exponent(statistics::log_returns(closes(bars)));
    result.confidence = std::abs(result.hurst_exponent - 0.5) * 200.0;

    if (result.hurst_exponent > 0.6) {
        result.regime = PersistenceRegime::TRENDING;
        result.interpretation = "Persistent trending behavior";
    } else if (result.hurst_exponent < 0.4) {
        result.regime = PersistenceRegime::MEAN_REVERTING;
        result.interpretation = "Mean-reverting behavior";
    } else {
        result.regime = PersistenceRegime::RANDOM;
        result.interpretation = "Random walk behavior";
    }
    return Result<PersistenceResult>(std::move(result));
}

// ============================================================================
// Combined Detector
// ============================================================================

nlohmann::json AdvancedDetectorConfig::to_json() const {
    nlohmann::json j;
    j["min_bars"] = min_bars;
    j["trending_hurst"] = trending_hurst;
    j["mean_reverting_hurst"] = mean_reverting_hurst;
    j["hmm_states"] = hmm_states;
    j["hmm_iterations"] = hmm_iterations;
    j["hmm_seed"] = hmm_seed ? nlohmann::json(*hmm_seed) : nlohmann::json(nullptr);
    j["cusum_threshold"] = cusum_threshold;
    j["cycle_min_period"] = cycle_min_period;
    j["cycle_max_period"] = cycle_max_period;
    j["illiquidity_window"] = illiquidity_window;
    j["spread_window"] = spread_window;
    j["garch"] = garch.to_json();
    return j;
}

void AdvancedDetectorConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_bars"))
        min_bars = j.at("min_bars").get<int>();
    if (j.contains("trending_hurst"))
        trending_hurst = j.at("trending_hurst").get<double>();
    if (j.contains("mean_reverting_hurst"))
        mean_reverting_hurst = j.at("mean_reverting_hurst").get<double>();
    if (j.contains("hmm_states"))
        hmm_states = j.at("hmm_states").get<int>();
    if (j.contains("hmm_iterations"))
        hmm_iterations = j.at("hmm_iterations").get<int>();
    read_optional_seed(j, "hmm_seed", hmm_seed);
    if (j.contains("cusum_threshold"))
        cusum_threshold = j.at("cusum_threshold").get<double>();
    if (j.contains("cycle_min_period"))
        cycle_min_period = j.at("cycle_min_period").get<int>();
    if (j.contains("cycle_max_period"))
        cycle_max_period = j.at("cycle_max_period").get<int>();
    if (j.contains("illiquidity_window"))
        illiquidity_window = j.at("illiquidity_window").get<int>();
    if (j.contains("spread_window"))
        spread_window = j.at("spread_window").get<int>();
    if (j.contains("garch"))
        garch.from_json(j.at("garch"));
}

Result<AdvancedRegimeResult> detect_regime_advanced(const std::vector<Bar>& bars,
                                                    const AdvancedDetectorConfig& config) {
    bool rejected = false;
    auto checked = reject_invalid<AdvancedRegimeResult>(bars, "AdvancedRegime", rejected);
    if (rejected)
        return checked;

    AdvancedRegimeResult result;
    if (!bars.empty()) {
        result.time = bars.back().time;
    }
    const size_t min_bars = static_cast<size_t>(std::max(config.min_bars, 2));
    if (bars.size() < min_bars) {
        DEBUG("Advanced regime needs " << config.min_bars << " bars, got " << bars.size());
        return Result<AdvancedRegimeResult>(std::move(result));
    }

    const std::vector<double> close = closes(bars);
    const std::vector<double> returns = statistics::log_returns(close);
    AdvancedAnalysis& a = result.analysis;

    // 1. Trend persistence, over the min_bars - 1 returns of the shortest window
    a.hurst_exponent = statistics::calculate_hurst_exponent(returns, min_bars - 1);

    // 2. Volatility regime
    statistics::GarchModel garch(config.garch);
    auto volatility = garch.detect_regime(returns);
    if (volatility.is_ok()) {
        a.volatility_regime = volatility.value().regime;
        a.volatility_percentile = volatility.value().percentile;
    } else {
        DEBUG("GARCH unavailable in advanced regime: " << volatility.error()->what());
    }

    // 3. Hidden state
    statistics::HMMConfig hmm_config;
    hmm_config.num_states = config.hmm_states;
    hmm_config.max_iterations = config.hmm_iterations;
    hmm_config.seed = config.hmm_seed;
    statistics::HiddenMarkovModel hmm(hmm_config);
    if (hmm.fit(returns).is_ok()) {
        auto states = hmm.decode(returns);
        if (states.is_ok() && !states.value().empty()) {
            int state = states.value().back();
            a.hmm_state = state;
            a.hmm_regime = label_states_by_volatility(hmm.parameters().means,
                                                      hmm.parameters().stds,
                                                      HMMFeature::LOG_RETURNS)[state];
        }
    }

    // 4. Change points
    statistics::CusumOptions cusum;
    cusum.threshold = config.cusum_threshold;
    auto change_points = statistics::detect_change_points_cusum(close, cusum);
    a.change_point_detected = !change_points.empty();
    if (a.change_point_detected) {
        a.last_change_point = change_points.back().index;
    }

    // 5. Dominant cycle
    auto cycle =
        statistics::detect_dominant_cycle(close, config.cycle_min_period, config.cycle_max_period);
    a.dominant_cycle = cycle.period;
    a.cycle_strength = cycle.strength;

    // 6. Liquidity
    a.illiquidity = statistics::amihud_illiquidity(tail(bars, config.illiquidity_window));
    a.bid_ask_spread = statistics::roll_spread(tail(close, config.spread_window));

    const bool high_vol = a.volatility_regime == VolatilityRegime::HIGH_VOLATILITY;
    if (a.hurst_exponent > config.trending_hurst && !high_vol) {
        result.regime = AdvancedRegime::TRENDING;
        result.confidence = (a.hurst_exponent - 0.5) * 200.0;
    } else if (a.hurst_exponent < config.mean_reverting_hurst) {
        result.regime = AdvancedRegime::MEAN_REVERTING;
        result.confidence = (0.5 - a.hurst_exponent) * 200.0;
    } else if (high_vol) {
        result.regime = AdvancedRegime::HIGH_VOLATILITY;
        result.confidence = a.volatility_percentile;
    } else {
        result.regime = AdvancedRegime::NEUTRAL;
        result.confidence = 50.0;
    }
    result.confidence = std::clamp(std::round(result.confidence), 0.0, 100.0);

    result.interpretation.trend =
        trend_text(a.hurst_exponent, config.trending_hurst, config.mean_reverting_hurst);
    result.interpretation.volatility = to_string(a.volatility_regime);
    result.interpretation.cycle = cycle.interpretation;
    result.interpretation.liquidity = a.illiquidity > 1.0 ? "Low liquidity" : "Normal liquidity";

    DEBUG("Advanced regime: " << to_string(result.regime) << " (" << result.confidence
                              << "%), H=" << a.hurst_exponent);
    return Result<AdvancedRegimeResult>(std::move(result));
}

}  // namespace regime
}  // namespace signal_ngin
