// src/serialization/json_export.cpp

#include "signal_ngin/serialization/json_export.hpp"
#include <cmath>

namespace signal_ngin {
namespace serialization {

namespace {

nlohmann::json number_or_null(double value) {
    return std::isfinite(value) ? nlohmann::json(value) : nlohmann::json(nullptr);
}

template <typename T>
nlohmann::json optional_or_null(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json analysis_to_json(const regime::AdvancedAnalysis& analysis) {
    nlohmann::json j;
    j["hurst_exponent"] = analysis.hurst_exponent;
    j["volatility_regime"] = regime::to_string(analysis.volatility_regime);
    j["volatility_percentile"] = analysis.volatility_percentile;
    j["hmm_state"] = optional_or_null(analysis.hmm_state);
    j["hmm_regime"] = regime::to_string(analysis.hmm_regime);
    j["change_point_detected"] = analysis.change_point_detected;
    j["last_change_point"] = optional_or_null(analysis.last_change_point);
    j["dominant_cycle"] = analysis.dominant_cycle;
    j["cycle_strength"] = analysis.cycle_strength;
    j["illiquidity"] = number_or_null(analysis.illiquidity);
    j["bid_ask_spread"] = number_or_null(analysis.bid_ask_spread);
    return j;
}

}  // namespace

// ============================================================================
// Indicators and signals
// ============================================================================

nlohmann::json to_json(const indicators::SqueezeState& state) {
    return {{"on", state.on},
            {"fired", state.fired},
            {"direction", to_string(state.direction)},
            {"fired_bars_ago", optional_or_null(state.fired_bars_ago)}};
}

nlohmann::json to_json(const indicators::SatyLevels& levels) {
    nlohmann::json j;
    j["valid"] = levels.valid;
    j["pivot"] = number_or_null(levels.pivot);
    j["atr"] = number_or_null(levels.atr);
    j["up"] = nlohmann::json::array();
    j["down"] = nlohmann::json::array();
    for (size_t i = 0; i < levels.up.size(); ++i) {
        j["up"].push_back(number_or_null(levels.up[i]));
        j["down"].push_back(number_or_null(levels.down[i]));
    }
    j["range_used"] = number_or_null(levels.range_used);
    j["direction"] = to_string(levels.direction);
    return j;
}

nlohmann::json to_json(const signals::ScoreComponents& components) {
    nlohmann::json j = nlohmann::json::object();
    for (auto indicator : signals::ALL_SCORE_INDICATORS) {
        j[signals::to_string(indicator)] = components.get(indicator);
    }
    return j;
}

nlohmann::json to_json(const signals::SignalState& state) {
    nlohmann::json j;
    j["score"] = state.score;
    j["components"] = to_json(state.components);
    j["pivot_now"] = to_string(state.pivot_now);
    j["ripster_bias"] = to_string(state.ripster_bias);
    j["saty_direction"] = to_string(state.saty_direction);
    j["ichimoku_regime"] = to_string(state.ichimoku_regime);
    j["squeeze"] = to_json(state.squeeze);
    j["time"] = state.time;
    return j;
}

nlohmann::json to_json(const signals::ConsensusResult& consensus) {
    nlohmann::json j;
    j["primary_tf"] = signals::to_string(consensus.primary_tf);
    j["secondary_tf"] = consensus.secondary_tf
                            ? nlohmann::json(signals::to_string(*consensus.secondary_tf))
                            : nlohmann::json(nullptr);
    j["align"] = consensus.align;
    j["primary_pivot"] = to_string(consensus.primary_pivot);
    j["secondary_pivot"] = to_string(consensus.secondary_pivot);
    return j;
}

// ============================================================================
// Regimes
// ============================================================================

nlohmann::json to_json(const regime::RegimeClassification& classification) {
    const auto& f = classification.factors;
    nlohmann::json factors;
    factors["adx"] = f.adx;
    factors["trend_strength"] = f.trend_strength;
    factors["bullish_alignment"] = f.bullish_alignment;
    factors["bearish_alignment"] = f.bearish_alignment;
    factors["atr_percentile"] = f.atr_percentile;
    factors["volatility"] = f.volatility;
    factors["volume_percentile"] = f.volume_percentile;
    factors["volume"] = f.volume;
    factors["range_percent"] = f.range_percent;
    if (f.cloud) {
        factors["cloud"] = {{"above_cloud", f.cloud->above_cloud},
                            {"below_cloud", f.cloud->below_cloud},
                            {"in_cloud", f.cloud->in_cloud},
                            {"cloud_color", f.cloud->cloud_color}};
    }

    nlohmann::json j;
    j["regime"] = regime::to_string(classification.regime);
    j["label"] = regime::regime_label(classification.regime);
    j["confidence"] = classification.confidence;
    j["factors"] = factors;
    j["recommendation"] = classification.recommendation;
    return j;
}

nlohmann::json to_json(const regime::VolatilityRegimeResult& result) {
    nlohmann::json j;
    j["regime"] = regime::to_string(result.regime);
    j["confidence"] = result.confidence;
    j["current_volatility"] = number_or_null(result.current_volatility);
    j["percentile"] = result.percentile;
    j["forecast"] = result.forecast;
    j["params"] = {{"omega", result.params.omega},
                   {"alpha", result.params.alpha},
                   {"beta", result.params.beta},
                   {"persistence", result.params.persistence()},
                   {"log_likelihood", number_or_null(result.params.log_likelihood)}};
    return j;
}

nlohmann::json to_json(const regime::HMMRegimeResult& result) {
    nlohmann::json j;
    j["regime"] = regime::to_string(result.regime);
    j["confidence"] = result.confidence;
    j["current_state"] = result.current_state;
    j["probabilities"] = result.probabilities;
    j["states"] = result.states;
    j["state_labels"] = nlohmann::json::array();
    for (auto label : result.state_labels) {
        j["state_labels"].push_back(regime::to_string(label));
    }
    j["transition"] = nlohmann::json::array();
    for (Eigen::Index r = 0; r < result.transition.rows(); ++r) {
        nlohmann::json row = nlohmann::json::array();
        for (Eigen::Index c = 0; c < result.transition.cols(); ++c) {
            row.push_back(result.transition(r, c));
        }
        j["transition"].push_back(row);
    }
    return j;
}

nlohmann::json to_json(const regime::PersistenceResult& result) {
    return {{"regime", regime::to_string(result.regime)},
            {"hurst_exponent", result.hurst_exponent},
            {"confidence", result.confidence},
            {"interpretation", result.interpretation}};
}

nlohmann::json to_json(const regime::AdvancedRegimeResult& result) {
    nlohmann::json j;
    j["regime"] = regime::to_string(result.regime);
    j["confidence"] = result.confidence;
    j["analysis"] = analysis_to_json(result.analysis);
    j["interpretation"] = {{"trend", result.interpretation.trend},
                           {"volatility", result.interpretation.volatility},
                           {"cycle", result.interpretation.cycle},
                           {"liquidity", result.interpretation.liquidity}};
    j["time"] = result.time;
    return j;
}

nlohmann::json to_json(const regime::RegimeUpdate& update) {
    nlohmann::json j;
    j["regime"] = regime::to_string(update.regime);
    j["confidence"] = update.confidence;
    j["changed"] = update.changed;
    j["analysis"] = analysis_to_json(update.analysis);
    if (update.prediction) {
        j["prediction"] = {{"regime", regime::to_string(update.prediction->regime)},
                           {"probability", update.prediction->probability}};
    } else {
        j["prediction"] = nullptr;
    }
    return j;
}

nlohmann::json to_json(const regime::TransitionRisk& risk) {
    nlohmann::json j;
    j["risk"] = risk.risk;
    j["message"] = risk.message;
    j["predicted_regime"] = risk.predicted_regime
                                ? nlohmann::json(regime::to_string(*risk.predicted_regime))
                                : nlohmann::json(nullptr);
    return j;
}

// ============================================================================
// Backtest
// ============================================================================

nlohmann::json to_json(const backtest::BacktestReport& report) {
    nlohmann::json j;
    j["bars"] = report.bars;
    j["threshold"] = report.threshold;
    j["horizon"] = report.horizon;
    j["events"] = report.events.size();
    j["win_rate"] = report.win_rate;
    j["avg_forward"] = report.avg_forward;
    j["median_forward"] = report.median_forward;
    j["avg_win"] = report.avg_win;
    j["avg_loss"] = report.avg_loss;
    j["profit_factor"] = optional_or_null(report.profit_factor);
    j["score_avg"] = report.score_avg;
    j["score_pcts"] = {{"p40", report.pct_above_40},
                       {"p60", report.pct_above_60},
                       {"p70", report.pct_above_70}};
    j["recent_scores"] = report.recent_scores;

    j["event_log"] = nlohmann::json::array();
    for (const auto& event : report.events) {
        j["event_log"].push_back({{"index", event.index},
                                  {"time", event.time},
                                  {"close", event.close},
                                  {"score", event.score},
                                  {"forward_return", event.forward_return}});
    }

    j["curve"] = nlohmann::json::array();
    for (const auto& point : report.curve) {
        j["curve"].push_back({{"threshold", point.threshold},
                              {"events", point.events},
                              {"win_rate", point.win_rate},
                              {"avg_forward", point.avg_forward}});
    }
    return j;
}

}  // namespace serialization
}  // namespace signal_ngin
