// src/signals/composite_score.cpp

#include "signal_ngin/signals/composite_score.hpp"
#include <algorithm>
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {
namespace signals {

std::string to_string(ScoreIndicator indicator) {
    switch (indicator) {
        case ScoreIndicator::PIVOT_RIBBON:
            return "pivot_ribbon";
        case ScoreIndicator::RIPSTER_3450:
            return "ripster_3450";
        case ScoreIndicator::SATY_TRIGGER:
            return "saty_trigger";
        case ScoreIndicator::SQUEEZE_ON:
            return "squeeze_on";
        case ScoreIndicator::SQUEEZE_FIRED:
            return "squeeze_fired";
        case ScoreIndicator::ICHIMOKU:
            return "ichimoku";
        case ScoreIndicator::CONSENSUS:
            return "consensus";
        default:
            return "unknown";
    }
}

double ScoreComponents::total() const {
    double sum = 0.0;
    for (double v : values_) {
        sum += v;
    }
    return sum;
}

// ============================================================================
// Configuration
// ============================================================================

double ScoreWeights::fired_contribution(int bars_ago) const {
    if (bars_ago < 0 || bars_ago > squeeze_decay_bars)
        return 0.0;
    if (squeeze_decay_bars <= 0)
        return squeeze_fired;
    double step = (squeeze_fired - squeeze_fired_floor) / squeeze_decay_bars;
    return std::max(squeeze_fired_floor, squeeze_fired - step * bars_ago);
}

nlohmann::json ScoreWeights::to_json() const {
    nlohmann::json j;
    j["pivot_ribbon"] = pivot_ribbon;
    j["ripster_3450"] = ripster_3450;
    j["saty_trigger"] = saty_trigger;
    j["squeeze_on"] = squeeze_on;
    j["squeeze_fired"] = squeeze_fired;
    j["squeeze_fired_floor"] = squeeze_fired_floor;
    j["squeeze_decay_bars"] = squeeze_decay_bars;
    j["ichimoku"] = ichimoku;
    j["consensus_bonus"] = consensus_bonus;
    return j;
}

void ScoreWeights::from_json(const nlohmann::json& j) {
    if (j.contains("pivot_ribbon"))
        pivot_ribbon = j.at("pivot_ribbon").get<double>();
    if (j.contains("ripster_3450"))
        ripster_3450 = j.at("ripster_3450").get<double>();
    if (j.contains("saty_trigger"))
        saty_trigger = j.at("saty_trigger").get<double>();
    if (j.contains("squeeze_on"))
        squeeze_on = j.at("squeeze_on").get<double>();
    if (j.contains("squeeze_fired"))
        squeeze_fired = j.at("squeeze_fired").get<double>();
    if (j.contains("squeeze_fired_floor"))
        squeeze_fired_floor = j.at("squeeze_fired_floor").get<double>();
    if (j.contains("squeeze_decay_bars"))
        squeeze_decay_bars = j.at("squeeze_decay_bars").get<int>();
    if (j.contains("ichimoku"))
        ichimoku = j.at("ichimoku").get<double>();
    if (j.contains("consensus_bonus"))
        consensus_bonus = j.at("consensus_bonus").get<double>();
}

nlohmann::json SignalScorerConfig::to_json() const {
    nlohmann::json j;
    j["overlays"] = overlays.to_json();
    j["weights"] = weights.to_json();
    j["threshold"] = threshold;
    return j;
}

void SignalScorerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("overlays"))
        overlays.from_json(j.at("overlays"));
    if (j.contains("weights"))
        weights.from_json(j.at("weights"));
    if (j.contains("threshold"))
        threshold = j.at("threshold").get<double>();
}

// ============================================================================
// SignalScorer
// ============================================================================

SignalScorer::SignalScorer(SignalScorerConfig config) : config_(std::move(config)) {}

Result<SignalState> SignalScorer::score(const std::vector<Bar>& bars) const {
    auto overlays = indicators::compute_overlays(bars, config_.overlays);
    if (overlays.is_error()) {
        return make_error<SignalState>(overlays.error()->code(), overlays.error()->what(),
                                       "SignalScorer");
    }
    if (bars.empty()) {
        return Result<SignalState>(SignalState());
    }

    const auto& bundle = overlays.value();
    auto squeeze = indicators::scan_squeeze(bundle.ttm.squeeze_on, bundle.ttm.momentum);
    return Result<SignalState>(evaluate(bars, bundle, squeeze, bars.size() - 1));
}

Result<std::vector<SignalState>> SignalScorer::score_history(const std::vector<Bar>& bars,
                                                             size_t start) const {
    auto overlays = indicators::compute_overlays(bars, config_.overlays);
    if (overlays.is_error()) {
        return make_error<std::vector<SignalState>>(overlays.error()->code(),
                                                    overlays.error()->what(), "SignalScorer");
    }

    const auto& bundle = overlays.value();
    auto squeeze = indicators::scan_squeeze(bundle.ttm.squeeze_on, bundle.ttm.momentum);

    std::vector<SignalState> history;
    if (start < bars.size()) {
        history.reserve(bars.size() - start);
    }
    for (size_t i = start; i < bars.size(); ++i) {
        history.push_back(evaluate(bars, bundle, squeeze, i));
    }
    DEBUG("Scored " << history.size() << " bars from index " << start);
    return Result<std::vector<SignalState>>(std::move(history));
}

SignalState SignalScorer::evaluate(const std::vector<Bar>& bars,
                                   const indicators::OverlayBundle& overlays,
                                   const std::vector<indicators::SqueezeState>& squeeze,
                                   size_t index) const {
    const ScoreWeights& w = config_.weights;
    const Bar& bar = bars[index];

    SignalState state;
    state.time = bar.time;
    state.pivot_now = overlays.pivot_ribbon.states[index];
    state.ripster_bias = overlays.ripster[index];
    state.saty_direction = indicators::saty_levels_at(bars, overlays.atr, index).direction;
    state.ichimoku_regime = indicators::ichimoku_regime_at(overlays.ichimoku, bar.close, index);
    state.squeeze = squeeze[index];

    if (state.pivot_now == Trend::BULLISH) {
        state.components.set(ScoreIndicator::PIVOT_RIBBON, w.pivot_ribbon);
    }
    if (state.ripster_bias == Trend::BULLISH) {
        state.components.set(ScoreIndicator::RIPSTER_3450, w.ripster_3450);
    }
    // Trigger only counts in the direction of the ribbon
    if (state.saty_direction == TradeDirection::LONG && state.pivot_now == Trend::BULLISH) {
        state.components.set(ScoreIndicator::SATY_TRIGGER, w.saty_trigger);
    }
    if (state.squeeze.on) {
        state.components.set(ScoreIndicator::SQUEEZE_ON, w.squeeze_on);
    } else if (state.squeeze.direction == TradeDirection::LONG && state.squeeze.fired_bars_ago) {
        state.components.set(ScoreIndicator::SQUEEZE_FIRED,
                             w.fired_contribution(*state.squeeze.fired_bars_ago));
    }
    if (state.ichimoku_regime == Trend::BULLISH) {
        state.components.set(ScoreIndicator::ICHIMOKU, w.ichimoku);
    }

    state.score = std::clamp(state.components.total(), 0.0, 100.0);
    return state;
}

}  // namespace signals
}  // namespace signal_ngin
