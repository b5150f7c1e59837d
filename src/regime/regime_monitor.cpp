// src/regime/regime_monitor.cpp

#include "signal_ngin/regime/regime_monitor.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {
namespace regime {

namespace {

constexpr std::array<AdvancedRegime, ADVANCED_REGIME_COUNT> REGIME_ORDER{
    AdvancedRegime::TRENDING, AdvancedRegime::MEAN_REVERTING, AdvancedRegime::HIGH_VOLATILITY,
    AdvancedRegime::NEUTRAL, AdvancedRegime::UNKNOWN};

size_t index_of(AdvancedRegime regime) {
    return static_cast<size_t>(regime);
}

}  // namespace

// ============================================================================
// RegimeMonitorConfig
// ============================================================================

nlohmann::json RegimeMonitorConfig::to_json() const {
    nlohmann::json j;
    j["alert_threshold"] = alert_threshold;
    j["max_history"] = max_history;
    j["min_history_for_transitions"] = min_history_for_transitions;
    j["stability_window"] = stability_window;
    j["detector"] = detector.to_json();
    return j;
}

void RegimeMonitorConfig::from_json(const nlohmann::json& j) {
    if (j.contains("alert_threshold"))
        alert_threshold = j.at("alert_threshold").get<double>();
    if (j.contains("max_history"))
        max_history = std::clamp<size_t>(j.at("max_history").get<size_t>(), 1,
                                         MAX_REGIME_HISTORY);
    if (j.contains("min_history_for_transitions"))
        min_history_for_transitions = j.at("min_history_for_transitions").get<size_t>();
    if (j.contains("stability_window"))
        stability_window = j.at("stability_window").get<size_t>();
    if (j.contains("detector"))
        detector.from_json(j.at("detector"));
}

// ============================================================================
// Transition Statistics
// ============================================================================

std::optional<TransitionMatrix> estimate_transition_matrix(
    const std::vector<AdvancedRegime>& sequence, size_t min_length) {
    if (sequence.size() < min_length || sequence.size() < 2)
        return std::nullopt;

    TransitionMatrix matrix{};
    for (size_t i = 0; i + 1 < sequence.size(); ++i) {
        matrix[index_of(sequence[i])][index_of(sequence[i + 1])] += 1.0;
    }

    for (auto& row : matrix) {
        double total = 0.0;
        for (double count : row) total += count;
        if (total > 0.0) {
            for (double& cell : row) cell /= total;
        }
    }
    return matrix;
}

RegimePrediction predict_next_regime(AdvancedRegime current,
                                     const std::optional<TransitionMatrix>& matrix) {
    RegimePrediction prediction{current, 1.0};
    if (!matrix)
        return prediction;

    const auto& row = (*matrix)[index_of(current)];
    double best = 0.0;
    for (AdvancedRegime candidate : REGIME_ORDER) {
        double p = row[index_of(candidate)];
        if (p > best) {
            best = p;
            prediction = RegimePrediction{candidate, p};
        }
    }
    return prediction;
}

// ============================================================================
// RegimeMonitor
// ============================================================================

RegimeMonitor::RegimeMonitor(RegimeMonitorConfig config) : config_(std::move(config)) {
    config_.max_history = std::clamp<size_t>(config_.max_history, 1, MAX_REGIME_HISTORY);
}

Result<RegimeUpdate> RegimeMonitor::update(const std::vector<Bar>& bars) {
    auto detected = detect_regime_advanced(bars, config_.detector);
    if (detected.is_error()) {
        return make_error<RegimeUpdate>(detected.error()->code(), detected.error()->what(),
                                        "RegimeMonitor");
    }
    EpochSeconds stamp = bars.empty() ? 0 : bars.back().time;
    return Result<RegimeUpdate>(record(stamp, detected.value()));
}

RegimeUpdate RegimeMonitor::record(EpochSeconds timestamp, const AdvancedRegimeResult& result) {
    history_.push_back(RegimeRecord{timestamp, result.regime, result.confidence});
    while (history_.size() > config_.max_history) {
        history_.pop_front();
    }

    std::vector<AdvancedRegime> sequence;
    sequence.reserve(history_.size());
    for (const auto& entry : history_) {
        sequence.push_back(entry.regime);
    }
    transition_matrix_ =
        estimate_transition_matrix(sequence, config_.min_history_for_transitions);

    RegimeUpdate update;
    update.regime = result.regime;
    update.confidence = result.confidence;
    update.changed = !current_regime_ || *current_regime_ != result.regime;
    update.analysis = result.analysis;

    if (update.changed && current_regime_) {
        INFO("Regime change: " << to_string(*current_regime_) << " -> "
                               << to_string(result.regime) << " (" << result.confidence << "%)");
    }
    current_regime_ = result.regime;
    last_update_ = timestamp;

    if (transition_matrix_) {
        update.prediction = predict_next_regime(result.regime, transition_matrix_);
    }

    TransitionRisk risk = check_transition_risk();
    if (risk.risk > 0.0) {
        INFO("Regime transition alert: " << risk.message);
    }
    return update;
}

double RegimeMonitor::stability() const {
    const size_t window = config_.stability_window;
    if (window == 0 || history_.size() < window)
        return 0.0;

    std::set<AdvancedRegime> unique;
    for (auto it = history_.end() - window; it != history_.end(); ++it) {
        unique.insert(it->regime);
    }
    return std::max(0.0, 100.0 - 25.0 * static_cast<double>(unique.size()));
}

RegimePrediction RegimeMonitor::predict_next() const {
    return predict_next_regime(current_regime_.value_or(AdvancedRegime::UNKNOWN),
                               transition_matrix_);
}

TransitionRisk RegimeMonitor::check_transition_risk() const {
    TransitionRisk risk;
    if (!transition_matrix_ || !current_regime_) {
        risk.message = "Insufficient data";
        return risk;
    }

    RegimePrediction prediction = predict_next_regime(*current_regime_, transition_matrix_);
    if (prediction.regime != *current_regime_ &&
        prediction.probability > config_.alert_threshold) {
        risk.risk = prediction.probability * 100.0;
        risk.message = "High probability (" +
                       std::to_string(static_cast<int>(std::round(risk.risk))) +
                       "%) of transition to " + to_string(prediction.regime);
        risk.predicted_regime = prediction.regime;
        return risk;
    }

    risk.message = "Regime appears stable";
    return risk;
}

nlohmann::json RegimeMonitor::export_state() const {
    nlohmann::json j;
    j["history"] = nlohmann::json::array();
    for (const auto& entry : history_) {
        j["history"].push_back({{"timestamp", entry.timestamp},
                                {"regime", to_string(entry.regime)},
                                {"confidence", entry.confidence}});
    }
    j["current_regime"] =
        current_regime_ ? nlohmann::json(to_string(*current_regime_)) : nlohmann::json(nullptr);

    if (transition_matrix_) {
        nlohmann::json matrix = nlohmann::json::object();
        for (AdvancedRegime from : REGIME_ORDER) {
            nlohmann::json row = nlohmann::json::object();
            for (AdvancedRegime to : REGIME_ORDER) {
                row[to_string(to)] = (*transition_matrix_)[index_of(from)][index_of(to)];
            }
            matrix[to_string(from)] = row;
        }
        j["transition_matrix"] = matrix;
    } else {
        j["transition_matrix"] = nullptr;
    }

    j["stability"] = stability();
    j["last_update"] = last_update_ ? nlohmann::json(*last_update_) : nlohmann::json(nullptr);
    return j;
}

}  // namespace regime
}  // namespace signal_ngin
