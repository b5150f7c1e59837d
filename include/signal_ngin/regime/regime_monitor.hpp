// include/signal_ngin/regime/regime_monitor.hpp
#pragma once

#include <array>
#include <deque>
#include <optional>
#include <string>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/regime/advanced_detector.hpp"
#include "signal_ngin/regime/regime_types.hpp"

namespace signal_ngin {
namespace regime {

// Upper bound on retained monitor history
constexpr size_t MAX_REGIME_HISTORY = 100;

/**
 * @brief Configuration for regime monitoring
 * max_history is clamped to [1, MAX_REGIME_HISTORY].
 */
struct RegimeMonitorConfig : public ConfigBase {
    double alert_threshold{0.7};  // transition probability that raises an alert
    size_t max_history{100};
    size_t min_history_for_transitions{10};
    size_t stability_window{10};
    AdvancedDetectorConfig detector;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

struct RegimeRecord {
    EpochSeconds timestamp{0};
    AdvancedRegime regime{AdvancedRegime::UNKNOWN};
    double confidence{0.0};
};

/**
 * @brief Empirical transition probabilities indexed by AdvancedRegime
 * Rows of regimes never left are all zero.
 */
using TransitionMatrix =
    std::array<std::array<double, ADVANCED_REGIME_COUNT>, ADVANCED_REGIME_COUNT>;

struct RegimePrediction {
    AdvancedRegime regime{AdvancedRegime::UNKNOWN};
    double probability{1.0};
};

struct RegimeUpdate {
    AdvancedRegime regime{AdvancedRegime::UNKNOWN};
    double confidence{0.0};
    bool changed{false};
    AdvancedAnalysis analysis;
    std::optional<RegimePrediction> prediction;
};

struct TransitionRisk {
    double risk{0.0};  // 0-100
    std::string message;
    std::optional<AdvancedRegime> predicted_regime;
};

/**
 * @brief Count consecutive transitions in a regime sequence
 * @return Row-normalised matrix, or nothing for fewer than min_length entries
 */
std::optional<TransitionMatrix> estimate_transition_matrix(
    const std::vector<AdvancedRegime>& sequence, size_t min_length = 10);

/**
 * @brief Most probable successor of current
 * Ties go to the regime declared first. Without a matrix, or when current
 * has never been left, the prediction is current with probability 1.
 */
RegimePrediction predict_next_regime(AdvancedRegime current,
                                     const std::optional<TransitionMatrix>& matrix);

/**
 * @brief Rolling regime history with transition statistics
 *
 * Owned by one caller; concurrent use must be serialized externally.
 */
class RegimeMonitor {
public:
    explicit RegimeMonitor(RegimeMonitorConfig config = RegimeMonitorConfig());

    /**
     * @brief Run the advanced detector on bars and record the outcome
     * The record is stamped with the last bar's time.
     * @return INVALID_DATA for a malformed window, nothing recorded
     */
    Result<RegimeUpdate> update(const std::vector<Bar>& bars);

    /**
     * @brief Append one detector outcome and refresh derived state
     */
    RegimeUpdate record(EpochSeconds timestamp, const AdvancedRegimeResult& result);

    /**
     * @brief 100 - 25 * distinct regimes in the recent window, floored at 0
     * @return 0 until the window is full
     */
    double stability() const;

    RegimePrediction predict_next() const;

    TransitionRisk check_transition_risk() const;

    /**
     * @brief History, current regime, transition matrix and stability as JSON
     */
    nlohmann::json export_state() const;

    const std::deque<RegimeRecord>& history() const {
        return history_;
    }

    std::optional<AdvancedRegime> current_regime() const {
        return current_regime_;
    }

    const std::optional<TransitionMatrix>& transition_matrix() const {
        return transition_matrix_;
    }

    const RegimeMonitorConfig& config() const {
        return config_;
    }

private:
    RegimeMonitorConfig config_;
    std::deque<RegimeRecord> history_;
    std::optional<AdvancedRegime> current_regime_;
    std::optional<TransitionMatrix> transition_matrix_;
    std::optional<EpochSeconds> last_update_;
};

}  // namespace regime
}  // namespace signal_ngin
