// include/signal_ngin/backtest/score_backtest.hpp
#pragma once

#include <optional>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/signals/composite_score.hpp"

namespace signal_ngin {
namespace backtest {

/**
 * @brief Configuration for replaying the composite score over history
 */
struct ScoreBacktestConfig : public ConfigBase {
    double threshold{70.0};
    size_t horizon{10};                  // bars between entry and exit
    std::optional<size_t> start_index;   // defaults to min(80, bars / 5)
    std::vector<double> curve_thresholds{30, 40, 50, 60, 70, 80, 90};
    size_t score_window{400};            // scores kept for the distribution stats
    size_t recent_scores{120};
    signals::SignalScorerConfig scorer;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief A bar whose score met the threshold with a complete forward window
 */
struct ScoreEvent {
    size_t index{0};
    EpochSeconds time{0};
    double close{0.0};
    double score{0.0};
    double forward_return{0.0};  // fraction, 0.01 = 1%
};

struct ThresholdCurvePoint {
    double threshold{0.0};
    size_t events{0};
    double win_rate{0.0};     // percent
    double avg_forward{0.0};  // percent
};

/**
 * @brief Summary statistics; return figures are expressed in percent
 */
struct BacktestReport {
    size_t bars{0};
    double threshold{0.0};
    size_t horizon{0};
    std::vector<ScoreEvent> events;
    double win_rate{0.0};
    double avg_forward{0.0};
    double median_forward{0.0};
    double avg_win{0.0};
    double avg_loss{0.0};
    std::optional<double> profit_factor;  // absent when only wins or only losses
    double score_avg{0.0};
    double pct_above_40{0.0};
    double pct_above_60{0.0};
    double pct_above_70{0.0};
    std::vector<double> recent_scores;
    std::vector<ThresholdCurvePoint> curve;
};

/**
 * @brief Score every bar from the start index and measure forward returns
 *
 * Scores come from SignalScorer::score_history, so each bar sees only its
 * own prefix of the series.
 *
 * @return INVALID_DATA for a malformed series, INVALID_ARGUMENT for a zero
 *         horizon. An empty series yields an empty report.
 */
Result<BacktestReport> run_score_backtest(const std::vector<Bar>& bars,
                                          const ScoreBacktestConfig& config = ScoreBacktestConfig());

}  // namespace backtest
}  // namespace signal_ngin
