// include/signal_ngin/signals/composite_score.hpp
#pragma once

#include <array>
#include <string>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/indicators/overlays.hpp"
#include "signal_ngin/indicators/squeeze.hpp"

namespace signal_ngin {
namespace signals {

/**
 * @brief Indicators that can contribute to the composite score
 */
enum class ScoreIndicator {
    PIVOT_RIBBON,
    RIPSTER_3450,
    SATY_TRIGGER,
    SQUEEZE_ON,
    SQUEEZE_FIRED,
    ICHIMOKU,
    CONSENSUS
};

constexpr size_t SCORE_INDICATOR_COUNT = 7;

constexpr std::array<ScoreIndicator, SCORE_INDICATOR_COUNT> ALL_SCORE_INDICATORS{
    ScoreIndicator::PIVOT_RIBBON, ScoreIndicator::RIPSTER_3450, ScoreIndicator::SATY_TRIGGER,
    ScoreIndicator::SQUEEZE_ON,   ScoreIndicator::SQUEEZE_FIRED, ScoreIndicator::ICHIMOKU,
    ScoreIndicator::CONSENSUS};

std::string to_string(ScoreIndicator indicator);

/**
 * @brief Per-indicator score contributions, indexed by ScoreIndicator
 */
class ScoreComponents {
public:
    double get(ScoreIndicator indicator) const {
        return values_[static_cast<size_t>(indicator)];
    }

    void set(ScoreIndicator indicator, double contribution) {
        values_[static_cast<size_t>(indicator)] = contribution;
    }

    double total() const;

private:
    std::array<double, SCORE_INDICATOR_COUNT> values_{};
};

/**
 * @brief Weight of each verdict in the 0-100 score
 */
struct ScoreWeights : public ConfigBase {
    double pivot_ribbon{20.0};
    double ripster_3450{20.0};
    double saty_trigger{20.0};
    double squeeze_on{10.0};
    double squeeze_fired{25.0};       // on the release bar
    double squeeze_fired_floor{5.0};  // after squeeze_decay_bars
    int squeeze_decay_bars{5};
    double ichimoku{15.0};
    double consensus_bonus{10.0};

    /**
     * @brief Contribution of a long squeeze release seen bars_ago bars back
     * @return Linear decay from squeeze_fired to squeeze_fired_floor, 0 beyond
     */
    double fired_contribution(int bars_ago) const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

struct SignalScorerConfig : public ConfigBase {
    indicators::OverlayConfig overlays;
    ScoreWeights weights;
    double threshold{70.0};  // score at which a signal is considered live

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Composite score for one bar with its attribution
 */
struct SignalState {
    double score{0.0};
    ScoreComponents components;
    Trend pivot_now{Trend::NEUTRAL};
    Trend ripster_bias{Trend::NEUTRAL};
    TradeDirection saty_direction{TradeDirection::NONE};
    Trend ichimoku_regime{Trend::NEUTRAL};
    indicators::SqueezeState squeeze;
    EpochSeconds time{0};
};

/**
 * @brief Turns overlay verdicts into a weighted 0-100 score
 *
 * Stateless apart from its configuration; score() on a prefix of a series
 * returns exactly the entry score_history() produces for that index.
 */
class SignalScorer {
public:
    explicit SignalScorer(SignalScorerConfig config = SignalScorerConfig());

    /**
     * @brief Score the last bar of a window
     * @param bars Validated, ascending bar window
     * @return SignalState, or INVALID_DATA for a malformed window. An empty
     *         window scores 0.
     */
    Result<SignalState> score(const std::vector<Bar>& bars) const;

    /**
     * @brief Score every bar from start onward in a single pass
     * @return One SignalState per index in [start, bars.size())
     */
    Result<std::vector<SignalState>> score_history(const std::vector<Bar>& bars,
                                                   size_t start = 0) const;

    const SignalScorerConfig& config() const {
        return config_;
    }

private:
    SignalScorerConfig config_;

    SignalState evaluate(const std::vector<Bar>& bars, const indicators::OverlayBundle& overlays,
                         const std::vector<indicators::SqueezeState>& squeeze,
                         size_t index) const;
};

}  // namespace signals
}  // namespace signal_ngin
