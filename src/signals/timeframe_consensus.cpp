// src/signals/timeframe_consensus.cpp

#include "signal_ngin/signals/timeframe_consensus.hpp"
#include <algorithm>

namespace signal_ngin {
namespace signals {

std::string to_string(Timeframe timeframe) {
    switch (timeframe) {
        case Timeframe::ONE_MIN:
            return "1Min";
        case Timeframe::FIVE_MIN:
            return "5Min";
        case Timeframe::FIFTEEN_MIN:
            return "15Min";
        case Timeframe::ONE_HOUR:
            return "1Hour";
        case Timeframe::ONE_DAY:
            return "1Day";
        default:
            return "unknown";
    }
}

Result<Timeframe> parse_timeframe(const std::string& name) {
    if (name == "1Min")
        return Result<Timeframe>(Timeframe::ONE_MIN);
    if (name == "5Min")
        return Result<Timeframe>(Timeframe::FIVE_MIN);
    if (name == "15Min")
        return Result<Timeframe>(Timeframe::FIFTEEN_MIN);
    if (name == "1Hour")
        return Result<Timeframe>(Timeframe::ONE_HOUR);
    if (name == "1Day")
        return Result<Timeframe>(Timeframe::ONE_DAY);
    return make_error<Timeframe>(ErrorCode::INVALID_ARGUMENT, "Unknown timeframe: " + name,
                                 "TimeframeConsensus");
}

std::optional<Timeframe> secondary_timeframe(Timeframe primary) {
    switch (primary) {
        case Timeframe::ONE_MIN:
            return Timeframe::FIVE_MIN;
        case Timeframe::FIVE_MIN:
            return Timeframe::FIFTEEN_MIN;
        case Timeframe::FIFTEEN_MIN:
            return Timeframe::ONE_HOUR;
        default:
            return std::nullopt;
    }
}

ConsensusResult evaluate_consensus(Timeframe primary_tf, const SignalState& primary,
                                   const SignalState& secondary) {
    ConsensusResult result;
    result.primary_tf = primary_tf;
    result.secondary_tf = secondary_timeframe(primary_tf);
    result.primary_pivot = primary.pivot_now;
    result.secondary_pivot = secondary.pivot_now;
    result.align = result.secondary_tf.has_value() && primary.pivot_now != Trend::NEUTRAL &&
                   primary.pivot_now == secondary.pivot_now;
    return result;
}

SignalState apply_consensus_bonus(const SignalState& state, const ConsensusResult& consensus,
                                  bool enabled, double bonus) {
    SignalState out = state;
    if (!enabled || !consensus.align)
        return out;
    out.components.set(ScoreIndicator::CONSENSUS, bonus);
    out.score = std::min(100.0, state.score + bonus);
    return out;
}

}  // namespace signals
}  // namespace signal_ngin
