// include/signal_ngin/signals/timeframe_consensus.hpp
#pragma once

#include <optional>
#include <string>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/signals/composite_score.hpp"

namespace signal_ngin {
namespace signals {

enum class Timeframe {
    ONE_MIN,
    FIVE_MIN,
    FIFTEEN_MIN,
    ONE_HOUR,
    ONE_DAY
};

std::string to_string(Timeframe timeframe);

/**
 * @brief Parse "1Min", "5Min", "15Min", "1Hour" or "1Day"
 * @return INVALID_ARGUMENT for any other name
 */
Result<Timeframe> parse_timeframe(const std::string& name);

/**
 * @brief Next-slower timeframe used to confirm the primary one
 * @return 1Min -> 5Min, 5Min -> 15Min, 15Min -> 1Hour; nothing above that
 */
std::optional<Timeframe> secondary_timeframe(Timeframe primary);

struct ConsensusResult {
    Timeframe primary_tf{Timeframe::FIVE_MIN};
    std::optional<Timeframe> secondary_tf;
    bool align{false};
    Trend primary_pivot{Trend::NEUTRAL};
    Trend secondary_pivot{Trend::NEUTRAL};
};

/**
 * @brief Compare pivot ribbon direction across two timeframes
 * Alignment requires equal, non-neutral directions and a mapped secondary
 * timeframe.
 */
ConsensusResult evaluate_consensus(Timeframe primary_tf, const SignalState& primary,
                                   const SignalState& secondary);

/**
 * @brief Add the consensus bonus to a scored state
 * @param bonus Points awarded on alignment
 * @return Copy of state with the CONSENSUS component set and the score
 *         capped at 100 when enabled and aligned, otherwise unchanged
 */
SignalState apply_consensus_bonus(const SignalState& state, const ConsensusResult& consensus,
                                  bool enabled, double bonus = 10.0);

}  // namespace signals
}  // namespace signal_ngin
