// include/signal_ngin/indicators/squeeze.hpp
#pragma once

#include <optional>
#include <vector>
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {
namespace indicators {

/**
 * @brief Volatility squeeze status at one bar
 */
struct SqueezeState {
    bool on{false};
    bool fired{false};
    TradeDirection direction{TradeDirection::NONE};
    std::optional<int> fired_bars_ago;  // bars since the last ON -> OFF release
};

/**
 * @brief Derive the squeeze state of every bar in one forward scan
 *
 * - OFF -> ON clears any earlier release
 * - ON -> OFF marks the bar fired, direction = sign of momentum there
 * - OFF -> OFF after a release counts bars since it, keeping its direction
 *
 * Readings inside the band warmup are empty and leave the state OFF.
 *
 * @param readings Per-bar Bollinger-inside-Keltner verdicts
 * @param momentum Per-bar momentum aligned with readings
 * @return One state per reading
 */
std::vector<SqueezeState> scan_squeeze(const std::vector<std::optional<bool>>& readings,
                                       const IndicatorSeries& momentum);

/**
 * @brief State of the last bar, or OFF for an empty window
 */
SqueezeState current_squeeze(const std::vector<std::optional<bool>>& readings,
                             const IndicatorSeries& momentum);

}  // namespace indicators
}  // namespace signal_ngin
