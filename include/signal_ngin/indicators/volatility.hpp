// include/signal_ngin/indicators/volatility.hpp
#pragma once

#include <vector>
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {
namespace indicators {

/**
 * @brief True range per bar
 * The first bar has no prior close and uses high - low.
 */
IndicatorSeries true_range(const std::vector<Bar>& bars);

/**
 * @brief Average true range with Wilder smoothing
 *
 * Seeded at index period-1 with the mean of the first period true ranges,
 * then atr = (prev * (period - 1) + tr) / period.
 */
IndicatorSeries atr(const std::vector<Bar>& bars, int period = 14);

}  // namespace indicators
}  // namespace signal_ngin
