// include/signal_ngin/statistics/microstructure.hpp
#pragma once

#include <vector>
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {
namespace statistics {

/**
 * @brief Amihud illiquidity: mean |close - open| / open per million of
 *        dollar volume, over bars that traded
 * @return 0 when no bar has positive dollar volume
 */
double amihud_illiquidity(const std::vector<Bar>& bars);

/**
 * @brief Roll bid-ask spread estimate, 2 * sqrt(-serial covariance of price
 *        changes)
 * @return 0 when the serial covariance is non-negative or data is too short
 */
double roll_spread(const std::vector<double>& prices);

/**
 * @brief Per-bar signed volume share, +1 for an up bar, -1 for a down bar
 */
std::vector<double> order_flow_imbalance(const std::vector<Bar>& bars);

}  // namespace statistics
}  // namespace signal_ngin
