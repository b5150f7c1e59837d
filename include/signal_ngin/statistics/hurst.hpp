// include/signal_ngin/statistics/hurst.hpp
#pragma once

#include <cstddef>
#include <vector>

namespace signal_ngin {
namespace statistics {

/**
 * @brief Hurst exponent by rescaled-range analysis
 *
 * The series is cut into non-overlapping chunks of 20, 40, 60, 100 and 150
 * points. For each chunk R/S is the range of cumulative deviations from the
 * chunk mean over its population std; chunks with zero std are skipped.
 * H is the slope of log(mean R/S) against log(chunk size).
 *
 * @param series Increments (e.g. returns) of the process under study
 * @param min_points Shortest series analysed; returns of an N-bar window
 *        have N - 1 points
 * @return H in [0, 1]; 0.5 below min_points or when fewer than two chunk
 *         sizes yield a usable R/S
 */
constexpr size_t MIN_HURST_POINTS = 100;

double calculate_hurst_exponent(const std::vector<double>& series,
                                size_t min_points = MIN_HURST_POINTS);

}  // namespace statistics
}  // namespace signal_ngin
