// include/signal_ngin/statistics/series_math.hpp
#pragma once

#include <vector>
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {
namespace statistics {

// ============================================================================
// Moving Averages
// ============================================================================

/**
 * @brief Simple moving average over a rolling window
 * @param values Input series
 * @param period Window length
 * @return Series aligned with values; the first period-1 entries (and any
 *         window containing an undefined input) are UNDEFINED_VALUE
 */
IndicatorSeries sma(const std::vector<double>& values, int period);

/**
 * @brief Exponential moving average with k = 2 / (period + 1)
 *
 * Seeded with the simple average of the first period defined values, then
 * v = price * k + prev * (1 - k). Leading undefined inputs are skipped, so an
 * EMA of an indicator that has its own warmup starts where that warmup ends.
 *
 * @param values Input series
 * @param period Smoothing period
 * @return Series aligned with values
 */
IndicatorSeries ema(const std::vector<double>& values, int period);

// ============================================================================
// Descriptive Statistics
// ============================================================================

// Return UNDEFINED_VALUE on empty input
double mean(const std::vector<double>& values);
double variance(const std::vector<double>& values);  // population
double std_dev(const std::vector<double>& values);   // population
double median(std::vector<double> values);

/**
 * @brief Population covariance of two equal-length series
 * @return UNDEFINED_VALUE if lengths differ or input is empty
 */
double covariance(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief Pearson correlation
 * @return 0 when either series has zero variance, UNDEFINED_VALUE on
 *         mismatched or empty input
 */
double correlation(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief Sample autocorrelation at a lag, normalised by the full-series
 *        sum of squared deviations
 * @return 0 when lag is out of range or the series is constant
 */
double autocorrelation(const std::vector<double>& series, int lag);

// ============================================================================
// Returns and Rolling Helpers
// ============================================================================

std::vector<double> log_returns(const std::vector<double>& prices);
std::vector<double> simple_returns(const std::vector<double>& prices);

IndicatorSeries rolling_std(const std::vector<double>& values, int period);
IndicatorSeries rolling_max(const std::vector<double>& values, int period);
IndicatorSeries rolling_min(const std::vector<double>& values, int period);

/**
 * @brief Least-squares slope of values against their index 0..n-1
 * @return UNDEFINED_VALUE for fewer than two points or undefined input
 */
double linear_regression_slope(const std::vector<double>& values);

/**
 * @brief Linear-regression slope over a trailing window at every bar
 */
IndicatorSeries rolling_slope(const std::vector<double>& values, int period);

/**
 * @brief Percentage of reference values strictly below value
 * @return 50 when reference is empty
 */
double percentile_rank(const std::vector<double>& reference, double value);

}  // namespace statistics
}  // namespace signal_ngin
