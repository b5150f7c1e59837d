// include/signal_ngin/statistics/numeric_utils.hpp
#pragma once

#include <algorithm>
#include <cmath>
#include <limits>

// Define M_PI if not available (Windows)
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace signal_ngin {
namespace statistics {
namespace numeric {

constexpr double NEG_INF = -std::numeric_limits<double>::infinity();

/**
 * @brief Numerically stable log(sum(exp(values[0..n-1])))
 */
inline double log_sum_exp(const double* values, int n) {
    if (n == 0) return NEG_INF;
    double mx = *std::max_element(values, values + n);
    if (mx == NEG_INF) return mx;
    double sum = 0.0;
    for (int i = 0; i < n; ++i) {
        sum += std::exp(values[i] - mx);
    }
    return mx + std::log(sum);
}

inline double safe_log(double p) {
    return p > 0.0 ? std::log(p) : NEG_INF;
}

/**
 * @brief Log density of a univariate Gaussian
 */
inline double log_normal_pdf(double x, double mean, double std) {
    double z = (x - mean) / std;
    return -0.5 * (std::log(2.0 * M_PI) + 2.0 * std::log(std) + z * z);
}

}  // namespace numeric
}  // namespace statistics
}  // namespace signal_ngin
