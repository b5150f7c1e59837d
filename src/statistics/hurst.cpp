// src/statistics/hurst.cpp

#include "signal_ngin/statistics/hurst.hpp"
#include <algorithm>
#include <cmath>
#include "signal_ngin/statistics/series_math.hpp"

namespace signal_ngin {
namespace statistics {

namespace {

constexpr size_t HURST_WINDOWS[] = {20, 40, 60, 100, 150};

// R/S of one chunk, or a negative value when the chunk is flat
double rescaled_range(std::vector<double>::const_iterator begin,
                      std::vector<double>::const_iterator end) {
    std::vector<double> chunk(begin, end);
    double avg = mean(chunk);
    double sd = std_dev(chunk);
    if (!(sd > 0.0))
        return -1.0;

    double cumulative = 0.0;
    double hi = 0.0;
    double lo = 0.0;
    for (double v : chunk) {
        cumulative += v - avg;
        hi = std::max(hi, cumulative);
        lo = std::min(lo, cumulative);
    }
    return (hi - lo) / sd;
}

}  // namespace

double calculate_hurst_exponent(const std::vector<double>& series, size_t min_points) {
    const size_t n = series.size();
    if (n < min_points)
        return 0.5;

    std::vector<double> log_sizes;
    std::vector<double> log_rs;

    for (size_t window : HURST_WINDOWS) {
        if (window > n)
            break;

        std::vector<double> rs_values;
        for (size_t start = 0; start + window <= n; start += window) {
            double rs = rescaled_range(series.begin() + start, series.begin() + start + window);
            if (rs > 0.0)
                rs_values.push_back(rs);
        }
        if (rs_values.empty())
            continue;

        log_sizes.push_back(std::log(static_cast<double>(window)));
        log_rs.push_back(std::log(mean(rs_values)));
    }

    if (log_sizes.size() < 2)
        return 0.5;

    double mean_x = mean(log_sizes);
    double mean_y = mean(log_rs);
    double numerator = 0.0;
    double denominator = 0.0;
    for (size_t i = 0; i < log_sizes.size(); ++i) {
        numerator += (log_sizes[i] - mean_x) * (log_rs[i] - mean_y);
        denominator += (log_sizes[i] - mean_x) * (log_sizes[i] - mean_x);
    }

    double hurst = denominator > 0.0 ? numerator / denominator : 0.5;
    if (!std::isfinite(hurst))
        return 0.5;
    return std::clamp(hurst, 0.0, 1.0);
}

}  // namespace statistics
}  // namespace signal_ngin
