// src/statistics/change_point.cpp

#include "signal_ngin/statistics/change_point.hpp"
#include <algorithm>
#include "signal_ngin/statistics/series_math.hpp"

namespace signal_ngin {
namespace statistics {

namespace {

// Residual variance floor for perfectly fitting splits
constexpr double MIN_RESIDUAL_VARIANCE = 1e-12;

double segment_ssr(double sum, double sum_sq, size_t count) {
    return std::max(0.0, sum_sq - sum * sum / count);
}

}  // namespace

std::vector<ChangePoint> detect_change_points_cusum(const std::vector<double>& series,
                                                    const CusumOptions& options) {
    std::vector<ChangePoint> points;
    if (series.empty())
        return points;

    const double avg = mean(series);
    double upper = 0.0;
    double lower = 0.0;

    for (size_t i = 0; i < series.size(); ++i) {
        upper = std::max(0.0, upper + (series[i] - avg - options.drift));
        if (upper > options.threshold) {
            points.push_back({i, series[i], ShiftDirection::UP});
            upper = 0.0;
        }

        if (!options.two_sided)
            continue;
        lower = std::max(0.0, lower + (avg - series[i] - options.drift));
        if (lower > options.threshold) {
            points.push_back({i, series[i], ShiftDirection::DOWN});
            lower = 0.0;
        }
    }
    return points;
}

std::vector<StructuralBreak> detect_structural_breaks(const std::vector<double>& series,
                                                      const StructuralBreakOptions& options) {
    std::vector<StructuralBreak> breaks;
    const size_t n = series.size();
    const size_t min_seg = std::max<size_t>(options.min_segment, 1);
    if (n < 2 * min_seg || n < 3)
        return breaks;

    std::vector<double> prefix(n + 1, 0.0);
    std::vector<double> prefix_sq(n + 1, 0.0);
    for (size_t i = 0; i < n; ++i) {
        prefix[i + 1] = prefix[i] + series[i];
        prefix_sq[i + 1] = prefix_sq[i] + series[i] * series[i];
    }

    const double ssr_full = variance(series) * n;

    for (size_t k = min_seg; k + min_seg < n; ++k) {
        double sum1 = prefix[k];
        double sum2 = prefix[n] - prefix[k];
        double ssr = segment_ssr(sum1, prefix_sq[k], k) +
                     segment_ssr(sum2, prefix_sq[n] - prefix_sq[k], n - k);

        double residual_variance = std::max(ssr / (n - 2), MIN_RESIDUAL_VARIANCE);
        double f_stat = (ssr_full - ssr) / residual_variance;

        if (f_stat > options.critical_value) {
            breaks.push_back({k, f_stat, sum1 / k, sum2 / (n - k)});
        }
    }

    std::stable_sort(breaks.begin(), breaks.end(),
                     [](const StructuralBreak& a, const StructuralBreak& b) {
                         return a.f_statistic > b.f_statistic;
                     });
    if (breaks.size() > options.max_breaks) {
        breaks.resize(options.max_breaks);
    }
    return breaks;
}

}  // namespace statistics
}  // namespace signal_ngin
