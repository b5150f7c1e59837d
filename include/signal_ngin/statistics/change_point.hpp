// include/signal_ngin/statistics/change_point.hpp
#pragma once

#include <cstddef>
#include <vector>

namespace signal_ngin {
namespace statistics {

struct CusumOptions {
    double threshold{5.0};
    double drift{0.0};
    bool two_sided{false};  // also track downward shifts
};

enum class ShiftDirection {
    UP,
    DOWN
};

struct ChangePoint {
    size_t index{0};
    double value{0.0};
    ShiftDirection direction{ShiftDirection::UP};
};

/**
 * @brief CUSUM change-point detection around the series mean
 *
 * s = max(0, s + x - mean - drift); a change point is emitted and s reset
 * to 0 whenever s exceeds threshold. The two-sided variant runs the mirror
 * accumulator for downward shifts as well.
 */
std::vector<ChangePoint> detect_change_points_cusum(const std::vector<double>& series,
                                                    const CusumOptions& options = CusumOptions());

struct StructuralBreakOptions {
    size_t min_segment{20};
    size_t max_breaks{5};
    double critical_value{10.0};
};

struct StructuralBreak {
    size_t index{0};  // first index of the second segment
    double f_statistic{0.0};
    double mean_before{0.0};
    double mean_after{0.0};
};

/**
 * @brief Single-split mean-shift F test at every admissible index
 *
 * F = (SSR_full - SSR_split) / (SSR_split / (n - 2)). Splits above the
 * critical value are returned strongest first, at most max_breaks of them.
 * Series shorter than two minimum segments yield no breaks.
 */
std::vector<StructuralBreak> detect_structural_breaks(
    const std::vector<double>& series,
    const StructuralBreakOptions& options = StructuralBreakOptions());

}  // namespace statistics
}  // namespace signal_ngin
