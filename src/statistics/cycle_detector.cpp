// src/statistics/cycle_detector.cpp

#include "signal_ngin/statistics/cycle_detector.hpp"
#include <algorithm>
#include <cmath>
#include "signal_ngin/statistics/series_math.hpp"

namespace signal_ngin {
namespace statistics {

DominantCycle detect_dominant_cycle(const std::vector<double>& series, int min_period,
                                    int max_period) {
    DominantCycle cycle;
    cycle.period = min_period;
    cycle.strength = -1.0;

    for (int period = min_period; period <= max_period; ++period) {
        double corr = std::abs(autocorrelation(series, period));
        if (corr > cycle.strength) {
            cycle.strength = corr;
            cycle.period = period;
        }
    }
    cycle.strength = std::max(cycle.strength, 0.0);

    if (cycle.strength > 0.5) {
        cycle.interpretation = "Strong cycle detected";
    } else if (cycle.strength > 0.3) {
        cycle.interpretation = "Moderate cycle";
    } else {
        cycle.interpretation = "Weak or no cycle";
    }
    return cycle;
}

CycleSpectrum detect_cycles_spectral(const std::vector<double>& series, size_t top_n) {
    CycleSpectrum result;
    const size_t n = series.size();
    if (n < 4)
        return result;

    std::vector<double> detrended(n);
    double slope = (series[n - 1] - series[0]) / n;
    for (size_t i = 0; i < n; ++i) {
        detrended[i] = series[i] - (series[0] + slope * i);
    }

    for (size_t period = 2; 2 * period < n; ++period) {
        double power = std::abs(autocorrelation(detrended, static_cast<int>(period)));
        result.spectrum.push_back({static_cast<int>(period), power});
    }

    result.dominant_cycles = result.spectrum;
    std::stable_sort(result.dominant_cycles.begin(), result.dominant_cycles.end(),
                     [](const SpectralPeak& a, const SpectralPeak& b) { return a.power > b.power; });
    if (result.dominant_cycles.size() > top_n) {
        result.dominant_cycles.resize(top_n);
    }
    return result;
}

}  // namespace statistics
}  // namespace signal_ngin
