// include/signal_ngin/statistics/cycle_detector.hpp
#pragma once

#include <string>
#include <vector>

namespace signal_ngin {
namespace statistics {

struct DominantCycle {
    int period{0};
    double strength{0.0};  // |autocorrelation| at period
    std::string interpretation;
};

/**
 * @brief Period in [min_period, max_period] with the largest absolute
 *        autocorrelation; ties keep the shortest period
 */
DominantCycle detect_dominant_cycle(const std::vector<double>& series, int min_period = 5,
                                    int max_period = 50);

struct SpectralPeak {
    int period{0};
    double power{0.0};
};

struct CycleSpectrum {
    std::vector<SpectralPeak> dominant_cycles;  // strongest first
    std::vector<SpectralPeak> spectrum;         // by ascending period
};

/**
 * @brief Autocorrelation spectrum of the linearly detrended series
 *
 * Detrends with the straight line from the first point at slope
 * (last - first) / n, then ranks periods 2 .. n/2 by |autocorrelation|.
 */
CycleSpectrum detect_cycles_spectral(const std::vector<double>& series, size_t top_n = 3);

}  // namespace statistics
}  // namespace signal_ngin
