// src/indicators/volatility.cpp

#include "signal_ngin/indicators/volatility.hpp"
#include <algorithm>
#include <cmath>

namespace signal_ngin {
namespace indicators {

IndicatorSeries true_range(const std::vector<Bar>& bars) {
    IndicatorSeries tr(bars.size(), UNDEFINED_VALUE);
    for (size_t i = 0; i < bars.size(); ++i) {
        double range = bars[i].high - bars[i].low;
        if (i == 0) {
            tr[i] = range;
            continue;
        }
        double prev_close = bars[i - 1].close;
        tr[i] = std::max({range, std::abs(bars[i].high - prev_close),
                          std::abs(bars[i].low - prev_close)});
    }
    return tr;
}

IndicatorSeries atr(const std::vector<Bar>& bars, int period) {
    IndicatorSeries out(bars.size(), UNDEFINED_VALUE);
    if (period <= 0 || bars.size() < static_cast<size_t>(period))
        return out;

    IndicatorSeries tr = true_range(bars);
    double seed = 0.0;
    for (int i = 0; i < period; ++i) {
        seed += tr[i];
    }
    double prev = seed / period;
    out[period - 1] = prev;

    for (size_t i = period; i < bars.size(); ++i) {
        prev = (prev * (period - 1) + tr[i]) / period;
        out[i] = prev;
    }
    return out;
}

}  // namespace indicators
}  // namespace signal_ngin
