// src/core/bar_validation.cpp

#include "signal_ngin/core/bar_validation.hpp"
#include <cmath>
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {

namespace {

bool is_finite_bar(const Bar& bar) {
    return std::isfinite(bar.open) && std::isfinite(bar.high) && std::isfinite(bar.low) &&
           std::isfinite(bar.close) && std::isfinite(bar.volume);
}

Result<void> reject(size_t index, const std::string& reason, const std::string& component) {
    std::string message = "Bar " + std::to_string(index) + ": " + reason;
    WARN("Rejected bar window in " << component << ": " << message);
    return make_error<void>(ErrorCode::INVALID_DATA, message, component);
}

}  // namespace

Result<void> validate_bars(const std::vector<Bar>& bars, const std::string& component) {
    for (size_t i = 0; i < bars.size(); ++i) {
        const Bar& bar = bars[i];

        if (!is_finite_bar(bar)) {
            return reject(i, "non-finite OHLCV field", component);
        }
        if (bar.volume < 0.0) {
            return reject(i, "negative volume", component);
        }
        if (bar.high < bar.low) {
            return reject(i, "high below low", component);
        }
        if (i > 0) {
            if (bar.time == bars[i - 1].time) {
                return reject(i, "duplicate timestamp " + std::to_string(bar.time), component);
            }
            if (bar.time < bars[i - 1].time) {
                return reject(i, "timestamps not ascending", component);
            }
        }
    }
    return Result<void>();
}

}  // namespace signal_ngin
