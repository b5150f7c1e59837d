// src/statistics/microstructure.cpp

#include "signal_ngin/statistics/microstructure.hpp"
#include <cmath>
#include "signal_ngin/statistics/series_math.hpp"

namespace signal_ngin {
namespace statistics {

double amihud_illiquidity(const std::vector<Bar>& bars) {
    std::vector<double> illiquidity;
    for (const auto& bar : bars) {
        double dollar_volume = bar.close * bar.volume;
        if (dollar_volume > 0.0 && bar.open != 0.0) {
            double bar_return = std::abs((bar.close - bar.open) / bar.open);
            illiquidity.push_back(bar_return / (dollar_volume / 1e6));
        }
    }
    return illiquidity.empty() ? 0.0 : mean(illiquidity);
}

double roll_spread(const std::vector<double>& prices) {
    if (prices.size() < 3)
        return 0.0;

    std::vector<double> changes;
    changes.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        changes.push_back(prices[i] - prices[i - 1]);
    }

    double cov = 0.0;
    for (size_t i = 1; i < changes.size(); ++i) {
        cov += changes[i] * changes[i - 1];
    }
    cov /= static_cast<double>(changes.size() - 1);

    return cov < 0.0 ? 2.0 * std::sqrt(-cov) : 0.0;
}

std::vector<double> order_flow_imbalance(const std::vector<Bar>& bars) {
    std::vector<double> imbalances;
    imbalances.reserve(bars.size());
    for (const auto& bar : bars) {
        if (bar.volume <= 0.0 || bar.close == bar.open) {
            imbalances.push_back(0.0);
        } else {
            imbalances.push_back(bar.close > bar.open ? 1.0 : -1.0);
        }
    }
    return imbalances;
}

}  // namespace statistics
}  // namespace signal_ngin
