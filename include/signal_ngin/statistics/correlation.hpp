// include/signal_ngin/statistics/correlation.hpp
#pragma once

#include <string>
#include <vector>

namespace signal_ngin {
namespace statistics {

/**
 * @brief Pearson correlation over each trailing window
 * @return One value per complete window, x.size() - window + 1 entries
 */
std::vector<double> rolling_correlation(const std::vector<double>& x,
                                        const std::vector<double>& y, size_t window = 20);

enum class CorrelationRegime {
    STABLE,
    HIGH_CORRELATION,
    LOW_CORRELATION
};

std::string to_string(CorrelationRegime regime);

struct DccResult {
    double current_correlation{0.0};
    double average_correlation{0.0};
    CorrelationRegime regime{CorrelationRegime::STABLE};
    std::vector<double> series;
};

/**
 * @brief Simplified dynamic conditional correlation
 * The current rolling correlation is high (low) when it sits more than one
 * std above (below) the average of the rolling path.
 */
DccResult calculate_dcc(const std::vector<double>& returns1, const std::vector<double>& returns2,
                        size_t window = 20);

/**
 * @brief Market beta, cov(asset, market) / var(market)
 * @return 1 when the market series has no variance
 */
double calculate_beta(const std::vector<double>& asset_returns,
                      const std::vector<double>& market_returns);

}  // namespace statistics
}  // namespace signal_ngin
