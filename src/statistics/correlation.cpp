// src/statistics/correlation.cpp

#include "signal_ngin/statistics/correlation.hpp"
#include <algorithm>
#include "signal_ngin/statistics/series_math.hpp"

namespace signal_ngin {
namespace statistics {

std::string to_string(CorrelationRegime regime) {
    switch (regime) {
        case CorrelationRegime::HIGH_CORRELATION:
            return "high_correlation";
        case CorrelationRegime::LOW_CORRELATION:
            return "low_correlation";
        case CorrelationRegime::STABLE:
        default:
            return "stable";
    }
}

std::vector<double> rolling_correlation(const std::vector<double>& x,
                                        const std::vector<double>& y, size_t window) {
    std::vector<double> out;
    const size_t n = std::min(x.size(), y.size());
    if (window == 0 || n < window)
        return out;

    out.reserve(n - window + 1);
    for (size_t end = window; end <= n; ++end) {
        std::vector<double> xw(x.begin() + (end - window), x.begin() + end);
        std::vector<double> yw(y.begin() + (end - window), y.begin() + end);
        out.push_back(correlation(xw, yw));
    }
    return out;
}

DccResult calculate_dcc(const std::vector<double>& returns1, const std::vector<double>& returns2,
                        size_t window) {
    DccResult result;
    result.series = rolling_correlation(returns1, returns2, window);
    if (result.series.empty())
        return result;

    result.current_correlation = result.series.back();
    result.average_correlation = mean(result.series);
    double spread = std_dev(result.series);

    if (result.current_correlation > result.average_correlation + spread) {
        result.regime = CorrelationRegime::HIGH_CORRELATION;
    } else if (result.current_correlation < result.average_correlation - spread) {
        result.regime = CorrelationRegime::LOW_CORRELATION;
    }
    return result;
}

double calculate_beta(const std::vector<double>& asset_returns,
                      const std::vector<double>& market_returns) {
    double market_var = variance(market_returns);
    if (!(market_var > 0.0))
        return 1.0;
    double cov = covariance(asset_returns, market_returns);
    return is_defined(cov) ? cov / market_var : 1.0;
}

}  // namespace statistics
}  // namespace signal_ngin
