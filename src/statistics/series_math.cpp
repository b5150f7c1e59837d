// src/statistics/series_math.cpp

#include "signal_ngin/statistics/series_math.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace signal_ngin {
namespace statistics {

namespace {

bool window_defined(const std::vector<double>& values, size_t end, int period) {
    for (size_t j = end + 1 - static_cast<size_t>(period); j <= end; ++j) {
        if (!is_defined(values[j]))
            return false;
    }
    return true;
}

}  // namespace

IndicatorSeries sma(const std::vector<double>& values, int period) {
    IndicatorSeries out(values.size(), UNDEFINED_VALUE);
    if (period <= 0)
        return out;

    const size_t p = static_cast<size_t>(period);
    double sum = 0.0;
    size_t undefined_in_window = 0;

    for (size_t i = 0; i < values.size(); ++i) {
        if (is_defined(values[i])) {
            sum += values[i];
        } else {
            ++undefined_in_window;
        }
        if (i >= p) {
            if (is_defined(values[i - p])) {
                sum -= values[i - p];
            } else {
                --undefined_in_window;
            }
        }
        if (i + 1 >= p && undefined_in_window == 0) {
            out[i] = sum / period;
        }
    }
    return out;
}

IndicatorSeries ema(const std::vector<double>& values, int period) {
    IndicatorSeries out(values.size(), UNDEFINED_VALUE);
    if (period <= 0)
        return out;

    const double k = 2.0 / (period + 1);
    bool seeded = false;
    int run = 0;
    double run_sum = 0.0;
    double prev = 0.0;

    for (size_t i = 0; i < values.size(); ++i) {
        double v = values[i];
        if (!seeded) {
            if (!is_defined(v)) {
                run = 0;
                run_sum = 0.0;
                continue;
            }
            run_sum += v;
            if (++run == period) {
                prev = run_sum / period;
                out[i] = prev;
                seeded = true;
            }
            continue;
        }
        if (!is_defined(v))
            continue;
        prev = v * k + prev * (1.0 - k);
        out[i] = prev;
    }
    return out;
}

double mean(const std::vector<double>& values) {
    if (values.empty())
        return UNDEFINED_VALUE;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double variance(const std::vector<double>& values) {
    if (values.empty())
        return UNDEFINED_VALUE;
    double avg = mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - avg) * (v - avg);
    }
    return sum_sq / values.size();
}

double std_dev(const std::vector<double>& values) {
    return std::sqrt(variance(values));
}

double median(std::vector<double> values) {
    if (values.empty())
        return UNDEFINED_VALUE;
    std::sort(values.begin(), values.end());
    size_t n = values.size();
    if (n % 2 == 0) {
        return (values[n / 2 - 1] + values[n / 2]) / 2.0;
    }
    return values[n / 2];
}

double covariance(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.empty() || x.size() != y.size())
        return UNDEFINED_VALUE;
    double mean_x = mean(x);
    double mean_y = mean(y);
    double sum = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        sum += (x[i] - mean_x) * (y[i] - mean_y);
    }
    return sum / x.size();
}

double correlation(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.empty() || x.size() != y.size())
        return UNDEFINED_VALUE;
    double denom = std_dev(x) * std_dev(y);
    if (denom <= 0.0)
        return 0.0;
    return covariance(x, y) / denom;
}

double autocorrelation(const std::vector<double>& series, int lag) {
    const size_t n = series.size();
    if (lag < 0 || static_cast<size_t>(lag) >= n)
        return 0.0;

    double avg = mean(series);
    double numerator = 0.0;
    double denominator = 0.0;
    for (size_t i = 0; i + lag < n; ++i) {
        numerator += (series[i] - avg) * (series[i + lag] - avg);
    }
    for (double v : series) {
        denominator += (v - avg) * (v - avg);
    }
    if (denominator <= 0.0)
        return 0.0;
    return numerator / denominator;
}

std::vector<double> log_returns(const std::vector<double>& prices) {
    std::vector<double> returns;
    if (prices.size() < 2)
        return returns;
    returns.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        // Non-positive prices have no log return; treat the step as flat
        if (prices[i] > 0.0 && prices[i - 1] > 0.0) {
            returns.push_back(std::log(prices[i] / prices[i - 1]));
        } else {
            returns.push_back(0.0);
        }
    }
    return returns;
}

std::vector<double> simple_returns(const std::vector<double>& prices) {
    std::vector<double> returns;
    if (prices.size() < 2)
        return returns;
    returns.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        returns.push_back(prices[i - 1] != 0.0 ? (prices[i] - prices[i - 1]) / prices[i - 1]
                                               : 0.0);
    }
    return returns;
}

IndicatorSeries rolling_std(const std::vector<double>& values, int period) {
    IndicatorSeries out(values.size(), UNDEFINED_VALUE);
    if (period <= 0)
        return out;
    for (size_t i = static_cast<size_t>(period) - 1; i < values.size(); ++i) {
        if (!window_defined(values, i, period))
            continue;
        std::vector<double> window(values.begin() + (i + 1 - period), values.begin() + i + 1);
        out[i] = std_dev(window);
    }
    return out;
}

IndicatorSeries rolling_max(const std::vector<double>& values, int period) {
    IndicatorSeries out(values.size(), UNDEFINED_VALUE);
    if (period <= 0)
        return out;
    for (size_t i = static_cast<size_t>(period) - 1; i < values.size(); ++i) {
        if (!window_defined(values, i, period))
            continue;
        out[i] = *std::max_element(values.begin() + (i + 1 - period), values.begin() + i + 1);
    }
    return out;
}

IndicatorSeries rolling_min(const std::vector<double>& values, int period) {
    IndicatorSeries out(values.size(), UNDEFINED_VALUE);
    if (period <= 0)
        return out;
    for (size_t i = static_cast<size_t>(period) - 1; i < values.size(); ++i) {
        if (!window_defined(values, i, period))
            continue;
        out[i] = *std::min_element(values.begin() + (i + 1 - period), values.begin() + i + 1);
    }
    return out;
}

double linear_regression_slope(const std::vector<double>& values) {
    const size_t n = values.size();
    if (n < 2)
        return UNDEFINED_VALUE;

    double mean_x = (n - 1) / 2.0;
    double mean_y = 0.0;
    for (double v : values) {
        if (!is_defined(v))
            return UNDEFINED_VALUE;
        mean_y += v;
    }
    mean_y /= n;

    double sxy = 0.0;
    double sxx = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double dx = static_cast<double>(i) - mean_x;
        sxy += dx * (values[i] - mean_y);
        sxx += dx * dx;
    }
    return sxy / sxx;
}

IndicatorSeries rolling_slope(const std::vector<double>& values, int period) {
    IndicatorSeries out(values.size(), UNDEFINED_VALUE);
    if (period < 2)
        return out;
    for (size_t i = static_cast<size_t>(period) - 1; i < values.size(); ++i) {
        std::vector<double> window(values.begin() + (i + 1 - period), values.begin() + i + 1);
        out[i] = linear_regression_slope(window);
    }
    return out;
}

double percentile_rank(const std::vector<double>& reference, double value) {
    if (reference.empty())
        return 50.0;
    size_t below = 0;
    for (double v : reference) {
        if (v < value)
            ++below;
    }
    return 100.0 * static_cast<double>(below) / reference.size();
}

}  // namespace statistics
}  // namespace signal_ngin
