//===== test_helpers.hpp =====
#pragma once

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <random>
#include <vector>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {
namespace testing {

constexpr EpochSeconds BASE_TIME = 1700000000;

/**
 * @brief Bars around the given closes: high = close + spread, low = close - spread,
 * open = previous close
 */
inline std::vector<Bar> make_bars(const std::vector<double>& closes, double spread = 0.5,
                                  double volume = 1000.0, EpochSeconds step = 60) {
    std::vector<Bar> bars;
    bars.reserve(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
        double open = i == 0 ? closes[i] : closes[i - 1];
        bars.emplace_back(BASE_TIME + static_cast<EpochSeconds>(i) * step, open,
                          closes[i] + spread, closes[i] - spread, closes[i], volume);
    }
    return bars;
}

inline std::vector<Bar> rising_bars(size_t n, double start = 100.0, double step = 1.0) {
    std::vector<double> closes(n);
    for (size_t i = 0; i < n; ++i) closes[i] = start + step * static_cast<double>(i);
    return make_bars(closes);
}

inline std::vector<Bar> falling_bars(size_t n, double start = 200.0, double step = 1.0) {
    return rising_bars(n, start, -step);
}

inline std::vector<Bar> flat_bars(size_t n, double price = 100.0) {
    return make_bars(std::vector<double>(n, price));
}

/**
 * @brief Geometric random walk with a fixed seed
 */
inline std::vector<Bar> random_walk_bars(size_t n, unsigned int seed = 42, double drift = 0.0,
                                         double volatility = 0.01, double start = 100.0) {
    std::mt19937 gen(seed);
    std::normal_distribution<> noise(drift, volatility);
    std::uniform_real_distribution<> volume(800.0, 1200.0);

    std::vector<double> closes(n);
    double price = start;
    for (size_t i = 0; i < n; ++i) {
        closes[i] = price;
        price *= std::exp(noise(gen));
    }

    auto bars = make_bars(closes, 0.0);
    for (auto& bar : bars) {
        double range = bar.close * volatility;
        bar.high = std::max(bar.open, bar.close) + range;
        bar.low = std::min(bar.open, bar.close) - range;
        bar.volume = volume(gen);
    }
    return bars;
}

/**
 * @brief Element-wise identity of two series, with undefined matching undefined
 */
inline ::testing::AssertionResult same_series(const std::vector<double>& a,
                                              const std::vector<double>& b) {
    if (a.size() != b.size())
        return ::testing::AssertionFailure() << "sizes " << a.size() << " vs " << b.size();
    for (size_t i = 0; i < a.size(); ++i) {
        bool both_undefined = std::isnan(a[i]) && std::isnan(b[i]);
        if (!both_undefined && a[i] != b[i])
            return ::testing::AssertionFailure() << "index " << i << ": " << a[i] << " vs " << b[i];
    }
    return ::testing::AssertionSuccess();
}

inline std::vector<double> closes_of(const std::vector<Bar>& bars) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& bar : bars) out.push_back(bar.close);
    return out;
}

/**
 * @brief Base fixture with a quiet console logger
 */
class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        LoggerConfig config;
        config.min_level = LogLevel::FATAL;
        config.destination = LogDestination::CONSOLE;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        Logger::reset_for_tests();
    }
};

}  // namespace testing
}  // namespace signal_ngin
