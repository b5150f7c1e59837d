// include/signal_ngin/core/types.hpp

#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace signal_ngin {

/**
 * @brief Bar timestamp, seconds since the Unix epoch
 */
using EpochSeconds = std::int64_t;

/**
 * @brief Price type with double precision
 * Used for all price-related calculations
 */
using Price = double;

/**
 * @brief Market data bar structure
 * Represents OHLCV data for any timeframe. Bars are owned by the caller
 * and never modified by the engine.
 */
struct Bar {
    EpochSeconds time{0};
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};

    Bar() = default;
    Bar(EpochSeconds t, Price o, Price h, Price l, Price c, double v)
        : time(t), open(o), high(h), low(l), close(c), volume(v) {}
};

/**
 * @brief Indicator output aligned index-for-index with the input bars
 * Entries inside an indicator's warmup hold UNDEFINED_VALUE.
 */
using IndicatorSeries = std::vector<double>;

/**
 * @brief Sentinel for "not yet defined" indicator entries
 */
constexpr double UNDEFINED_VALUE = std::numeric_limits<double>::quiet_NaN();

inline bool is_defined(double value) {
    return !std::isnan(value);
}

/**
 * @brief Directional verdict of a trend indicator
 */
enum class Trend {
    BULLISH,
    BEARISH,
    NEUTRAL
};

/**
 * @brief Trade direction of a trigger or squeeze release
 */
enum class TradeDirection {
    LONG,
    SHORT,
    NONE
};

inline std::string to_string(Trend trend) {
    switch (trend) {
        case Trend::BULLISH:
            return "bullish";
        case Trend::BEARISH:
            return "bearish";
        case Trend::NEUTRAL:
            return "neutral";
        default:
            return "neutral";
    }
}

inline std::string to_string(TradeDirection direction) {
    switch (direction) {
        case TradeDirection::LONG:
            return "long";
        case TradeDirection::SHORT:
            return "short";
        case TradeDirection::NONE:
            return "none";
        default:
            return "none";
    }
}

/**
 * @brief Column helpers over a bar window
 */
inline std::vector<double> closes(const std::vector<Bar>& bars) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& bar : bars) out.push_back(bar.close);
    return out;
}

inline std::vector<double> highs(const std::vector<Bar>& bars) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& bar : bars) out.push_back(bar.high);
    return out;
}

inline std::vector<double> lows(const std::vector<Bar>& bars) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& bar : bars) out.push_back(bar.low);
    return out;
}

inline std::vector<double> volumes(const std::vector<Bar>& bars) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& bar : bars) out.push_back(bar.volume);
    return out;
}

}  // namespace signal_ngin
