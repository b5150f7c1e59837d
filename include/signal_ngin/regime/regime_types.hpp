// include/signal_ngin/regime/regime_types.hpp
#pragma once

#include <cstddef>
#include <string>

namespace signal_ngin {
namespace regime {

/**
 * @brief Regimes produced by the rule-based classifier
 */
enum class MarketRegime {
    TRENDING_BULL,
    TRENDING_BEAR,
    HIGH_VOLATILITY,
    LOW_LIQUIDITY,
    RANGING,
    WEAK_TREND,
    UNKNOWN
};

/**
 * @brief Volatility state from HMM or GARCH analysis
 */
enum class VolatilityRegime {
    LOW_VOLATILITY,
    MODERATE,
    HIGH_VOLATILITY,
    UNKNOWN
};

/**
 * @brief Hurst-based trend persistence
 */
enum class PersistenceRegime {
    TRENDING,
    MEAN_REVERTING,
    RANDOM
};

/**
 * @brief Regimes produced by the combined statistical detector
 */
enum class AdvancedRegime {
    TRENDING,
    MEAN_REVERTING,
    HIGH_VOLATILITY,
    NEUTRAL,
    UNKNOWN
};

constexpr size_t ADVANCED_REGIME_COUNT = 5;

// snake_case identifiers, e.g. "trending_bull"
std::string to_string(MarketRegime regime);
std::string to_string(VolatilityRegime regime);
std::string to_string(PersistenceRegime regime);
std::string to_string(AdvancedRegime regime);

/**
 * @brief Display label, e.g. "Trending Bull" or "Choppy Range"
 */
std::string regime_label(MarketRegime regime);

}  // namespace regime
}  // namespace signal_ngin
