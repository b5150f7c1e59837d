// src/regime/regime_types.cpp

#include "signal_ngin/regime/regime_types.hpp"

namespace signal_ngin {
namespace regime {

std::string to_string(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::TRENDING_BULL:
            return "trending_bull";
        case MarketRegime::TRENDING_BEAR:
            return "trending_bear";
        case MarketRegime::HIGH_VOLATILITY:
            return "high_volatility";
        case MarketRegime::LOW_LIQUIDITY:
            return "low_liquidity";
        case MarketRegime::RANGING:
            return "ranging";
        case MarketRegime::WEAK_TREND:
            return "weak_trend";
        case MarketRegime::UNKNOWN:
        default:
            return "unknown";
    }
}

std::string to_string(VolatilityRegime regime) {
    switch (regime) {
        case VolatilityRegime::LOW_VOLATILITY:
            return "low_volatility";
        case VolatilityRegime::MODERATE:
            return "moderate";
        case VolatilityRegime::HIGH_VOLATILITY:
            return "high_volatility";
        case VolatilityRegime::UNKNOWN:
        default:
            return "unknown";
    }
}

std::string to_string(PersistenceRegime regime) {
    switch (regime) {
        case PersistenceRegime::TRENDING:
            return "trending";
        case PersistenceRegime::MEAN_REVERTING:
            return "mean_reverting";
        case PersistenceRegime::RANDOM:
        default:
            return "random";
    }
}

std::string to_string(AdvancedRegime regime) {
    switch (regime) {
        case AdvancedRegime::TRENDING:
            return "trending";
        case AdvancedRegime::MEAN_REVERTING:
            return "mean_reverting";
        case AdvancedRegime::HIGH_VOLATILITY:
            return "high_volatility";
        case AdvancedRegime::NEUTRAL:
            return "neutral";
        case AdvancedRegime::UNKNOWN:
        default:
            return "unknown";
    }
}

std::string regime_label(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::TRENDING_BULL:
            return "Trending Bull";
        case MarketRegime::TRENDING_BEAR:
            return "Trending Bear";
        case MarketRegime::HIGH_VOLATILITY:
            return "High Volatility";
        case MarketRegime::LOW_LIQUIDITY:
            return "Low Liquidity";
        case MarketRegime::RANGING:
            return "Choppy Range";
        case MarketRegime::WEAK_TREND:
            return "Weak Trend";
        case MarketRegime::UNKNOWN:
        default:
            return "Unknown";
    }
}

}  // namespace regime
}  // namespace signal_ngin
