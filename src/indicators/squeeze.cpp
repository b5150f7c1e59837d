// src/indicators/squeeze.cpp

#include "signal_ngin/indicators/squeeze.hpp"

namespace signal_ngin {
namespace indicators {

namespace {

TradeDirection direction_of(double momentum) {
    if (!is_defined(momentum) || momentum == 0.0)
        return TradeDirection::NONE;
    return momentum > 0.0 ? TradeDirection::LONG : TradeDirection::SHORT;
}

}  // namespace

std::vector<SqueezeState> scan_squeeze(const std::vector<std::optional<bool>>& readings,
                                       const IndicatorSeries& momentum) {
    std::vector<SqueezeState> states;
    states.reserve(readings.size());

    SqueezeState state;
    for (size_t i = 0; i < readings.size(); ++i) {
        bool on_now = readings[i].value_or(false);
        bool was_on = state.on;

        if (on_now) {
            if (!was_on) {
                state = SqueezeState();
            }
            state.on = true;
        } else if (was_on) {
            state.on = false;
            state.fired = true;
            state.direction = direction_of(i < momentum.size() ? momentum[i] : UNDEFINED_VALUE);
            state.fired_bars_ago = 0;
        } else {
            state.fired = false;
            if (state.fired_bars_ago) {
                ++*state.fired_bars_ago;
            }
        }
        states.push_back(state);
    }
    return states;
}

SqueezeState current_squeeze(const std::vector<std::optional<bool>>& readings,
                             const IndicatorSeries& momentum) {
    std::vector<SqueezeState> states = scan_squeeze(readings, momentum);
    return states.empty() ? SqueezeState() : states.back();
}

}  // namespace indicators
}  // namespace signal_ngin
