// include/signal_ngin/serialization/json_export.hpp
#pragma once

#include <nlohmann/json.hpp>
#include "signal_ngin/backtest/score_backtest.hpp"
#include "signal_ngin/indicators/overlays.hpp"
#include "signal_ngin/indicators/squeeze.hpp"
#include "signal_ngin/regime/advanced_detector.hpp"
#include "signal_ngin/regime/regime_monitor.hpp"
#include "signal_ngin/regime/rule_classifier.hpp"
#include "signal_ngin/signals/composite_score.hpp"
#include "signal_ngin/signals/timeframe_consensus.hpp"

namespace signal_ngin {
namespace serialization {

// Enum members are written with their to_string names, undefined values as null.

nlohmann::json to_json(const indicators::SqueezeState& state);
nlohmann::json to_json(const indicators::SatyLevels& levels);
nlohmann::json to_json(const signals::ScoreComponents& components);
nlohmann::json to_json(const signals::SignalState& state);
nlohmann::json to_json(const signals::ConsensusResult& consensus);
nlohmann::json to_json(const regime::RegimeClassification& classification);
nlohmann::json to_json(const regime::VolatilityRegimeResult& result);
nlohmann::json to_json(const regime::HMMRegimeResult& result);
nlohmann::json to_json(const regime::PersistenceResult& result);
nlohmann::json to_json(const regime::AdvancedRegimeResult& result);
nlohmann::json to_json(const regime::RegimeUpdate& update);
nlohmann::json to_json(const regime::TransitionRisk& risk);
nlohmann::json to_json(const backtest::BacktestReport& report);

}  // namespace serialization
}  // namespace signal_ngin
