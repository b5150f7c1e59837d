// apps/signal_report.cpp
//
// Usage: signal_report <bars.csv> [timeframe] [secondary.csv] [--config <file.json>]

#include <iostream>
#include <string>
#include <vector>
#include "signal_ngin/backtest/score_backtest.hpp"
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/time_utils.hpp"
#include "signal_ngin/data/csv_bar_loader.hpp"
#include "signal_ngin/regime/advanced_detector.hpp"
#include "signal_ngin/regime/rule_classifier.hpp"
#include "signal_ngin/serialization/json_export.hpp"
#include "signal_ngin/signals/composite_score.hpp"
#include "signal_ngin/signals/timeframe_consensus.hpp"

using namespace signal_ngin;

namespace {

struct ReportConfig : public ConfigBase {
    LoggerConfig logging;
    signals::SignalScorerConfig scorer;
    bool consensus_enabled{true};
    regime::RuleClassifierConfig rule_classifier;
    regime::AdvancedDetectorConfig advanced;
    backtest::ScoreBacktestConfig backtest;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["logging"] = logging.to_json();
        j["scorer"] = scorer.to_json();
        j["consensus_enabled"] = consensus_enabled;
        j["rule_classifier"] = rule_classifier.to_json();
        j["advanced"] = advanced.to_json();
        j["backtest"] = backtest.to_json();
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("logging"))
            logging.from_json(j.at("logging"));
        if (j.contains("scorer"))
            scorer.from_json(j.at("scorer"));
        if (j.contains("consensus_enabled"))
            consensus_enabled = j.at("consensus_enabled").get<bool>();
        if (j.contains("rule_classifier"))
            rule_classifier.from_json(j.at("rule_classifier"));
        if (j.contains("advanced"))
            advanced.from_json(j.at("advanced"));
        if (j.contains("backtest"))
            backtest.from_json(j.at("backtest"));
    }
};

void print_usage() {
    std::cerr << "Usage: signal_report <bars.csv> [timeframe] [secondary.csv] "
                 "[--config <file.json>]"
              << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        std::vector<std::string> positional;
        std::string config_path;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else {
                positional.push_back(arg);
            }
        }
        if (positional.empty()) {
            print_usage();
            return 1;
        }

        ReportConfig config;
        // stdout carries the report, so logs default to a file
        config.logging.destination = LogDestination::FILE;
        config.logging.filename_prefix = "signal_report";
        if (!config_path.empty()) {
            auto loaded = config.load_from_file(config_path);
            if (loaded.is_error()) {
                std::cerr << "Error: " << loaded.error()->to_string() << std::endl;
                return 1;
            }
        }

        Logger::reset_for_tests();
        auto& logger = Logger::instance();
        logger.initialize(config.logging);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("SignalReport");

        auto timeframe = signals::parse_timeframe(positional.size() > 1 ? positional[1] : "5Min");
        if (timeframe.is_error()) {
            std::cerr << "Error: " << timeframe.error()->to_string() << std::endl;
            return 1;
        }

        auto bars = data::load_bars_csv(positional[0]);
        if (bars.is_error()) {
            std::cerr << "Error: " << bars.error()->to_string() << std::endl;
            return 1;
        }
        const auto& series = bars.value();
        INFO("Building report for " << series.size() << " bars on "
                                    << signals::to_string(timeframe.value()));

        signals::SignalScorer scorer(config.scorer);
        auto state = scorer.score(series);
        if (state.is_error()) {
            std::cerr << "Error: " << state.error()->to_string() << std::endl;
            return 1;
        }

        nlohmann::json report;
        report["bars"] = series.size();
        report["timeframe"] = signals::to_string(timeframe.value());
        report["as_of"] = series.empty() ? nlohmann::json(nullptr)
                                         : nlohmann::json(core::format_epoch_utc(series.back().time));

        signals::SignalState final_state = state.value();
        if (positional.size() > 2) {
            auto secondary_bars = data::load_bars_csv(positional[2]);
            if (secondary_bars.is_error()) {
                std::cerr << "Error: " << secondary_bars.error()->to_string() << std::endl;
                return 1;
            }
            auto secondary_state = scorer.score(secondary_bars.value());
            if (secondary_state.is_error()) {
                std::cerr << "Error: " << secondary_state.error()->to_string() << std::endl;
                return 1;
            }
            auto consensus = signals::evaluate_consensus(timeframe.value(), final_state,
                                                         secondary_state.value());
            final_state = signals::apply_consensus_bonus(final_state, consensus,
                                                         config.consensus_enabled,
                                                         config.scorer.weights.consensus_bonus);
            report["consensus"] = serialization::to_json(consensus);
        }

        auto overlays = indicators::compute_overlays(series, config.scorer.overlays);
        if (overlays.is_error()) {
            std::cerr << "Error: " << overlays.error()->to_string() << std::endl;
            return 1;
        }
        report["saty"] = serialization::to_json(overlays.value().saty);
        report["signal"] = serialization::to_json(final_state);
        report["signal"]["live"] = final_state.score >= config.scorer.threshold;

        auto rule_regime = regime::classify_market_regime(series, config.rule_classifier);
        if (rule_regime.is_error()) {
            std::cerr << "Error: " << rule_regime.error()->to_string() << std::endl;
            return 1;
        }
        report["market_regime"] = serialization::to_json(rule_regime.value());

        auto advanced = regime::detect_regime_advanced(series, config.advanced);
        if (advanced.is_error()) {
            std::cerr << "Error: " << advanced.error()->to_string() << std::endl;
            return 1;
        }
        report["advanced_regime"] = serialization::to_json(advanced.value());

        auto persistence = regime::classify_trend_persistence(series);
        if (persistence.is_ok()) {
            report["persistence"] = serialization::to_json(persistence.value());
        } else {
            WARN("Trend persistence unavailable: " << persistence.error()->what());
        }

        auto replay = backtest::run_score_backtest(series, config.backtest);
        if (replay.is_ok()) {
            report["backtest"] = serialization::to_json(replay.value());
        } else {
            WARN("Score backtest unavailable: " << replay.error()->what());
        }

        std::cout << report.dump(2) << std::endl;
        INFO("Report completed");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
