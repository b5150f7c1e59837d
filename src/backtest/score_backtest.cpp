// src/backtest/score_backtest.cpp

#include "signal_ngin/backtest/score_backtest.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <numeric>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/statistics/series_math.hpp"

namespace signal_ngin {
namespace backtest {

namespace {

double share_at_or_above(const std::deque<double>& scores, double level) {
    if (scores.empty())
        return 0.0;
    auto hits = std::count_if(scores.begin(), scores.end(),
                              [level](double s) { return s >= level; });
    return static_cast<double>(hits) / static_cast<double>(scores.size()) * 100.0;
}

double average(const std::vector<double>& values) {
    if (values.empty())
        return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

}  // namespace

// ============================================================================
// ScoreBacktestConfig
// ============================================================================

nlohmann::json ScoreBacktestConfig::to_json() const {
    nlohmann::json j;
    j["threshold"] = threshold;
    j["horizon"] = horizon;
    j["start_index"] = start_index ? nlohmann::json(*start_index) : nlohmann::json(nullptr);
    j["curve_thresholds"] = curve_thresholds;
    j["score_window"] = score_window;
    j["recent_scores"] = recent_scores;
    j["scorer"] = scorer.to_json();
    return j;
}

void ScoreBacktestConfig::from_json(const nlohmann::json& j) {
    if (j.contains("threshold"))
        threshold = j.at("threshold").get<double>();
    if (j.contains("horizon"))
        horizon = j.at("horizon").get<size_t>();
    if (j.contains("start_index")) {
        if (j.at("start_index").is_null())
            start_index.reset();
        else
            start_index = j.at("start_index").get<size_t>();
    }
    if (j.contains("curve_thresholds")) {
        curve_thresholds = j.at("curve_thresholds").get<std::vector<double>>();
        std::sort(curve_thresholds.begin(), curve_thresholds.end());
        curve_thresholds.erase(std::unique(curve_thresholds.begin(), curve_thresholds.end()),
                               curve_thresholds.end());
    }
    if (j.contains("score_window"))
        score_window = j.at("score_window").get<size_t>();
    if (j.contains("recent_scores"))
        recent_scores = j.at("recent_scores").get<size_t>();
    if (j.contains("scorer"))
        scorer.from_json(j.at("scorer"));
}

// ============================================================================
// Backtest
// ============================================================================

Result<BacktestReport> run_score_backtest(const std::vector<Bar>& bars,
                                          const ScoreBacktestConfig& config) {
    if (config.horizon == 0) {
        return make_error<BacktestReport>(ErrorCode::INVALID_ARGUMENT,
                                          "Backtest horizon must be at least one bar",
                                          "ScoreBacktest");
    }

    BacktestReport report;
    report.bars = bars.size();
    report.threshold = config.threshold;
    report.horizon = config.horizon;
    for (double th : config.curve_thresholds) {
        report.curve.push_back(ThresholdCurvePoint{th, 0, 0.0, 0.0});
    }
    if (bars.empty())
        return Result<BacktestReport>(std::move(report));

    const size_t start = config.start_index.value_or(std::min<size_t>(80, bars.size() / 5));

    signals::SignalScorer scorer(config.scorer);
    auto history = scorer.score_history(bars, start);
    if (history.is_error()) {
        return make_error<BacktestReport>(history.error()->code(), history.error()->what(),
                                          "ScoreBacktest");
    }

    std::deque<double> window;
    std::vector<std::vector<double>> curve_returns(config.curve_thresholds.size());

    const auto& states = history.value();
    for (size_t k = 0; k < states.size(); ++k) {
        const size_t i = start + k;
        const double score = states[k].score;

        window.push_back(score);
        if (window.size() > config.score_window)
            window.pop_front();

        if (i + config.horizon >= bars.size())
            continue;
        const double entry = bars[i].close;
        if (entry == 0.0)
            continue;
        const double fwd = (bars[i + config.horizon].close - entry) / entry;

        if (score >= config.threshold) {
            report.events.push_back(ScoreEvent{i, bars[i].time, entry, score, fwd});
        }
        for (size_t c = 0; c < config.curve_thresholds.size(); ++c) {
            if (score >= config.curve_thresholds[c])
                curve_returns[c].push_back(fwd);
        }
    }

    std::vector<double> forwards, wins, losses;
    for (const auto& event : report.events) {
        forwards.push_back(event.forward_return);
        if (event.forward_return > 0.0)
            wins.push_back(event.forward_return);
        else
            losses.push_back(event.forward_return);
    }

    if (!report.events.empty()) {
        report.win_rate =
            static_cast<double>(wins.size()) / static_cast<double>(report.events.size()) * 100.0;
        report.avg_forward = average(forwards) * 100.0;
        report.median_forward = statistics::median(forwards) * 100.0;
    }
    const double avg_win = average(wins);
    const double avg_loss = average(losses);
    report.avg_win = avg_win * 100.0;
    report.avg_loss = avg_loss * 100.0;
    if (avg_win > 0.0 && avg_loss < 0.0) {
        report.profit_factor = std::abs(avg_win / avg_loss);
    } else if (!wins.empty() && !losses.empty()) {
        report.profit_factor = 0.0;
    }

    report.score_avg = window.empty()
                           ? 0.0
                           : std::accumulate(window.begin(), window.end(), 0.0) /
                                 static_cast<double>(window.size());
    report.pct_above_40 = share_at_or_above(window, 40.0);
    report.pct_above_60 = share_at_or_above(window, 60.0);
    report.pct_above_70 = share_at_or_above(window, 70.0);

    const size_t recent = std::min(config.recent_scores, window.size());
    report.recent_scores.assign(window.end() - static_cast<std::ptrdiff_t>(recent), window.end());

    for (size_t c = 0; c < curve_returns.size(); ++c) {
        const auto& rets = curve_returns[c];
        auto& point = report.curve[c];
        point.events = rets.size();
        if (rets.empty())
            continue;
        auto positive = std::count_if(rets.begin(), rets.end(), [](double r) { return r > 0.0; });
        point.win_rate = static_cast<double>(positive) / static_cast<double>(rets.size()) * 100.0;
        point.avg_forward = average(rets) * 100.0;
    }

    DEBUG("Score backtest over " << bars.size() << " bars: " << report.events.size()
                                 << " events, win rate " << report.win_rate << "%");
    return Result<BacktestReport>(std::move(report));
}

}  // namespace backtest
}  // namespace signal_ngin
