// src/statistics/garch.cpp

#include "signal_ngin/statistics/garch.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/statistics/numeric_utils.hpp"
#include "signal_ngin/statistics/series_math.hpp"

namespace signal_ngin {
namespace statistics {

namespace {

// Keeps the recursion defined for constant return series
constexpr double MIN_INITIAL_VARIANCE = 1e-12;

std::vector<double> read_grid(const nlohmann::json& j, const std::string& key,
                              const std::vector<double>& fallback) {
    if (!j.contains(key))
        return fallback;
    return j.at(key).get<std::vector<double>>();
}

}  // namespace

// ============================================================================
// GARCHConfig
// ============================================================================

nlohmann::json GARCHConfig::to_json() const {
    nlohmann::json j;
    j["omega_grid"] = omega_grid;
    j["alpha_grid"] = alpha_grid;
    j["beta_grid"] = beta_grid;
    j["min_observations"] = min_observations;
    j["high_percentile"] = high_percentile;
    j["low_percentile"] = low_percentile;
    j["forecast_steps"] = forecast_steps;
    return j;
}

void GARCHConfig::from_json(const nlohmann::json& j) {
    omega_grid = read_grid(j, "omega_grid", omega_grid);
    alpha_grid = read_grid(j, "alpha_grid", alpha_grid);
    beta_grid = read_grid(j, "beta_grid", beta_grid);
    if (j.contains("min_observations"))
        min_observations = j.at("min_observations").get<int>();
    if (j.contains("high_percentile"))
        high_percentile = j.at("high_percentile").get<double>();
    if (j.contains("low_percentile"))
        low_percentile = j.at("low_percentile").get<double>();
    if (j.contains("forecast_steps"))
        forecast_steps = j.at("forecast_steps").get<int>();
}

// ============================================================================
// Estimation
// ============================================================================

std::vector<double> garch_variances(const std::vector<double>& returns, double omega, double alpha,
                                    double beta) {
    std::vector<double> var(returns.size());
    if (returns.empty())
        return var;

    var[0] = std::max(variance(returns), MIN_INITIAL_VARIANCE);
    for (size_t t = 1; t < returns.size(); ++t) {
        var[t] = omega + alpha * returns[t - 1] * returns[t - 1] + beta * var[t - 1];
    }
    return var;
}

double garch_log_likelihood(const std::vector<double>& returns,
                            const std::vector<double>& variances) {
    double ll = 0.0;
    for (size_t t = 0; t < returns.size() && t < variances.size(); ++t) {
        if (variances[t] <= 0.0)
            return -std::numeric_limits<double>::infinity();
        ll += -0.5 * (std::log(2.0 * M_PI) + std::log(variances[t]) +
                      returns[t] * returns[t] / variances[t]);
    }
    return ll;
}

Result<GARCHParameters> fit_garch(const std::vector<double>& returns, const GARCHConfig& config) {
    if (returns.size() < static_cast<size_t>(std::max(config.min_observations, 2))) {
        return make_error<GARCHParameters>(
            ErrorCode::INSUFFICIENT_DATA,
            "Insufficient data for GARCH model (" + std::to_string(returns.size()) +
                " returns, minimum " + std::to_string(config.min_observations) + ")",
            "GARCH");
    }

    GARCHParameters best;
    best.log_likelihood = -std::numeric_limits<double>::infinity();
    bool found = false;

    for (double omega : config.omega_grid) {
        for (double alpha : config.alpha_grid) {
            for (double beta : config.beta_grid) {
                // Stationarity: alpha + beta < 1
                if (alpha + beta >= 1.0 || omega <= 0.0 || alpha < 0.0 || beta < 0.0)
                    continue;

                double ll =
                    garch_log_likelihood(returns, garch_variances(returns, omega, alpha, beta));
                if (!found || ll > best.log_likelihood) {
                    best = GARCHParameters{omega, alpha, beta, ll};
                    found = true;
                }
            }
        }
    }

    if (!found) {
        return make_error<GARCHParameters>(ErrorCode::MODEL_ERROR,
                                           "GARCH grid has no stationary combination", "GARCH");
    }
    return Result<GARCHParameters>(std::move(best));
}

// ============================================================================
// GarchModel
// ============================================================================

GarchModel::GarchModel(GARCHConfig config) : config_(std::move(config)) {}

Result<void> GarchModel::fit(const std::vector<double>& returns) {
    auto fitted = fit_garch(returns, config_);
    if (fitted.is_error()) {
        return make_error<void>(fitted.error()->code(), fitted.error()->what(), "GARCH");
    }

    params_ = fitted.value();
    returns_ = returns;
    variances_ = garch_variances(returns_, params_.omega, params_.alpha, params_.beta);
    fitted_ = true;

    DEBUG("GARCH fit: omega=" << params_.omega << " alpha=" << params_.alpha
                              << " beta=" << params_.beta << " ll=" << params_.log_likelihood);
    return Result<void>();
}

Result<std::vector<double>> GarchModel::forecast(int steps) const {
    if (!fitted_) {
        return make_error<std::vector<double>>(ErrorCode::NOT_INITIALIZED,
                                               "GARCH model has not been fitted", "GARCH");
    }

    std::vector<double> forecasts;
    forecasts.reserve(std::max(steps, 0));
    double last_return = returns_.back();
    double h = params_.omega + params_.alpha * last_return * last_return +
               params_.beta * variances_.back();

    for (int i = 0; i < steps; ++i) {
        forecasts.push_back(h);
        h = params_.omega + params_.persistence() * h;
    }
    return Result<std::vector<double>>(std::move(forecasts));
}

Result<double> GarchModel::current_volatility() const {
    if (!fitted_) {
        return make_error<double>(ErrorCode::NOT_INITIALIZED, "GARCH model has not been fitted",
                                  "GARCH");
    }
    return Result<double>(std::sqrt(variances_.back()));
}

Result<GarchRegime> GarchModel::detect_regime(const std::vector<double>& returns) {
    auto fitted = fit(returns);
    if (fitted.is_error()) {
        return make_error<GarchRegime>(fitted.error()->code(), fitted.error()->what(), "GARCH");
    }

    GarchRegime result;
    result.params = params_;
    result.current_volatility = std::sqrt(variances_.back());

    size_t below = 0;
    for (double v : variances_) {
        if (std::sqrt(v) < result.current_volatility)
            ++below;
    }
    double fraction = static_cast<double>(below) / variances_.size();
    result.percentile = fraction * 100.0;

    if (fraction > config_.high_percentile) {
        result.regime = regime::VolatilityRegime::HIGH_VOLATILITY;
        result.confidence = std::round(fraction * 100.0);
    } else if (fraction < config_.low_percentile) {
        result.regime = regime::VolatilityRegime::LOW_VOLATILITY;
        result.confidence = std::round((1.0 - fraction) * 100.0);
    } else {
        result.regime = regime::VolatilityRegime::MODERATE;
        result.confidence = 50.0;
    }

    auto projected = forecast(config_.forecast_steps);
    if (projected.is_ok()) {
        result.forecast = projected.value();
    }
    return Result<GarchRegime>(std::move(result));
}

}  // namespace statistics
}  // namespace signal_ngin
