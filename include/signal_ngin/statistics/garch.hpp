// include/signal_ngin/statistics/garch.hpp
#pragma once

#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/regime/regime_types.hpp"

namespace signal_ngin {
namespace statistics {

/**
 * @brief Configuration for GARCH(1,1) grid fitting and regime labelling
 */
struct GARCHConfig : public ConfigBase {
    std::vector<double> omega_grid{1e-5, 1e-4, 1e-3};
    std::vector<double> alpha_grid{0.05, 0.1, 0.15, 0.2};
    std::vector<double> beta_grid{0.7, 0.8, 0.85, 0.9};
    int min_observations{20};
    double high_percentile{0.8};  // above: high_volatility
    double low_percentile{0.2};   // below: low_volatility
    int forecast_steps{5};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Fitted GARCH(1,1) coefficients, alpha + beta < 1
 */
struct GARCHParameters {
    double omega{0.0};
    double alpha{0.0};
    double beta{0.0};
    double log_likelihood{0.0};

    double persistence() const {
        return alpha + beta;
    }
};

/**
 * @brief Volatility regime read off a fitted GARCH path
 */
struct GarchRegime {
    regime::VolatilityRegime regime{regime::VolatilityRegime::UNKNOWN};
    double confidence{0.0};          // 0-100
    double current_volatility{0.0};  // sqrt of the last conditional variance
    double percentile{0.0};          // 0-100, rank of current volatility in the path
    std::vector<double> forecast;    // variances
    GARCHParameters params;
};

/**
 * @brief Conditional variance path h[0] = sample variance,
 *        h[t] = omega + alpha * r[t-1]^2 + beta * h[t-1]
 */
std::vector<double> garch_variances(const std::vector<double>& returns, double omega, double alpha,
                                    double beta);

/**
 * @brief Gaussian log-likelihood of returns under a variance path
 * @return -infinity if any variance is non-positive
 */
double garch_log_likelihood(const std::vector<double>& returns,
                            const std::vector<double>& variances);

/**
 * @brief Grid search for the likelihood-maximising coefficients
 *
 * Combinations with alpha + beta >= 1 are skipped. Returns are used as
 * given, without demeaning.
 *
 * @return INSUFFICIENT_DATA below min_observations, INVALID_ARGUMENT when the
 *         grid has no stationary combination
 */
Result<GARCHParameters> fit_garch(const std::vector<double>& returns,
                                  const GARCHConfig& config = GARCHConfig());

/**
 * @brief GARCH(1,1) volatility model
 */
class GarchModel {
public:
    explicit GarchModel(GARCHConfig config = GARCHConfig());

    /**
     * @brief Fit to a return series, replacing any earlier fit
     */
    Result<void> fit(const std::vector<double>& returns);

    /**
     * @brief Variance forecast for the next steps periods
     * The first step uses the last return and variance, later ones decay
     * towards the long-run level at rate alpha + beta.
     */
    Result<std::vector<double>> forecast(int steps = 1) const;

    Result<double> current_volatility() const;

    /**
     * @brief Fit and label the current volatility
     * @return GarchRegime, or the fit error
     */
    Result<GarchRegime> detect_regime(const std::vector<double>& returns);

    bool is_fitted() const {
        return fitted_;
    }

    const GARCHParameters& parameters() const {
        return params_;
    }

    const std::vector<double>& conditional_variances() const {
        return variances_;
    }

private:
    GARCHConfig config_;
    GARCHParameters params_;
    std::vector<double> returns_;
    std::vector<double> variances_;
    bool fitted_{false};
};

}  // namespace statistics
}  // namespace signal_ngin
