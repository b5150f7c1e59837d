// include/signal_ngin/statistics/hmm.hpp
#pragma once

#include <Eigen/Dense>
#include <optional>
#include <random>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"

namespace signal_ngin {
namespace statistics {

/**
 * @brief Configuration for HMM
 */
struct HMMConfig : public ConfigBase {
    int num_states{3};
    int max_iterations{30};
    double tolerance{1e-6};     // stop once the log-likelihood gain drops below this
    double min_std{1e-6};       // floor on emission std
    std::optional<unsigned int> seed;  // unset: random_device, fits differ run to run

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Immutable parameter set of a univariate Gaussian HMM
 */
struct HMMParameters {
    int num_states{0};
    Eigen::VectorXd initial;     // initial state distribution
    Eigen::MatrixXd transition;  // row-stochastic, k x k
    Eigen::VectorXd means;       // per-state emission mean
    Eigen::VectorXd stds;        // per-state emission std
    double log_likelihood{0.0};  // of the training data under these parameters
    int iterations{0};           // EM iterations run to produce them
};

/**
 * @brief Starting point for Baum-Welch
 *
 * Uniform initial distribution, random stochastic transition rows and a
 * Gaussian per state estimated from consecutive equal chunks of the
 * observations.
 */
HMMParameters initial_parameters(const std::vector<double>& observations, int num_states,
                                 std::mt19937& rng, double min_std = 1e-6);

/**
 * @brief Train an HMM by expectation-maximisation
 *
 * Pure: the returned parameters are a new value and initial is untouched.
 * Stops after max_iterations or when the log-likelihood improves by less
 * than tolerance, returning the last estimate either way.
 *
 * @return INSUFFICIENT_DATA for fewer than max(10, 2k) observations,
 *         INVALID_ARGUMENT for malformed initial parameters
 */
Result<HMMParameters> baum_welch(const HMMParameters& initial,
                                 const std::vector<double>& observations, int max_iterations,
                                 double tolerance, double min_std = 1e-6);

/**
 * @brief Per-bar state occupancy probabilities (T x k)
 */
Result<Eigen::MatrixXd> posteriors(const HMMParameters& params,
                                   const std::vector<double>& observations);

/**
 * @brief Most likely state path
 */
Result<std::vector<int>> viterbi(const HMMParameters& params,
                                 const std::vector<double>& observations);

/**
 * @brief Hidden Markov Model for regime detection
 *
 * Holds the parameters of its last fit. Not internally synchronized; a
 * shared instance must be guarded by its owner.
 */
class HiddenMarkovModel {
public:
    explicit HiddenMarkovModel(HMMConfig config = HMMConfig());

    /**
     * @brief Fit from a fresh random initialization, replacing the current parameters
     * @param observations Feature series
     * @return Result indicating success or failure; on failure the previous
     *         parameters are kept
     */
    Result<void> fit(const std::vector<double>& observations);

    Result<std::vector<int>> decode(const std::vector<double>& observations) const;
    Result<Eigen::MatrixXd> state_probabilities(const std::vector<double>& observations) const;

    bool is_fitted() const {
        return fitted_;
    }

    const HMMParameters& parameters() const {
        return params_;
    }

    const HMMConfig& config() const {
        return config_;
    }

private:
    HMMConfig config_;
    HMMParameters params_;
    std::mt19937 rng_;
    bool fitted_{false};
};

}  // namespace statistics
}  // namespace signal_ngin
