// src/statistics/hmm.cpp

#include "signal_ngin/statistics/hmm.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/statistics/numeric_utils.hpp"
#include "signal_ngin/statistics/series_math.hpp"

namespace signal_ngin {
namespace statistics {

namespace {

// Expected counts from one forward-backward pass
struct Expectations {
    Eigen::MatrixXd gamma;       // T x N state occupancy
    Eigen::MatrixXd xi_sum;      // N x N expected transitions summed over t
    double log_likelihood{0.0};
};

size_t min_observations(int num_states) {
    return static_cast<size_t>(std::max(10, 2 * num_states));
}

Result<void> check_parameters(const HMMParameters& params, const std::string& component) {
    const int N = params.num_states;
    if (N <= 0 || params.initial.size() != N || params.transition.rows() != N ||
        params.transition.cols() != N || params.means.size() != N || params.stds.size() != N) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "HMM parameter dimensions do not match num_states", component);
    }
    if ((params.stds.array() <= 0.0).any()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "HMM emission stds must be positive", component);
    }
    return Result<void>();
}

Eigen::MatrixXd log_emissions(const HMMParameters& params, const std::vector<double>& obs) {
    const int T = static_cast<int>(obs.size());
    const int N = params.num_states;
    Eigen::MatrixXd log_emit(T, N);
    for (int t = 0; t < T; ++t) {
        for (int j = 0; j < N; ++j) {
            log_emit(t, j) = numeric::log_normal_pdf(obs[t], params.means(j), params.stds(j));
        }
    }
    return log_emit;
}

Eigen::MatrixXd log_matrix(const Eigen::MatrixXd& m) {
    Eigen::MatrixXd out(m.rows(), m.cols());
    for (int i = 0; i < m.rows(); ++i) {
        for (int j = 0; j < m.cols(); ++j) {
            out(i, j) = numeric::safe_log(m(i, j));
        }
    }
    return out;
}

Expectations forward_backward(const HMMParameters& params, const std::vector<double>& obs) {
    const int T = static_cast<int>(obs.size());
    const int N = params.num_states;

    Eigen::MatrixXd log_emit = log_emissions(params, obs);
    Eigen::MatrixXd log_A = log_matrix(params.transition);
    Eigen::VectorXd log_pi(N);
    for (int i = 0; i < N; ++i) {
        log_pi(i) = numeric::safe_log(params.initial(i));
    }

    // Log forward pass
    Eigen::MatrixXd log_alpha(T, N);
    for (int i = 0; i < N; ++i) {
        log_alpha(0, i) = log_pi(i) + log_emit(0, i);
    }

    std::vector<double> temp(N);
    for (int t = 1; t < T; ++t) {
        for (int j = 0; j < N; ++j) {
            for (int i = 0; i < N; ++i) {
                temp[i] = log_alpha(t - 1, i) + log_A(i, j);
            }
            log_alpha(t, j) = numeric::log_sum_exp(temp.data(), N) + log_emit(t, j);
        }
    }

    // Log backward pass
    Eigen::MatrixXd log_beta(T, N);
    log_beta.row(T - 1).setZero();
    for (int t = T - 2; t >= 0; --t) {
        for (int i = 0; i < N; ++i) {
            for (int j = 0; j < N; ++j) {
                temp[j] = log_A(i, j) + log_emit(t + 1, j) + log_beta(t + 1, j);
            }
            log_beta(t, i) = numeric::log_sum_exp(temp.data(), N);
        }
    }

    Expectations e;
    e.gamma.resize(T, N);
    for (int t = 0; t < T; ++t) {
        for (int i = 0; i < N; ++i) {
            temp[i] = log_alpha(t, i) + log_beta(t, i);
        }
        double log_norm = numeric::log_sum_exp(temp.data(), N);
        for (int i = 0; i < N; ++i) {
            e.gamma(t, i) = std::exp(log_alpha(t, i) + log_beta(t, i) - log_norm);
        }
    }

    e.xi_sum = Eigen::MatrixXd::Zero(N, N);
    std::vector<double> temp_xi(N * N);
    for (int t = 0; t < T - 1; ++t) {
        for (int i = 0; i < N; ++i) {
            for (int j = 0; j < N; ++j) {
                temp_xi[i * N + j] =
                    log_alpha(t, i) + log_A(i, j) + log_emit(t + 1, j) + log_beta(t + 1, j);
            }
        }
        double log_norm = numeric::log_sum_exp(temp_xi.data(), N * N);
        for (int i = 0; i < N; ++i) {
            for (int j = 0; j < N; ++j) {
                e.xi_sum(i, j) += std::exp(temp_xi[i * N + j] - log_norm);
            }
        }
    }

    for (int i = 0; i < N; ++i) {
        temp[i] = log_alpha(T - 1, i);
    }
    e.log_likelihood = numeric::log_sum_exp(temp.data(), N);
    return e;
}

HMMParameters maximize(const HMMParameters& current, const Expectations& e,
                       const std::vector<double>& obs, double min_std) {
    const int T = static_cast<int>(obs.size());
    const int N = current.num_states;

    HMMParameters next = current;
    next.initial = e.gamma.row(0).transpose();
    double initial_sum = next.initial.sum();
    if (initial_sum > 0.0) {
        next.initial /= initial_sum;
    } else {
        next.initial = Eigen::VectorXd::Constant(N, 1.0 / N);
    }

    for (int i = 0; i < N; ++i) {
        double row_sum = e.xi_sum.row(i).sum();
        if (row_sum > 0.0 && std::isfinite(row_sum)) {
            next.transition.row(i) = e.xi_sum.row(i) / row_sum;
        } else {
            // State never left: no evidence, keep the row stochastic
            next.transition.row(i).setConstant(1.0 / N);
        }
    }

    for (int k = 0; k < N; ++k) {
        double gamma_sum = e.gamma.col(k).sum();
        if (!(gamma_sum > 0.0))
            continue;

        double mean = 0.0;
        for (int t = 0; t < T; ++t) {
            mean += e.gamma(t, k) * obs[t];
        }
        mean /= gamma_sum;

        double var = 0.0;
        for (int t = 0; t < T; ++t) {
            double diff = obs[t] - mean;
            var += e.gamma(t, k) * diff * diff;
        }
        var /= gamma_sum;

        next.means(k) = mean;
        next.stds(k) = std::max(std::sqrt(var), min_std);
    }
    return next;
}

}  // namespace

// ============================================================================
// HMMConfig
// ============================================================================

nlohmann::json HMMConfig::to_json() const {
    nlohmann::json j;
    j["num_states"] = num_states;
    j["max_iterations"] = max_iterations;
    j["tolerance"] = tolerance;
    j["min_std"] = min_std;
    if (seed) {
        j["seed"] = *seed;
    } else {
        j["seed"] = nullptr;
    }
    return j;
}

void HMMConfig::from_json(const nlohmann::json& j) {
    if (j.contains("num_states"))
        num_states = j.at("num_states").get<int>();
    if (j.contains("max_iterations"))
        max_iterations = j.at("max_iterations").get<int>();
    if (j.contains("tolerance"))
        tolerance = j.at("tolerance").get<double>();
    if (j.contains("min_std"))
        min_std = j.at("min_std").get<double>();
    if (j.contains("seed")) {
        if (j.at("seed").is_null()) {
            seed.reset();
        } else {
            seed = j.at("seed").get<unsigned int>();
        }
    }
}

// ============================================================================
// Training and Decoding
// ============================================================================

HMMParameters initial_parameters(const std::vector<double>& observations, int num_states,
                                 std::mt19937& rng, double min_std) {
    const int N = std::max(num_states, 1);
    HMMParameters params;
    params.num_states = N;
    params.initial = Eigen::VectorXd::Constant(N, 1.0 / N);

    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    params.transition.resize(N, N);
    for (int i = 0; i < N; ++i) {
        for (int j = 0; j < N; ++j) {
            // Bounded away from zero so every transition stays reachable
            params.transition(i, j) = 0.01 + uniform(rng);
        }
        params.transition.row(i) /= params.transition.row(i).sum();
    }

    params.means = Eigen::VectorXd::Zero(N);
    params.stds = Eigen::VectorXd::Constant(N, 1.0);
    const size_t chunk = observations.size() / N;
    for (int k = 0; k < N && chunk > 0; ++k) {
        std::vector<double> slice(observations.begin() + k * chunk,
                                  observations.begin() + (k + 1) * chunk);
        params.means(k) = mean(slice);
        params.stds(k) = std::max(std_dev(slice), min_std);
    }
    return params;
}

Result<HMMParameters> baum_welch(const HMMParameters& initial,
                                 const std::vector<double>& observations, int max_iterations,
                                 double tolerance, double min_std) {
    auto valid = check_parameters(initial, "HMM");
    if (valid.is_error()) {
        return make_error<HMMParameters>(valid.error()->code(), valid.error()->what(), "HMM");
    }
    if (observations.size() < min_observations(initial.num_states)) {
        return make_error<HMMParameters>(ErrorCode::INSUFFICIENT_DATA,
                                         "Insufficient observations for HMM fitting (" +
                                             std::to_string(observations.size()) + ")",
                                         "HMM");
    }

    HMMParameters params = initial;
    double prev_log_likelihood = -std::numeric_limits<double>::infinity();
    int iter = 0;

    for (; iter < max_iterations; ++iter) {
        Expectations e = forward_backward(params, observations);
        if (!std::isfinite(e.log_likelihood)) {
            return make_error<HMMParameters>(ErrorCode::NUMERIC_ERROR,
                                             "HMM log-likelihood is not finite", "HMM");
        }
        params.log_likelihood = e.log_likelihood;

        if (std::abs(e.log_likelihood - prev_log_likelihood) < tolerance) {
            break;
        }
        prev_log_likelihood = e.log_likelihood;
        params = maximize(params, e, observations, min_std);
    }

    params.iterations = iter;
    params.log_likelihood = forward_backward(params, observations).log_likelihood;
    return Result<HMMParameters>(std::move(params));
}

Result<Eigen::MatrixXd> posteriors(const HMMParameters& params,
                                   const std::vector<double>& observations) {
    auto valid = check_parameters(params, "HMM");
    if (valid.is_error()) {
        return make_error<Eigen::MatrixXd>(valid.error()->code(), valid.error()->what(), "HMM");
    }
    if (observations.empty()) {
        return make_error<Eigen::MatrixXd>(ErrorCode::INSUFFICIENT_DATA,
                                           "No observations to evaluate", "HMM");
    }
    return Result<Eigen::MatrixXd>(forward_backward(params, observations).gamma);
}

Result<std::vector<int>> viterbi(const HMMParameters& params,
                                 const std::vector<double>& observations) {
    auto valid = check_parameters(params, "HMM");
    if (valid.is_error()) {
        return make_error<std::vector<int>>(valid.error()->code(), valid.error()->what(), "HMM");
    }
    if (observations.empty()) {
        return make_error<std::vector<int>>(ErrorCode::INSUFFICIENT_DATA,
                                            "No observations to decode", "HMM");
    }

    const int T = static_cast<int>(observations.size());
    const int N = params.num_states;
    Eigen::MatrixXd log_emit = log_emissions(params, observations);
    Eigen::MatrixXd log_A = log_matrix(params.transition);

    Eigen::MatrixXd delta(T, N);
    Eigen::MatrixXi psi = Eigen::MatrixXi::Zero(T, N);

    for (int i = 0; i < N; ++i) {
        delta(0, i) = numeric::safe_log(params.initial(i)) + log_emit(0, i);
    }

    for (int t = 1; t < T; ++t) {
        for (int j = 0; j < N; ++j) {
            double max_val = -std::numeric_limits<double>::infinity();
            int max_state = 0;
            for (int i = 0; i < N; ++i) {
                double val = delta(t - 1, i) + log_A(i, j);
                if (val > max_val) {
                    max_val = val;
                    max_state = i;
                }
            }
            delta(t, j) = max_val + log_emit(t, j);
            psi(t, j) = max_state;
        }
    }

    std::vector<int> states(T);
    int max_idx = 0;
    delta.row(T - 1).maxCoeff(&max_idx);
    states[T - 1] = max_idx;
    for (int t = T - 2; t >= 0; --t) {
        states[t] = psi(t + 1, states[t + 1]);
    }
    return Result<std::vector<int>>(std::move(states));
}

// ============================================================================
// HiddenMarkovModel
// ============================================================================

HiddenMarkovModel::HiddenMarkovModel(HMMConfig config)
    : config_(std::move(config)),
      rng_(config_.seed ? *config_.seed : std::random_device{}()) {}

Result<void> HiddenMarkovModel::fit(const std::vector<double>& observations) {
    if (config_.num_states <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "num_states must be positive",
                                "HMM");
    }

    HMMParameters start =
        initial_parameters(observations, config_.num_states, rng_, config_.min_std);
    auto trained = baum_welch(start, observations, config_.max_iterations, config_.tolerance,
                              config_.min_std);
    if (trained.is_error()) {
        return make_error<void>(trained.error()->code(), trained.error()->what(), "HMM");
    }

    params_ = trained.value();
    fitted_ = true;
    DEBUG("HMM fit: " << params_.num_states << " states, " << params_.iterations
                      << " iterations, log-likelihood " << params_.log_likelihood);
    return Result<void>();
}

Result<std::vector<int>> HiddenMarkovModel::decode(const std::vector<double>& observations) const {
    if (!fitted_) {
        return make_error<std::vector<int>>(ErrorCode::NOT_INITIALIZED,
                                            "HMM has not been fitted", "HMM");
    }
    return viterbi(params_, observations);
}

Result<Eigen::MatrixXd> HiddenMarkovModel::state_probabilities(
    const std::vector<double>& observations) const {
    if (!fitted_) {
        return make_error<Eigen::MatrixXd>(ErrorCode::NOT_INITIALIZED, "HMM has not been fitted",
                                           "HMM");
    }
    return posteriors(params_, observations);
}

}  // namespace statistics
}  // namespace signal_ngin
