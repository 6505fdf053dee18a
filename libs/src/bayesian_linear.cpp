//
// Created by the bayesnet authors on 10/17/26.
//

#include "nn/bayesian_linear.h"

#include <cmath>
#include <numbers>

namespace bayesnet::nn {

    namespace {
        const double log_sqrt_2pi = 0.5 * std::log(2 * std::numbers::pi);

        torch::Tensor softplus_sigma(const torch::Tensor &rho) {
            return torch::log1p(torch::exp(rho));
        }

        torch::Tensor normal_log_prob(const torch::Tensor &value, double sigma) {
            return -std::log(sigma) - log_sqrt_2pi - value.pow(2) / (2 * sigma * sigma);
        }
    }

    BayesianLinearOptions::BayesianLinearOptions(int64_t in_features, int64_t out_features) :
            in_features_(in_features),
            out_features_(out_features) {

    }

    BayesianLinearImpl::BayesianLinearImpl(const BayesianLinearOptions &options) :
            options(options),
            m_freeze(options.freeze()) {
        reset();
    }

    BayesianLinearImpl::BayesianLinearImpl(int64_t in_features, int64_t out_features) :
            BayesianLinearImpl(BayesianLinearOptions(in_features, out_features)) {

    }

    void BayesianLinearImpl::reset() {
        weight_mu = register_parameter("weight_mu",
                                       torch::empty({options.out_features(), options.in_features()}));
        weight_rho = register_parameter("weight_rho",
                                        torch::empty({options.out_features(), options.in_features()}));
        if (options.bias()) {
            bias_mu = register_parameter("bias_mu", torch::empty({options.out_features()}));
            bias_rho = register_parameter("bias_rho", torch::empty({options.out_features()}));
        } else {
            bias_mu = register_parameter("bias_mu", {}, false);
            bias_rho = register_parameter("bias_rho", {}, false);
        }
        m_log_variational_posterior = torch::zeros({});
        m_log_prior = torch::zeros({});
        reset_parameters();
    }

    void BayesianLinearImpl::reset_parameters() {
        torch::NoGradGuard no_grad;
        weight_mu.normal_(options.posterior_mu_init(), 0.1);
        weight_rho.normal_(options.posterior_rho_init(), 0.1);
        if (options.bias()) {
            bias_mu.normal_(options.posterior_mu_init(), 0.1);
            bias_rho.normal_(options.posterior_rho_init(), 0.1);
        }
    }

    Weights BayesianLinearImpl::sample_weights() const {
        Weights sample;
        sample.weight = weight_mu + softplus_sigma(weight_rho) * torch::randn_like(weight_mu);
        if (options.bias()) {
            sample.bias = bias_mu + softplus_sigma(bias_rho) * torch::randn_like(bias_mu);
        }
        return sample;
    }

    torch::Tensor BayesianLinearImpl::posterior_log_prob(const torch::Tensor &value, const torch::Tensor &mu,
                                                         const torch::Tensor &rho) const {
        auto sigma = softplus_sigma(rho);
        auto log_posteriors = -log_sqrt_2pi - torch::log(sigma) - (value - mu).pow(2) / (2 * sigma.pow(2)) - 0.5;
        return log_posteriors.sum();
    }

    torch::Tensor BayesianLinearImpl::prior_log_prob(const torch::Tensor &value) const {
        auto prior_pdf = options.prior_pi() * torch::exp(normal_log_prob(value, options.prior_sigma_1()));
        if (options.prior_pi() < 1.0) {
            prior_pdf = prior_pdf +
                        (1.0 - options.prior_pi()) * torch::exp(normal_log_prob(value, options.prior_sigma_2()));
        }
        return (torch::log(prior_pdf + 1e-6) - 0.5).sum();
    }

    torch::Tensor BayesianLinearImpl::forward(const torch::Tensor &x) {
        if (m_freeze) {
            return torch::nn::functional::linear(x, weight_mu, bias_mu);
        }
        auto sample = sample_weights();
        auto log_posterior = posterior_log_prob(sample.weight, weight_mu, weight_rho);
        auto log_prior = prior_log_prob(sample.weight);
        if (options.bias()) {
            log_posterior = log_posterior + posterior_log_prob(sample.bias, bias_mu, bias_rho);
            log_prior = log_prior + prior_log_prob(sample.bias);
        }
        m_log_variational_posterior = log_posterior;
        m_log_prior = log_prior;
        return torch::nn::functional::linear(x, sample.weight, sample.bias);
    }

    torch::Tensor BayesianLinearImpl::kl_divergence() const {
        return m_log_variational_posterior - m_log_prior;
    }

    torch::Tensor BayesianLinearImpl::log_variational_posterior() const {
        return m_log_variational_posterior;
    }

    torch::Tensor BayesianLinearImpl::log_prior() const {
        return m_log_prior;
    }

    void BayesianLinearImpl::set_freeze(bool freeze) {
        m_freeze = freeze;
    }

    bool BayesianLinearImpl::is_frozen() const {
        return m_freeze;
    }

    void BayesianLinearImpl::pretty_print(std::ostream &stream) const {
        stream << "bayesnet::nn::BayesianLinear(in_features=" << options.in_features()
               << ", out_features=" << options.out_features()
               << ", bias=" << options.bias()
               << ", frozen=" << m_freeze << ")";
    }

}
