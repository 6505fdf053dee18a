//
// Created by the bayesnet authors on 10/17/26.
//

#ifndef BAYESNET_BAYESIAN_LINEAR_H
#define BAYESNET_BAYESIAN_LINEAR_H

#include <torch/torch.h>

namespace bayesnet::nn {

    // one Monte-Carlo draw of the parameters of a BayesianLinear unit
    struct Weights {
        torch::Tensor weight; // (out_features, in_features)
        torch::Tensor bias;   // (out_features,), undefined when the unit has no bias
    };

    struct BayesianLinearOptions {
        BayesianLinearOptions(int64_t in_features, int64_t out_features);

        TORCH_ARG(int64_t, in_features);
        TORCH_ARG(int64_t, out_features);
        TORCH_ARG(bool, bias) = true;
        // scale mixture prior pi * N(0, sigma_1) + (1 - pi) * N(0, sigma_2)
        TORCH_ARG(double, prior_sigma_1) = 0.1;
        TORCH_ARG(double, prior_sigma_2) = 0.4;
        TORCH_ARG(double, prior_pi) = 1.0;
        TORCH_ARG(double, posterior_mu_init) = 0.0;
        TORCH_ARG(double, posterior_rho_init) = -7.0;
        TORCH_ARG(bool, freeze) = false;
    };

    /*
     * Affine transform whose weight and bias follow a factorized Gaussian posterior
     * N(mu, log1p(exp(rho))^2). Every stochastic forward draws a fresh sample through the
     * reparameterization trick and caches the log posterior / log prior of that sample, so
     * kl_divergence() always refers to the weights used by the last forward call.
     * A frozen unit uses the posterior mean and leaves the cached terms untouched.
     */
    class BayesianLinearImpl : public torch::nn::Cloneable<BayesianLinearImpl> {
    public:
        explicit BayesianLinearImpl(const BayesianLinearOptions &options);

        BayesianLinearImpl(int64_t in_features, int64_t out_features);

        void reset() override;

        void reset_parameters();

        torch::Tensor forward(const torch::Tensor &x);

        Weights sample_weights() const;

        // log q(w | theta) - log p(w) of the last sampled weights, 0-dim
        torch::Tensor kl_divergence() const;

        [[nodiscard]] torch::Tensor log_variational_posterior() const;

        [[nodiscard]] torch::Tensor log_prior() const;

        void set_freeze(bool freeze);

        [[nodiscard]] bool is_frozen() const;

        void pretty_print(std::ostream &stream) const override;

        BayesianLinearOptions options;

        torch::Tensor weight_mu;
        torch::Tensor weight_rho;
        torch::Tensor bias_mu;
        torch::Tensor bias_rho;

    private:
        torch::Tensor posterior_log_prob(const torch::Tensor &value, const torch::Tensor &mu,
                                         const torch::Tensor &rho) const;

        torch::Tensor prior_log_prob(const torch::Tensor &value) const;

        bool m_freeze;
        torch::Tensor m_log_variational_posterior;
        torch::Tensor m_log_prior;
    };

    TORCH_MODULE(BayesianLinear);

}

#endif //BAYESNET_BAYESIAN_LINEAR_H
