//
// Created by the bayesnet authors on 10/17/26.
//

#ifndef BAYESNET_LINEAR_H
#define BAYESNET_LINEAR_H

#include <torch/torch.h>
#include <vector>
#include "nn/bayesian_linear.h"

namespace bayesnet::nn {

    // throws ConfigurationError unless elite_models is non-empty, distinct and within [0, num_ensembles)
    void check_elite_indices(const std::vector<int64_t> &elite_models, int64_t num_ensembles);

    /*
     * E independent BayesianLinear units evaluated in one call. The leading axis of the input
     * and of the output indexes the model. After set_elite() and toggle_use_only_elite() only
     * the elite units are evaluated, in elite order, and the leading axis shrinks accordingly.
     */
    class EnsembleLinearImpl : public torch::nn::Cloneable<EnsembleLinearImpl> {
    public:
        explicit EnsembleLinearImpl(int64_t num_ensembles, int64_t in_features, int64_t out_features,
                                    bool use_bias = true);

        // x: (B, in) is fed to every active unit; (1, B, in) is broadcast; (M, B, in) is split by model
        // returns (M, B, out) where M is the number of active units
        torch::Tensor forward(const torch::Tensor &x);

        void reset() override;

        void set_elite(const std::vector<int64_t> &elite_models);

        void toggle_use_only_elite();

        [[nodiscard]] bool use_only_elite() const;

        [[nodiscard]] const std::vector<int64_t> &elite_models() const;

        [[nodiscard]] std::vector<int64_t> active_members() const;

        [[nodiscard]] const std::vector<BayesianLinear> &units() const;

        [[nodiscard]] int64_t num_ensembles() const;

        void pretty_print(std::ostream &stream) const override;

    private:
        torch::nn::ModuleList members{nullptr};
        std::vector<BayesianLinear> m_units;
        std::vector<int64_t> m_elite_models;
        bool m_use_only_elite;
        int64_t in_features;
        int64_t out_features;
        int64_t num_ensembles_;
        bool use_bias;
    };

    TORCH_MODULE(EnsembleLinear);

}

#endif //BAYESNET_LINEAR_H
