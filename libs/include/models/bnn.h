//
// Created by the bayesnet authors on 10/17/26.
//

#ifndef BAYESNET_BNN_H
#define BAYESNET_BNN_H

#include <torch/torch.h>
#include <optional>
#include <string>
#include <vector>
#include "models/ensemble.h"
#include "nn/layers.h"

namespace bayesnet::models {

    /*
     * Ensemble of Bayesian MLPs used as a probabilistic transition model.
     *
     * Every linear layer is an EnsembleLinear holding one BayesianLinear unit per member, so the
     * E members run side by side in a single forward call. When the model is not frozen each
     * forward draws fresh weights from the posteriors and loss() returns a Monte-Carlo estimate
     * of the ELBO; when frozen the posterior means are used and loss() is a plain sum of squared
     * errors.
     *
     * Propagation methods (for rank 2 inputs whose batch size is a multiple of the number of
     * active models, i.e. the elite set when one is selected):
     *   - none: one pass on the raw input, the model axis is dropped when E == 1
     *   - random_model: examples are split among the models with a fresh random permutation
     *   - fixed_model: same as random_model with caller supplied indices
     *   - expectation: every model sees the whole batch and predictions are averaged
     */
    class BNN : public Ensemble {
    public:
        explicit BNN(int64_t in_size,
                     int64_t out_size,
                     torch::Device device,
                     int64_t num_layers = 4,
                     int64_t ensemble_size = 1,
                     int64_t hid_size = 200,
                     bool deterministic = true,
                     bool freeze = false,
                     PropagationMethod propagation_method = PropagationMethod::None,
                     bool learn_logvar_bounds = false,
                     nn::ActivationType activation = nn::ActivationType::ReLU);

        explicit BNN(const BNNConfig &config);

        using Ensemble::save;
        using Ensemble::load;

        torch::Tensor forward(const torch::Tensor &x,
                              const std::optional<at::Generator> &rng = std::nullopt,
                              const std::optional<torch::Tensor> &propagation_indices = std::nullopt,
                              bool use_propagation = true) override;

        // sum of squared errors when frozen, Monte-Carlo ELBO otherwise. Metadata is empty
        tensor_with_info loss(const torch::Tensor &model_in, const torch::Tensor &target) override;

        // element-wise squared error of shape (E, B, out), computed without gradient
        tensor_with_info eval_score(const torch::Tensor &model_in, const torch::Tensor &target) override;

        torch::Tensor sample_propagation_indices(int64_t batch_size,
                                                 const std::optional<at::Generator> &rng) override;

        // stored only when the number of indices differs from num_members()
        void set_elite(const std::vector<int64_t> &elite_indices) override;

        void save(const std::string &save_dir) const override;

        void load(const std::string &load_dir) override;

        // sum of the KL divergence of every Bayesian unit for the weights drawn last, 0-dim
        torch::Tensor nn_kl_divergence() const;

        torch::Tensor sample_elbo(const torch::Tensor &inputs,
                                  const torch::Tensor &labels,
                                  int64_t sample_nbr = 100,
                                  double complexity_cost_weight = 1.0);

        void freeze_model();

        void unfreeze_model();

        [[nodiscard]] bool is_frozen() const;

        [[nodiscard]] const std::optional<std::vector<int64_t>> &elite_models() const;

        [[nodiscard]] const std::vector<nn::BayesianLinear> &bayesian_units() const;

        [[nodiscard]] int64_t num_active_models() const;

    protected:
        torch::Tensor default_forward(const torch::Tensor &x, bool only_elite = false);

        torch::Tensor forward_from_indices(const torch::Tensor &x, const torch::Tensor &model_shuffle_indices);

        torch::Tensor forward_ensemble(const torch::Tensor &x,
                                       const std::optional<at::Generator> &rng,
                                       const std::optional<torch::Tensor> &propagation_indices);

        torch::Tensor mse_loss(const torch::Tensor &model_in, const torch::Tensor &target);

    private:
        void maybe_toggle_layers_use_only_elite(bool only_elite);

        void check_batch_size(int64_t batch_size) const;

        void check_propagation_indices(const torch::Tensor &indices, int64_t batch_size) const;

        void apply_elite_to_layers();

        // validated elite list of a checkpoint, throws ConfigurationError when it does not fit this model
        std::optional<std::vector<int64_t>> read_elite_models(torch::serialize::InputArchive &archive) const;

        const int64_t in_size;
        const int64_t out_size;
        nn::StackSequential hidden_layers{nullptr};
        std::vector<nn::EnsembleLinear> hidden_linear;
        nn::EnsembleLinear output_layer{nullptr};
        // every Bayesian unit of the network (hidden and output), used for freeze and KL
        std::vector<nn::BayesianLinear> m_bayesian_units;
        std::optional<std::vector<int64_t>> m_elite_models;
        bool m_freeze;
    };
}

#endif //BAYESNET_BNN_H
