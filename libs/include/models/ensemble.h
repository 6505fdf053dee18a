//
// Created by the bayesnet authors on 10/17/26.
//

#ifndef BAYESNET_ENSEMBLE_H
#define BAYESNET_ENSEMBLE_H

#include <torch/torch.h>
#include <optional>
#include <string>
#include <vector>
#include "config.h"
#include "type.h"

namespace bayesnet::models {

    // base class of ensemble dynamics models used by model-based RL rollouts
    class Ensemble : public torch::nn::Module {
    public:
        static constexpr const char *MODEL_FNAME = "model.pth";

        explicit Ensemble(int64_t ensemble_size, torch::Device device, PropagationMethod propagation_method,
                          bool deterministic = false);

        using torch::nn::Module::save;
        using torch::nn::Module::load;

        virtual torch::Tensor forward(const torch::Tensor &x,
                                      const std::optional<at::Generator> &rng = std::nullopt,
                                      const std::optional<torch::Tensor> &propagation_indices = std::nullopt,
                                      bool use_propagation = true) = 0;

        virtual tensor_with_info loss(const torch::Tensor &model_in, const torch::Tensor &target) = 0;

        virtual tensor_with_info eval_score(const torch::Tensor &model_in, const torch::Tensor &target) = 0;

        virtual torch::Tensor sample_propagation_indices(int64_t batch_size,
                                                         const std::optional<at::Generator> &rng) = 0;

        virtual void set_elite(const std::vector<int64_t> &elite_indices) = 0;

        virtual void save(const std::string &save_dir) const = 0;

        virtual void load(const std::string &load_dir) = 0;

        [[nodiscard]] int64_t num_members() const;

        [[nodiscard]] torch::Device device() const;

        [[nodiscard]] PropagationMethod propagation_method() const;

        [[nodiscard]] bool is_deterministic() const;

    protected:
        const int64_t m_ensemble_size;
        const torch::Device m_device;
        const PropagationMethod m_propagation_method;
        const bool m_deterministic;
    };
}

#endif //BAYESNET_ENSEMBLE_H
