//
// Created by the bayesnet authors on 10/17/26.
//

#ifndef BAYESNET_ACTIVATION_H
#define BAYESNET_ACTIVATION_H


#include <torch/torch.h>
#include <string>

namespace bayesnet::nn {

    enum class ActivationType {
        Identity,
        ReLU,
        Tanh,
        Sigmoid,
        GELU,
        SiLU,
        LeakyReLU
    };

    // throws ConfigurationError for unknown names
    ActivationType activation_from_string(const std::string &name);

    std::string activation_to_string(ActivationType type);

    // activation module selected by a closed set of kinds, resolved at construction time
    class ActivationImpl : public torch::nn::Cloneable<ActivationImpl> {
    public:
        explicit ActivationImpl(ActivationType type = ActivationType::ReLU);

        torch::Tensor forward(const torch::Tensor &x);

        void reset() override;

        [[nodiscard]] ActivationType type() const;

    private:
        ActivationType m_type;
    };

    TORCH_MODULE(Activation);

}

#endif //BAYESNET_ACTIVATION_H
