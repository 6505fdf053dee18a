//
// Created by the bayesnet authors on 10/17/26.
//

#include "nn/activation.h"
#include "exception.h"
#include "fmt/core.h"


namespace bayesnet::nn {

    ActivationType activation_from_string(const std::string &name) {
        if (name == "identity") {
            return ActivationType::Identity;
        } else if (name == "relu") {
            return ActivationType::ReLU;
        } else if (name == "tanh") {
            return ActivationType::Tanh;
        } else if (name == "sigmoid") {
            return ActivationType::Sigmoid;
        } else if (name == "gelu") {
            return ActivationType::GELU;
        } else if (name == "silu") {
            return ActivationType::SiLU;
        } else if (name == "leaky_relu") {
            return ActivationType::LeakyReLU;
        } else {
            throw ConfigurationError(fmt::format("Unknown activation {}", name));
        }
    }

    std::string activation_to_string(ActivationType type) {
        switch (type) {
            case ActivationType::Identity:
                return "identity";
            case ActivationType::ReLU:
                return "relu";
            case ActivationType::Tanh:
                return "tanh";
            case ActivationType::Sigmoid:
                return "sigmoid";
            case ActivationType::GELU:
                return "gelu";
            case ActivationType::SiLU:
                return "silu";
            case ActivationType::LeakyReLU:
                return "leaky_relu";
        }
        throw ConfigurationError("Unknown activation type");
    }

    ActivationImpl::ActivationImpl(ActivationType type) : m_type(type) {

    }

    torch::Tensor ActivationImpl::forward(const torch::Tensor &x) {
        switch (m_type) {
            case ActivationType::Identity:
                return x;
            case ActivationType::ReLU:
                return x.relu();
            case ActivationType::Tanh:
                return x.tanh();
            case ActivationType::Sigmoid:
                return x.sigmoid();
            case ActivationType::GELU:
                return torch::gelu(x);
            case ActivationType::SiLU:
                return torch::silu(x);
            case ActivationType::LeakyReLU:
                return torch::leaky_relu(x, 0.01);
        }
        throw ConfigurationError("Unknown activation type");
    }

    void ActivationImpl::reset() {

    }

    ActivationType ActivationImpl::type() const {
        return m_type;
    }

}
