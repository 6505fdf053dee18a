//
// Created by the bayesnet authors on 10/17/26.
//

#ifndef BAYESNET_CONFIG_H
#define BAYESNET_CONFIG_H

#include <string>
#include "nlohmann/json.hpp"
#include "nn/activation.h"

namespace bayesnet {
    using json = nlohmann::json;

    enum class PropagationMethod {
        None,
        RandomModel,
        FixedModel,
        Expectation
    };

    // "", "none", "random_model", "fixed_model" or "expectation"
    PropagationMethod propagation_from_string(const std::string &name);

    std::string propagation_to_string(PropagationMethod method);

    struct BNNConfig {
        int64_t in_size{};
        int64_t out_size{};
        std::string device = "cpu";
        int64_t num_layers = 4;
        int64_t ensemble_size = 1;
        int64_t hid_size = 200;
        bool deterministic = true;
        bool freeze = false;
        PropagationMethod propagation_method = PropagationMethod::None;
        // accepted for compatibility with the gaussian ensemble configs, not used by the model
        bool learn_logvar_bounds = false;
        nn::ActivationType activation = nn::ActivationType::ReLU;
    };

    void to_json(json &j, const BNNConfig &config);

    // in_size and out_size are required, every other key falls back to its default
    void from_json(const json &j, BNNConfig &config);

    BNNConfig load_config(const std::string &path);

    void save_config(const BNNConfig &config, const std::string &path);
}

#endif //BAYESNET_CONFIG_H
