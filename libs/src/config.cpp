//
// Created by the bayesnet authors on 10/17/26.
//

#include "config.h"
#include "exception.h"
#include "spdlog/spdlog.h"
#include "fmt/format.h"

#include <fstream>

namespace bayesnet {

    PropagationMethod propagation_from_string(const std::string &name) {
        if (name.empty() || name == "none") {
            return PropagationMethod::None;
        } else if (name == "random_model") {
            return PropagationMethod::RandomModel;
        } else if (name == "fixed_model") {
            return PropagationMethod::FixedModel;
        } else if (name == "expectation") {
            return PropagationMethod::Expectation;
        } else {
            throw ConfigurationError(fmt::format("Invalid propagation method {}.", name));
        }
    }

    std::string propagation_to_string(PropagationMethod method) {
        switch (method) {
            case PropagationMethod::None:
                return "none";
            case PropagationMethod::RandomModel:
                return "random_model";
            case PropagationMethod::FixedModel:
                return "fixed_model";
            case PropagationMethod::Expectation:
                return "expectation";
        }
        throw ConfigurationError("Invalid propagation method.");
    }

    void to_json(json &j, const BNNConfig &config) {
        j = json{
                {"in_size",             config.in_size},
                {"out_size",            config.out_size},
                {"device",              config.device},
                {"num_layers",          config.num_layers},
                {"ensemble_size",       config.ensemble_size},
                {"hid_size",            config.hid_size},
                {"deterministic",       config.deterministic},
                {"freeze",              config.freeze},
                {"propagation_method",  propagation_to_string(config.propagation_method)},
                {"learn_logvar_bounds", config.learn_logvar_bounds},
                {"activation",          nn::activation_to_string(config.activation)},
        };
    }

    void from_json(const json &j, BNNConfig &config) {
        if (!j.contains("in_size") || !j.contains("out_size")) {
            throw ConfigurationError("Model config must provide in_size and out_size");
        }
        j.at("in_size").get_to(config.in_size);
        j.at("out_size").get_to(config.out_size);
        config.device = j.value("device", config.device);
        config.num_layers = j.value("num_layers", config.num_layers);
        config.ensemble_size = j.value("ensemble_size", config.ensemble_size);
        config.hid_size = j.value("hid_size", config.hid_size);
        config.deterministic = j.value("deterministic", config.deterministic);
        config.freeze = j.value("freeze", config.freeze);
        config.learn_logvar_bounds = j.value("learn_logvar_bounds", config.learn_logvar_bounds);
        if (j.contains("propagation_method") && !j.at("propagation_method").is_null()) {
            config.propagation_method = propagation_from_string(j.at("propagation_method").get<std::string>());
        }
        if (j.contains("activation") && !j.at("activation").is_null()) {
            config.activation = nn::activation_from_string(j.at("activation").get<std::string>());
        }
    }

    BNNConfig load_config(const std::string &path) {
        std::ifstream f(path);
        if (!f.is_open()) {
            throw ConfigurationError(fmt::format("Cannot open config file {}", path));
        }
        json root;
        try {
            f >> root;
        } catch (const json::parse_error &e) {
            throw ConfigurationError(fmt::format("Cannot parse config file {}: {}", path, e.what()));
        }
        spdlog::info("Loaded model config from {}", path);
        return root.get<BNNConfig>();
    }

    void save_config(const BNNConfig &config, const std::string &path) {
        json root = config;
        std::ofstream f(path);
        if (!f.is_open()) {
            throw ConfigurationError(fmt::format("Cannot write config file {}", path));
        }
        f << root.dump(4);
        spdlog::info("Saved model config to {}", path);
    }
}
