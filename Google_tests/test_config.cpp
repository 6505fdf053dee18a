//
// Created by the bayesnet authors on 10/17/26.
//

#include <gtest/gtest.h>
#include <torch/torch.h>
#include <filesystem>
#include <fstream>
#include "config.h"
#include "exception.h"
#include "models/bnn.h"
#include "nn/activation.h"
#include "utils/torch_utils.h"

using bayesnet::BNNConfig;
using bayesnet::PropagationMethod;
using bayesnet::json;
using bayesnet::nn::ActivationType;

TEST(Config, defaults_for_missing_keys) {
    json j = {{"in_size", 7}, {"out_size", 3}};
    auto config = j.get<BNNConfig>();
    ASSERT_EQ(config.in_size, 7);
    ASSERT_EQ(config.out_size, 3);
    ASSERT_EQ(config.device, "cpu");
    ASSERT_EQ(config.num_layers, 4);
    ASSERT_EQ(config.ensemble_size, 1);
    ASSERT_EQ(config.hid_size, 200);
    ASSERT_TRUE(config.deterministic);
    ASSERT_FALSE(config.freeze);
    ASSERT_FALSE(config.learn_logvar_bounds);
    ASSERT_EQ(config.propagation_method, PropagationMethod::None);
    ASSERT_EQ(config.activation, ActivationType::ReLU);
}

TEST(Config, parse_all_keys) {
    json j = {{"in_size",            5},
              {"out_size",           4},
              {"ensemble_size",      3},
              {"hid_size",           10},
              {"num_layers",         2},
              {"freeze",             true},
              {"propagation_method", "expectation"},
              {"activation",         "tanh"}};
    auto config = j.get<BNNConfig>();
    ASSERT_EQ(config.ensemble_size, 3);
    ASSERT_EQ(config.hid_size, 10);
    ASSERT_EQ(config.num_layers, 2);
    ASSERT_TRUE(config.freeze);
    ASSERT_EQ(config.propagation_method, PropagationMethod::Expectation);
    ASSERT_EQ(config.activation, ActivationType::Tanh);

    json dumped = config;
    ASSERT_EQ(dumped["propagation_method"], "expectation");
    ASSERT_EQ(dumped["activation"], "tanh");
    ASSERT_EQ(dumped.get<BNNConfig>().hid_size, 10);

    json null_propagation = {{"in_size", 5}, {"out_size", 4}, {"propagation_method", nullptr}};
    ASSERT_EQ(null_propagation.get<BNNConfig>().propagation_method, PropagationMethod::None);
}

TEST(Config, invalid_values) {
    ASSERT_THROW((json{{"in_size", 5}}.get<BNNConfig>()), bayesnet::ConfigurationError);
    ASSERT_THROW((json{{"in_size", 5}, {"out_size", 4}, {"propagation_method", "ts1"}}.get<BNNConfig>()),
                 bayesnet::ConfigurationError);
    ASSERT_THROW((json{{"in_size", 5}, {"out_size", 4}, {"activation", "swish"}}.get<BNNConfig>()),
                 bayesnet::ConfigurationError);
    ASSERT_THROW(bayesnet::propagation_from_string("random"), bayesnet::ConfigurationError);
    ASSERT_EQ(bayesnet::propagation_from_string(""), PropagationMethod::None);
    ASSERT_EQ(bayesnet::propagation_from_string("fixed_model"), PropagationMethod::FixedModel);
}

TEST(Config, save_and_load_file) {
    auto path = std::filesystem::path(testing::TempDir()) / "bnn_config.json";
    BNNConfig config;
    config.in_size = 6;
    config.out_size = 2;
    config.ensemble_size = 5;
    config.propagation_method = PropagationMethod::RandomModel;
    config.activation = ActivationType::SiLU;
    bayesnet::save_config(config, path.string());

    auto loaded = bayesnet::load_config(path.string());
    ASSERT_EQ(loaded.in_size, 6);
    ASSERT_EQ(loaded.out_size, 2);
    ASSERT_EQ(loaded.ensemble_size, 5);
    ASSERT_EQ(loaded.propagation_method, PropagationMethod::RandomModel);
    ASSERT_EQ(loaded.activation, ActivationType::SiLU);

    std::ofstream broken(path);
    broken << "{ not json";
    broken.close();
    ASSERT_THROW(bayesnet::load_config(path.string()), bayesnet::ConfigurationError);
    std::filesystem::remove(path);
    ASSERT_THROW(bayesnet::load_config(path.string()), bayesnet::ConfigurationError);
}

TEST(Config, model_from_config) {
    BNNConfig config;
    config.in_size = 5;
    config.out_size = 4;
    config.ensemble_size = 3;
    config.hid_size = 10;
    config.num_layers = 2;
    config.propagation_method = PropagationMethod::Expectation;
    config.activation = ActivationType::GELU;
    bayesnet::models::BNN bnn(config);
    ASSERT_EQ(bnn.num_members(), 3);
    ASSERT_EQ(bnn.propagation_method(), PropagationMethod::Expectation);
    ASSERT_TRUE(bnn.is_deterministic());
    ASSERT_EQ(bnn.device(), torch::Device(torch::kCPU));
    ASSERT_EQ(bnn.forward(torch::randn({3, 5})).sizes(), torch::IntArrayRef({3, 4}));
}

TEST(Activation, names) {
    for (auto name: {"identity", "relu", "tanh", "sigmoid", "gelu", "silu", "leaky_relu"}) {
        ASSERT_EQ(bayesnet::nn::activation_to_string(bayesnet::nn::activation_from_string(name)), name);
    }
    bayesnet::nn::Activation identity(ActivationType::Identity);
    auto x = torch::randn({4});
    ASSERT_TRUE(torch::equal(identity->forward(x), x));
    bayesnet::nn::Activation relu;
    ASSERT_TRUE(torch::equal(relu->forward(x), x.clamp_min(0)));
}

TEST(TorchUtils, device) {
    ASSERT_EQ(bayesnet::ptu::get_torch_device("cpu"), torch::Device(torch::kCPU));
    ASSERT_THROW(bayesnet::ptu::get_torch_device("tpu"), bayesnet::ConfigurationError);
    ASSERT_THROW(bayesnet::ptu::get_torch_device("cuda:x"), bayesnet::ConfigurationError);
    if (!torch::cuda::is_available()) {
        ASSERT_EQ(bayesnet::ptu::get_torch_device("gpu"), torch::Device(torch::kCPU));
    }
}
