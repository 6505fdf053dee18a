//
// Created by the bayesnet authors on 10/17/26.
//

#include "models/bnn.h"
#include "exception.h"
#include "config.h"
#include "spdlog/spdlog.h"
#include "fmt/core.h"
#include "cxxopts.hpp"

#include <filesystem>
#include <sstream>

static cxxopts::ParseResult parse(int argc, char *argv[]) {
    try {
        cxxopts::Options options(argv[0], " - Smoke test of the BNN ensemble dynamics model");
        options.positional_help("[optional args]").show_positional_help();
        options.add_options()
                ("help", "Print help")
                ("config", "JSON model config, overrides the model options", cxxopts::value<std::string>())
                ("in_size", "Input dimension", cxxopts::value<int64_t>()->default_value("5"))
                ("out_size", "Output dimension", cxxopts::value<int64_t>()->default_value("4"))
                ("ensemble_size", "Number of ensemble members", cxxopts::value<int64_t>()->default_value("3"))
                ("hid_size", "Width of the hidden layers", cxxopts::value<int64_t>()->default_value("10"))
                ("num_layers", "Number of hidden layers", cxxopts::value<int64_t>()->default_value("2"))
                ("batch_size", "Number of examples in the batch", cxxopts::value<int64_t>()->default_value("3"))
                ("propagation", "Propagation method", cxxopts::value<std::string>()->default_value("expectation"))
                ("sample_nbr", "Monte-Carlo samples of the ELBO", cxxopts::value<int64_t>()->default_value("10"))
                ("lr", "Learning rate of the Adam step", cxxopts::value<double>()->default_value("1e-2"))
                ("device", "Pytorch device", cxxopts::value<std::string>()->default_value("cpu"))
                ("seed", "Random seed", cxxopts::value<int64_t>()->default_value("1"))
                ("save_dir", "Directory for a save/load round trip", cxxopts::value<std::string>());

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            exit(0);
        }

        return result;

    } catch (const cxxopts::OptionException &e) {
        std::cout << "error parsing options: " << e.what() << std::endl;
        exit(1);
    }
}

static std::string to_string(const torch::Tensor &tensor) {
    std::stringstream ss;
    ss << tensor;
    return ss.str();
}

int main(int argc, char **argv) {
    auto result = parse(argc, argv);
    torch::manual_seed(result["seed"].as<int64_t>());

    try {
        bayesnet::BNNConfig config;
        if (result.count("config")) {
            config = bayesnet::load_config(result["config"].as<std::string>());
        } else {
            config.in_size = result["in_size"].as<int64_t>();
            config.out_size = result["out_size"].as<int64_t>();
            config.ensemble_size = result["ensemble_size"].as<int64_t>();
            config.hid_size = result["hid_size"].as<int64_t>();
            config.num_layers = result["num_layers"].as<int64_t>();
            config.device = result["device"].as<std::string>();
            config.propagation_method = bayesnet::propagation_from_string(result["propagation"].as<std::string>());
        }

        auto bnn = std::make_shared<bayesnet::models::BNN>(config);
        auto device = bnn->device();
        auto batch_size = result["batch_size"].as<int64_t>();

        auto batch = torch::randn({batch_size, config.in_size}, torch::TensorOptions().device(device));
        auto labels = torch::randint(config.out_size, {batch_size},
                                     torch::TensorOptions().dtype(torch::kInt64).device(device));
        auto target = torch::one_hot(labels, config.out_size).to(torch::kFloat32) - 1;
        spdlog::info("Input batch:\n{}", to_string(batch));
        spdlog::info("Prediction:\n{}", to_string(bnn->forward(batch)));

        torch::optim::Adam optimizer(bnn->parameters(), torch::optim::AdamOptions(result["lr"].as<double>()));

        bnn->freeze_model();
        optimizer.zero_grad();
        auto loss = bnn->sample_elbo(batch, target, result["sample_nbr"].as<int64_t>());
        spdlog::info("ELBO: {}", loss.item<float>());
        spdlog::info("Prediction before the update:\n{}", to_string(bnn->forward(batch)));
        loss.backward();
        optimizer.step();
        spdlog::info("Prediction after the update:\n{}", to_string(bnn->forward(batch)));

        auto score = bnn->eval_score(batch, target).first;
        spdlog::info("Mean squared error per member:\n{}", to_string(score.mean({1, 2})));

        if (result.count("save_dir")) {
            auto save_dir = result["save_dir"].as<std::string>();
            bnn->save(save_dir);
            bayesnet::save_config(config, (std::filesystem::path(save_dir) / "config.json").string());
            auto restored = std::make_shared<bayesnet::models::BNN>(config);
            restored->load(save_dir);
            restored->freeze_model();
            spdlog::info("Restored prediction:\n{}", to_string(restored->forward(batch)));
        }
    } catch (const bayesnet::ConfigurationError &e) {
        spdlog::error("Configuration error: {}", e.what());
        return 1;
    } catch (const bayesnet::ShapeError &e) {
        spdlog::error("Shape error: {}", e.what());
        return 1;
    }
    return 0;
}
