//
// Created by the bayesnet authors on 10/17/26.
//

#include "models/bnn.h"
#include "exception.h"
#include "utils/torch_utils.h"
#include "spdlog/spdlog.h"
#include "fmt/format.h"
#include "fmt/ranges.h"

#include <filesystem>

namespace bayesnet::models {
    namespace fs = std::filesystem;

    BNN::BNN(int64_t in_size, int64_t out_size, torch::Device device, int64_t num_layers, int64_t ensemble_size,
             int64_t hid_size, bool deterministic, bool freeze, PropagationMethod propagation_method,
             bool learn_logvar_bounds, nn::ActivationType activation) :
            Ensemble(ensemble_size, device, propagation_method, deterministic),
            in_size(in_size),
            out_size(out_size),
            m_freeze(freeze) {
        if (num_layers < 1) {
            throw ConfigurationError(fmt::format("BNN needs at least one hidden layer. Got {}", num_layers));
        }
        if (learn_logvar_bounds) {
            spdlog::warn("learn_logvar_bounds has no effect on a BNN ensemble");
        }

        hidden_layers = register_module("hidden_layers", nn::StackSequential());
        for (int64_t i = 0; i < num_layers; i++) {
            auto linear = nn::EnsembleLinear(ensemble_size, i == 0 ? in_size : hid_size, hid_size);
            hidden_layers->push_back(nn::StackSequential(linear, nn::Activation(activation)));
            hidden_linear.push_back(linear);
        }
        output_layer = register_module("output_layer", nn::EnsembleLinear(ensemble_size, hid_size, out_size));

        for (auto &layer: hidden_linear) {
            m_bayesian_units.insert(m_bayesian_units.end(), layer->units().begin(), layer->units().end());
        }
        m_bayesian_units.insert(m_bayesian_units.end(), output_layer->units().begin(), output_layer->units().end());

        if (m_freeze) {
            freeze_model();
        }

        this->to(m_device);

        spdlog::info("Created BNN ensemble: {} members, {} -> {} x {} -> {}, activation {}, propagation {}",
                     ensemble_size, in_size, num_layers, hid_size, out_size,
                     nn::activation_to_string(activation), propagation_to_string(propagation_method));
    }

    BNN::BNN(const BNNConfig &config) :
            BNN(config.in_size, config.out_size, ptu::get_torch_device(config.device), config.num_layers,
                config.ensemble_size, config.hid_size, config.deterministic, config.freeze,
                config.propagation_method, config.learn_logvar_bounds, config.activation) {

    }

    void BNN::maybe_toggle_layers_use_only_elite(bool only_elite) {
        if (!m_elite_models.has_value()) {
            return;
        }
        if (num_members() > 1 && only_elite) {
            for (auto &layer: hidden_linear) {
                layer->toggle_use_only_elite();
            }
            output_layer->toggle_use_only_elite();
        }
    }

    torch::Tensor BNN::default_forward(const torch::Tensor &x, bool only_elite) {
        maybe_toggle_layers_use_only_elite(only_elite);
        torch::Tensor output;
        try {
            output = output_layer->forward(hidden_layers->forward(x));
        } catch (...) {
            // restore full-ensemble behavior before reporting the error
            maybe_toggle_layers_use_only_elite(only_elite);
            throw;
        }
        maybe_toggle_layers_use_only_elite(only_elite);
        return output;
    }

    torch::Tensor BNN::forward_from_indices(const torch::Tensor &x, const torch::Tensor &model_shuffle_indices) {
        using namespace torch::indexing;
        auto batch_size = x.size(1);
        auto num_models = num_active_models();
        auto shuffled_x = x.index({Slice(), model_shuffle_indices, Ellipsis})
                .view({num_models, batch_size / num_models, -1});

        auto pred = default_forward(shuffled_x, true);
        // pred is shuffled, row i belongs to example model_shuffle_indices[i]
        pred = pred.view({batch_size, -1});
        auto output = torch::empty_like(pred);
        output.index_put_({model_shuffle_indices}, pred);
        return output;
    }

    torch::Tensor BNN::forward_ensemble(const torch::Tensor &x,
                                        const std::optional<at::Generator> &rng,
                                        const std::optional<torch::Tensor> &propagation_indices) {
        if (m_propagation_method == PropagationMethod::None) {
            auto mean = default_forward(x, false);
            if (num_members() == 1) {
                mean = mean[0];
            }
            return mean;
        }
        if (x.dim() != 2) {
            throw ShapeError(fmt::format("Ensemble propagation expects an input of rank 2. Got rank {}", x.dim()));
        }
        check_batch_size(x.size(0));
        auto batched_x = x.unsqueeze(0);
        switch (m_propagation_method) {
            case PropagationMethod::RandomModel: {
                auto model_indices = sample_propagation_indices(x.size(0), rng);
                return forward_from_indices(batched_x, model_indices);
            }
            case PropagationMethod::FixedModel: {
                if (!propagation_indices.has_value()) {
                    throw ConfigurationError(
                            "When using propagation='fixed_model', `propagation_indices` must be provided.");
                }
                check_propagation_indices(propagation_indices.value(), x.size(0));
                return forward_from_indices(batched_x, propagation_indices->to(m_device, torch::kInt64));
            }
            case PropagationMethod::Expectation: {
                auto pred = default_forward(batched_x, true);
                return pred.mean(0);
            }
            default:
                throw ConfigurationError(fmt::format("Invalid propagation method {}.",
                                                     propagation_to_string(m_propagation_method)));
        }
    }

    torch::Tensor BNN::forward(const torch::Tensor &x,
                               const std::optional<at::Generator> &rng,
                               const std::optional<torch::Tensor> &propagation_indices,
                               bool use_propagation) {
        if (use_propagation) {
            return forward_ensemble(x, rng, propagation_indices);
        }
        return default_forward(x);
    }

    torch::Tensor BNN::mse_loss(const torch::Tensor &model_in, const torch::Tensor &target) {
        if (model_in.dim() != target.dim()) {
            throw ShapeError(fmt::format("Input of rank {} does not match target of rank {}",
                                         model_in.dim(), target.dim()));
        }
        auto pred_mean = forward(model_in, std::nullopt, std::nullopt, false);
        return torch::square(pred_mean - target).sum({1, 2}).sum();
    }

    tensor_with_info BNN::loss(const torch::Tensor &model_in, const torch::Tensor &target) {
        if (m_freeze) {
            freeze_model();
            return {mse_loss(model_in, target), {}};
        }
        return {sample_elbo(model_in, target), {}};
    }

    torch::Tensor BNN::nn_kl_divergence() const {
        auto kl = torch::zeros({}, torch::TensorOptions().device(m_device));
        for (auto &unit: m_bayesian_units) {
            kl = kl + unit->kl_divergence();
        }
        return kl;
    }

    torch::Tensor BNN::sample_elbo(const torch::Tensor &inputs, const torch::Tensor &labels, int64_t sample_nbr,
                                   double complexity_cost_weight) {
        if (sample_nbr < 1) {
            throw ConfigurationError(fmt::format("sample_nbr must be positive. Got {}", sample_nbr));
        }
        auto loss = torch::zeros({}, torch::TensorOptions().device(m_device));
        for (int64_t i = 0; i < sample_nbr; i++) {
            loss = loss + mse_loss(inputs, labels);
            loss = loss + nn_kl_divergence().mean() * complexity_cost_weight;
        }
        return loss / sample_nbr;
    }

    tensor_with_info BNN::eval_score(const torch::Tensor &model_in, const torch::Tensor &target) {
        if (model_in.dim() != 2 || target.dim() != 2) {
            throw ShapeError(fmt::format("eval_score expects input and target of rank 2. Got {} and {}",
                                         model_in.dim(), target.dim()));
        }
        torch::NoGradGuard no_grad;
        auto pred = forward(model_in, std::nullopt, std::nullopt, false);
        auto repeated_target = target.repeat({num_members(), 1, 1});
        return {torch::square(pred - repeated_target), {}};
    }

    void BNN::check_batch_size(int64_t batch_size) const {
        auto model_len = num_active_models();
        if (batch_size % model_len != 0) {
            throw ConfigurationError(fmt::format(
                    "BNN ensemble requires batch size to be a multiple of the number of models. "
                    "Current batch size is {} for {} models.", batch_size, model_len));
        }
    }

    void BNN::check_propagation_indices(const torch::Tensor &indices, int64_t batch_size) const {
        if (indices.dim() != 1 || indices.size(0) != batch_size) {
            throw ConfigurationError(fmt::format("propagation_indices must be a vector of length {}. Got shape {}",
                                                 batch_size, indices.sizes().vec()));
        }
        auto sorted = std::get<0>(indices.to(torch::kInt64).sort());
        if (!torch::equal(sorted.cpu(), torch::arange(batch_size, torch::kInt64))) {
            throw ConfigurationError(fmt::format("propagation_indices must be a permutation of [0, {})",
                                                 batch_size));
        }
    }

    torch::Tensor BNN::sample_propagation_indices(int64_t batch_size, const std::optional<at::Generator> &rng) {
        check_batch_size(batch_size);
        // the generator is not forwarded to randperm, see https://github.com/pytorch/pytorch/issues/44714
        return torch::randperm(batch_size, torch::TensorOptions().dtype(torch::kInt64).device(m_device));
    }

    void BNN::set_elite(const std::vector<int64_t> &elite_indices) {
        if (static_cast<int64_t>(elite_indices.size()) == num_members()) {
            spdlog::debug("Elite set {} covers every member, keeping the current one", elite_indices);
            return;
        }
        auto previous = m_elite_models;
        m_elite_models = elite_indices;
        try {
            apply_elite_to_layers();
        } catch (const ConfigurationError &) {
            m_elite_models = previous;
            throw;
        }
        spdlog::debug("Elite models set to {}", elite_indices);
    }

    void BNN::apply_elite_to_layers() {
        if (!m_elite_models.has_value()) {
            return;
        }
        for (auto &layer: hidden_linear) {
            layer->set_elite(m_elite_models.value());
        }
        output_layer->set_elite(m_elite_models.value());
    }

    int64_t BNN::num_active_models() const {
        return m_elite_models.has_value() ? static_cast<int64_t>(m_elite_models->size()) : num_members();
    }

    void BNN::freeze_model() {
        m_freeze = true;
        for (auto &unit: m_bayesian_units) {
            unit->set_freeze(true);
        }
    }

    void BNN::unfreeze_model() {
        m_freeze = false;
        for (auto &unit: m_bayesian_units) {
            unit->set_freeze(false);
        }
    }

    bool BNN::is_frozen() const {
        return m_freeze;
    }

    const std::optional<std::vector<int64_t>> &BNN::elite_models() const {
        return m_elite_models;
    }

    const std::vector<nn::BayesianLinear> &BNN::bayesian_units() const {
        return m_bayesian_units;
    }

    void BNN::save(const std::string &save_dir) const {
        if (!fs::exists(save_dir)) {
            fs::create_directories(save_dir);
        }
        auto path = fs::path(save_dir) / MODEL_FNAME;
        torch::serialize::OutputArchive archive;
        torch::nn::Module::save(archive);
        std::vector<int64_t> elite = m_elite_models.value_or(std::vector<int64_t>());
        archive.write("ensemble_size", torch::tensor(num_members()));
        archive.write("has_elite_models", torch::tensor(static_cast<int64_t>(m_elite_models.has_value())));
        archive.write("elite_models", torch::tensor(elite, torch::kInt64));
        archive.save_to(path.string());
        spdlog::info("Saved BNN ensemble to {}", path.string());
    }

    std::optional<std::vector<int64_t>> BNN::read_elite_models(torch::serialize::InputArchive &archive) const {
        torch::Tensor has_elite_models;
        torch::Tensor elite_models;
        archive.read("has_elite_models", has_elite_models);
        archive.read("elite_models", elite_models);
        if (has_elite_models.item<int64_t>() == 0) {
            return std::nullopt;
        }
        auto elite_cpu = elite_models.to(torch::kCPU, torch::kInt64).contiguous();
        std::vector<int64_t> elite(elite_cpu.data_ptr<int64_t>(), elite_cpu.data_ptr<int64_t>() + elite_cpu.numel());
        if (static_cast<int64_t>(elite.size()) == num_members()) {
            throw ConfigurationError(fmt::format("Saved elite set {} covers every member", elite));
        }
        nn::check_elite_indices(elite, num_members());
        return elite;
    }

    void BNN::load(const std::string &load_dir) {
        auto path = fs::path(load_dir) / MODEL_FNAME;
        if (!fs::exists(path)) {
            throw std::runtime_error(fmt::format("No saved model at {}", path.string()));
        }
        torch::serialize::InputArchive archive;
        archive.load_from(path.string(), m_device);

        // everything is checked before the first parameter is overwritten
        torch::Tensor saved_ensemble_size;
        if (!archive.try_read("ensemble_size", saved_ensemble_size)) {
            throw ConfigurationError(fmt::format("{} does not record the ensemble size", path.string()));
        }
        if (saved_ensemble_size.item<int64_t>() != num_members()) {
            throw ConfigurationError(fmt::format("{} holds an ensemble of {} members, this model has {}",
                                                 path.string(), saved_ensemble_size.item<int64_t>(),
                                                 num_members()));
        }
        auto elite = read_elite_models(archive);

        auto params = parameters();
        std::vector<torch::Tensor> previous;
        previous.reserve(params.size());
        for (auto &param: params) {
            previous.push_back(param.detach().clone());
        }
        auto restore = [&params, &previous]() {
            torch::NoGradGuard no_grad;
            for (size_t i = 0; i < params.size(); i++) {
                params[i].set_(previous[i]);
            }
        };
        try {
            torch::nn::Module::load(archive);
        } catch (const c10::Error &e) {
            restore();
            throw ConfigurationError(fmt::format("Cannot load {}: {}", path.string(), e.what_without_backtrace()));
        }
        for (size_t i = 0; i < params.size(); i++) {
            if (params[i].sizes() != previous[i].sizes()) {
                auto message = fmt::format("{} does not match the architecture of this model: shape {} where {} "
                                           "is expected", path.string(), params[i].sizes().vec(),
                                           previous[i].sizes().vec());
                restore();
                throw ConfigurationError(message);
            }
        }

        m_elite_models = elite;
        apply_elite_to_layers();
        spdlog::info("Loaded BNN ensemble from {}", path.string());
    }
}
