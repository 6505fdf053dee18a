//
// Created by the bayesnet authors on 10/17/26.
//

#include "nn/linear.h"
#include "exception.h"
#include "fmt/format.h"
#include "fmt/ranges.h"

#include <numeric>
#include <set>

namespace bayesnet::nn {

    void check_elite_indices(const std::vector<int64_t> &elite_models, int64_t num_ensembles) {
        if (elite_models.empty()) {
            throw ConfigurationError("The elite set must contain at least one model");
        }
        std::set<int64_t> seen;
        for (auto &idx: elite_models) {
            if (idx < 0 || idx >= num_ensembles) {
                throw ConfigurationError(fmt::format("Elite index {} out of range for an ensemble of size {}",
                                                     idx, num_ensembles));
            }
            if (!seen.insert(idx).second) {
                throw ConfigurationError(fmt::format("Duplicated elite index {} in {}", idx, elite_models));
            }
        }
    }

    EnsembleLinearImpl::EnsembleLinearImpl(int64_t num_ensembles, int64_t in_features, int64_t out_features,
                                           bool use_bias) :
            m_use_only_elite(false),
            in_features(in_features),
            out_features(out_features),
            num_ensembles_(num_ensembles),
            use_bias(use_bias) {
        if (num_ensembles < 1) {
            throw ConfigurationError(fmt::format("Ensemble size must be at least 1. Got {}", num_ensembles));
        }
        reset();
    }

    void EnsembleLinearImpl::reset() {
        members = register_module("members", torch::nn::ModuleList());
        m_units.clear();
        for (int64_t i = 0; i < num_ensembles_; i++) {
            auto unit = BayesianLinear(BayesianLinearOptions(in_features, out_features).bias(use_bias));
            members->push_back(unit);
            m_units.push_back(unit);
        }
    }

    torch::Tensor EnsembleLinearImpl::forward(const torch::Tensor &x) {
        auto active = active_members();
        auto num_active = static_cast<int64_t>(active.size());
        std::vector<torch::Tensor> outputs;
        outputs.reserve(active.size());
        if (x.dim() == 2) {
            for (auto &idx: active) {
                outputs.push_back(m_units.at(idx)->forward(x));
            }
        } else if (x.dim() == 3) {
            if (x.size(0) != 1 && x.size(0) != num_active) {
                throw ShapeError(fmt::format("Leading dimension {} of the input does not match the {} active models",
                                             x.size(0), num_active));
            }
            for (int64_t i = 0; i < num_active; i++) {
                auto slice = x.size(0) == 1 ? x[0] : x[i];
                outputs.push_back(m_units.at(active[i])->forward(slice));
            }
        } else {
            throw ShapeError(fmt::format("EnsembleLinear expects an input of rank 2 or 3. Got rank {}", x.dim()));
        }
        return torch::stack(outputs, 0);
    }

    void EnsembleLinearImpl::set_elite(const std::vector<int64_t> &elite_models) {
        check_elite_indices(elite_models, num_ensembles_);
        m_elite_models = elite_models;
    }

    void EnsembleLinearImpl::toggle_use_only_elite() {
        m_use_only_elite = !m_use_only_elite;
    }

    bool EnsembleLinearImpl::use_only_elite() const {
        return m_use_only_elite;
    }

    const std::vector<int64_t> &EnsembleLinearImpl::elite_models() const {
        return m_elite_models;
    }

    std::vector<int64_t> EnsembleLinearImpl::active_members() const {
        if (m_use_only_elite && !m_elite_models.empty()) {
            return m_elite_models;
        }
        std::vector<int64_t> all(num_ensembles_);
        std::iota(all.begin(), all.end(), 0);
        return all;
    }

    const std::vector<BayesianLinear> &EnsembleLinearImpl::units() const {
        return m_units;
    }

    int64_t EnsembleLinearImpl::num_ensembles() const {
        return num_ensembles_;
    }

    void EnsembleLinearImpl::pretty_print(std::ostream &stream) const {
        stream << "bayesnet::nn::EnsembleLinear(num_ensembles=" << num_ensembles_
               << ", in_features=" << in_features
               << ", out_features=" << out_features << ")";
    }

}
