//
// Created by the bayesnet authors on 10/17/26.
//

#include "models/ensemble.h"
#include "exception.h"
#include "fmt/format.h"

namespace bayesnet::models {

    Ensemble::Ensemble(int64_t ensemble_size, torch::Device device, PropagationMethod propagation_method,
                       bool deterministic) :
            m_ensemble_size(ensemble_size),
            m_device(device),
            m_propagation_method(propagation_method),
            m_deterministic(deterministic) {
        if (ensemble_size < 1) {
            throw ConfigurationError(fmt::format("Ensemble size must be at least 1. Got {}", ensemble_size));
        }
    }

    int64_t Ensemble::num_members() const {
        return m_ensemble_size;
    }

    torch::Device Ensemble::device() const {
        return m_device;
    }

    PropagationMethod Ensemble::propagation_method() const {
        return m_propagation_method;
    }

    bool Ensemble::is_deterministic() const {
        return m_deterministic;
    }
}
