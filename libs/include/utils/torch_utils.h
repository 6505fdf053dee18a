//
// Created by the bayesnet authors on 10/17/26.
//

#ifndef BAYESNET_TORCH_UTILS_H
#define BAYESNET_TORCH_UTILS_H

#include <torch/torch.h>
#include <string>

namespace bayesnet::ptu {
    // "cpu", "gpu"/"cuda" (CPU fallback when CUDA is missing) or "cuda:N"
    torch::Device get_torch_device(const std::string &device_name);
}

#endif //BAYESNET_TORCH_UTILS_H
