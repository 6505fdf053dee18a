//
// Created by the bayesnet authors on 10/17/26.
//

#ifndef BAYESNET_TYPE_H
#define BAYESNET_TYPE_H

#include <torch/torch.h>
#include <string>
#include <unordered_map>
#include <utility>

namespace bayesnet {

    typedef std::unordered_map<std::string, torch::Tensor> str_to_tensor;
    // a loss or score tensor together with its (possibly empty) metadata
    typedef std::pair<torch::Tensor, str_to_tensor> tensor_with_info;

}

#endif //BAYESNET_TYPE_H
