//
// Created by the bayesnet authors on 10/17/26.
//

#include "nn/stack_sequential.h"

namespace bayesnet::nn {
    torch::Tensor StackSequentialImpl::forward(torch::Tensor x) {
        return SequentialImpl::forward<torch::Tensor>(std::move(x));
    }
}
