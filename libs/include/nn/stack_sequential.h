//
// Created by the bayesnet authors on 10/17/26.
//

#ifndef BAYESNET_STACK_SEQUENTIAL_H
#define BAYESNET_STACK_SEQUENTIAL_H

#include <torch/torch.h>

namespace bayesnet::nn {

    // Sequential with a concrete Tensor -> Tensor forward so that it can be nested in another Sequential
    class StackSequentialImpl : public torch::nn::SequentialImpl {
    public:
        using SequentialImpl::SequentialImpl;

        torch::Tensor forward(torch::Tensor x);
    };

    TORCH_MODULE(StackSequential);

}

#endif //BAYESNET_STACK_SEQUENTIAL_H
