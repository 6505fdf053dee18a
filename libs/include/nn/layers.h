//
// Created by the bayesnet authors on 10/17/26.
//

#ifndef BAYESNET_LAYERS_H
#define BAYESNET_LAYERS_H

#include "nn/activation.h"
#include "nn/bayesian_linear.h"
#include "nn/linear.h"
#include "nn/stack_sequential.h"

#endif //BAYESNET_LAYERS_H
