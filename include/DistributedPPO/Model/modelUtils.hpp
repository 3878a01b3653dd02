#pragma once

#ifndef DISTRIBUTEDPPO_MODELUTILS_HPP
#define DISTRIBUTEDPPO_MODELUTILS_HPP

#include<string>

#include<torch/nn.h>

namespace DistributedPPO
{
    /**
     * @brief Initializes weights and biases of a set of parameters in place
     *
     * Weight tensors (names containing "weight") receive orthogonal
     * initialization scaled by `weightGain`; bias tensors (names containing
     * "bias") are filled with `biasGain`. Other parameters are left untouched.
     *
     * @param parameters Named parameters, typically `module->named_parameters()`
     * @param weightGain Gain of the orthogonal weight matrices. sqrt(2) for
     *                   ReLU hidden layers, small values for policy logits.
     * @param biasGain Constant assigned to every bias entry, usually 0.
     */
    void initWeights(const torch::OrderedDict<std::string, torch::Tensor> &parameters,
                     double weightGain,
                     double biasGain);

    /**
     * @brief Builds the two-hidden-layer ReLU perceptron shared by actor and critic
     *
     * Linear(numInputs, hiddenSize) -> ReLU -> Linear(hiddenSize, hiddenSize)
     * -> ReLU -> Linear(hiddenSize, numOutputs). Hidden layers are initialized
     * with gain sqrt(2), the output layer with `outputGain`.
     */
    torch::nn::Sequential makeMlp(int64_t numInputs,
                                  int64_t hiddenSize,
                                  int64_t numOutputs,
                                  double outputGain);
}

#endif //DISTRIBUTEDPPO_MODELUTILS_HPP
