#pragma once

#ifndef DISTRIBUTEDPPO_ACTOR_HPP
#define DISTRIBUTEDPPO_ACTOR_HPP

#include<vector>

#include<torch/torch.h>

#include"../Distribution/Categorical.hpp"

namespace DistributedPPO
{
    /**
     * @class ActorImpl
     * @brief Policy network mapping a state vector to a categorical distribution.
     *
     * Two hidden layers of `hiddenSize` ReLU units feed a linear layer of
     * `numActions` logits. The logits layer starts with a small orthogonal
     * gain (0.01) so the initial policy is close to uniform.
     *
     * @note Wrapped with TORCH_MODULE, pass `Actor` handles around by value.
     */
    class ActorImpl : public torch::nn::Module
    {
    private:
        torch::nn::Sequential body;
        int64_t numInputs;
        int64_t numActions;
        int64_t hiddenSize;

    public:
        ActorImpl(int64_t numInputs, int64_t numActions, int64_t hiddenSize = 64);

        /**
         * @brief Differentiable forward pass.
         *
         * @param x States, shape [B, numInputs] or [numInputs].
         * @return Distribution whose batch shape is the leading shape of `x`.
         */
        Categorical forward(torch::Tensor x);

        /**
         * @brief Same computation as forward() with gradient tracking disabled.
         */
        Categorical evaluate(torch::Tensor x);

        /**
         * @brief Samples actions from the current policy.
         *
         * @return {action (int64), logProbability (float)}, both with the batch
         *         shape of `x`. Neither tensor requires grad.
         */
        std::vector<torch::Tensor> act(torch::Tensor x);

        inline int64_t getNumInputs() const { return numInputs; }
        inline int64_t getNumActions() const { return numActions; }
        inline int64_t getHiddenSize() const { return hiddenSize; }
    };
    TORCH_MODULE(Actor);
}

#endif //DISTRIBUTEDPPO_ACTOR_HPP
