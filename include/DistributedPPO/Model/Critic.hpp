#pragma once

#ifndef DISTRIBUTEDPPO_CRITIC_HPP
#define DISTRIBUTEDPPO_CRITIC_HPP

#include<torch/torch.h>

namespace DistributedPPO
{
    /**
     * @class CriticImpl
     * @brief State-value network V(s).
     *
     * Same two-hidden-layer body as the actor with a single linear output
     * (orthogonal gain 1).
     */
    class CriticImpl : public torch::nn::Module
    {
    private:
        torch::nn::Sequential body;
        int64_t numInputs;
        int64_t hiddenSize;

    public:
        CriticImpl(int64_t numInputs, int64_t hiddenSize = 64);

        /**
         * @brief Differentiable value estimate, shape [B, 1].
         */
        torch::Tensor forward(torch::Tensor x);

        /**
         * @brief Value estimate without gradient tracking, shape [B].
         */
        torch::Tensor evaluate(torch::Tensor x);

        inline int64_t getNumInputs() const { return numInputs; }
        inline int64_t getHiddenSize() const { return hiddenSize; }
    };
    TORCH_MODULE(Critic);
}

#endif //DISTRIBUTEDPPO_CRITIC_HPP
