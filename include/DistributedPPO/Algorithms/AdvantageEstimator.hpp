#pragma once
/**
 * @file AdvantageEstimator.hpp
 * @brief Generalized Advantage Estimation over a single ordered trajectory.
 */

#ifndef DISTRIBUTEDPPO_ADVANTAGEESTIMATOR_HPP
#define DISTRIBUTEDPPO_ADVANTAGEESTIMATOR_HPP

#include<torch/torch.h>

#include"../Model/Critic.hpp"
#include"../Storage.hpp"

namespace DistributedPPO
{
    /**
     * @brief Raw GAE advantages.
     *
     * For t = T-1 down to 0:
     *   delta[t] = r[t] + gamma * V(s'[t]) * (1 - d[t]) - V(s[t])
     *   gae      = delta[t] + gamma * lambda * (1 - d[t]) * gae
     *
     * The accumulator is cut at every done step, so a batch may hold several
     * consecutive episodes.
     *
     * @param rewards [T]
     * @param dones [T], 1 on terminal steps
     * @param values [T], V(states)
     * @param nextValues [T], V(nextStates)
     * @return [T] float tensor on the device of `rewards`
     */
    torch::Tensor computeGae(const torch::Tensor &rewards,
                             const torch::Tensor &dones,
                             const torch::Tensor &values,
                             const torch::Tensor &nextValues,
                             float gamma,
                             float gaeLambda);

    /**
     * @brief Standardizes advantages to zero mean and unit population std.
     *
     * With a single element there is no spread to scale by, so the result is
     * only mean-centered (and therefore exactly zero).
     */
    torch::Tensor normalizeAdvantages(const torch::Tensor &advantages, float epsilon);

    /**
     * @brief Turns a trajectory batch into advantages and critic targets
     *
     * The critic is only read here (through Critic::evaluate), so estimating
     * advantages never leaves state in the autograd graph or the optimizers.
     */
    class AdvantageEstimator
    {
    private:
        Critic critic;
        float gamma;
        float gaeLambda;
        float epsilon;

    public:
        AdvantageEstimator(Critic critic, float gamma, float gaeLambda, float epsilon = 1e-8f);

        /**
         * @brief Normalized advantages and `tdTarget = advantage + V(state)`.
         *
         * @throws std::runtime_error if the batch is empty or misaligned.
         */
        AdvantageOutput estimate(const TrajectoryBatch &batch);
    };
}

#endif //DISTRIBUTEDPPO_ADVANTAGEESTIMATOR_HPP
