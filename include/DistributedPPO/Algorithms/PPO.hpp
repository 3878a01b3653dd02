#pragma once
/**
 * @file PPO.hpp
 * @brief Proximal Policy Optimization update with separate actor and critic.
 */

#ifndef DISTRIBUTEDPPO_PPO_HPP
#define DISTRIBUTEDPPO_PPO_HPP

#include<string>
#include<vector>

#include<torch/torch.h>

#include"Algorithm.hpp"
#include"../Model/Actor.hpp"
#include"../Model/Critic.hpp"
#include"../Storage.hpp"

namespace DistributedPPO
{
    /**
     * @brief Loss graph of one PPO update, before any optimizer step.
     */
    struct PPOLosses
    {
        torch::Tensor actorLoss;   /**< -mean(min(ratio * A, clip(ratio) * A)) */
        torch::Tensor criticLoss;  /**< mse(V(s), tdTarget) */
        torch::Tensor ratio;       /**< [T] exp(log pi(a|s) - old log pi(a|s)), detached */
    };

    /**
     * @class PPO
     * @brief Clipped-surrogate policy update
     *
     * The probability ratio r = pi(a|s) / pi_old(a|s) is clipped to
     * [1 - clipParam, 1 + clipParam]. The pessimistic minimum of the clipped
     * and unclipped surrogate removes any incentive to move the ratio past
     * the band in the direction the advantage favours.
     *
     * Actor and critic are stepped by their own optimizers: each update runs
     * zero_grad, backward and step once per network on the whole batch. The
     * optimizers are owned elsewhere (see ModelContainer) and must outlive
     * this object.
     */
    class PPO : public Algorithms
    {
    private:
        Actor actor;
        Critic critic;
        torch::optim::Optimizer &actorOptimizer;
        torch::optim::Optimizer &criticOptimizer;
        float clipParam;

    public:
        /**
         * @param actor Policy network, stepped by `actorOptimizer`.
         * @param critic Value network, stepped by `criticOptimizer`.
         * @param clipParam Half-width of the ratio clip band (EPS_CLIP).
         */
        PPO(Actor actor,
            Critic critic,
            torch::optim::Optimizer &actorOptimizer,
            torch::optim::Optimizer &criticOptimizer,
            float clipParam);

        /**
         * @brief Builds the differentiable losses for `batch`.
         *
         * Parameters and gradients are left as they are.
         */
        PPOLosses computeLosses(const TrajectoryBatch &batch, const AdvantageOutput &advantages);

        /**
         * @brief One optimizer step per network.
         *
         * @return "loss" (actor + critic), "actor_loss", "critic_loss" and
         *         "clip_fraction" (share of ratios outside the clip band).
         * @throws std::runtime_error if either loss is not finite. No parameter
         *         is modified in that case.
         */
        std::vector<UpdateDatum> update(const TrajectoryBatch &batch,
                                        const AdvantageOutput &advantages) override;
    };
}

#endif //DISTRIBUTEDPPO_PPO_HPP
