#pragma once
/**
 * @file Storage.hpp
 * @brief Transition records and the tensor batches built from them.
 */

#ifndef DISTRIBUTEDPPO_STORAGE_HPP
#define DISTRIBUTEDPPO_STORAGE_HPP

#include<cstdint>
#include<vector>

#include<torch/torch.h>

namespace DistributedPPO
{
    /**
     * @brief A single environment step as produced by the environment collaborator.
     */
    struct Transition
    {
        std::vector<float> state;
        int64_t action = 0;
        float reward = 0.f;
        std::vector<float> nextState;
        bool done = false;
        float logProb = 0.f;  ///< Log-probability of `action` under the behavior policy
    };

    /**
     * @brief Ordered rollout stored as index-aligned tensors.
     *
     * Row t of every tensor belongs to the same transition. The order is the
     * order of collection; GAE walks it backwards, so it must not be shuffled
     * before preprocessing.
     */
    struct TrajectoryBatch
    {
        torch::Tensor states;      /**< [T, numState] float */
        torch::Tensor nextStates;  /**< [T, numState] float */
        torch::Tensor actions;     /**< [T] int64 */
        torch::Tensor rewards;     /**< [T] float */
        torch::Tensor logProbs;    /**< [T] float, behavior-policy log-probabilities */
        torch::Tensor dones;       /**< [T] float, 1 marks the last step of an episode */

        /**
         * @brief Number of transitions T.
         */
        int64_t size() const;

        /**
         * @brief Throws std::runtime_error unless all tensors are defined,
         *        non-empty and share the leading dimension.
         */
        void check() const;

        TrajectoryBatch to(torch::Device device) const;
    };

    /**
     * @brief Output of the advantage estimator, index-aligned with the batch.
     */
    struct AdvantageOutput
    {
        torch::Tensor advantage;  /**< [T] normalized GAE advantages */
        torch::Tensor tdTarget;   /**< [T] regression target for the critic */

        AdvantageOutput to(torch::Device device) const;
    };

    /**
     * @brief Accumulates transitions during collection
     *
     * `TrajectoryStorage` keeps transitions in insertion order and turns them
     * into a `TrajectoryBatch` on the requested device. State vectors are
     * checked against the configured state size on insert so that a bad
     * environment reply fails at the step that produced it.
     */
    class TrajectoryStorage
    {
    private:
        std::vector<Transition> transitions;
        int64_t numState;

    public:
        explicit TrajectoryStorage(int64_t numState);

        /**
         * @brief Appends a transition.
         *
         * @throws std::runtime_error if `state` or `nextState` does not have
         *         `numState` entries.
         */
        void insert(Transition transition);

        /**
         * @brief Builds the tensor batch.
         *
         * @throws std::runtime_error if the storage is empty.
         */
        TrajectoryBatch toBatch(torch::Device device) const;

        inline int64_t size() const
        {
            return static_cast<int64_t>(transitions.size());
        }

        inline void clear()
        {
            transitions.clear();
        }
    };
}

#endif //DISTRIBUTEDPPO_STORAGE_HPP
