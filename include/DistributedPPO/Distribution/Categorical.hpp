#pragma once

#ifndef DISTRIBUTEDPPO_CATEGORICAL_HPP
#define DISTRIBUTEDPPO_CATEGORICAL_HPP

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>

#include"Distribution.hpp"

namespace DistributedPPO
{
    /**
    * @class Categorical
    * @brief Categorical distribution over `numEvents` discrete actions.
    *
    * The last dimension of the parameter tensor indexes events; all leading
    * dimensions form the batch. The policy network builds it from logits, the
    * probability constructor exists for tests and for hand-written policies.
    *
    * Log-probabilities are taken from the normalized logits, so gradients flow
    * back into whatever produced the logits.
    */
    class Categorical : public Distribution
    {
    private:
        torch::Tensor logits;  ///< Normalized log-probabilities, logsumexp over events is 0
        torch::Tensor probs;   ///< softmax(logits)
        int64_t numEvents;

        Categorical(torch::Tensor logits, torch::Tensor probs);

    public:
        /**
         * @brief Builds the distribution from unnormalized log-probabilities.
         *
         * @throws std::runtime_error if `logits` is undefined or 0-dimensional.
         */
        static Categorical fromLogits(const torch::Tensor &logits);

        /**
         * @brief Builds the distribution from (possibly unnormalized) probabilities.
         *
         * Probabilities are renormalized over the last dimension and clamped away
         * from 0 and 1 before taking the logarithm.
         *
         * @throws std::runtime_error if `probs` is undefined or 0-dimensional.
         */
        static Categorical fromProbabilities(const torch::Tensor &probs);

        torch::Tensor entropy() const override;

        /**
         * @brief Log-probability of the action indices in `value`.
         *
         * `value` is broadcast against the batch shape, so a [T] tensor of
         * actions scores a [T, numEvents] batch row by row.
         */
        torch::Tensor logProbability(torch::Tensor value) const override;

        torch::Tensor sample(c10::ArrayRef<int64_t> sampleShape = {}) const override;

        inline torch::Tensor getLogits() const { return logits; }
        inline torch::Tensor getProbabilities() const { return probs; }
        inline int64_t getNumEvents() const { return numEvents; }
    };
}

#endif //DISTRIBUTEDPPO_CATEGORICAL_HPP
