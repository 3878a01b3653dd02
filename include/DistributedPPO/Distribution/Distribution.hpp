#pragma once

#ifndef DISTRIBUTEDPPO_DISTRIBUTION_HPP
#define DISTRIBUTEDPPO_DISTRIBUTION_HPP

#include<vector>

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>

namespace DistributedPPO
{
    /**
     * @class Distribution
     * @brief Abstract base class for action distributions produced by a policy.
     *
     * Subclasses hold the parameters of a batch of distributions and offer the
     * three operations PPO needs: drawing actions, scoring actions that were
     * drawn earlier, and measuring spread.
     *
     * @see Categorical
     */
    class Distribution
    {
    protected:
        std::vector<int64_t> batchShape;  ///< Shape of the batch dimension(s)
        std::vector<int64_t> eventShape;  ///< Shape of a single event

        /**
         * @brief Concatenates sample, batch and event shapes.
         *
         * @param sampleShape Leading shape requested by the caller of sample()
         * @return The shape of a tensor of samples
         */
        std::vector<int64_t> extendedShape(c10::ArrayRef<int64_t> sampleShape) const;

    public:
        virtual ~Distribution() = 0;

        /**
         * @brief Entropy of every distribution in the batch, in nats.
         */
        virtual torch::Tensor entropy() const = 0;

        /**
         * @brief Log-probability of `value` under every distribution in the batch.
         */
        virtual torch::Tensor logProbability(torch::Tensor value) const = 0;

        /**
         * @brief Draws samples with shape [sampleShape, batchShape, eventShape].
         */
        virtual torch::Tensor sample(c10::ArrayRef<int64_t> sampleShape = {}) const = 0;
    };

    inline Distribution::~Distribution() {}
}

#endif //DISTRIBUTEDPPO_DISTRIBUTION_HPP
