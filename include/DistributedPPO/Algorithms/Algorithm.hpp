#pragma once

#ifndef DISTRIBUTEDPPO_ALGORITHM_HPP
#define DISTRIBUTEDPPO_ALGORITHM_HPP

#include<string>
#include<vector>

#include"../Storage.hpp"

namespace DistributedPPO
{
    /**
     * @brief A named scalar produced by a training update
     *
     * Updates return a list of these (losses, clip fraction) so that callers
     * can log or forward them without knowing the algorithm.
     */
    struct UpdateDatum
    {
        std::string name;  /**< Metric identifier, e.g. "actor_loss" */
        float value;
    };

    /**
     * @brief Abstract base class for on-policy update rules
     *
     * An algorithm consumes one ordered trajectory batch together with the
     * advantages computed for it and applies gradient steps to the networks it
     * was built with.
     */
    class Algorithms
    {
    public:
        virtual ~Algorithms() = 0;

        /**
         * @brief Performs one training update.
         *
         * @param batch Trajectory the advantages were computed from.
         * @param advantages Output of the advantage estimator for `batch`.
         * @return Training metrics for this update.
         */
        virtual std::vector<UpdateDatum> update(const TrajectoryBatch &batch,
                                                const AdvantageOutput &advantages) = 0;
    };
    inline Algorithms::~Algorithms() {}
}

#endif //DISTRIBUTEDPPO_ALGORITHM_HPP
