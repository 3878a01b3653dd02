#pragma once

#ifndef DISTRIBUTEDPPO_ENVIRONMENT_HPP
#define DISTRIBUTEDPPO_ENVIRONMENT_HPP

#include<cstdint>
#include<vector>

namespace DistributedPPO
{
    struct StepResult
    {
        std::vector<float> observation;
        float reward = 0.f;
        bool done = false;
    };

    /**
     * @class Environment
     * @brief A single episodic environment with a discrete action space
     *
     * States are flat float vectors of the configured state size; actions are
     * indices in [0, numAction).
     */
    class Environment
    {
    public:
        virtual ~Environment() = 0;

        /**
         * @brief Starts a new episode and returns its first state.
         */
        virtual std::vector<float> reset() = 0;

        virtual StepResult step(int64_t action) = 0;
    };
    inline Environment::~Environment() {}
}

#endif //DISTRIBUTEDPPO_ENVIRONMENT_HPP
