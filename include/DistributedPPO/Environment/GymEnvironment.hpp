#pragma once

#ifndef DISTRIBUTEDPPO_GYMENVIRONMENT_HPP
#define DISTRIBUTEDPPO_GYMENVIRONMENT_HPP

#include<cstdint>
#include<memory>
#include<string>
#include<vector>

#include"Environment.hpp"
#include"../Communication/Communication.hpp"
#include"../Config.hpp"

namespace DistributedPPO
{
    /**
     * @class GymEnvironment
     * @brief Client of an external gym server driving one environment copy
     *
     * On construction the server is asked to `make` the environment and its
     * `info` is checked against the model configuration: the observation
     * space must be a flat vector of NUM_STATE entries and the action space
     * Discrete with NUM_ACTION actions.
     *
     * Every call throws std::runtime_error when the server does not answer
     * within the communicator timeout or answers something undecodable.
     */
    class GymEnvironment : public Environment
    {
    private:
        std::unique_ptr<Communicator> communicator;
        int64_t numState;
        int64_t numAction;

        template<typename T>
        std::unique_ptr<T> expectResponse(const char *method);

        std::vector<float> checkObservation(const std::vector<std::vector<float>> &observation) const;

    public:
        /**
         * @brief Connects to `environment.url` and creates `environment.name`.
         */
        GymEnvironment(const EnvironmentConfig &environment, const ModelConfig &model);

        /**
         * @brief Uses an already connected communicator.
         */
        GymEnvironment(std::unique_ptr<Communicator> communicator,
                       const std::string &name,
                       const ModelConfig &model);

        std::vector<float> reset() override;

        StepResult step(int64_t action) override;
    };
}

#endif //DISTRIBUTEDPPO_GYMENVIRONMENT_HPP
