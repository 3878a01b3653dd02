#pragma once
/**
 * @file Worker.hpp
 * @brief Worker-level contract driven by the distributed trainer.
 */

#ifndef DISTRIBUTEDPPO_WORKER_HPP
#define DISTRIBUTEDPPO_WORKER_HPP

#include<memory>
#include<string>
#include<vector>

#include<torch/torch.h>

#include"../Algorithms/Algorithm.hpp"
#include"../Config.hpp"
#include"../Distributed/DistributedAdapter.hpp"
#include"../Environment/Environment.hpp"
#include"../Model/ModelContainer.hpp"
#include"../Storage.hpp"

namespace DistributedPPO
{
    /**
     * @class Worker
     * @brief Binds a model container to an environment
     *
     * Lifecycle: constructed -> ready -> (preprocess -> train)* -> saved.
     * Every call is synchronous and the worker expects one call at a time.
     * The device is chosen once at construction from TRAIN.USE_CUDA and CUDA
     * availability.
     */
    class Worker
    {
    private:
        UserConfig userConfig;
        SystemConfig systemConfig;
        torch::Device device;
        std::unique_ptr<ModelContainer> model;
        std::unique_ptr<Environment> environment;
        std::vector<float> currentState;
        bool needsReset;

    public:
        /**
         * @brief Validates the configuration and builds the model container.
         *
         * When no environment is injected and ENV.URL is set, a GymEnvironment
         * connected to that url is created.
         *
         * @throws std::invalid_argument on an invalid configuration
         * @throws std::runtime_error on a malformed checkpoint at `modelPath`
         */
        Worker(const std::string &modelPath,
               UserConfig userConfig,
               SystemConfig systemConfig,
               std::unique_ptr<Environment> environment = nullptr);

        /**
         * @brief Liveness probe, true once construction succeeded.
         */
        bool ready() const;

        /**
         * @brief Advantages and critic targets for `batch` under the current critic.
         */
        AdvantageOutput preprocess(const TrajectoryBatch &batch);

        /**
         * @brief Passes both networks through `adapter` and trains the returned
         *        handles from then on.
         */
        void prepareModel(DistributedAdapter &adapter);

        std::vector<UpdateDatum> train(const TrajectoryBatch &batch, const AdvantageOutput &preprocessed);

        void save(const std::string &path);

        /**
         * @brief Rolls the current policy for `numSteps` environment steps.
         *
         * Episodes continue across calls; a done step resets the environment
         * before the next one.
         *
         * @throws std::runtime_error without an environment
         * @throws std::invalid_argument if `numSteps` < 1
         */
        TrajectoryBatch collect(int64_t numSteps);

        inline ModelContainer &getModel() { return *model; }
        inline torch::Device getDevice() const { return device; }
    };
}

#endif //DISTRIBUTEDPPO_WORKER_HPP
