#pragma once
/**
 * @file ModelContainer.hpp
 * @brief Ownership of the actor/critic pair, their optimizers and checkpoints.
 */

#ifndef DISTRIBUTEDPPO_MODELCONTAINER_HPP
#define DISTRIBUTEDPPO_MODELCONTAINER_HPP

#include<memory>
#include<string>
#include<vector>

#include<torch/torch.h>

#include"Actor.hpp"
#include"Critic.hpp"
#include"../Algorithms/Algorithm.hpp"
#include"../Config.hpp"
#include"../Storage.hpp"

namespace DistributedPPO
{
    /**
     * @brief The closed set of networks a container holds.
     */
    enum class NetworkRole
    {
        Actor,
        Critic
    };

    /**
     * @brief Checkpoint key of a role: "actor" or "critic".
     */
    const char *toString(NetworkRole role);

    /**
     * @brief Tagged pair of network handles.
     *
     * Handles share ownership with the container; modifying the module behind
     * a handle modifies the container's network.
     */
    struct Networks
    {
        Actor actor{nullptr};
        Critic critic{nullptr};
    };

    /**
     * @class ModelContainer
     * @brief Owns both networks and one Adam optimizer per network
     *
     * The container is the only place where network parameters change:
     * through train(), load() or by binding replacement handles. A checkpoint
     * is a LibTorch archive holding exactly two nested archives, "actor" and
     * "critic".
     */
    class ModelContainer
    {
    private:
        ModelConfig config;
        float learningRate;
        torch::Device device;
        Networks networks;
        std::unique_ptr<torch::optim::Adam> actorOptimizer;
        std::unique_ptr<torch::optim::Adam> criticOptimizer;

    public:
        /**
         * @brief Builds the networks on `device`, loads `modelPath` when it
         *        exists and creates the optimizers.
         *
         * @throws std::runtime_error if `modelPath` exists but is malformed.
         */
        ModelContainer(const std::string &modelPath,
                       float learningRate,
                       ModelConfig config,
                       torch::Device device);

        Networks get() const;

        /**
         * @brief Replaces the active handles.
         *
         * The optimizer of every handle whose identity changed is rebuilt for
         * the new parameters. Nothing changes if a handle is null.
         *
         * @throws std::invalid_argument if either handle is null.
         */
        void bind(Networks replacement);

        /**
         * @brief Writes both networks to `path`, overwriting it.
         */
        void save(const std::string &path) const;

        /**
         * @brief Replaces the parameters with the checkpoint at `path`
         *
         * A missing file only logs a warning. Otherwise the checkpoint must
         * hold exactly the keys "actor" and "critic" and every parameter of
         * both networks with matching shapes.
         *
         * @throws std::runtime_error on a malformed checkpoint. Parameters are
         *         left untouched in that case.
         */
        void load(const std::string &path);

        /**
         * @brief Samples actions for `state` without tracking gradients.
         *
         * @return {action, logProbability}
         */
        std::vector<torch::Tensor> act(const torch::Tensor &state);

        AdvantageOutput preprocess(const TrajectoryBatch &batch);

        std::vector<UpdateDatum> train(const TrajectoryBatch &batch, const AdvantageOutput &advantages);

        inline torch::Device getDevice() const { return device; }
        inline const ModelConfig &getConfig() const { return config; }
    };
}

#endif //DISTRIBUTEDPPO_MODELCONTAINER_HPP
