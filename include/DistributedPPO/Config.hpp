#pragma once
/**
 * @file Config.hpp
 * @brief Hyperparameter records handed to a worker by the orchestrator.
 *
 * The orchestrator ships two records with every worker: the user
 * configuration (model and environment) and the system configuration
 * (training). Both travel as MessagePack maps; the wire keys are the
 * upper-case names used by the orchestrator, e.g. `MODEL.NUM_STATE`.
 * Keys absent from a map keep the defaults below.
 */

#ifndef DISTRIBUTEDPPO_CONFIG_HPP
#define DISTRIBUTEDPPO_CONFIG_HPP

#include<cmath>
#include<cstdint>
#include<stdexcept>
#include<string>

#include<msgpack.hpp>

namespace DistributedPPO
{
    /**
     * @brief Network shapes and PPO/GAE hyperparameters (`MODEL.*`).
     */
    struct ModelConfig
    {
        int64_t numState = 0;            ///< Dimensionality of a state vector
        int64_t numAction = 0;           ///< Number of discrete actions
        float gamma = 0.99f;             ///< Discount factor
        float gaeLambda = 0.95f;         ///< GAE trace decay
        float epsClip = 0.2f;            ///< PPO ratio clip band half-width
        float advantageEpsilon = 1e-8f;  ///< Floor added to the advantage standard deviation
        int64_t hiddenSize = 64;         ///< Width of both hidden layers

        void validate() const
        {
            if (numState < 1)
            {
                throw std::invalid_argument("MODEL.NUM_STATE must be >= 1");
            }
            if (numAction < 1)
            {
                throw std::invalid_argument("MODEL.NUM_ACTION must be >= 1");
            }
            if (!(gamma >= 0.f && gamma <= 1.f))
            {
                throw std::invalid_argument("MODEL.GAMMA must lie in [0, 1]");
            }
            if (!(gaeLambda >= 0.f && gaeLambda <= 1.f))
            {
                throw std::invalid_argument("MODEL.LAMBDA must lie in [0, 1]");
            }
            if (!(epsClip > 0.f && epsClip < 1.f))
            {
                throw std::invalid_argument("MODEL.EPS_CLIP must lie in (0, 1)");
            }
            if (!std::isfinite(advantageEpsilon) || advantageEpsilon <= 0.f)
            {
                throw std::invalid_argument("MODEL.ADVANTAGE_EPSILON must be finite and > 0");
            }
            if (hiddenSize < 1)
            {
                throw std::invalid_argument("MODEL.HIDDEN_SIZE must be >= 1");
            }
        }

        MSGPACK_DEFINE_MAP(MSGPACK_NVP("NUM_STATE", numState),
                           MSGPACK_NVP("NUM_ACTION", numAction),
                           MSGPACK_NVP("GAMMA", gamma),
                           MSGPACK_NVP("LAMBDA", gaeLambda),
                           MSGPACK_NVP("EPS_CLIP", epsClip),
                           MSGPACK_NVP("ADVANTAGE_EPSILON", advantageEpsilon),
                           MSGPACK_NVP("HIDDEN_SIZE", hiddenSize));
    };

    /**
     * @brief Where the worker's environment lives (`ENV.*`).
     *
     * An empty url means the worker is driven purely by batches pushed from
     * the orchestrator and has no environment of its own.
     */
    struct EnvironmentConfig
    {
        std::string name;  ///< Gym environment id passed to the server's `make`
        std::string url;   ///< ZeroMQ endpoint of the gym server, e.g. "tcp://127.0.0.1:10201"

        MSGPACK_DEFINE_MAP(MSGPACK_NVP("NAME", name),
                           MSGPACK_NVP("URL", url));
    };

    struct UserConfig
    {
        ModelConfig model;
        EnvironmentConfig environment;

        void validate() const
        {
            model.validate();
            if (!environment.url.empty() && environment.name.empty())
            {
                throw std::invalid_argument("ENV.NAME is required when ENV.URL is set");
            }
        }

        MSGPACK_DEFINE_MAP(MSGPACK_NVP("MODEL", model),
                           MSGPACK_NVP("ENV", environment));
    };

    /**
     * @brief Optimizer and placement settings (`TRAIN.*`).
     */
    struct TrainConfig
    {
        float learningRate = 3e-4f;  ///< Adam step size shared by actor and critic
        bool useCuda = true;         ///< Place the networks on CUDA when a device is available

        MSGPACK_DEFINE_MAP(MSGPACK_NVP("LEARNING_RATE", learningRate),
                           MSGPACK_NVP("USE_CUDA", useCuda));
    };

    struct SystemConfig
    {
        TrainConfig train;

        void validate() const
        {
            if (!std::isfinite(train.learningRate) || train.learningRate <= 0.f)
            {
                throw std::invalid_argument("TRAIN.LEARNING_RATE must be finite and > 0");
            }
        }

        MSGPACK_DEFINE_MAP(MSGPACK_NVP("TRAIN", train));
    };
}

#endif //DISTRIBUTEDPPO_CONFIG_HPP
