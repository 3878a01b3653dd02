#pragma once
/**
 * @file Request.hpp
 * @brief MessagePack messages exchanged with the gym server and the orchestrator.
 *
 * Two protocols share the same envelope, a map `{method, param}`:
 * - the gym protocol (`make`, `info`, `reset`, `step`) spoken by
 *   GymEnvironment as a client of an external gym server;
 * - the worker protocol (`init`, `ready`, `preprocess`, `prepare_model`,
 *   `train`, `save`, `collect`, `shutdown`) served by WorkerServer. Worker
 *   replies are maps `{status, message, result}`.
 */

#ifndef DISTRIBUTEDPPO_REQUEST_HPP
#define DISTRIBUTEDPPO_REQUEST_HPP

#include<cstdint>
#include<map>
#include<memory>
#include<string>
#include<vector>

#include<msgpack.hpp>

#include"../Config.hpp"

namespace DistributedPPO
{
    /**
     * @brief Envelope of every request
     * @tparam T Operation-specific parameter type
     */
    template<class T>
    struct Request
    {
        std::string method;        ///< Operation name, e.g. "step" or "train"
        std::shared_ptr<T> param;  ///< Operation-specific parameters

        Request() = default;

        Request(const std::string &method, std::shared_ptr<T> param) : method(method), param(param)
        {
        }

        MSGPACK_DEFINE_MAP(method, param);
    };

    /**
     * @brief A request whose parameters are decoded later, once the method is known.
     *
     * `param` points into the zone of the object handle the header was
     * converted from; the handle must outlive it.
     */
    struct RequestHeader
    {
        std::string method;
        msgpack::object param;

        MSGPACK_DEFINE_MAP(method, param);
    };

    // Gym server protocol

    struct infoParam
    {
        int x = 0;
        MSGPACK_DEFINE_MAP(x);
    };

    struct makeParam
    {
        std::string envName;  ///< Gym id of the environment
        int numEnv = 1;       ///< Number of parallel copies the server should run
        MSGPACK_DEFINE_MAP(envName, numEnv);
    };

    struct resetParam
    {
        int x = 0;
        MSGPACK_DEFINE_MAP(x);
    };

    struct stepParam
    {
        std::vector<std::vector<float>> action;  ///< One action vector per environment copy
        bool render = false;
        MSGPACK_DEFINE_MAP(action, render);
    };

    /**
     * @brief Action and observation spaces reported by the gym server.
     */
    struct InfoResponse
    {
        std::string actionSpaceType;                 ///< "Discrete", "Box", ...
        std::vector<int64_t> actionSpaceShape;       ///< For "Discrete", the number of actions
        std::string observationSpaceType;
        std::vector<int64_t> observationSpaceShape;
        MSGPACK_DEFINE_MAP(actionSpaceType, actionSpaceShape, observationSpaceType, observationSpaceShape);
    };

    struct MakeResponse
    {
        std::string result;
        MSGPACK_DEFINE_MAP(result);
    };

    struct MlpResetResponse
    {
        std::vector<std::vector<float>> observation;  ///< [numEnv][numState]
        MSGPACK_DEFINE_MAP(observation);
    };

    struct MlpStepResponse
    {
        std::vector<std::vector<float>> observation;  ///< [numEnv][numState]
        std::vector<std::vector<float>> reward;       ///< [numEnv][1]
        std::vector<std::vector<bool>> done;          ///< [numEnv][1]
        std::vector<std::vector<float>> real_reward;  ///< [numEnv][1], reward before any server-side shaping
        MSGPACK_DEFINE_MAP(observation, reward, done, real_reward);
    };

    // Worker protocol

    /**
     * @brief Parameter of methods that take none.
     */
    struct EmptyParam
    {
        int x = 0;
        MSGPACK_DEFINE_MAP(x);
    };

    struct InitParam
    {
        std::string modelPath;
        UserConfig userConfig;
        SystemConfig systemConfig;
        MSGPACK_DEFINE_MAP(modelPath, userConfig, systemConfig);
    };

    /**
     * @brief Trajectory batch as nested lists, row t of every field belongs
     *        to the same transition.
     */
    struct BatchMessage
    {
        std::vector<std::vector<float>> states;
        std::vector<std::vector<float>> nextStates;
        std::vector<int64_t> actions;
        std::vector<float> rewards;
        std::vector<float> logProbs;
        std::vector<float> dones;
        MSGPACK_DEFINE_MAP(states, nextStates, actions, rewards, logProbs, dones);
    };

    struct AdvantageMessage
    {
        std::vector<float> advantage;
        std::vector<float> tdTarget;
        MSGPACK_DEFINE_MAP(advantage, tdTarget);
    };

    struct TrainParam
    {
        BatchMessage batch;
        AdvantageMessage preprocessed;
        MSGPACK_DEFINE_MAP(batch, preprocessed);
    };

    struct SaveParam
    {
        std::string path;
        MSGPACK_DEFINE_MAP(path);
    };

    struct CollectParam
    {
        int64_t numSteps = 0;
        MSGPACK_DEFINE_MAP(numSteps);
    };

    struct ReadyResult
    {
        bool ready = false;
        MSGPACK_DEFINE_MAP(ready);
    };

    using TrainResult = std::map<std::string, float>;

    /**
     * @brief Worker reply envelope
     * @tparam T Result type, msgpack::type::nil_t when there is none
     */
    template<class T>
    struct Reply
    {
        std::string status;   ///< "ok" or "error"
        std::string message;  ///< Error description, empty on success
        T result;
        MSGPACK_DEFINE_MAP(status, message, result);
    };

    /**
     * @brief Status part of a reply, decodable whatever the result type is.
     */
    struct ReplyStatus
    {
        std::string status;
        std::string message;
        MSGPACK_DEFINE_MAP(status, message);
    };
}

#endif //DISTRIBUTEDPPO_REQUEST_HPP
