#pragma once
/**
 * @file WorkerServer.hpp
 * @brief Remote-call front end of a Worker.
 */

#ifndef DISTRIBUTEDPPO_WORKERSERVER_HPP
#define DISTRIBUTEDPPO_WORKERSERVER_HPP

#include<memory>
#include<string>

#include<msgpack.hpp>
#include<torch/torch.h>

#include"Worker.hpp"
#include"../Communication/Communication.hpp"
#include"../Communication/Request.hpp"
#include"../Distributed/DistributedAdapter.hpp"
#include"../Storage.hpp"

namespace DistributedPPO
{
    /**
     * @brief Converts a wire batch into tensors on `device`.
     *
     * @throws std::runtime_error on ragged rows or fields of different lengths
     */
    TrajectoryBatch toTrajectoryBatch(const BatchMessage &message, torch::Device device);

    BatchMessage toBatchMessage(const TrajectoryBatch &batch);

    /**
     * @throws std::runtime_error if the two fields differ in length
     */
    AdvantageOutput toAdvantageOutput(const AdvantageMessage &message, torch::Device device);

    AdvantageMessage toAdvantageMessage(const AdvantageOutput &advantages);

    /**
     * @class WorkerServer
     * @brief Serves the worker contract over MessagePack requests
     *
     * A request is a map `{method, param}`; the reply is a map
     * `{status, message, result}` with status "ok" or "error". Failures of a
     * worker operation become error replies and the server keeps serving.
     * Every method except `init` and `shutdown` requires a prior `init`.
     */
    class WorkerServer
    {
    private:
        std::unique_ptr<Worker> worker;
        std::unique_ptr<DistributedAdapter> adapter;
        bool running;

        std::string dispatch(const std::string &method, const msgpack::object &param);

        Worker &requireWorker(const std::string &method);

    public:
        /**
         * @param adapter Adapter used by `prepare_model`. When null a
         *                LocalAdapter on the worker's device is used.
         */
        explicit WorkerServer(std::unique_ptr<DistributedAdapter> adapter = nullptr);

        /**
         * @brief Handles one encoded request and returns the encoded reply.
         */
        std::string handle(const std::string &payload);

        /**
         * @brief Receive, handle, reply until a `shutdown` request is handled.
         */
        void serve(Communicator &communicator);

        inline bool isRunning() const { return running; }
    };
}

#endif //DISTRIBUTEDPPO_WORKERSERVER_HPP
