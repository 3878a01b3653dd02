#pragma once

#ifndef DISTRIBUTEDPPO_DISTRIBUTEDADAPTER_HPP
#define DISTRIBUTEDPPO_DISTRIBUTEDADAPTER_HPP

#include<torch/torch.h>

#include"../Model/Actor.hpp"
#include"../Model/Critic.hpp"

namespace DistributedPPO
{
    /**
     * @brief Picks CUDA when requested and available, the CPU otherwise.
     */
    torch::Device selectDevice(bool useCuda);

    /**
     * @class DistributedAdapter
     * @brief Hook through which the execution layer wraps networks for
     *        distributed training
     *
     * prepare() receives a network handle and returns the handle the worker
     * should train from then on. Implementations may return the same handle
     * (after moving it) or a different module that shares or mirrors its
     * parameters.
     */
    class DistributedAdapter
    {
    public:
        virtual ~DistributedAdapter() = 0;

        virtual torch::Device device() const = 0;

        virtual Actor prepare(Actor actor) = 0;

        virtual Critic prepare(Critic critic) = 0;
    };
    inline DistributedAdapter::~DistributedAdapter() {}

    /**
     * @brief Single-process adapter: moves networks to its device and hands
     *        them back unchanged.
     */
    class LocalAdapter : public DistributedAdapter
    {
    private:
        torch::Device targetDevice;

    public:
        explicit LocalAdapter(torch::Device device);

        torch::Device device() const override;

        Actor prepare(Actor actor) override;

        Critic prepare(Critic critic) override;
    };
}

#endif //DISTRIBUTEDPPO_DISTRIBUTEDADAPTER_HPP
