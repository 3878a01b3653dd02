#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../../include/DistributedPPO/Distributed/DistributedAdapter.hpp"
#include<doctest/doctest.h>

namespace DistributedPPO
{
    torch::Device selectDevice(bool useCuda)
    {
        if (useCuda && torch::cuda::is_available())
        {
            spdlog::info("Using CUDA device");
            return torch::kCUDA;
        }
        if (useCuda)
        {
            spdlog::warn("CUDA requested but not available, using CPU");
        }
        return torch::kCPU;
    }

    LocalAdapter::LocalAdapter(torch::Device device) : targetDevice(device)
    {
    }

    torch::Device LocalAdapter::device() const
    {
        return targetDevice;
    }

    Actor LocalAdapter::prepare(Actor actor)
    {
        actor->to(targetDevice);
        return actor;
    }

    Critic LocalAdapter::prepare(Critic critic)
    {
        critic->to(targetDevice);
        return critic;
    }

    TEST_CASE("LocalAdapter")
    {
        LocalAdapter adapter(torch::kCPU);

        SUBCASE("prepare() returns the same handles")
        {
            Actor actor(3, 2);
            Critic critic(3);

            CHECK(adapter.prepare(actor).ptr() == actor.ptr());
            CHECK(adapter.prepare(critic).ptr() == critic.ptr());
        }

        SUBCASE("Parameters end up on the adapter's device")
        {
            Critic critic(3);
            auto prepared = adapter.prepare(critic);
            for (const auto &parameter : prepared->parameters())
            {
                CHECK(parameter.device() == adapter.device());
            }
        }

        SUBCASE("selectDevice() falls back to the CPU")
        {
            CHECK(selectDevice(false) == torch::Device(torch::kCPU));
        }
    }
}
