#include<torch/torch.h>

#include"../../include/DistributedPPO/Model/Critic.hpp"
#include"../../include/DistributedPPO/Model/modelUtils.hpp"
#include<doctest/doctest.h>

namespace DistributedPPO
{
    CriticImpl::CriticImpl(int64_t numInputs, int64_t hiddenSize) :
        body(makeMlp(numInputs, hiddenSize, 1, 1)),
        numInputs(numInputs),
        hiddenSize(hiddenSize)
    {
        register_module("body", body);
    }

    torch::Tensor CriticImpl::forward(torch::Tensor x)
    {
        return body->forward(x);
    }

    torch::Tensor CriticImpl::evaluate(torch::Tensor x)
    {
        torch::NoGradGuard noGrad;
        return forward(x).squeeze(-1);
    }

    TEST_CASE("Critic")
    {
        Critic critic(6);
        auto states = torch::rand({5, 6});

        SUBCASE("forward() output is [B, 1]")
        {
            auto values = critic->forward(states);
            CHECK(values.sizes().vec() == std::vector<int64_t>{5, 1});
            CHECK(values.requires_grad());
        }

        SUBCASE("evaluate() output is [B] and detached")
        {
            auto values = critic->evaluate(states);
            CHECK(values.sizes().vec() == std::vector<int64_t>{5});
            CHECK(!values.requires_grad());
            CHECK(torch::allclose(values, critic->forward(states).squeeze(-1).detach()));
        }

        SUBCASE("Hidden size is configurable")
        {
            Critic wide(6, 32);
            CHECK(wide->getHiddenSize() == 32);
            CHECK(wide->named_parameters()["body.0.weight"].size(0) == 32);
        }
    }
}
