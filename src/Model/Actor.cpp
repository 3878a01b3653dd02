#include<torch/torch.h>

#include"../../include/DistributedPPO/Model/Actor.hpp"
#include"../../include/DistributedPPO/Model/modelUtils.hpp"
#include<doctest/doctest.h>

namespace DistributedPPO
{
    ActorImpl::ActorImpl(int64_t numInputs, int64_t numActions, int64_t hiddenSize) :
        body(makeMlp(numInputs, hiddenSize, numActions, 0.01)),
        numInputs(numInputs),
        numActions(numActions),
        hiddenSize(hiddenSize)
    {
        register_module("body", body);
    }

    Categorical ActorImpl::forward(torch::Tensor x)
    {
        return Categorical::fromLogits(body->forward(x));
    }

    Categorical ActorImpl::evaluate(torch::Tensor x)
    {
        torch::NoGradGuard noGrad;
        return forward(x);
    }

    std::vector<torch::Tensor> ActorImpl::act(torch::Tensor x)
    {
        auto dist = evaluate(x);
        auto action = dist.sample();
        auto logProb = dist.logProbability(action);
        return {action, logProb};
    }

    TEST_CASE("Actor")
    {
        Actor actor(4, 3);

        SUBCASE("forward() gives one distribution per state")
        {
            auto dist = actor->forward(torch::rand({5, 4}));

            CHECK(dist.getProbabilities().sizes().vec() == std::vector<int64_t>{5, 3});
            CHECK(torch::allclose(dist.getProbabilities().sum(-1), torch::ones({5})));
        }

        SUBCASE("Initial policy is close to uniform")
        {
            auto probs = actor->forward(torch::rand({10, 4})).getProbabilities();
            CHECK(torch::allclose(probs, torch::full({10, 3}, 1.f / 3), 0, 0.05));
        }

        SUBCASE("forward() is differentiable")
        {
            auto dist = actor->forward(torch::rand({2, 4}));
            auto loss = dist.logProbability(torch::tensor({0, 1}, torch::kLong)).sum();
            CHECK(loss.requires_grad());
        }

        SUBCASE("evaluate() does not track gradients")
        {
            auto dist = actor->evaluate(torch::rand({2, 4}));
            CHECK(!dist.getLogits().requires_grad());
        }

        SUBCASE("act() returns actions in range with matching log-probabilities")
        {
            auto states = torch::rand({8, 4});
            auto result = actor->act(states);
            auto action = result[0];
            auto logProb = result[1];

            REQUIRE(action.sizes().vec() == std::vector<int64_t>{8});
            CHECK(logProb.sizes().vec() == std::vector<int64_t>{8});
            CHECK(action.scalar_type() == torch::kLong);
            CHECK(!(action < 0).any().item().toBool());
            CHECK(!(action > 2).any().item().toBool());

            auto expected = actor->evaluate(states).logProbability(action);
            CHECK(torch::allclose(logProb, expected));
        }

        SUBCASE("act() on a single state returns scalars")
        {
            auto result = actor->act(torch::rand({4}));
            CHECK(result[0].dim() == 0);
            CHECK(result[1].dim() == 0);
        }
    }
}
