#include<stdexcept>

#include<fmt/format.h>
#include<torch/torch.h>

#include"../../include/DistributedPPO/Algorithms/AdvantageEstimator.hpp"
#include<doctest/doctest.h>

namespace DistributedPPO
{
    torch::Tensor computeGae(const torch::Tensor &rewards,
                             const torch::Tensor &dones,
                             const torch::Tensor &values,
                             const torch::Tensor &nextValues,
                             float gamma,
                             float gaeLambda)
    {
        const auto length = rewards.size(0);
        if (dones.size(0) != length || values.size(0) != length || nextValues.size(0) != length)
        {
            throw std::runtime_error(fmt::format(
                "GAE inputs are misaligned: rewards {}, dones {}, values {}, next values {}",
                length, dones.size(0), values.size(0), nextValues.size(0)));
        }

        // The recurrence is sequential, walk it on the CPU
        auto cpu = [](const torch::Tensor &tensor) {
            return tensor.detach().to(torch::kCPU, torch::kFloat).contiguous();
        };
        auto rewardsCpu = cpu(rewards);
        auto notDone = 1 - cpu(dones);
        auto valuesCpu = cpu(values);
        auto nextValuesCpu = cpu(nextValues);

        auto delta = rewardsCpu + gamma * nextValuesCpu * notDone - valuesCpu;
        auto advantages = torch::zeros({length});

        auto deltaAccessor = delta.accessor<float, 1>();
        auto notDoneAccessor = notDone.accessor<float, 1>();
        auto advantageAccessor = advantages.accessor<float, 1>();

        float gae = 0;
        for (int64_t step = length - 1; step >= 0; --step)
        {
            gae = deltaAccessor[step] + gamma * gaeLambda * notDoneAccessor[step] * gae;
            advantageAccessor[step] = gae;
        }

        return advantages.to(rewards.device());
    }

    torch::Tensor normalizeAdvantages(const torch::Tensor &advantages, float epsilon)
    {
        auto centered = advantages - advantages.mean();
        if (advantages.numel() < 2)
        {
            return centered;
        }
        return centered / (advantages.std(/*unbiased=*/false) + epsilon);
    }

    AdvantageEstimator::AdvantageEstimator(Critic critic, float gamma, float gaeLambda, float epsilon) :
        critic(std::move(critic)),
        gamma(gamma),
        gaeLambda(gaeLambda),
        epsilon(epsilon)
    {
    }

    AdvantageOutput AdvantageEstimator::estimate(const TrajectoryBatch &batch)
    {
        batch.check();

        auto values = critic->evaluate(batch.states);
        auto nextValues = critic->evaluate(batch.nextStates);

        auto advantage = normalizeAdvantages(
            computeGae(batch.rewards, batch.dones, values, nextValues, gamma, gaeLambda),
            epsilon);

        return {advantage, advantage + values};
    }

    TEST_CASE("computeGae()")
    {
        SUBCASE("Three step episode matches hand calculation")
        {
            auto rewards = torch::tensor({1.f, 1.f, 1.f});
            auto dones = torch::tensor({0.f, 0.f, 1.f});
            auto zeros = torch::zeros({3});

            auto advantages = computeGae(rewards, dones, zeros, zeros, 0.99f, 0.95f);

            CHECK(advantages[2].item().toDouble() == doctest::Approx(1.0));
            CHECK(advantages[1].item().toDouble() == doctest::Approx(1.9405).epsilon(1e-4));
            CHECK(advantages[0].item().toDouble() == doctest::Approx(2.8252).epsilon(1e-4));
        }

        SUBCASE("LAMBDA = 0 reduces to the one-step TD error")
        {
            auto rewards = torch::tensor({0.5f, -1.f, 2.f, 0.f});
            auto dones = torch::tensor({0.f, 1.f, 0.f, 0.f});
            auto values = torch::tensor({0.1f, 0.2f, 0.3f, 0.4f});
            auto nextValues = torch::tensor({0.2f, 0.f, 0.4f, 0.5f});

            auto advantages = computeGae(rewards, dones, values, nextValues, 0.9f, 0.f);
            auto delta = rewards + 0.9f * nextValues * (1 - dones) - values;

            CHECK(torch::allclose(advantages, delta));
        }

        SUBCASE("GAMMA = 0 reduces to reward minus value")
        {
            auto rewards = torch::tensor({0.5f, -1.f, 2.f});
            auto dones = torch::tensor({0.f, 0.f, 1.f});
            auto values = torch::tensor({0.1f, 0.2f, 0.3f});
            auto nextValues = torch::tensor({5.f, 5.f, 5.f});

            auto advantages = computeGae(rewards, dones, values, nextValues, 0.f, 0.95f);

            CHECK(torch::allclose(advantages, rewards - values));
        }

        SUBCASE("Done steps cut the accumulator")
        {
            auto rewards = torch::tensor({1.f, 1.f, 1.f, 1.f});
            auto dones = torch::tensor({0.f, 1.f, 0.f, 1.f});
            auto zeros = torch::zeros({4});

            auto advantages = computeGae(rewards, dones, zeros, zeros, 0.99f, 0.95f);

            CHECK(advantages[0].item().toDouble() == doctest::Approx(advantages[2].item().toDouble()));
            CHECK(advantages[1].item().toDouble() == doctest::Approx(1.0));
        }

        SUBCASE("Misaligned inputs throw")
        {
            CHECK_THROWS_AS(computeGae(torch::zeros({3}), torch::zeros({2}),
                                       torch::zeros({3}), torch::zeros({3}), 0.99f, 0.95f),
                            std::runtime_error);
        }
    }

    TEST_CASE("normalizeAdvantages()")
    {
        SUBCASE("Result has zero mean and unit population std")
        {
            auto advantages = normalizeAdvantages(torch::tensor({2.8252f, 1.9405f, 1.f}), 1e-8f);

            CHECK(advantages.mean().item().toDouble() == doctest::Approx(0).epsilon(1e-5));
            CHECK(advantages.std(false).item().toDouble() == doctest::Approx(1).epsilon(1e-4));
        }

        SUBCASE("Single sample is mean-centered to exactly zero")
        {
            auto advantages = normalizeAdvantages(torch::tensor({3.7f}), 1e-8f);

            REQUIRE(advantages.numel() == 1);
            CHECK(advantages[0].item().toFloat() == 0.f);
        }

        SUBCASE("Constant advantages stay finite")
        {
            auto advantages = normalizeAdvantages(torch::full({4}, 2.f), 1e-8f);
            CHECK(torch::isfinite(advantages).all().item().toBool());
        }
    }

    TEST_CASE("AdvantageEstimator")
    {
        Critic critic(2);
        AdvantageEstimator estimator(critic, 0.99f, 0.95f);

        TrajectoryBatch batch;
        batch.states = torch::rand({3, 2});
        batch.nextStates = torch::rand({3, 2});
        batch.actions = torch::zeros({3}, torch::kLong);
        batch.rewards = torch::tensor({1.f, 1.f, 1.f});
        batch.logProbs = torch::zeros({3});
        batch.dones = torch::tensor({0.f, 0.f, 1.f});

        SUBCASE("Targets equal advantage plus value")
        {
            auto output = estimator.estimate(batch);
            auto values = critic->evaluate(batch.states);

            CHECK(torch::allclose(output.tdTarget, output.advantage + values));
            CHECK(!output.advantage.requires_grad());
            CHECK(!output.tdTarget.requires_grad());
        }

        SUBCASE("Advantages are normalized")
        {
            auto output = estimator.estimate(batch);
            CHECK(output.advantage.mean().item().toDouble() == doctest::Approx(0).epsilon(1e-5));
            CHECK(output.advantage.std(false).item().toDouble() == doctest::Approx(1).epsilon(1e-4));
        }

        SUBCASE("Single transition gives zero advantage")
        {
            TrajectoryBatch single;
            single.states = batch.states.narrow(0, 0, 1);
            single.nextStates = batch.nextStates.narrow(0, 0, 1);
            single.actions = batch.actions.narrow(0, 0, 1);
            single.rewards = batch.rewards.narrow(0, 0, 1);
            single.logProbs = batch.logProbs.narrow(0, 0, 1);
            single.dones = batch.dones.narrow(0, 0, 1);

            auto output = estimator.estimate(single);
            CHECK(output.advantage[0].item().toFloat() == 0.f);
        }

        SUBCASE("Empty batch throws")
        {
            CHECK_THROWS_AS(estimator.estimate(TrajectoryBatch()), std::runtime_error);
        }
    }
}
