#include<stdexcept>
#include<vector>

#include<fmt/format.h>
#include<torch/torch.h>

#include"../include/DistributedPPO/Storage.hpp"
#include<doctest/doctest.h>

namespace DistributedPPO
{
    int64_t TrajectoryBatch::size() const
    {
        return rewards.defined() ? rewards.size(0) : 0;
    }

    /**
     * @brief Validates the batch invariants.
     *
     * @details Every tensor must be defined, the batch must hold at least one
     * transition, and all tensors must agree on T. States and next states must
     * also agree on the state width.
     */
    void TrajectoryBatch::check() const
    {
        if (!states.defined() || !nextStates.defined() || !actions.defined() ||
            !rewards.defined() || !logProbs.defined() || !dones.defined())
        {
            throw std::runtime_error("Trajectory batch has undefined tensors");
        }
        if (states.dim() != 2 || nextStates.dim() != 2)
        {
            throw std::runtime_error("Trajectory batch states must be [T, numState]");
        }
        auto length = rewards.size(0);
        if (length < 1)
        {
            throw std::runtime_error("Trajectory batch must contain at least one transition");
        }
        if (states.size(0) != length || nextStates.size(0) != length ||
            actions.size(0) != length || logProbs.size(0) != length ||
            dones.size(0) != length)
        {
            throw std::runtime_error(fmt::format(
                "Trajectory batch tensors disagree on length: states {}, next states {}, actions {}, "
                "rewards {}, log probs {}, dones {}",
                states.size(0), nextStates.size(0), actions.size(0), length,
                logProbs.size(0), dones.size(0)));
        }
        if (states.size(1) != nextStates.size(1))
        {
            throw std::runtime_error("States and next states have different widths");
        }
    }

    TrajectoryBatch TrajectoryBatch::to(torch::Device device) const
    {
        return {states.to(device),
                nextStates.to(device),
                actions.to(device),
                rewards.to(device),
                logProbs.to(device),
                dones.to(device)};
    }

    AdvantageOutput AdvantageOutput::to(torch::Device device) const
    {
        return {advantage.to(device), tdTarget.to(device)};
    }

    TrajectoryStorage::TrajectoryStorage(int64_t numState) : numState(numState)
    {
    }

    void TrajectoryStorage::insert(Transition transition)
    {
        if (static_cast<int64_t>(transition.state.size()) != numState ||
            static_cast<int64_t>(transition.nextState.size()) != numState)
        {
            throw std::runtime_error(fmt::format(
                "Transition state has {} entries and next state {}, expected {}",
                transition.state.size(), transition.nextState.size(), numState));
        }
        transitions.push_back(std::move(transition));
    }

    /**
     * @brief Packs the stored transitions into index-aligned tensors.
     *
     * @details The tensors are filled on the CPU through accessors and moved
     * to `device` in one copy each.
     */
    TrajectoryBatch TrajectoryStorage::toBatch(torch::Device device) const
    {
        if (transitions.empty())
        {
            throw std::runtime_error("Cannot build a batch from an empty storage");
        }
        auto length = size();
        auto states = torch::empty({length, numState}, torch::kFloat);
        auto nextStates = torch::empty({length, numState}, torch::kFloat);
        auto actions = torch::empty({length}, torch::kLong);
        auto rewards = torch::empty({length}, torch::kFloat);
        auto logProbs = torch::empty({length}, torch::kFloat);
        auto dones = torch::empty({length}, torch::kFloat);

        auto statesAccessor = states.accessor<float, 2>();
        auto nextStatesAccessor = nextStates.accessor<float, 2>();
        auto actionsAccessor = actions.accessor<int64_t, 1>();
        auto rewardsAccessor = rewards.accessor<float, 1>();
        auto logProbsAccessor = logProbs.accessor<float, 1>();
        auto donesAccessor = dones.accessor<float, 1>();

        for (int64_t t = 0; t < length; ++t)
        {
            const auto &transition = transitions[t];
            for (int64_t i = 0; i < numState; ++i)
            {
                statesAccessor[t][i] = transition.state[i];
                nextStatesAccessor[t][i] = transition.nextState[i];
            }
            actionsAccessor[t] = transition.action;
            rewardsAccessor[t] = transition.reward;
            logProbsAccessor[t] = transition.logProb;
            donesAccessor[t] = transition.done ? 1.f : 0.f;
        }

        return TrajectoryBatch{states, nextStates, actions, rewards, logProbs, dones}.to(device);
    }

    TEST_CASE("TrajectoryStorage")
    {
        TrajectoryStorage storage(2);

        SUBCASE("Batch keeps insertion order and shapes")
        {
            storage.insert({{0, 1}, 1, 0.5f, {1, 2}, false, -0.7f});
            storage.insert({{1, 2}, 0, 1.5f, {2, 3}, true, -0.2f});
            auto batch = storage.toBatch(torch::kCPU);

            CHECK(batch.size() == 2);
            CHECK(batch.states.sizes().vec() == std::vector<int64_t>{2, 2});
            CHECK(batch.actions.scalar_type() == torch::kLong);
            CHECK(batch.states[1][1].item().toFloat() == doctest::Approx(2));
            CHECK(batch.nextStates[0][0].item().toFloat() == doctest::Approx(1));
            CHECK(batch.actions[0].item().toLong() == 1);
            CHECK(batch.rewards[1].item().toFloat() == doctest::Approx(1.5));
            CHECK(batch.logProbs[0].item().toFloat() == doctest::Approx(-0.7));
            CHECK(batch.dones[0].item().toFloat() == doctest::Approx(0));
            CHECK(batch.dones[1].item().toFloat() == doctest::Approx(1));
            CHECK_NOTHROW(batch.check());
        }

        SUBCASE("Rejects states of the wrong width")
        {
            CHECK_THROWS_AS(storage.insert({{0, 1, 2}, 0, 0.f, {0, 1}, false, 0.f}), std::runtime_error);
            CHECK(storage.size() == 0);
        }

        SUBCASE("Empty storage cannot produce a batch")
        {
            CHECK_THROWS_AS(storage.toBatch(torch::kCPU), std::runtime_error);
        }

        SUBCASE("clear() empties the storage")
        {
            storage.insert({{0, 1}, 1, 0.5f, {1, 2}, false, -0.7f});
            storage.clear();
            CHECK(storage.size() == 0);
        }
    }

    TEST_CASE("TrajectoryBatch::check()")
    {
        TrajectoryBatch batch{torch::rand({3, 4}),
                              torch::rand({3, 4}),
                              torch::zeros({3}, torch::kLong),
                              torch::rand({3}),
                              torch::rand({3}),
                              torch::zeros({3})};

        SUBCASE("Accepts a consistent batch")
        {
            CHECK_NOTHROW(batch.check());
        }

        SUBCASE("Rejects mismatched lengths")
        {
            batch.dones = torch::zeros({2});
            CHECK_THROWS_AS(batch.check(), std::runtime_error);
        }

        SUBCASE("Rejects an empty batch")
        {
            batch = TrajectoryBatch{torch::rand({0, 4}),
                                    torch::rand({0, 4}),
                                    torch::zeros({0}, torch::kLong),
                                    torch::rand({0}),
                                    torch::rand({0}),
                                    torch::zeros({0})};
            CHECK_THROWS_AS(batch.check(), std::runtime_error);
        }

        SUBCASE("Rejects undefined tensors")
        {
            batch.logProbs = torch::Tensor();
            CHECK_THROWS_AS(batch.check(), std::runtime_error);
        }
    }
}
