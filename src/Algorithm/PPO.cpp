/**
 * @file PPO.cpp
 * @brief Clipped-surrogate PPO update and its learning tests.
 */

#include<cmath>
#include<stdexcept>

#include<fmt/format.h>
#include<fmt/ranges.h>
#include<torch/torch.h>

#include"../../include/DistributedPPO/Algorithms/PPO.hpp"
#include"../../include/DistributedPPO/Algorithms/AdvantageEstimator.hpp"
#include<doctest/doctest.h>

namespace DistributedPPO
{
    PPO::PPO(Actor actor,
             Critic critic,
             torch::optim::Optimizer &actorOptimizer,
             torch::optim::Optimizer &criticOptimizer,
             float clipParam) :
        actor(std::move(actor)),
        critic(std::move(critic)),
        actorOptimizer(actorOptimizer),
        criticOptimizer(criticOptimizer),
        clipParam(clipParam)
    {
    }

    PPOLosses PPO::computeLosses(const TrajectoryBatch &batch, const AdvantageOutput &advantages)
    {
        batch.check();
        if (!advantages.advantage.defined() || !advantages.tdTarget.defined())
        {
            throw std::runtime_error("Advantage output has undefined tensors");
        }
        if (advantages.advantage.dim() != 1 || advantages.tdTarget.dim() != 1 ||
            advantages.advantage.size(0) != batch.size() || advantages.tdTarget.size(0) != batch.size())
        {
            throw std::runtime_error(fmt::format(
                "Advantage output does not match the batch: advantage {}, td target {}, batch length {}",
                fmt::join(advantages.advantage.sizes(), "x"), fmt::join(advantages.tdTarget.sizes(), "x"),
                batch.size()));
        }

        auto values = critic->forward(batch.states).squeeze(-1);
        auto logProbs = actor->forward(batch.states).logProbability(batch.actions);

        // r = pi(a|s) / pi_old(a|s)
        auto ratio = torch::exp(logProbs - batch.logProbs);
        auto surr1 = ratio * advantages.advantage;
        auto surr2 = torch::clamp(ratio, 1.0 - clipParam, 1.0 + clipParam) * advantages.advantage;

        auto actorLoss = -torch::min(surr1, surr2).mean();
        auto criticLoss = torch::mse_loss(values, advantages.tdTarget);

        return {actorLoss, criticLoss, ratio.detach()};
    }

    std::vector<UpdateDatum> PPO::update(const TrajectoryBatch &batch, const AdvantageOutput &advantages)
    {
        auto losses = computeLosses(batch, advantages);

        float actorLoss = losses.actorLoss.item().toFloat();
        float criticLoss = losses.criticLoss.item().toFloat();
        if (!std::isfinite(actorLoss) || !std::isfinite(criticLoss))
        {
            throw std::runtime_error(fmt::format(
                "Non-finite PPO loss (actor {}, critic {}), update skipped", actorLoss, criticLoss));
        }

        float clipFraction = (losses.ratio - 1.0)
                                 .abs()
                                 .gt(clipParam)
                                 .to(torch::kFloat)
                                 .mean()
                                 .item()
                                 .toFloat();

        actorOptimizer.zero_grad();
        losses.actorLoss.backward();
        actorOptimizer.step();

        criticOptimizer.zero_grad();
        losses.criticLoss.backward();
        criticOptimizer.step();

        return {{"loss", actorLoss + criticLoss},
                {"actor_loss", actorLoss},
                {"critic_loss", criticLoss},
                {"clip_fraction", clipFraction}};
    }

    namespace
    {
        float findDatum(const std::vector<UpdateDatum> &data, const std::string &name)
        {
            for (const auto &datum : data)
            {
                if (datum.name == name)
                {
                    return datum.value;
                }
            }
            throw std::runtime_error("No update datum named " + name);
        }

        TrajectoryBatch randomBatch(Actor &actor, int64_t length, int64_t numState)
        {
            TrajectoryBatch batch;
            batch.states = torch::rand({length, numState});
            batch.nextStates = torch::rand({length, numState});
            auto actResult = actor->act(batch.states);
            batch.actions = actResult[0];
            batch.logProbs = actResult[1];
            batch.rewards = torch::rand({length});
            batch.dones = torch::zeros({length});
            batch.dones[length - 1] = 1;
            return batch;
        }

        /**
         * @brief Trains on one-step episodes where the reward equals the action.
         *
         * Observations are a single random bit. The policy should learn to
         * prefer action 1 regardless of the observation.
         */
        void learnPattern(Actor &actor, Critic &critic, PPO &ppo)
        {
            AdvantageEstimator estimator(critic, 0.9f, 0.95f);
            TrajectoryStorage storage(1);

            for (int update = 0; update < 40; ++update)
            {
                for (int step = 0; step < 16; ++step)
                {
                    auto observation = torch::randint(0, 2, {1}).to(torch::kFloat);
                    auto actResult = actor->act(observation);
                    auto action = actResult[0].item().toLong();

                    Transition transition;
                    transition.state = {observation.item().toFloat()};
                    transition.nextState = {0.f};
                    transition.action = action;
                    transition.reward = static_cast<float>(action);
                    transition.done = true;
                    transition.logProb = actResult[1].item().toFloat();
                    storage.insert(transition);
                }

                auto batch = storage.toBatch(torch::kCPU);
                ppo.update(batch, estimator.estimate(batch));
                storage.clear();
            }
        }

        /**
         * @brief Trains on a matching game: reward 1 when the action equals the
         *        observed bit, -1 otherwise.
         */
        void learnGame(Actor &actor, Critic &critic, PPO &ppo)
        {
            AdvantageEstimator estimator(critic, 0.9f, 0.95f);
            TrajectoryStorage storage(1);

            for (int update = 0; update < 40; ++update)
            {
                for (int step = 0; step < 16; ++step)
                {
                    auto observation = torch::randint(0, 2, {1}).to(torch::kFloat);
                    auto actResult = actor->act(observation);
                    auto action = actResult[0].item().toLong();
                    auto bit = static_cast<int64_t>(observation.item().toFloat());

                    Transition transition;
                    transition.state = {observation.item().toFloat()};
                    transition.nextState = {0.f};
                    transition.action = action;
                    transition.reward = action == bit ? 1.f : -1.f;
                    transition.done = true;
                    transition.logProb = actResult[1].item().toFloat();
                    storage.insert(transition);
                }

                auto batch = storage.toBatch(torch::kCPU);
                ppo.update(batch, estimator.estimate(batch));
                storage.clear();
            }
        }
    }

    TEST_CASE("PPO")
    {
        torch::manual_seed(0);

        SUBCASE("update() reports losses and clip fraction")
        {
            Actor actor(3, 2);
            Critic critic(3);
            torch::optim::Adam actorOptimizer(actor->parameters(), torch::optim::AdamOptions(1e-3));
            torch::optim::Adam criticOptimizer(critic->parameters(), torch::optim::AdamOptions(1e-3));
            PPO ppo(actor, critic, actorOptimizer, criticOptimizer, 0.2f);

            auto batch = randomBatch(actor, 8, 3);
            auto advantages = AdvantageEstimator(critic, 0.99f, 0.95f).estimate(batch);
            auto data = ppo.update(batch, advantages);

            REQUIRE(data.size() == 4);
            CHECK(findDatum(data, "loss") ==
                  doctest::Approx(findDatum(data, "actor_loss") + findDatum(data, "critic_loss")));
            // The batch was sampled from the same policy, so every ratio is 1
            CHECK(findDatum(data, "clip_fraction") == doctest::Approx(0));
        }

        SUBCASE("Ratio beyond the clip band gives no actor gradient")
        {
            Actor actor(3, 2);
            Critic critic(3);
            torch::optim::Adam actorOptimizer(actor->parameters(), torch::optim::AdamOptions(1e-3));
            torch::optim::Adam criticOptimizer(critic->parameters(), torch::optim::AdamOptions(1e-3));
            PPO ppo(actor, critic, actorOptimizer, criticOptimizer, 0.2f);

            auto batch = randomBatch(actor, 6, 3);
            // ratio = e, well above 1 + clip, with a positive advantage
            batch.logProbs = batch.logProbs - 1;
            AdvantageOutput advantages{torch::ones({6}), torch::zeros({6})};

            auto losses = ppo.computeLosses(batch, advantages);
            CHECK(losses.actorLoss.item().toDouble() == doctest::Approx(-1.2));

            actorOptimizer.zero_grad();
            losses.actorLoss.backward();
            for (const auto &parameter : actor->parameters())
            {
                if (parameter.grad().defined())
                {
                    CHECK(parameter.grad().abs().sum().item().toDouble() == doctest::Approx(0));
                }
            }
        }

        SUBCASE("Ratio inside the clip band follows the unclipped gradient")
        {
            Actor actor(3, 2);
            Critic critic(3);
            torch::optim::Adam actorOptimizer(actor->parameters(), torch::optim::AdamOptions(1e-3));
            torch::optim::Adam criticOptimizer(critic->parameters(), torch::optim::AdamOptions(1e-3));
            PPO ppo(actor, critic, actorOptimizer, criticOptimizer, 0.2f);

            auto batch = randomBatch(actor, 6, 3);
            auto advantageValues = torch::tensor({1.f, -0.5f, 2.f, -1.f, 0.3f, -2.f});
            AdvantageOutput advantages{advantageValues, torch::zeros({6})};

            actorOptimizer.zero_grad();
            auto logProbs = actor->forward(batch.states).logProbability(batch.actions);
            auto unclipped = -(torch::exp(logProbs - batch.logProbs) * advantageValues).mean();
            unclipped.backward();
            std::vector<torch::Tensor> expected;
            for (const auto &parameter : actor->parameters())
            {
                expected.push_back(parameter.grad().clone());
            }

            actorOptimizer.zero_grad();
            ppo.computeLosses(batch, advantages).actorLoss.backward();
            auto parameters = actor->parameters();
            for (size_t i = 0; i < parameters.size(); ++i)
            {
                CHECK(torch::allclose(parameters[i].grad(), expected[i], 1e-4, 1e-6));
            }
        }

        SUBCASE("Critic loss decreases when regressing to fixed targets")
        {
            Actor actor(3, 2);
            Critic critic(3);
            torch::optim::Adam actorOptimizer(actor->parameters(), torch::optim::AdamOptions(1e-3));
            torch::optim::Adam criticOptimizer(critic->parameters(), torch::optim::AdamOptions(1e-3));
            PPO ppo(actor, critic, actorOptimizer, criticOptimizer, 0.2f);

            auto batch = randomBatch(actor, 16, 3);
            auto advantages = AdvantageEstimator(critic, 0.99f, 0.95f).estimate(batch);

            float first = findDatum(ppo.update(batch, advantages), "critic_loss");
            float last = first;
            for (int i = 0; i < 30; ++i)
            {
                last = findDatum(ppo.update(batch, advantages), "critic_loss");
            }
            CHECK(last < first);
        }

        SUBCASE("Non-finite loss throws and leaves parameters untouched")
        {
            Actor actor(3, 2);
            Critic critic(3);
            torch::optim::Adam actorOptimizer(actor->parameters(), torch::optim::AdamOptions(1e-3));
            torch::optim::Adam criticOptimizer(critic->parameters(), torch::optim::AdamOptions(1e-3));
            PPO ppo(actor, critic, actorOptimizer, criticOptimizer, 0.2f);

            auto batch = randomBatch(actor, 4, 3);
            batch.rewards[1] = std::nanf("");
            auto advantages = AdvantageEstimator(critic, 0.99f, 0.95f).estimate(batch);

            std::vector<torch::Tensor> before;
            for (const auto &parameter : actor->parameters())
            {
                before.push_back(parameter.detach().clone());
            }
            for (const auto &parameter : critic->parameters())
            {
                before.push_back(parameter.detach().clone());
            }

            CHECK_THROWS_AS(ppo.update(batch, advantages), std::runtime_error);

            auto parameters = actor->parameters();
            auto criticParameters = critic->parameters();
            parameters.insert(parameters.end(), criticParameters.begin(), criticParameters.end());
            for (size_t i = 0; i < parameters.size(); ++i)
            {
                CHECK(torch::equal(parameters[i].detach(), before[i]));
            }
        }

        SUBCASE("Advantages misaligned with the batch are rejected before any step")
        {
            Actor actor(3, 2);
            Critic critic(3);
            torch::optim::Adam actorOptimizer(actor->parameters(), torch::optim::AdamOptions(1e-3));
            torch::optim::Adam criticOptimizer(critic->parameters(), torch::optim::AdamOptions(1e-3));
            PPO ppo(actor, critic, actorOptimizer, criticOptimizer, 0.2f);

            auto batch = randomBatch(actor, 3, 3);
            auto before = actor->parameters()[0].detach().clone();

            CHECK_THROWS_AS(ppo.update(batch, AdvantageOutput{torch::ones({1}), torch::zeros({1})}),
                            std::runtime_error);
            CHECK_THROWS_AS(ppo.update(batch, AdvantageOutput{torch::ones({3, 1}), torch::zeros({3, 1})}),
                            std::runtime_error);
            CHECK_THROWS_AS(ppo.update(batch, AdvantageOutput{torch::ones({3}), torch::zeros({2})}),
                            std::runtime_error);
            CHECK(torch::equal(actor->parameters()[0].detach(), before));
        }

        SUBCASE("Learns a basic pattern")
        {
            Actor actor(1, 2);
            Critic critic(1);
            torch::optim::Adam actorOptimizer(actor->parameters(), torch::optim::AdamOptions(1e-2));
            torch::optim::Adam criticOptimizer(critic->parameters(), torch::optim::AdamOptions(1e-2));
            PPO ppo(actor, critic, actorOptimizer, criticOptimizer, 0.2f);

            auto observations = torch::tensor({{0.f}, {1.f}});
            auto preTrainingProbs = actor->evaluate(observations).getProbabilities();

            learnPattern(actor, critic, ppo);

            auto postTrainingProbs = actor->evaluate(observations).getProbabilities();

            INFO("Pre-training probabilities: \n" << preTrainingProbs << "\n");
            INFO("Post-training probabilities: \n" << postTrainingProbs << "\n");

            CHECK(postTrainingProbs[0][1].item().toDouble() > preTrainingProbs[0][1].item().toDouble());
            CHECK(postTrainingProbs[1][1].item().toDouble() > preTrainingProbs[1][1].item().toDouble());
        }

        SUBCASE("Learns a basic game")
        {
            Actor actor(1, 2);
            Critic critic(1);
            torch::optim::Adam actorOptimizer(actor->parameters(), torch::optim::AdamOptions(1e-2));
            torch::optim::Adam criticOptimizer(critic->parameters(), torch::optim::AdamOptions(1e-2));
            PPO ppo(actor, critic, actorOptimizer, criticOptimizer, 0.2f);

            auto observations = torch::tensor({{0.f}, {1.f}});
            auto preTrainingProbs = actor->evaluate(observations).getProbabilities();

            learnGame(actor, critic, ppo);

            auto postTrainingProbs = actor->evaluate(observations).getProbabilities();

            INFO("Pre-training probabilities: \n" << preTrainingProbs << "\n");
            INFO("Post-training probabilities: \n" << postTrainingProbs << "\n");

            // Observation 1 should pull towards action 1; the zero input only
            // reaches the network through its biases so it learns more slowly
            CHECK(postTrainingProbs[1][1].item().toDouble() > preTrainingProbs[1][1].item().toDouble());
        }
    }
}
