#include<algorithm>
#include<cmath>
#include<filesystem>
#include<fstream>
#include<set>
#include<stdexcept>

#include<fmt/format.h>
#include<fmt/ranges.h>
#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../../include/DistributedPPO/Model/ModelContainer.hpp"
#include"../../include/DistributedPPO/Algorithms/AdvantageEstimator.hpp"
#include"../../include/DistributedPPO/Algorithms/PPO.hpp"
#include<doctest/doctest.h>

namespace DistributedPPO
{
    const char *toString(NetworkRole role)
    {
        switch (role)
        {
            case NetworkRole::Actor:
                return "actor";
            case NetworkRole::Critic:
                return "critic";
        }
        throw std::invalid_argument("Unknown network role");
    }

    namespace
    {
        /**
         * @brief Rejects archive entries that `module` has no parameter, buffer
         *        or submodule for, at every nesting level.
         */
        void checkArchiveEntries(torch::serialize::InputArchive &archive,
                                 const torch::nn::Module &module,
                                 const std::string &prefix,
                                 const std::string &path)
        {
            std::set<std::string> known;
            for (const auto &parameter : module.named_parameters(false))
            {
                known.insert(parameter.key());
            }
            for (const auto &buffer : module.named_buffers(false))
            {
                known.insert(buffer.key());
            }
            for (const auto &child : module.named_children())
            {
                known.insert(child.key());
            }

            auto keys = archive.keys();
            for (const auto &key : keys)
            {
                if (known.count(key) == 0)
                {
                    throw std::runtime_error(fmt::format(
                        "Malformed checkpoint {}: unexpected entry {}{}", path, prefix, key));
                }
            }

            for (const auto &child : module.named_children())
            {
                if (std::find(keys.begin(), keys.end(), child.key()) == keys.end())
                {
                    continue;
                }
                torch::serialize::InputArchive childArchive;
                archive.read(child.key(), childArchive);
                checkArchiveEntries(childArchive, *child.value(), prefix + child.key() + ".", path);
            }
        }

        /**
         * @brief Reads the nested archive of `role` into `scratch` and checks
         *        it against the parameters of `live`.
         */
        void readNetwork(torch::serialize::InputArchive &root,
                         NetworkRole role,
                         torch::nn::Module &scratch,
                         const torch::nn::Module &live,
                         const std::string &path)
        {
            torch::serialize::InputArchive archive;
            root.read(toString(role), archive);
            // Module::load re-seats parameters, so shapes are whatever the file holds
            scratch.load(archive);
            checkArchiveEntries(archive, live, std::string(toString(role)) + ".", path);

            auto expected = live.named_parameters();
            auto loaded = scratch.named_parameters();
            for (const auto &parameter : expected)
            {
                const auto *found = loaded.find(parameter.key());
                if (found == nullptr)
                {
                    throw std::runtime_error(fmt::format(
                        "Malformed checkpoint {}: {} has no parameter {}",
                        path, toString(role), parameter.key()));
                }
                if (found->sizes() != parameter.value().sizes())
                {
                    throw std::runtime_error(fmt::format(
                        "Malformed checkpoint {}: {}.{} has shape {}, expected {}",
                        path, toString(role), parameter.key(),
                        fmt::join(found->sizes(), "x"),
                        fmt::join(parameter.value().sizes(), "x")));
                }
            }
        }

        void copyParameters(const torch::nn::Module &source, torch::nn::Module &destination)
        {
            torch::NoGradGuard noGrad;
            auto loaded = source.named_parameters();
            for (auto &parameter : destination.named_parameters())
            {
                parameter.value().copy_(loaded[parameter.key()]);
            }
        }
    }

    ModelContainer::ModelContainer(const std::string &modelPath,
                                   float learningRate,
                                   ModelConfig config,
                                   torch::Device device) :
        config(std::move(config)),
        learningRate(learningRate),
        device(device)
    {
        networks.actor = Actor(this->config.numState, this->config.numAction, this->config.hiddenSize);
        networks.critic = Critic(this->config.numState, this->config.hiddenSize);
        networks.actor->to(device);
        networks.critic->to(device);

        load(modelPath);

        actorOptimizer = std::make_unique<torch::optim::Adam>(
            networks.actor->parameters(), torch::optim::AdamOptions(learningRate));
        criticOptimizer = std::make_unique<torch::optim::Adam>(
            networks.critic->parameters(), torch::optim::AdamOptions(learningRate));
    }

    Networks ModelContainer::get() const
    {
        return networks;
    }

    void ModelContainer::bind(Networks replacement)
    {
        if (!replacement.actor || !replacement.critic)
        {
            throw std::invalid_argument("Cannot bind a null network handle");
        }

        std::unique_ptr<torch::optim::Adam> newActorOptimizer;
        std::unique_ptr<torch::optim::Adam> newCriticOptimizer;
        if (replacement.actor.ptr() != networks.actor.ptr())
        {
            newActorOptimizer = std::make_unique<torch::optim::Adam>(
                replacement.actor->parameters(), torch::optim::AdamOptions(learningRate));
        }
        if (replacement.critic.ptr() != networks.critic.ptr())
        {
            newCriticOptimizer = std::make_unique<torch::optim::Adam>(
                replacement.critic->parameters(), torch::optim::AdamOptions(learningRate));
        }

        networks = std::move(replacement);
        if (newActorOptimizer)
        {
            actorOptimizer = std::move(newActorOptimizer);
        }
        if (newCriticOptimizer)
        {
            criticOptimizer = std::move(newCriticOptimizer);
        }
    }

    void ModelContainer::save(const std::string &path) const
    {
        torch::serialize::OutputArchive root;

        torch::serialize::OutputArchive actorArchive;
        networks.actor->save(actorArchive);
        root.write(toString(NetworkRole::Actor), actorArchive);

        torch::serialize::OutputArchive criticArchive;
        networks.critic->save(criticArchive);
        root.write(toString(NetworkRole::Critic), criticArchive);

        root.save_to(path);
        spdlog::info("Model saved at {}.", path);
    }

    void ModelContainer::load(const std::string &path)
    {
        if (path.empty() || !std::filesystem::exists(path))
        {
            spdlog::warn("Model file not found at {}.", path);
            return;
        }

        Actor actor(config.numState, config.numAction, config.hiddenSize);
        Critic critic(config.numState, config.hiddenSize);

        try
        {
            torch::serialize::InputArchive root;
            root.load_from(path, device);

            auto keys = root.keys();
            std::sort(keys.begin(), keys.end());
            if (keys != std::vector<std::string>{"actor", "critic"})
            {
                throw std::runtime_error(fmt::format(
                    "Malformed checkpoint {}: expected keys actor and critic, found [{}]",
                    path, fmt::join(keys, ", ")));
            }

            readNetwork(root, NetworkRole::Actor, *actor, *networks.actor, path);
            readNetwork(root, NetworkRole::Critic, *critic, *networks.critic, path);
        }
        catch (const c10::Error &error)
        {
            throw std::runtime_error(fmt::format(
                "Malformed checkpoint {}: {}", path, error.what_without_backtrace()));
        }

        copyParameters(*actor, *networks.actor);
        copyParameters(*critic, *networks.critic);
        spdlog::info("Model loaded successfully at {}.", path);
    }

    std::vector<torch::Tensor> ModelContainer::act(const torch::Tensor &state)
    {
        return networks.actor->act(state.to(device, torch::kFloat));
    }

    AdvantageOutput ModelContainer::preprocess(const TrajectoryBatch &batch)
    {
        AdvantageEstimator estimator(networks.critic, config.gamma, config.gaeLambda, config.advantageEpsilon);
        return estimator.estimate(batch.to(device));
    }

    std::vector<UpdateDatum> ModelContainer::train(const TrajectoryBatch &batch, const AdvantageOutput &advantages)
    {
        PPO ppo(networks.actor, networks.critic, *actorOptimizer, *criticOptimizer, config.epsClip);
        return ppo.update(batch.to(device), advantages.to(device));
    }

    namespace
    {
        ModelConfig testConfig(int64_t hiddenSize = 64)
        {
            ModelConfig config;
            config.numState = 4;
            config.numAction = 3;
            config.hiddenSize = hiddenSize;
            return config;
        }

        std::string testPath(const std::string &name)
        {
            auto path = std::filesystem::temp_directory_path() / name;
            std::filesystem::remove(path);
            return path.string();
        }

        std::vector<torch::Tensor> snapshot(const Networks &networks)
        {
            std::vector<torch::Tensor> parameters;
            for (const auto &parameter : networks.actor->parameters())
            {
                parameters.push_back(parameter.detach().clone());
            }
            for (const auto &parameter : networks.critic->parameters())
            {
                parameters.push_back(parameter.detach().clone());
            }
            return parameters;
        }

        bool unchanged(const Networks &networks, const std::vector<torch::Tensor> &before)
        {
            auto after = snapshot(networks);
            if (after.size() != before.size())
            {
                return false;
            }
            for (size_t i = 0; i < after.size(); ++i)
            {
                if (!torch::equal(after[i], before[i]))
                {
                    return false;
                }
            }
            return true;
        }

        TrajectoryBatch testBatch(int64_t length)
        {
            TrajectoryBatch batch;
            batch.states = torch::rand({length, 4});
            batch.nextStates = torch::rand({length, 4});
            batch.actions = torch::randint(0, 3, {length}, torch::kLong);
            batch.rewards = torch::rand({length});
            batch.logProbs = torch::full({length}, std::log(1.f / 3));
            batch.dones = torch::zeros({length});
            return batch;
        }
    }

    TEST_CASE("ModelContainer")
    {
        torch::manual_seed(0);

        SUBCASE("Missing checkpoint is a cold start")
        {
            ModelContainer container(testPath("dppo_missing.pt"), 1e-3f, testConfig(), torch::kCPU);
            auto networks = container.get();

            CHECK(!networks.actor.is_empty());
            CHECK(!networks.critic.is_empty());
        }

        SUBCASE("Save then load reproduces outputs")
        {
            auto path = testPath("dppo_roundtrip.pt");
            ModelContainer original("", 1e-3f, testConfig(), torch::kCPU);
            original.save(path);

            ModelContainer restored(path, 1e-3f, testConfig(), torch::kCPU);

            auto states = torch::rand({6, 4});
            auto originalNetworks = original.get();
            auto restoredNetworks = restored.get();
            CHECK(torch::allclose(originalNetworks.actor->evaluate(states).getProbabilities(),
                                  restoredNetworks.actor->evaluate(states).getProbabilities()));
            CHECK(torch::allclose(originalNetworks.critic->evaluate(states),
                                  restoredNetworks.critic->evaluate(states)));
        }

        SUBCASE("Checkpoint with unexpected keys is rejected")
        {
            auto path = testPath("dppo_extra_key.pt");
            {
                Actor actor(4, 3);
                torch::serialize::OutputArchive root;
                torch::serialize::OutputArchive actorArchive;
                actor->save(actorArchive);
                root.write("actor", actorArchive);
                root.write("optimizer", torch::zeros({1}));
                root.save_to(path);
            }

            ModelContainer container("", 1e-3f, testConfig(), torch::kCPU);
            auto before = snapshot(container.get());

            CHECK_THROWS_AS(container.load(path), std::runtime_error);
            CHECK(unchanged(container.get(), before));
        }

        SUBCASE("Checkpoint with extra parameters inside a network is rejected")
        {
            auto path = testPath("dppo_extra_parameter.pt");
            {
                Actor actor(4, 3);
                Critic critic(4);
                torch::serialize::OutputArchive root;
                torch::serialize::OutputArchive actorArchive;
                actor->save(actorArchive);
                actorArchive.write("temperature", torch::ones({1}));
                torch::serialize::OutputArchive criticArchive;
                critic->save(criticArchive);
                root.write("actor", actorArchive);
                root.write("critic", criticArchive);
                root.save_to(path);
            }

            ModelContainer container("", 1e-3f, testConfig(), torch::kCPU);
            auto before = snapshot(container.get());

            CHECK_THROWS_AS(container.load(path), std::runtime_error);
            CHECK(unchanged(container.get(), before));
        }

        SUBCASE("Checkpoint with mismatched shapes is rejected")
        {
            auto path = testPath("dppo_shape.pt");
            ModelContainer narrow("", 1e-3f, testConfig(32), torch::kCPU);
            narrow.save(path);

            ModelContainer container("", 1e-3f, testConfig(), torch::kCPU);
            auto before = snapshot(container.get());

            CHECK_THROWS_AS(container.load(path), std::runtime_error);
            CHECK(unchanged(container.get(), before));
            CHECK_THROWS_AS(ModelContainer(path, 1e-3f, testConfig(), torch::kCPU), std::runtime_error);
        }

        SUBCASE("Garbage file is rejected")
        {
            auto path = testPath("dppo_garbage.pt");
            {
                std::ofstream file(path);
                file << "not a checkpoint";
            }
            CHECK_THROWS_AS(ModelContainer(path, 1e-3f, testConfig(), torch::kCPU), std::runtime_error);
        }

        SUBCASE("bind() swaps handles and trains the new networks")
        {
            ModelContainer container("", 1e-3f, testConfig(), torch::kCPU);
            Actor replacement(4, 3);
            auto networks = container.get();
            auto oldCritic = networks.critic;
            networks.actor = replacement;

            container.bind(networks);
            REQUIRE(container.get().actor.ptr() == replacement.ptr());
            CHECK(container.get().critic.ptr() == oldCritic.ptr());

            auto before = replacement->parameters()[0].detach().clone();
            auto batch = testBatch(8);
            container.train(batch, container.preprocess(batch));
            CHECK(!torch::equal(before, replacement->parameters()[0].detach()));
        }

        SUBCASE("bind() rejects null handles")
        {
            ModelContainer container("", 1e-3f, testConfig(), torch::kCPU);
            auto networks = container.get();
            networks.critic = Critic(nullptr);

            CHECK_THROWS_AS(container.bind(networks), std::invalid_argument);
            CHECK(!container.get().critic.is_empty());
        }

        SUBCASE("act() samples valid actions")
        {
            ModelContainer container("", 1e-3f, testConfig(), torch::kCPU);
            auto result = container.act(torch::rand({5, 4}));

            CHECK(result[0].sizes().vec() == std::vector<int64_t>{5});
            CHECK(!(result[0] > 2).any().item().toBool());
        }
    }
}
