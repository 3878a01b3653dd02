#include<cmath>
#include<filesystem>
#include<stdexcept>

#include<fmt/format.h>
#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../../include/DistributedPPO/Worker/Worker.hpp"
#include"../../include/DistributedPPO/Environment/GymEnvironment.hpp"
#include<doctest/doctest.h>

namespace DistributedPPO
{
    Worker::Worker(const std::string &modelPath,
                   UserConfig userConfig,
                   SystemConfig systemConfig,
                   std::unique_ptr<Environment> environment) :
        userConfig(std::move(userConfig)),
        systemConfig(std::move(systemConfig)),
        device(torch::kCPU),
        environment(std::move(environment)),
        needsReset(true)
    {
        this->userConfig.validate();
        this->systemConfig.validate();

        device = selectDevice(this->systemConfig.train.useCuda);
        model = std::make_unique<ModelContainer>(modelPath,
                                                 this->systemConfig.train.learningRate,
                                                 this->userConfig.model,
                                                 device);

        auto networks = model->get();
        networks.actor->train();
        networks.critic->train();

        if (!this->environment && !this->userConfig.environment.url.empty())
        {
            this->environment = std::make_unique<GymEnvironment>(this->userConfig.environment,
                                                                 this->userConfig.model);
        }
    }

    bool Worker::ready() const
    {
        return true;
    }

    AdvantageOutput Worker::preprocess(const TrajectoryBatch &batch)
    {
        return model->preprocess(batch);
    }

    void Worker::prepareModel(DistributedAdapter &adapter)
    {
        if (adapter.device() != device)
        {
            throw std::invalid_argument(fmt::format(
                "Adapter places networks on {} but the worker runs on {}",
                adapter.device().str(), device.str()));
        }

        auto networks = model->get();
        Networks prepared;
        prepared.actor = adapter.prepare(networks.actor);
        prepared.critic = adapter.prepare(networks.critic);
        model->bind(prepared);
        spdlog::debug("Networks prepared for device {}", adapter.device().str());
    }

    std::vector<UpdateDatum> Worker::train(const TrajectoryBatch &batch, const AdvantageOutput &preprocessed)
    {
        return model->train(batch, preprocessed);
    }

    void Worker::save(const std::string &path)
    {
        model->save(path);
    }

    TrajectoryBatch Worker::collect(int64_t numSteps)
    {
        if (!environment)
        {
            throw std::runtime_error("Worker has no environment to collect from");
        }
        if (numSteps < 1)
        {
            throw std::invalid_argument("Number of steps to collect must be >= 1");
        }

        TrajectoryStorage storage(userConfig.model.numState);
        for (int64_t step = 0; step < numSteps; ++step)
        {
            if (needsReset)
            {
                currentState = environment->reset();
                needsReset = false;
            }

            auto stateTensor = torch::tensor(currentState);
            auto actResult = model->act(stateTensor);
            auto action = actResult[0].item().toLong();

            auto result = environment->step(action);

            Transition transition;
            transition.state = currentState;
            transition.action = action;
            transition.reward = result.reward;
            transition.nextState = result.observation;
            transition.done = result.done;
            transition.logProb = actResult[1].item().toFloat();
            storage.insert(std::move(transition));

            currentState = std::move(result.observation);
            needsReset = result.done;
        }

        return storage.toBatch(device);
    }

    namespace
    {
        /**
         * @brief One-hot target environment: the state marks the rewarded
         *        action, episodes last four steps.
         */
        class MatchingEnvironment : public Environment
        {
        private:
            int64_t numAction;
            int64_t target = 0;
            int steps = 0;

            std::vector<float> observe() const
            {
                std::vector<float> state(numAction, 0.f);
                state[target] = 1.f;
                return state;
            }

        public:
            explicit MatchingEnvironment(int64_t numAction) : numAction(numAction)
            {
            }

            std::vector<float> reset() override
            {
                steps = 0;
                target = torch::randint(0, numAction, {1}).item().toLong();
                return observe();
            }

            StepResult step(int64_t action) override
            {
                StepResult result;
                result.reward = action == target ? 1.f : 0.f;
                ++steps;
                target = torch::randint(0, numAction, {1}).item().toLong();
                result.observation = observe();
                result.done = steps >= 4;
                return result;
            }
        };

        UserConfig workerUserConfig()
        {
            UserConfig config;
            config.model.numState = 2;
            config.model.numAction = 2;
            return config;
        }

        SystemConfig workerSystemConfig(float learningRate = 1e-2f)
        {
            SystemConfig config;
            config.train.learningRate = learningRate;
            config.train.useCuda = false;
            return config;
        }

        std::unique_ptr<Worker> makeWorker(const std::string &modelPath = "")
        {
            return std::make_unique<Worker>(modelPath, workerUserConfig(), workerSystemConfig(),
                                            std::make_unique<MatchingEnvironment>(2));
        }

        /**
         * @brief Returns the input handles and counts the calls.
         */
        class CountingAdapter : public DistributedAdapter
        {
        public:
            int calls = 0;
            torch::Device placement;

            explicit CountingAdapter(torch::Device placement = torch::kCPU) :
                placement(placement)
            {
            }

            torch::Device device() const override { return placement; }

            Actor prepare(Actor actor) override
            {
                ++calls;
                return actor;
            }

            Critic prepare(Critic critic) override
            {
                ++calls;
                return Critic(critic->getNumInputs(), critic->getHiddenSize());
            }
        };
    }

    TEST_CASE("Worker")
    {
        torch::manual_seed(0);

        SUBCASE("ready() is true once constructed")
        {
            CHECK(makeWorker()->ready());
        }

        SUBCASE("Networks start in training mode")
        {
            auto worker = makeWorker();
            CHECK(worker->getModel().get().actor->is_training());
            CHECK(worker->getModel().get().critic->is_training());
        }

        SUBCASE("Invalid configuration is rejected")
        {
            auto config = workerUserConfig();
            config.model.numAction = 0;
            CHECK_THROWS_AS(Worker("", config, workerSystemConfig()), std::invalid_argument);
            CHECK_THROWS_AS(Worker("", workerUserConfig(), workerSystemConfig(-1.f)), std::invalid_argument);
            CHECK_THROWS_AS(Worker("", workerUserConfig(), workerSystemConfig(std::nanf(""))),
                            std::invalid_argument);
        }

        SUBCASE("NaN hyperparameters are rejected")
        {
            auto config = workerUserConfig();
            config.model.gamma = std::nanf("");
            CHECK_THROWS_AS(config.model.validate(), std::invalid_argument);

            config = workerUserConfig();
            config.model.gaeLambda = std::nanf("");
            CHECK_THROWS_AS(config.model.validate(), std::invalid_argument);

            config = workerUserConfig();
            config.model.epsClip = std::nanf("");
            CHECK_THROWS_AS(config.model.validate(), std::invalid_argument);

            config = workerUserConfig();
            config.model.advantageEpsilon = std::nanf("");
            CHECK_THROWS_AS(config.model.validate(), std::invalid_argument);

            CHECK_NOTHROW(workerUserConfig().model.validate());
        }

        SUBCASE("collect() needs an environment")
        {
            Worker worker("", workerUserConfig(), workerSystemConfig());
            CHECK_THROWS_AS(worker.collect(4), std::runtime_error);
        }

        SUBCASE("collect() records episodes in order")
        {
            auto worker = makeWorker();
            auto batch = worker->collect(10);

            REQUIRE_NOTHROW(batch.check());
            CHECK(batch.size() == 10);
            CHECK(batch.states.sizes().vec() == std::vector<int64_t>{10, 2});
            CHECK(batch.dones[3].item().toFloat() == 1.f);
            CHECK(batch.dones[7].item().toFloat() == 1.f);
            CHECK(batch.dones.sum().item().toFloat() == 2.f);
            // Inside an episode the next state is the following state
            CHECK(torch::equal(batch.nextStates[0], batch.states[1]));

            auto more = worker->collect(2);
            CHECK(more.dones[1].item().toFloat() == 1.f);
        }

        SUBCASE("prepareModel() refuses an adapter for another device")
        {
            auto worker = makeWorker();
            auto before = worker->getModel().get();
            CountingAdapter adapter(torch::Device(torch::kCUDA, 0));

            CHECK_THROWS_AS(worker->prepareModel(adapter), std::invalid_argument);
            CHECK(adapter.calls == 0);
            CHECK(worker->getModel().get().critic.ptr() == before.critic.ptr());
        }

        SUBCASE("prepareModel() binds what the adapter returns")
        {
            auto worker = makeWorker();
            auto before = worker->getModel().get();
            CountingAdapter adapter;

            worker->prepareModel(adapter);
            auto after = worker->getModel().get();

            CHECK(adapter.calls == 2);
            CHECK(after.actor.ptr() == before.actor.ptr());
            CHECK(after.critic.ptr() != before.critic.ptr());

            auto batch = worker->collect(8);
            CHECK_NOTHROW(worker->train(batch, worker->preprocess(batch)));
        }

        SUBCASE("Training on the matching game favours the rewarded action")
        {
            auto worker = makeWorker();
            LocalAdapter adapter(worker->getDevice());
            worker->prepareModel(adapter);

            auto states = torch::eye(2);
            auto before = worker->getModel().get().actor->evaluate(states).getProbabilities();

            for (int update = 0; update < 30; ++update)
            {
                auto batch = worker->collect(32);
                auto preprocessed = worker->preprocess(batch);
                auto data = worker->train(batch, preprocessed);
                REQUIRE(data.size() == 4);
            }

            auto after = worker->getModel().get().actor->evaluate(states).getProbabilities();

            INFO("Pre-training probabilities: \n" << before << "\n");
            INFO("Post-training probabilities: \n" << after << "\n");

            CHECK(after[0][0].item().toDouble() > before[0][0].item().toDouble());
            CHECK(after[1][1].item().toDouble() > before[1][1].item().toDouble());
        }

        SUBCASE("save() is picked up by a new worker")
        {
            auto path = (std::filesystem::temp_directory_path() / "dppo_worker.pt").string();
            std::filesystem::remove(path);

            auto worker = makeWorker();
            auto batch = worker->collect(8);
            worker->train(batch, worker->preprocess(batch));
            worker->save(path);

            auto restored = makeWorker(path);
            auto states = torch::eye(2);
            CHECK(torch::allclose(worker->getModel().get().actor->evaluate(states).getProbabilities(),
                                  restored->getModel().get().actor->evaluate(states).getProbabilities()));
            CHECK(torch::allclose(worker->getModel().get().critic->evaluate(states),
                                  restored->getModel().get().critic->evaluate(states)));
        }
    }
}
