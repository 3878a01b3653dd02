#include<chrono>
#include<stdexcept>
#include<thread>

#include<fmt/format.h>
#include<fmt/ranges.h>
#include<spdlog/spdlog.h>

#include"../../include/DistributedPPO/Environment/GymEnvironment.hpp"
#include<doctest/doctest.h>

namespace DistributedPPO
{
    GymEnvironment::GymEnvironment(const EnvironmentConfig &environment, const ModelConfig &model) :
        GymEnvironment(std::make_unique<Communicator>(environment.url), environment.name, model)
    {
    }

    GymEnvironment::GymEnvironment(std::unique_ptr<Communicator> communicator,
                                   const std::string &name,
                                   const ModelConfig &model) :
        communicator(std::move(communicator)),
        numState(model.numState),
        numAction(model.numAction)
    {
        spdlog::info("Creating environment {}", name);
        auto makeParams = std::make_shared<makeParam>();
        makeParams->envName = name;
        makeParams->numEnv = 1;
        this->communicator->sendRequest(Request<makeParam>("make", makeParams));
        spdlog::info(expectResponse<MakeResponse>("make")->result);

        this->communicator->sendRequest(Request<infoParam>("info", std::make_shared<infoParam>()));
        auto info = expectResponse<InfoResponse>("info");
        spdlog::info("Observation space: {} - [{}]", info->observationSpaceType,
                     fmt::join(info->observationSpaceShape, ", "));
        spdlog::info("Action space: {} - [{}]", info->actionSpaceType,
                     fmt::join(info->actionSpaceShape, ", "));

        if (info->observationSpaceShape != std::vector<int64_t>{numState})
        {
            throw std::runtime_error(fmt::format(
                "Environment {} observations have shape [{}], the model expects [{}]",
                name, fmt::join(info->observationSpaceShape, ", "), numState));
        }
        if (info->actionSpaceType != "Discrete" ||
            info->actionSpaceShape != std::vector<int64_t>{numAction})
        {
            throw std::runtime_error(fmt::format(
                "Environment {} has a {} [{}] action space, the model expects Discrete [{}]",
                name, info->actionSpaceType, fmt::join(info->actionSpaceShape, ", "), numAction));
        }
    }

    template<typename T>
    std::unique_ptr<T> GymEnvironment::expectResponse(const char *method)
    {
        auto response = communicator->getResponse<T>();
        if (!response)
        {
            throw std::runtime_error(fmt::format("Failed to get {} response from gym server", method));
        }
        return response;
    }

    std::vector<float> GymEnvironment::checkObservation(const std::vector<std::vector<float>> &observation) const
    {
        if (observation.size() != 1 || static_cast<int64_t>(observation[0].size()) != numState)
        {
            throw std::runtime_error(fmt::format(
                "Gym server sent {} observations of width {}, expected 1 of width {}",
                observation.size(), observation.empty() ? 0 : observation[0].size(), numState));
        }
        return observation[0];
    }

    std::vector<float> GymEnvironment::reset()
    {
        communicator->sendRequest(Request<resetParam>("reset", std::make_shared<resetParam>()));
        return checkObservation(expectResponse<MlpResetResponse>("reset")->observation);
    }

    StepResult GymEnvironment::step(int64_t action)
    {
        if (action < 0 || action >= numAction)
        {
            throw std::out_of_range(fmt::format("Action {} outside [0, {})", action, numAction));
        }

        auto stepParams = std::make_shared<stepParam>();
        stepParams->action = {{static_cast<float>(action)}};
        stepParams->render = false;
        communicator->sendRequest(Request<stepParam>("step", stepParams));
        auto response = expectResponse<MlpStepResponse>("step");

        if (response->reward.size() != 1 || response->reward[0].empty() ||
            response->done.size() != 1 || response->done[0].empty())
        {
            throw std::runtime_error("Gym server sent a step response without reward or done flag");
        }

        StepResult result;
        result.observation = checkObservation(response->observation);
        result.reward = response->reward[0][0];
        result.done = response->done[0][0];
        return result;
    }

    namespace
    {
        /**
         * @brief Minimal gym server: a counter environment whose episode
         *        ends after three steps and rewards action 1.
         */
        void serveFakeGym(std::shared_ptr<zmq::context_t> context,
                          const std::string &url,
                          std::vector<int64_t> observationShape)
        {
            Communicator server(context, url, SocketRole::Bind, 1000);
            int stepCount = 0;
            while (true)
            {
                auto payload = server.getRawResponse();
                if (!payload)
                {
                    return;
                }
                auto handle = msgpack::unpack(payload->data(), payload->size());
                auto header = handle.get().as<RequestHeader>();

                msgpack::sbuffer buffer;
                if (header.method == "make")
                {
                    msgpack::pack(buffer, MakeResponse{"created"});
                }
                else if (header.method == "info")
                {
                    msgpack::pack(buffer, InfoResponse{"Discrete", {2}, "Box", observationShape});
                }
                else if (header.method == "reset")
                {
                    stepCount = 0;
                    msgpack::pack(buffer, MlpResetResponse{{{0.f, 0.f}}});
                }
                else if (header.method == "step")
                {
                    auto action = header.param.as<stepParam>().action[0][0];
                    ++stepCount;
                    MlpStepResponse response;
                    response.observation = {{static_cast<float>(stepCount), action}};
                    response.reward = {{action == 1.f ? 1.f : 0.f}};
                    response.done = {{stepCount >= 3}};
                    response.real_reward = response.reward;
                    msgpack::pack(buffer, response);
                }
                else
                {
                    return;
                }
                server.sendRaw(std::string(buffer.data(), buffer.size()));
            }
        }

        ModelConfig gymTestConfig()
        {
            ModelConfig config;
            config.numState = 2;
            config.numAction = 2;
            return config;
        }
    }

    TEST_CASE("GymEnvironment")
    {
        auto context = std::make_shared<zmq::context_t>(1);

        SUBCASE("Plays an episode against the server")
        {
            auto server = std::thread(serveFakeGym, context, "inproc://gym-episode", std::vector<int64_t>{2});
            std::this_thread::sleep_for(std::chrono::milliseconds(100));

            {
                GymEnvironment environment(
                    std::make_unique<Communicator>(context, "inproc://gym-episode", SocketRole::Connect, 1000),
                    "Counter-v0", gymTestConfig());

                auto state = environment.reset();
                CHECK(state == std::vector<float>{0.f, 0.f});

                auto first = environment.step(1);
                CHECK(first.reward == doctest::Approx(1));
                CHECK(!first.done);
                CHECK(first.observation == std::vector<float>{1.f, 1.f});

                environment.step(0);
                auto last = environment.step(0);
                CHECK(last.done);
                CHECK(last.reward == doctest::Approx(0));

                CHECK_THROWS_AS(environment.step(2), std::out_of_range);
            }
            server.join();
        }

        SUBCASE("Mismatched observation shape is rejected")
        {
            auto server = std::thread(serveFakeGym, context, "inproc://gym-mismatch", std::vector<int64_t>{5});
            std::this_thread::sleep_for(std::chrono::milliseconds(100));

            CHECK_THROWS_AS(GymEnvironment(
                                std::make_unique<Communicator>(context, "inproc://gym-mismatch",
                                                               SocketRole::Connect, 1000),
                                "Counter-v0", gymTestConfig()),
                            std::runtime_error);
            server.join();
        }
    }
}
