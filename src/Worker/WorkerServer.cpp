#include<filesystem>
#include<stdexcept>
#include<thread>

#include<fmt/format.h>
#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../../include/DistributedPPO/Worker/WorkerServer.hpp"
#include<doctest/doctest.h>

namespace DistributedPPO
{
    namespace
    {
        template<class T>
        std::string packReply(const std::string &status, const std::string &message, const T &result)
        {
            Reply<T> reply{status, message, result};
            msgpack::sbuffer buffer;
            msgpack::pack(buffer, reply);
            return std::string(buffer.data(), buffer.size());
        }

        template<class T>
        std::string packOk(const T &result)
        {
            return packReply("ok", "", result);
        }

        std::string packOk()
        {
            return packReply("ok", "", msgpack::type::nil_t());
        }

        std::string packError(const std::string &message)
        {
            return packReply("error", message, msgpack::type::nil_t());
        }

        std::vector<float> toVector(const torch::Tensor &tensor)
        {
            auto cpu = tensor.detach().to(torch::kCPU, torch::kFloat).contiguous();
            return std::vector<float>(cpu.data_ptr<float>(), cpu.data_ptr<float>() + cpu.numel());
        }

        std::vector<std::vector<float>> toRows(const torch::Tensor &tensor)
        {
            auto cpu = tensor.detach().to(torch::kCPU, torch::kFloat).contiguous();
            std::vector<std::vector<float>> rows;
            rows.reserve(cpu.size(0));
            for (int64_t row = 0; row < cpu.size(0); ++row)
            {
                rows.push_back(toVector(cpu[row]));
            }
            return rows;
        }

        torch::Tensor fromRows(const std::vector<std::vector<float>> &rows, const char *field)
        {
            auto width = rows.front().size();
            std::vector<float> flat;
            flat.reserve(rows.size() * width);
            for (const auto &row : rows)
            {
                if (row.size() != width)
                {
                    throw std::runtime_error(fmt::format(
                        "Ragged {}: rows of width {} and {}", field, width, row.size()));
                }
                flat.insert(flat.end(), row.begin(), row.end());
            }
            return torch::tensor(flat).view({static_cast<int64_t>(rows.size()), static_cast<int64_t>(width)});
        }
    }

    TrajectoryBatch toTrajectoryBatch(const BatchMessage &message, torch::Device device)
    {
        auto length = message.rewards.size();
        if (length == 0)
        {
            throw std::runtime_error("Trajectory batch must contain at least one transition");
        }
        if (message.states.size() != length || message.nextStates.size() != length ||
            message.actions.size() != length || message.logProbs.size() != length ||
            message.dones.size() != length)
        {
            throw std::runtime_error(fmt::format(
                "Trajectory batch fields disagree on length: states {}, next states {}, actions {}, "
                "rewards {}, log probs {}, dones {}",
                message.states.size(), message.nextStates.size(), message.actions.size(),
                length, message.logProbs.size(), message.dones.size()));
        }

        TrajectoryBatch batch;
        batch.states = fromRows(message.states, "states");
        batch.nextStates = fromRows(message.nextStates, "next states");
        batch.actions = torch::tensor(message.actions, torch::kLong);
        batch.rewards = torch::tensor(message.rewards);
        batch.logProbs = torch::tensor(message.logProbs);
        batch.dones = torch::tensor(message.dones);
        batch.check();
        return batch.to(device);
    }

    BatchMessage toBatchMessage(const TrajectoryBatch &batch)
    {
        batch.check();

        BatchMessage message;
        message.states = toRows(batch.states);
        message.nextStates = toRows(batch.nextStates);
        auto actions = batch.actions.to(torch::kCPU, torch::kLong).contiguous();
        message.actions.assign(actions.data_ptr<int64_t>(), actions.data_ptr<int64_t>() + actions.numel());
        message.rewards = toVector(batch.rewards);
        message.logProbs = toVector(batch.logProbs);
        message.dones = toVector(batch.dones);
        return message;
    }

    AdvantageOutput toAdvantageOutput(const AdvantageMessage &message, torch::Device device)
    {
        if (message.advantage.size() != message.tdTarget.size())
        {
            throw std::runtime_error(fmt::format(
                "Advantage has {} entries and td target {}",
                message.advantage.size(), message.tdTarget.size()));
        }
        return AdvantageOutput{torch::tensor(message.advantage), torch::tensor(message.tdTarget)}.to(device);
    }

    AdvantageMessage toAdvantageMessage(const AdvantageOutput &advantages)
    {
        return {toVector(advantages.advantage), toVector(advantages.tdTarget)};
    }

    WorkerServer::WorkerServer(std::unique_ptr<DistributedAdapter> adapter) :
        adapter(std::move(adapter)),
        running(true)
    {
    }

    Worker &WorkerServer::requireWorker(const std::string &method)
    {
        if (!worker)
        {
            throw std::runtime_error(fmt::format("{} called before init", method));
        }
        return *worker;
    }

    std::string WorkerServer::dispatch(const std::string &method, const msgpack::object &param)
    {
        if (method == "init")
        {
            auto init = param.as<InitParam>();
            worker = std::make_unique<Worker>(init.modelPath, init.userConfig, init.systemConfig);
            spdlog::info("Worker initialized from {}", init.modelPath);
            return packOk();
        }
        if (method == "ready")
        {
            return packOk(ReadyResult{requireWorker(method).ready()});
        }
        if (method == "preprocess")
        {
            auto &current = requireWorker(method);
            auto batch = toTrajectoryBatch(param.as<BatchMessage>(), current.getDevice());
            return packOk(toAdvantageMessage(current.preprocess(batch)));
        }
        if (method == "prepare_model")
        {
            auto &current = requireWorker(method);
            if (!adapter)
            {
                adapter = std::make_unique<LocalAdapter>(current.getDevice());
            }
            current.prepareModel(*adapter);
            return packOk();
        }
        if (method == "train")
        {
            auto &current = requireWorker(method);
            auto train = param.as<TrainParam>();
            auto batch = toTrajectoryBatch(train.batch, current.getDevice());
            auto advantages = toAdvantageOutput(train.preprocessed, current.getDevice());

            TrainResult result;
            for (const auto &datum : current.train(batch, advantages))
            {
                result[datum.name] = datum.value;
            }
            return packOk(result);
        }
        if (method == "save")
        {
            requireWorker(method).save(param.as<SaveParam>().path);
            return packOk();
        }
        if (method == "collect")
        {
            auto &current = requireWorker(method);
            return packOk(toBatchMessage(current.collect(param.as<CollectParam>().numSteps)));
        }
        if (method == "shutdown")
        {
            running = false;
            spdlog::info("Shutting down");
            return packOk();
        }
        throw std::invalid_argument(fmt::format("Unknown method '{}'", method));
    }

    std::string WorkerServer::handle(const std::string &payload)
    {
        std::string method = "request";
        try
        {
            auto objectHandle = msgpack::unpack(payload.data(), payload.size());
            auto header = objectHandle.get().as<RequestHeader>();
            method = header.method;
            spdlog::debug("Handling {}", method);
            return dispatch(header.method, header.param);
        }
        catch (const std::exception &error)
        {
            spdlog::error("{} failed: {}", method, error.what());
            return packError(error.what());
        }
    }

    void WorkerServer::serve(Communicator &communicator)
    {
        running = true;
        while (running)
        {
            auto payload = communicator.getRawResponse();
            if (!payload)
            {
                continue;
            }
            communicator.sendRaw(handle(*payload));
        }
    }

    namespace
    {
        template<class T>
        std::string encode(const std::string &method, const T &param)
        {
            msgpack::sbuffer buffer;
            msgpack::pack(buffer, Request<T>(method, std::make_shared<T>(param)));
            return std::string(buffer.data(), buffer.size());
        }

        std::string encode(const std::string &method)
        {
            return encode(method, EmptyParam());
        }

        ReplyStatus statusOf(const std::string &reply)
        {
            return msgpack::unpack(reply.data(), reply.size()).get().as<ReplyStatus>();
        }

        template<class T>
        T resultOf(const std::string &reply)
        {
            auto decoded = msgpack::unpack(reply.data(), reply.size()).get().as<Reply<T>>();
            REQUIRE(decoded.status == "ok");
            return decoded.result;
        }

        InitParam serverInitParam()
        {
            InitParam init;
            init.modelPath = "";
            init.userConfig.model.numState = 2;
            init.userConfig.model.numAction = 2;
            init.systemConfig.train.learningRate = 1e-3f;
            init.systemConfig.train.useCuda = false;
            return init;
        }

        BatchMessage serverBatch()
        {
            BatchMessage batch;
            batch.states = {{0.f, 1.f}, {1.f, 0.f}, {0.5f, 0.5f}};
            batch.nextStates = {{1.f, 0.f}, {0.5f, 0.5f}, {0.f, 0.f}};
            batch.actions = {0, 1, 1};
            batch.rewards = {1.f, 1.f, 1.f};
            batch.logProbs = {-0.6931f, -0.6931f, -0.6931f};
            batch.dones = {0.f, 0.f, 1.f};
            return batch;
        }
    }

    TEST_CASE("WorkerServer")
    {
        torch::manual_seed(0);
        WorkerServer server;

        SUBCASE("Calls before init are errors")
        {
            auto status = statusOf(server.handle(encode("ready")));
            CHECK(status.status == "error");
            CHECK(status.message.find("before init") != std::string::npos);
        }

        SUBCASE("Unknown methods and garbage are errors")
        {
            CHECK(statusOf(server.handle(encode("fly"))).status == "error");
            CHECK(statusOf(server.handle("\xc1")).status == "error");
        }

        SUBCASE("Invalid configuration is an error reply")
        {
            auto init = serverInitParam();
            init.userConfig.model.numState = 0;
            auto status = statusOf(server.handle(encode("init", init)));
            CHECK(status.status == "error");
            CHECK(status.message.find("NUM_STATE") != std::string::npos);
        }

        SUBCASE("Full cycle")
        {
            REQUIRE(statusOf(server.handle(encode("init", serverInitParam()))).status == "ok");
            CHECK(resultOf<ReadyResult>(server.handle(encode("ready"))).ready);
            CHECK(statusOf(server.handle(encode("prepare_model"))).status == "ok");

            auto advantages = resultOf<AdvantageMessage>(server.handle(encode("preprocess", serverBatch())));
            REQUIRE(advantages.advantage.size() == 3);
            CHECK(advantages.tdTarget.size() == 3);
            CHECK(advantages.advantage[0] + advantages.advantage[1] + advantages.advantage[2] ==
                  doctest::Approx(0).epsilon(1e-4));

            TrainParam train{serverBatch(), advantages};
            auto metrics = resultOf<TrainResult>(server.handle(encode("train", train)));
            CHECK(metrics.size() == 4);
            CHECK(metrics.count("loss") == 1);
            CHECK(metrics.count("actor_loss") == 1);
            CHECK(metrics.count("critic_loss") == 1);
            CHECK(metrics.count("clip_fraction") == 1);

            auto path = (std::filesystem::temp_directory_path() / "dppo_server.pt").string();
            std::filesystem::remove(path);
            CHECK(statusOf(server.handle(encode("save", SaveParam{path}))).status == "ok");
            CHECK(std::filesystem::exists(path));
        }

        SUBCASE("Failed operations leave the server usable")
        {
            REQUIRE(statusOf(server.handle(encode("init", serverInitParam()))).status == "ok");

            auto ragged = serverBatch();
            ragged.states[1] = {1.f};
            CHECK(statusOf(server.handle(encode("preprocess", ragged))).status == "error");

            auto shortActions = serverBatch();
            shortActions.actions.pop_back();
            CHECK(statusOf(server.handle(encode("preprocess", shortActions))).status == "error");

            CHECK(statusOf(server.handle(encode("collect", CollectParam{4}))).status == "error");

            TrainParam misaligned{serverBatch(), AdvantageMessage{{1.f}, {0.f}}};
            auto trainStatus = statusOf(server.handle(encode("train", misaligned)));
            CHECK(trainStatus.status == "error");
            CHECK(trainStatus.message.find("does not match the batch") != std::string::npos);

            CHECK(resultOf<ReadyResult>(server.handle(encode("ready"))).ready);
        }

        SUBCASE("shutdown stops the server")
        {
            CHECK(statusOf(server.handle(encode("shutdown"))).status == "ok");
            CHECK(!server.isRunning());
        }

        SUBCASE("serve() answers over a socket until shutdown")
        {
            auto context = std::make_shared<zmq::context_t>(1);
            Communicator serverSocket(context, "inproc://worker-server", SocketRole::Bind, 100);
            Communicator client(context, "inproc://worker-server", SocketRole::Connect, 5000);

            std::thread serving([&server, &serverSocket]() { server.serve(serverSocket); });

            client.sendRequest(Request<EmptyParam>("ready", std::make_shared<EmptyParam>()));
            auto ready = client.getResponse<ReplyStatus>();
            client.sendRequest(Request<EmptyParam>("shutdown", std::make_shared<EmptyParam>()));
            auto shutdown = client.getResponse<ReplyStatus>();
            serving.join();

            REQUIRE(ready != nullptr);
            CHECK(ready->status == "error");
            REQUIRE(shutdown != nullptr);
            CHECK(shutdown->status == "ok");
        }
    }

    TEST_CASE("Batch message conversion")
    {
        TrajectoryBatch batch;
        batch.states = torch::tensor({{0.f, 1.f}, {2.f, 3.f}});
        batch.nextStates = torch::tensor({{2.f, 3.f}, {4.f, 5.f}});
        batch.actions = torch::tensor({1, 0}, torch::kLong);
        batch.rewards = torch::tensor({0.5f, -1.f});
        batch.logProbs = torch::tensor({-0.1f, -2.f});
        batch.dones = torch::tensor({0.f, 1.f});

        auto message = toBatchMessage(batch);
        CHECK(message.states[1] == std::vector<float>{2.f, 3.f});
        CHECK(message.actions == std::vector<int64_t>{1, 0});

        auto restored = toTrajectoryBatch(message, torch::kCPU);
        CHECK(torch::equal(restored.states, batch.states));
        CHECK(torch::equal(restored.actions, batch.actions));
        CHECK(torch::equal(restored.dones, batch.dones));

        CHECK_THROWS_AS(toTrajectoryBatch(BatchMessage(), torch::kCPU), std::runtime_error);
        CHECK_THROWS_AS(toAdvantageOutput(AdvantageMessage{{1.f}, {}}, torch::kCPU), std::runtime_error);
    }
}
