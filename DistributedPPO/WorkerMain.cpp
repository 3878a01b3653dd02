#include<exception>
#include<string>

#include<ATen/Parallel.h>
#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../include/DistributedPPO/Communication/Communication.hpp"
#include"../include/DistributedPPO/Worker/WorkerServer.hpp"

using namespace DistributedPPO;

int main(int argc, char *argv[])
{
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("%^[%T %7l] %v%$");
    at::set_num_threads(1);

    if (argc != 2)
    {
        spdlog::error("Usage: {} <bind-url>, e.g. {} tcp://*:10301", argv[0], argv[0]);
        return 1;
    }

    try
    {
        Communicator communicator(argv[1], SocketRole::Bind, -1);
        WorkerServer server;
        server.serve(communicator);
    }
    catch (const std::exception &error)
    {
        spdlog::critical("Worker stopped: {}", error.what());
        return 1;
    }
    return 0;
}
