#include<memory>
#include<string>

#include<msgpack.hpp>
#include<spdlog/spdlog.h>
#include<zmq.hpp>

#include"../../include/DistributedPPO/Communication/Communication.hpp"
#include<doctest/doctest.h>

namespace DistributedPPO
{
    Communicator::Communicator(const std::string &url, SocketRole role, int receiveTimeoutMs) :
        Communicator(std::make_shared<zmq::context_t>(1), url, role, receiveTimeoutMs)
    {
    }

    Communicator::Communicator(std::shared_ptr<zmq::context_t> context,
                               const std::string &url,
                               SocketRole role,
                               int receiveTimeoutMs) :
        context(std::move(context))
    {
        socket = std::make_unique<zmq::socket_t>(*this->context, zmq::socket_type::pair);
        socket->set(zmq::sockopt::rcvtimeo, receiveTimeoutMs);
        socket->set(zmq::sockopt::linger, 0);

        if (role == SocketRole::Bind)
        {
            socket->bind(url);
            spdlog::info("Listening at: {}", url);
        }
        else
        {
            socket->connect(url);
            spdlog::info("Connected to: {}", url);
        }
    }

    Communicator::~Communicator()
    {
        // The socket must close before its context is released
        socket.reset();
    }

    std::optional<std::string> Communicator::getRawResponse()
    {
        zmq::message_t zmqMessage;
        auto received = socket->recv(zmqMessage, zmq::recv_flags::none);
        if (!received)
        {
            return std::nullopt;
        }
        return std::string(static_cast<const char *>(zmqMessage.data()), zmqMessage.size());
    }

    void Communicator::sendRaw(const std::string &payload)
    {
        socket->send(zmq::buffer(payload), zmq::send_flags::none);
    }

    TEST_CASE("Communicator")
    {
        auto context = std::make_shared<zmq::context_t>(1);
        Communicator server(context, "inproc://communicator-test", SocketRole::Bind, 1000);
        Communicator client(context, "inproc://communicator-test", SocketRole::Connect, 1000);

        SUBCASE("Requests arrive with method and parameters")
        {
            auto param = std::make_shared<makeParam>();
            param->envName = "CartPole-v1";
            param->numEnv = 1;
            client.sendRequest(Request<makeParam>("make", param));

            auto received = server.getResponse<Request<makeParam>>();
            REQUIRE(received != nullptr);
            CHECK(received->method == "make");
            REQUIRE(received->param != nullptr);
            CHECK(received->param->envName == "CartPole-v1");
            CHECK(received->param->numEnv == 1);
        }

        SUBCASE("Headers defer parameter decoding")
        {
            auto param = std::make_shared<SaveParam>();
            param->path = "/tmp/model.pt";
            client.sendRequest(Request<SaveParam>("save", param));

            auto payload = server.getRawResponse();
            REQUIRE(payload.has_value());
            auto handle = msgpack::unpack(payload->data(), payload->size());
            auto header = handle.get().as<RequestHeader>();

            CHECK(header.method == "save");
            CHECK(header.param.as<SaveParam>().path == "/tmp/model.pt");
        }

        SUBCASE("Undecodable payload yields nullptr")
        {
            client.sendRaw("\xc1");
            CHECK(server.getResponse<MakeResponse>() == nullptr);
        }

        SUBCASE("Wrong message type yields nullptr")
        {
            msgpack::sbuffer buffer;
            msgpack::pack(buffer, std::string("not a map"));
            client.sendRaw(std::string(buffer.data(), buffer.size()));
            CHECK(server.getResponse<InfoResponse>() == nullptr);
        }

        SUBCASE("Receive timeout yields nullptr")
        {
            Communicator lonely(context, "inproc://communicator-timeout", SocketRole::Bind, 50);
            CHECK(lonely.getResponse<MakeResponse>() == nullptr);
        }
    }
}
