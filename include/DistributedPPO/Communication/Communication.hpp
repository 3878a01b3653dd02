#pragma once
/**
 * @file Communication.hpp
 * @brief ZeroMQ PAIR socket carrying MessagePack requests and replies.
 *
 * The same class serves both ends used in this project: the gym client side
 * of GymEnvironment (connects, 5 s receive timeout) and the worker server
 * (binds, waits forever).
 */

#ifndef DISTRIBUTEDPPO_COMMUNICATION_HPP
#define DISTRIBUTEDPPO_COMMUNICATION_HPP

#include<cstring>
#include<memory>
#include<optional>
#include<string>

#include<fmt/ostream.h>
#include<msgpack.hpp>
#include<spdlog/spdlog.h>
#include<zmq.hpp>

#include"Request.hpp"

namespace DistributedPPO
{
    enum class SocketRole
    {
        Connect,  ///< Client end, connects to a listening peer
        Bind      ///< Server end, listens on the url
    };

    /**
     * @class Communicator
     * @brief One ZeroMQ PAIR socket plus the MessagePack codec around it
     *
     * Receiving honours the configured timeout; a timeout is reported as an
     * empty result rather than an exception so callers can decide whether it
     * is fatal.
     */
    class Communicator
    {
    private:
        std::shared_ptr<zmq::context_t> context;  ///< Shared so inproc peers can use the same context
        std::unique_ptr<zmq::socket_t> socket;

    public:
        /**
         * @param url ZeroMQ endpoint, e.g. "tcp://127.0.0.1:10201"
         * @param role Whether to connect to or bind on `url`
         * @param receiveTimeoutMs Receive timeout in milliseconds, -1 blocks forever
         *
         * @throws zmq::error_t if the endpoint cannot be connected or bound
         */
        Communicator(const std::string &url,
                     SocketRole role = SocketRole::Connect,
                     int receiveTimeoutMs = 5000);

        /**
         * @brief Same as above on an existing context.
         */
        Communicator(std::shared_ptr<zmq::context_t> context,
                     const std::string &url,
                     SocketRole role,
                     int receiveTimeoutMs);

        ~Communicator();

        Communicator(const Communicator &) = delete;
        Communicator &operator=(const Communicator &) = delete;

        /**
         * @brief Receives one message as raw bytes.
         *
         * @return The payload, or an empty optional on timeout.
         */
        std::optional<std::string> getRawResponse();

        void sendRaw(const std::string &payload);

        /**
         * @brief Receives and decodes one message.
         *
         * @tparam T MessagePack-decodable response type
         * @return The decoded response, or nullptr on timeout or when the
         *         payload cannot be decoded as T (the error is logged).
         */
        template<typename T>
        std::unique_ptr<T> getResponse()
        {
            auto payload = getRawResponse();
            if (!payload)
            {
                spdlog::error("Timeout waiting for response");
                return nullptr;
            }

            msgpack::object_handle objectHandle;
            try
            {
                objectHandle = msgpack::unpack(payload->data(), payload->size());
            }
            catch (const msgpack::unpack_error &error)
            {
                spdlog::error("Received a message that is not MessagePack: {}", error.what());
                return nullptr;
            }

            msgpack::object object = objectHandle.get();
            auto response = std::make_unique<T>();
            try
            {
                object.convert(*response);
            }
            catch (const msgpack::type_error &error)
            {
                spdlog::error("Communication error {}: {}", error.what(), fmt::streamed(object));
                return nullptr;
            }
            return response;
        }

        /**
         * @brief Encodes `request` and sends it.
         *
         * @throws zmq::error_t if sending fails
         */
        template<class T>
        void sendRequest(const Request<T> &request)
        {
            msgpack::sbuffer buffer;
            msgpack::pack(buffer, request);

            zmq::message_t message(buffer.size());
            std::memcpy(message.data(), buffer.data(), buffer.size());
            socket->send(message, zmq::send_flags::none);
        }
    };
}

#endif //DISTRIBUTEDPPO_COMMUNICATION_HPP
