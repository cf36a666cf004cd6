#pragma once

#ifndef SIMPLERL_TRANSPORT_ZMQTRANSPORT_HPP
#define SIMPLERL_TRANSPORT_ZMQTRANSPORT_HPP

#include<memory>
#include<string>

#include<zmq.hpp>

#include"Transport.hpp"

namespace SimpleRL
{
    /**
     * @class ZmqTransport
     * @brief Transport over a ZeroMQ PAIR socket, one message frame per Blob.
     *
     * The learner binds, each actor connects to its own learner endpoint.
     * Socket failures surface as zmq::error_t; a receive timeout is not an error.
     */
    class ZmqTransport : public Transport
    {
    public:
        enum class Mode
        {
            BIND,
            CONNECT
        };

    private:
        std::shared_ptr<zmq::context_t> context; ///< ZeroMQ context for socket management
        std::unique_ptr<zmq::socket_t> socket;   ///< PAIR socket, closed before the context
        std::string url;

    public:
        /**
         * @param url ZeroMQ endpoint, e.g. "tcp://127.0.0.1:5555" or "inproc://learner"
         * @param context context to open the socket in, required to share inproc
         *                endpoints; a private one is created when null
         * @throws zmq::error_t if the socket cannot bind or connect
         */
        ZmqTransport(const std::string &url, Mode mode, std::shared_ptr<zmq::context_t> context = nullptr);

        void send(const Blob &blob) override;

        /** @throws IncompatibleRestoreError if the frame is not a Blob */
        std::optional<Blob> tryReceive(std::chrono::milliseconds timeout) override;

        inline const std::string &getUrl() const
        {
            return url;
        }
    };
}

#endif //SIMPLERL_TRANSPORT_ZMQTRANSPORT_HPP
