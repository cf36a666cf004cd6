#include<doctest/doctest.h>
#include<spdlog/spdlog.h>

#include"../../include/Errors.hpp"
#include"../../include/Transport/ZmqTransport.hpp"

namespace SimpleRL
{
    ZmqTransport::ZmqTransport(const std::string &url, Mode mode, std::shared_ptr<zmq::context_t> context) :
    context(context ? std::move(context) : std::make_shared<zmq::context_t>(1)),
    url(url)
    {
        socket = std::make_unique<zmq::socket_t>(*this->context, zmq::socket_type::pair);
        socket->set(zmq::sockopt::linger, 0);

        if (mode == Mode::BIND)
        {
            socket->bind(url);
            spdlog::info("Listening for peers at: {}", url);
        }
        else
        {
            socket->connect(url);
            spdlog::info("Connected to peer at: {}", url);
        }
    }

    void ZmqTransport::send(const Blob &blob)
    {
        const auto bytes = blob.toBytes();
        zmq::message_t message(bytes.data(), bytes.size());
        socket->send(message, zmq::send_flags::none);
    }

    std::optional<Blob> ZmqTransport::tryReceive(std::chrono::milliseconds timeout)
    {
        socket->set(zmq::sockopt::rcvtimeo, static_cast<int>(timeout.count()));

        zmq::message_t message;
        const auto received = socket->recv(message, zmq::recv_flags::none);
        if (!received)
        {
            return std::nullopt;
        }
        return Blob::fromBytes(message.to_string());
    }

    TEST_CASE("ZmqTransport")
    {
        auto context = std::make_shared<zmq::context_t>(1);
        ZmqTransport learner("inproc://simple-rl-test", ZmqTransport::Mode::BIND, context);
        ZmqTransport actor("inproc://simple-rl-test", ZmqTransport::Mode::CONNECT, context);

        SUBCASE("Carries one Blob per frame in both directions")
        {
            Blob blob;
            blob.typeTag = "QL/Memory";
            blob.version = 1;
            blob.sequence = 4;
            blob.payload = {'a', 'b'};
            actor.send(blob);

            auto received = learner.tryReceive(std::chrono::seconds(5));
            REQUIRE(received.has_value());
            CHECK(received->typeTag == "QL/Memory");
            CHECK(received->sequence == 4);
            CHECK(received->payload == std::vector<char>{'a', 'b'});

            learner.send(*received);
            CHECK(actor.tryReceive(std::chrono::seconds(5)).has_value());
        }

        SUBCASE("Frames that are not Blobs are refused one at a time")
        {
            ZmqTransport listener("inproc://simple-rl-raw", ZmqTransport::Mode::BIND, context);
            zmq::socket_t raw(*context, zmq::socket_type::pair);
            raw.set(zmq::sockopt::linger, 0);
            raw.connect("inproc://simple-rl-raw");

            const std::string garbage = "\xc1 not a blob";
            raw.send(zmq::buffer(garbage), zmq::send_flags::none);
            Blob blob;
            blob.typeTag = "QL/Memory";
            const auto bytes = blob.toBytes();
            raw.send(zmq::buffer(bytes), zmq::send_flags::none);

            CHECK_THROWS_AS(listener.tryReceive(std::chrono::seconds(5)), IncompatibleRestoreError);
            auto received = listener.tryReceive(std::chrono::seconds(5));
            REQUIRE(received.has_value());
            CHECK(received->typeTag == "QL/Memory");
        }

        SUBCASE("A receive timeout yields nothing")
        {
            CHECK_FALSE(learner.tryReceive(std::chrono::milliseconds(10)).has_value());
        }
    }
}
