#include<thread>

#include<doctest/doctest.h>

#include"../../include/Transport/InProcessChannel.hpp"

namespace SimpleRL
{
    InProcessChannel::InProcessChannel(std::shared_ptr<Queue> inbox, std::shared_ptr<Queue> outbox) :
    inbox(std::move(inbox)),
    outbox(std::move(outbox))
    {
    }

    std::pair<std::unique_ptr<InProcessChannel>, std::unique_ptr<InProcessChannel>> InProcessChannel::makePair()
    {
        auto forward = std::make_shared<Queue>();
        auto backward = std::make_shared<Queue>();
        std::unique_ptr<InProcessChannel> first(new InProcessChannel(backward, forward));
        std::unique_ptr<InProcessChannel> second(new InProcessChannel(forward, backward));
        return {std::move(first), std::move(second)};
    }

    void InProcessChannel::send(const Blob &blob)
    {
        {
            std::lock_guard<std::mutex> lock(outbox->mutex);
            outbox->blobs.push_back(blob);
        }
        outbox->ready.notify_one();
    }

    std::optional<Blob> InProcessChannel::tryReceive(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(inbox->mutex);
        if (!inbox->ready.wait_for(lock, timeout, [this] { return !inbox->blobs.empty(); }))
        {
            return std::nullopt;
        }
        Blob blob = std::move(inbox->blobs.front());
        inbox->blobs.pop_front();
        return blob;
    }

    size_t InProcessChannel::pending() const
    {
        std::lock_guard<std::mutex> lock(inbox->mutex);
        return inbox->blobs.size();
    }

    TEST_CASE("InProcessChannel")
    {
        auto channel = InProcessChannel::makePair();
        auto &actor = *channel.first;
        auto &learner = *channel.second;

        SUBCASE("Delivers in order to the other end")
        {
            Blob first;
            first.typeTag = "first";
            Blob second;
            second.typeTag = "second";
            actor.send(first);
            actor.send(second);

            CHECK(actor.pending() == 0);
            CHECK(learner.pending() == 2);
            CHECK(learner.tryReceive(std::chrono::milliseconds(0))->typeTag == "first");
            CHECK(learner.tryReceive(std::chrono::milliseconds(0))->typeTag == "second");
        }

        SUBCASE("Times out when nothing arrives")
        {
            CHECK_FALSE(learner.tryReceive(std::chrono::milliseconds(10)).has_value());
        }

        SUBCASE("Wakes a waiting receiver")
        {
            std::thread sender([&actor] {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                Blob blob;
                blob.sequence = 9;
                actor.send(blob);
            });
            auto received = learner.tryReceive(std::chrono::seconds(5));
            sender.join();
            REQUIRE(received.has_value());
            CHECK(received->sequence == 9);
        }
    }
}
