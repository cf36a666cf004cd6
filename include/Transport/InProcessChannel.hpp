#pragma once

#ifndef SIMPLERL_TRANSPORT_INPROCESSCHANNEL_HPP
#define SIMPLERL_TRANSPORT_INPROCESSCHANNEL_HPP

#include<condition_variable>
#include<deque>
#include<memory>
#include<mutex>
#include<utility>

#include"Transport.hpp"

namespace SimpleRL
{
    /**
     * @class InProcessChannel
     * @brief Thread-safe in-memory Transport, created in connected pairs.
     *
     * What one end sends the other end receives. Both ends may live in different
     * threads; each end itself is used by one thread at a time.
     */
    class InProcessChannel : public Transport
    {
    private:
        struct Queue
        {
            std::mutex mutex;
            std::condition_variable ready;
            std::deque<Blob> blobs;
        };

        std::shared_ptr<Queue> inbox;
        std::shared_ptr<Queue> outbox;

        InProcessChannel(std::shared_ptr<Queue> inbox, std::shared_ptr<Queue> outbox);

    public:
        static std::pair<std::unique_ptr<InProcessChannel>, std::unique_ptr<InProcessChannel>> makePair();

        void send(const Blob &blob) override;

        std::optional<Blob> tryReceive(std::chrono::milliseconds timeout) override;

        /** @return Blobs waiting to be received by this end */
        size_t pending() const;
    };
}

#endif //SIMPLERL_TRANSPORT_INPROCESSCHANNEL_HPP
