#pragma once

#ifndef SIMPLERL_TRANSPORT_TRANSPORT_HPP
#define SIMPLERL_TRANSPORT_TRANSPORT_HPP

#include<chrono>
#include<optional>

#include"../Blob.hpp"

namespace SimpleRL
{
    /**
     * @class Transport
     * @brief One end of a bidirectional Blob channel between an actor and the learner.
     *
     * Delivery is ordered per channel but callers must not depend on it: experience
     * may arrive twice and parameters may be overtaken by newer ones.
     */
    class Transport
    {
    public:
        virtual ~Transport() = default;

        virtual void send(const Blob &blob) = 0;

        /**
         * @return the next Blob, or std::nullopt if none arrived within `timeout`
         * @throws IncompatibleRestoreError if the next frame is not a Blob. The frame
         *         is consumed, so the following call reads past it.
         */
        virtual std::optional<Blob> tryReceive(std::chrono::milliseconds timeout) = 0;
    };
}

#endif //SIMPLERL_TRANSPORT_TRANSPORT_HPP
