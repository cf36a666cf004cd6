#pragma once

#ifndef SIMPLERL_MEMORY_SEQUENCEREMOTEMEMORY_HPP
#define SIMPLERL_MEMORY_SEQUENCEREMOTEMEMORY_HPP

#include<deque>
#include<vector>

#include"../RL/RLRemoteMemory.hpp"

namespace SimpleRL
{
    /**
     * @class SequenceRemoteMemory
     * @brief FIFO queue of transitions, drained by the trainer in arrival order.
     */
    class SequenceRemoteMemory : public RLRemoteMemory
    {
    private:
        std::deque<Experience> buffer;
        ExperienceIdSet seen;

    public:
        static constexpr uint32_t blobVersion = 1;

        SequenceRemoteMemory(RLConfig config, RLSpaces spaces);

        bool add(const Experience &experience) override;

        size_t length() const override;

        size_t merge(const Blob &blob) override;

        void clear() override;

        Blob backup() const override;

        void restore(const Blob &blob) override;

        /**
         * @brief Removes and returns the `count` oldest transitions.
         * @throws InsufficientDataError if fewer are stored; nothing is removed then
         */
        std::vector<Experience> pop(size_t count);

        static const char *typeTag();
    };
}

#endif //SIMPLERL_MEMORY_SEQUENCEREMOTEMEMORY_HPP
