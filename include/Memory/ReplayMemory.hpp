#pragma once

#ifndef SIMPLERL_MEMORY_REPLAYMEMORY_HPP
#define SIMPLERL_MEMORY_REPLAYMEMORY_HPP

#include<cstdint>
#include<vector>

#include"../RL/RLRemoteMemory.hpp"

namespace SimpleRL
{
    /**
     * @struct ReplayBatch
     * @brief Transitions drawn for one optimization step with their importance weights.
     */
    struct ReplayBatch
    {
        std::vector<Experience> experiences;
        std::vector<float> weights;
    };

    /**
     * @class ReplayMemory
     * @brief Memory that samples mini batches instead of draining in order.
     *
     * Every sample() is answered by exactly one update() carrying the TD errors
     * of the sampled transitions, which prioritized memories use to re-rank them.
     */
    class ReplayMemory : public RLRemoteMemory
    {
    public:
        using RLRemoteMemory::RLRemoteMemory;

        /**
         * @param step trainer step count, used to anneal importance weights
         * @throws InsufficientDataError if fewer than `batchSize` transitions are stored
         */
        virtual ReplayBatch sample(size_t batchSize, int64_t step) = 0;

        virtual void update(ReplayBatch batch, const std::vector<float> &tdErrors) = 0;
    };
}

#endif //SIMPLERL_MEMORY_REPLAYMEMORY_HPP
