#pragma once

#ifndef SIMPLERL_MEMORY_EXPERIENCEREPLAYBUFFER_HPP
#define SIMPLERL_MEMORY_EXPERIENCEREPLAYBUFFER_HPP

#include<vector>

#include"ReplayMemory.hpp"

namespace SimpleRL
{
    /**
     * @class ExperienceReplayBuffer
     * @brief Ring buffer of `memoryCapacity` transitions sampled uniformly.
     */
    class ExperienceReplayBuffer : public ReplayMemory
    {
    private:
        size_t capacity;
        std::vector<Experience> buffer;
        size_t next = 0;
        ExperienceIdSet seen;

    public:
        static constexpr uint32_t blobVersion = 1;

        /** @throws std::invalid_argument if the config has no positive "memoryCapacity" */
        ExperienceReplayBuffer(RLConfig config, RLSpaces spaces);

        bool add(const Experience &experience) override;

        size_t length() const override;

        size_t merge(const Blob &blob) override;

        void clear() override;

        Blob backup() const override;

        void restore(const Blob &blob) override;

        ReplayBatch sample(size_t batchSize, int64_t step) override;

        void update(ReplayBatch batch, const std::vector<float> &tdErrors) override;

        static const char *typeTag();
    };
}

#endif //SIMPLERL_MEMORY_EXPERIENCEREPLAYBUFFER_HPP
