#pragma once

#ifndef SIMPLERL_MEMORY_RANKBASEMEMORY_HPP
#define SIMPLERL_MEMORY_RANKBASEMEMORY_HPP

#include<vector>

#include"ReplayMemory.hpp"

namespace SimpleRL
{
    /**
     * @class RankBaseMemory
     * @brief Prioritized replay where the sampling probability grows linearly with rank.
     *
     * Transitions are kept sorted by priority (|TD error|), lowest first. The
     * transition at rank i (0 = lowest priority) is drawn with probability
     * proportional to 1 + i * alpha, so alpha = 0 is uniform sampling. New
     * transitions enter with the highest priority seen so far. When full, the
     * lowest-priority transition is evicted.
     *
     * sample() takes the drawn transitions out of the memory; update() puts them
     * back with their new priorities.
     *
     * Importance weights are (N * P(i))^-beta normalized by their maximum, with
     * beta annealed linearly from betaInitial to 1 over betaSteps trainer steps.
     *
     * Config keys: memoryCapacity, alpha, betaInitial, betaSteps.
     */
    class RankBaseMemory : public ReplayMemory
    {
    private:
        struct Item
        {
            float priority;
            Experience experience;
        };

        size_t capacity;
        double alpha;
        double betaInitial;
        double betaSteps;

        std::vector<Item> items;
        float maxPriority = 1.0f;
        ExperienceIdSet seen;

        void insert(float priority, Experience experience);

    public:
        static constexpr uint32_t blobVersion = 1;

        RankBaseMemory(RLConfig config, RLSpaces spaces);

        bool add(const Experience &experience) override;

        size_t length() const override;

        size_t merge(const Blob &blob) override;

        void clear() override;

        Blob backup() const override;

        void restore(const Blob &blob) override;

        ReplayBatch sample(size_t batchSize, int64_t step) override;

        void update(ReplayBatch batch, const std::vector<float> &tdErrors) override;

        inline float getMaxPriority() const
        {
            return maxPriority;
        }

        /** @return priorities from lowest to highest */
        std::vector<float> getPriorities() const;

        static const char *typeTag();
    };

    /** @brief Sum of the unnormalized probabilities of ranks [0, k). */
    double rankSum(double k, double alpha);

    /** @brief Inverse of rankSum() in k. */
    double rankSumInverse(double sum, double alpha);
}

#endif //SIMPLERL_MEMORY_RANKBASEMEMORY_HPP
