#include<algorithm>
#include<cmath>

#include<doctest/doctest.h>

#include"../../include/Errors.hpp"
#include"../../include/Memory/MemorySnapshot.hpp"
#include"../../include/Memory/RankBaseMemory.hpp"
#include"../../include/Space/ArrayContinuousSpace.hpp"
#include"../../include/Space/DiscreteSpace.hpp"

namespace SimpleRL
{
    double rankSum(double k, double alpha)
    {
        return k * (2.0 + (k - 1.0) * alpha) / 2.0;
    }

    double rankSumInverse(double sum, double alpha)
    {
        if (alpha == 0.0)
        {
            return sum;
        }
        const double t = alpha - 2.0 + std::sqrt((2.0 - alpha) * (2.0 - alpha) + 8.0 * alpha * sum);
        return t / (2.0 * alpha);
    }

    RankBaseMemory::RankBaseMemory(RLConfig config, RLSpaces spaces) :
    ReplayMemory(std::move(config), std::move(spaces)),
    capacity(0),
    alpha(this->config.get("alpha")),
    betaInitial(this->config.get("betaInitial")),
    betaSteps(this->config.get("betaSteps"))
    {
        const auto configured = this->config.getInt("memoryCapacity");
        if (configured <= 0)
        {
            throw std::invalid_argument("memoryCapacity must be positive");
        }
        if (alpha < 0.0 || betaSteps <= 0.0)
        {
            throw std::invalid_argument("RankBaseMemory needs alpha >= 0 and betaSteps > 0");
        }
        capacity = static_cast<size_t>(configured);
    }

    const char *RankBaseMemory::typeTag()
    {
        return "RankBaseMemory";
    }

    void RankBaseMemory::insert(float priority, Experience experience)
    {
        if (items.size() >= capacity)
        {
            items.erase(items.begin());
        }
        auto position = std::upper_bound(items.begin(), items.end(), priority,
                                         [](float value, const Item &item) { return value < item.priority; });
        items.insert(position, Item{priority, std::move(experience)});
    }

    bool RankBaseMemory::add(const Experience &experience)
    {
        if (!seen.insert(experience.id))
        {
            return false;
        }
        insert(maxPriority, experience);
        return true;
    }

    size_t RankBaseMemory::length() const
    {
        return items.size();
    }

    size_t RankBaseMemory::merge(const Blob &blob)
    {
        auto decoded = decodeMemoryBlob(blob, typeTag(), blobVersion, spaces);
        size_t added = 0;
        for (const auto &experience : decoded.experiences)
        {
            added += add(experience) ? 1 : 0;
        }
        return added;
    }

    void RankBaseMemory::clear()
    {
        items.clear();
    }

    Blob RankBaseMemory::backup() const
    {
        MemorySnapshot snapshot;
        snapshot.spaces = spaces.describe();
        for (const auto &item : items)
        {
            snapshot.experiences.push_back(ExperienceData::encode(item.experience));
            snapshot.priorities.push_back(item.priority);
        }
        snapshot.seen = seen.describe();
        snapshot.maxPriority = maxPriority;
        return packBlob(typeTag(), blobVersion, snapshot);
    }

    void RankBaseMemory::restore(const Blob &blob)
    {
        auto decoded = decodeMemoryBlob(blob, typeTag(), blobVersion, spaces);
        if (decoded.priorities.size() != decoded.experiences.size())
        {
            throw IncompatibleRestoreError("RankBaseMemory snapshot carries no priorities");
        }

        std::vector<Item> restored;
        restored.reserve(decoded.experiences.size());
        for (size_t i = 0; i < decoded.experiences.size(); ++i)
        {
            restored.push_back(Item{decoded.priorities[i], std::move(decoded.experiences[i])});
        }
        std::stable_sort(restored.begin(), restored.end(),
                         [](const Item &a, const Item &b) { return a.priority < b.priority; });
        if (restored.size() > capacity)
        {
            restored.erase(restored.begin(), restored.begin() + static_cast<std::ptrdiff_t>(restored.size() - capacity));
        }

        items = std::move(restored);
        maxPriority = decoded.maxPriority;
        seen = std::move(decoded.seen);
    }

    ReplayBatch RankBaseMemory::sample(size_t batchSize, int64_t step)
    {
        if (items.size() < batchSize)
        {
            throw InsufficientDataError("RankBaseMemory holds " + std::to_string(items.size()) +
                                        " transitions, batch needs " + std::to_string(batchSize));
        }

        const double beta = std::min(1.0, betaInitial + (1.0 - betaInitial) * static_cast<double>(step) / betaSteps);
        const auto memorySize = static_cast<double>(items.size());
        const double total = rankSum(memorySize, alpha);

        std::vector<size_t> indices;
        while (indices.size() < batchSize)
        {
            const double r = torch::rand({1}, torch::TensorOptions().dtype(torch::kDouble)).item<double>() * total;
            auto index = static_cast<size_t>(rankSumInverse(r, alpha));
            index = std::min(index, items.size() - 1);
            if (std::find(indices.begin(), indices.end(), index) == indices.end())
            {
                indices.push_back(index);
            }
        }
        // take from the back so earlier indices stay valid
        std::sort(indices.rbegin(), indices.rend());

        ReplayBatch batch;
        float maxWeight = 0.0f;
        for (auto index : indices)
        {
            const double probability = (rankSum(static_cast<double>(index) + 1.0, alpha) -
                                        rankSum(static_cast<double>(index), alpha)) / total;
            const auto weight = static_cast<float>(std::pow(memorySize * probability, -beta));
            maxWeight = std::max(maxWeight, weight);

            batch.experiences.push_back(std::move(items[index].experience));
            batch.weights.push_back(weight);
            items.erase(items.begin() + static_cast<std::ptrdiff_t>(index));
        }
        for (auto &weight : batch.weights)
        {
            weight /= maxWeight;
        }
        return batch;
    }

    void RankBaseMemory::update(ReplayBatch batch, const std::vector<float> &tdErrors)
    {
        if (tdErrors.size() != batch.experiences.size())
        {
            throw std::invalid_argument("RankBaseMemory::update needs one TD error per sampled transition");
        }
        for (size_t i = 0; i < batch.experiences.size(); ++i)
        {
            const float priority = std::abs(tdErrors[i]);
            maxPriority = std::max(maxPriority, priority);
            insert(priority, std::move(batch.experiences[i]));
        }
    }

    std::vector<float> RankBaseMemory::getPriorities() const
    {
        std::vector<float> priorities;
        for (const auto &item : items)
        {
            priorities.push_back(item.priority);
        }
        return priorities;
    }

    TEST_CASE("RankBaseMemory")
    {
        torch::manual_seed(2);

        RLSpaces spaces;
        spaces.actionSpace = std::make_shared<DiscreteSpace>(2);
        spaces.observationSpace = std::make_shared<ArrayContinuousSpace>(2, -1.0, 1.0);
        spaces.observationType = EnvObservationType::CONTINUOUS;
        RLConfig config("DQN", RLActionType::DISCRETE, RLObservationType::CONTINUOUS,
                        {{"memoryCapacity", 8}, {"alpha", 1.0}, {"betaInitial", 0.4}, {"betaSteps", 100}});

        RankBaseMemory memory(config, spaces);
        auto experience = [](uint64_t sequence) {
            Experience result;
            result.id = {0, sequence};
            result.state = torch::zeros({2});
            result.action = DiscreteSpace::value(0);
            result.reward = static_cast<float>(sequence);
            result.nextState = torch::zeros({2});
            return result;
        };

        SUBCASE("Rank sums invert")
        {
            for (double alpha : {0.0, 0.5, 1.0, 2.0})
            {
                for (double k : {0.0, 1.0, 3.5, 10.0})
                {
                    CHECK(rankSumInverse(rankSum(k, alpha), alpha) == doctest::Approx(k));
                }
            }
        }

        SUBCASE("Sampling removes and update re-ranks")
        {
            for (uint64_t i = 1; i <= 6; ++i)
            {
                memory.add(experience(i));
            }
            auto batch = memory.sample(4, 0);
            CHECK(batch.experiences.size() == 4);
            CHECK(memory.length() == 2);
            CHECK(*std::max_element(batch.weights.begin(), batch.weights.end()) == doctest::Approx(1.0f));

            memory.update(std::move(batch), {0.1f, 5.0f, 0.2f, 0.3f});
            CHECK(memory.length() == 6);
            CHECK(memory.getMaxPriority() == doctest::Approx(5.0f));
            auto priorities = memory.getPriorities();
            CHECK(std::is_sorted(priorities.begin(), priorities.end()));
            CHECK(priorities.back() == doctest::Approx(5.0f));
        }

        SUBCASE("Evicts the lowest priority when full")
        {
            for (uint64_t i = 1; i <= 8; ++i)
            {
                memory.add(experience(i));
            }
            auto batch = memory.sample(1, 0);
            memory.update(std::move(batch), {0.01f});
            memory.add(experience(9));
            CHECK(memory.length() == 8);
            CHECK(memory.getPriorities().front() == doctest::Approx(1.0f));
        }

        SUBCASE("Backup keeps priorities")
        {
            for (uint64_t i = 1; i <= 4; ++i)
            {
                memory.add(experience(i));
            }
            memory.update(memory.sample(2, 0), {3.0f, 0.5f});

            RankBaseMemory copy(config, spaces);
            copy.restore(memory.backup());
            CHECK(copy.getPriorities() == memory.getPriorities());
            CHECK(copy.getMaxPriority() == memory.getMaxPriority());
            CHECK_FALSE(copy.add(experience(1)));
        }
    }
}
