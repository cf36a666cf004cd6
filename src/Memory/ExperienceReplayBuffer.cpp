#include<doctest/doctest.h>

#include"../../include/Errors.hpp"
#include"../../include/Memory/ExperienceReplayBuffer.hpp"
#include"../../include/Memory/MemorySnapshot.hpp"
#include"../../include/Space/ContinuousSpace.hpp"
#include"../../include/Space/DiscreteSpace.hpp"

namespace SimpleRL
{
    ExperienceReplayBuffer::ExperienceReplayBuffer(RLConfig config, RLSpaces spaces) :
    ReplayMemory(std::move(config), std::move(spaces)),
    capacity(0)
    {
        const auto configured = this->config.getInt("memoryCapacity");
        if (configured <= 0)
        {
            throw std::invalid_argument("memoryCapacity must be positive");
        }
        capacity = static_cast<size_t>(configured);
    }

    const char *ExperienceReplayBuffer::typeTag()
    {
        return "ExperienceReplayBuffer";
    }

    bool ExperienceReplayBuffer::add(const Experience &experience)
    {
        if (!seen.insert(experience.id))
        {
            return false;
        }
        if (buffer.size() < capacity)
        {
            buffer.push_back(experience);
        }
        else
        {
            buffer[next] = experience;
        }
        next = (next + 1) % capacity;
        return true;
    }

    size_t ExperienceReplayBuffer::length() const
    {
        return buffer.size();
    }

    size_t ExperienceReplayBuffer::merge(const Blob &blob)
    {
        auto decoded = decodeMemoryBlob(blob, typeTag(), blobVersion, spaces);
        size_t added = 0;
        for (const auto &experience : decoded.experiences)
        {
            added += add(experience) ? 1 : 0;
        }
        return added;
    }

    void ExperienceReplayBuffer::clear()
    {
        buffer.clear();
        next = 0;
    }

    Blob ExperienceReplayBuffer::backup() const
    {
        MemorySnapshot snapshot;
        snapshot.spaces = spaces.describe();
        // oldest first, so a restored buffer overwrites in the same order
        for (size_t i = 0; i < buffer.size(); ++i)
        {
            const auto index = buffer.size() < capacity ? i : (next + i) % capacity;
            snapshot.experiences.push_back(ExperienceData::encode(buffer[index]));
        }
        snapshot.seen = seen.describe();
        return packBlob(typeTag(), blobVersion, snapshot);
    }

    void ExperienceReplayBuffer::restore(const Blob &blob)
    {
        auto decoded = decodeMemoryBlob(blob, typeTag(), blobVersion, spaces);
        auto &experiences = decoded.experiences;
        if (experiences.size() > capacity)
        {
            experiences.erase(experiences.begin(),
                              experiences.begin() + static_cast<std::ptrdiff_t>(experiences.size() - capacity));
        }
        buffer = std::move(experiences);
        next = buffer.size() % capacity;
        seen = std::move(decoded.seen);
    }

    ReplayBatch ExperienceReplayBuffer::sample(size_t batchSize, int64_t step)
    {
        if (buffer.size() < batchSize)
        {
            throw InsufficientDataError("ExperienceReplayBuffer holds " + std::to_string(buffer.size()) +
                                        " transitions, batch needs " + std::to_string(batchSize));
        }
        auto order = torch::randperm(static_cast<int64_t>(buffer.size()), torch::TensorOptions().dtype(torch::kLong));

        ReplayBatch batch;
        for (size_t i = 0; i < batchSize; ++i)
        {
            batch.experiences.push_back(buffer[static_cast<size_t>(order[static_cast<int64_t>(i)].item<int64_t>())]);
        }
        batch.weights.assign(batchSize, 1.0f);
        return batch;
    }

    void ExperienceReplayBuffer::update(ReplayBatch batch, const std::vector<float> &tdErrors)
    {
    }

    TEST_CASE("ExperienceReplayBuffer")
    {
        RLSpaces spaces;
        spaces.actionSpace = std::make_shared<DiscreteSpace>(2);
        spaces.observationSpace = std::make_shared<ContinuousSpace>(-1.0, 1.0);
        spaces.observationType = EnvObservationType::CONTINUOUS;
        RLConfig config("DQN", RLActionType::DISCRETE, RLObservationType::CONTINUOUS, {{"memoryCapacity", 3}});

        ExperienceReplayBuffer memory(config, spaces);
        auto experience = [](uint64_t sequence) {
            Experience result;
            result.id = {0, sequence};
            result.state = ContinuousSpace::value(0.5f);
            result.action = DiscreteSpace::value(1);
            result.reward = static_cast<float>(sequence);
            result.nextState = ContinuousSpace::value(0.25f);
            return result;
        };

        SUBCASE("Overwrites the oldest transition when full")
        {
            for (uint64_t i = 1; i <= 5; ++i)
            {
                memory.add(experience(i));
            }
            CHECK(memory.length() == 3);

            auto batch = memory.sample(3, 0);
            std::set<float> rewards;
            for (const auto &sampled : batch.experiences)
            {
                rewards.insert(sampled.reward);
            }
            CHECK(rewards == std::set<float>{3.0f, 4.0f, 5.0f});
            CHECK(batch.weights == std::vector<float>(3, 1.0f));
        }

        SUBCASE("Restore keeps the newest transitions")
        {
            for (uint64_t i = 1; i <= 4; ++i)
            {
                memory.add(experience(i));
            }
            ExperienceReplayBuffer copy(config, spaces);
            copy.restore(memory.backup());
            copy.add(experience(6));

            std::set<float> rewards;
            for (const auto &sampled : copy.sample(3, 0).experiences)
            {
                rewards.insert(sampled.reward);
            }
            CHECK(rewards == std::set<float>{3.0f, 4.0f, 6.0f});
        }

        SUBCASE("Small memories refuse to sample")
        {
            memory.add(experience(1));
            CHECK_THROWS_AS(memory.sample(2, 0), InsufficientDataError);
        }
    }
}
