#include<doctest/doctest.h>

#include"../../include/Errors.hpp"
#include"../../include/Memory/MemorySnapshot.hpp"
#include"../../include/Memory/SequenceRemoteMemory.hpp"
#include"../../include/Space/ArrayDiscreteSpace.hpp"
#include"../../include/Space/DiscreteSpace.hpp"

namespace SimpleRL
{
    SequenceRemoteMemory::SequenceRemoteMemory(RLConfig config, RLSpaces spaces) :
    RLRemoteMemory(std::move(config), std::move(spaces))
    {
    }

    const char *SequenceRemoteMemory::typeTag()
    {
        return "SequenceRemoteMemory";
    }

    bool SequenceRemoteMemory::add(const Experience &experience)
    {
        if (!seen.insert(experience.id))
        {
            return false;
        }
        buffer.push_back(experience);
        return true;
    }

    size_t SequenceRemoteMemory::length() const
    {
        return buffer.size();
    }

    size_t SequenceRemoteMemory::merge(const Blob &blob)
    {
        auto decoded = decodeMemoryBlob(blob, typeTag(), blobVersion, spaces);
        size_t added = 0;
        for (const auto &experience : decoded.experiences)
        {
            added += add(experience) ? 1 : 0;
        }
        return added;
    }

    void SequenceRemoteMemory::clear()
    {
        buffer.clear();
    }

    Blob SequenceRemoteMemory::backup() const
    {
        MemorySnapshot snapshot;
        snapshot.spaces = spaces.describe();
        for (const auto &experience : buffer)
        {
            snapshot.experiences.push_back(ExperienceData::encode(experience));
        }
        snapshot.seen = seen.describe();
        return packBlob(typeTag(), blobVersion, snapshot);
    }

    void SequenceRemoteMemory::restore(const Blob &blob)
    {
        auto decoded = decodeMemoryBlob(blob, typeTag(), blobVersion, spaces);
        buffer.assign(decoded.experiences.begin(), decoded.experiences.end());
        seen = std::move(decoded.seen);
    }

    std::vector<Experience> SequenceRemoteMemory::pop(size_t count)
    {
        if (buffer.size() < count)
        {
            throw InsufficientDataError("SequenceRemoteMemory holds " + std::to_string(buffer.size()) +
                                        " transitions, " + std::to_string(count) + " requested");
        }
        std::vector<Experience> batch(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(count));
        buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(count));
        return batch;
    }

    namespace
    {
        RLSpaces testSpaces()
        {
            RLSpaces spaces;
            spaces.actionSpace = std::make_shared<DiscreteSpace>(4);
            spaces.observationSpace = std::make_shared<ArrayDiscreteSpace>(2, 0, 3);
            spaces.observationType = EnvObservationType::DISCRETE;
            return spaces;
        }

        Experience testExperience(int64_t actorId, uint64_t sequence)
        {
            Experience experience;
            experience.id = {actorId, sequence};
            experience.state = torch::tensor(std::vector<int64_t>{0, 1});
            experience.action = DiscreteSpace::value(static_cast<int64_t>(sequence % 4));
            experience.reward = static_cast<float>(sequence);
            experience.nextState = torch::tensor(std::vector<int64_t>{1, 1});
            return experience;
        }
    }

    TEST_CASE("SequenceRemoteMemory")
    {
        RLConfig config("QL", RLActionType::DISCRETE, RLObservationType::DISCRETE);
        SequenceRemoteMemory memory(config, testSpaces());

        SUBCASE("Pops in arrival order")
        {
            memory.add(testExperience(0, 1));
            memory.add(testExperience(0, 2));
            memory.add(testExperience(1, 1));
            auto batch = memory.pop(2);
            CHECK(batch[0].reward == 1.0f);
            CHECK(batch[1].reward == 2.0f);
            CHECK(memory.length() == 1);
            CHECK_THROWS_AS(memory.pop(2), InsufficientDataError);
            CHECK(memory.length() == 1);
        }

        SUBCASE("Duplicate deliveries are dropped")
        {
            SequenceRemoteMemory actor(config, testSpaces());
            actor.add(testExperience(3, 1));
            actor.add(testExperience(3, 2));
            auto blob = actor.backup();

            CHECK(memory.merge(blob) == 2);
            CHECK(memory.merge(blob) == 0);
            CHECK(memory.length() == 2);

            memory.pop(2);
            CHECK(memory.merge(blob) == 0);
            CHECK_FALSE(memory.add(testExperience(3, 1)));
        }

        SUBCASE("Shipped Blobs stay small after clear")
        {
            SequenceRemoteMemory actor(config, testSpaces());
            uint64_t sequence = 0;
            for (int round = 0; round < 5; ++round)
            {
                for (int i = 0; i < 50; ++i)
                {
                    actor.add(testExperience(4, sequence++));
                }
                CHECK(memory.merge(actor.backup()) == 50);
                actor.clear();
            }

            actor.add(testExperience(4, sequence++));
            auto snapshot = unpackBlob<MemorySnapshot>(actor.backup(), SequenceRemoteMemory::typeTag(),
                                                       SequenceRemoteMemory::blobVersion);
            CHECK(snapshot.experiences.size() == 1);
            REQUIRE(snapshot.seen.watermarks.size() == 1);
            CHECK(snapshot.seen.watermarks[0].sequence == sequence);
            CHECK(snapshot.seen.ahead.empty());
            CHECK_FALSE(actor.add(testExperience(4, 10)));
            CHECK(memory.length() == 250);
        }

        SUBCASE("Restore replaces content")
        {
            memory.add(testExperience(0, 1));
            auto blob = memory.backup();
            memory.add(testExperience(0, 2));

            memory.restore(blob);
            CHECK(memory.length() == 1);
            CHECK(memory.add(testExperience(0, 2)));
        }

        SUBCASE("Snapshots for other spaces are refused")
        {
            auto spaces = testSpaces();
            spaces.actionSpace = std::make_shared<DiscreteSpace>(5);
            SequenceRemoteMemory other(config, spaces);
            other.add(testExperience(0, 1));

            CHECK_THROWS_AS(memory.restore(other.backup()), IncompatibleRestoreError);
            CHECK_THROWS_AS(memory.merge(other.backup()), IncompatibleRestoreError);
            CHECK(memory.length() == 0);
        }
    }
}
