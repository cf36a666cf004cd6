#include<doctest/doctest.h>

#include"../../include/Errors.hpp"
#include"../../include/Memory/Experience.hpp"

namespace SimpleRL
{
    ExperienceData ExperienceData::encode(const Experience &experience)
    {
        ExperienceData data;
        data.id = experience.id;
        data.state = encodeTensor(experience.state);
        data.action = encodeTensor(experience.action);
        data.reward = experience.reward;
        data.nextState = encodeTensor(experience.nextState);
        data.done = experience.done;
        data.nextInvalidActions = experience.nextInvalidActions;
        return data;
    }

    Experience ExperienceData::decode() const
    {
        Experience experience;
        experience.id = id;
        experience.state = decodeTensor(state);
        experience.action = decodeTensor(action);
        experience.reward = reward;
        experience.nextState = decodeTensor(nextState);
        experience.done = done;
        experience.nextInvalidActions = nextInvalidActions;
        return experience;
    }

    bool ExperienceIdSet::insert(const ExperienceId &id)
    {
        auto &ids = actors[id.actorId];
        if (id.sequence < ids.watermark)
        {
            return false;
        }
        if (id.sequence > ids.watermark)
        {
            return ids.ahead.insert(id.sequence).second;
        }

        ++ids.watermark;
        while (!ids.ahead.empty() && *ids.ahead.begin() == ids.watermark)
        {
            ids.ahead.erase(ids.ahead.begin());
            ++ids.watermark;
        }
        return true;
    }

    bool ExperienceIdSet::contains(const ExperienceId &id) const
    {
        auto found = actors.find(id.actorId);
        if (found == actors.end())
        {
            return false;
        }
        return id.sequence < found->second.watermark || found->second.ahead.count(id.sequence) > 0;
    }

    size_t ExperienceIdSet::storedIds() const
    {
        size_t total = 0;
        for (const auto &entry : actors)
        {
            total += 1 + entry.second.ahead.size();
        }
        return total;
    }

    ExperienceIdSetData ExperienceIdSet::describe() const
    {
        ExperienceIdSetData data;
        for (const auto &entry : actors)
        {
            data.watermarks.push_back({entry.first, entry.second.watermark});
            for (auto sequence : entry.second.ahead)
            {
                data.ahead.push_back({entry.first, sequence});
            }
        }
        return data;
    }

    ExperienceIdSet ExperienceIdSet::fromDescriptor(const ExperienceIdSetData &data)
    {
        ExperienceIdSet set;
        for (const auto &watermark : data.watermarks)
        {
            if (set.actors.count(watermark.actorId) > 0)
            {
                throw IncompatibleRestoreError("Actor " + std::to_string(watermark.actorId) +
                                               " has two experience watermarks");
            }
            set.actors[watermark.actorId].watermark = watermark.sequence;
        }
        for (const auto &id : data.ahead)
        {
            set.insert(id);
        }
        return set;
    }

    TEST_CASE("ExperienceIdSet")
    {
        ExperienceIdSet ids;

        SUBCASE("Contiguous ids collapse into a watermark")
        {
            for (uint64_t sequence = 0; sequence < 1000; ++sequence)
            {
                CHECK(ids.insert({7, sequence}));
            }
            CHECK(ids.storedIds() == 1);
            CHECK(ids.contains({7, 999}));
            CHECK_FALSE(ids.contains({7, 1000}));
            CHECK_FALSE(ids.contains({8, 0}));
            CHECK_FALSE(ids.insert({7, 500}));
        }

        SUBCASE("Ids past a gap are held until the gap closes")
        {
            CHECK(ids.insert({1, 2}));
            CHECK(ids.insert({1, 3}));
            CHECK_FALSE(ids.insert({1, 3}));
            CHECK(ids.storedIds() == 3);
            CHECK(ids.insert({1, 0}));
            CHECK(ids.insert({1, 1}));
            CHECK(ids.storedIds() == 1);
            CHECK(ids.contains({1, 3}));
            CHECK(ids.describe().watermarks[0].sequence == 4);
        }

        SUBCASE("Descriptors keep every id")
        {
            ids.insert({0, 0});
            ids.insert({0, 5});
            ids.insert({2, 0});
            auto copy = ExperienceIdSet::fromDescriptor(ids.describe());
            CHECK(copy.contains({0, 0}));
            CHECK(copy.contains({0, 5}));
            CHECK_FALSE(copy.contains({0, 1}));
            CHECK(copy.contains({2, 0}));
            CHECK(copy.storedIds() == ids.storedIds());

            auto data = ids.describe();
            data.watermarks.push_back(data.watermarks.front());
            CHECK_THROWS_AS(ExperienceIdSet::fromDescriptor(data), IncompatibleRestoreError);
        }
    }
}
