#pragma once

#ifndef SIMPLERL_MEMORY_EXPERIENCE_HPP
#define SIMPLERL_MEMORY_EXPERIENCE_HPP

#include<cstdint>
#include<map>
#include<set>
#include<tuple>
#include<vector>

#include<msgpack.hpp>
#include<torch/torch.h>

#include"../Blob.hpp"

namespace SimpleRL
{
    /**
     * @struct ExperienceId
     * @brief Identity of one transition: who produced it and its per-actor sequence.
     *
     * Memories drop a transition whose id they have already seen, which makes
     * at-least-once delivery from actors safe.
     */
    struct ExperienceId
    {
        int64_t actorId = 0;
        uint64_t sequence = 0;

        inline bool operator<(const ExperienceId &other) const
        {
            return std::tie(actorId, sequence) < std::tie(other.actorId, other.sequence);
        }

        inline bool operator==(const ExperienceId &other) const
        {
            return actorId == other.actorId && sequence == other.sequence;
        }

        MSGPACK_DEFINE_MAP(actorId, sequence);
    };

    /**
     * @struct ExperienceIdSetData
     * @brief msgpack form of ExperienceIdSet.
     *
     * `watermarks` holds one entry per actor whose `sequence` is the count of
     * contiguous ids seen from 0; `ahead` lists the ids seen past a gap.
     */
    struct ExperienceIdSetData
    {
        std::vector<ExperienceId> watermarks;
        std::vector<ExperienceId> ahead;
        MSGPACK_DEFINE_MAP(watermarks, ahead);
    };

    /**
     * @class ExperienceIdSet
     * @brief Ids a memory has already taken in.
     *
     * Actors number their transitions 0, 1, 2, ... so the set keeps a per-actor
     * watermark below which every id was seen, plus the few ids that arrived past
     * a gap. Its size follows the number of actors and gaps, not the history.
     */
    class ExperienceIdSet
    {
    private:
        struct ActorIds
        {
            uint64_t watermark = 0;
            std::set<uint64_t> ahead;
        };

        std::map<int64_t, ActorIds> actors;

    public:
        /** @return false if `id` was already in the set */
        bool insert(const ExperienceId &id);

        bool contains(const ExperienceId &id) const;

        /** @return watermarks plus ids held past a gap */
        size_t storedIds() const;

        ExperienceIdSetData describe() const;

        /** @throws IncompatibleRestoreError if an actor appears twice among the watermarks */
        static ExperienceIdSet fromDescriptor(const ExperienceIdSetData &data);
    };

    /**
     * @struct Experience
     * @brief One transition in the algorithm's representation.
     */
    struct Experience
    {
        ExperienceId id;
        torch::Tensor state;
        torch::Tensor action;
        float reward = 0;
        torch::Tensor nextState;
        bool done = false;
        std::vector<int64_t> nextInvalidActions;
    };

    /**
     * @struct ExperienceData
     * @brief msgpack form of Experience.
     */
    struct ExperienceData
    {
        ExperienceId id;
        TensorData state;
        TensorData action;
        float reward = 0;
        TensorData nextState;
        bool done = false;
        std::vector<int64_t> nextInvalidActions;
        MSGPACK_DEFINE_MAP(id, state, action, reward, nextState, done, nextInvalidActions);

        static ExperienceData encode(const Experience &experience);

        Experience decode() const;
    };
}

#endif //SIMPLERL_MEMORY_EXPERIENCE_HPP
