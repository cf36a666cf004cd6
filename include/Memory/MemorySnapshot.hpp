#pragma once

#ifndef SIMPLERL_MEMORY_MEMORYSNAPSHOT_HPP
#define SIMPLERL_MEMORY_MEMORYSNAPSHOT_HPP

#include<string>
#include<vector>

#include<msgpack.hpp>

#include"../RL/RLSpaces.hpp"
#include"Experience.hpp"

namespace SimpleRL
{
    /**
     * @struct MemorySnapshot
     * @brief Payload shared by the experience memories' backups.
     *
     * `priorities` is parallel to `experiences` for prioritized memories and empty
     * otherwise.
     */
    struct MemorySnapshot
    {
        RLSpacesDescriptor spaces;
        std::vector<ExperienceData> experiences;
        std::vector<float> priorities;
        ExperienceIdSetData seen;
        float maxPriority = 1.0f;
        MSGPACK_DEFINE_MAP(spaces, experiences, priorities, seen, maxPriority);
    };

    /**
     * @struct DecodedMemory
     * @brief A snapshot with its tensors decoded, ready to be committed.
     */
    struct DecodedMemory
    {
        std::vector<Experience> experiences;
        std::vector<float> priorities;
        ExperienceIdSet seen;
        float maxPriority = 1.0f;
    };

    /**
     * @brief Checks tag, version and spaces of a memory Blob and decodes it completely.
     * @throws IncompatibleRestoreError on any mismatch, before the caller changes anything
     */
    DecodedMemory decodeMemoryBlob(const Blob &blob,
                                   const std::string &typeTag,
                                   uint32_t version,
                                   const RLSpaces &spaces);
}

#endif //SIMPLERL_MEMORY_MEMORYSNAPSHOT_HPP
