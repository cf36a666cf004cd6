#include"../../include/Errors.hpp"
#include"../../include/Memory/MemorySnapshot.hpp"
#include"../../include/RL/RLParameter.hpp"

namespace SimpleRL
{
    DecodedMemory decodeMemoryBlob(const Blob &blob,
                                   const std::string &typeTag,
                                   uint32_t version,
                                   const RLSpaces &spaces)
    {
        auto snapshot = unpackBlob<MemorySnapshot>(blob, typeTag, version);
        checkSnapshotSpaces(spaces, snapshot.spaces, typeTag);
        if (!snapshot.priorities.empty() && snapshot.priorities.size() != snapshot.experiences.size())
        {
            throw IncompatibleRestoreError(typeTag + " snapshot has " + std::to_string(snapshot.priorities.size()) +
                                           " priorities for " + std::to_string(snapshot.experiences.size()) +
                                           " experiences");
        }

        DecodedMemory decoded;
        decoded.experiences.reserve(snapshot.experiences.size());
        for (const auto &data : snapshot.experiences)
        {
            decoded.experiences.push_back(data.decode());
        }
        decoded.priorities = std::move(snapshot.priorities);
        decoded.seen = ExperienceIdSet::fromDescriptor(snapshot.seen);
        decoded.maxPriority = snapshot.maxPriority;
        return decoded;
    }
}
