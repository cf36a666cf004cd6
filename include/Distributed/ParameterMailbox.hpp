#pragma once

#ifndef SIMPLERL_DISTRIBUTED_PARAMETERMAILBOX_HPP
#define SIMPLERL_DISTRIBUTED_PARAMETERMAILBOX_HPP

#include<cstdint>
#include<mutex>
#include<optional>

#include"../Blob.hpp"

namespace SimpleRL
{
    /**
     * @class ParameterMailbox
     * @brief Single-slot, last-write-wins holder for parameter Blobs.
     *
     * Only a Blob with a higher `sequence` than any posted before replaces the
     * slot, and each Blob is handed out by take() at most once.
     */
    class ParameterMailbox
    {
    private:
        mutable std::mutex mutex;
        std::optional<Blob> latest;
        uint64_t highestSequence = 0;
        bool seenAny = false;

    public:
        /** @return true if `blob` replaced the slot, false if it was stale */
        bool post(Blob blob);

        /** @return the newest unread Blob, if any */
        std::optional<Blob> take();

        /** @return sequence of the newest Blob ever posted, 0 if none */
        uint64_t getSequence() const;
    };
}

#endif //SIMPLERL_DISTRIBUTED_PARAMETERMAILBOX_HPP
