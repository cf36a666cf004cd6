#include<doctest/doctest.h>

#include"../../include/Distributed/ParameterMailbox.hpp"

namespace SimpleRL
{
    bool ParameterMailbox::post(Blob blob)
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (seenAny && blob.sequence <= highestSequence)
        {
            return false;
        }
        seenAny = true;
        highestSequence = blob.sequence;
        latest = std::move(blob);
        return true;
    }

    std::optional<Blob> ParameterMailbox::take()
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::optional<Blob> result;
        result.swap(latest);
        return result;
    }

    uint64_t ParameterMailbox::getSequence() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return highestSequence;
    }

    namespace
    {
        Blob parameterBlob(uint64_t sequence)
        {
            Blob blob;
            blob.typeTag = "QL/Parameter";
            blob.sequence = sequence;
            return blob;
        }
    }

    TEST_CASE("ParameterMailbox")
    {
        ParameterMailbox mailbox;
        CHECK_FALSE(mailbox.take().has_value());

        SUBCASE("Newest sequence wins")
        {
            CHECK(mailbox.post(parameterBlob(3)));
            CHECK_FALSE(mailbox.post(parameterBlob(2)));
            CHECK(mailbox.post(parameterBlob(5)));
            CHECK(mailbox.getSequence() == 5);

            auto taken = mailbox.take();
            REQUIRE(taken.has_value());
            CHECK(taken->sequence == 5);
        }

        SUBCASE("Each Blob is taken once")
        {
            mailbox.post(parameterBlob(1));
            CHECK(mailbox.take().has_value());
            CHECK_FALSE(mailbox.take().has_value());
            CHECK_FALSE(mailbox.post(parameterBlob(1)));
            CHECK_FALSE(mailbox.take().has_value());
        }
    }
}
