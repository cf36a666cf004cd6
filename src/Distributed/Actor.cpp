#include<algorithm>

#include<fmt/format.h>
#include<fmt/ranges.h>
#include<spdlog/spdlog.h>

#include"../../include/Distributed/Actor.hpp"
#include"../../include/Errors.hpp"

namespace SimpleRL
{
    const char *const actorDoneTag = "Actor/Done";

    Actor::Actor(int64_t actorId,
                 EnvRun &env,
                 std::vector<WorkerRun> &workers,
                 std::shared_ptr<RLParameter> parameter,
                 std::shared_ptr<RLRemoteMemory> memory,
                 Transport &transport) :
    actorId(actorId),
    env(env),
    workers(workers),
    parameter(std::move(parameter)),
    memory(std::move(memory)),
    transport(transport)
    {
        if (!this->parameter || !this->memory)
        {
            throw std::invalid_argument("Actor needs a parameter and a memory replica");
        }
    }

    bool Actor::shipExperience()
    {
        if (memory->length() == 0)
        {
            return false;
        }
        transport.send(memory->backup());
        memory->clear();
        return true;
    }

    bool Actor::syncParameters(std::chrono::milliseconds timeout)
    {
        for (auto wait = timeout;; wait = std::chrono::milliseconds(0))
        {
            std::optional<Blob> blob;
            try
            {
                blob = transport.tryReceive(wait);
            }
            catch (const IncompatibleRestoreError &e)
            {
                spdlog::error("Actor {} skipped an unreadable frame: {}", actorId, e.what());
                continue;
            }
            if (!blob)
            {
                break;
            }
            const auto blobSequence = blob->sequence;
            if (!mailbox.post(std::move(*blob)))
            {
                spdlog::debug("Actor {} dropped stale parameter {}", actorId, blobSequence);
            }
        }

        auto latest = mailbox.take();
        if (!latest)
        {
            return false;
        }
        try
        {
            parameter->restore(*latest);
        }
        catch (const IncompatibleRestoreError &e)
        {
            spdlog::error("Actor {} cannot restore parameter {}: {}", actorId, latest->sequence, e.what());
            return false;
        }
        spdlog::debug("Actor {} restored parameter {}", actorId, latest->sequence);
        return true;
    }

    ActorReport Actor::run(const ActorOptions &options)
    {
        ActorReport report;
        report.rewardSum.assign(static_cast<size_t>(env.getPlayerNum()), 0.0f);
        const int64_t sendInterval = std::max<int64_t>(options.sendInterval, 1);

        for (int64_t episode = 0; episode < options.episodes; ++episode)
        {
            auto result = playEpisode(env, workers);
            ++report.episodes;
            for (size_t player = 0; player < result.rewards.size(); ++player)
            {
                report.rewardSum[player] += result.rewards[player];
            }

            if ((episode + 1) % sendInterval == 0 && shipExperience())
            {
                ++report.experienceSent;
            }
            if (syncParameters(options.pollTimeout))
            {
                ++report.parameterUpdates;
            }

            if (options.logInterval > 0 && (episode + 1) % options.logInterval == 0)
            {
                spdlog::info("Actor {} episode {:>6}: rewards {:.3f}, parameter {}",
                             actorId,
                             episode + 1,
                             fmt::join(result.rewards, ", "),
                             mailbox.getSequence());
            }
        }

        if (shipExperience())
        {
            ++report.experienceSent;
        }
        Blob done;
        done.typeTag = actorDoneTag;
        done.sequence = static_cast<uint64_t>(actorId);
        transport.send(done);

        spdlog::info("Actor {} finished {} episodes, {} parameter updates",
                     actorId, report.episodes, report.parameterUpdates);
        return report;
    }
}
