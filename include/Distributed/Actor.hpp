#pragma once

#ifndef SIMPLERL_DISTRIBUTED_ACTOR_HPP
#define SIMPLERL_DISTRIBUTED_ACTOR_HPP

#include<chrono>
#include<memory>
#include<string>
#include<vector>

#include"../Env/EnvRun.hpp"
#include"../RL/RLParameter.hpp"
#include"../RL/RLRemoteMemory.hpp"
#include"../Runner/Episode.hpp"
#include"../Transport/Transport.hpp"
#include"../Worker/WorkerRun.hpp"
#include"ParameterMailbox.hpp"

namespace SimpleRL
{
    /** @brief Type tag of the Blob an actor sends after its last episode. */
    extern const char *const actorDoneTag;

    struct ActorOptions
    {
        int64_t episodes = 100;
        int64_t sendInterval = 1;                   ///< episodes between experience shipments
        std::chrono::milliseconds pollTimeout{0};   ///< wait for parameters after each shipment
        int64_t logInterval = 0;                    ///< episodes between progress logs, 0 for none
    };

    struct ActorReport
    {
        int64_t episodes = 0;
        int64_t experienceSent = 0;     ///< experience Blobs shipped
        int64_t parameterUpdates = 0;   ///< parameter Blobs restored
        std::vector<float> rewardSum;   ///< per player, over all episodes
    };

    /**
     * @class Actor
     * @brief Plays episodes with a local replica of the parameter and the memory.
     *
     * Experience collected in `memory` is shipped as memory backup() Blobs and the
     * local memory is cleared afterwards. Parameter Blobs arriving from the learner
     * go through a ParameterMailbox so only the newest one is restored.
     */
    class Actor
    {
    private:
        int64_t actorId;
        EnvRun &env;
        std::vector<WorkerRun> &workers;
        std::shared_ptr<RLParameter> parameter;
        std::shared_ptr<RLRemoteMemory> memory;
        Transport &transport;
        ParameterMailbox mailbox;

        bool shipExperience();

    public:
        Actor(int64_t actorId,
              EnvRun &env,
              std::vector<WorkerRun> &workers,
              std::shared_ptr<RLParameter> parameter,
              std::shared_ptr<RLRemoteMemory> memory,
              Transport &transport);

        /**
         * @brief Plays `options.episodes` episodes, then ships the rest of the
         *        experience followed by an actorDoneTag Blob.
         */
        ActorReport run(const ActorOptions &options);

        /**
         * @brief Drains the transport and restores the newest parameter Blob.
         *
         * A Blob that cannot be restored is logged and dropped; the replica keeps
         * its previous state.
         *
         * @param timeout how long to wait for the first Blob
         * @return true if the parameter was restored
         */
        bool syncParameters(std::chrono::milliseconds timeout);

        inline int64_t getActorId() const
        {
            return actorId;
        }
    };
}

#endif //SIMPLERL_DISTRIBUTED_ACTOR_HPP
