#pragma once

#ifndef SIMPLERL_WORKER_WORKERRUN_HPP
#define SIMPLERL_WORKER_WORKERRUN_HPP

#include<memory>
#include<ostream>

#include<torch/torch.h>

#include"WorkerBase.hpp"

namespace SimpleRL
{
    /**
     * @class WorkerRun
     * @brief Drives one WorkerBase on behalf of one player.
     *
     * In multi-player games a player's action is only resolved when it is their
     * turn again (or the episode ends). WorkerRun collects the player's rewards
     * from every step in between and forwards onStep() exactly once per action.
     * Calling policy() twice without that resolution is a protocol error.
     */
    class WorkerRun
    {
    private:
        std::shared_ptr<WorkerBase> worker;
        int playerIndex;

        torch::Tensor lastAction;
        float reward = 0;
        float episodeReward = 0;
        bool pendingAction = false;
        int64_t stepNum = 0;
        InfoMap lastInfo;

    public:
        /** @throws std::invalid_argument if worker is null or playerIndex is negative */
        WorkerRun(std::shared_ptr<WorkerBase> worker, int playerIndex = 0);

        /** @brief Starts an episode, call right after EnvRun::reset(). */
        void onReset(const EnvRun &env);

        /**
         * @return the worker's action for the current state
         * @throws std::logic_error if it is not this player's turn or the previous
         *         action has not been resolved yet
         */
        torch::Tensor policy(const EnvRun &env);

        /**
         * @brief Drops the pending action after EnvRun::step() refused it, so that
         *        policy() may be asked again for the same state.
         */
        void discardAction();

        /**
         * @brief Call after every EnvRun::step(), whoever acted.
         * @return the worker's info when the pending action was resolved, empty otherwise
         */
        InfoMap onStep(const EnvRun &env);

        void renderTerminal(const EnvRun &env, std::ostream &os) const;

        inline int getPlayerIndex() const
        {
            return playerIndex;
        }

        /** @return reward collected since the last policy() call */
        inline float getReward() const
        {
            return reward;
        }

        inline float getEpisodeReward() const
        {
            return episodeReward;
        }

        inline const torch::Tensor &getLastAction() const
        {
            return lastAction;
        }

        inline bool hasPendingAction() const
        {
            return pendingAction;
        }

        /** @return actions resolved in this episode */
        inline int64_t getStepNum() const
        {
            return stepNum;
        }

        inline const InfoMap &getLastInfo() const
        {
            return lastInfo;
        }

        inline const std::shared_ptr<WorkerBase> &getWorker() const
        {
            return worker;
        }
    };
}

#endif //SIMPLERL_WORKER_WORKERRUN_HPP
