#pragma once

#ifndef SIMPLERL_ENV_ENVRUN_HPP
#define SIMPLERL_ENV_ENVRUN_HPP

#include<cstdint>
#include<memory>
#include<ostream>
#include<string>
#include<vector>

#include<torch/torch.h>

#include"../Blob.hpp"
#include"EnvBase.hpp"

namespace SimpleRL
{
    /**
     * @class EnvRun
     * @brief Owns one environment and the runtime state of its current episode.
     *
     * EnvRun is the only way the rest of the framework talks to an environment.
     * It enforces the episode protocol: reset() starts an episode, step() is
     * only accepted from the player whose turn it is and only with a legal
     * action, `done` never flips back to false before the next reset(), and the
     * episode is cut with reason "timeout" once the step limit is reached.
     */
    class EnvRun : public Checkpointable
    {
    private:
        std::unique_ptr<EnvBase> env;
        int64_t maxEpisodeSteps;

        torch::Tensor state;
        std::vector<float> stepRewards;
        std::vector<float> episodeRewards;
        bool done = true;
        std::string doneReason = "not_started";
        int64_t stepNum = 0;
        int playerIndex = 0;
        InfoMap info;

        int nextPlayerIndex() const;

    public:
        static constexpr uint32_t blobVersion = 1;

        /**
         * @param env environment to own
         * @param maxEpisodeSteps tightens the environment's own limit when > 0
         * @throws std::invalid_argument if env is null or declares no players
         */
        explicit EnvRun(std::unique_ptr<EnvBase> env, int64_t maxEpisodeSteps = -1);

        /** @return the initial observation */
        torch::Tensor reset();

        /**
         * @brief Applies `action` for `playerIndex` and advances the turn.
         *
         * @throws InvalidActionError if the episode is done, it is not `playerIndex`'s
         *         turn, the action is outside the action space or marked invalid.
         *         The run is left untouched in every case.
         */
        EnvStep step(const torch::Tensor &action, int playerIndex);

        /** @return invalid flat action indices for `playerIndex` in the current state */
        std::vector<int64_t> getInvalidActions(int playerIndex) const;

        /** @return valid flat action indices, requires a discretizable action space */
        std::vector<int64_t> getValidActions(int playerIndex) const;

        /** @return a uniformly random legal action for the current player */
        torch::Tensor sampleAction() const;

        Blob backup() const override;

        /**
         * @throws IncompatibleRestoreError if the Blob was not produced by an EnvRun of
         *         the same environment or cannot be decoded; the run keeps its state
         */
        void restore(const Blob &blob) override;

        void renderTerminal(std::ostream &os) const;

        torch::Tensor renderRgbArray() const;

        std::string typeTag() const;

        inline const EnvBase &getEnv() const
        {
            return *env;
        }

        inline std::string getName() const
        {
            return env->getName();
        }

        inline std::shared_ptr<const Space> actionSpace() const
        {
            return env->actionSpace();
        }

        inline std::shared_ptr<const Space> observationSpace() const
        {
            return env->observationSpace();
        }

        inline EnvObservationType observationType() const
        {
            return env->observationType();
        }

        inline int getPlayerNum() const
        {
            return env->playerNum();
        }

        inline int64_t getMaxEpisodeSteps() const
        {
            return maxEpisodeSteps;
        }

        inline const torch::Tensor &getState() const
        {
            return state;
        }

        inline const std::vector<float> &getStepRewards() const
        {
            return stepRewards;
        }

        inline const std::vector<float> &getEpisodeRewards() const
        {
            return episodeRewards;
        }

        inline bool isDone() const
        {
            return done;
        }

        inline const std::string &getDoneReason() const
        {
            return doneReason;
        }

        inline int64_t getStepNum() const
        {
            return stepNum;
        }

        inline int getPlayerIndex() const
        {
            return playerIndex;
        }

        inline const InfoMap &getInfo() const
        {
            return info;
        }
    };
}

#endif //SIMPLERL_ENV_ENVRUN_HPP
