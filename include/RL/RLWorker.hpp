#pragma once

#ifndef SIMPLERL_RL_RLWORKER_HPP
#define SIMPLERL_RL_RLWORKER_HPP

#include<cstdint>
#include<ostream>
#include<vector>

#include<torch/torch.h>

#include"../Define.hpp"
#include"RLConfig.hpp"
#include"RLSpaces.hpp"

namespace SimpleRL
{
    /**
     * @class RLWorker
     * @brief Algorithm side of a learning worker.
     *
     * An RLWorker only ever sees values of its own RLSpaces: observations already
     * converted, actions in the algorithm's representation and invalid actions as
     * flat indices of the algorithm's action space. WorkerAdapter does the
     * translation from and to the environment.
     *
     * Workers record experience into their RLRemoteMemory; they never update the
     * parameter themselves, that is the trainer's job.
     */
    class RLWorker
    {
    protected:
        RLConfig config;
        RLSpaces spaces;
        bool training;

    public:
        RLWorker(RLConfig config, RLSpaces spaces, bool training) :
        config(std::move(config)),
        spaces(std::move(spaces)),
        training(training)
        {
        }

        virtual ~RLWorker() = default;

        virtual void callOnReset(const torch::Tensor &state, const std::vector<int64_t> &invalidActions) = 0;

        /** @return an action of spaces.actionSpace */
        virtual torch::Tensor callPolicy(const torch::Tensor &state, const std::vector<int64_t> &invalidActions) = 0;

        /**
         * @brief Learning-signal bookkeeping for the last action.
         * @param reward reward collected by this player since callPolicy()
         */
        virtual InfoMap callOnStep(const torch::Tensor &nextState,
                                   float reward,
                                   bool done,
                                   const std::vector<int64_t> &nextInvalidActions) = 0;

        virtual void callRender(std::ostream &os) const
        {
        }

        inline const RLConfig &getConfig() const
        {
            return config;
        }

        inline const RLSpaces &getSpaces() const
        {
            return spaces;
        }

        inline bool isTraining() const
        {
            return training;
        }
    };
}

#endif //SIMPLERL_RL_RLWORKER_HPP
