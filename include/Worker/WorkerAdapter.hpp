#pragma once

#ifndef SIMPLERL_WORKER_WORKERADAPTER_HPP
#define SIMPLERL_WORKER_WORKERADAPTER_HPP

#include<memory>

#include"../RL/RLWorker.hpp"
#include"SpaceAdapter.hpp"
#include"WorkerBase.hpp"

namespace SimpleRL
{
    /**
     * @class WorkerAdapter
     * @brief Lets an algorithm's RLWorker play an environment.
     *
     * Observations, actions and invalid actions go through the SpaceAdapter on
     * every call; the RLWorker never sees an environment-native value.
     */
    class WorkerAdapter : public WorkerBase
    {
    private:
        SpaceAdapter adapter;
        std::unique_ptr<RLWorker> worker;

    public:
        /**
         * @throws std::invalid_argument if worker is null
         * @throws ShapeMismatchError / TypeIncompatibilityError if the worker is bound
         *         to spaces other than the ones the adapter produces
         */
        WorkerAdapter(SpaceAdapter adapter, std::unique_ptr<RLWorker> worker);

        void onReset(const EnvRun &env, const WorkerRun &run) override;

        torch::Tensor policy(const EnvRun &env, const WorkerRun &run) override;

        InfoMap onStep(const EnvRun &env, const WorkerRun &run) override;

        void renderTerminal(const EnvRun &env, const WorkerRun &run, std::ostream &os) const override;

        inline const SpaceAdapter &getAdapter() const
        {
            return adapter;
        }

        inline RLWorker &getWorker() const
        {
            return *worker;
        }
    };
}

#endif //SIMPLERL_WORKER_WORKERADAPTER_HPP
