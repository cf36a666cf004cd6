#pragma once

#ifndef SIMPLERL_WORKER_WORKERBASE_HPP
#define SIMPLERL_WORKER_WORKERBASE_HPP

#include<ostream>

#include<torch/torch.h>

#include"../Define.hpp"

namespace SimpleRL
{
    class EnvRun;
    class WorkerRun;

    /**
     * @class WorkerBase
     * @brief The one capability interface every worker implements.
     *
     * The driving loop only ever talks to workers through this interface, so a
     * learning worker (WorkerAdapter), a scripted one (RuleBaseWorker) and a
     * decorated one (ExtendWorker) are interchangeable. Variants are composed by
     * holding functions or other workers, never by deriving from each other.
     *
     * Calls are made through a WorkerRun, which knows the player index and the
     * reward collected since the last action.
     */
    class WorkerBase
    {
    public:
        virtual ~WorkerBase() = default;

        virtual void onReset(const EnvRun &env, const WorkerRun &run) = 0;

        /** @return an action in the environment's native action space */
        virtual torch::Tensor policy(const EnvRun &env, const WorkerRun &run) = 0;

        /** @brief Called once the action returned by policy() has been resolved. */
        virtual InfoMap onStep(const EnvRun &env, const WorkerRun &run) = 0;

        virtual void renderTerminal(const EnvRun &env, const WorkerRun &run, std::ostream &os) const
        {
        }
    };
}

#endif //SIMPLERL_WORKER_WORKERBASE_HPP
