#pragma once

#ifndef SIMPLERL_WORKER_RULEBASEWORKER_HPP
#define SIMPLERL_WORKER_RULEBASEWORKER_HPP

#include<functional>
#include<memory>

#include"WorkerBase.hpp"

namespace SimpleRL
{
    /**
     * @class RuleBaseWorker
     * @brief Scripted worker: a policy function plus optional reset/step/render hooks.
     */
    class RuleBaseWorker : public WorkerBase
    {
    public:
        using PolicyFunction = std::function<torch::Tensor(const EnvRun &, const WorkerRun &)>;
        using ResetFunction = std::function<void(const EnvRun &, const WorkerRun &)>;
        using StepFunction = std::function<InfoMap(const EnvRun &, const WorkerRun &)>;
        using RenderFunction = std::function<void(const EnvRun &, const WorkerRun &, std::ostream &)>;

    private:
        PolicyFunction policyFunction;
        ResetFunction resetFunction;
        StepFunction stepFunction;
        RenderFunction renderFunction;

    public:
        /** @throws std::invalid_argument if policyFunction is empty */
        explicit RuleBaseWorker(PolicyFunction policyFunction,
                                ResetFunction resetFunction = nullptr,
                                StepFunction stepFunction = nullptr,
                                RenderFunction renderFunction = nullptr);

        void onReset(const EnvRun &env, const WorkerRun &run) override;

        torch::Tensor policy(const EnvRun &env, const WorkerRun &run) override;

        InfoMap onStep(const EnvRun &env, const WorkerRun &run) override;

        void renderTerminal(const EnvRun &env, const WorkerRun &run, std::ostream &os) const override;

        /** @return a worker playing uniformly random legal actions */
        static std::shared_ptr<RuleBaseWorker> random();
    };
}

#endif //SIMPLERL_WORKER_RULEBASEWORKER_HPP
