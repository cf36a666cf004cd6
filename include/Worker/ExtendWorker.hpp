#pragma once

#ifndef SIMPLERL_WORKER_EXTENDWORKER_HPP
#define SIMPLERL_WORKER_EXTENDWORKER_HPP

#include<functional>
#include<memory>

#include"WorkerBase.hpp"

namespace SimpleRL
{
    /**
     * @class ExtendWorker
     * @brief Decorates another worker's decisions.
     *
     * Every call is delegated to the inner worker; the action it proposes is then
     * passed through `transform`, which may keep, alter or replace it (e.g. an
     * exploration wrapper around a scripted opponent).
     */
    class ExtendWorker : public WorkerBase
    {
    public:
        using ActionTransform =
            std::function<torch::Tensor(const EnvRun &, const WorkerRun &, const torch::Tensor &innerAction)>;

    private:
        std::shared_ptr<WorkerBase> inner;
        ActionTransform transform;

    public:
        /** @throws std::invalid_argument if inner or transform is empty */
        ExtendWorker(std::shared_ptr<WorkerBase> inner, ActionTransform transform);

        void onReset(const EnvRun &env, const WorkerRun &run) override;

        torch::Tensor policy(const EnvRun &env, const WorkerRun &run) override;

        InfoMap onStep(const EnvRun &env, const WorkerRun &run) override;

        void renderTerminal(const EnvRun &env, const WorkerRun &run, std::ostream &os) const override;

        inline const std::shared_ptr<WorkerBase> &getInner() const
        {
            return inner;
        }

        /** @return `inner` replaced by a random legal action with probability `epsilon` */
        static std::shared_ptr<ExtendWorker> epsilonGreedy(std::shared_ptr<WorkerBase> inner, double epsilon);
    };
}

#endif //SIMPLERL_WORKER_EXTENDWORKER_HPP
