#include"../../include/Env/EnvRun.hpp"
#include"../../include/Worker/RuleBaseWorker.hpp"
#include"../../include/Worker/WorkerRun.hpp"

namespace SimpleRL
{
    RuleBaseWorker::RuleBaseWorker(PolicyFunction policyFunction,
                                   ResetFunction resetFunction,
                                   StepFunction stepFunction,
                                   RenderFunction renderFunction) :
    policyFunction(std::move(policyFunction)),
    resetFunction(std::move(resetFunction)),
    stepFunction(std::move(stepFunction)),
    renderFunction(std::move(renderFunction))
    {
        if (!this->policyFunction)
        {
            throw std::invalid_argument("RuleBaseWorker needs a policy function");
        }
    }

    void RuleBaseWorker::onReset(const EnvRun &env, const WorkerRun &run)
    {
        if (resetFunction)
        {
            resetFunction(env, run);
        }
    }

    torch::Tensor RuleBaseWorker::policy(const EnvRun &env, const WorkerRun &run)
    {
        return policyFunction(env, run);
    }

    InfoMap RuleBaseWorker::onStep(const EnvRun &env, const WorkerRun &run)
    {
        if (stepFunction)
        {
            return stepFunction(env, run);
        }
        return {};
    }

    void RuleBaseWorker::renderTerminal(const EnvRun &env, const WorkerRun &run, std::ostream &os) const
    {
        if (renderFunction)
        {
            renderFunction(env, run, os);
        }
    }

    std::shared_ptr<RuleBaseWorker> RuleBaseWorker::random()
    {
        return std::make_shared<RuleBaseWorker>([](const EnvRun &env, const WorkerRun &) {
            return env.sampleAction();
        });
    }
}
