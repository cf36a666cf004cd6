#include"../../include/Env/EnvRun.hpp"
#include"../../include/Worker/ExtendWorker.hpp"
#include"../../include/Worker/WorkerRun.hpp"

namespace SimpleRL
{
    ExtendWorker::ExtendWorker(std::shared_ptr<WorkerBase> inner, ActionTransform transform) :
    inner(std::move(inner)),
    transform(std::move(transform))
    {
        if (!this->inner || !this->transform)
        {
            throw std::invalid_argument("ExtendWorker needs an inner worker and a transform");
        }
    }

    void ExtendWorker::onReset(const EnvRun &env, const WorkerRun &run)
    {
        inner->onReset(env, run);
    }

    torch::Tensor ExtendWorker::policy(const EnvRun &env, const WorkerRun &run)
    {
        return transform(env, run, inner->policy(env, run));
    }

    InfoMap ExtendWorker::onStep(const EnvRun &env, const WorkerRun &run)
    {
        return inner->onStep(env, run);
    }

    void ExtendWorker::renderTerminal(const EnvRun &env, const WorkerRun &run, std::ostream &os) const
    {
        inner->renderTerminal(env, run, os);
    }

    std::shared_ptr<ExtendWorker> ExtendWorker::epsilonGreedy(std::shared_ptr<WorkerBase> inner, double epsilon)
    {
        return std::make_shared<ExtendWorker>(std::move(inner),
                                              [epsilon](const EnvRun &env, const WorkerRun &, const torch::Tensor &action) {
                                                  if (torch::rand({1}).item<double>() < epsilon)
                                                  {
                                                      return env.sampleAction();
                                                  }
                                                  return action;
                                              });
    }
}
