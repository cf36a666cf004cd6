#include<doctest/doctest.h>

#include"../../include/Env/EnvRun.hpp"
#include"../../include/Errors.hpp"
#include"../../include/Envs/Grid.hpp"
#include"../../include/Space/ArrayDiscreteSpace.hpp"
#include"../../include/Space/DiscreteSpace.hpp"
#include"../../include/Worker/WorkerAdapter.hpp"
#include"../../include/Worker/WorkerRun.hpp"

namespace SimpleRL
{
    WorkerAdapter::WorkerAdapter(SpaceAdapter adapter, std::unique_ptr<RLWorker> worker) :
    adapter(std::move(adapter)),
    worker(std::move(worker))
    {
        if (!this->worker)
        {
            throw std::invalid_argument("WorkerAdapter needs an RLWorker");
        }
        this->worker->getSpaces().checkCompatible(this->adapter.getSpaces());
    }

    void WorkerAdapter::onReset(const EnvRun &env, const WorkerRun &run)
    {
        worker->callOnReset(adapter.encodeObservation(env.getState(), env),
                            adapter.encodeInvalidActions(env.getInvalidActions(run.getPlayerIndex())));
    }

    torch::Tensor WorkerAdapter::policy(const EnvRun &env, const WorkerRun &run)
    {
        auto rlAction = worker->callPolicy(adapter.encodeObservation(env.getState(), env),
                                           adapter.encodeInvalidActions(env.getInvalidActions(run.getPlayerIndex())));
        return adapter.decodeAction(rlAction);
    }

    InfoMap WorkerAdapter::onStep(const EnvRun &env, const WorkerRun &run)
    {
        std::vector<int64_t> nextInvalidActions;
        if (!env.isDone())
        {
            nextInvalidActions = adapter.encodeInvalidActions(env.getInvalidActions(run.getPlayerIndex()));
        }
        return worker->callOnStep(adapter.encodeObservation(env.getState(), env),
                                  run.getReward(),
                                  env.isDone(),
                                  nextInvalidActions);
    }

    void WorkerAdapter::renderTerminal(const EnvRun &env, const WorkerRun &run, std::ostream &os) const
    {
        worker->callRender(os);
    }

    namespace
    {
        /** Always plays flat index `action`, remembers what it was told. */
        class RecordingWorker : public RLWorker
        {
        public:
            int64_t action = 0;
            std::vector<torch::Tensor> states;
            std::vector<float> rewards;
            bool sawDone = false;

            RecordingWorker(RLSpaces spaces, int64_t action) :
            RLWorker(RLConfig("recording", RLActionType::DISCRETE, RLObservationType::DISCRETE), std::move(spaces), true),
            action(action)
            {
            }

            void callOnReset(const torch::Tensor &state, const std::vector<int64_t> &invalidActions) override
            {
                states.push_back(state);
            }

            torch::Tensor callPolicy(const torch::Tensor &state, const std::vector<int64_t> &invalidActions) override
            {
                CHECK(spaces.observationSpace->contains(state));
                return DiscreteSpace::value(action);
            }

            InfoMap callOnStep(const torch::Tensor &nextState,
                               float reward,
                               bool done,
                               const std::vector<int64_t> &nextInvalidActions) override
            {
                states.push_back(nextState);
                rewards.push_back(reward);
                sawDone = done;
                return {{"reward", reward}};
            }
        };
    }

    TEST_CASE("WorkerAdapter")
    {
        EnvRun env(std::make_unique<Grid>(1.0f));
        RLConfig config("recording", RLActionType::DISCRETE, RLObservationType::DISCRETE);
        auto adapter = SpaceAdapter::make(config, env.actionSpace(), env.observationSpace(), env.observationType());

        SUBCASE("Drives the algorithm in its own representation")
        {
            auto recording = std::make_unique<RecordingWorker>(adapter.getSpaces(), 3);
            auto *raw = recording.get();
            auto worker = std::make_shared<WorkerAdapter>(adapter, std::move(recording));
            WorkerRun run(worker);

            env.reset();
            run.onReset(env);
            auto action = run.policy(env);
            CHECK(action.item<int64_t>() == 3);
            env.step(action, 0);
            auto info = run.onStep(env);

            CHECK(info.at("reward") == doctest::Approx(-0.04f));
            REQUIRE(raw->states.size() == 2);
            CHECK(raw->states[1][1].item<int64_t>() == 1);
            CHECK_FALSE(raw->sawDone);
        }

        SUBCASE("Workers bound to other spaces are refused")
        {
            auto wrongAction = adapter.getSpaces();
            wrongAction.actionSpace = std::make_shared<DiscreteSpace>(5);
            CHECK_THROWS_AS(WorkerAdapter(adapter, std::make_unique<RecordingWorker>(wrongAction, 0)),
                            TypeIncompatibilityError);

            auto wrongShape = adapter.getSpaces();
            wrongShape.observationSpace = std::make_shared<ArrayDiscreteSpace>(3, 0, 3);
            CHECK_THROWS_AS(WorkerAdapter(adapter, std::make_unique<RecordingWorker>(wrongShape, 0)),
                            ShapeMismatchError);

            CHECK_THROWS_AS(WorkerAdapter(adapter, nullptr), std::invalid_argument);
        }
    }
}
