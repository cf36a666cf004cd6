#include<sstream>

#include<fmt/format.h>
#include<doctest/doctest.h>

#include"../../include/Env/EnvRun.hpp"
#include"../../include/Errors.hpp"
#include"../../include/Envs/Grid.hpp"
#include"../../include/Space/DiscreteSpace.hpp"
#include"../../include/Worker/ExtendWorker.hpp"
#include"../../include/Worker/RuleBaseWorker.hpp"
#include"../../include/Worker/WorkerRun.hpp"

namespace SimpleRL
{
    WorkerRun::WorkerRun(std::shared_ptr<WorkerBase> worker, int playerIndex) :
    worker(std::move(worker)),
    playerIndex(playerIndex)
    {
        if (!this->worker)
        {
            throw std::invalid_argument("WorkerRun needs a worker");
        }
        if (playerIndex < 0)
        {
            throw std::invalid_argument(fmt::format("Player index {} is negative", playerIndex));
        }
    }

    void WorkerRun::onReset(const EnvRun &env)
    {
        if (playerIndex >= env.getPlayerNum())
        {
            throw std::invalid_argument(fmt::format("{} has {} players, worker plays {}",
                                                    env.getName(),
                                                    env.getPlayerNum(),
                                                    playerIndex));
        }
        lastAction = torch::Tensor();
        reward = 0;
        episodeReward = 0;
        pendingAction = false;
        stepNum = 0;
        lastInfo.clear();
        worker->onReset(env, *this);
    }

    torch::Tensor WorkerRun::policy(const EnvRun &env)
    {
        if (pendingAction)
        {
            throw std::logic_error(fmt::format("Player {} asked for a second action before the first was resolved",
                                               playerIndex));
        }
        if (env.isDone())
        {
            throw std::logic_error(fmt::format("{}: episode is over, no action for player {}", env.getName(), playerIndex));
        }
        if (env.getPlayerIndex() != playerIndex)
        {
            throw std::logic_error(fmt::format("{}: player {} asked to act on player {}'s turn",
                                               env.getName(),
                                               playerIndex,
                                               env.getPlayerIndex()));
        }

        reward = 0;
        auto action = worker->policy(env, *this);
        lastAction = action;
        pendingAction = true;
        return action;
    }

    void WorkerRun::discardAction()
    {
        lastAction = torch::Tensor();
        pendingAction = false;
    }

    InfoMap WorkerRun::onStep(const EnvRun &env)
    {
        const auto &stepRewards = env.getStepRewards();
        if (static_cast<size_t>(playerIndex) < stepRewards.size())
        {
            reward += stepRewards[static_cast<size_t>(playerIndex)];
            episodeReward += stepRewards[static_cast<size_t>(playerIndex)];
        }

        if (!pendingAction || !(env.isDone() || env.getPlayerIndex() == playerIndex))
        {
            return {};
        }

        ++stepNum;
        lastInfo = worker->onStep(env, *this);
        pendingAction = false;
        return lastInfo;
    }

    void WorkerRun::renderTerminal(const EnvRun &env, std::ostream &os) const
    {
        worker->renderTerminal(env, *this, os);
    }

    namespace
    {
        /** Two players taking turns. Every step pays player 0 one point and player 1 two. */
        class AlternateEnv : public EnvBase
        {
        private:
            int64_t length;
            int64_t count = 0;

        public:
            explicit AlternateEnv(int64_t length) : length(length)
            {
            }

            std::string getName() const override
            {
                return "Alternate";
            }

            std::shared_ptr<const Space> actionSpace() const override
            {
                return std::make_shared<DiscreteSpace>(2);
            }

            std::shared_ptr<const Space> observationSpace() const override
            {
                return std::make_shared<DiscreteSpace>(length + 1);
            }

            EnvObservationType observationType() const override
            {
                return EnvObservationType::DISCRETE;
            }

            int64_t maxEpisodeSteps() const override
            {
                return -1;
            }

            int playerNum() const override
            {
                return 2;
            }

            torch::Tensor reset() override
            {
                count = 0;
                return DiscreteSpace::value(0);
            }

            EnvStep step(const torch::Tensor &action, int playerIndex) override
            {
                ++count;
                EnvStep result;
                result.observation = DiscreteSpace::value(count);
                result.rewards = {1.0f, 2.0f};
                result.done = count >= length;
                return result;
            }

            Blob backup() const override
            {
                return packBlob("Alternate", 1, count);
            }

            void restore(const Blob &blob) override
            {
                count = unpackBlob<int64_t>(blob, "Alternate", 1);
            }
        };
    }

    TEST_CASE("WorkerRun")
    {
        SUBCASE("Single player loop on Grid")
        {
            EnvRun env(std::make_unique<Grid>());
            int resolved = 0;
            auto worker = std::make_shared<RuleBaseWorker>(
                [](const EnvRun &env, const WorkerRun &) {
                    return env.sampleAction();
                },
                nullptr,
                [&resolved](const EnvRun &, const WorkerRun &) {
                    ++resolved;
                    return InfoMap{{"resolved", 1.0f}};
                });
            WorkerRun run(worker);

            env.reset();
            run.onReset(env);
            while (!env.isDone())
            {
                env.step(run.policy(env), 0);
                CHECK(run.onStep(env).count("resolved") == 1);
            }
            CHECK(resolved == env.getStepNum());
            CHECK(run.getStepNum() == env.getStepNum());
            CHECK(run.getEpisodeReward() == doctest::Approx(env.getEpisodeRewards()[0]));
        }

        SUBCASE("Second policy call without a step is refused")
        {
            EnvRun env(std::make_unique<Grid>());
            WorkerRun run(RuleBaseWorker::random());
            env.reset();
            run.onReset(env);
            run.policy(env);
            CHECK_THROWS_AS(run.policy(env), std::logic_error);
        }

        SUBCASE("A refused action can be asked for again")
        {
            EnvRun env(std::make_unique<Grid>());
            WorkerRun run(RuleBaseWorker::random());
            env.reset();
            run.onReset(env);
            run.policy(env);
            run.discardAction();
            CHECK_FALSE(run.hasPendingAction());
            CHECK_FALSE(run.getLastAction().defined());
            env.step(run.policy(env), 0);
            run.onStep(env);
            CHECK(run.getStepNum() == 1);
        }

        SUBCASE("Rewards between turns are accumulated")
        {
            EnvRun env(std::make_unique<AlternateEnv>(4));
            std::vector<float> seen[2];
            auto makeWorker = [&seen](int player) {
                return std::make_shared<RuleBaseWorker>(
                    [](const EnvRun &, const WorkerRun &) {
                        return DiscreteSpace::value(0);
                    },
                    nullptr,
                    [&seen, player](const EnvRun &, const WorkerRun &run) {
                        seen[player].push_back(run.getReward());
                        return InfoMap();
                    });
            };
            WorkerRun first(makeWorker(0), 0);
            WorkerRun second(makeWorker(1), 1);

            env.reset();
            first.onReset(env);
            second.onReset(env);
            CHECK_THROWS_AS(second.policy(env), std::logic_error);

            while (!env.isDone())
            {
                WorkerRun &current = env.getPlayerIndex() == 0 ? first : second;
                env.step(current.policy(env), current.getPlayerIndex());
                first.onStep(env);
                second.onStep(env);
            }

            CHECK(seen[0] == std::vector<float>{2.0f, 2.0f});
            CHECK(seen[1] == std::vector<float>{4.0f, 2.0f});
            CHECK(first.getEpisodeReward() == doctest::Approx(4.0f));
            CHECK(second.getEpisodeReward() == doctest::Approx(8.0f));
            CHECK_FALSE(first.hasPendingAction());
            CHECK_FALSE(second.hasPendingAction());
        }

        SUBCASE("Player index outside the game")
        {
            EnvRun env(std::make_unique<Grid>());
            env.reset();
            WorkerRun run(RuleBaseWorker::random(), 1);
            CHECK_THROWS_AS(run.onReset(env), std::invalid_argument);
            CHECK_THROWS_AS(WorkerRun(RuleBaseWorker::random(), -1), std::invalid_argument);
            CHECK_THROWS_AS(WorkerRun(nullptr), std::invalid_argument);
        }

        SUBCASE("Epsilon wrapper keeps legal actions")
        {
            EnvRun env(std::make_unique<Grid>());
            auto fixed = std::make_shared<RuleBaseWorker>([](const EnvRun &, const WorkerRun &) {
                return DiscreteSpace::value(2);
            });
            WorkerRun always(ExtendWorker::epsilonGreedy(fixed, 0.0));
            WorkerRun never(ExtendWorker::epsilonGreedy(fixed, 1.0));
            env.reset();
            always.onReset(env);
            never.onReset(env);
            CHECK(always.policy(env).item<int64_t>() == 2);
            CHECK(env.actionSpace()->contains(never.policy(env)));
        }
    }
}
