#include<sstream>

#include<fmt/format.h>
#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../../include/Envs/Grid.hpp"
#include"../../include/Envs/Othello.hpp"
#include"../../include/Space/DiscreteSpace.hpp"
#include"../../include/Errors.hpp"
#include"../../include/Runner/Episode.hpp"
#include"../../include/Worker/RuleBaseWorker.hpp"

namespace SimpleRL
{
    namespace
    {
        /** Refused actions in a row before the episode gives up on a worker. */
        constexpr int maxActionRetries = 10;
    }

    EpisodeResult playEpisode(EnvRun &env, std::vector<WorkerRun> &workers, RLTrainer *trainer, std::ostream *render)
    {
        if (static_cast<int>(workers.size()) != env.getPlayerNum())
        {
            throw std::invalid_argument(fmt::format("{} needs {} workers, got {}",
                                                    env.getName(),
                                                    env.getPlayerNum(),
                                                    workers.size()));
        }

        EpisodeResult result;
        env.reset();
        for (auto &worker : workers)
        {
            worker.onReset(env);
        }
        if (render)
        {
            env.renderTerminal(*render);
        }

        while (!env.isDone())
        {
            const int playerIndex = env.getPlayerIndex();
            auto &current = workers[static_cast<size_t>(playerIndex)];
            torch::Tensor action;
            for (int attempt = 1;; ++attempt)
            {
                action = current.policy(env);
                try
                {
                    env.step(action, playerIndex);
                    break;
                }
                catch (const InvalidActionError &e)
                {
                    current.discardAction();
                    if (attempt >= maxActionRetries)
                    {
                        throw;
                    }
                    spdlog::warn("{}: player {} action refused, asking again: {}", env.getName(), playerIndex, e.what());
                }
            }
            for (auto &worker : workers)
            {
                worker.onStep(env);
            }

            if (trainer)
            {
                try
                {
                    result.lastUpdate = trainer->train();
                    ++result.trainCount;
                }
                catch (const InsufficientDataError &e)
                {
                    spdlog::debug("Training skipped: {}", e.what());
                }
            }

            if (render)
            {
                *render << fmt::format("--- step {} player {} action {} rewards {}\n",
                                       env.getStepNum(),
                                       playerIndex,
                                       valueToString(action),
                                       valueToString(torch::tensor(env.getStepRewards())));
                env.renderTerminal(*render);
                current.renderTerminal(env, *render);
            }
        }

        result.rewards = env.getEpisodeRewards();
        result.stepNum = env.getStepNum();
        result.doneReason = env.getDoneReason();
        return result;
    }

    std::vector<EpisodeResult> playEpisodes(EnvRun &env,
                                            std::vector<WorkerRun> &workers,
                                            int64_t episodes,
                                            RLTrainer *trainer,
                                            int64_t logInterval)
    {
        std::vector<EpisodeResult> results;
        for (int64_t episode = 0; episode < episodes; ++episode)
        {
            results.push_back(playEpisode(env, workers, trainer));
            if (logInterval > 0 && (episode + 1) % logInterval == 0)
            {
                const auto &last = results.back();
                spdlog::info("{} episode {:>6}: {} steps, rewards {}, trained {}",
                             env.getName(),
                             episode + 1,
                             last.stepNum,
                             valueToString(torch::tensor(last.rewards)),
                             trainer ? trainer->getTrainCount() : 0);
            }
        }
        return results;
    }

    TEST_CASE("playEpisode")
    {
        EnvRun env(std::make_unique<Grid>());

        SUBCASE("Random worker finishes Grid episodes")
        {
            std::vector<WorkerRun> workers{WorkerRun(RuleBaseWorker::random())};
            auto results = playEpisodes(env, workers, 5);
            REQUIRE(results.size() == 5);
            for (const auto &result : results)
            {
                CHECK(result.stepNum >= 1);
                CHECK(result.stepNum <= env.getMaxEpisodeSteps());
                CHECK((result.doneReason == "env" || result.doneReason == "timeout"));
                CHECK(result.trainCount == 0);
            }
        }

        SUBCASE("Rendering writes every step")
        {
            std::vector<WorkerRun> workers{WorkerRun(RuleBaseWorker::random())};
            std::ostringstream os;
            auto result = playEpisode(env, workers, nullptr, &os);
            CHECK(os.str().find(fmt::format("--- step {} ", result.stepNum)) != std::string::npos);
        }

        SUBCASE("Refused actions are asked for again")
        {
            EnvRun othello(std::make_unique<Othello>(6, 6));
            auto makeWorker = [](bool recovers) {
                auto calls = std::make_shared<int64_t>(0);
                return std::make_shared<RuleBaseWorker>([calls, recovers](const EnvRun &env, const WorkerRun &run) {
                    if (recovers && ++*calls % 2 == 0)
                    {
                        return env.sampleAction();
                    }
                    return DiscreteSpace::value(env.getInvalidActions(run.getPlayerIndex()).front());
                });
            };

            std::vector<WorkerRun> workers{WorkerRun(makeWorker(true), 0), WorkerRun(makeWorker(true), 1)};
            auto result = playEpisode(othello, workers);
            CHECK(result.doneReason == "env");
            CHECK(workers[0].getStepNum() + workers[1].getStepNum() == result.stepNum);

            std::vector<WorkerRun> stubborn{WorkerRun(makeWorker(false), 0), WorkerRun(makeWorker(true), 1)};
            CHECK_THROWS_AS(playEpisode(othello, stubborn), InvalidActionError);
            CHECK(othello.getStepNum() == 0);
        }

        SUBCASE("Worker count must match the players")
        {
            std::vector<WorkerRun> workers;
            CHECK_THROWS_AS(playEpisode(env, workers), std::invalid_argument);
        }
    }
}
