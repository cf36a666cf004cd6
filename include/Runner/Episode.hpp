#pragma once

#ifndef SIMPLERL_RUNNER_EPISODE_HPP
#define SIMPLERL_RUNNER_EPISODE_HPP

#include<cstdint>
#include<ostream>
#include<string>
#include<vector>

#include"../Env/EnvRun.hpp"
#include"../RL/RLTrainer.hpp"
#include"../Worker/WorkerRun.hpp"

namespace SimpleRL
{
    /**
     * @struct EpisodeResult
     * @brief Summary of one finished episode.
     */
    struct EpisodeResult
    {
        std::vector<float> rewards;  /**< Episode reward per player */
        int64_t stepNum = 0;
        std::string doneReason;
        int64_t trainCount = 0;      /**< Successful train() calls during the episode */
        std::vector<UpdateDatum> lastUpdate;
    };

    /**
     * @brief Plays one episode to the end.
     *
     * `workers[i]` plays player i. After every step each WorkerRun sees the step,
     * then `trainer` (if any) runs one train() call; InsufficientDataError only
     * means the memory is still filling up and is skipped. An action the run
     * refuses is discarded and the worker is asked again, up to ten times.
     *
     * @param render if not null, the environment and the acting worker are drawn
     *               after every step
     * @throws std::invalid_argument if the number of workers differs from the player count
     * @throws InvalidActionError if a worker keeps choosing refused actions
     */
    EpisodeResult playEpisode(EnvRun &env,
                              std::vector<WorkerRun> &workers,
                              RLTrainer *trainer = nullptr,
                              std::ostream *render = nullptr);

    /**
     * @brief Repeats playEpisode() `episodes` times, logging progress every `logInterval` episodes.
     * @return the result of every episode, in order
     */
    std::vector<EpisodeResult> playEpisodes(EnvRun &env,
                                            std::vector<WorkerRun> &workers,
                                            int64_t episodes,
                                            RLTrainer *trainer = nullptr,
                                            int64_t logInterval = 0);
}

#endif //SIMPLERL_RUNNER_EPISODE_HPP
