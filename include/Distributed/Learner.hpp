#pragma once

#ifndef SIMPLERL_DISTRIBUTED_LEARNER_HPP
#define SIMPLERL_DISTRIBUTED_LEARNER_HPP

#include<chrono>
#include<vector>

#include"../RL/RLTrainer.hpp"
#include"../Transport/Transport.hpp"

namespace SimpleRL
{
    struct LearnerOptions
    {
        int64_t maxTrainCount = 0;                  ///< stop after this many train() steps, 0 to run until every actor is done
        int64_t publishInterval = 10;               ///< train() steps between parameter broadcasts
        std::chrono::milliseconds pollTimeout{1};   ///< wait per actor when nothing is queued
        int64_t logInterval = 0;                    ///< train() steps between progress logs, 0 for none
    };

    struct LearnerReport
    {
        int64_t trainCount = 0;
        int64_t experienceReceived = 0;   ///< experience Blobs merged
        int64_t experienceAdded = 0;      ///< transitions new to the memory
        int64_t rejected = 0;             ///< Blobs that could not be merged
        int64_t parametersSent = 0;       ///< broadcasts
    };

    /**
     * @class Learner
     * @brief Merges actors' experience into the trainer's memory, trains and
     *        broadcasts parameter Blobs with increasing sequence numbers.
     *
     * The transports are borrowed and must outlive the learner. Each transport
     * connects to exactly one actor.
     */
    class Learner
    {
    private:
        RLTrainer &trainer;
        std::vector<Transport *> actors;
        uint64_t sequence = 0;

        void receive(size_t actorIndex, std::chrono::milliseconds timeout, std::vector<bool> &done, LearnerReport &report);

    public:
        /** @throws std::invalid_argument if a transport is null */
        Learner(RLTrainer &trainer, std::vector<Transport *> actors);

        /** @brief Runs until every actor has sent its done Blob or maxTrainCount is reached, then broadcasts once more. */
        LearnerReport run(const LearnerOptions &options);

        /** @brief Sends the current parameter to every actor. */
        void publish();

        inline uint64_t getSequence() const
        {
            return sequence;
        }
    };
}

#endif //SIMPLERL_DISTRIBUTED_LEARNER_HPP
