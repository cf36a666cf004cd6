#pragma once

#ifndef SIMPLERL_RL_RLTRAINER_HPP
#define SIMPLERL_RL_RLTRAINER_HPP

#include<cstdint>
#include<memory>
#include<string>
#include<vector>

#include"RLConfig.hpp"
#include"RLParameter.hpp"
#include"RLRemoteMemory.hpp"

namespace SimpleRL
{
    /**
     * @brief Data structure for storing trainer metrics
     *
     * `UpdateDatum` encapsulates a single scalar metric produced during a training
     * step. Each metric is identified by a name (for logging and monitoring) and
     * contains a floating-point value.
     *
     * Typical uses:
     * - TD error of a Q update
     * - Loss of the Q network
     * - Importance-sampling weight statistics
     */
    struct UpdateDatum
    {
        std::string name; /**< Identifier for this metric (e.g., "loss", "td_error"). */
        float value;      /**< Scalar metric value. */
    };

    /**
     * @brief Abstract base class for trainers
     *
     * `RLTrainer` reads transitions from an RLRemoteMemory and mutates an
     * RLParameter, one optimization step per train() call. The parameter and the
     * memory are shared with the workers of the same process.
     *
     * Subclasses override update() with their algorithm's step. update() throws
     * InsufficientDataError when the memory does not hold enough transitions yet;
     * the caller retries after more experience has arrived. train() never blocks.
     */
    class RLTrainer
    {
    private:
        int64_t trainCount = 0;

    protected:
        RLConfig config;
        std::shared_ptr<RLParameter> parameter;
        std::shared_ptr<RLRemoteMemory> memory;

        /**
         * @brief Performs a single optimization step
         *
         * @return metrics of this step, e.g. {"loss", 0.12}
         * @throws InsufficientDataError when the memory cannot fill one step
         */
        virtual std::vector<UpdateDatum> update() = 0;

    public:
        RLTrainer(RLConfig config, std::shared_ptr<RLParameter> parameter, std::shared_ptr<RLRemoteMemory> memory);

        virtual ~RLTrainer() = 0;

        /**
         * @brief Runs update() and counts it when it succeeds
         *
         * @return metrics of this step
         * @throws InsufficientDataError (recoverable, nothing was changed)
         */
        std::vector<UpdateDatum> train();

        /** @return number of successful train() calls */
        inline int64_t getTrainCount() const
        {
            return trainCount;
        }

        inline const std::shared_ptr<RLParameter> &getParameter() const
        {
            return parameter;
        }

        inline const std::shared_ptr<RLRemoteMemory> &getMemory() const
        {
            return memory;
        }
    };
    inline RLTrainer::~RLTrainer() {}
}

#endif //SIMPLERL_RL_RLTRAINER_HPP
