#pragma once

#ifndef SIMPLERL_ENV_ENVBASE_HPP
#define SIMPLERL_ENV_ENVBASE_HPP

#include<cstdint>
#include<memory>
#include<ostream>
#include<string>
#include<vector>

#include<torch/torch.h>

#include"../Blob.hpp"
#include"../Define.hpp"
#include"../Space/Space.hpp"

namespace SimpleRL
{
    class WorkerBase;
    class Processor;

    /**
     * @struct EnvStep
     * @brief Result of one environment transition.
     */
    struct EnvStep
    {
        torch::Tensor observation;  /**< Native observation after the step */
        std::vector<float> rewards; /**< One reward per player */
        bool done = false;
        InfoMap info;
    };

    /**
     * @class EnvBase
     * @brief Interface every concrete environment implements.
     *
     * Environments never validate turn order or legality themselves: EnvRun does
     * that before step() is called. backup() must capture everything step()
     * depends on, random generator state included, so that a restored copy
     * continues exactly like the original.
     */
    class EnvBase : public Checkpointable
    {
    public:
        ~EnvBase() override = default;

        virtual std::string getName() const = 0;

        virtual std::shared_ptr<const Space> actionSpace() const = 0;

        virtual std::shared_ptr<const Space> observationSpace() const = 0;

        virtual EnvObservationType observationType() const = 0;

        /** @return episode length limit, <= 0 for none */
        virtual int64_t maxEpisodeSteps() const = 0;

        virtual int playerNum() const
        {
            return 1;
        }

        virtual TurnOrder turnOrder() const
        {
            return TurnOrder::ROUND_ROBIN;
        }

        /** @brief Player to move next. Only consulted for TurnOrder::ENVIRONMENT_DECLARED. */
        virtual int currentPlayerIndex() const
        {
            return 0;
        }

        /** @return initial observation */
        virtual torch::Tensor reset() = 0;

        /**
         * @brief Applies a legal action for `playerIndex`.
         * @param action native value of actionSpace()
         */
        virtual EnvStep step(const torch::Tensor &action, int playerIndex) = 0;

        /**
         * @return flat discrete indices of the actions `playerIndex` may not take now.
         *         Continuous actions are checked through their bin, so only bounded
         *         action spaces can declare any.
         */
        virtual std::vector<int64_t> getInvalidActions(int playerIndex) const
        {
            return {};
        }

        virtual void renderTerminal(std::ostream &os) const
        {
        }

        /** @return HxWx3 uint8 image, or an undefined tensor if the environment has no image view */
        virtual torch::Tensor renderRgbArray() const
        {
            return torch::Tensor();
        }

        /**
         * @brief Rule-based workers shipped with the environment (e.g. a scripted opponent).
         * @throws std::invalid_argument if the environment has no worker of that name
         */
        virtual std::shared_ptr<WorkerBase> makeWorker(const std::string &name) const;

        /**
         * @brief Observation processors shipped with the environment.
         * @throws std::invalid_argument if the environment has no processor of that name
         */
        virtual std::shared_ptr<const Processor> makeProcessor(const std::string &name) const;

        virtual void setSeed(int64_t seed)
        {
        }
    };
}

#endif //SIMPLERL_ENV_ENVBASE_HPP
