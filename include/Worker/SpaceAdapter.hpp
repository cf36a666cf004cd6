#pragma once

#ifndef SIMPLERL_WORKER_SPACEADAPTER_HPP
#define SIMPLERL_WORKER_SPACEADAPTER_HPP

#include<cstdint>
#include<memory>
#include<vector>

#include<torch/torch.h>

#include"../RL/RLConfig.hpp"
#include"../RL/RLSpaces.hpp"
#include"Processor.hpp"

namespace SimpleRL
{
    class EnvRun;

    /**
     * @class SpaceAdapter
     * @brief Converts values between an environment's spaces and an algorithm's.
     *
     * Built once per (environment, config) pair. Every conversion is checked when
     * the adapter is made, so an impossible pairing fails before any episode runs.
     *
     * Actions:
     * - ANY: identity.
     * - DISCRETE: a single flat index, DiscreteSpace(envActionSpace.getDiscreteNum()).
     * - CONTINUOUS: the continuous representation of the environment space.
     *
     * Observations are processed by the configured processors first, then
     * converted the same way (DISCRETE keeps the element-wise discrete view).
     */
    class SpaceAdapter
    {
    private:
        RLActionType actionType;
        RLObservationType observationType;
        std::shared_ptr<const Space> envActionSpace;
        std::shared_ptr<const Space> processedObservationSpace;
        std::vector<std::shared_ptr<const Processor>> processors;
        RLSpaces spaces;

        SpaceAdapter() = default;

    public:
        /**
         * @throws UnboundedConversionError if DISCRETE is asked of an unbounded space
         * @throws TypeIncompatibilityError if a processor rejects the observation space
         */
        static SpaceAdapter make(const RLConfig &config,
                                 const std::shared_ptr<const Space> &envActionSpace,
                                 const std::shared_ptr<const Space> &envObservationSpace,
                                 EnvObservationType envObservationType,
                                 std::vector<std::shared_ptr<const Processor>> processors = {});

        /** @brief make() with the environment's spaces and the processors named in `config`. */
        static SpaceAdapter fromEnv(const RLConfig &config, const EnvRun &env);

        /** @return the environment observation in the algorithm's representation */
        torch::Tensor encodeObservation(const torch::Tensor &observation, const EnvRun &env) const;

        /** @return the algorithm's action as a native value of the environment action space */
        torch::Tensor decodeAction(const torch::Tensor &rlAction) const;

        /** @brief Inverse of decodeAction(), up to quantization. */
        torch::Tensor encodeAction(const torch::Tensor &envAction) const;

        /**
         * @brief Environment invalid actions to the algorithm's flat indices.
         *
         * Flat indices coincide for ANY and DISCRETE. A CONTINUOUS algorithm cannot
         * be told about them and gets an empty list.
         */
        std::vector<int64_t> encodeInvalidActions(const std::vector<int64_t> &invalidActions) const;

        inline const RLSpaces &getSpaces() const
        {
            return spaces;
        }

        inline const std::shared_ptr<const Space> &getEnvActionSpace() const
        {
            return envActionSpace;
        }

        inline RLActionType getActionType() const
        {
            return actionType;
        }

        inline RLObservationType getObservationType() const
        {
            return observationType;
        }
    };
}

#endif //SIMPLERL_WORKER_SPACEADAPTER_HPP
