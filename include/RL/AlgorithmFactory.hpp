#pragma once

#ifndef SIMPLERL_RL_ALGORITHMFACTORY_HPP
#define SIMPLERL_RL_ALGORITHMFACTORY_HPP

#include<cstdint>
#include<map>
#include<memory>
#include<string>
#include<vector>

#include"RLConfig.hpp"
#include"RLParameter.hpp"
#include"RLRemoteMemory.hpp"
#include"RLSpaces.hpp"
#include"RLTrainer.hpp"
#include"RLWorker.hpp"

namespace SimpleRL
{
    /**
     * @class AlgorithmFactory
     * @brief Builds every piece of one algorithm.
     *
     * An algorithm is registered in an RLRegistry as one factory. The parameter,
     * memory, workers and trainer it builds for the same config share the
     * parameter and memory by pointer.
     */
    class AlgorithmFactory
    {
    public:
        virtual ~AlgorithmFactory() = default;

        virtual std::string getName() const = 0;

        virtual RLActionType actionType() const = 0;

        virtual RLObservationType observationType() const = 0;

        /** @return every accepted hyperparameter with its default value */
        virtual std::map<std::string, double> defaultHyperParameters() const = 0;

        /**
         * @brief Config with the defaults overridden by `hyperParameters`.
         * @throws std::invalid_argument if a key is not a hyperparameter of this algorithm
         */
        RLConfig makeConfig(const std::map<std::string, double> &hyperParameters = {},
                            std::vector<std::string> processors = {}) const;

        virtual std::shared_ptr<RLParameter> makeParameter(const RLConfig &config, const RLSpaces &spaces) const = 0;

        virtual std::shared_ptr<RLRemoteMemory> makeRemoteMemory(const RLConfig &config,
                                                                 const RLSpaces &spaces) const = 0;

        /**
         * @param training record experience and explore when true
         * @param actorId stamped into every ExperienceId the worker produces
         */
        virtual std::unique_ptr<RLWorker> makeWorker(const RLConfig &config,
                                                     const RLSpaces &spaces,
                                                     std::shared_ptr<RLParameter> parameter,
                                                     std::shared_ptr<RLRemoteMemory> memory,
                                                     bool training,
                                                     int64_t actorId) const = 0;

        virtual std::unique_ptr<RLTrainer> makeTrainer(const RLConfig &config,
                                                       std::shared_ptr<RLParameter> parameter,
                                                       std::shared_ptr<RLRemoteMemory> memory) const = 0;
    };
}

#endif //SIMPLERL_RL_ALGORITHMFACTORY_HPP
