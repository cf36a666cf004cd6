#pragma once

#ifndef SIMPLERL_RL_RLCONFIG_HPP
#define SIMPLERL_RL_RLCONFIG_HPP

#include<map>
#include<string>
#include<vector>

#include<msgpack.hpp>

#include"../Define.hpp"

namespace SimpleRL
{
    /**
     * @class RLConfig
     * @brief Immutable description of an algorithm instance.
     *
     * Holds the algorithm name, the action and observation representations the
     * algorithm works in, its hyperparameters and the names of the observation
     * processors to apply. There are no setters: the with*() helpers return a
     * modified copy, so a config can be shared by value between a learner and
     * its actors without anyone changing it under them.
     */
    class RLConfig
    {
    private:
        std::string name;
        RLActionType actionType = RLActionType::ANY;
        RLObservationType observationType = RLObservationType::ANY;
        std::map<std::string, double> hyperParameters;
        std::vector<std::string> processors;

    public:
        RLConfig() = default;

        RLConfig(std::string name,
                 RLActionType actionType,
                 RLObservationType observationType,
                 std::map<std::string, double> hyperParameters = {},
                 std::vector<std::string> processors = {});

        inline const std::string &getName() const
        {
            return name;
        }

        inline RLActionType getActionType() const
        {
            return actionType;
        }

        inline RLObservationType getObservationType() const
        {
            return observationType;
        }

        inline const std::map<std::string, double> &getHyperParameters() const
        {
            return hyperParameters;
        }

        inline const std::vector<std::string> &getProcessors() const
        {
            return processors;
        }

        /** @throws std::invalid_argument if `key` is not a hyperparameter of this config */
        double get(const std::string &key) const;

        /** @brief get() narrowed to an integer count, e.g. a batch size. */
        int64_t getInt(const std::string &key) const;

        RLConfig withHyperParameter(const std::string &key, double value) const;

        RLConfig withProcessors(std::vector<std::string> processors) const;

        std::string toString() const;

        bool operator==(const RLConfig &other) const;

        MSGPACK_DEFINE_MAP(name, actionType, observationType, hyperParameters, processors);
    };
}

#endif //SIMPLERL_RL_RLCONFIG_HPP
