#pragma once

#ifndef SIMPLERL_ENV_ENVCONFIG_HPP
#define SIMPLERL_ENV_ENVCONFIG_HPP

#include<cstdint>
#include<map>
#include<string>

#include<msgpack.hpp>

namespace SimpleRL
{
    /**
     * @struct EnvConfig
     * @brief Names a registered environment and overrides its constructor arguments.
     */
    struct EnvConfig
    {
        std::string name;
        std::map<std::string, double> kwargs; ///< Overrides the registered defaults
        int64_t maxEpisodeSteps = -1;         ///< -1 keeps the environment's own limit
        int64_t seed = -1;                    ///< -1 leaves the environment unseeded

        EnvConfig() = default;

        explicit EnvConfig(std::string name, std::map<std::string, double> kwargs = {}) :
        name(std::move(name)),
        kwargs(std::move(kwargs))
        {
        }

        MSGPACK_DEFINE_MAP(name, kwargs, maxEpisodeSteps, seed);
    };
}

#endif //SIMPLERL_ENV_ENVCONFIG_HPP
