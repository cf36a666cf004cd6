#pragma once

#ifndef SIMPLERL_ENV_ENVREGISTRY_HPP
#define SIMPLERL_ENV_ENVREGISTRY_HPP

#include<functional>
#include<map>
#include<memory>
#include<string>
#include<vector>

#include"EnvBase.hpp"
#include"EnvConfig.hpp"
#include"EnvRun.hpp"

namespace SimpleRL
{
    /**
     * @class EnvRegistry
     * @brief Name to environment factory table.
     *
     * Created once at process start and handed to whoever builds environments.
     */
    class EnvRegistry
    {
    public:
        using Kwargs = std::map<std::string, double>;
        using Factory = std::function<std::unique_ptr<EnvBase>(const Kwargs &kwargs)>;

    private:
        struct Entry
        {
            Factory factory;
            Kwargs defaultKwargs;
        };

        std::map<std::string, Entry> entries;

    public:
        /**
         * @param defaultKwargs every accepted keyword with its default value
         * @throws std::invalid_argument if `name` is already registered
         */
        void add(const std::string &name, Factory factory, Kwargs defaultKwargs = {});

        bool contains(const std::string &name) const;

        std::vector<std::string> names() const;

        /**
         * @brief Builds the environment named by `config` and wraps it in an EnvRun.
         *
         * kwargs in the config override the registered defaults; the seed is applied
         * when it is not -1.
         *
         * @throws std::invalid_argument for unknown names or unknown keywords
         */
        std::unique_ptr<EnvRun> make(const EnvConfig &config) const;
    };

    /** @brief Adds "Grid", "Othello" and "Othello6x6". */
    void registerReferenceEnvs(EnvRegistry &registry);
}

#endif //SIMPLERL_ENV_ENVREGISTRY_HPP
