#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../../include/Env/EnvRegistry.hpp"
#include"../../include/Envs/Grid.hpp"
#include"../../include/Envs/Othello.hpp"

namespace SimpleRL
{
    void EnvRegistry::add(const std::string &name, Factory factory, Kwargs defaultKwargs)
    {
        if (entries.count(name) != 0)
        {
            throw std::invalid_argument("Environment '" + name + "' is already registered");
        }
        entries.emplace(name, Entry{std::move(factory), std::move(defaultKwargs)});
        spdlog::debug("Registered environment {}", name);
    }

    bool EnvRegistry::contains(const std::string &name) const
    {
        return entries.count(name) != 0;
    }

    std::vector<std::string> EnvRegistry::names() const
    {
        std::vector<std::string> result;
        for (const auto &entry : entries)
        {
            result.push_back(entry.first);
        }
        return result;
    }

    std::unique_ptr<EnvRun> EnvRegistry::make(const EnvConfig &config) const
    {
        auto found = entries.find(config.name);
        if (found == entries.end())
        {
            throw std::invalid_argument("Unknown environment '" + config.name + "'");
        }

        Kwargs kwargs = found->second.defaultKwargs;
        for (const auto &kwarg : config.kwargs)
        {
            if (kwargs.count(kwarg.first) == 0)
            {
                throw std::invalid_argument("Environment '" + config.name + "' has no argument '" + kwarg.first + "'");
            }
            kwargs[kwarg.first] = kwarg.second;
        }

        auto env = found->second.factory(kwargs);
        if (config.seed >= 0)
        {
            env->setSeed(config.seed);
        }
        return std::make_unique<EnvRun>(std::move(env), config.maxEpisodeSteps);
    }

    void registerReferenceEnvs(EnvRegistry &registry)
    {
        registry.add("Grid",
                     [](const EnvRegistry::Kwargs &kwargs) {
                         return std::make_unique<Grid>(static_cast<float>(kwargs.at("moveProbability")));
                     },
                     {{"moveProbability", 0.8}});

        auto othello = [](const EnvRegistry::Kwargs &kwargs) {
            return std::make_unique<Othello>(static_cast<int64_t>(kwargs.at("W")), static_cast<int64_t>(kwargs.at("H")));
        };
        registry.add("Othello", othello, {{"W", 8}, {"H", 8}});
        registry.add("Othello6x6", othello, {{"W", 6}, {"H", 6}});
    }

    TEST_CASE("EnvRegistry")
    {
        EnvRegistry registry;
        registry.add("Grid",
                     [](const EnvRegistry::Kwargs &kwargs) {
                         return std::make_unique<Grid>(static_cast<float>(kwargs.at("moveProbability")));
                     },
                     {{"moveProbability", 0.8}});

        SUBCASE("Unknown names are rejected")
        {
            CHECK_THROWS_AS(registry.make(EnvConfig("Missing")), std::invalid_argument);
            CHECK_THROWS_AS(registry.add("Grid", nullptr), std::invalid_argument);
        }

        SUBCASE("Unknown keywords are rejected")
        {
            CHECK_THROWS_AS(registry.make(EnvConfig("Grid", {{"size", 3}})), std::invalid_argument);
        }

        SUBCASE("Config limits the episode length")
        {
            EnvConfig config("Grid", {{"moveProbability", 1.0}});
            config.maxEpisodeSteps = 5;
            config.seed = 3;
            auto run = registry.make(config);
            CHECK(run->getName() == "Grid");
            CHECK(run->getMaxEpisodeSteps() == 5);
        }

        SUBCASE("Lists registered names")
        {
            CHECK(registry.contains("Grid"));
            CHECK(registry.names() == std::vector<std::string>{"Grid"});
        }
    }

    TEST_CASE("registerReferenceEnvs()")
    {
        EnvRegistry registry;
        registerReferenceEnvs(registry);
        CHECK(registry.names() == std::vector<std::string>{"Grid", "Othello", "Othello6x6"});

        auto small = registry.make(EnvConfig("Othello6x6"));
        CHECK(small->getName() == "Othello6x6");
        CHECK(small->actionSpace()->getDiscreteNum() == 36);
        CHECK(small->getPlayerNum() == 2);

        auto resized = registry.make(EnvConfig("Othello", {{"W", 6}, {"H", 6}}));
        CHECK(resized->getMaxEpisodeSteps() == 36);
        CHECK_THROWS_AS(registry.make(EnvConfig("Othello", {{"W", 5}})), std::invalid_argument);
    }
}
