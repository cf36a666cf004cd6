#include<fmt/format.h>
#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../../include/Algorithms/DQN.hpp"
#include"../../include/Algorithms/QL.hpp"
#include"../../include/Env/EnvRun.hpp"
#include"../../include/Envs/Grid.hpp"
#include"../../include/Errors.hpp"
#include"../../include/RL/RLRegistry.hpp"
#include"../../include/Space/ArrayContinuousSpace.hpp"
#include"../../include/Space/DiscreteSpace.hpp"

namespace SimpleRL
{
    RLConfig AlgorithmFactory::makeConfig(const std::map<std::string, double> &hyperParameters,
                                          std::vector<std::string> processors) const
    {
        auto merged = defaultHyperParameters();
        for (const auto &entry : hyperParameters)
        {
            if (merged.count(entry.first) == 0)
            {
                throw std::invalid_argument(fmt::format("{} has no hyperparameter '{}'", getName(), entry.first));
            }
            merged[entry.first] = entry.second;
        }
        return RLConfig(getName(), actionType(), observationType(), std::move(merged), std::move(processors));
    }

    void RLRegistry::add(std::shared_ptr<const AlgorithmFactory> factory)
    {
        if (!factory)
        {
            throw std::invalid_argument("Cannot register a null algorithm factory");
        }
        const auto name = factory->getName();
        if (factories.count(name) != 0)
        {
            throw std::invalid_argument("Algorithm '" + name + "' is already registered");
        }
        factories.emplace(name, std::move(factory));
        spdlog::debug("Registered algorithm {}", name);
    }

    bool RLRegistry::contains(const std::string &name) const
    {
        return factories.count(name) != 0;
    }

    std::vector<std::string> RLRegistry::names() const
    {
        std::vector<std::string> result;
        for (const auto &entry : factories)
        {
            result.push_back(entry.first);
        }
        return result;
    }

    const AlgorithmFactory &RLRegistry::get(const std::string &name) const
    {
        auto found = factories.find(name);
        if (found == factories.end())
        {
            throw std::invalid_argument("Unknown algorithm '" + name + "'");
        }
        return *found->second;
    }

    RLConfig RLRegistry::makeConfig(const std::string &name,
                                    const std::map<std::string, double> &hyperParameters,
                                    std::vector<std::string> processors) const
    {
        return get(name).makeConfig(hyperParameters, std::move(processors));
    }

    std::shared_ptr<RLParameter> RLRegistry::makeParameter(const RLConfig &config, const RLSpaces &spaces) const
    {
        return get(config.getName()).makeParameter(config, spaces);
    }

    std::shared_ptr<RLRemoteMemory> RLRegistry::makeRemoteMemory(const RLConfig &config, const RLSpaces &spaces) const
    {
        return get(config.getName()).makeRemoteMemory(config, spaces);
    }

    std::shared_ptr<WorkerAdapter> RLRegistry::makeWorker(const RLConfig &config,
                                                          const SpaceAdapter &adapter,
                                                          std::shared_ptr<RLParameter> parameter,
                                                          std::shared_ptr<RLRemoteMemory> memory,
                                                          bool training,
                                                          int64_t actorId) const
    {
        const auto &factory = get(config.getName());
        if (!parameter || !memory)
        {
            throw std::invalid_argument(config.getName() + " worker needs a parameter and a memory");
        }
        parameter->getSpaces().checkCompatible(adapter.getSpaces());
        memory->getSpaces().checkCompatible(adapter.getSpaces());

        auto worker = factory.makeWorker(config, adapter.getSpaces(), std::move(parameter), std::move(memory), training, actorId);
        return std::make_shared<WorkerAdapter>(adapter, std::move(worker));
    }

    std::unique_ptr<RLTrainer> RLRegistry::makeTrainer(const RLConfig &config,
                                                       std::shared_ptr<RLParameter> parameter,
                                                       std::shared_ptr<RLRemoteMemory> memory) const
    {
        return get(config.getName()).makeTrainer(config, std::move(parameter), std::move(memory));
    }

    void registerReferenceAlgorithms(RLRegistry &registry)
    {
        registry.add(std::make_shared<QLFactory>());
        registry.add(std::make_shared<DQNFactory>());
    }

    TEST_CASE("RLRegistry")
    {
        RLRegistry registry;
        registerReferenceAlgorithms(registry);
        EnvRun env(std::make_unique<Grid>());

        SUBCASE("Lookups")
        {
            CHECK(registry.names() == std::vector<std::string>{"DQN", "QL"});
            CHECK_THROWS_AS(registry.get("PPO"), std::invalid_argument);
            CHECK_THROWS_AS(registry.add(std::make_shared<QLFactory>()), std::invalid_argument);
        }

        SUBCASE("Configs merge defaults and reject unknown keys")
        {
            auto config = registry.makeConfig("QL", {{"gamma", 0.5}});
            CHECK(config.get("gamma") == doctest::Approx(0.5));
            CHECK(config.get("epsilon") == doctest::Approx(0.1));
            CHECK(config.getActionType() == RLActionType::DISCRETE);
            CHECK_THROWS_AS(registry.makeConfig("QL", {{"momentum", 0.9}}), std::invalid_argument);
        }

        SUBCASE("Workers are checked against the parameter's spaces")
        {
            auto config = registry.makeConfig("QL");
            auto adapter = SpaceAdapter::fromEnv(config, env);
            auto parameter = registry.makeParameter(config, adapter.getSpaces());
            auto memory = registry.makeRemoteMemory(config, adapter.getSpaces());
            CHECK_NOTHROW(registry.makeWorker(config, adapter, parameter, memory));

            auto other = adapter.getSpaces();
            other.observationSpace = std::make_shared<DiscreteSpace>(12);
            auto foreign = registry.makeParameter(config, other);
            CHECK_THROWS_AS(registry.makeWorker(config, adapter, foreign, memory), ShapeMismatchError);
        }

        SUBCASE("DISCRETE algorithms refuse unbounded continuous actions")
        {
            auto config = registry.makeConfig("QL");
            auto unbounded = std::make_shared<ArrayContinuousSpace>(2);
            CHECK_THROWS_AS(SpaceAdapter::make(config, unbounded, env.observationSpace(), env.observationType()),
                            UnboundedConversionError);
        }
    }
}
