#include<iostream>
#include<string>

#include<ATen/Parallel.h>
#include<spdlog/spdlog.h>

#include"../include/SimpleRL.hpp"

using namespace SimpleRL;

// Environment
const std::string envName = "Grid";
const double moveProbability = 0.9;
const int64_t envSeed = 1;

// Algorithm hyperparameters
const std::string algorithm = "QL";
const double epsilon = 0.2;
const double learningRate = 0.3;
const double discountFactor = 0.9;

const int64_t trainEpisodes = 2000;
const int64_t logInterval = 200;
const std::string parameterPath = "ql_grid.bin";

int main(int argc, char *argv[])
{
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("%^[%T %7l] %v%$");
    at::set_num_threads(1);
    torch::manual_seed(0);

    EnvRegistry envs;
    registerReferenceEnvs(envs);
    RLRegistry algorithms;
    registerReferenceAlgorithms(algorithms);

    spdlog::info("Creating environment {}", envName);
    EnvConfig envConfig(envName, {{"moveProbability", moveProbability}});
    envConfig.seed = envSeed;
    auto env = envs.make(envConfig);
    spdlog::info("Action space: {}", env->actionSpace()->toString());
    spdlog::info("Observation space: {}", env->observationSpace()->toString());

    auto config = algorithms.makeConfig(algorithm, {{"epsilon", epsilon}, {"lr", learningRate}, {"gamma", discountFactor}});
    auto adapter = SpaceAdapter::fromEnv(config, *env);
    spdlog::info("Algorithm spaces: {}", adapter.getSpaces().toString());

    auto parameter = algorithms.makeParameter(config, adapter.getSpaces());
    auto memory = algorithms.makeRemoteMemory(config, adapter.getSpaces());
    auto trainer = algorithms.makeTrainer(config, parameter, memory);

    spdlog::info("Training {} for {} episodes", algorithm, trainEpisodes);
    std::vector<WorkerRun> learners;
    learners.emplace_back(algorithms.makeWorker(config, adapter, parameter, memory, true));
    auto results = playEpisodes(*env, learners, trainEpisodes, trainer.get(), logInterval);

    float rewardSum = 0;
    for (const auto &result : results)
    {
        rewardSum += result.rewards[0];
    }
    spdlog::info("Average training reward {:.3f}, {} train steps", rewardSum / results.size(), trainer->getTrainCount());

    parameter->save(parameterPath);
    spdlog::info("Saved parameter to {}", parameterPath);

    auto restored = algorithms.makeParameter(config, adapter.getSpaces());
    restored->load(parameterPath);
    std::vector<WorkerRun> testers;
    testers.emplace_back(algorithms.makeWorker(config, adapter, restored, memory, false));

    spdlog::info("Evaluating the restored parameter");
    auto result = playEpisode(*env, testers, nullptr, &std::cout);
    env->renderTerminal(std::cout);
    spdlog::info("Evaluation: {} steps, reward {:.3f}, done by {}", result.stepNum, result.rewards[0], result.doneReason);

    return 0;
}
