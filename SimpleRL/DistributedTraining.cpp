#include<iostream>
#include<memory>
#include<string>
#include<thread>

#include<ATen/Parallel.h>
#include<spdlog/spdlog.h>

#include"../include/SimpleRL.hpp"

using namespace SimpleRL;

// Environment
const std::string envName = "Othello6x6";
const std::string opponent = "cpu";

// Algorithm hyperparameters
const std::string algorithm = "DQN";
const double epsilon = 0.2;
const double learningRate = 5e-4;
const double discountFactor = 0.99;
const int batchSize = 32;
const int warmup = 200;
const int hiddenSize = 128;

// Distribution
const int numActors = 2;
const int64_t episodesPerActor = 200;
const int64_t publishInterval = 50;
const int64_t actorLogInterval = 50;
const int64_t learnerLogInterval = 200;
const int zmqBasePort = 10201;
const std::string parameterPath = "dqn_othello6x6.bin";

std::unique_ptr<Transport> makeEndpoint(bool useZmq,
                                        int actor,
                                        ZmqTransport::Mode mode,
                                        std::unique_ptr<InProcessChannel> &inProcess)
{
    if (!useZmq)
    {
        return std::move(inProcess);
    }
    const std::string url = mode == ZmqTransport::Mode::BIND ?
                            "tcp://*:" + std::to_string(zmqBasePort + actor) :
                            "tcp://127.0.0.1:" + std::to_string(zmqBasePort + actor);
    return std::make_unique<ZmqTransport>(url, mode);
}

int main(int argc, char *argv[])
{
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("%^[%T %7l] %v%$");
    at::set_num_threads(1);
    torch::manual_seed(0);

    const bool useZmq = argc > 1 && std::string(argv[1]) == "zmq";
    spdlog::info("Transport: {}", useZmq ? "ZeroMQ" : "in-process");

    EnvRegistry envs;
    registerReferenceEnvs(envs);
    RLRegistry algorithms;
    registerReferenceAlgorithms(algorithms);

    auto config = algorithms.makeConfig(algorithm,
                                        {{"epsilon", epsilon},
                                         {"lr", learningRate},
                                         {"gamma", discountFactor},
                                         {"batchSize", batchSize},
                                         {"warmup", warmup},
                                         {"hiddenSize", hiddenSize}},
                                        {"layer"});

    auto learnerEnv = envs.make(EnvConfig(envName));
    auto adapter = SpaceAdapter::fromEnv(config, *learnerEnv);
    spdlog::info("Algorithm spaces: {}", adapter.getSpaces().toString());

    auto parameter = algorithms.makeParameter(config, adapter.getSpaces());
    auto memory = algorithms.makeRemoteMemory(config, adapter.getSpaces());
    auto trainer = algorithms.makeTrainer(config, parameter, memory);

    std::vector<std::unique_ptr<Transport>> learnerEnds;
    std::vector<std::unique_ptr<Transport>> actorEnds;
    for (int i = 0; i < numActors; ++i)
    {
        auto pair = InProcessChannel::makePair();
        learnerEnds.push_back(makeEndpoint(useZmq, i, ZmqTransport::Mode::BIND, pair.second));
        actorEnds.push_back(makeEndpoint(useZmq, i, ZmqTransport::Mode::CONNECT, pair.first));
    }

    std::vector<std::thread> actorThreads;
    for (int i = 0; i < numActors; ++i)
    {
        actorThreads.emplace_back([&, i] {
            auto env = envs.make(EnvConfig(envName));
            auto actorParameter = algorithms.makeParameter(config, adapter.getSpaces());
            auto actorMemory = algorithms.makeRemoteMemory(config, adapter.getSpaces());

            std::vector<WorkerRun> workers;
            workers.emplace_back(algorithms.makeWorker(config, adapter, actorParameter, actorMemory, true, i), 0);
            workers.emplace_back(env->getEnv().makeWorker(opponent), 1);

            Actor actor(i, *env, workers, actorParameter, actorMemory, *actorEnds[i]);
            ActorOptions options;
            options.episodes = episodesPerActor;
            options.logInterval = actorLogInterval;
            auto report = actor.run(options);
            spdlog::info("Actor {} rewards {:.1f} over {} episodes", i, report.rewardSum[0], report.episodes);
        });
    }

    std::vector<Transport *> transports;
    for (auto &end : learnerEnds)
    {
        transports.push_back(end.get());
    }
    Learner learner(*trainer, transports);
    LearnerOptions options;
    options.publishInterval = publishInterval;
    options.logInterval = learnerLogInterval;
    auto report = learner.run(options);

    for (auto &thread : actorThreads)
    {
        thread.join();
    }

    spdlog::info("Trained {} steps on {} transitions", report.trainCount, report.experienceAdded);
    parameter->save(parameterPath);
    spdlog::info("Saved parameter to {}", parameterPath);

    auto evalEnv = envs.make(EnvConfig(envName));
    std::vector<WorkerRun> players;
    players.emplace_back(algorithms.makeWorker(config, adapter, parameter, memory, false), 0);
    players.emplace_back(evalEnv->getEnv().makeWorker(opponent), 1);
    auto result = playEpisode(*evalEnv, players);
    evalEnv->renderTerminal(std::cout);
    spdlog::info("Evaluation against {}: reward {:.1f}", opponent, result.rewards[0]);

    return 0;
}
