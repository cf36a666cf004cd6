#include<algorithm>
#include<thread>

#include<doctest/doctest.h>
#include<fmt/format.h>
#include<spdlog/spdlog.h>

#include"../../include/Distributed/Actor.hpp"
#include"../../include/Distributed/Learner.hpp"
#include"../../include/Env/EnvRegistry.hpp"
#include"../../include/Errors.hpp"
#include"../../include/RL/RLRegistry.hpp"
#include"../../include/Transport/InProcessChannel.hpp"
#include"../../include/Worker/SpaceAdapter.hpp"

namespace SimpleRL
{
    namespace
    {
        /** Forwards to another transport, but the first `garbled` frames cannot be read. */
        class GarbledTransport : public Transport
        {
        private:
            Transport &inner;
            int garbled;

        public:
            GarbledTransport(Transport &inner, int garbled) : inner(inner), garbled(garbled)
            {
            }

            void send(const Blob &blob) override
            {
                inner.send(blob);
            }

            std::optional<Blob> tryReceive(std::chrono::milliseconds timeout) override
            {
                if (garbled > 0)
                {
                    --garbled;
                    return Blob::fromBytes("\xc1 not msgpack");
                }
                return inner.tryReceive(timeout);
            }
        };
    }

    Learner::Learner(RLTrainer &trainer, std::vector<Transport *> actors) :
    trainer(trainer),
    actors(std::move(actors))
    {
        if (std::any_of(this->actors.begin(), this->actors.end(), [](Transport *transport) {
                return transport == nullptr;
            }))
        {
            throw std::invalid_argument("Learner needs a transport per actor");
        }
    }

    void Learner::receive(size_t actorIndex,
                          std::chrono::milliseconds timeout,
                          std::vector<bool> &done,
                          LearnerReport &report)
    {
        for (auto wait = timeout;; wait = std::chrono::milliseconds(0))
        {
            std::optional<Blob> blob;
            try
            {
                blob = actors[actorIndex]->tryReceive(wait);
            }
            catch (const IncompatibleRestoreError &e)
            {
                ++report.rejected;
                spdlog::error("Unreadable frame from actor connection {}: {}", actorIndex, e.what());
                continue;
            }
            if (!blob)
            {
                return;
            }

            if (blob->typeTag == actorDoneTag)
            {
                done[actorIndex] = true;
                spdlog::info("Actor {} is done", blob->sequence);
                return;
            }

            try
            {
                report.experienceAdded += static_cast<int64_t>(trainer.getMemory()->merge(*blob));
                ++report.experienceReceived;
            }
            catch (const IncompatibleRestoreError &e)
            {
                ++report.rejected;
                spdlog::error("Rejected '{}' from actor connection {}: {}", blob->typeTag, actorIndex, e.what());
            }
        }
    }

    void Learner::publish()
    {
        Blob blob = trainer.getParameter()->backup();
        blob.sequence = ++sequence;
        for (auto *transport : actors)
        {
            transport->send(blob);
        }
    }

    LearnerReport Learner::run(const LearnerOptions &options)
    {
        LearnerReport report;
        std::vector<bool> done(actors.size(), false);
        const int64_t startCount = trainer.getTrainCount();
        bool trained = false;

        while (std::find(done.begin(), done.end(), false) != done.end())
        {
            if (options.maxTrainCount > 0 && trainer.getTrainCount() - startCount >= options.maxTrainCount)
            {
                break;
            }

            for (size_t i = 0; i < actors.size(); ++i)
            {
                if (!done[i])
                {
                    receive(i, trained ? std::chrono::milliseconds(0) : options.pollTimeout, done, report);
                }
            }

            try
            {
                auto update = trainer.train();
                trained = true;
                const int64_t count = trainer.getTrainCount() - startCount;
                if (options.publishInterval > 0 && count % options.publishInterval == 0)
                {
                    publish();
                    ++report.parametersSent;
                }
                if (options.logInterval > 0 && count % options.logInterval == 0)
                {
                    std::string metrics;
                    for (const auto &datum : update)
                    {
                        metrics += fmt::format(" {}={:.4f}", datum.name, datum.value);
                    }
                    spdlog::info("Learner train {:>8}, memory {}:{}", count, trainer.getMemory()->length(), metrics);
                }
            }
            catch (const InsufficientDataError &e)
            {
                trained = false;
                spdlog::debug("Learner waiting for experience: {}", e.what());
            }
        }

        report.trainCount = trainer.getTrainCount() - startCount;
        publish();
        ++report.parametersSent;
        spdlog::info("Learner finished after {} train steps, {} experience Blobs", report.trainCount,
                     report.experienceReceived);
        return report;
    }

    TEST_CASE("Distributed actor and learner")
    {
        torch::manual_seed(0);
        EnvRegistry envs;
        registerReferenceEnvs(envs);
        RLRegistry algorithms;
        registerReferenceAlgorithms(algorithms);

        EnvConfig envConfig("Grid", {{"moveProbability", 1.0}});
        auto env = envs.make(envConfig);
        auto config = algorithms.makeConfig("QL", {{"epsilon", 0.3}, {"lr", 0.5}});
        auto adapter = SpaceAdapter::fromEnv(config, *env);

        auto learnerParameter = algorithms.makeParameter(config, adapter.getSpaces());
        auto learnerMemory = algorithms.makeRemoteMemory(config, adapter.getSpaces());
        auto trainer = algorithms.makeTrainer(config, learnerParameter, learnerMemory);

        auto actorParameter = algorithms.makeParameter(config, adapter.getSpaces());
        auto actorMemory = algorithms.makeRemoteMemory(config, adapter.getSpaces());
        std::vector<WorkerRun> workers;
        workers.emplace_back(algorithms.makeWorker(config, adapter, actorParameter, actorMemory, true, 1));

        auto channel = InProcessChannel::makePair();

        SUBCASE("Trains from shipped experience and hands parameters back")
        {
            Actor actor(1, *env, workers, actorParameter, actorMemory, *channel.first);
            Learner learner(*trainer, {channel.second.get()});

            LearnerReport learnerReport;
            std::thread learnerThread([&] {
                LearnerOptions options;
                options.publishInterval = 5;
                learnerReport = learner.run(options);
            });

            ActorOptions options;
            options.episodes = 200;
            auto actorReport = actor.run(options);
            learnerThread.join();

            CHECK(actorReport.episodes == 200);
            CHECK(actorReport.experienceSent > 0);
            CHECK(actorMemory->length() == 0);
            CHECK(learnerReport.experienceReceived == actorReport.experienceSent);
            CHECK(learnerReport.rejected == 0);
            CHECK(learnerReport.trainCount > 0);
            CHECK(learnerReport.parametersSent >= 1);

            CHECK(actor.syncParameters(std::chrono::seconds(5)));
            CHECK(actorParameter->backup().payload == learnerParameter->backup().payload);
        }

        SUBCASE("Duplicate experience is merged once")
        {
            for (int episode = 0; episode < 3; ++episode)
            {
                playEpisode(*env, workers);
            }
            const auto transitions = static_cast<int64_t>(actorMemory->length());
            auto blob = actorMemory->backup();
            channel.first->send(blob);
            channel.first->send(blob);
            Blob done;
            done.typeTag = actorDoneTag;
            channel.first->send(done);

            LearnerOptions options;
            options.publishInterval = 0;
            Learner learner(*trainer, {channel.second.get()});
            auto report = learner.run(options);

            CHECK(report.experienceReceived == 2);
            CHECK(report.experienceAdded == transitions);
            CHECK(report.parametersSent == 1);
            CHECK(channel.first->pending() == 1);
        }

        SUBCASE("Foreign Blobs are rejected without stopping the learner")
        {
            Blob foreign;
            foreign.typeTag = "DQN/Memory";
            channel.first->send(foreign);
            Blob done;
            done.typeTag = actorDoneTag;
            channel.first->send(done);

            Learner learner(*trainer, {channel.second.get()});
            auto report = learner.run(LearnerOptions());
            CHECK(report.rejected == 1);
            CHECK(report.experienceAdded == 0);
        }

        SUBCASE("Unreadable frames are counted and skipped")
        {
            for (int episode = 0; episode < 2; ++episode)
            {
                playEpisode(*env, workers);
            }
            const auto transitions = static_cast<int64_t>(actorMemory->length());
            channel.first->send(actorMemory->backup());
            Blob done;
            done.typeTag = actorDoneTag;
            channel.first->send(done);

            GarbledTransport garbled(*channel.second, 2);
            Learner learner(*trainer, {&garbled});
            auto report = learner.run(LearnerOptions());
            CHECK(report.rejected == 2);
            CHECK(report.experienceReceived == 1);
            CHECK(report.experienceAdded == transitions);

            GarbledTransport actorSide(*channel.first, 1);
            Actor garbledActor(1, *env, workers, actorParameter, actorMemory, actorSide);
            CHECK(garbledActor.syncParameters(std::chrono::seconds(5)));
            CHECK(actorParameter->backup().payload == learnerParameter->backup().payload);
        }

        SUBCASE("A stale or foreign parameter Blob leaves the replica untouched")
        {
            Actor actor(1, *env, workers, actorParameter, actorMemory, *channel.first);
            const auto before = actorParameter->backup().payload;
            Blob foreign;
            foreign.typeTag = "DQN/Parameter";
            foreign.sequence = 1;
            channel.second->send(foreign);
            CHECK_FALSE(actor.syncParameters(std::chrono::milliseconds(10)));
            CHECK(actorParameter->backup().payload == before);
        }
    }
}
