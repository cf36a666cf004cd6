#include<algorithm>
#include<cmath>
#include<filesystem>
#include<limits>

#include<fmt/format.h>
#include<fmt/ranges.h>
#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../../include/Algorithms/QL.hpp"
#include"../../include/Envs/Grid.hpp"
#include"../../include/Errors.hpp"
#include"../../include/Runner/Episode.hpp"
#include"../../include/Space/DiscreteSpace.hpp"
#include"../../include/Worker/WorkerAdapter.hpp"

namespace SimpleRL
{
    namespace
    {
        struct QLSnapshot
        {
            RLSpacesDescriptor spaces;
            std::map<std::string, std::vector<float>> table;
            MSGPACK_DEFINE_MAP(spaces, table);
        };

        bool isInvalid(int64_t action, const std::vector<int64_t> &invalidActions)
        {
            return std::find(invalidActions.begin(), invalidActions.end(), action) != invalidActions.end();
        }
    }

    int64_t argmaxValid(const std::vector<float> &values, const std::vector<int64_t> &invalidActions)
    {
        std::vector<int64_t> best;
        float bestValue = -std::numeric_limits<float>::infinity();
        for (int64_t action = 0; action < static_cast<int64_t>(values.size()); ++action)
        {
            if (isInvalid(action, invalidActions))
            {
                continue;
            }
            const float value = values[static_cast<size_t>(action)];
            if (best.empty() || value > bestValue)
            {
                best.assign(1, action);
                bestValue = value;
            }
            else if (value == bestValue)
            {
                best.push_back(action);
            }
        }
        if (best.empty())
        {
            return -1;
        }
        if (best.size() == 1)
        {
            return best[0];
        }
        return best[static_cast<size_t>(torch::randint(static_cast<int64_t>(best.size()), {1}).item<int64_t>())];
    }

    int64_t randomValid(int64_t n, const std::vector<int64_t> &invalidActions)
    {
        std::vector<float> flat(static_cast<size_t>(n), 0.0f);
        return argmaxValid(flat, invalidActions);
    }

    QLParameter::QLParameter(RLConfig config, RLSpaces spaces) :
    RLParameter(std::move(config), std::move(spaces)),
    actionNum(0)
    {
        if (!this->spaces.actionSpace->isDiscrete() || !this->spaces.observationSpace->isDiscrete())
        {
            throw TypeIncompatibilityError("QL needs discrete spaces, got " + this->spaces.toString());
        }
        actionNum = this->spaces.actionSpace->getDiscreteNum();
    }

    const char *QLParameter::typeTag()
    {
        return "QL/Parameter";
    }

    std::string QLParameter::stateKey(const torch::Tensor &state)
    {
        auto flat = state.to(torch::kLong).contiguous().view({-1});
        std::vector<int64_t> values(flat.data_ptr<int64_t>(), flat.data_ptr<int64_t>() + flat.numel());
        return fmt::format("{}", fmt::join(values, ","));
    }

    std::vector<float> QLParameter::getQValues(const torch::Tensor &state) const
    {
        auto found = table.find(stateKey(state));
        if (found == table.end())
        {
            return std::vector<float>(static_cast<size_t>(actionNum), 0.0f);
        }
        return found->second;
    }

    std::vector<float> &QLParameter::qValues(const torch::Tensor &state)
    {
        auto &row = table[stateKey(state)];
        if (row.empty())
        {
            row.assign(static_cast<size_t>(actionNum), 0.0f);
        }
        return row;
    }

    Blob QLParameter::backup() const
    {
        QLSnapshot snapshot;
        snapshot.spaces = spaces.describe();
        snapshot.table = table;
        return packBlob(typeTag(), blobVersion, snapshot);
    }

    void QLParameter::restore(const Blob &blob)
    {
        auto snapshot = unpackBlob<QLSnapshot>(blob, typeTag(), blobVersion);
        checkSnapshotSpaces(spaces, snapshot.spaces, typeTag());
        for (const auto &row : snapshot.table)
        {
            if (static_cast<int64_t>(row.second.size()) != actionNum)
            {
                throw IncompatibleRestoreError(fmt::format("QL row '{}' holds {} values, expected {}",
                                                           row.first,
                                                           row.second.size(),
                                                           actionNum));
            }
        }
        table = std::move(snapshot.table);
    }

    QLWorker::QLWorker(RLConfig config,
                       RLSpaces spaces,
                       std::shared_ptr<const QLParameter> parameter,
                       std::shared_ptr<RLRemoteMemory> memory,
                       bool training,
                       int64_t actorId) :
    RLWorker(std::move(config), std::move(spaces), training),
    parameter(std::move(parameter)),
    memory(std::move(memory)),
    epsilon(0),
    actorId(actorId)
    {
        if (!this->parameter || !this->memory)
        {
            throw std::invalid_argument("QLWorker needs a parameter and a memory");
        }
        epsilon = training ? this->config.get("epsilon") : this->config.get("testEpsilon");
    }

    void QLWorker::callOnReset(const torch::Tensor &state, const std::vector<int64_t> &invalidActions)
    {
        this->state = state;
        action = torch::Tensor();
    }

    torch::Tensor QLWorker::callPolicy(const torch::Tensor &state, const std::vector<int64_t> &invalidActions)
    {
        const auto actionNum = parameter->getActionNum();
        int64_t chosen;
        if (torch::rand({1}).item<double>() < epsilon)
        {
            chosen = randomValid(actionNum, invalidActions);
        }
        else
        {
            chosen = argmaxValid(parameter->getQValues(state), invalidActions);
        }
        if (chosen < 0)
        {
            throw InvalidActionError("QL has no valid action to choose from");
        }

        this->state = state;
        action = DiscreteSpace::value(chosen);
        return action;
    }

    InfoMap QLWorker::callOnStep(const torch::Tensor &nextState,
                                 float reward,
                                 bool done,
                                 const std::vector<int64_t> &nextInvalidActions)
    {
        if (training && action.defined())
        {
            Experience experience;
            experience.id = ExperienceId{actorId, sequence++};
            experience.state = state;
            experience.action = action;
            experience.reward = reward;
            experience.nextState = nextState;
            experience.done = done;
            experience.nextInvalidActions = nextInvalidActions;
            memory->add(experience);
        }
        state = nextState;
        return {{"epsilon", static_cast<float>(epsilon)}};
    }

    void QLWorker::callRender(std::ostream &os) const
    {
        if (!state.defined())
        {
            return;
        }
        auto values = parameter->getQValues(state);
        os << fmt::format("Q({}) = [{:.3f}]\n", QLParameter::stateKey(state), fmt::join(values, ", "));
    }

    QLTrainer::QLTrainer(RLConfig config, std::shared_ptr<RLParameter> parameter, std::shared_ptr<RLRemoteMemory> memory) :
    RLTrainer(std::move(config), parameter, memory),
    table(std::dynamic_pointer_cast<QLParameter>(parameter)),
    sequence(std::dynamic_pointer_cast<SequenceRemoteMemory>(memory)),
    gamma(this->config.get("gamma")),
    lr(this->config.get("lr")),
    batchSize(static_cast<size_t>(std::max<int64_t>(1, this->config.getInt("batchSize"))))
    {
        if (!table || !sequence)
        {
            throw std::invalid_argument("QLTrainer needs a QLParameter and a SequenceRemoteMemory");
        }
    }

    std::vector<UpdateDatum> QLTrainer::update()
    {
        auto batch = sequence->pop(batchSize);

        float tdError = 0;
        for (const auto &experience : batch)
        {
            float target = experience.reward;
            if (!experience.done)
            {
                auto next = table->getQValues(experience.nextState);
                auto best = argmaxValid(next, experience.nextInvalidActions);
                if (best >= 0)
                {
                    target += static_cast<float>(gamma) * next[static_cast<size_t>(best)];
                }
            }

            auto &row = table->qValues(experience.state);
            auto &value = row[static_cast<size_t>(experience.action.item<int64_t>())];
            const float td = target - value;
            value += static_cast<float>(lr) * td;
            tdError += std::abs(td);
        }

        return {{"td_error", tdError / static_cast<float>(batch.size())}};
    }

    std::string QLFactory::getName() const
    {
        return "QL";
    }

    RLActionType QLFactory::actionType() const
    {
        return RLActionType::DISCRETE;
    }

    RLObservationType QLFactory::observationType() const
    {
        return RLObservationType::DISCRETE;
    }

    std::map<std::string, double> QLFactory::defaultHyperParameters() const
    {
        return {{"epsilon", 0.1}, {"testEpsilon", 0.0}, {"gamma", 0.9}, {"lr", 0.1}, {"batchSize", 1}};
    }

    std::shared_ptr<RLParameter> QLFactory::makeParameter(const RLConfig &config, const RLSpaces &spaces) const
    {
        return std::make_shared<QLParameter>(config, spaces);
    }

    std::shared_ptr<RLRemoteMemory> QLFactory::makeRemoteMemory(const RLConfig &config, const RLSpaces &spaces) const
    {
        return std::make_shared<SequenceRemoteMemory>(config, spaces);
    }

    std::unique_ptr<RLWorker> QLFactory::makeWorker(const RLConfig &config,
                                                    const RLSpaces &spaces,
                                                    std::shared_ptr<RLParameter> parameter,
                                                    std::shared_ptr<RLRemoteMemory> memory,
                                                    bool training,
                                                    int64_t actorId) const
    {
        auto table = std::dynamic_pointer_cast<const QLParameter>(parameter);
        if (!table)
        {
            throw std::invalid_argument("QL workers need a QLParameter");
        }
        return std::make_unique<QLWorker>(config, spaces, table, std::move(memory), training, actorId);
    }

    std::unique_ptr<RLTrainer> QLFactory::makeTrainer(const RLConfig &config,
                                                      std::shared_ptr<RLParameter> parameter,
                                                      std::shared_ptr<RLRemoteMemory> memory) const
    {
        return std::make_unique<QLTrainer>(config, std::move(parameter), std::move(memory));
    }

    TEST_CASE("QL")
    {
        torch::manual_seed(0);
        QLFactory factory;
        EnvRun env(std::make_unique<Grid>(1.0f));
        auto config = factory.makeConfig({{"epsilon", 0.3}, {"lr", 0.5}});
        auto adapter = SpaceAdapter::make(config, env.actionSpace(), env.observationSpace(), env.observationType());
        auto parameter = factory.makeParameter(config, adapter.getSpaces());
        auto memory = factory.makeRemoteMemory(config, adapter.getSpaces());
        auto trainer = factory.makeTrainer(config, parameter, memory);

        auto makeRun = [&](bool training) {
            auto worker = factory.makeWorker(config, adapter.getSpaces(), parameter, memory, training, 0);
            return WorkerRun(std::make_shared<WorkerAdapter>(adapter, std::move(worker)));
        };

        SUBCASE("Learns the deterministic grid")
        {
            std::vector<WorkerRun> learners{makeRun(true)};
            playEpisodes(env, learners, 300, trainer.get());
            CHECK(trainer->getTrainCount() > 300);

            std::vector<WorkerRun> testers{makeRun(false)};
            auto result = playEpisode(env, testers);
            CHECK(result.doneReason == "env");
            CHECK(result.rewards[0] > 0.0f);
            CHECK(result.stepNum <= 8);
        }

        SUBCASE("Restored parameters act identically")
        {
            std::vector<WorkerRun> learners{makeRun(true)};
            playEpisodes(env, learners, 20, trainer.get());

            auto copy = factory.makeParameter(config, adapter.getSpaces());
            copy->restore(Blob::fromBytes(parameter->backup().toBytes()));
            auto &original = dynamic_cast<QLParameter &>(*parameter);
            auto &restored = dynamic_cast<QLParameter &>(*copy);
            CHECK(restored.size() == original.size());
            for (int64_t x = 0; x < 4; ++x)
            {
                for (int64_t y = 0; y < 3; ++y)
                {
                    auto state = torch::tensor({x, y});
                    CHECK(original.getQValues(state) == restored.getQValues(state));
                }
            }
            CHECK(copy->backup().payload == parameter->backup().payload);
        }

        SUBCASE("Saved parameters load from disk")
        {
            std::vector<WorkerRun> learners{makeRun(true)};
            playEpisodes(env, learners, 20, trainer.get());

            const auto path = (std::filesystem::temp_directory_path() / "simple_rl_ql_test.bin").string();
            parameter->save(path);
            auto copy = factory.makeParameter(config, adapter.getSpaces());
            copy->load(path);
            CHECK(copy->backup().payload == parameter->backup().payload);
            std::filesystem::remove(path);

            CHECK_THROWS_AS(copy->load(path), std::runtime_error);
        }

        SUBCASE("Duplicate experience deliveries train once")
        {
            std::vector<WorkerRun> actors{makeRun(true)};
            playEpisode(env, actors);
            auto blob = memory->backup();

            auto learnerMemory = factory.makeRemoteMemory(config, adapter.getSpaces());
            auto learnerParameter = factory.makeParameter(config, adapter.getSpaces());
            auto learnerTrainer = factory.makeTrainer(config, learnerParameter, learnerMemory);
            const auto added = learnerMemory->merge(blob);
            CHECK(added == memory->length());
            CHECK(learnerMemory->merge(blob) == 0);
            CHECK(learnerMemory->merge(Blob::fromBytes(blob.toBytes())) == 0);

            for (size_t i = 0; i < added; ++i)
            {
                auto data = learnerTrainer->train();
                REQUIRE(data.size() == 1);
                CHECK(std::isfinite(data[0].value));
            }
            CHECK_THROWS_AS(learnerTrainer->train(), InsufficientDataError);
            CHECK(learnerTrainer->getTrainCount() == static_cast<int64_t>(added));
        }

        SUBCASE("Snapshots of other spaces are refused")
        {
            auto other = adapter.getSpaces();
            other.actionSpace = std::make_shared<DiscreteSpace>(5);
            QLParameter foreign(config, other);
            auto before = parameter->backup().payload;
            CHECK_THROWS_AS(parameter->restore(foreign.backup()), IncompatibleRestoreError);
            CHECK(parameter->backup().payload == before);
        }

        SUBCASE("Continuous observations are refused")
        {
            auto spaces = adapter.getSpaces();
            spaces.observationSpace = spaces.observationSpace->continuousView();
            CHECK_THROWS_AS(QLParameter(config, spaces), TypeIncompatibilityError);
        }
    }
}
