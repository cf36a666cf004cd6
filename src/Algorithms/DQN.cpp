#include<algorithm>
#include<cmath>
#include<sstream>

#include<fmt/format.h>
#include<fmt/ranges.h>
#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../../include/Algorithms/DQN.hpp"
#include"../../include/Algorithms/QL.hpp"
#include"../../include/Envs/Grid.hpp"
#include"../../include/Errors.hpp"
#include"../../include/Memory/ExperienceReplayBuffer.hpp"
#include"../../include/Memory/RankBaseMemory.hpp"
#include"../../include/Runner/Episode.hpp"
#include"../../include/Space/DiscreteSpace.hpp"
#include"../../include/Worker/WorkerAdapter.hpp"

namespace SimpleRL
{
    namespace
    {
        struct DQNSnapshot
        {
            RLSpacesDescriptor spaces;
            int64_t hiddenSize = 0;
            std::vector<char> online;
            std::vector<char> target;
            MSGPACK_DEFINE_MAP(spaces, hiddenSize, online, target);
        };

        std::vector<char> saveNetwork(const DuelingNetwork &network)
        {
            std::ostringstream stream;
            torch::save(network, stream);
            const auto bytes = stream.str();
            return std::vector<char>(bytes.begin(), bytes.end());
        }

        void loadNetwork(DuelingNetwork &network, const std::vector<char> &bytes)
        {
            std::istringstream stream(std::string(bytes.begin(), bytes.end()));
            torch::load(network, stream);
        }

        void copyWeights(DuelingNetwork &from, DuelingNetwork &to)
        {
            torch::NoGradGuard guard;
            auto source = from->named_parameters();
            for (auto &parameter : to->named_parameters())
            {
                parameter.value().copy_(source[parameter.key()]);
            }
        }

        /** @return a [actionNum] bool mask, true for invalid actions */
        torch::Tensor invalidMask(int64_t actionNum, const std::vector<int64_t> &invalidActions)
        {
            auto mask = torch::zeros({actionNum}, torch::TensorOptions().dtype(torch::kBool));
            for (auto action : invalidActions)
            {
                if (action >= 0 && action < actionNum)
                {
                    mask[action].fill_(true);
                }
            }
            return mask;
        }
    }

    DQNParameter::DQNParameter(RLConfig config, RLSpaces spaces) :
    RLParameter(std::move(config), std::move(spaces)),
    actionNum(0),
    online(nullptr),
    target(nullptr)
    {
        if (!this->spaces.actionSpace->isDiscrete() || !this->spaces.actionSpace->getShape().empty())
        {
            throw TypeIncompatibilityError("DQN needs a single discrete action, got " +
                                           this->spaces.actionSpace->toString());
        }
        actionNum = this->spaces.actionSpace->getDiscreteNum();
        const auto numInputs = this->spaces.observationSpace->numel();
        const auto hiddenSize = this->config.getInt("hiddenSize");

        online = DuelingNetwork(numInputs, actionNum, hiddenSize);
        target = DuelingNetwork(numInputs, actionNum, hiddenSize);
        target->eval();
        syncTarget();
    }

    const char *DQNParameter::typeTag()
    {
        return "DQN/Parameter";
    }

    torch::Tensor DQNParameter::predict(const torch::Tensor &states)
    {
        torch::NoGradGuard guard;
        return online->forward(states);
    }

    void DQNParameter::syncTarget()
    {
        copyWeights(online, target);
    }

    Blob DQNParameter::backup() const
    {
        DQNSnapshot snapshot;
        snapshot.spaces = spaces.describe();
        snapshot.hiddenSize = online->getHiddenSize();
        snapshot.online = saveNetwork(online);
        snapshot.target = saveNetwork(target);
        return packBlob(typeTag(), blobVersion, snapshot);
    }

    void DQNParameter::restore(const Blob &blob)
    {
        auto snapshot = unpackBlob<DQNSnapshot>(blob, typeTag(), blobVersion);
        checkSnapshotSpaces(spaces, snapshot.spaces, typeTag());
        if (snapshot.hiddenSize != online->getHiddenSize())
        {
            throw IncompatibleRestoreError(fmt::format("DQN snapshot has hidden size {}, network has {}",
                                                       snapshot.hiddenSize,
                                                       online->getHiddenSize()));
        }

        DuelingNetwork loadedOnline(online->getNumInputs(), actionNum, snapshot.hiddenSize);
        DuelingNetwork loadedTarget(online->getNumInputs(), actionNum, snapshot.hiddenSize);
        try
        {
            loadNetwork(loadedOnline, snapshot.online);
            loadNetwork(loadedTarget, snapshot.target);
        }
        catch (const std::exception &e)
        {
            throw IncompatibleRestoreError(std::string("Corrupted DQN weights: ") + e.what());
        }

        copyWeights(loadedOnline, online);
        copyWeights(loadedTarget, target);
    }

    DQNWorker::DQNWorker(RLConfig config,
                         RLSpaces spaces,
                         std::shared_ptr<DQNParameter> parameter,
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
            throw std::invalid_argument("DQNWorker needs a parameter and a memory");
        }
        epsilon = training ? this->config.get("epsilon") : this->config.get("testEpsilon");
    }

    void DQNWorker::callOnReset(const torch::Tensor &state, const std::vector<int64_t> &invalidActions)
    {
        this->state = state;
        action = torch::Tensor();
        lastQ = torch::Tensor();
    }

    torch::Tensor DQNWorker::callPolicy(const torch::Tensor &state, const std::vector<int64_t> &invalidActions)
    {
        const auto actionNum = parameter->getActionNum();
        lastQ = parameter->predict(state.unsqueeze(0))[0];

        int64_t chosen;
        if (torch::rand({1}).item<double>() < epsilon)
        {
            chosen = randomValid(actionNum, invalidActions);
        }
        else
        {
            auto q = lastQ.contiguous();
            std::vector<float> values(q.data_ptr<float>(), q.data_ptr<float>() + q.numel());
            chosen = argmaxValid(values, invalidActions);
        }
        if (chosen < 0)
        {
            throw InvalidActionError("DQN has no valid action to choose from");
        }

        this->state = state;
        action = DiscreteSpace::value(chosen);
        return action;
    }

    InfoMap DQNWorker::callOnStep(const torch::Tensor &nextState,
                                  float reward,
                                  bool done,
                                  const std::vector<int64_t> &nextInvalidActions)
    {
        InfoMap info{{"epsilon", static_cast<float>(epsilon)}};
        if (lastQ.defined() && action.defined())
        {
            info["q"] = lastQ[action.item<int64_t>()].item<float>();
        }

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
        return info;
    }

    void DQNWorker::callRender(std::ostream &os) const
    {
        if (!lastQ.defined())
        {
            return;
        }
        auto q = lastQ.contiguous();
        std::vector<float> values(q.data_ptr<float>(), q.data_ptr<float>() + q.numel());
        os << fmt::format("Q = [{:.3f}]\n", fmt::join(values, ", "));
    }

    DQNTrainer::DQNTrainer(RLConfig config, std::shared_ptr<RLParameter> parameter, std::shared_ptr<RLRemoteMemory> memory) :
    RLTrainer(std::move(config), parameter, memory),
    networks(std::dynamic_pointer_cast<DQNParameter>(parameter)),
    replay(std::dynamic_pointer_cast<ReplayMemory>(memory)),
    gamma(this->config.get("gamma")),
    batchSize(static_cast<size_t>(std::max<int64_t>(1, this->config.getInt("batchSize")))),
    warmup(static_cast<size_t>(std::max<int64_t>(0, this->config.getInt("warmup")))),
    targetUpdateInterval(std::max<int64_t>(1, this->config.getInt("targetUpdateInterval"))),
    maxGradNorm(this->config.get("maxGradNorm"))
    {
        if (!networks || !replay)
        {
            throw std::invalid_argument("DQNTrainer needs a DQNParameter and a ReplayMemory");
        }
        optimizer = std::make_unique<torch::optim::Adam>(networks->getOnline()->parameters(),
                                                         torch::optim::AdamOptions(this->config.get("lr")));
    }

    std::vector<UpdateDatum> DQNTrainer::update()
    {
        const auto required = std::max(batchSize, warmup);
        if (replay->length() < required)
        {
            throw InsufficientDataError(fmt::format("DQN needs {} transitions, memory holds {}",
                                                    required,
                                                    replay->length()));
        }

        auto batch = replay->sample(batchSize, getTrainCount());
        const auto actionNum = networks->getActionNum();

        std::vector<torch::Tensor> states, nextStates, actions, masks;
        std::vector<float> rewards, dones;
        for (const auto &experience : batch.experiences)
        {
            states.push_back(experience.state.to(torch::kFloat));
            nextStates.push_back(experience.nextState.to(torch::kFloat));
            actions.push_back(experience.action.to(torch::kLong).reshape({1}));
            masks.push_back(invalidMask(actionNum, experience.nextInvalidActions));
            rewards.push_back(experience.reward);
            dones.push_back(experience.done ? 1.0f : 0.0f);
        }
        auto stateBatch = torch::stack(states);
        auto nextStateBatch = torch::stack(nextStates);
        auto actionBatch = torch::stack(actions);
        auto maskBatch = torch::stack(masks);
        auto rewardBatch = torch::tensor(rewards);
        auto doneBatch = torch::tensor(dones);
        auto weightBatch = torch::tensor(batch.weights);

        torch::Tensor targets;
        {
            torch::NoGradGuard guard;
            // double DQN: the online network picks, the target network evaluates
            auto nextOnline = networks->getOnline()->forward(nextStateBatch).masked_fill(maskBatch, -1e9);
            auto nextActions = nextOnline.argmax(1, true);
            auto nextValues = networks->getTarget()->forward(nextStateBatch).gather(1, nextActions).squeeze(1);
            targets = rewardBatch + static_cast<float>(gamma) * (1 - doneBatch) * nextValues;
        }

        auto q = networks->getOnline()->forward(stateBatch).gather(1, actionBatch).squeeze(1);
        auto tdError = targets - q;
        auto absError = tdError.abs();
        auto huber = torch::where(absError < 1, 0.5 * tdError.pow(2), absError - 0.5);
        auto loss = (weightBatch * huber).mean();

        optimizer->zero_grad();
        loss.backward();
        torch::nn::utils::clip_grad_norm_(networks->getOnline()->parameters(), maxGradNorm);
        optimizer->step();

        auto priorities = absError.detach().contiguous();
        replay->update(std::move(batch),
                       std::vector<float>(priorities.data_ptr<float>(), priorities.data_ptr<float>() + priorities.numel()));

        if ((getTrainCount() + 1) % targetUpdateInterval == 0)
        {
            networks->syncTarget();
            spdlog::debug("DQN target network synced at step {}", getTrainCount() + 1);
        }

        return {{"loss", loss.item<float>()}, {"td_error", priorities.mean().item<float>()}};
    }

    std::string DQNFactory::getName() const
    {
        return "DQN";
    }

    RLActionType DQNFactory::actionType() const
    {
        return RLActionType::DISCRETE;
    }

    RLObservationType DQNFactory::observationType() const
    {
        return RLObservationType::CONTINUOUS;
    }

    std::map<std::string, double> DQNFactory::defaultHyperParameters() const
    {
        return {{"epsilon", 0.1},
                {"testEpsilon", 0.0},
                {"gamma", 0.99},
                {"lr", 0.001},
                {"batchSize", 32},
                {"warmup", 100},
                {"hiddenSize", 64},
                {"targetUpdateInterval", 100},
                {"maxGradNorm", 10.0},
                {"memoryCapacity", 10000},
                {"enableRankBaseMemory", 1},
                {"alpha", 1.0},
                {"betaInitial", 0.4},
                {"betaSteps", 10000}};
    }

    std::shared_ptr<RLParameter> DQNFactory::makeParameter(const RLConfig &config, const RLSpaces &spaces) const
    {
        return std::make_shared<DQNParameter>(config, spaces);
    }

    std::shared_ptr<RLRemoteMemory> DQNFactory::makeRemoteMemory(const RLConfig &config, const RLSpaces &spaces) const
    {
        if (config.get("enableRankBaseMemory") != 0)
        {
            return std::make_shared<RankBaseMemory>(config, spaces);
        }
        return std::make_shared<ExperienceReplayBuffer>(config, spaces);
    }

    std::unique_ptr<RLWorker> DQNFactory::makeWorker(const RLConfig &config,
                                                     const RLSpaces &spaces,
                                                     std::shared_ptr<RLParameter> parameter,
                                                     std::shared_ptr<RLRemoteMemory> memory,
                                                     bool training,
                                                     int64_t actorId) const
    {
        auto networks = std::dynamic_pointer_cast<DQNParameter>(parameter);
        if (!networks)
        {
            throw std::invalid_argument("DQN workers need a DQNParameter");
        }
        return std::make_unique<DQNWorker>(config, spaces, networks, std::move(memory), training, actorId);
    }

    std::unique_ptr<RLTrainer> DQNFactory::makeTrainer(const RLConfig &config,
                                                       std::shared_ptr<RLParameter> parameter,
                                                       std::shared_ptr<RLRemoteMemory> memory) const
    {
        return std::make_unique<DQNTrainer>(config, std::move(parameter), std::move(memory));
    }

    TEST_CASE("DQN")
    {
        torch::manual_seed(0);
        DQNFactory factory;
        EnvRun env(std::make_unique<Grid>());
        auto config = factory.makeConfig({{"epsilon", 0.5},
                                          {"batchSize", 8},
                                          {"warmup", 16},
                                          {"hiddenSize", 16},
                                          {"targetUpdateInterval", 5},
                                          {"memoryCapacity", 256}});
        auto adapter = SpaceAdapter::fromEnv(config, env);
        auto parameter = factory.makeParameter(config, adapter.getSpaces());
        auto memory = factory.makeRemoteMemory(config, adapter.getSpaces());
        auto trainer = factory.makeTrainer(config, parameter, memory);
        auto &networks = dynamic_cast<DQNParameter &>(*parameter);

        auto makeRun = [&](std::shared_ptr<RLRemoteMemory> target, int64_t actorId) {
            auto worker = factory.makeWorker(config, adapter.getSpaces(), parameter, std::move(target), true, actorId);
            return WorkerRun(std::make_shared<WorkerAdapter>(adapter, std::move(worker)));
        };

        SUBCASE("Observations are continuous, actions one flat index")
        {
            CHECK(adapter.getSpaces().actionSpace->getType() == SpaceType::DISCRETE);
            CHECK(adapter.getSpaces().observationSpace->getType() == SpaceType::ARRAY_CONTINUOUS);
            CHECK(networks.getActionNum() == 4);
        }

        SUBCASE("Waits for the warmup, then trains")
        {
            CHECK_THROWS_AS(trainer->train(), InsufficientDataError);
            std::vector<WorkerRun> actors{makeRun(memory, 0)};
            while (memory->length() < 16)
            {
                playEpisode(env, actors);
            }

            auto before = networks.predict(torch::tensor({0.0f, 2.0f}).unsqueeze(0)).clone();
            for (int i = 0; i < 10; ++i)
            {
                auto data = trainer->train();
                REQUIRE(data.size() == 2);
                CHECK(std::isfinite(data[0].value));
            }
            CHECK(trainer->getTrainCount() == 10);
            CHECK_FALSE(torch::equal(before, networks.predict(torch::tensor({0.0f, 2.0f}).unsqueeze(0))));
            CHECK(memory->length() >= 16);
        }

        SUBCASE("Restored parameters predict identically")
        {
            std::vector<WorkerRun> actors{makeRun(memory, 0)};
            while (memory->length() < 16)
            {
                playEpisode(env, actors);
            }
            trainer->train();

            auto copy = factory.makeParameter(config, adapter.getSpaces());
            copy->restore(Blob::fromBytes(parameter->backup().toBytes()));
            auto &restored = dynamic_cast<DQNParameter &>(*copy);

            auto states = torch::rand({20, 2}) * torch::tensor({3.0f, 2.0f});
            CHECK(torch::equal(networks.predict(states), restored.predict(states)));
            CHECK(torch::equal(networks.getTarget()->forward(states), restored.getTarget()->forward(states)));

            // a trainer built before the restore keeps optimizing the restored weights
            auto copyMemory = factory.makeRemoteMemory(config, adapter.getSpaces());
            auto copyTrainer = factory.makeTrainer(config, copy, copyMemory);
            copy->restore(parameter->backup());
            copyMemory->merge(memory->backup());
            CHECK_NOTHROW(copyTrainer->train());
            CHECK_FALSE(torch::equal(networks.predict(states), restored.predict(states)));
        }

        SUBCASE("Duplicate experience deliveries are harmless")
        {
            auto actorMemory = factory.makeRemoteMemory(config, adapter.getSpaces());
            std::vector<WorkerRun> actors{makeRun(actorMemory, 3)};
            while (actorMemory->length() < 16)
            {
                playEpisode(env, actors);
            }
            auto blob = actorMemory->backup();

            const auto added = memory->merge(blob);
            CHECK(added == actorMemory->length());
            CHECK(memory->merge(blob) == 0);
            CHECK(memory->length() == added);
            for (int i = 0; i < 5; ++i)
            {
                CHECK(std::isfinite(trainer->train()[0].value));
            }
            CHECK(memory->merge(blob) == 0);
            CHECK(memory->length() == added);
        }

        SUBCASE("Uniform replay can replace the ranked memory")
        {
            auto uniformConfig = config.withHyperParameter("enableRankBaseMemory", 0);
            auto uniform = factory.makeRemoteMemory(uniformConfig, adapter.getSpaces());
            CHECK(dynamic_cast<ExperienceReplayBuffer *>(uniform.get()) != nullptr);
            auto uniformTrainer = factory.makeTrainer(uniformConfig, parameter, uniform);
            std::vector<WorkerRun> actors{makeRun(uniform, 0)};
            while (uniform->length() < 16)
            {
                playEpisode(env, actors);
            }
            CHECK_NOTHROW(uniformTrainer->train());
        }

        SUBCASE("QL's memory is refused")
        {
            auto sequence = QLFactory().makeRemoteMemory(config, adapter.getSpaces());
            CHECK_THROWS_AS(factory.makeTrainer(config, parameter, sequence), std::invalid_argument);
        }
    }
}
