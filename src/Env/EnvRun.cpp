#include<algorithm>

#include<fmt/format.h>
#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../../include/Env/EnvRun.hpp"
#include"../../include/Errors.hpp"
#include"../../include/Space/ContinuousSpace.hpp"
#include"../../include/Space/DiscreteSpace.hpp"

namespace SimpleRL
{
    namespace
    {
        struct EnvRunState
        {
            TensorData state;
            std::vector<float> stepRewards;
            std::vector<float> episodeRewards;
            bool done = true;
            std::string doneReason;
            int64_t stepNum = 0;
            int playerIndex = 0;
            InfoMap info;
            Blob env;
            MSGPACK_DEFINE_MAP(state, stepRewards, episodeRewards, done, doneReason, stepNum, playerIndex, info, env);
        };
    }

    EnvRun::EnvRun(std::unique_ptr<EnvBase> env, int64_t maxEpisodeSteps) :
    env(std::move(env)),
    maxEpisodeSteps(-1)
    {
        if (!this->env)
        {
            throw std::invalid_argument("EnvRun needs an environment");
        }
        const int playerNum = this->env->playerNum();
        if (playerNum < 1)
        {
            throw std::invalid_argument(this->env->getName() + " declares no players");
        }

        this->maxEpisodeSteps = this->env->maxEpisodeSteps();
        if (maxEpisodeSteps > 0 && (this->maxEpisodeSteps <= 0 || maxEpisodeSteps < this->maxEpisodeSteps))
        {
            this->maxEpisodeSteps = maxEpisodeSteps;
        }
        stepRewards.assign(static_cast<size_t>(playerNum), 0.0f);
        episodeRewards.assign(static_cast<size_t>(playerNum), 0.0f);
    }

    std::string EnvRun::typeTag() const
    {
        return "EnvRun/" + env->getName();
    }

    int EnvRun::nextPlayerIndex() const
    {
        const int playerNum = env->playerNum();
        if (env->turnOrder() == TurnOrder::ROUND_ROBIN)
        {
            return (playerIndex + 1) % playerNum;
        }
        const int next = env->currentPlayerIndex();
        if (next < 0 || next >= playerNum)
        {
            throw std::logic_error(fmt::format("{} declared player {} of {}", env->getName(), next, playerNum));
        }
        return next;
    }

    torch::Tensor EnvRun::reset()
    {
        const auto playerNum = static_cast<size_t>(env->playerNum());
        auto initialState = env->reset();

        state = initialState;
        stepRewards.assign(playerNum, 0.0f);
        episodeRewards.assign(playerNum, 0.0f);
        done = false;
        doneReason.clear();
        stepNum = 0;
        info.clear();
        playerIndex = 0;
        if (env->turnOrder() == TurnOrder::ENVIRONMENT_DECLARED)
        {
            playerIndex = nextPlayerIndex();
        }

        spdlog::debug("{} reset, player {} to move", env->getName(), playerIndex);
        return state;
    }

    EnvStep EnvRun::step(const torch::Tensor &action, int playerIndex)
    {
        if (done)
        {
            throw InvalidActionError(fmt::format("{}: episode is over ({}), reset() first", getName(), doneReason));
        }
        if (playerIndex != this->playerIndex)
        {
            throw InvalidActionError(fmt::format("{}: player {} acted on player {}'s turn",
                                                 getName(),
                                                 playerIndex,
                                                 this->playerIndex));
        }

        auto space = env->actionSpace();
        if (!space->contains(action))
        {
            throw InvalidActionError(fmt::format("{}: action {} is outside {}",
                                                 getName(),
                                                 valueToString(action),
                                                 space->toString()));
        }
        if (space->isBounded())
        {
            auto invalidActions = env->getInvalidActions(playerIndex);
            if (!invalidActions.empty())
            {
                const auto index = space->encodeDiscreteIndex(space->toDiscrete(action));
                if (std::find(invalidActions.begin(), invalidActions.end(), index) != invalidActions.end())
                {
                    throw InvalidActionError(fmt::format("{}: action {} is not allowed for player {} now",
                                                         getName(),
                                                         valueToString(action),
                                                         playerIndex));
                }
            }
        }

        EnvStep result = env->step(action.to(space->nativeDtype()), playerIndex);
        if (result.rewards.size() != episodeRewards.size())
        {
            throw std::logic_error(fmt::format("{} returned {} rewards for {} players",
                                               getName(),
                                               result.rewards.size(),
                                               episodeRewards.size()));
        }

        ++stepNum;
        state = result.observation;
        stepRewards = result.rewards;
        for (size_t i = 0; i < episodeRewards.size(); ++i)
        {
            episodeRewards[i] += stepRewards[i];
        }
        info = result.info;

        if (result.done)
        {
            done = true;
            doneReason = "env";
        }
        else if (maxEpisodeSteps > 0 && stepNum >= maxEpisodeSteps)
        {
            done = true;
            doneReason = "timeout";
            result.done = true;
        }
        if (!done)
        {
            this->playerIndex = nextPlayerIndex();
        }
        return result;
    }

    std::vector<int64_t> EnvRun::getInvalidActions(int playerIndex) const
    {
        return env->getInvalidActions(playerIndex);
    }

    std::vector<int64_t> EnvRun::getValidActions(int playerIndex) const
    {
        auto invalidActions = env->getInvalidActions(playerIndex);
        std::sort(invalidActions.begin(), invalidActions.end());

        std::vector<int64_t> validActions;
        const auto discreteNum = env->actionSpace()->getDiscreteNum();
        for (int64_t action = 0; action < discreteNum; ++action)
        {
            if (!std::binary_search(invalidActions.begin(), invalidActions.end(), action))
            {
                validActions.push_back(action);
            }
        }
        return validActions;
    }

    torch::Tensor EnvRun::sampleAction() const
    {
        return env->actionSpace()->sample(env->getInvalidActions(playerIndex));
    }

    Blob EnvRun::backup() const
    {
        EnvRunState runState;
        runState.state = encodeTensor(state);
        runState.stepRewards = stepRewards;
        runState.episodeRewards = episodeRewards;
        runState.done = done;
        runState.doneReason = doneReason;
        runState.stepNum = stepNum;
        runState.playerIndex = playerIndex;
        runState.info = info;
        runState.env = env->backup();
        return packBlob(typeTag(), blobVersion, runState);
    }

    void EnvRun::restore(const Blob &blob)
    {
        auto runState = unpackBlob<EnvRunState>(blob, typeTag(), blobVersion);

        const auto playerNum = static_cast<size_t>(env->playerNum());
        if (runState.stepRewards.size() != playerNum || runState.episodeRewards.size() != playerNum ||
            runState.playerIndex < 0 || runState.playerIndex >= static_cast<int>(playerNum))
        {
            throw IncompatibleRestoreError(typeTag() + " snapshot does not match " + std::to_string(playerNum) +
                                           " players");
        }
        auto restoredState = decodeTensor(runState.state);

        env->restore(runState.env);

        state = restoredState;
        stepRewards = std::move(runState.stepRewards);
        episodeRewards = std::move(runState.episodeRewards);
        done = runState.done;
        doneReason = std::move(runState.doneReason);
        stepNum = runState.stepNum;
        playerIndex = runState.playerIndex;
        info = std::move(runState.info);
        spdlog::debug("{} restored at step {}", getName(), stepNum);
    }

    void EnvRun::renderTerminal(std::ostream &os) const
    {
        env->renderTerminal(os);
    }

    torch::Tensor EnvRun::renderRgbArray() const
    {
        return env->renderRgbArray();
    }

    namespace
    {
        /**
         * Two players. Action 0 hands the turn over, action 1 takes another turn
         * and scores a point, action 2 is never allowed. Ends after `length` steps.
         */
        class TurnTakingEnv : public EnvBase
        {
        private:
            struct Snapshot
            {
                int64_t count = 0;
                int next = 0;
                MSGPACK_DEFINE_MAP(count, next);
            };

            int64_t length;
            bool continuousActions;
            Snapshot current;

        public:
            explicit TurnTakingEnv(int64_t length, bool continuousActions = false) :
            length(length),
            continuousActions(continuousActions)
            {
            }

            std::string getName() const override
            {
                return "TurnTaking";
            }

            std::shared_ptr<const Space> actionSpace() const override
            {
                if (continuousActions)
                {
                    return std::make_shared<ContinuousSpace>(0.0, 3.0, 3);
                }
                return std::make_shared<DiscreteSpace>(3);
            }

            std::shared_ptr<const Space> observationSpace() const override
            {
                return std::make_shared<DiscreteSpace>(length + 1);
            }

            EnvObservationType observationType() const override
            {
                return EnvObservationType::DISCRETE;
            }

            int64_t maxEpisodeSteps() const override
            {
                return -1;
            }

            int playerNum() const override
            {
                return 2;
            }

            TurnOrder turnOrder() const override
            {
                return TurnOrder::ENVIRONMENT_DECLARED;
            }

            int currentPlayerIndex() const override
            {
                return current.next;
            }

            torch::Tensor reset() override
            {
                current = Snapshot();
                return DiscreteSpace::value(0);
            }

            EnvStep step(const torch::Tensor &action, int playerIndex) override
            {
                EnvStep result;
                result.rewards.assign(2, 0.0f);
                ++current.count;
                if (static_cast<int64_t>(action.item<double>()) == 1)
                {
                    result.rewards[static_cast<size_t>(playerIndex)] = 1.0f;
                }
                else
                {
                    current.next = 1 - playerIndex;
                }
                result.observation = DiscreteSpace::value(current.count);
                result.done = current.count >= length;
                return result;
            }

            std::vector<int64_t> getInvalidActions(int playerIndex) const override
            {
                return {2};
            }

            Blob backup() const override
            {
                return packBlob("TurnTaking", 1, current);
            }

            void restore(const Blob &blob) override
            {
                current = unpackBlob<Snapshot>(blob, "TurnTaking", 1);
            }
        };
    }

    TEST_CASE("EnvRun")
    {
        EnvRun run(std::make_unique<TurnTakingEnv>(6));

        SUBCASE("Refuses steps before reset")
        {
            CHECK(run.isDone());
            CHECK_THROWS_AS(run.step(DiscreteSpace::value(0), 0), InvalidActionError);
        }

        run.reset();

        SUBCASE("Environment declared turn order")
        {
            run.step(DiscreteSpace::value(1), 0);
            CHECK(run.getPlayerIndex() == 0);
            CHECK(run.getStepRewards() == std::vector<float>{1.0f, 0.0f});
            run.step(DiscreteSpace::value(0), 0);
            CHECK(run.getPlayerIndex() == 1);
            run.step(DiscreteSpace::value(1), 1);
            CHECK(run.getEpisodeRewards() == std::vector<float>{1.0f, 1.0f});
        }

        SUBCASE("Invalid actions leave the run untouched")
        {
            auto before = run.backup().toBytes();
            CHECK_THROWS_AS(run.step(DiscreteSpace::value(0), 1), InvalidActionError);
            CHECK_THROWS_AS(run.step(DiscreteSpace::value(2), 0), InvalidActionError);
            CHECK_THROWS_AS(run.step(DiscreteSpace::value(3), 0), InvalidActionError);
            CHECK_THROWS_AS(run.step(torch::tensor({0}), 0), InvalidActionError);
            CHECK(run.backup().toBytes() == before);
            CHECK(run.getStepNum() == 0);
            CHECK_FALSE(run.isDone());
        }

        SUBCASE("Done is sticky until reset")
        {
            for (int i = 0; i < 6; ++i)
            {
                run.step(DiscreteSpace::value(1), 0);
            }
            CHECK(run.isDone());
            CHECK(run.getDoneReason() == "env");
            CHECK_THROWS_AS(run.step(DiscreteSpace::value(1), 0), InvalidActionError);
            CHECK(run.isDone());
            run.reset();
            CHECK_FALSE(run.isDone());
        }

        SUBCASE("Valid actions and sampling skip invalid ones")
        {
            CHECK(run.getValidActions(0) == std::vector<int64_t>{0, 1});
            for (int i = 0; i < 20; ++i)
            {
                CHECK(run.sampleAction().item<int64_t>() != 2);
            }
        }

        SUBCASE("Restore continues identically")
        {
            run.step(DiscreteSpace::value(0), 0);
            auto blob = run.backup();

            EnvRun copy(std::make_unique<TurnTakingEnv>(6));
            copy.restore(Blob::fromBytes(blob.toBytes()));
            CHECK(copy.getPlayerIndex() == 1);
            CHECK(copy.getStepNum() == 1);

            auto original = run.step(DiscreteSpace::value(1), 1);
            auto restored = copy.step(DiscreteSpace::value(1), 1);
            CHECK(torch::equal(original.observation, restored.observation));
            CHECK(original.rewards == restored.rewards);
            CHECK(original.done == restored.done);
        }

        SUBCASE("Foreign snapshots are rejected without side effects")
        {
            run.step(DiscreteSpace::value(1), 0);
            auto blob = run.backup();
            blob.typeTag = "EnvRun/Other";
            CHECK_THROWS_AS(run.restore(blob), IncompatibleRestoreError);

            auto corrupted = run.backup();
            corrupted.payload.resize(corrupted.payload.size() / 2);
            CHECK_THROWS_AS(run.restore(corrupted), IncompatibleRestoreError);
            CHECK(run.getStepNum() == 1);
        }
    }

    TEST_CASE("EnvRun bounded continuous actions")
    {
        EnvRun run(std::make_unique<TurnTakingEnv>(6, true));
        run.reset();
        const auto before = run.backup().toBytes();
        CHECK_THROWS_AS(run.step(ContinuousSpace::value(2.5f), 0), InvalidActionError);
        CHECK(run.backup().toBytes() == before);

        run.step(ContinuousSpace::value(1.5f), 0);
        CHECK(run.getStepRewards() == std::vector<float>{1.0f, 0.0f});
        for (int i = 0; i < 20; ++i)
        {
            CHECK(run.sampleAction().item<float>() < 2.0f);
        }
    }

    TEST_CASE("EnvRun timeout")
    {
        EnvRun run(std::make_unique<TurnTakingEnv>(100), 3);
        CHECK(run.getMaxEpisodeSteps() == 3);
        run.reset();
        run.step(DiscreteSpace::value(1), 0);
        run.step(DiscreteSpace::value(1), 0);
        auto last = run.step(DiscreteSpace::value(1), 0);
        CHECK(last.done);
        CHECK(run.getDoneReason() == "timeout");
        CHECK(run.getStepNum() == 3);
    }
}
