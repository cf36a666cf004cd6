#include<fmt/format.h>
#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../../include/Env/EnvRun.hpp"
#include"../../include/Errors.hpp"
#include"../../include/Envs/Grid.hpp"
#include"../../include/Space/ArrayContinuousSpace.hpp"
#include"../../include/Space/ArrayDiscreteSpace.hpp"
#include"../../include/Space/BoxSpace.hpp"
#include"../../include/Space/DiscreteSpace.hpp"
#include"../../include/Worker/SpaceAdapter.hpp"

namespace SimpleRL
{
    SpaceAdapter SpaceAdapter::make(const RLConfig &config,
                                    const std::shared_ptr<const Space> &envActionSpace,
                                    const std::shared_ptr<const Space> &envObservationSpace,
                                    EnvObservationType envObservationType,
                                    std::vector<std::shared_ptr<const Processor>> processors)
    {
        if (!envActionSpace || !envObservationSpace)
        {
            throw std::invalid_argument("SpaceAdapter needs both environment spaces");
        }

        SpaceAdapter adapter;
        adapter.actionType = config.getActionType();
        adapter.observationType = config.getObservationType();
        adapter.envActionSpace = envActionSpace;
        adapter.processors = std::move(processors);

        switch (adapter.actionType)
        {
            case RLActionType::ANY:
                adapter.spaces.actionSpace = envActionSpace;
                break;
            case RLActionType::DISCRETE:
                envActionSpace->checkDiscretizable();
                adapter.spaces.actionSpace = std::make_shared<DiscreteSpace>(envActionSpace->getDiscreteNum());
                break;
            case RLActionType::CONTINUOUS:
                adapter.spaces.actionSpace = envActionSpace->continuousView();
                break;
        }

        auto observationSpace = envObservationSpace;
        auto type = envObservationType;
        for (const auto &processor : adapter.processors)
        {
            if (!processor)
            {
                throw std::invalid_argument("SpaceAdapter got a null processor");
            }
            std::tie(observationSpace, type) = processor->changeObservationInfo(observationSpace, type);
        }
        adapter.processedObservationSpace = observationSpace;
        adapter.spaces.observationType = type;

        switch (adapter.observationType)
        {
            case RLObservationType::ANY:
                adapter.spaces.observationSpace = observationSpace;
                break;
            case RLObservationType::DISCRETE:
                adapter.spaces.observationSpace = observationSpace->discreteView();
                break;
            case RLObservationType::CONTINUOUS:
                adapter.spaces.observationSpace = observationSpace->continuousView();
                break;
        }

        spdlog::debug("{}: {} adapted to {}", config.getName(), envActionSpace->toString(), adapter.spaces.toString());
        return adapter;
    }

    SpaceAdapter SpaceAdapter::fromEnv(const RLConfig &config, const EnvRun &env)
    {
        std::vector<std::shared_ptr<const Processor>> processors;
        for (const auto &name : config.getProcessors())
        {
            processors.push_back(env.getEnv().makeProcessor(name));
        }
        return make(config, env.actionSpace(), env.observationSpace(), env.observationType(), std::move(processors));
    }

    torch::Tensor SpaceAdapter::encodeObservation(const torch::Tensor &observation, const EnvRun &env) const
    {
        auto processed = observation;
        for (const auto &processor : processors)
        {
            processed = processor->processObservation(processed, env);
        }

        switch (observationType)
        {
            case RLObservationType::DISCRETE:
                return processedObservationSpace->toDiscrete(processed);
            case RLObservationType::CONTINUOUS:
                return processedObservationSpace->toContinuous(processed);
            case RLObservationType::ANY:
                break;
        }
        return processed;
    }

    torch::Tensor SpaceAdapter::decodeAction(const torch::Tensor &rlAction) const
    {
        switch (actionType)
        {
            case RLActionType::DISCRETE:
                return envActionSpace->fromDiscrete(envActionSpace->decodeDiscreteIndex(rlAction.item<int64_t>()));
            case RLActionType::CONTINUOUS:
                return envActionSpace->fromContinuous(rlAction);
            case RLActionType::ANY:
                break;
        }
        return rlAction.to(envActionSpace->nativeDtype());
    }

    torch::Tensor SpaceAdapter::encodeAction(const torch::Tensor &envAction) const
    {
        switch (actionType)
        {
            case RLActionType::DISCRETE:
                return DiscreteSpace::value(envActionSpace->encodeDiscreteIndex(envActionSpace->toDiscrete(envAction)));
            case RLActionType::CONTINUOUS:
                return envActionSpace->toContinuous(envAction);
            case RLActionType::ANY:
                break;
        }
        return envAction;
    }

    std::vector<int64_t> SpaceAdapter::encodeInvalidActions(const std::vector<int64_t> &invalidActions) const
    {
        if (actionType == RLActionType::CONTINUOUS)
        {
            return {};
        }
        return invalidActions;
    }

    namespace
    {
        /** Shifts observations into [0, 1] per element. */
        class NormalizeProcessor : public Processor
        {
        public:
            std::string getName() const override
            {
                return "normalize";
            }

            std::pair<std::shared_ptr<const Space>, EnvObservationType>
            changeObservationInfo(const std::shared_ptr<const Space> &space, EnvObservationType type) const override
            {
                if (!space->isBounded())
                {
                    throw TypeIncompatibilityError("normalize needs a bounded observation space");
                }
                auto shape = space->getShape();
                return {std::make_shared<BoxSpace>(shape, torch::zeros(shape), torch::ones(shape), false), EnvObservationType::CONTINUOUS};
            }

            torch::Tensor processObservation(const torch::Tensor &observation, const EnvRun &env) const override
            {
                auto space = env.observationSpace();
                auto low = space->getLow();
                return ((observation.to(torch::kDouble) - low) / (space->getHigh() - low)).to(torch::kFloat);
            }
        };

        RLConfig adapterConfig(RLActionType actionType, RLObservationType observationType)
        {
            return RLConfig("test", actionType, observationType);
        }
    }

    TEST_CASE("SpaceAdapter")
    {
        SUBCASE("ANY keeps a discrete environment untouched")
        {
            auto action = std::make_shared<DiscreteSpace>(4);
            auto observation = std::make_shared<ArrayDiscreteSpace>(2, 0, 3);
            auto adapter = SpaceAdapter::make(adapterConfig(RLActionType::ANY, RLObservationType::ANY),
                                              action,
                                              observation,
                                              EnvObservationType::DISCRETE);
            CHECK(*adapter.getSpaces().actionSpace == *action);
            CHECK(*adapter.getSpaces().observationSpace == *observation);
            for (int64_t i = 0; i < 4; ++i)
            {
                auto decoded = adapter.decodeAction(DiscreteSpace::value(i));
                CHECK(decoded.item<int64_t>() == i);
                CHECK(decoded.scalar_type() == torch::kLong);
            }
            CHECK(adapter.encodeInvalidActions({1, 3}) == std::vector<int64_t>{1, 3});
        }

        SUBCASE("DISCRETE over an unbounded action space fails at construction")
        {
            auto action = std::make_shared<ArrayContinuousSpace>(2);
            auto observation = std::make_shared<DiscreteSpace>(3);
            CHECK_THROWS_AS(SpaceAdapter::make(adapterConfig(RLActionType::DISCRETE, RLObservationType::ANY),
                                               action,
                                               observation,
                                               EnvObservationType::DISCRETE),
                            UnboundedConversionError);
            CHECK_THROWS_AS(SpaceAdapter::make(adapterConfig(RLActionType::ANY, RLObservationType::DISCRETE),
                                               observation,
                                               action,
                                               EnvObservationType::CONTINUOUS),
                            UnboundedConversionError);
        }

        SUBCASE("Bounded continuous actions become one flat index")
        {
            auto action = std::make_shared<ArrayContinuousSpace>(2, -1.0, 1.0, 5);
            auto observation = std::make_shared<DiscreteSpace>(3);
            auto adapter = SpaceAdapter::make(adapterConfig(RLActionType::DISCRETE, RLObservationType::ANY),
                                              action,
                                              observation,
                                              EnvObservationType::DISCRETE);
            CHECK(*adapter.getSpaces().actionSpace == DiscreteSpace(25));
            for (int64_t i = 0; i < 25; ++i)
            {
                auto decoded = adapter.decodeAction(DiscreteSpace::value(i));
                CHECK(action->contains(decoded));
                CHECK(adapter.encodeAction(decoded).item<int64_t>() == i);
            }
        }

        SUBCASE("Box observations become bins")
        {
            auto action = std::make_shared<DiscreteSpace>(2);
            auto observation = std::make_shared<BoxSpace>(std::vector<int64_t>{4}, -1.0, 1.0, false, 4);
            auto adapter = SpaceAdapter::make(adapterConfig(RLActionType::ANY, RLObservationType::DISCRETE),
                                              action,
                                              observation,
                                              EnvObservationType::CONTINUOUS);
            CHECK(adapter.getSpaces().observationSpace->getType() == SpaceType::ARRAY_DISCRETE);
            CHECK(adapter.getSpaces().observationSpace->getBinCounts() == std::vector<int64_t>{4, 4, 4, 4});
        }

        SUBCASE("Processors run before conversion")
        {
            EnvRun env(std::make_unique<Grid>());
            std::vector<std::shared_ptr<const Processor>> processors{std::make_shared<NormalizeProcessor>()};
            auto adapter = SpaceAdapter::make(adapterConfig(RLActionType::ANY, RLObservationType::CONTINUOUS),
                                              env.actionSpace(),
                                              env.observationSpace(),
                                              env.observationType(),
                                              processors);
            CHECK(adapter.getSpaces().observationType == EnvObservationType::CONTINUOUS);

            auto state = env.reset();
            auto encoded = adapter.encodeObservation(state, env);
            CHECK(adapter.getSpaces().observationSpace->contains(encoded));
            CHECK(encoded[0].item<float>() == doctest::Approx(0.0f));
            CHECK(encoded[1].item<float>() == doctest::Approx(1.0f));
        }

        SUBCASE("Unknown processor names are rejected")
        {
            EnvRun env(std::make_unique<Grid>());
            auto config = adapterConfig(RLActionType::ANY, RLObservationType::ANY).withProcessors({"missing"});
            CHECK_THROWS_AS(SpaceAdapter::fromEnv(config, env), std::invalid_argument);
        }
    }
}
