#include<fmt/format.h>
#include<doctest/doctest.h>

#include"../../include/Errors.hpp"
#include"../../include/RL/RLSpaces.hpp"
#include"../../include/Space/ArrayDiscreteSpace.hpp"
#include"../../include/Space/BoxSpace.hpp"
#include"../../include/Space/DiscreteSpace.hpp"

namespace SimpleRL
{
    namespace
    {
        void checkSameSpace(const char *role, const Space &expected, const Space &actual)
        {
            if (expected.getShape() != actual.getShape())
            {
                throw ShapeMismatchError(fmt::format("{} space {} does not match bound {}",
                                                     role,
                                                     actual.toString(),
                                                     expected.toString()));
            }
            if (expected != actual)
            {
                throw TypeIncompatibilityError(fmt::format("{} space {} does not match bound {}",
                                                           role,
                                                           actual.toString(),
                                                           expected.toString()));
            }
        }
    }

    void RLSpaces::checkCompatible(const RLSpaces &other) const
    {
        checkSameSpace("Action", *actionSpace, *other.actionSpace);
        checkSameSpace("Observation", *observationSpace, *other.observationSpace);
        if (observationType != other.observationType)
        {
            throw TypeIncompatibilityError(fmt::format("Observation type {} does not match bound {}",
                                                       SimpleRL::toString(other.observationType),
                                                       SimpleRL::toString(observationType)));
        }
    }

    RLSpacesDescriptor RLSpaces::describe() const
    {
        RLSpacesDescriptor descriptor;
        descriptor.action = actionSpace->describe();
        descriptor.observation = observationSpace->describe();
        descriptor.observationType = observationType;
        return descriptor;
    }

    RLSpaces RLSpaces::fromDescriptor(const RLSpacesDescriptor &descriptor)
    {
        RLSpaces spaces;
        spaces.actionSpace = makeSpace(descriptor.action);
        spaces.observationSpace = makeSpace(descriptor.observation);
        spaces.observationType = descriptor.observationType;
        return spaces;
    }

    std::string RLSpaces::toString() const
    {
        return fmt::format("action={}, observation={} ({})",
                           actionSpace->toString(),
                           observationSpace->toString(),
                           SimpleRL::toString(observationType));
    }

    TEST_CASE("RLSpaces")
    {
        RLSpaces spaces;
        spaces.actionSpace = std::make_shared<DiscreteSpace>(4);
        spaces.observationSpace = std::make_shared<ArrayDiscreteSpace>(2, 0, 3);
        spaces.observationType = EnvObservationType::DISCRETE;

        SUBCASE("Descriptor rebuilds compatible spaces")
        {
            CHECK_NOTHROW(spaces.checkCompatible(RLSpaces::fromDescriptor(spaces.describe())));
        }

        SUBCASE("Shape differences are shape mismatches")
        {
            auto other = spaces;
            other.observationSpace = std::make_shared<ArrayDiscreteSpace>(3, 0, 3);
            CHECK_THROWS_AS(spaces.checkCompatible(other), ShapeMismatchError);
        }

        SUBCASE("Kind differences are type incompatibilities")
        {
            auto other = spaces;
            other.actionSpace = std::make_shared<DiscreteSpace>(5);
            CHECK_THROWS_AS(spaces.checkCompatible(other), TypeIncompatibilityError);

            other = spaces;
            other.observationSpace = std::make_shared<BoxSpace>(std::vector<int64_t>{2}, 0.0, 3.0);
            CHECK_THROWS_AS(spaces.checkCompatible(other), TypeIncompatibilityError);
        }
    }
}
