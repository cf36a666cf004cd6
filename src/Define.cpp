#include"../include/Define.hpp"

namespace SimpleRL
{
    std::string toString(RLActionType type)
    {
        switch (type)
        {
            case RLActionType::ANY: return "ANY";
            case RLActionType::DISCRETE: return "DISCRETE";
            case RLActionType::CONTINUOUS: return "CONTINUOUS";
        }
        return "UNKNOWN";
    }

    std::string toString(RLObservationType type)
    {
        switch (type)
        {
            case RLObservationType::ANY: return "ANY";
            case RLObservationType::DISCRETE: return "DISCRETE";
            case RLObservationType::CONTINUOUS: return "CONTINUOUS";
        }
        return "UNKNOWN";
    }

    std::string toString(EnvObservationType type)
    {
        switch (type)
        {
            case EnvObservationType::UNKNOWN: return "UNKNOWN";
            case EnvObservationType::DISCRETE: return "DISCRETE";
            case EnvObservationType::CONTINUOUS: return "CONTINUOUS";
            case EnvObservationType::SHAPE2: return "SHAPE2";
            case EnvObservationType::SHAPE3: return "SHAPE3";
        }
        return "UNKNOWN";
    }

    std::string toString(SpaceType type)
    {
        switch (type)
        {
            case SpaceType::DISCRETE: return "Discrete";
            case SpaceType::ARRAY_DISCRETE: return "ArrayDiscrete";
            case SpaceType::CONTINUOUS: return "Continuous";
            case SpaceType::ARRAY_CONTINUOUS: return "ArrayContinuous";
            case SpaceType::BOX: return "Box";
        }
        return "Unknown";
    }
}
