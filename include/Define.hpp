#pragma once

#ifndef SIMPLERL_DEFINE_HPP
#define SIMPLERL_DEFINE_HPP

#include<map>
#include<string>

#include<msgpack.hpp>

namespace SimpleRL
{
    /** @brief Action representation an algorithm asks for. ANY accepts the environment's native type. */
    enum class RLActionType
    {
        ANY,
        DISCRETE,
        CONTINUOUS
    };

    /** @brief Observation representation an algorithm asks for. ANY accepts the environment's native type. */
    enum class RLObservationType
    {
        ANY,
        DISCRETE,
        CONTINUOUS
    };

    /** @brief What an environment's observation tensor means. SHAPE2/SHAPE3 are image-like layouts. */
    enum class EnvObservationType
    {
        UNKNOWN,
        DISCRETE,
        CONTINUOUS,
        SHAPE2,
        SHAPE3
    };

    enum class SpaceType
    {
        DISCRETE,
        ARRAY_DISCRETE,
        CONTINUOUS,
        ARRAY_CONTINUOUS,
        BOX
    };

    /**
     * @brief How EnvRun decides whose turn is next.
     *
     * ROUND_ROBIN cycles 0..playerNum-1 after every step. ENVIRONMENT_DECLARED asks
     * the environment (passes, extra moves, simultaneous-move emulation).
     */
    enum class TurnOrder
    {
        ROUND_ROBIN,
        ENVIRONMENT_DECLARED
    };

    /** @brief Free-form numeric side information returned by steps and workers. */
    using InfoMap = std::map<std::string, float>;

    std::string toString(RLActionType type);
    std::string toString(RLObservationType type);
    std::string toString(EnvObservationType type);
    std::string toString(SpaceType type);
}

MSGPACK_ADD_ENUM(SimpleRL::RLActionType);
MSGPACK_ADD_ENUM(SimpleRL::RLObservationType);
MSGPACK_ADD_ENUM(SimpleRL::EnvObservationType);
MSGPACK_ADD_ENUM(SimpleRL::SpaceType);

#endif //SIMPLERL_DEFINE_HPP
