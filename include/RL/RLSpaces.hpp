#pragma once

#ifndef SIMPLERL_RL_RLSPACES_HPP
#define SIMPLERL_RL_RLSPACES_HPP

#include<memory>
#include<string>

#include<msgpack.hpp>

#include"../Define.hpp"
#include"../Space/Space.hpp"

namespace SimpleRL
{
    /**
     * @struct RLSpacesDescriptor
     * @brief msgpack form of RLSpaces, stored inside parameter and memory snapshots.
     */
    struct RLSpacesDescriptor
    {
        SpaceDescriptor action;
        SpaceDescriptor observation;
        EnvObservationType observationType = EnvObservationType::UNKNOWN;
        MSGPACK_DEFINE_MAP(action, observation, observationType);
    };

    /**
     * @struct RLSpaces
     * @brief The action and observation spaces as seen by an algorithm.
     *
     * Produced by SpaceAdapter from an environment and an RLConfig. Parameters and
     * memories are bound to one RLSpaces for their whole life.
     */
    struct RLSpaces
    {
        std::shared_ptr<const Space> actionSpace;
        std::shared_ptr<const Space> observationSpace;
        EnvObservationType observationType = EnvObservationType::UNKNOWN;

        /**
         * @brief Verifies `other` describes the same algorithm-side spaces.
         * @throws ShapeMismatchError if a shape differs
         * @throws TypeIncompatibilityError if a variant, element type or range differs
         */
        void checkCompatible(const RLSpaces &other) const;

        RLSpacesDescriptor describe() const;

        static RLSpaces fromDescriptor(const RLSpacesDescriptor &descriptor);

        std::string toString() const;
    };
}

#endif //SIMPLERL_RL_RLSPACES_HPP
