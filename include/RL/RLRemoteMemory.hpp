#pragma once

#ifndef SIMPLERL_RL_RLREMOTEMEMORY_HPP
#define SIMPLERL_RL_RLREMOTEMEMORY_HPP

#include<cstddef>

#include"../Blob.hpp"
#include"../Memory/Experience.hpp"
#include"RLConfig.hpp"
#include"RLSpaces.hpp"

namespace SimpleRL
{
    /**
     * @class RLRemoteMemory
     * @brief Experience store of an algorithm.
     *
     * Each process holds its own replica. Actors add() locally and ship backup()
     * Blobs; the learner merge()s them. Transitions are identified by
     * ExperienceId and a replica never stores the same id twice, so re-sent or
     * reordered Blobs are harmless.
     */
    class RLRemoteMemory : public Checkpointable
    {
    protected:
        RLConfig config;
        RLSpaces spaces;

    public:
        RLRemoteMemory(RLConfig config, RLSpaces spaces) : config(std::move(config)), spaces(std::move(spaces))
        {
        }

        ~RLRemoteMemory() override = default;

        /** @return false if a transition with the same id was already stored */
        virtual bool add(const Experience &experience) = 0;

        /** @return number of stored transitions */
        virtual size_t length() const = 0;

        /**
         * @brief Adds the transitions of another replica's backup().
         * @return number of transitions actually added
         * @throws IncompatibleRestoreError if the Blob comes from another memory type or spaces
         */
        virtual size_t merge(const Blob &blob) = 0;

        /** @brief Drops stored transitions. Seen ids are kept. */
        virtual void clear() = 0;

        inline const RLConfig &getConfig() const
        {
            return config;
        }

        inline const RLSpaces &getSpaces() const
        {
            return spaces;
        }
    };
}

#endif //SIMPLERL_RL_RLREMOTEMEMORY_HPP
