#pragma once

#ifndef SIMPLERL_RL_RLPARAMETER_HPP
#define SIMPLERL_RL_RLPARAMETER_HPP

#include<string>

#include"../Blob.hpp"
#include"RLConfig.hpp"
#include"RLSpaces.hpp"

namespace SimpleRL
{
    /**
     * @class RLParameter
     * @brief Learned state of an algorithm (Q table, network weights...).
     *
     * Mutated by the trainer, read by workers, shipped from the learner to actors
     * through backup()/restore(). Implementations embed their RLSpaces in the
     * snapshot and refuse snapshots taken for different spaces.
     */
    class RLParameter : public Checkpointable
    {
    protected:
        RLConfig config;
        RLSpaces spaces;

    public:
        RLParameter(RLConfig config, RLSpaces spaces) : config(std::move(config)), spaces(std::move(spaces))
        {
        }

        ~RLParameter() override = default;

        inline const RLConfig &getConfig() const
        {
            return config;
        }

        inline const RLSpaces &getSpaces() const
        {
            return spaces;
        }

        /** @brief Writes backup() to `path`. */
        void save(const std::string &path) const;

        /** @brief restore() from a file written by save(). */
        void load(const std::string &path);
    };

    /**
     * @brief Checks that a snapshot was taken for `expected` spaces.
     * @throws IncompatibleRestoreError otherwise
     */
    void checkSnapshotSpaces(const RLSpaces &expected, const RLSpacesDescriptor &snapshot, const std::string &typeTag);
}

#endif //SIMPLERL_RL_RLPARAMETER_HPP
