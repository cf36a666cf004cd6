#pragma once

#ifndef SIMPLERL_RL_RLREGISTRY_HPP
#define SIMPLERL_RL_RLREGISTRY_HPP

#include<map>
#include<memory>
#include<string>
#include<vector>

#include"../Worker/SpaceAdapter.hpp"
#include"../Worker/WorkerAdapter.hpp"
#include"AlgorithmFactory.hpp"

namespace SimpleRL
{
    /**
     * @class RLRegistry
     * @brief Name to AlgorithmFactory table.
     *
     * Created once at process start and handed to whoever builds algorithms.
     * Every make*() resolves the factory by config.getName().
     */
    class RLRegistry
    {
    private:
        std::map<std::string, std::shared_ptr<const AlgorithmFactory>> factories;

    public:
        /** @throws std::invalid_argument if the name is already registered */
        void add(std::shared_ptr<const AlgorithmFactory> factory);

        bool contains(const std::string &name) const;

        std::vector<std::string> names() const;

        /** @throws std::invalid_argument for unknown names */
        const AlgorithmFactory &get(const std::string &name) const;

        RLConfig makeConfig(const std::string &name,
                            const std::map<std::string, double> &hyperParameters = {},
                            std::vector<std::string> processors = {}) const;

        std::shared_ptr<RLParameter> makeParameter(const RLConfig &config, const RLSpaces &spaces) const;

        std::shared_ptr<RLRemoteMemory> makeRemoteMemory(const RLConfig &config, const RLSpaces &spaces) const;

        /**
         * @brief Builds the algorithm's RLWorker and wraps it for the adapter's environment.
         * @throws TypeIncompatibilityError / ShapeMismatchError if `parameter` or `memory`
         *         is bound to spaces other than the adapter's
         */
        std::shared_ptr<WorkerAdapter> makeWorker(const RLConfig &config,
                                                  const SpaceAdapter &adapter,
                                                  std::shared_ptr<RLParameter> parameter,
                                                  std::shared_ptr<RLRemoteMemory> memory,
                                                  bool training = true,
                                                  int64_t actorId = 0) const;

        std::unique_ptr<RLTrainer> makeTrainer(const RLConfig &config,
                                               std::shared_ptr<RLParameter> parameter,
                                               std::shared_ptr<RLRemoteMemory> memory) const;
    };

    /** @brief Registers QL and DQN. */
    void registerReferenceAlgorithms(RLRegistry &registry);
}

#endif //SIMPLERL_RL_RLREGISTRY_HPP
