#pragma once

#ifndef SIMPLERL_ALGORITHMS_DQN_HPP
#define SIMPLERL_ALGORITHMS_DQN_HPP

#include<map>
#include<memory>
#include<string>
#include<vector>

#include<torch/torch.h>

#include"../Memory/ReplayMemory.hpp"
#include"../Model/DuelingNetwork.hpp"
#include"../RL/AlgorithmFactory.hpp"

namespace SimpleRL
{
    /**
     * @class DQNParameter
     * @brief Online and target dueling networks.
     *
     * restore() copies weights into the existing modules, so an optimizer built
     * over the online network keeps working after a restore.
     *
     * Config keys: hiddenSize.
     */
    class DQNParameter : public RLParameter
    {
    private:
        int64_t actionNum;
        DuelingNetwork online;
        DuelingNetwork target;

    public:
        static constexpr uint32_t blobVersion = 1;

        /** @throws TypeIncompatibilityError unless the action space is discrete */
        DQNParameter(RLConfig config, RLSpaces spaces);

        /** @return Q values of a batch of observations, without gradient */
        torch::Tensor predict(const torch::Tensor &states);

        /** @brief Copies the online weights into the target network. */
        void syncTarget();

        inline DuelingNetwork &getOnline()
        {
            return online;
        }

        inline DuelingNetwork &getTarget()
        {
            return target;
        }

        inline int64_t getActionNum() const
        {
            return actionNum;
        }

        Blob backup() const override;

        void restore(const Blob &blob) override;

        static const char *typeTag();
    };

    /**
     * @class DQNWorker
     * @brief Epsilon-greedy actor over the online network.
     */
    class DQNWorker : public RLWorker
    {
    private:
        std::shared_ptr<DQNParameter> parameter;
        std::shared_ptr<RLRemoteMemory> memory;
        double epsilon;
        int64_t actorId;
        uint64_t sequence = 0;

        torch::Tensor state;
        torch::Tensor action;
        torch::Tensor lastQ;

    public:
        DQNWorker(RLConfig config,
                  RLSpaces spaces,
                  std::shared_ptr<DQNParameter> parameter,
                  std::shared_ptr<RLRemoteMemory> memory,
                  bool training,
                  int64_t actorId);

        void callOnReset(const torch::Tensor &state, const std::vector<int64_t> &invalidActions) override;

        torch::Tensor callPolicy(const torch::Tensor &state, const std::vector<int64_t> &invalidActions) override;

        InfoMap callOnStep(const torch::Tensor &nextState,
                           float reward,
                           bool done,
                           const std::vector<int64_t> &nextInvalidActions) override;

        void callRender(std::ostream &os) const override;
    };

    /**
     * @class DQNTrainer
     * @brief Double DQN with importance-weighted Huber loss and priority updates.
     *
     * Config keys: gamma, lr, batchSize, warmup, targetUpdateInterval, maxGradNorm.
     */
    class DQNTrainer : public RLTrainer
    {
    private:
        std::shared_ptr<DQNParameter> networks;
        std::shared_ptr<ReplayMemory> replay;
        double gamma;
        size_t batchSize;
        size_t warmup;
        int64_t targetUpdateInterval;
        double maxGradNorm;
        std::unique_ptr<torch::optim::Adam> optimizer;

    protected:
        std::vector<UpdateDatum> update() override;

    public:
        /** @throws std::invalid_argument if the parameter or memory is not DQN's */
        DQNTrainer(RLConfig config, std::shared_ptr<RLParameter> parameter, std::shared_ptr<RLRemoteMemory> memory);
    };

    /**
     * Memory is RankBaseMemory, or ExperienceReplayBuffer when the
     * enableRankBaseMemory hyperparameter is 0.
     */
    class DQNFactory : public AlgorithmFactory
    {
    public:
        std::string getName() const override;

        RLActionType actionType() const override;

        RLObservationType observationType() const override;

        std::map<std::string, double> defaultHyperParameters() const override;

        std::shared_ptr<RLParameter> makeParameter(const RLConfig &config, const RLSpaces &spaces) const override;

        std::shared_ptr<RLRemoteMemory> makeRemoteMemory(const RLConfig &config, const RLSpaces &spaces) const override;

        std::unique_ptr<RLWorker> makeWorker(const RLConfig &config,
                                             const RLSpaces &spaces,
                                             std::shared_ptr<RLParameter> parameter,
                                             std::shared_ptr<RLRemoteMemory> memory,
                                             bool training,
                                             int64_t actorId) const override;

        std::unique_ptr<RLTrainer> makeTrainer(const RLConfig &config,
                                               std::shared_ptr<RLParameter> parameter,
                                               std::shared_ptr<RLRemoteMemory> memory) const override;
    };
}

#endif //SIMPLERL_ALGORITHMS_DQN_HPP
