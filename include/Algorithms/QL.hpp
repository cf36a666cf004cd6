#pragma once

#ifndef SIMPLERL_ALGORITHMS_QL_HPP
#define SIMPLERL_ALGORITHMS_QL_HPP

#include<map>
#include<memory>
#include<string>
#include<vector>

#include"../Memory/SequenceRemoteMemory.hpp"
#include"../RL/AlgorithmFactory.hpp"

namespace SimpleRL
{
    /**
     * @class QLParameter
     * @brief Tabular action values, one row per visited state.
     *
     * Rows are keyed by the state's discrete elements joined with commas and
     * created lazily with zeros.
     */
    class QLParameter : public RLParameter
    {
    private:
        int64_t actionNum;
        std::map<std::string, std::vector<float>> table;

    public:
        static constexpr uint32_t blobVersion = 1;

        /** @throws TypeIncompatibilityError unless both spaces are discrete */
        QLParameter(RLConfig config, RLSpaces spaces);

        /** @return Q values of `state`, zeros for an unseen state */
        std::vector<float> getQValues(const torch::Tensor &state) const;

        /** @return the row of `state`, created on first access */
        std::vector<float> &qValues(const torch::Tensor &state);

        inline int64_t getActionNum() const
        {
            return actionNum;
        }

        inline size_t size() const
        {
            return table.size();
        }

        Blob backup() const override;

        void restore(const Blob &blob) override;

        static std::string stateKey(const torch::Tensor &state);

        static const char *typeTag();
    };

    /**
     * @class QLWorker
     * @brief Epsilon-greedy actor over a QLParameter.
     *
     * In training mode every resolved action is recorded into the memory.
     */
    class QLWorker : public RLWorker
    {
    private:
        std::shared_ptr<const QLParameter> parameter;
        std::shared_ptr<RLRemoteMemory> memory;
        double epsilon;
        int64_t actorId;
        uint64_t sequence = 0;

        torch::Tensor state;
        torch::Tensor action;

    public:
        QLWorker(RLConfig config,
                 RLSpaces spaces,
                 std::shared_ptr<const QLParameter> parameter,
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
     * @class QLTrainer
     * @brief One-step Q-learning over transitions popped in arrival order.
     *
     * Config keys: gamma, lr, batchSize.
     */
    class QLTrainer : public RLTrainer
    {
    private:
        std::shared_ptr<QLParameter> table;
        std::shared_ptr<SequenceRemoteMemory> sequence;
        double gamma;
        double lr;
        size_t batchSize;

    protected:
        std::vector<UpdateDatum> update() override;

    public:
        /** @throws std::invalid_argument if the parameter or memory is not QL's */
        QLTrainer(RLConfig config, std::shared_ptr<RLParameter> parameter, std::shared_ptr<RLRemoteMemory> memory);
    };

    class QLFactory : public AlgorithmFactory
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

    /**
     * @brief Picks a random index among the valid ones with the highest value.
     * @return -1 when every index is invalid
     */
    int64_t argmaxValid(const std::vector<float> &values, const std::vector<int64_t> &invalidActions);

    /** @brief Uniform pick among indices [0, n) not listed in `invalidActions`, -1 if none. */
    int64_t randomValid(int64_t n, const std::vector<int64_t> &invalidActions);
}

#endif //SIMPLERL_ALGORITHMS_QL_HPP
