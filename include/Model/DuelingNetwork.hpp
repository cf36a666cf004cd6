#pragma once

#ifndef SIMPLERL_MODEL_DUELINGNETWORK_HPP
#define SIMPLERL_MODEL_DUELINGNETWORK_HPP

#include<cstdint>

#include<torch/nn.h>

#include"modelUtils.hpp"

namespace SimpleRL
{
    /**
     * @brief Fully-connected dueling Q network
     *
     * A shared trunk feeds a state value head V(s) and an advantage head A(s, a):
     *
     * ```
     * Q(s, a) = V(s) + A(s, a) - mean_a A(s, a)
     * ```
     *
     * Inputs of any shape are flattened per sample first, so the network accepts
     * a batch of observations in their space's shape.
     */
    class DuelingNetworkImpl : public torch::nn::Module
    {
    private:
        Flatten flatten;
        torch::nn::Sequential trunk;
        torch::nn::Linear valueHead;
        torch::nn::Linear advantageHead;
        int64_t numInputs;
        int64_t actionNum;
        int64_t hiddenSize;

    public:
        DuelingNetworkImpl(int64_t numInputs, int64_t actionNum, int64_t hiddenSize = 64);

        /**
         * @param inputs Batch of observations [batch_size, ...] with numInputs elements per sample
         * @return Q values [batch_size, actionNum]
         */
        torch::Tensor forward(const torch::Tensor &inputs);

        inline int64_t getNumInputs() const
        {
            return numInputs;
        }

        inline int64_t getActionNum() const
        {
            return actionNum;
        }

        inline int64_t getHiddenSize() const
        {
            return hiddenSize;
        }
    };
    TORCH_MODULE(DuelingNetwork);
}

#endif //SIMPLERL_MODEL_DUELINGNETWORK_HPP
