#pragma once

#ifndef SIMPLERL_MODEL_MODELUTILS_HPP
#define SIMPLERL_MODEL_MODELUTILS_HPP

#include<string>

#include<torch/nn.h>

namespace SimpleRL
{
    /**
     * @brief Flattens every dimension except the batch dimension
     *
     * Observations arrive in their space's shape (e.g. the 2xHxW board layers);
     * the fully-connected layers want one feature vector per sample.
     */
    struct FlattenImpl : torch::nn::Module
    {
        /**
         * @param x Input tensor with shape [batch_size, dim1, dim2, ...]
         * @return Tensor with shape [batch_size, dim1 * dim2 * ...]
         */
        torch::Tensor forward(const torch::Tensor &x);
    };
    TORCH_MODULE(Flatten);

    /**
     * @brief Fills `tensor` with a (semi) orthogonal matrix scaled by `gain`
     *
     * Tensors with fewer than two dimensions are returned untouched.
     */
    torch::Tensor orthogonal_(torch::Tensor tensor, double gain);

    /**
     * @brief Initializes weights and biases of a module
     *
     * Parameters whose name contains "weight" get an orthogonal matrix scaled by
     * `weightGain`; parameters whose name contains "bias" are set to `biasGain`.
     */
    void initWeights(torch::OrderedDict<std::string, torch::Tensor> parameters, double weightGain, double biasGain);
}

#endif //SIMPLERL_MODEL_MODELUTILS_HPP
