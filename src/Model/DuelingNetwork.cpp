#include<cmath>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/DuelingNetwork.hpp"

namespace SimpleRL
{
    DuelingNetworkImpl::DuelingNetworkImpl(int64_t numInputs, int64_t actionNum, int64_t hiddenSize) :
    flatten(nullptr),
    trunk(nullptr),
    valueHead(nullptr),
    advantageHead(nullptr),
    numInputs(numInputs),
    actionNum(actionNum),
    hiddenSize(hiddenSize)
    {
        if (numInputs < 1 || actionNum < 1 || hiddenSize < 1)
        {
            throw std::invalid_argument("DuelingNetwork needs positive sizes");
        }

        flatten = Flatten();
        trunk = torch::nn::Sequential(
            torch::nn::Linear(numInputs, hiddenSize),
            torch::nn::Functional(torch::tanh),
            torch::nn::Linear(hiddenSize, hiddenSize),
            torch::nn::Functional(torch::tanh));
        valueHead = torch::nn::Linear(hiddenSize, 1);
        advantageHead = torch::nn::Linear(hiddenSize, actionNum);

        register_module("flatten", flatten);
        register_module("trunk", trunk);
        register_module("valueHead", valueHead);
        register_module("advantageHead", advantageHead);

        initWeights(trunk->named_parameters(), std::sqrt(2.), 0);
        initWeights(valueHead->named_parameters(), 1, 0);
        initWeights(advantageHead->named_parameters(), 0.01, 0);

        train();
    }

    torch::Tensor DuelingNetworkImpl::forward(const torch::Tensor &inputs)
    {
        auto features = trunk->forward(flatten->forward(inputs.to(torch::kFloat)));
        auto value = valueHead->forward(features);
        auto advantage = advantageHead->forward(features);
        return value + advantage - advantage.mean(1, true);
    }

    TEST_CASE("DuelingNetwork")
    {
        torch::manual_seed(0);
        DuelingNetwork network(8, 3, 16);

        SUBCASE("Output has one value per action")
        {
            auto output = network->forward(torch::rand({4, 2, 4}));
            CHECK(output.size(0) == 4);
            CHECK(output.size(1) == 3);
        }

        SUBCASE("Batch rows are evaluated independently")
        {
            auto inputs = torch::rand({5, 8});
            auto batch = network->forward(inputs);
            for (int64_t i = 0; i < 5; ++i)
            {
                auto single = network->forward(inputs[i].unsqueeze(0));
                CHECK(torch::allclose(single[0], batch[i], 1e-5, 1e-6));
            }
        }

        SUBCASE("Gradients reach the trunk")
        {
            auto q = network->forward(torch::rand({2, 8}));
            q.sum().backward();
            for (const auto &parameter : network->named_parameters())
            {
                CHECK(parameter.value().grad().defined());
            }
        }
    }
}
