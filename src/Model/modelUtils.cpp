#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/modelUtils.hpp"

namespace SimpleRL
{
    /**
     * @brief Orthogonal initialization through a QR decomposition
     *
     * A = QR of a standard normal matrix, Q is then sign corrected with the
     * diagonal of R so the result is uniformly distributed over orthogonal
     * matrices, and scaled by `gain`.
     */
    torch::Tensor orthogonal_(torch::Tensor tensor, double gain)
    {
        torch::NoGradGuard guard;
        if (tensor.dim() < 2)
        {
            return tensor;
        }

        const auto rows = tensor.size(0);
        const auto columns = tensor.numel() / rows;
        auto flattened = torch::randn({rows, columns});
        if (rows < columns)
        {
            flattened.t_();
        }
        torch::Tensor q, r;
        std::tie(q, r) = torch::linalg_qr(flattened);
        auto d = torch::diag(r, 0);
        q *= d.sign();

        if (rows < columns)
        {
            q.t_();
        }

        tensor.view_as(q).copy_(q);
        tensor.mul_(gain);
        return tensor;
    }

    torch::Tensor FlattenImpl::forward(const torch::Tensor &x)
    {
        return x.reshape({x.size(0), -1});
    }

    void initWeights(torch::OrderedDict<std::string, torch::Tensor> parameters, double weightGain, double biasGain)
    {
        for (const auto &parameter : parameters)
        {
            if (parameter.value().size(0) == 0)
            {
                continue;
            }
            if (parameter.key().find("bias") != std::string::npos)
            {
                torch::nn::init::constant_(parameter.value(), biasGain);
            }
            else if (parameter.key().find("weight") != std::string::npos)
            {
                orthogonal_(parameter.value(), weightGain);
            }
        }
    }

    TEST_CASE("Flatten")
    {
        auto flatten = Flatten();

        SUBCASE("Board layers become one feature row per sample")
        {
            auto input = torch::rand({5, 2, 6, 6});
            auto output = flatten->forward(input);

            CHECK(output.size(0) == 5);
            CHECK(output.size(1) == 72);
        }

        SUBCASE("1 dimensional input becomes a column")
        {
            auto input = torch::rand({10});
            auto output = flatten->forward(input);

            CHECK(output.size(0) == 10);
            CHECK(output.size(1) == 1);
        }
    }

    TEST_CASE("initWeights()")
    {
        auto module = torch::nn::Sequential(
            torch::nn::Linear(5, 10),
            torch::nn::Functional(torch::relu),
            torch::nn::Linear(10, 8));

        initWeights(module->named_parameters(), 1, 0);

        SUBCASE("Bias weights are initialized to 0")
        {
            for (const auto &parameter : module->named_parameters())
            {
                if (parameter.key().find("bias") != std::string::npos)
                {
                    CHECK(parameter.value().abs().max().item<double>() == doctest::Approx(0));
                }
            }
        }

        SUBCASE("Weight rows are orthonormal")
        {
            auto weight = module->named_parameters()["0.weight"];
            auto gram = torch::mm(weight.t(), weight);
            CHECK(torch::allclose(gram, torch::eye(5), 1e-4, 1e-4));
        }
    }
}
