#include<cmath>

#include<torch/torch.h>

#include"../../include/DistributedPPO/Model/modelUtils.hpp"
#include<doctest/doctest.h>

namespace DistributedPPO
{
    void initWeights(const torch::OrderedDict<std::string, torch::Tensor> &parameters,
                     double weightGain,
                     double biasGain)
    {
        torch::NoGradGuard noGrad;
        for (const auto &parameter : parameters)
        {
            if (parameter.value().numel() == 0)
            {
                continue;
            }
            if (parameter.key().find("bias") != std::string::npos)
            {
                torch::nn::init::constant_(parameter.value(), biasGain);
            }
            else if (parameter.key().find("weight") != std::string::npos)
            {
                torch::nn::init::orthogonal_(parameter.value(), weightGain);
            }
        }
    }

    torch::nn::Sequential makeMlp(int64_t numInputs,
                                  int64_t hiddenSize,
                                  int64_t numOutputs,
                                  double outputGain)
    {
        torch::nn::Linear input(numInputs, hiddenSize);
        torch::nn::Linear hidden(hiddenSize, hiddenSize);
        torch::nn::Linear output(hiddenSize, numOutputs);

        initWeights(input->named_parameters(), std::sqrt(2.0), 0);
        initWeights(hidden->named_parameters(), std::sqrt(2.0), 0);
        initWeights(output->named_parameters(), outputGain, 0);

        return torch::nn::Sequential(input,
                                     torch::nn::ReLU(),
                                     hidden,
                                     torch::nn::ReLU(),
                                     output);
    }

    TEST_CASE("initWeights()")
    {
        auto module = torch::nn::Sequential(
            torch::nn::Linear(5, 10),
            torch::nn::ReLU(),
            torch::nn::Linear(10, 8));

        initWeights(module->named_parameters(), 1, 0);

        SUBCASE("Bias weights are initialized to 0")
        {
            for (const auto &parameter : module->named_parameters())
            {
                if (parameter.key().find("bias") != std::string::npos)
                {
                    CHECK(parameter.value().abs().sum().item().toDouble() == doctest::Approx(0));
                }
            }
        }

        SUBCASE("Weights are orthogonal")
        {
            // [10, 5] has orthonormal columns
            auto weight = module->named_parameters()["0.weight"];
            auto gram = torch::matmul(weight.t(), weight);
            CHECK(torch::allclose(gram, torch::eye(5), 1e-4, 1e-4));
        }
    }

    TEST_CASE("makeMlp()")
    {
        auto mlp = makeMlp(4, 64, 3, 0.01);

        SUBCASE("Maps [B, numInputs] to [B, numOutputs]")
        {
            auto output = mlp->forward(torch::rand({7, 4}));
            CHECK(output.sizes().vec() == std::vector<int64_t>{7, 3});
        }

        SUBCASE("Has three linear layers")
        {
            CHECK(mlp->named_parameters().size() == 6);
        }
    }
}
