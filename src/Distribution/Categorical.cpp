#include<stdexcept>

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>

#include"../../include/DistributedPPO/Distribution/Categorical.hpp"
#include<doctest/doctest.h>

namespace DistributedPPO
{
    Categorical::Categorical(torch::Tensor logits, torch::Tensor probs) :
        logits(std::move(logits)),
        probs(std::move(probs))
    {
        numEvents = this->logits.size(-1);
        batchShape = this->logits.sizes().vec();
        batchShape.pop_back();
    }

    /**
     * @details Subtracting logsumexp keeps the stored logits a proper
     * log-probability table while leaving the softmax unchanged.
     */
    Categorical Categorical::fromLogits(const torch::Tensor &logits)
    {
        if (!logits.defined() || logits.dim() < 1)
        {
            throw std::runtime_error("Categorical logits need at least one dimension");
        }
        auto normalized = logits - logits.logsumexp(-1, true);
        return Categorical(normalized, torch::softmax(normalized, -1));
    }

    Categorical Categorical::fromProbabilities(const torch::Tensor &probs)
    {
        if (!probs.defined() || probs.dim() < 1)
        {
            throw std::runtime_error("Categorical probabilities need at least one dimension");
        }
        auto normalized = (probs / probs.sum(-1, true)).clamp(1.21e-7, 1. - 1.21e-7);
        return Categorical(torch::log(normalized), normalized);
    }

    torch::Tensor Categorical::entropy() const
    {
        return -(logits * probs).sum(-1);
    }

    torch::Tensor Categorical::logProbability(torch::Tensor value) const
    {
        auto index = value.to(torch::kLong).unsqueeze(-1);
        auto broadcasted = torch::broadcast_tensors({index, logits});
        index = broadcasted[0].narrow(-1, 0, 1);
        return broadcasted[1].gather(-1, index).squeeze(-1);
    }

    /**
     * @details multinomial only accepts 1-D or 2-D inputs, so the expanded
     * probability table is flattened to [N, numEvents], sampled once per row
     * and reshaped to the extended shape.
     */
    torch::Tensor Categorical::sample(c10::ArrayRef<int64_t> sampleShape) const
    {
        auto outputShape = extendedShape(sampleShape);
        auto probabilityShape = outputShape;
        probabilityShape.push_back(numEvents);

        auto expanded = probs;
        for (size_t i = 0; i < sampleShape.size(); ++i)
        {
            expanded = expanded.unsqueeze(0);
        }
        auto flat = expanded.expand(probabilityShape).contiguous().view({-1, numEvents});
        return torch::multinomial(flat, 1, true).view(outputShape);
    }

    TEST_CASE("Categorical")
    {
        SUBCASE("Rejects undefined parameters")
        {
            CHECK_THROWS_AS(Categorical::fromLogits(torch::Tensor()), std::runtime_error);
            CHECK_THROWS_AS(Categorical::fromProbabilities(torch::Tensor()), std::runtime_error);
        }

        SUBCASE("Logits and probabilities describe the same distribution")
        {
            auto logits = torch::tensor({1.0f, 2.0f, 3.0f});
            auto fromLogits = Categorical::fromLogits(logits);
            auto fromProbs = Categorical::fromProbabilities(torch::softmax(logits, -1));

            CHECK(torch::allclose(fromLogits.getProbabilities(), fromProbs.getProbabilities(), 1e-5, 1e-6));
            CHECK(fromLogits.getProbabilities().sum().item().toDouble() == doctest::Approx(1));
        }

        SUBCASE("Sampled numbers are in the right range")
        {
            auto dist = Categorical::fromProbabilities(torch::full({5}, 0.2f));
            auto output = dist.sample({100});

            CHECK(!(output > 4).any().item().toBool());
            CHECK(!(output < 0).any().item().toBool());
        }

        SUBCASE("Sampled tensors are of the right shape")
        {
            auto dist = Categorical::fromLogits(torch::zeros({2, 4}));

            CHECK(dist.sample().sizes().vec() == std::vector<int64_t>{2});
            CHECK(dist.sample({20}).sizes().vec() == std::vector<int64_t>{20, 2});
            CHECK(dist.sample({10, 5}).sizes().vec() == std::vector<int64_t>{10, 5, 2});
        }

        SUBCASE("Single state samples a scalar action")
        {
            auto dist = Categorical::fromLogits(torch::zeros({3}));
            CHECK(dist.sample().dim() == 0);
        }

        SUBCASE("Deterministic probabilities are respected")
        {
            auto probabilities = torch::tensor({{0.f, 1.f, 0.f, 0.f},
                                                {0.f, 0.f, 0.f, 1.f}});
            auto dist = Categorical::fromProbabilities(probabilities);
            auto sum = dist.sample({5}).sum({0});

            CHECK(sum[0].item().toInt() == 5);
            CHECK(sum[1].item().toInt() == 15);
        }

        SUBCASE("entropy()")
        {
            auto probabilities = torch::tensor({{0.5f, 0.5f, 0.0f, 0.0f},
                                                {0.25f, 0.25f, 0.25f, 0.25f}});
            auto entropies = Categorical::fromProbabilities(probabilities).entropy();

            CHECK(entropies.sizes().vec() == std::vector<int64_t>{2});
            CHECK(entropies[0].item().toDouble() == doctest::Approx(0.6931).epsilon(1e-3));
            CHECK(entropies[1].item().toDouble() == doctest::Approx(1.3863).epsilon(1e-3));
        }

        SUBCASE("logProbability() scores one action per row")
        {
            auto probabilities = torch::tensor({{0.5f, 0.5f, 0.0f, 0.0f},
                                                {0.25f, 0.25f, 0.25f, 0.25f}});
            auto dist = Categorical::fromProbabilities(probabilities);
            auto logProbs = dist.logProbability(torch::tensor({1, 3}, torch::kLong));

            REQUIRE(logProbs.sizes().vec() == std::vector<int64_t>{2});
            CHECK(logProbs[0].item().toDouble() == doctest::Approx(-0.6931).epsilon(1e-3));
            CHECK(logProbs[1].item().toDouble() == doctest::Approx(-1.3863).epsilon(1e-3));
        }

        SUBCASE("logProbability() broadcasts extra action dimensions")
        {
            auto probabilities = torch::tensor({{0.5f, 0.5f, 0.0f, 0.0f},
                                                {0.25f, 0.25f, 0.25f, 0.25f}});
            auto dist = Categorical::fromProbabilities(probabilities);
            auto logProbs = dist.logProbability(torch::tensor({{0, 1}, {2, 3}}, torch::kLong));

            CHECK(logProbs.sizes().vec() == std::vector<int64_t>{2, 2});
            CHECK(logProbs[1][0].item().toDouble() == doctest::Approx(-15.9275).epsilon(1e-3));
        }

        SUBCASE("Gradients flow from log-probabilities into the logits")
        {
            auto logits = torch::zeros({2, 3}, torch::requires_grad());
            auto dist = Categorical::fromLogits(logits);
            dist.logProbability(torch::tensor({0, 2}, torch::kLong)).sum().backward();

            REQUIRE(logits.grad().defined());
            CHECK(logits.grad()[0][0].item().toDouble() == doctest::Approx(2.0 / 3.0));
            CHECK(logits.grad()[0][1].item().toDouble() == doctest::Approx(-1.0 / 3.0));
        }
    }
}
