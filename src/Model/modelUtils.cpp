//
// Initialisation, loss and parameter helpers shared by models and trainers.
//

#include<cmath>
#include<stdexcept>

#include<torch/torch.h>

#include"../../include/Model/modelUtils.hpp"

#include<doctest/doctest.h>

namespace Glimpse
{
    /**
     * @brief Fills the input `tensor` with a (semi) orthogonal matrix using QR decomposition
     *
     * Follows "Exact solutions to the nonlinear dynamics of learning in deep
     * linear neural networks": draw A ~ N(0, 1) shaped [rows, numel / rows],
     * factor A = QR, fix the signs with diag(sign(diag(R))), then scale by
     * `gain`. Runs without gradient tracking.
     *
     * @param tensor an n-dimensional tensor, where n >= 2
     * @param gain the multiplier for the weights (1.0, or sqrt(2) ahead of ReLU)
     * @return the same tensor, filled in place
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

    torch::Tensor FlattenImpl::forward(torch::Tensor x)
    {
        return x.view({x.size(0), -1});
    }

    void initWeights(torch::OrderedDict<std::string, torch::Tensor> parameters,
                     double weightGain,
                     double biasGain)
    {
        for (const auto &parameter : parameters)
        {
            if (parameter.value().numel() == 0)
            {
                continue;
            }
            if (parameter.key().find("bias") != std::string::npos)
            {
                torch::NoGradGuard guard;
                torch::nn::init::constant_(parameter.value(), biasGain);
            }
            else if (parameter.key().find("weight") != std::string::npos)
            {
                orthogonal_(parameter.value(), weightGain);
            }
        }
    }

    torch::Tensor maskedTokenLoss(const torch::Tensor &logits, const torch::Tensor &inputIds, const torch::Tensor &mask)
    {
        if (logits.dim() != 2 || inputIds.dim() != 1 || mask.dim() != 1)
        {
            throw std::invalid_argument("maskedTokenLoss expects logits [T, V], ids [T] and mask [T]");
        }
        const auto length = inputIds.size(0);
        if (logits.size(0) != length || mask.size(0) != length)
        {
            throw std::invalid_argument("maskedTokenLoss got " + std::to_string(logits.size(0)) + " logits for " +
                                        std::to_string(length) + " tokens and " + std::to_string(mask.size(0)) +
                                        " mask entries");
        }
        if (length < 2)
        {
            throw std::invalid_argument("maskedTokenLoss needs at least two tokens");
        }

        auto device = logits.device();
        auto predictions = logits.narrow(0, 0, length - 1);
        auto targets = inputIds.narrow(0, 1, length - 1).to(device, torch::kLong);
        auto targetMask = mask.narrow(0, 1, length - 1).to(device, logits.scalar_type());

        auto perToken = torch::nn::functional::cross_entropy(
            predictions,
            targets,
            torch::nn::functional::CrossEntropyFuncOptions().reduction(torch::kNone));

        return (perToken * targetMask).sum() / targetMask.sum().clamp_min(1.0);
    }

    std::vector<torch::Tensor> trainableParameters(const torch::nn::Module &module)
    {
        std::vector<torch::Tensor> trainable;
        for (const auto &parameter : module.parameters())
        {
            if (parameter.requires_grad())
            {
                trainable.push_back(parameter);
            }
        }
        return trainable;
    }

    double gradientNorm(const std::vector<torch::Tensor> &parameters)
    {
        double squared = 0.0;
        for (const auto &parameter : parameters)
        {
            if (parameter.grad().defined())
            {
                squared += parameter.grad().detach().to(torch::kDouble).pow(2).sum().item<double>();
            }
        }
        return std::sqrt(squared);
    }

    double parameterChecksum(const torch::nn::Module &module)
    {
        torch::NoGradGuard guard;
        double checksum = 0.0;
        for (const auto &parameter : module.parameters())
        {
            auto values = parameter.detach().to(torch::kDouble);
            checksum += values.abs().sum().item<double>() + values.pow(2).sum().item<double>();
        }
        return checksum;
    }

    TEST_CASE("Flatten")
    {
        auto flatten = Flatten();

        SUBCASE("Flatten converts 4 dimensional feature maps to 2 dimensional")
        {
            auto output = flatten->forward(torch::rand({2, 32, 4, 4}));

            CHECK(output.size(0) == 2);
            CHECK(output.size(1) == 512);
        }

        SUBCASE("Flatten converts 1 dimensional vector to 2 dimensional")
        {
            auto output = flatten->forward(torch::rand({10}));

            CHECK(output.size(0) == 10);
            CHECK(output.size(1) == 1);
        }
    }

    TEST_CASE("initWeights()")
    {
        auto module = torch::nn::Sequential(
            torch::nn::Conv2d(torch::nn::Conv2dOptions(3, 4, 3)),
            torch::nn::Functional(torch::relu),
            torch::nn::Linear(10, 8));

        initWeights(module->named_parameters(), 1, 0);

        SUBCASE("Bias weights are initialized to 0")
        {
            for (const auto &parameter : module->named_parameters())
            {
                if (parameter.key().find("bias") != std::string::npos)
                {
                    CHECK(parameter.value().abs().sum().item<double>() == doctest::Approx(0));
                }
            }
        }

        SUBCASE("Linear weights have orthonormal rows")
        {
            // [8, 10] weight: fewer rows than columns
            auto weight = module->named_parameters()["2.weight"].detach();
            auto product = weight.mm(weight.t());
            CHECK(torch::allclose(product, torch::eye(8), 1e-4, 1e-4));
        }
    }

    TEST_CASE("maskedTokenLoss()")
    {
        SUBCASE("Only masked targets contribute")
        {
            // Perfect predictions for tokens 1 and 2, a wrong one for token 3
            auto logits = torch::full({4, 5}, -10.f);
            logits[0][1] = 10.f;
            logits[1][2] = 10.f;
            logits[2][0] = 10.f;
            auto ids = torch::tensor({0, 1, 2, 3}, torch::kLong);

            auto goodOnly = torch::tensor({0.f, 1.f, 1.f, 0.f});
            auto withBad = torch::tensor({0.f, 1.f, 1.f, 1.f});

            CHECK(maskedTokenLoss(logits, ids, goodOnly).item<float>() < 1e-3f);
            CHECK(maskedTokenLoss(logits, ids, withBad).item<float>() > 5.f);
        }

        SUBCASE("Uniform logits give log(V) per token")
        {
            auto logits = torch::zeros({6, 8}, torch::requires_grad());
            auto ids = torch::tensor({1, 2, 3, 4, 5, 6}, torch::kLong);
            auto mask = torch::ones({6});
            auto loss = maskedTokenLoss(logits, ids, mask);
            CHECK(loss.item<float>() == doctest::Approx(std::log(8.f)).epsilon(1e-4));

            loss.backward();
            CHECK(logits.grad().defined());
        }

        SUBCASE("Shape mismatches are rejected")
        {
            auto ids = torch::tensor({1, 2, 3}, torch::kLong);
            CHECK_THROWS_AS(maskedTokenLoss(torch::zeros({2, 4}), ids, torch::ones({3})), std::invalid_argument);
            CHECK_THROWS_AS(maskedTokenLoss(torch::zeros({1, 4}), torch::tensor({1}, torch::kLong), torch::ones({1})),
                            std::invalid_argument);
        }
    }

    TEST_CASE("Gradient and parameter helpers")
    {
        auto module = torch::nn::Linear(3, 2);

        SUBCASE("trainableParameters() skips frozen parameters")
        {
            CHECK(trainableParameters(*module).size() == 2);
            module->bias.set_requires_grad(false);
            CHECK(trainableParameters(*module).size() == 1);
        }

        SUBCASE("gradientNorm() is the L2 norm over all gradients")
        {
            module->weight.mutable_grad() = torch::full({2, 3}, 1.0);
            module->bias.mutable_grad() = torch::full({2}, 2.0);
            CHECK(gradientNorm(module->parameters()) == doctest::Approx(std::sqrt(6.0 + 8.0)));
        }

        SUBCASE("parameterChecksum() changes when a parameter changes")
        {
            auto before = parameterChecksum(*module);
            CHECK(parameterChecksum(*module) == doctest::Approx(before));
            {
                torch::NoGradGuard guard;
                module->weight.add_(0.5);
            }
            CHECK(parameterChecksum(*module) != doctest::Approx(before));
        }
    }
}
