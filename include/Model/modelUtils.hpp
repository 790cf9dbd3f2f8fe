#pragma once

#ifndef GLIMPSERL_MODELUTILS_HPP
#define GLIMPSERL_MODELUTILS_HPP

#include<string>
#include<vector>

#include<torch/torch.h>
#include<torch/nn.h>

namespace Glimpse
{
    /**
     * @brief Flattens all dimensions except the batch dimension
     *
     * Turns the [N, C, H, W] feature maps of the frame encoder into [N, C*H*W]
     * vectors for the projection layer.
     */
    struct FlattenImpl : torch::nn::Module
    {
        torch::Tensor forward(torch::Tensor x);
    };
    TORCH_MODULE(Flatten);

    /**
     * @brief Fills `tensor` in place with a (semi) orthogonal matrix scaled by `gain`
     *
     * Tensors with fewer than two dimensions are returned untouched.
     */
    torch::Tensor orthogonal_(torch::Tensor tensor, double gain);

    /**
     * @brief Orthogonal weights and constant biases for a module's parameters
     *
     * Parameters whose name contains "bias" are set to `biasGain`; parameters
     * whose name contains "weight" receive orthogonal initialization scaled by
     * `weightGain`. Anything else is left unchanged.
     */
    void initWeights(torch::OrderedDict<std::string, torch::Tensor> parameters, double weightGain, double biasGain);

    /**
     * @brief Next-token cross-entropy restricted to masked target tokens
     *
     * Position t of `logits` predicts token t + 1 of `inputIds`; a prediction
     * contributes only if its target token is masked. The result is the mean
     * over contributing positions, matching a causal language-model loss with
     * all unmasked labels ignored.
     *
     * @param logits Float tensor [T, V]
     * @param inputIds Integer tensor [T]
     * @param mask Float tensor [T], 1 on tokens eligible for loss
     * @return Scalar loss tensor attached to the graph of `logits`
     * @throws std::invalid_argument on mismatched shapes or sequences shorter than two tokens
     */
    torch::Tensor maskedTokenLoss(const torch::Tensor &logits, const torch::Tensor &inputIds, const torch::Tensor &mask);

    /**
     * @brief Parameters of `module` that currently require gradients
     *
     * Frozen parameters are excluded so optimizers and gradient clipping only
     * see the trainable part of a partially frozen model.
     */
    std::vector<torch::Tensor> trainableParameters(const torch::nn::Module &module);

    /**
     * @brief Total L2 norm of the gradients of `parameters`
     *
     * Parameters without a gradient are skipped.
     */
    double gradientNorm(const std::vector<torch::Tensor> &parameters);

    /**
     * @brief Order-insensitive fingerprint of every parameter value
     *
     * Sum of absolute values plus sum of squares, in double precision. Any
     * optimizer step changes it; it is used to verify that aborted training
     * calls leave parameters untouched.
     */
    double parameterChecksum(const torch::nn::Module &module);
}

#endif //GLIMPSERL_MODELUTILS_HPP
