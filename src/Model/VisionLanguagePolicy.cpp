/**
 * @file VisionLanguagePolicy.cpp
 * @brief Small recurrent policy that reads tokens and screen frames
 *
 * Frames are encoded by a convolutional stack and written over the
 * embeddings of their `<|image|>` tokens before the GRU runs over the
 * whole dialogue. The head scores every position over the vocabulary.
 */

#include<cmath>
#include<stdexcept>

#include<torch/torch.h>

#include"../../include/Model/VisionLanguagePolicy.hpp"
#include"../../include/Model/modelUtils.hpp"

#include<doctest/doctest.h>

namespace Glimpse
{
    /**
     * @brief Builds the policy
     *
     * Frame encoder shapes for a [1, C, H, W] frame:
     * ```
     * Conv 3x3 stride 2:   [1, 16, H/2, W/2]
     * Conv 3x3 stride 2:   [1, 32, H/4, W/4]
     * Adaptive pool:       [1, 32, 4, 4]
     * Flatten + Linear:    [1, embeddingSize]
     * ```
     * Convolution weights get orthogonal initialization scaled by sqrt(2) to
     * compensate for the ReLUs; the GRU and the head use gain 1. All biases
     * start at zero.
     */
    VisionLanguagePolicy::VisionLanguagePolicy(int64_t vocabularySize,
                                               int64_t imageTokenId,
                                               int64_t frameChannels,
                                               int64_t embeddingSize,
                                               int64_t hiddenSize) :
    tokenEmbedding(torch::nn::EmbeddingOptions(vocabularySize, embeddingSize)),
    frameEncoder(torch::nn::Conv2d(torch::nn::Conv2dOptions(frameChannels, 16, 3).stride(2).padding(1)),
                 torch::nn::Functional(torch::relu),
                 torch::nn::Conv2d(torch::nn::Conv2dOptions(16, 32, 3).stride(2).padding(1)),
                 torch::nn::Functional(torch::relu),
                 torch::nn::AdaptiveAvgPool2d(torch::nn::AdaptiveAvgPool2dOptions({4, 4})),
                 Flatten(),
                 torch::nn::Linear(32 * 4 * 4, embeddingSize),
                 torch::nn::Functional(torch::relu)),
    sequenceModel(torch::nn::GRUOptions(embeddingSize, hiddenSize)),
    head(hiddenSize, vocabularySize),
    imageTokenId(imageTokenId)
    {
        if (imageTokenId < 0 || imageTokenId >= vocabularySize)
        {
            throw std::invalid_argument("Image token id " + std::to_string(imageTokenId) +
                                        " is outside a vocabulary of " + std::to_string(vocabularySize));
        }

        register_module("tokenEmbedding", tokenEmbedding);
        register_module("frameEncoder", frameEncoder);
        register_module("sequenceModel", sequenceModel);
        register_module("head", head);

        initWeights(frameEncoder->named_parameters(), std::sqrt(2.), 0);
        initWeights(sequenceModel->named_parameters(), 1, 0);
        initWeights(head->named_parameters(), 1, 0);
        eval();
    }

    torch::Tensor VisionLanguagePolicy::forward(const TokenizedDialogue &dialogue)
    {
        if (dialogue.frames.size() != dialogue.imagePositions.size())
        {
            throw std::invalid_argument("Dialogue has " + std::to_string(dialogue.frames.size()) + " frames but " +
                                        std::to_string(dialogue.imagePositions.size()) + " image tokens");
        }

        auto device = getDevice();
        auto ids = dialogue.inputIds.to(device, torch::kLong);
        auto embeddings = tokenEmbedding->forward(ids);

        if (!dialogue.frames.empty())
        {
            std::vector<torch::Tensor> encoded;
            encoded.reserve(dialogue.frames.size());
            for (const auto &frame : dialogue.frames)
            {
                auto pixels = frame.to(device);
                pixels = pixels.scalar_type() == torch::kByte ? pixels.to(torch::kFloat) / 255. : pixels.to(torch::kFloat);
                encoded.push_back(frameEncoder->forward(pixels.unsqueeze(0)));
            }

            auto positions = torch::tensor(dialogue.imagePositions, torch::TensorOptions(torch::kLong)).to(device);
            embeddings = embeddings.index_copy(0, positions, torch::cat(encoded, 0));
        }

        // GRU input is (sequence, batch, features) with a batch of one dialogue
        auto [output, state] = sequenceModel->forward(embeddings.unsqueeze(1));
        return head->forward(output.squeeze(1));
    }

    void VisionLanguagePolicy::freezeFrameEncoder()
    {
        for (auto &parameter : frameEncoder->parameters())
        {
            parameter.set_requires_grad(false);
        }
    }

    TEST_CASE("VisionLanguagePolicy")
    {
        torch::manual_seed(0);
        ByteTokenizer tokenizer;
        ChatTemplate chatTemplate(tokenizer);
        VisionLanguagePolicy policy(tokenizer.vocabularySize(), chatTemplate.getImageTokenId(), 3, 16, 32);

        Trajectory trajectory;
        trajectory.observe(torch::rand({3, 8, 8}), 0.0).decide("CLICK 1 2", 0.5);
        auto dialogue = chatTemplate.encode(buildDialogue(trajectory.getEntries(), "Press the button"));

        SUBCASE("forward() scores every token over the vocabulary")
        {
            auto logits = policy.forward(dialogue);
            CHECK(logits.size(0) == dialogue.size());
            CHECK(logits.size(1) == tokenizer.vocabularySize());
        }

        SUBCASE("The frame only influences tokens from its image position on")
        {
            torch::NoGradGuard guard;
            auto before = policy.forward(dialogue);

            auto changed = dialogue;
            changed.frames[0] = torch::rand({3, 8, 8}) + 1.f;
            auto after = policy.forward(changed);

            auto position = dialogue.imagePositions[0];
            CHECK(torch::allclose(before.narrow(0, 0, position), after.narrow(0, 0, position)));
            CHECK_FALSE(torch::allclose(before.narrow(0, position, 1), after.narrow(0, position, 1)));
        }

        SUBCASE("Byte frames of other sizes are accepted")
        {
            auto resized = dialogue;
            resized.frames[0] = torch::randint(0, 256, {3, 20, 12}).to(torch::kByte);
            CHECK(policy.forward(resized).size(0) == dialogue.size());
        }

        SUBCASE("Frames must line up with image tokens")
        {
            auto broken = dialogue;
            broken.frames.push_back(torch::rand({3, 8, 8}));
            CHECK_THROWS_AS(policy.forward(broken), std::invalid_argument);
        }

        SUBCASE("freezeFrameEncoder() removes the encoder from the trainable set")
        {
            auto trainableBefore = trainableParameters(policy).size();
            policy.freezeFrameEncoder();
            CHECK(trainableParameters(policy).size() == trainableBefore - 6);
        }

        SUBCASE("An image token outside the vocabulary is rejected")
        {
            CHECK_THROWS_AS(VisionLanguagePolicy(10, 12), std::invalid_argument);
        }
    }
}
