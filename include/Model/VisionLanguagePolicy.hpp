#pragma once

#ifndef GLIMPSERL_VISIONLANGUAGEPOLICY_HPP
#define GLIMPSERL_VISIONLANGUAGEPOLICY_HPP

#include<torch/torch.h>
#include<torch/nn.h>

#include"PolicyModel.hpp"

namespace Glimpse
{
    /**
     * @brief Small recurrent vision-language policy over ChatML token streams
     *
     * The architecture consists of:
     * - A token embedding table covering the tokenizer's vocabulary
     * - A convolutional frame encoder whose output replaces the embedding of
     *   each `<|image|>` token
     * - A single-layer GRU running over the whole sequence
     * - A linear head producing next-token logits
     *
     * The frame encoder ends in adaptive pooling, so frames of any size at or
     * above 4x4 are accepted. Byte frames are scaled from [0, 255] to [0, 1].
     */
    class VisionLanguagePolicy : public PolicyModel
    {
    private:
        torch::nn::Embedding tokenEmbedding;
        torch::nn::Sequential frameEncoder;   /**< conv -> relu -> conv -> relu -> pool -> flatten -> linear -> relu */
        torch::nn::GRU sequenceModel;
        torch::nn::Linear head;
        int64_t imageTokenId;

    public:
        /**
         * @brief Constructs the policy and initializes its weights
         *
         * @param vocabularySize Number of token ids, special tokens included
         * @param imageTokenId Id of the placeholder token standing in for a frame
         * @param frameChannels Channels of the observation frames (3 for RGB)
         * @param embeddingSize Width of token and frame embeddings
         * @param hiddenSize Width of the GRU state
         */
        VisionLanguagePolicy(int64_t vocabularySize,
                             int64_t imageTokenId,
                             int64_t frameChannels = 3,
                             int64_t embeddingSize = 64,
                             int64_t hiddenSize = 128);

        /**
         * @throws std::invalid_argument if the frames do not line up with image tokens
         */
        torch::Tensor forward(const TokenizedDialogue &dialogue) override;

        /**
         * @brief Stops gradients into the frame encoder
         *
         * Must be called before a trainer is constructed for the frozen
         * parameters to stay out of its optimizer.
         */
        void freezeFrameEncoder();

        inline int64_t getImageTokenId() const
        {
            return imageTokenId;
        }
    };
}

#endif //GLIMPSERL_VISIONLANGUAGEPOLICY_HPP
