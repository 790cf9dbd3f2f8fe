#pragma once

#ifndef GLIMPSERL_SPANMASKER_HPP
#define GLIMPSERL_SPANMASKER_HPP

#include<cstdint>
#include<vector>

#include<torch/torch.h>

namespace Glimpse
{
    /**
     * @brief Describes how decision turns are delimited in a tokenized dialogue
     *
     * A decision turn is `turnStart`, then `rolePrefix`, then the content
     * tokens, then `turnEnd`. Only the content tokens are eligible for loss.
     */
    struct DecisionMarker
    {
        int64_t turnStart;
        std::vector<int64_t> rolePrefix;
        int64_t turnEnd;
    };

    /**
     * @brief Marks the content tokens of every decision turn in the sequence
     *
     * Used when an entire trajectory shares one reward. A decision turn that
     * runs to the end of the sequence without a closing delimiter is masked up
     * to the last token.
     *
     * @param inputIds 1-D integer tensor of token ids
     * @param marker Delimiters of decision turns in this tokenization
     * @return Float tensor shaped like `inputIds`, 1 on decision content tokens and 0 elsewhere
     */
    torch::Tensor maskAllDecisions(const torch::Tensor &inputIds, const DecisionMarker &marker);

    /**
     * @brief Marks only the last occurrence of `targetIds` inside `inputIds`
     *
     * Used when only the final decision of a window is the prediction target.
     * Earlier occurrences of the same action text are context and stay
     * unmasked. An empty target, or a target that never appears verbatim,
     * yields an all-zero mask; callers must check maskedTokenCount() and
     * treat such an example as unusable.
     *
     * @param inputIds 1-D integer tensor of token ids
     * @param targetIds Token ids of the target decision text
     * @return Float tensor shaped like `inputIds`
     */
    torch::Tensor maskFinalOccurrence(const torch::Tensor &inputIds, const std::vector<int64_t> &targetIds);

    int64_t maskedTokenCount(const torch::Tensor &mask);
}

#endif //GLIMPSERL_SPANMASKER_HPP
