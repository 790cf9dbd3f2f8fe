#pragma once

#ifndef GLIMPSERL_DIALOGUE_HPP
#define GLIMPSERL_DIALOGUE_HPP

#include<cstdint>
#include<string>
#include<vector>

#include<torch/torch.h>

#include"SpanMasker.hpp"
#include"Tokenizer.hpp"
#include"Trajectory.hpp"

namespace Glimpse
{
    enum class Role
    {
        System,
        User,
        Assistant
    };

    const char *roleName(Role role);

    /**
     * @brief One turn of a structured dialogue
     *
     * User turns built from observations carry the frame; system and
     * assistant turns leave it undefined.
     */
    struct Turn
    {
        Role role;
        std::string text;
        torch::Tensor frame;
    };

    using Dialogue = std::vector<Turn>;

    /**
     * @brief System instruction block for the browser-control policy
     *
     * Describes the two-line `SEE:` / `ACTION:` output format and the action
     * grammar, and ends with the task description.
     */
    std::string systemInstruction(const std::string &task);

    /**
     * @brief Serializes trajectory entries into a structured turn sequence
     *
     * Produces one system turn carrying the task instructions, then one user
     * turn per observation (frame plus its time offset from the first entry,
     * formatted `[t=1.25s]`) and one assistant turn per decision, in entry
     * order. Deterministic and stateless.
     *
     * @throws std::invalid_argument if an observation has no frame
     */
    Dialogue buildDialogue(const std::vector<TrajectoryEntry> &entries, const std::string &task);

    /**
     * @brief Content span of one turn inside a tokenized dialogue
     *
     * `[begin, end)` covers the content tokens only: the role prefix and the
     * closing delimiter are excluded.
     */
    struct TurnSpan
    {
        Role role;
        int64_t begin;
        int64_t end;
    };

    /**
     * @brief A dialogue rendered to token ids, ready for the policy
     */
    struct TokenizedDialogue
    {
        torch::Tensor inputIds;                 /**< 1-D kLong tensor of token ids */
        std::vector<torch::Tensor> frames;      /**< Frames of the observation turns, in order */
        std::vector<int64_t> imagePositions;    /**< Index of the image token standing in for each frame */
        std::vector<TurnSpan> turns;            /**< Structural span of every turn */

        inline int64_t size() const
        {
            return inputIds.defined() ? inputIds.size(0) : 0;
        }
    };

    /**
     * @brief ChatML renderer over a Tokenizer
     *
     * Every turn is rendered as `<|im_start|>role\n` + content + `<|im_end|>\n`.
     * A user turn with a frame starts its content with a single `<|image|>`
     * token that the policy replaces with the encoded frame.
     */
    class ChatTemplate
    {
    private:
        const Tokenizer &tokenizer;
        int64_t turnStartId;
        int64_t turnEndId;
        int64_t imageId;

    public:
        /**
         * @throws std::out_of_range if the tokenizer lacks the ChatML special tokens
         */
        explicit ChatTemplate(const Tokenizer &tokenizer);

        TokenizedDialogue encode(const Dialogue &dialogue) const;

        /**
         * @brief Delimiters of assistant turns, for all-decisions masking
         */
        DecisionMarker decisionMarker() const;

        inline const Tokenizer &getTokenizer() const
        {
            return tokenizer;
        }

        inline int64_t getImageTokenId() const
        {
            return imageId;
        }
    };
}

#endif //GLIMPSERL_DIALOGUE_HPP
