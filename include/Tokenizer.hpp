#pragma once

#ifndef GLIMPSERL_TOKENIZER_HPP
#define GLIMPSERL_TOKENIZER_HPP

#include<cstdint>
#include<string>
#include<unordered_map>
#include<vector>

namespace Glimpse
{
    /**
     * @brief Abstract text tokenizer used to serialize dialogues for the policy
     *
     * Special tokens (turn delimiters, image placeholders) are never produced
     * by encode(); they are looked up by name and inserted by the chat template.
     */
    class Tokenizer
    {
    public:
        virtual ~Tokenizer() = default;

        /**
         * @brief Converts plain text into token ids
         *
         * Must be deterministic: identical text always yields identical ids.
         * The span masker relies on this to find decision text inside a
         * serialized dialogue.
         */
        virtual std::vector<int64_t> encode(const std::string &text) const = 0;

        virtual std::string decode(const std::vector<int64_t> &ids) const = 0;

        /**
         * @brief Looks up the id of a named special token
         * @throws std::out_of_range if the tokenizer has no such token
         */
        virtual int64_t specialTokenId(const std::string &name) const = 0;

        virtual int64_t vocabularySize() const = 0;
    };

    /**
     * @brief Byte-level tokenizer with ChatML special tokens
     *
     * Every UTF-8 byte maps to its own id (0..255); special tokens follow at
     * 256 and above. Because no merges happen, any substring of a serialized
     * dialogue encodes to exactly the matching id subsequence.
     */
    class ByteTokenizer : public Tokenizer
    {
    private:
        std::vector<std::string> specialNames;
        std::unordered_map<std::string, int64_t> specialIds;

    public:
        static constexpr const char *TurnStart = "<|im_start|>";
        static constexpr const char *TurnEnd = "<|im_end|>";
        static constexpr const char *Image = "<|image|>";
        static constexpr const char *Pad = "<|pad|>";

        ByteTokenizer();

        std::vector<int64_t> encode(const std::string &text) const override;

        std::string decode(const std::vector<int64_t> &ids) const override;

        int64_t specialTokenId(const std::string &name) const override;

        int64_t vocabularySize() const override;
    };
}

#endif //GLIMPSERL_TOKENIZER_HPP
