#include<stdexcept>

#include"../include/Tokenizer.hpp"

#include<doctest/doctest.h>

namespace Glimpse
{
    namespace
    {
        constexpr int64_t byteCount = 256;
    }

    ByteTokenizer::ByteTokenizer() : specialNames{TurnStart, TurnEnd, Image, Pad}
    {
        for (size_t i = 0; i < specialNames.size(); ++i)
        {
            specialIds[specialNames[i]] = byteCount + static_cast<int64_t>(i);
        }
    }

    std::vector<int64_t> ByteTokenizer::encode(const std::string &text) const
    {
        std::vector<int64_t> ids;
        ids.reserve(text.size());
        for (unsigned char byte : text)
        {
            ids.push_back(static_cast<int64_t>(byte));
        }
        return ids;
    }

    /**
     * @brief Converts ids back to text, rendering special tokens by name
     * @throws std::out_of_range for ids outside the vocabulary
     */
    std::string ByteTokenizer::decode(const std::vector<int64_t> &ids) const
    {
        std::string text;
        for (auto id : ids)
        {
            if (id >= 0 && id < byteCount)
            {
                text.push_back(static_cast<char>(id));
            }
            else if (id >= byteCount && id < vocabularySize())
            {
                text += specialNames[static_cast<size_t>(id - byteCount)];
            }
            else
            {
                throw std::out_of_range("Token id " + std::to_string(id) + " is outside the vocabulary");
            }
        }
        return text;
    }

    int64_t ByteTokenizer::specialTokenId(const std::string &name) const
    {
        auto found = specialIds.find(name);
        if (found == specialIds.end())
        {
            throw std::out_of_range("Unknown special token: " + name);
        }
        return found->second;
    }

    int64_t ByteTokenizer::vocabularySize() const
    {
        return byteCount + static_cast<int64_t>(specialNames.size());
    }

    TEST_CASE("ByteTokenizer")
    {
        ByteTokenizer tokenizer;

        SUBCASE("encode() produces one id per byte")
        {
            auto ids = tokenizer.encode("CLICK 1 2");
            REQUIRE(ids.size() == 9);
            CHECK(ids[0] == 'C');
            CHECK(ids[5] == ' ');
        }

        SUBCASE("decode() inverts encode()")
        {
            std::string text = "TYPE héllo\nDONE";
            CHECK(tokenizer.decode(tokenizer.encode(text)) == text);
        }

        SUBCASE("Special tokens sit above the byte range")
        {
            CHECK(tokenizer.specialTokenId(ByteTokenizer::TurnStart) == 256);
            CHECK(tokenizer.specialTokenId(ByteTokenizer::TurnEnd) == 257);
            CHECK(tokenizer.specialTokenId(ByteTokenizer::Pad) == 259);
            CHECK(tokenizer.vocabularySize() == 260);
            CHECK(tokenizer.decode({tokenizer.specialTokenId(ByteTokenizer::Image)}) == "<|image|>");
        }

        SUBCASE("Unknown special tokens and ids throw")
        {
            CHECK_THROWS_AS(tokenizer.specialTokenId("<|nope|>"), std::out_of_range);
            CHECK_THROWS_AS(tokenizer.decode({1000}), std::out_of_range);
        }
    }
}
