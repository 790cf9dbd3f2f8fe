#include<algorithm>
#include<stdexcept>

#include"../include/SpanMasker.hpp"

#include<doctest/doctest.h>

namespace Glimpse
{
    namespace
    {
        std::vector<int64_t> toIdVector(const torch::Tensor &inputIds)
        {
            if (inputIds.dim() != 1)
            {
                throw std::invalid_argument("Span masking expects a 1-D token id tensor, got " +
                                            std::to_string(inputIds.dim()) + " dimensions");
            }
            auto ids = inputIds.to(torch::kCPU).to(torch::kLong).contiguous();
            return std::vector<int64_t>(ids.data_ptr<int64_t>(), ids.data_ptr<int64_t>() + ids.numel());
        }

        torch::Tensor emptyMaskLike(const torch::Tensor &inputIds)
        {
            return torch::zeros({inputIds.size(0)}, torch::TensorOptions(torch::kFloat));
        }
    }

    torch::Tensor maskAllDecisions(const torch::Tensor &inputIds, const DecisionMarker &marker)
    {
        auto ids = toIdVector(inputIds);
        auto mask = emptyMaskLike(inputIds);
        auto maskAccessor = mask.accessor<float, 1>();

        const auto length = ids.size();
        const auto prefixLength = marker.rolePrefix.size();

        size_t i = 0;
        while (i < length)
        {
            if (ids[i] == marker.turnStart && i + 1 + prefixLength <= length &&
                std::equal(marker.rolePrefix.begin(), marker.rolePrefix.end(), ids.begin() + i + 1))
            {
                auto contentStart = i + 1 + prefixLength;
                auto j = contentStart;
                while (j < length && ids[j] != marker.turnEnd)
                {
                    maskAccessor[j] = 1.f;
                    ++j;
                }
                // Resume after the closing delimiter so the next turn is scanned once
                i = j + 1;
                continue;
            }
            ++i;
        }

        return mask;
    }

    torch::Tensor maskFinalOccurrence(const torch::Tensor &inputIds, const std::vector<int64_t> &targetIds)
    {
        auto ids = toIdVector(inputIds);
        auto mask = emptyMaskLike(inputIds);

        const auto targetLength = targetIds.size();
        if (targetLength == 0 || targetLength > ids.size())
        {
            return mask;
        }

        // Search backwards: the first hit is the last occurrence
        for (size_t start = ids.size() - targetLength + 1; start-- > 0;)
        {
            if (std::equal(targetIds.begin(), targetIds.end(), ids.begin() + start))
            {
                mask.narrow(0, static_cast<int64_t>(start), static_cast<int64_t>(targetLength)).fill_(1.f);
                break;
            }
        }

        return mask;
    }

    int64_t maskedTokenCount(const torch::Tensor &mask)
    {
        return mask.sum().item<int64_t>();
    }

    TEST_CASE("maskAllDecisions()")
    {
        DecisionMarker marker{100, {7, 8}, 101};

        SUBCASE("Marks only the content of decision turns")
        {
            auto ids = torch::tensor({100, 1, 2, 101,
                                      100, 7, 8, 5, 6, 101,
                                      100, 3, 101,
                                      100, 7, 8, 9, 101},
                                     torch::kLong);
            auto mask = maskAllDecisions(ids, marker);

            REQUIRE(mask.size(0) == ids.size(0));
            CHECK(maskedTokenCount(mask) == 3);
            CHECK(mask[7].item<float>() == 1.f);
            CHECK(mask[8].item<float>() == 1.f);
            CHECK(mask[16].item<float>() == 1.f);
            CHECK(mask[5].item<float>() == 0.f);
            CHECK(mask[9].item<float>() == 0.f);
        }

        SUBCASE("A partial role prefix is not a decision turn")
        {
            auto ids = torch::tensor({100, 7, 5, 5, 101}, torch::kLong);
            CHECK(maskedTokenCount(maskAllDecisions(ids, marker)) == 0);
        }

        SUBCASE("An unterminated decision turn is masked to the end")
        {
            auto ids = torch::tensor({100, 7, 8, 4, 4}, torch::kLong);
            auto mask = maskAllDecisions(ids, marker);
            CHECK(maskedTokenCount(mask) == 2);
            CHECK(mask[4].item<float>() == 1.f);
        }

        SUBCASE("Running twice on the same input gives the same mask")
        {
            auto ids = torch::tensor({100, 7, 8, 1, 2, 101, 100, 7, 8, 3, 101}, torch::kLong);
            auto first = maskAllDecisions(ids, marker);
            auto second = maskAllDecisions(ids, marker);
            CHECK(torch::equal(first, second));
        }

        SUBCASE("Rejects tensors that are not 1-D")
        {
            CHECK_THROWS_AS(maskAllDecisions(torch::zeros({1, 4}, torch::kLong), marker), std::invalid_argument);
        }
    }

    TEST_CASE("maskFinalOccurrence()")
    {
        SUBCASE("Selects only the later of two occurrences")
        {
            auto ids = torch::tensor({1, 2, 3, 9, 1, 2, 3, 9}, torch::kLong);
            auto mask = maskFinalOccurrence(ids, {1, 2, 3});

            CHECK(maskedTokenCount(mask) == 3);
            CHECK(mask[0].item<float>() == 0.f);
            CHECK(mask[4].item<float>() == 1.f);
            CHECK(mask[6].item<float>() == 1.f);
            CHECK(mask[7].item<float>() == 0.f);
        }

        SUBCASE("Overlapping matches keep the last start position")
        {
            auto ids = torch::tensor({1, 1, 1}, torch::kLong);
            auto mask = maskFinalOccurrence(ids, {1, 1});
            CHECK(mask[0].item<float>() == 0.f);
            CHECK(mask[1].item<float>() == 1.f);
            CHECK(mask[2].item<float>() == 1.f);
        }

        SUBCASE("A match at the very end of the sequence is found")
        {
            auto ids = torch::tensor({4, 5, 6}, torch::kLong);
            CHECK(maskedTokenCount(maskFinalOccurrence(ids, {5, 6})) == 2);
        }

        SUBCASE("Missing, empty or oversized targets give an empty mask")
        {
            auto ids = torch::tensor({1, 2, 3}, torch::kLong);
            CHECK(maskedTokenCount(maskFinalOccurrence(ids, {4})) == 0);
            CHECK(maskedTokenCount(maskFinalOccurrence(ids, {})) == 0);
            CHECK(maskedTokenCount(maskFinalOccurrence(ids, {1, 2, 3, 4})) == 0);
        }

        SUBCASE("Running twice on the same input gives the same mask")
        {
            auto ids = torch::tensor({1, 2, 1, 2}, torch::kLong);
            CHECK(torch::equal(maskFinalOccurrence(ids, {1, 2}), maskFinalOccurrence(ids, {1, 2})));
        }
    }
}
