#include<algorithm>
#include<stdexcept>

#include"../include/TrajectoryWindower.hpp"

#include<doctest/doctest.h>

namespace Glimpse
{
    std::vector<std::pair<const TrajectoryEntry *, const TrajectoryEntry *>> pairEntries(const Trajectory &trajectory)
    {
        const auto &entries = trajectory.getEntries();
        std::vector<std::pair<const TrajectoryEntry *, const TrajectoryEntry *>> pairs;

        size_t i = 0;
        while (i < entries.size())
        {
            if (entries[i].isObservation() && i + 1 < entries.size() && entries[i + 1].isDecision())
            {
                pairs.emplace_back(&entries[i], &entries[i + 1]);
                i += 2;
            }
            else
            {
                ++i;
            }
        }
        return pairs;
    }

    std::vector<TrainingExample> windowTrajectory(const Trajectory &trajectory, int windowSize)
    {
        if (windowSize < 1)
        {
            throw std::invalid_argument("Window size must be at least 1, got " + std::to_string(windowSize));
        }

        auto pairs = pairEntries(trajectory);
        std::vector<TrainingExample> examples;
        examples.reserve(pairs.size());

        const auto window = static_cast<size_t>(windowSize);
        for (size_t step = 0; step < pairs.size(); ++step)
        {
            const auto first = step + 1 > window ? step + 1 - window : 0;

            TrainingExample example;
            example.window.reserve(2 * (step + 1 - first));
            for (size_t k = first; k <= step; ++k)
            {
                example.window.push_back(*pairs[k].first);
                example.window.push_back(*pairs[k].second);
            }
            example.target = pairs[step].second->text;
            examples.push_back(std::move(example));
        }
        return examples;
    }

    static Trajectory numberedTrajectory(int decisions)
    {
        Trajectory trajectory;
        for (int i = 0; i < decisions; ++i)
        {
            trajectory.observe(torch::full({1, 2, 2}, static_cast<float>(i)), i);
            trajectory.decide("CLICK " + std::to_string(i) + " 0", i + 0.5);
        }
        return trajectory;
    }

    TEST_CASE("windowTrajectory()")
    {
        SUBCASE("N pairs give N examples with min(k + 1, W) pairs each")
        {
            for (int windowSize : {1, 3, 8})
            {
                auto examples = windowTrajectory(numberedTrajectory(6), windowSize);
                REQUIRE(examples.size() == 6);
                for (size_t k = 0; k < examples.size(); ++k)
                {
                    CHECK(examples[k].pairCount() == std::min<size_t>(k + 1, windowSize));
                    CHECK(examples[k].target == "CLICK " + std::to_string(k) + " 0");
                }
            }
        }

        SUBCASE("Windows slide and end at the decision under prediction")
        {
            auto examples = windowTrajectory(numberedTrajectory(5), 2);
            const auto &window = examples[4].window;
            REQUIRE(window.size() == 4);
            CHECK(window[0].isObservation());
            CHECK(window[0].frame[0][0][0].item<float>() == doctest::Approx(3.f));
            CHECK(window[1].text == "CLICK 3 0");
            CHECK(window[3].isDecision());
            CHECK(window[3].text == examples[4].target);
        }

        SUBCASE("Unpaired leading and trailing entries are discarded")
        {
            Trajectory trajectory;
            trajectory.decide("WAIT", 0.0)
                .observe(torch::zeros({1, 2, 2}), 1.0)
                .observe(torch::zeros({1, 2, 2}), 2.0)
                .decide("CLICK 1 1", 2.5)
                .observe(torch::zeros({1, 2, 2}), 3.0);

            auto examples = windowTrajectory(trajectory, 4);
            REQUIRE(examples.size() == 1);
            CHECK(examples[0].target == "CLICK 1 1");
            CHECK(examples[0].window[0].timestamp == doctest::Approx(2.0));
        }

        SUBCASE("Empty or pairless trajectories give no examples")
        {
            CHECK(windowTrajectory(Trajectory(), 4).empty());

            Trajectory observationsOnly;
            observationsOnly.observe(torch::zeros({1, 2, 2}), 0.0).observe(torch::zeros({1, 2, 2}), 1.0);
            CHECK(windowTrajectory(observationsOnly, 4).empty());
        }

        SUBCASE("A window size below one is rejected")
        {
            CHECK_THROWS_AS(windowTrajectory(numberedTrajectory(2), 0), std::invalid_argument);
        }
    }
}
