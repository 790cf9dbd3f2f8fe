#include<algorithm>
#include<utility>

#include"../include/Trajectory.hpp"

#include<doctest/doctest.h>

namespace Glimpse
{
    TrajectoryEntry TrajectoryEntry::observation(torch::Tensor frame, double timestamp)
    {
        return {EntryKind::Observation, std::move(frame), "", timestamp};
    }

    TrajectoryEntry TrajectoryEntry::decision(std::string text, double timestamp)
    {
        return {EntryKind::Decision, torch::Tensor(), std::move(text), timestamp};
    }

    Trajectory::Trajectory(std::vector<TrajectoryEntry> entries) : entries(std::move(entries)) {}

    Trajectory &Trajectory::observe(torch::Tensor frame, double timestamp)
    {
        entries.push_back(TrajectoryEntry::observation(std::move(frame), timestamp));
        return *this;
    }

    Trajectory &Trajectory::decide(std::string text, double timestamp)
    {
        entries.push_back(TrajectoryEntry::decision(std::move(text), timestamp));
        return *this;
    }

    size_t Trajectory::decisionCount() const
    {
        return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
                                                 [](const TrajectoryEntry &entry)
                                                 { return entry.isDecision(); }));
    }

    TEST_CASE("Trajectory")
    {
        SUBCASE("observe() and decide() append entries in order")
        {
            Trajectory trajectory;
            trajectory.observe(torch::zeros({3, 8, 8}), 1.0)
                .decide("CLICK 10 20", 1.5)
                .observe(torch::zeros({3, 8, 8}), 2.0);

            REQUIRE(trajectory.size() == 3);
            CHECK(trajectory.getEntries()[0].isObservation());
            CHECK(trajectory.getEntries()[1].isDecision());
            CHECK(trajectory.getEntries()[1].text == "CLICK 10 20");
            CHECK(trajectory.getEntries()[2].timestamp == doctest::Approx(2.0));
            CHECK(trajectory.decisionCount() == 1);
        }

        SUBCASE("A default trajectory is empty")
        {
            Trajectory trajectory;
            CHECK(trajectory.empty());
            CHECK(trajectory.decisionCount() == 0);
        }

        SUBCASE("A trajectory can be built from recorded entries")
        {
            Trajectory trajectory({TrajectoryEntry::observation(torch::zeros({3, 8, 8}), 0.0),
                                   TrajectoryEntry::decision("TYPE hello", 0.4),
                                   TrajectoryEntry::decision("DONE", 0.9)});
            CHECK(trajectory.size() == 3);
            CHECK(trajectory.decisionCount() == 2);
            CHECK(trajectory.getEntries()[2].text == "DONE");
        }

        SUBCASE("A default rollout carries no reward")
        {
            Rollout rollout;
            CHECK(rollout.reward == 0);
            CHECK(rollout.trajectory.empty());
        }
    }
}
