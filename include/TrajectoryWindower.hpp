#pragma once

#ifndef GLIMPSERL_TRAJECTORYWINDOWER_HPP
#define GLIMPSERL_TRAJECTORYWINDOWER_HPP

#include<string>
#include<utility>
#include<vector>

#include"Trajectory.hpp"

namespace Glimpse
{
    /**
     * @brief One windowed prediction problem cut from a trajectory
     *
     * `window` alternates Observation, Decision and ends with the decision
     * under prediction, whose text is repeated in `target`.
     */
    struct TrainingExample
    {
        std::vector<TrajectoryEntry> window;
        std::string target;

        inline size_t pairCount() const
        {
            return window.size() / 2;
        }
    };

    /**
     * @brief Pairs every observation with the decision immediately after it
     *
     * Decisions without a preceding observation and observations without a
     * following decision are dropped.
     */
    std::vector<std::pair<const TrajectoryEntry *, const TrajectoryEntry *>> pairEntries(const Trajectory &trajectory);

    /**
     * @brief Splits a trajectory into one training example per decision
     *
     * For pair index k of the paired sequence, the example's window holds
     * pairs [max(0, k + 1 - windowSize), k] flattened back into entries, and
     * its target is the decision of pair k. A trajectory without complete
     * pairs yields no examples, which callers treat as nothing to train on.
     *
     * @param trajectory Source trajectory, left untouched
     * @param windowSize Maximum number of (observation, decision) pairs per window
     * @throws std::invalid_argument if windowSize < 1
     */
    std::vector<TrainingExample> windowTrajectory(const Trajectory &trajectory, int windowSize);
}

#endif //GLIMPSERL_TRAJECTORYWINDOWER_HPP
