#pragma once

#ifndef GLIMPSERL_TRAJECTORY_HPP
#define GLIMPSERL_TRAJECTORY_HPP

#include<string>
#include<vector>

#include<torch/torch.h>

namespace Glimpse
{
    enum class EntryKind
    {
        Observation,
        Decision
    };

    /**
     * @brief One step of an interaction history
     *
     * An entry is either an Observation (a visual frame captured from the
     * environment) or a Decision (the free-text action the policy emitted).
     * Only the fields belonging to the entry's kind are meaningful: `frame`
     * for observations, `text` for decisions.
     */
    struct TrajectoryEntry
    {
        EntryKind kind;
        torch::Tensor frame;   /**< Frame tensor shaped [channels, height, width], observations only */
        std::string text;      /**< Action text, decisions only */
        double timestamp;      /**< Seconds, as reported by the environment driver */

        static TrajectoryEntry observation(torch::Tensor frame, double timestamp);
        static TrajectoryEntry decision(std::string text, double timestamp);

        inline bool isObservation() const
        {
            return kind == EntryKind::Observation;
        }

        inline bool isDecision() const
        {
            return kind == EntryKind::Decision;
        }
    };

    /**
     * @brief Ordered observation/decision history of one episode
     *
     * Entries are expected to alternate Observation, Decision, Observation, ...
     * A trailing observation without a following decision marks the end of the
     * episode. The trainers treat a trajectory as immutable input for the
     * duration of one training call.
     */
    class Trajectory
    {
    private:
        std::vector<TrajectoryEntry> entries;

    public:
        Trajectory() = default;

        explicit Trajectory(std::vector<TrajectoryEntry> entries);

        /**
         * @brief Appends an observation entry
         * @return Reference to this trajectory so appends can be chained
         */
        Trajectory &observe(torch::Tensor frame, double timestamp);

        /**
         * @brief Appends a decision entry
         * @return Reference to this trajectory so appends can be chained
         */
        Trajectory &decide(std::string text, double timestamp);

        inline const std::vector<TrajectoryEntry> &getEntries() const
        {
            return entries;
        }

        inline size_t size() const
        {
            return entries.size();
        }

        inline bool empty() const
        {
            return entries.empty();
        }

        size_t decisionCount() const;
    };

    /**
     * @brief A trajectory tagged with the scalar outcome of the whole episode
     *
     * All rollouts handed to one group training call belong to the same task,
     * so their rewards are directly comparable.
     */
    struct Rollout
    {
        Trajectory trajectory;
        float reward = 0;
    };
}

#endif //GLIMPSERL_TRAJECTORY_HPP
