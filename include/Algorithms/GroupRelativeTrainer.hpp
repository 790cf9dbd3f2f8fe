#pragma once

#ifndef GLIMPSERL_GROUPRELATIVETRAINER_HPP
#define GLIMPSERL_GROUPRELATIVETRAINER_HPP

#include<cstdint>
#include<memory>
#include<optional>
#include<string>
#include<utility>
#include<vector>

#include<nlohmann/json.hpp>

#include"Algorithm.hpp"
#include"../Config.hpp"
#include"../Trajectory.hpp"

namespace Glimpse
{
    /**
     * @brief Held-out evaluation of a group, computed without gradients
     */
    struct ValidationMetrics
    {
        double loss = 0;        ///< Mean masked loss over the evaluated rollouts
        double perplexity = 0;  ///< exp(loss)
        int64_t rollouts = 0;
        int64_t tokens = 0;
    };

    /**
     * @brief Diagnostics of one GroupRelativeTrainer::trainStep() call
     */
    struct GroupTrainResult
    {
        bool trained = false;
        std::string reason;
        std::vector<float> rewards;       ///< Rewards of the rollouts that survived filtering
        std::vector<double> advantages;   ///< One per training rollout
        double rewardMean = 0;
        double rewardStd = 0;             ///< Population std over the whole surviving group
        int64_t rollouts = 0;             ///< Rollouts that survived filtering
        int64_t trainRollouts = 0;
        int64_t validationRollouts = 0;
        int64_t usedRollouts = 0;
        int64_t skippedRollouts = 0;      ///< Below threshold, failed assembly or empty mask
        int64_t actionTokens = 0;
        double loss = 0;                  ///< Sum of advantage * loss over used rollouts, divided by their count
        double gradNorm = 0;              ///< Gradient norm after clipping
        double rawGradNorm = 0;
        double advantageThreshold = 0;
        double minAdvantageStd = 0;
        double validationFraction = 0;
        int64_t trainSteps = 0;
        std::optional<ValidationMetrics> validation;

        nlohmann::json toJson() const;
        std::vector<UpdateDatum> toUpdateData() const;
    };

    /**
     * @brief Group-relative policy optimization over rollouts of one task
     *
     * Rewards are turned into advantages by z-scoring them within the
     * training part of the group. A group whose advantages are all below the
     * significance threshold is rejected before any gradient is computed.
     * Otherwise every significant rollout contributes advantage * loss / n
     * over all of its decision tokens, followed by a single clipped
     * optimizer step. The held-out tail of the group is only evaluated.
     */
    class GroupRelativeTrainer : public PolicyTrainer
    {
    private:
        GroupTrainerConfig config;
        int64_t trainSteps = 0;

        ValidationMetrics evaluate(const std::vector<const Rollout *> &rollouts, const std::string &task);

    protected:
        void saveCounters(torch::serialize::OutputArchive &archive) const override;
        void loadCounters(torch::serialize::InputArchive &archive) override;

    public:
        /**
         * @throws std::invalid_argument if `config` is malformed
         */
        GroupRelativeTrainer(SharedPolicy &policy,
                             const ChatTemplate &chatTemplate,
                             const GroupTrainerConfig &config = GroupTrainerConfig(),
                             std::shared_ptr<MetricsLogger> metricsLogger = nullptr);

        /**
         * @brief Z-scored advantages of `rewards`
         *
         * Uses the sample standard deviation. Fewer than two rewards, or a
         * standard deviation below the configured minimum, give all zeros.
         */
        std::vector<double> computeAdvantages(const std::vector<float> &rewards) const;

        /**
         * @brief Splits `count` rollouts into training and held-out counts
         *
         * The last max(1, count * fraction) rollouts are held out. No split
         * happens when the fraction is zero, fewer than two rollouts remain,
         * or nothing would be left to train on.
         */
        std::pair<size_t, size_t> splitSizes(size_t count) const;

        /**
         * @brief One update from a group of rollouts sharing `task`
         *
         * Rollouts with empty trajectories are dropped first. Returns
         * `trained = false` with reason "no rollouts provided", "no variance
         * in rewards" or "no valid rollouts after filtering" without touching
         * parameters.
         */
        GroupTrainResult trainStep(const std::vector<Rollout> &rollouts, const std::string &task);

        inline int64_t getTrainSteps() const
        {
            return trainSteps;
        }
    };
}

#endif //GLIMPSERL_GROUPRELATIVETRAINER_HPP
