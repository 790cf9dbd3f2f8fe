#pragma once

#ifndef GLIMPSERL_TRAJECTORYTRAINER_HPP
#define GLIMPSERL_TRAJECTORYTRAINER_HPP

#include<cstdint>
#include<memory>
#include<string>
#include<vector>

#include<nlohmann/json.hpp>

#include"Algorithm.hpp"
#include"../Config.hpp"
#include"../Trajectory.hpp"

namespace Glimpse
{
    /**
     * @brief Diagnostics of one TrajectoryTrainer::trainOnTrajectory() call
     */
    struct TrajectoryTrainResult
    {
        bool trained = false;
        std::string reason;             ///< Why nothing was trained, empty on success
        double meanLoss = 0;            ///< Mean loss over the usable examples
        double gradNorm = 0;            ///< Gradient norm after clipping
        double rawGradNorm = 0;         ///< Gradient norm before clipping
        int64_t examples = 0;           ///< Examples produced by windowing
        int64_t usableExamples = 0;
        int64_t skippedExamples = 0;    ///< Failed assembly or matched no target tokens
        int64_t maskedTokens = 0;
        int64_t trajectoryLength = 0;
        int64_t trainSteps = 0;
        double averageLoss = 0;         ///< Running average over every successful call

        nlohmann::json toJson() const;
        std::vector<UpdateDatum> toUpdateData() const;
    };

    /**
     * @brief Counters kept across calls; reset only by constructing a new trainer
     */
    struct TrajectoryTrainerState
    {
        int64_t trainSteps = 0;
        double totalLoss = 0;

        inline double averageLoss() const
        {
            return trainSteps > 0 ? totalLoss / trainSteps : 0.0;
        }
    };

    /**
     * @brief Imitation trainer for one successful trajectory
     *
     * The trajectory is cut into sliding windows, one per decision. Each
     * window is rendered and the loss is restricted to the final occurrence
     * of its target decision, so earlier copies of the same action text stay
     * context. Every example contributes loss / examples to one accumulated
     * gradient, followed by a single clipped optimizer step.
     */
    class TrajectoryTrainer : public PolicyTrainer
    {
    private:
        TrajectoryTrainerConfig config;
        TrajectoryTrainerState state;

    protected:
        void saveCounters(torch::serialize::OutputArchive &archive) const override;
        void loadCounters(torch::serialize::InputArchive &archive) override;

    public:
        /**
         * @throws std::invalid_argument if `config` is malformed
         */
        TrajectoryTrainer(SharedPolicy &policy,
                          const ChatTemplate &chatTemplate,
                          const TrajectoryTrainerConfig &config = TrajectoryTrainerConfig(),
                          std::shared_ptr<MetricsLogger> metricsLogger = nullptr);

        /**
         * @brief Trains on every decision of `trajectory` with one optimizer step
         *
         * Returns `trained = false` with reason "no decisions" when windowing
         * yields nothing, and "no usable examples" when every example was
         * skipped; parameters are untouched in both cases.
         */
        TrajectoryTrainResult trainOnTrajectory(const Trajectory &trajectory, const std::string &task);

        inline const TrajectoryTrainerState &getState() const
        {
            return state;
        }
    };
}

#endif //GLIMPSERL_TRAJECTORYTRAINER_HPP
