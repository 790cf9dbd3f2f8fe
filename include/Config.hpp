#pragma once

#ifndef GLIMPSERL_CONFIG_HPP
#define GLIMPSERL_CONFIG_HPP

namespace Glimpse
{
    /**
     * @brief Hyperparameters of the TrajectoryTrainer
     */
    struct TrajectoryTrainerConfig
    {
        double learningRate = 2e-4;
        double weightDecay = 0.01;
        int windowSize = 8;         ///< Observation/decision pairs of context per example
        double maxGradNorm = 1.0;

        /**
         * @throws std::invalid_argument on a malformed value
         */
        void validate() const;
    };

    /**
     * @brief Hyperparameters of the GroupRelativeTrainer
     */
    struct GroupTrainerConfig
    {
        double learningRate = 2e-5;
        double weightDecay = 0.01;
        double advantageThreshold = 0.01;   ///< Rollouts with |advantage| below this contribute nothing
        double minAdvantageStd = 1e-8;      ///< Below this reward std every advantage is forced to zero
        double maxGradNorm = 1.0;
        double validationFraction = 0.2;    ///< Share of the group held out for evaluation, 0 disables it

        /**
         * @throws std::invalid_argument on a malformed value
         */
        void validate() const;
    };

    /**
     * @brief Hyperparameters of the CorrectionTrainer
     */
    struct CorrectionTrainerConfig
    {
        double learningRate = 2e-4;
        double weightDecay = 0.01;
        double correctWeight = 10.0;    ///< Pull toward the corrected output
        double wrongWeight = 10.0;      ///< Push away from the rejected model output
        double maxGradNorm = 1.0;

        /**
         * @throws std::invalid_argument on a malformed value
         */
        void validate() const;
    };
}

#endif //GLIMPSERL_CONFIG_HPP
