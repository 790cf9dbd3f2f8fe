#pragma once

#ifndef GLIMPSERL_CORRECTIONTRAINER_HPP
#define GLIMPSERL_CORRECTIONTRAINER_HPP

#include<cstdint>
#include<memory>
#include<string>
#include<vector>

#include<nlohmann/json.hpp>
#include<torch/torch.h>

#include"Algorithm.hpp"
#include"../Config.hpp"

namespace Glimpse
{
    /**
     * @brief An oracle's fix for one decision of the policy
     */
    struct Correction
    {
        torch::Tensor frame;            ///< Frame the policy was looking at
        std::string task;
        std::string modelOutput;        ///< What the policy said, may be empty
        std::string correctedOutput;    ///< What it should have said
        float reward = 1.0f;
    };

    /**
     * @brief Log-probability of the decision tokens of one dialogue
     */
    struct LogProbStats
    {
        double totalLogProb = 0;
        double averageLogProb = 0;
        int64_t tokens = 0;
        double perplexity = 0;     ///< exp(-averageLogProb)

        nlohmann::json toJson() const;
    };

    struct CorrectionResult
    {
        bool injected = false;
        double loss = 0;            ///< correctLoss + wrongLoss
        double correctLoss = 0;     ///< Weighted loss pulling toward the corrected output
        double wrongLoss = 0;       ///< Weighted, negated loss pushing away from the model output
        float reward = 0;
        double gradNorm = 0;
        double rawGradNorm = 0;
        LogProbStats before;
        LogProbStats after;
        double logProbDelta = 0;
        double perplexityDelta = 0;
        int64_t injections = 0;
        double averageLoss = 0;

        nlohmann::json toJson() const;
        std::vector<UpdateDatum> toUpdateData() const;
    };

    struct CorrectionBatchResult
    {
        bool injected = false;
        std::string reason;
        double batchLoss = 0;       ///< Sum of reward * loss over used corrections
        int64_t batchSize = 0;
        int64_t skipped = 0;
        double gradNorm = 0;
        double rawGradNorm = 0;
        int64_t injections = 0;
        double averageLoss = 0;

        nlohmann::json toJson() const;
        std::vector<UpdateDatum> toUpdateData() const;
    };

    /**
     * @brief Turns oracle corrections into immediate policy updates
     *
     * Each correction is rendered as a one-observation, one-decision
     * dialogue and only its decision tokens carry loss.
     */
    class CorrectionTrainer : public PolicyTrainer
    {
    private:
        CorrectionTrainerConfig config;
        int64_t injections = 0;
        double totalLoss = 0;

        TokenizedDialogue render(const torch::Tensor &frame, const std::string &task, const std::string &output) const;
        LogProbStats measure(const TokenizedDialogue &dialogue, const torch::Tensor &mask);

    protected:
        void saveCounters(torch::serialize::OutputArchive &archive) const override;
        void loadCounters(torch::serialize::InputArchive &archive) override;

    public:
        /**
         * @throws std::invalid_argument if `config` is malformed
         */
        CorrectionTrainer(SharedPolicy &policy,
                          const ChatTemplate &chatTemplate,
                          const CorrectionTrainerConfig &config = CorrectionTrainerConfig(),
                          std::shared_ptr<MetricsLogger> metricsLogger = nullptr);

        /**
         * @brief One update toward `correction.correctedOutput`
         *
         * The loss is correctWeight * loss(corrected); when the model output
         * is non-empty and differs, wrongWeight * loss(model output) is
         * subtracted. Log-probabilities of the corrected decision are
         * measured without gradients before and after the step.
         *
         * @throws std::invalid_argument if the correction has no frame or no corrected output
         */
        CorrectionResult inject(const Correction &correction);

        /**
         * @brief Accumulates reward * loss / n over `corrections`, then one step
         *
         * Corrections that fail to render are logged and skipped.
         */
        CorrectionBatchResult injectBatch(const std::vector<Correction> &corrections);

        inline int64_t getInjections() const
        {
            return injections;
        }

        inline double getAverageLoss() const
        {
            return injections > 0 ? totalLoss / injections : 0.0;
        }
    };
}

#endif //GLIMPSERL_CORRECTIONTRAINER_HPP
