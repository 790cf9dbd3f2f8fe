#pragma once

#ifndef GLIMPSERL_ALGORITHM_HPP
#define GLIMPSERL_ALGORITHM_HPP

#include<memory>
#include<mutex>
#include<string>
#include<vector>

#include<nlohmann/json.hpp>
#include<torch/torch.h>

#include"../Dialogue.hpp"
#include"../MetricsLogger.hpp"
#include"../Model/PolicyModel.hpp"

namespace Glimpse
{
    /**
     * @brief A single named scalar produced by a training call
     *
     * Every trainer result flattens into a list of these for logging and
     * plotting, e.g. "loss", "grad_norm", "reward_mean".
     */
    struct UpdateDatum
    {
        std::string name;
        float value;
    };

    /**
     * @brief Scope of one training call on the shared policy
     *
     * Holds the policy lock for its whole lifetime, switches the model to
     * training mode and clears stale gradients on entry, and puts the model
     * back into evaluation mode on every exit path.
     */
    class UpdateSession
    {
    private:
        std::unique_lock<std::mutex> lock;
        PolicyModel &model;

    public:
        explicit UpdateSession(SharedPolicy &policy);
        ~UpdateSession();

        UpdateSession(const UpdateSession &) = delete;
        UpdateSession &operator=(const UpdateSession &) = delete;
    };

    /**
     * @brief Norms measured around one clip-and-step
     */
    struct StepNorms
    {
        double raw;      /**< Gradient norm before clipping */
        double clipped;  /**< Gradient norm actually applied, at most the configured maximum */
    };

    /**
     * @brief Abstract base class for the trainers that update the shared policy
     *
     * A trainer owns its AdamW optimizer over the parameters that were
     * trainable when it was constructed, and only a reference to the policy.
     * Derived classes implement their own entry points; this class provides
     * the pieces they share:
     * 1. Rendering trajectory entries to a tokenized dialogue
     * 2. Forward pass plus masked next-token loss
     * 3. Gradient clipping and exactly one optimizer step
     * 4. Structured metrics
     * 5. Saving and restoring optimizer state and counters
     *
     * @note Frozen parameters must be frozen before construction to stay out
     *       of the optimizer.
     */
    class PolicyTrainer
    {
    private:
        bool optimizerStepped = false;

    protected:
        SharedPolicy &policy;
        const ChatTemplate &chatTemplate;
        std::vector<torch::Tensor> parameters;
        std::unique_ptr<torch::optim::AdamW> optimizer;
        std::shared_ptr<MetricsLogger> metricsLogger;
        double maxGradNorm;

        /**
         * @param metricsLogger Destination of structured records; a
         *                      console-only logger is created when null
         * @throws std::invalid_argument if the policy has no trainable parameter
         */
        PolicyTrainer(SharedPolicy &policy,
                      const ChatTemplate &chatTemplate,
                      double learningRate,
                      double weightDecay,
                      double maxGradNorm,
                      std::shared_ptr<MetricsLogger> metricsLogger);

        TokenizedDialogue encodeEntries(const std::vector<TrajectoryEntry> &entries, const std::string &task) const;

        /**
         * @brief Runs the policy on `dialogue` and returns the loss over `mask`
         */
        torch::Tensor sequenceLoss(const TokenizedDialogue &dialogue, const torch::Tensor &mask);

        /**
         * @brief Clips the accumulated gradients and takes one optimizer step
         */
        StepNorms clipAndStep();

        void logMetrics(const std::string &event, const nlohmann::json &payload);

        virtual void saveCounters(torch::serialize::OutputArchive &archive) const = 0;
        virtual void loadCounters(torch::serialize::InputArchive &archive) = 0;

    public:
        virtual ~PolicyTrainer() = 0;

        /**
         * @brief Writes optimizer state and counters to `path`
         *
         * Policy parameters are not included; whoever owns the policy saves
         * them with torch::save.
         */
        void saveState(const std::string &path) const;

        /**
         * @brief Restores a state written by saveState()
         *
         * Counters are always restored. The optimizer state is restored only
         * when the archive says one was saved, which is the case once the
         * saving trainer had taken at least one step.
         *
         * @throws std::runtime_error if `path` does not exist
         */
        void loadState(const std::string &path);
    };
    inline PolicyTrainer::~PolicyTrainer() {}

    /**
     * @brief Converts a result's named values into UpdateDatum entries
     *
     * Booleans and numbers are kept; strings, arrays and nested objects are
     * skipped.
     */
    std::vector<UpdateDatum> toUpdateData(const nlohmann::json &record);
}

#endif //GLIMPSERL_ALGORITHM_HPP
