/**
 * @file CorrectionTrainer.cpp
 * @brief Single-frame corrections from an oracle
 *
 * Pulls the policy toward the corrected output and, when the model's own
 * output differs, pushes it away from that output. Log probabilities of the
 * corrected output are measured before and after each injection.
 */

#include<algorithm>
#include<cmath>
#include<filesystem>
#include<stdexcept>

#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../../include/Algorithms/CorrectionTrainer.hpp"
#include"../../include/Model/VisionLanguagePolicy.hpp"
#include"../../include/Model/modelUtils.hpp"
#include"../../include/SpanMasker.hpp"

#include<doctest/doctest.h>

namespace Glimpse
{
    nlohmann::json LogProbStats::toJson() const
    {
        return {{"total_log_prob", totalLogProb},
                {"avg_log_prob", averageLogProb},
                {"num_tokens", tokens},
                {"perplexity", perplexity}};
    }

    nlohmann::json CorrectionResult::toJson() const
    {
        return {{"injected", injected},
                {"loss", loss},
                {"loss_correct", correctLoss},
                {"loss_wrong", wrongLoss},
                {"reward", reward},
                {"grad_norm", gradNorm},
                {"raw_grad_norm", rawGradNorm},
                {"logprobs_before", before.toJson()},
                {"logprobs_after", after.toJson()},
                {"log_prob_delta", logProbDelta},
                {"perplexity_delta", perplexityDelta},
                {"injections", injections},
                {"avg_loss", averageLoss}};
    }

    std::vector<UpdateDatum> CorrectionResult::toUpdateData() const
    {
        return Glimpse::toUpdateData(toJson());
    }

    nlohmann::json CorrectionBatchResult::toJson() const
    {
        nlohmann::json record = {{"injected", injected}};
        if (!injected)
        {
            record["reason"] = reason;
        }
        record["batch_loss"] = batchLoss;
        record["batch_size"] = batchSize;
        record["skipped"] = skipped;
        record["grad_norm"] = gradNorm;
        record["raw_grad_norm"] = rawGradNorm;
        record["injections"] = injections;
        record["avg_loss"] = averageLoss;
        return record;
    }

    std::vector<UpdateDatum> CorrectionBatchResult::toUpdateData() const
    {
        return Glimpse::toUpdateData(toJson());
    }

    namespace
    {
        const CorrectionTrainerConfig &validated(const CorrectionTrainerConfig &config)
        {
            config.validate();
            return config;
        }
    }

    CorrectionTrainer::CorrectionTrainer(SharedPolicy &policy,
                                         const ChatTemplate &chatTemplate,
                                         const CorrectionTrainerConfig &config,
                                         std::shared_ptr<MetricsLogger> metricsLogger) :
    PolicyTrainer(policy,
                  chatTemplate,
                  validated(config).learningRate,
                  config.weightDecay,
                  config.maxGradNorm,
                  std::move(metricsLogger)),
    config(config)
    {
    }

    TokenizedDialogue CorrectionTrainer::render(const torch::Tensor &frame,
                                                const std::string &task,
                                                const std::string &output) const
    {
        std::vector<TrajectoryEntry> entries = {TrajectoryEntry::observation(frame, 0.0),
                                                TrajectoryEntry::decision(output, 0.0)};
        return encodeEntries(entries, task);
    }

    LogProbStats CorrectionTrainer::measure(const TokenizedDialogue &dialogue, const torch::Tensor &mask)
    {
        torch::NoGradGuard guard;
        auto logits = policy->forward(dialogue);
        const auto length = dialogue.size();

        // Row t scores token t + 1
        auto logProbs = torch::log_softmax(logits.narrow(0, 0, length - 1), -1);
        auto targets = dialogue.inputIds.narrow(0, 1, length - 1).to(logits.device(), torch::kLong);
        auto tokenLogProbs = logProbs.gather(1, targets.unsqueeze(1)).squeeze(1);
        auto targetMask = mask.narrow(0, 1, length - 1).to(logits.device(), logits.scalar_type());

        LogProbStats stats;
        stats.totalLogProb = (tokenLogProbs * targetMask).sum().item<double>();
        stats.tokens = maskedTokenCount(targetMask);
        stats.averageLogProb = stats.totalLogProb / static_cast<double>(std::max<int64_t>(stats.tokens, 1));
        stats.perplexity = std::exp(-stats.averageLogProb);
        return stats;
    }

    CorrectionResult CorrectionTrainer::inject(const Correction &correction)
    {
        if (correction.correctedOutput.empty())
        {
            throw std::invalid_argument("Correction for '" + correction.task + "' has no corrected output");
        }

        UpdateSession session(policy);
        const auto marker = chatTemplate.decisionMarker();
        auto dialogue = render(correction.frame, correction.task, correction.correctedOutput);
        auto mask = maskAllDecisions(dialogue.inputIds, marker);

        CorrectionResult result;
        result.reward = correction.reward;

        policy->eval();
        result.before = measure(dialogue, mask);

        policy->train();
        auto correctLoss = sequenceLoss(dialogue, mask) * config.correctWeight;
        auto loss = correctLoss;
        if (!correction.modelOutput.empty() && correction.modelOutput != correction.correctedOutput)
        {
            auto wrongDialogue = render(correction.frame, correction.task, correction.modelOutput);
            auto wrongMask = maskAllDecisions(wrongDialogue.inputIds, marker);
            auto wrongLoss = sequenceLoss(wrongDialogue, wrongMask) * -config.wrongWeight;
            result.wrongLoss = wrongLoss.item<double>();
            loss = loss + wrongLoss;
        }
        loss.backward();

        auto norms = clipAndStep();

        policy->eval();
        result.after = measure(dialogue, mask);

        result.injected = true;
        result.correctLoss = correctLoss.item<double>();
        result.loss = loss.item<double>();
        result.gradNorm = norms.clipped;
        result.rawGradNorm = norms.raw;
        result.logProbDelta = result.after.averageLogProb - result.before.averageLogProb;
        result.perplexityDelta = result.after.perplexity - result.before.perplexity;

        ++injections;
        totalLoss += result.loss;
        result.injections = injections;
        result.averageLoss = getAverageLoss();

        spdlog::info("Injected correction for '{}': \"{}\" -> \"{}\", log prob {:+.4f}",
                     correction.task, correction.modelOutput, correction.correctedOutput, result.logProbDelta);
        logMetrics("correction_inject", result.toJson());
        return result;
    }

    CorrectionBatchResult CorrectionTrainer::injectBatch(const std::vector<Correction> &corrections)
    {
        CorrectionBatchResult result;
        result.injections = injections;
        result.averageLoss = getAverageLoss();
        if (corrections.empty())
        {
            result.reason = "no corrections provided";
            return result;
        }

        UpdateSession session(policy);
        const auto marker = chatTemplate.decisionMarker();
        const auto n = static_cast<double>(corrections.size());

        for (size_t i = 0; i < corrections.size(); ++i)
        {
            const auto &correction = corrections[i];

            TokenizedDialogue dialogue;
            torch::Tensor mask;
            try
            {
                dialogue = render(correction.frame, correction.task, correction.correctedOutput);
                mask = maskAllDecisions(dialogue.inputIds, marker);
            }
            catch (const std::exception &error)
            {
                spdlog::warn("Skipping correction {} of the batch: {}", i, error.what());
                ++result.skipped;
                continue;
            }
            if (maskedTokenCount(mask) == 0)
            {
                spdlog::warn("Skipping correction {} of the batch: empty corrected output", i);
                ++result.skipped;
                continue;
            }

            auto loss = sequenceLoss(dialogue, mask) * correction.reward;
            (loss / n).backward();
            result.batchLoss += loss.item<double>();
            ++result.batchSize;
        }

        if (result.batchSize == 0)
        {
            result.reason = "no usable corrections";
            spdlog::warn("No usable corrections in a batch of {}", corrections.size());
            return result;
        }

        auto norms = clipAndStep();

        injections += result.batchSize;
        totalLoss += result.batchLoss;

        result.injected = true;
        result.gradNorm = norms.clipped;
        result.rawGradNorm = norms.raw;
        result.injections = injections;
        result.averageLoss = getAverageLoss();

        spdlog::info("Injected {} corrections, batch loss {:.4f}", result.batchSize, result.batchLoss);
        logMetrics("correction_inject", result.toJson());
        return result;
    }

    void CorrectionTrainer::saveCounters(torch::serialize::OutputArchive &archive) const
    {
        archive.write("injections", torch::tensor(injections));
        archive.write("totalLoss", torch::tensor(totalLoss, torch::kDouble));
    }

    void CorrectionTrainer::loadCounters(torch::serialize::InputArchive &archive)
    {
        torch::Tensor count, loss;
        archive.read("injections", count);
        archive.read("totalLoss", loss);
        injections = count.item<int64_t>();
        totalLoss = loss.item<double>();
    }

    TEST_CASE("CorrectionTrainer")
    {
        torch::manual_seed(0);
        ByteTokenizer tokenizer;
        ChatTemplate chatTemplate(tokenizer);
        SharedPolicy policy(std::make_shared<VisionLanguagePolicy>(tokenizer.vocabularySize(),
                                                                   chatTemplate.getImageTokenId(),
                                                                   3, 16, 32));
        auto metrics = std::make_shared<MetricsLogger>("", false);

        Correction correction;
        correction.frame = torch::rand({3, 8, 8});
        correction.task = "Click the blue button";
        correction.correctedOutput = "CLICK 500 250";

        SUBCASE("Injection raises the log probability of the corrected output")
        {
            CorrectionTrainerConfig config;
            config.learningRate = 3e-3;
            CorrectionTrainer trainer(policy, chatTemplate, config, metrics);

            auto result = trainer.inject(correction);

            CHECK(result.injected);
            CHECK(result.before.tokens == 13);
            CHECK(result.after.tokens == 13);
            CHECK(result.logProbDelta > 0);
            CHECK(result.perplexityDelta < 0);
            CHECK(result.wrongLoss == 0);
            CHECK(result.loss == doctest::Approx(result.correctLoss));
            CHECK(result.injections == 1);
            CHECK_FALSE(policy->is_training());
        }

        SUBCASE("A differing model output is pushed away")
        {
            CorrectionTrainer trainer(policy, chatTemplate, CorrectionTrainerConfig(), metrics);
            correction.modelOutput = "CLICK 10 900";

            auto result = trainer.inject(correction);

            CHECK(result.wrongLoss < 0);
            CHECK(result.correctLoss > 0);
            CHECK(result.loss == doctest::Approx(result.correctLoss + result.wrongLoss));
        }

        SUBCASE("A model output equal to the correction is not pushed away")
        {
            CorrectionTrainer trainer(policy, chatTemplate, CorrectionTrainerConfig(), metrics);
            correction.modelOutput = correction.correctedOutput;
            CHECK(trainer.inject(correction).wrongLoss == 0);
        }

        SUBCASE("A correction without corrected output is rejected untouched")
        {
            CorrectionTrainer trainer(policy, chatTemplate, CorrectionTrainerConfig(), metrics);
            auto before = parameterChecksum(policy.get());
            correction.correctedOutput.clear();

            CHECK_THROWS_AS(trainer.inject(correction), std::invalid_argument);
            CHECK(parameterChecksum(policy.get()) == doctest::Approx(before));
            CHECK(trainer.getInjections() == 0);
        }

        SUBCASE("A batch takes one step over its usable corrections")
        {
            CorrectionTrainer trainer(policy, chatTemplate, CorrectionTrainerConfig(), metrics);
            auto second = correction;
            second.correctedOutput = "TYPE hello";
            second.reward = 0.5f;
            auto frameless = correction;
            frameless.frame = torch::Tensor();

            auto result = trainer.injectBatch({correction, second, frameless});

            CHECK(result.injected);
            CHECK(result.batchSize == 2);
            CHECK(result.skipped == 1);
            CHECK(result.injections == 2);
            CHECK(result.averageLoss == doctest::Approx(result.batchLoss / 2));
        }

        SUBCASE("An empty batch is not injected")
        {
            CorrectionTrainer trainer(policy, chatTemplate, CorrectionTrainerConfig(), metrics);
            auto result = trainer.injectBatch({});
            CHECK_FALSE(result.injected);
            CHECK(result.reason == "no corrections provided");
        }

        SUBCASE("Counters survive save and load")
        {
            auto path = (std::filesystem::temp_directory_path() / "glimpserl_correction_state.pt").string();
            CorrectionTrainer trainer(policy, chatTemplate, CorrectionTrainerConfig(), metrics);
            trainer.inject(correction);
            trainer.saveState(path);

            CorrectionTrainer resumed(policy, chatTemplate, CorrectionTrainerConfig(), metrics);
            resumed.loadState(path);
            CHECK(resumed.getInjections() == 1);
            CHECK(resumed.getAverageLoss() == doctest::Approx(trainer.getAverageLoss()));

            std::filesystem::remove(path);
        }
    }
}
