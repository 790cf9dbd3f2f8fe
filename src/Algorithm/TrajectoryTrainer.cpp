/**
 * @file TrajectoryTrainer.cpp
 * @brief Imitation updates from a single recorded trajectory
 *
 * A trajectory is cut into one sliding window per decision. Each window is
 * rendered as a dialogue whose final assistant turn is the target, and only
 * the last occurrence of that target's tokens contributes to the loss. All
 * usable windows share one optimizer step.
 *
 * Key features:
 * - Bounded context through the window size
 * - Per-window skips for rendering failures and empty target masks
 * - Gradient clipping with the pre-clip norm reported alongside
 * - Running average loss that survives save and load
 */

#include<filesystem>
#include<stdexcept>

#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../../include/Algorithms/TrajectoryTrainer.hpp"
#include"../../include/Model/VisionLanguagePolicy.hpp"
#include"../../include/Model/modelUtils.hpp"
#include"../../include/SpanMasker.hpp"
#include"../../include/TrajectoryWindower.hpp"

#include<doctest/doctest.h>

namespace Glimpse
{
    nlohmann::json TrajectoryTrainResult::toJson() const
    {
        nlohmann::json record = {{"trained", trained}};
        if (!trained)
        {
            record["reason"] = reason;
        }
        record["loss"] = meanLoss;
        record["grad_norm"] = gradNorm;
        record["raw_grad_norm"] = rawGradNorm;
        record["action_tokens"] = maskedTokens;
        record["num_examples"] = examples;
        record["usable_examples"] = usableExamples;
        record["skipped_examples"] = skippedExamples;
        record["trajectory_len"] = trajectoryLength;
        record["train_steps"] = trainSteps;
        record["avg_loss"] = averageLoss;
        return record;
    }

    std::vector<UpdateDatum> TrajectoryTrainResult::toUpdateData() const
    {
        return Glimpse::toUpdateData(toJson());
    }

    namespace
    {
        const TrajectoryTrainerConfig &validated(const TrajectoryTrainerConfig &config)
        {
            config.validate();
            return config;
        }
    }

    TrajectoryTrainer::TrajectoryTrainer(SharedPolicy &policy,
                                         const ChatTemplate &chatTemplate,
                                         const TrajectoryTrainerConfig &config,
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

    TrajectoryTrainResult TrajectoryTrainer::trainOnTrajectory(const Trajectory &trajectory, const std::string &task)
    {
        TrajectoryTrainResult result;
        result.trajectoryLength = static_cast<int64_t>(trajectory.size());
        result.trainSteps = state.trainSteps;
        result.averageLoss = state.averageLoss();

        auto examples = windowTrajectory(trajectory, config.windowSize);
        result.examples = static_cast<int64_t>(examples.size());
        if (examples.empty())
        {
            result.reason = "no decisions";
            spdlog::info("Trajectory for '{}' has no decisions, nothing to train", task);
            return result;
        }

        UpdateSession session(policy);
        const auto &tokenizer = chatTemplate.getTokenizer();
        const double scale = 1.0 / static_cast<double>(examples.size());
        double totalLoss = 0;

        for (size_t i = 0; i < examples.size(); ++i)
        {
            const auto &example = examples[i];

            TokenizedDialogue dialogue;
            torch::Tensor mask;
            try
            {
                dialogue = encodeEntries(example.window, task);
                mask = maskFinalOccurrence(dialogue.inputIds, tokenizer.encode(example.target));
            }
            catch (const std::exception &error)
            {
                spdlog::warn("Skipping example {} of '{}': {}", i, task, error.what());
                ++result.skippedExamples;
                continue;
            }

            auto tokens = maskedTokenCount(mask);
            if (tokens == 0)
            {
                spdlog::warn("Skipping example {} of '{}': target \"{}\" matched no tokens", i, task, example.target);
                ++result.skippedExamples;
                continue;
            }

            auto loss = sequenceLoss(dialogue, mask);
            (loss * scale).backward();

            auto value = loss.item<double>();
            spdlog::debug("Example {}/{}: {} pairs, {} target tokens, loss {:.4f}",
                          i + 1, examples.size(), example.pairCount(), tokens, value);
            totalLoss += value;
            result.maskedTokens += tokens;
            ++result.usableExamples;
        }

        if (result.usableExamples == 0)
        {
            result.reason = "no usable examples";
            spdlog::warn("No usable examples in trajectory for '{}', skipping update", task);
            return result;
        }

        auto norms = clipAndStep();

        result.trained = true;
        result.meanLoss = totalLoss / static_cast<double>(result.usableExamples);
        result.gradNorm = norms.clipped;
        result.rawGradNorm = norms.raw;

        ++state.trainSteps;
        state.totalLoss += result.meanLoss;
        result.trainSteps = state.trainSteps;
        result.averageLoss = state.averageLoss();

        spdlog::info("Trajectory step {}: loss {:.4f} over {}/{} examples, grad norm {:.4f}",
                     result.trainSteps, result.meanLoss, result.usableExamples, result.examples, result.gradNorm);

        auto record = result.toJson();
        record["window_size"] = config.windowSize;
        record["grad_clip"] = config.maxGradNorm;
        logMetrics("trajectory_train", record);
        return result;
    }

    void TrajectoryTrainer::saveCounters(torch::serialize::OutputArchive &archive) const
    {
        archive.write("trainSteps", torch::tensor(state.trainSteps));
        archive.write("totalLoss", torch::tensor(state.totalLoss, torch::kDouble));
    }

    void TrajectoryTrainer::loadCounters(torch::serialize::InputArchive &archive)
    {
        torch::Tensor trainSteps, totalLoss;
        archive.read("trainSteps", trainSteps);
        archive.read("totalLoss", totalLoss);
        state.trainSteps = trainSteps.item<int64_t>();
        state.totalLoss = totalLoss.item<double>();
    }

    namespace
    {
        /**
         * @brief Byte tokenizer that refuses to encode text containing "BROKEN"
         */
        class RefusingTokenizer : public ByteTokenizer
        {
        public:
            std::vector<int64_t> encode(const std::string &text) const override
            {
                if (text.find("BROKEN") != std::string::npos)
                {
                    throw std::runtime_error("cannot encode");
                }
                return ByteTokenizer::encode(text);
            }
        };

        Trajectory makeTrajectory(const std::vector<std::string> &decisions)
        {
            Trajectory trajectory;
            double timestamp = 0;
            for (const auto &decision : decisions)
            {
                trajectory.observe(torch::rand({3, 8, 8}), timestamp).decide(decision, timestamp + 0.5);
                timestamp += 1;
            }
            return trajectory;
        }
    }

    TEST_CASE("TrajectoryTrainer")
    {
        torch::manual_seed(0);
        RefusingTokenizer tokenizer;
        ChatTemplate chatTemplate(tokenizer);
        SharedPolicy policy(std::make_shared<VisionLanguagePolicy>(tokenizer.vocabularySize(),
                                                                   chatTemplate.getImageTokenId(),
                                                                   3, 16, 32));
        auto metrics = std::make_shared<MetricsLogger>("", false);
        const std::string task = "Open the settings";

        SUBCASE("A trajectory without decisions is not trained")
        {
            TrajectoryTrainer trainer(policy, chatTemplate, TrajectoryTrainerConfig(), metrics);
            Trajectory trajectory;
            trajectory.observe(torch::rand({3, 8, 8}), 0.0).observe(torch::rand({3, 8, 8}), 1.0);

            auto before = parameterChecksum(policy.get());
            auto result = trainer.trainOnTrajectory(trajectory, task);

            CHECK_FALSE(result.trained);
            CHECK(result.reason == "no decisions");
            CHECK(result.examples == 0);
            CHECK(trainer.getState().trainSteps == 0);
            CHECK(parameterChecksum(policy.get()) == doctest::Approx(before));
        }

        SUBCASE("Every decision becomes one example and one step is taken")
        {
            TrajectoryTrainer trainer(policy, chatTemplate, TrajectoryTrainerConfig(), metrics);
            auto trajectory = makeTrajectory({"CLICK 100 200", "TYPE hello", "DONE"});
            trajectory.observe(torch::rand({3, 8, 8}), 10.0);

            auto before = parameterChecksum(policy.get());
            auto result = trainer.trainOnTrajectory(trajectory, task);

            CHECK(result.trained);
            CHECK(result.examples == 3);
            CHECK(result.usableExamples == 3);
            CHECK(result.skippedExamples == 0);
            CHECK(result.maskedTokens == 13 + 10 + 4);
            CHECK(result.trajectoryLength == 7);
            CHECK(result.meanLoss > 0);
            CHECK(trainer.getState().trainSteps == 1);
            CHECK(parameterChecksum(policy.get()) != doctest::Approx(before));
            CHECK_FALSE(policy->is_training());
        }

        SUBCASE("Examples whose target matches nothing are skipped")
        {
            TrajectoryTrainer trainer(policy, chatTemplate, TrajectoryTrainerConfig(), metrics);
            auto result = trainer.trainOnTrajectory(makeTrajectory({"", "CLICK 5 5"}), task);

            CHECK(result.trained);
            CHECK(result.usableExamples == 1);
            CHECK(result.skippedExamples == 1);
            CHECK(result.maskedTokens == 9);
        }

        SUBCASE("Assembly failures skip only the affected examples")
        {
            TrajectoryTrainerConfig config;
            config.windowSize = 1;
            TrajectoryTrainer trainer(policy, chatTemplate, config, metrics);

            auto result = trainer.trainOnTrajectory(makeTrajectory({"CLICK 1 1", "TYPE BROKEN", "WAIT"}), task);
            CHECK(result.trained);
            CHECK(result.usableExamples == 2);
            CHECK(result.skippedExamples == 1);
        }

        SUBCASE("A trajectory whose examples all fail is not trained")
        {
            TrajectoryTrainer trainer(policy, chatTemplate, TrajectoryTrainerConfig(), metrics);
            auto before = parameterChecksum(policy.get());

            auto result = trainer.trainOnTrajectory(makeTrajectory({"TYPE BROKEN", "WAIT"}), task);

            CHECK_FALSE(result.trained);
            CHECK(result.reason == "no usable examples");
            CHECK(result.skippedExamples == 2);
            CHECK(parameterChecksum(policy.get()) == doctest::Approx(before));
            CHECK_FALSE(policy->is_training());
        }

        SUBCASE("The reported gradient norm is the clipped one")
        {
            TrajectoryTrainerConfig config;
            config.maxGradNorm = 1e-4;
            TrajectoryTrainer trainer(policy, chatTemplate, config, metrics);

            auto result = trainer.trainOnTrajectory(makeTrajectory({"CLICK 300 400", "DONE"}), task);

            REQUIRE(result.trained);
            CHECK(result.rawGradNorm > config.maxGradNorm);
            CHECK(result.gradNorm == doctest::Approx(config.maxGradNorm).epsilon(1e-3));
        }

        SUBCASE("Running average covers every successful call")
        {
            TrajectoryTrainer trainer(policy, chatTemplate, TrajectoryTrainerConfig(), metrics);
            auto first = trainer.trainOnTrajectory(makeTrajectory({"CLICK 1 2"}), task);
            auto second = trainer.trainOnTrajectory(makeTrajectory({"KEY enter", "DONE"}), task);
            trainer.trainOnTrajectory(Trajectory(), task);

            CHECK(trainer.getState().trainSteps == 2);
            CHECK(trainer.getState().averageLoss() == doctest::Approx((first.meanLoss + second.meanLoss) / 2));
            CHECK(second.averageLoss == doctest::Approx(trainer.getState().averageLoss()));
        }

        SUBCASE("Repeated training lowers the loss on the same trajectory")
        {
            TrajectoryTrainerConfig config;
            config.learningRate = 1e-2;
            TrajectoryTrainer trainer(policy, chatTemplate, config, metrics);
            auto trajectory = makeTrajectory({"CLICK 120 340", "DONE"});

            auto first = trainer.trainOnTrajectory(trajectory, task);
            TrajectoryTrainResult last;
            for (int i = 0; i < 15; ++i)
            {
                last = trainer.trainOnTrajectory(trajectory, task);
            }
            CHECK(last.meanLoss < first.meanLoss);
        }

        SUBCASE("Counters and optimizer state survive save and load")
        {
            auto path = (std::filesystem::temp_directory_path() / "glimpserl_trajectory_state.pt").string();
            TrajectoryTrainer trainer(policy, chatTemplate, TrajectoryTrainerConfig(), metrics);
            trainer.trainOnTrajectory(makeTrajectory({"CLICK 9 9"}), task);
            trainer.saveState(path);

            TrajectoryTrainer resumed(policy, chatTemplate, TrajectoryTrainerConfig(), metrics);
            resumed.loadState(path);
            CHECK(resumed.getState().trainSteps == 1);
            CHECK(resumed.getState().totalLoss == doctest::Approx(trainer.getState().totalLoss));

            auto result = resumed.trainOnTrajectory(makeTrajectory({"DONE"}), task);
            CHECK(result.trainSteps == 2);

            std::filesystem::remove(path);
            CHECK_THROWS_AS(resumed.loadState(path), std::runtime_error);
        }

        SUBCASE("Malformed configuration is fatal")
        {
            TrajectoryTrainerConfig config;
            config.windowSize = 0;
            CHECK_THROWS_AS(TrajectoryTrainer(policy, chatTemplate, config, metrics), std::invalid_argument);
        }
    }
}
