/**
 * @file GroupRelativeTrainer.cpp
 * @brief Group-relative advantage updates over rollouts of the same task
 *
 * Rewards of a rollout group are turned into z-scored advantages and each
 * rollout's decision tokens are weighted by its advantage. The tail of the
 * group can be held out and scored without gradients after the update.
 *
 * A group whose advantages are all below the significance threshold never
 * reaches the optimizer, so equal rewards leave the policy untouched.
 */

#include<algorithm>
#include<cmath>
#include<filesystem>
#include<numeric>
#include<stdexcept>
#include<tuple>

#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../../include/Algorithms/GroupRelativeTrainer.hpp"
#include"../../include/Model/VisionLanguagePolicy.hpp"
#include"../../include/Model/modelUtils.hpp"
#include"../../include/SpanMasker.hpp"

#include<doctest/doctest.h>

namespace Glimpse
{
    nlohmann::json GroupTrainResult::toJson() const
    {
        nlohmann::json record = {{"trained", trained}};
        if (!trained)
        {
            record["reason"] = reason;
        }
        record["rewards"] = rewards;
        record["reward_mean"] = rewardMean;
        record["reward_std"] = rewardStd;
        record["reward_variance"] = rewardStd * rewardStd;
        record["num_rollouts"] = rollouts;
        record["train_rollouts"] = trainRollouts;
        record["val_rollouts"] = validationRollouts;
        record["advantages_used"] = usedRollouts;
        record["skipped_rollouts"] = skippedRollouts;
        record["action_tokens"] = actionTokens;
        record["loss"] = loss;
        record["grad_norm"] = gradNorm;
        record["raw_grad_norm"] = rawGradNorm;
        record["advantage_threshold"] = advantageThreshold;
        record["min_advantage_std"] = minAdvantageStd;
        record["val_fraction"] = validationFraction;
        record["train_steps"] = trainSteps;
        if (validation)
        {
            record["validation"] = {{"val_loss", validation->loss},
                                    {"val_perplexity", validation->perplexity},
                                    {"val_batches", validation->rollouts},
                                    {"val_tokens", validation->tokens}};
        }
        return record;
    }

    std::vector<UpdateDatum> GroupTrainResult::toUpdateData() const
    {
        auto record = toJson();
        auto data = Glimpse::toUpdateData(record);
        if (validation)
        {
            auto validationData = Glimpse::toUpdateData(record["validation"]);
            data.insert(data.end(), validationData.begin(), validationData.end());
        }
        return data;
    }

    namespace
    {
        const GroupTrainerConfig &validated(const GroupTrainerConfig &config)
        {
            config.validate();
            return config;
        }
    }

    GroupRelativeTrainer::GroupRelativeTrainer(SharedPolicy &policy,
                                               const ChatTemplate &chatTemplate,
                                               const GroupTrainerConfig &config,
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

    std::vector<double> GroupRelativeTrainer::computeAdvantages(const std::vector<float> &rewards) const
    {
        std::vector<double> advantages(rewards.size(), 0.0);
        if (rewards.size() < 2)
        {
            return advantages;
        }

        auto values = torch::tensor(rewards, torch::kFloat).to(torch::kDouble);
        auto deviation = values.std().item<double>();
        if (deviation < config.minAdvantageStd)
        {
            return advantages;
        }

        // (R - mean) / (std + eps)
        auto normalized = (values - values.mean()) / (deviation + 1e-8);
        for (size_t i = 0; i < rewards.size(); ++i)
        {
            advantages[i] = normalized[static_cast<int64_t>(i)].item<double>();
        }
        return advantages;
    }

    std::pair<size_t, size_t> GroupRelativeTrainer::splitSizes(size_t count) const
    {
        if (config.validationFraction <= 0 || count < 2)
        {
            return {count, 0};
        }

        auto held = std::max<size_t>(1, static_cast<size_t>(static_cast<double>(count) * config.validationFraction));
        if (held >= count)
        {
            return {count, 0};
        }
        return {count - held, held};
    }

    GroupTrainResult GroupRelativeTrainer::trainStep(const std::vector<Rollout> &rollouts, const std::string &task)
    {
        GroupTrainResult result;
        result.advantageThreshold = config.advantageThreshold;
        result.minAdvantageStd = config.minAdvantageStd;
        result.validationFraction = config.validationFraction;
        result.trainSteps = trainSteps;

        std::vector<const Rollout *> group;
        for (const auto &rollout : rollouts)
        {
            if (rollout.trajectory.empty())
            {
                spdlog::warn("Dropping rollout with an empty trajectory for '{}'", task);
                continue;
            }
            group.push_back(&rollout);
            result.rewards.push_back(rollout.reward);
        }

        result.rollouts = static_cast<int64_t>(group.size());
        if (group.empty())
        {
            result.reason = "no rollouts provided";
            spdlog::info("No rollouts for '{}', nothing to train", task);
            return result;
        }

        auto rewards = torch::tensor(result.rewards, torch::kFloat).to(torch::kDouble);
        result.rewardMean = rewards.mean().item<double>();
        result.rewardStd = group.size() > 1 ? rewards.std(false).item<double>() : 0.0;

        size_t trainCount, validationCount;
        std::tie(trainCount, validationCount) = splitSizes(group.size());
        result.trainRollouts = static_cast<int64_t>(trainCount);
        result.validationRollouts = static_cast<int64_t>(validationCount);

        std::vector<float> trainRewards(result.rewards.begin(), result.rewards.begin() + trainCount);
        result.advantages = computeAdvantages(trainRewards);

        // A zero advantage carries no signal whatever the threshold
        bool significant = false;
        for (auto advantage : result.advantages)
        {
            significant = significant || (advantage != 0 && std::abs(advantage) >= config.advantageThreshold);
        }
        if (!significant)
        {
            result.reason = "no variance in rewards";
            spdlog::info("Rewards for '{}' have no usable variance (mean {:.3f}, std {:.3f}), skipping update",
                         task, result.rewardMean, result.rewardStd);
            return result;
        }

        UpdateSession session(policy);
        const auto marker = chatTemplate.decisionMarker();
        const auto n = static_cast<double>(trainCount);
        double weightedLoss = 0;

        for (size_t i = 0; i < trainCount; ++i)
        {
            auto advantage = result.advantages[i];
            if (advantage == 0 || std::abs(advantage) < config.advantageThreshold)
            {
                ++result.skippedRollouts;
                continue;
            }

            TokenizedDialogue dialogue;
            torch::Tensor mask;
            try
            {
                dialogue = encodeEntries(group[i]->trajectory.getEntries(), task);
                mask = maskAllDecisions(dialogue.inputIds, marker);
            }
            catch (const std::exception &error)
            {
                spdlog::warn("Skipping rollout {} of '{}': {}", i, task, error.what());
                ++result.skippedRollouts;
                continue;
            }

            auto tokens = maskedTokenCount(mask);
            if (tokens == 0)
            {
                spdlog::warn("Skipping rollout {} of '{}': no decision tokens", i, task);
                ++result.skippedRollouts;
                continue;
            }

            auto loss = sequenceLoss(dialogue, mask);
            (loss * (advantage / n)).backward();

            auto value = loss.item<double>();
            spdlog::debug("Rollout {}: reward {:.3f}, advantage {:.3f}, {} tokens, loss {:.4f}",
                          i, group[i]->reward, advantage, tokens, value);
            weightedLoss += advantage * value;
            result.actionTokens += tokens;
            ++result.usedRollouts;
        }

        if (result.usedRollouts == 0)
        {
            result.reason = "no valid rollouts after filtering";
            spdlog::warn("No valid rollouts for '{}' after filtering, skipping update", task);
            return result;
        }

        auto norms = clipAndStep();
        ++trainSteps;

        result.trained = true;
        result.loss = weightedLoss / static_cast<double>(result.usedRollouts);
        result.gradNorm = norms.clipped;
        result.rawGradNorm = norms.raw;
        result.trainSteps = trainSteps;

        if (validationCount > 0)
        {
            std::vector<const Rollout *> heldOut(group.begin() + trainCount, group.end());
            auto metrics = evaluate(heldOut, task);
            if (metrics.rollouts > 0)
            {
                result.validation = metrics;
            }
        }

        spdlog::info("Group step {}: {}/{} rollouts used, reward mean {:.3f}, loss {:.4f}, grad norm {:.4f}",
                     trainSteps, result.usedRollouts, result.trainRollouts, result.rewardMean, result.loss,
                     result.gradNorm);
        logMetrics("grpo_train", result.toJson());
        return result;
    }

    ValidationMetrics GroupRelativeTrainer::evaluate(const std::vector<const Rollout *> &rollouts,
                                                     const std::string &task)
    {
        torch::NoGradGuard guard;
        policy->eval();

        ValidationMetrics metrics;
        const auto marker = chatTemplate.decisionMarker();
        double totalLoss = 0;

        for (const auto *rollout : rollouts)
        {
            TokenizedDialogue dialogue;
            torch::Tensor mask;
            try
            {
                dialogue = encodeEntries(rollout->trajectory.getEntries(), task);
                mask = maskAllDecisions(dialogue.inputIds, marker);
            }
            catch (const std::exception &error)
            {
                spdlog::warn("Skipping validation rollout of '{}': {}", task, error.what());
                continue;
            }

            auto tokens = maskedTokenCount(mask);
            if (tokens == 0)
            {
                continue;
            }

            totalLoss += sequenceLoss(dialogue, mask).item<double>();
            metrics.tokens += tokens;
            ++metrics.rollouts;
        }

        if (metrics.rollouts > 0)
        {
            metrics.loss = totalLoss / static_cast<double>(metrics.rollouts);
            metrics.perplexity = std::exp(metrics.loss);
        }
        return metrics;
    }

    void GroupRelativeTrainer::saveCounters(torch::serialize::OutputArchive &archive) const
    {
        archive.write("trainSteps", torch::tensor(trainSteps));
    }

    void GroupRelativeTrainer::loadCounters(torch::serialize::InputArchive &archive)
    {
        torch::Tensor steps;
        archive.read("trainSteps", steps);
        trainSteps = steps.item<int64_t>();
    }

    namespace
    {
        Rollout makeRollout(const std::vector<std::string> &decisions, float reward)
        {
            Rollout rollout;
            double timestamp = 0;
            for (const auto &decision : decisions)
            {
                rollout.trajectory.observe(torch::rand({3, 8, 8}), timestamp).decide(decision, timestamp + 0.5);
                timestamp += 1;
            }
            rollout.reward = reward;
            return rollout;
        }

        std::vector<Rollout> makeGroup(const std::vector<float> &rewards)
        {
            std::vector<Rollout> group;
            for (size_t i = 0; i < rewards.size(); ++i)
            {
                group.push_back(makeRollout({"CLICK " + std::to_string(100 * i) + " 200", "DONE"}, rewards[i]));
            }
            return group;
        }
    }

    TEST_CASE("GroupRelativeTrainer")
    {
        torch::manual_seed(0);
        ByteTokenizer tokenizer;
        ChatTemplate chatTemplate(tokenizer);
        SharedPolicy policy(std::make_shared<VisionLanguagePolicy>(tokenizer.vocabularySize(),
                                                                   chatTemplate.getImageTokenId(),
                                                                   3, 16, 32));
        auto metrics = std::make_shared<MetricsLogger>("", false);
        const std::string task = "Submit the form";

        SUBCASE("Advantages are z-scores with the sample standard deviation")
        {
            GroupRelativeTrainer trainer(policy, chatTemplate, GroupTrainerConfig(), metrics);
            auto advantages = trainer.computeAdvantages({0, 0, 1, 1});

            REQUIRE(advantages.size() == 4);
            auto expected = 0.5 / std::sqrt(1.0 / 3.0);
            CHECK(advantages[0] == doctest::Approx(-expected).epsilon(1e-5));
            CHECK(advantages[3] == doctest::Approx(expected).epsilon(1e-5));
            CHECK(std::accumulate(advantages.begin(), advantages.end(), 0.0) == doctest::Approx(0));

            CHECK(trainer.computeAdvantages({2.5}) == std::vector<double>{0.0});
            CHECK(trainer.computeAdvantages({}).empty());
            CHECK(trainer.computeAdvantages({1, 1, 1}) == std::vector<double>(3, 0.0));
        }

        SUBCASE("The held-out tail follows the validation fraction")
        {
            GroupRelativeTrainer trainer(policy, chatTemplate, GroupTrainerConfig(), metrics);
            CHECK(trainer.splitSizes(5) == std::make_pair<size_t, size_t>(4, 1));
            CHECK(trainer.splitSizes(10) == std::make_pair<size_t, size_t>(8, 2));
            CHECK(trainer.splitSizes(3) == std::make_pair<size_t, size_t>(2, 1));
            CHECK(trainer.splitSizes(1) == std::make_pair<size_t, size_t>(1, 0));

            GroupTrainerConfig noValidation;
            noValidation.validationFraction = 0;
            GroupRelativeTrainer plain(policy, chatTemplate, noValidation, metrics);
            CHECK(plain.splitSizes(5) == std::make_pair<size_t, size_t>(5, 0));
        }

        SUBCASE("An empty group is not trained")
        {
            GroupRelativeTrainer trainer(policy, chatTemplate, GroupTrainerConfig(), metrics);
            auto result = trainer.trainStep({}, task);
            CHECK_FALSE(result.trained);
            CHECK(result.reason == "no rollouts provided");
        }

        SUBCASE("Equal rewards leave the parameters untouched")
        {
            GroupRelativeTrainer trainer(policy, chatTemplate, GroupTrainerConfig(), metrics);
            auto before = parameterChecksum(policy.get());

            auto result = trainer.trainStep(makeGroup({0.5f, 0.5f, 0.5f, 0.5f}), task);

            CHECK_FALSE(result.trained);
            CHECK(result.reason == "no variance in rewards");
            CHECK(result.rewards.size() == 4);
            CHECK(result.rewardMean == doctest::Approx(0.5));
            CHECK(result.rewardStd == doctest::Approx(0));
            CHECK(trainer.getTrainSteps() == 0);
            CHECK(parameterChecksum(policy.get()) == doctest::Approx(before));
        }

        SUBCASE("Equal rewards without a std floor still leave the parameters untouched")
        {
            GroupTrainerConfig config;
            config.minAdvantageStd = 0;
            config.advantageThreshold = 1e-12;
            GroupRelativeTrainer trainer(policy, chatTemplate, config, metrics);
            auto before = parameterChecksum(policy.get());

            auto result = trainer.trainStep(makeGroup({0.5f, 0.5f, 0.5f, 0.5f}), task);

            CHECK_FALSE(result.trained);
            CHECK(result.reason == "no variance in rewards");
            CHECK(result.advantages == std::vector<double>(3, 0.0));
            CHECK(result.usedRollouts == 0);
            CHECK(trainer.getTrainSteps() == 0);
            CHECK(parameterChecksum(policy.get()) == doctest::Approx(before));

            auto record = result.toJson();
            CHECK(record["min_advantage_std"].get<double>() == 0);
            CHECK(record["advantage_threshold"].get<double>() == doctest::Approx(1e-12));
        }

        SUBCASE("A zero significance threshold is refused at construction")
        {
            GroupTrainerConfig config;
            config.advantageThreshold = 0;
            CHECK_THROWS_AS(GroupRelativeTrainer(policy, chatTemplate, config, metrics), std::invalid_argument);
        }

        SUBCASE("One rollout of five is held out and advantages average to zero")
        {
            GroupRelativeTrainer trainer(policy, chatTemplate, GroupTrainerConfig(), metrics);
            auto before = parameterChecksum(policy.get());

            auto result = trainer.trainStep(makeGroup({0, 0, 1, 1, 1}), task);

            REQUIRE(result.trained);
            CHECK(result.rollouts == 5);
            CHECK(result.trainRollouts == 4);
            CHECK(result.validationRollouts == 1);
            REQUIRE(result.advantages.size() == 4);
            CHECK(std::accumulate(result.advantages.begin(), result.advantages.end(), 0.0) / 4 ==
                  doctest::Approx(0).epsilon(1e-6));
            CHECK(result.usedRollouts == 4);
            CHECK(result.skippedRollouts == 0);
            CHECK(result.rewardMean == doctest::Approx(0.6));
            CHECK(result.rewardStd == doctest::Approx(std::sqrt(0.24)));
            REQUIRE(result.validation.has_value());
            CHECK(result.validation->rollouts == 1);
            CHECK(result.validation->perplexity == doctest::Approx(std::exp(result.validation->loss)));
            CHECK(trainer.getTrainSteps() == 1);
            CHECK(parameterChecksum(policy.get()) != doctest::Approx(before));
            CHECK_FALSE(policy->is_training());
        }

        SUBCASE("Variance only in the held-out rollout does not train")
        {
            GroupRelativeTrainer trainer(policy, chatTemplate, GroupTrainerConfig(), metrics);
            auto before = parameterChecksum(policy.get());

            auto result = trainer.trainStep(makeGroup({1, 1, 1, 1, 0}), task);

            CHECK_FALSE(result.trained);
            CHECK(result.reason == "no variance in rewards");
            CHECK(result.rewardStd > 0);
            CHECK(parameterChecksum(policy.get()) == doctest::Approx(before));
        }

        SUBCASE("Rollouts with empty trajectories are dropped before statistics")
        {
            GroupTrainerConfig config;
            config.validationFraction = 0;
            GroupRelativeTrainer trainer(policy, chatTemplate, config, metrics);

            auto group = makeGroup({0, 1});
            group.push_back(Rollout{Trajectory(), 100.f});
            auto result = trainer.trainStep(group, task);

            CHECK(result.trained);
            CHECK(result.rollouts == 2);
            CHECK(result.rewardMean == doctest::Approx(0.5));
        }

        SUBCASE("Rollouts without decisions leave nothing to train")
        {
            GroupTrainerConfig config;
            config.validationFraction = 0;
            GroupRelativeTrainer trainer(policy, chatTemplate, config, metrics);
            auto before = parameterChecksum(policy.get());

            std::vector<Rollout> group(2);
            group[0].trajectory.observe(torch::rand({3, 8, 8}), 0.0);
            group[0].reward = 0;
            group[1].trajectory.observe(torch::rand({3, 8, 8}), 0.0);
            group[1].reward = 1;
            auto result = trainer.trainStep(group, task);

            CHECK_FALSE(result.trained);
            CHECK(result.reason == "no valid rollouts after filtering");
            CHECK(result.skippedRollouts == 2);
            CHECK(parameterChecksum(policy.get()) == doctest::Approx(before));
            CHECK_FALSE(policy->is_training());
        }

        SUBCASE("Rollouts below the significance threshold are counted but skipped")
        {
            GroupTrainerConfig config;
            config.validationFraction = 0;
            config.advantageThreshold = 0.5;
            GroupRelativeTrainer trainer(policy, chatTemplate, config, metrics);

            // Advantages of [0, 0.5, 1] are [-1, 0, 1]
            auto result = trainer.trainStep(makeGroup({0, 0.5f, 1}), task);

            REQUIRE(result.trained);
            CHECK(result.usedRollouts == 2);
            CHECK(result.skippedRollouts == 1);
            CHECK(result.actionTokens == (11 + 4) + (13 + 4));
        }

        SUBCASE("The reported gradient norm is the clipped one")
        {
            GroupTrainerConfig config;
            config.validationFraction = 0;
            config.maxGradNorm = 1e-4;
            GroupRelativeTrainer trainer(policy, chatTemplate, config, metrics);

            auto result = trainer.trainStep(makeGroup({0, 1, 0, 1}), task);

            REQUIRE(result.trained);
            CHECK(result.rawGradNorm > config.maxGradNorm);
            CHECK(result.gradNorm == doctest::Approx(config.maxGradNorm).epsilon(1e-3));
        }

        SUBCASE("Diagnostics flatten into update data")
        {
            GroupRelativeTrainer trainer(policy, chatTemplate, GroupTrainerConfig(), metrics);
            auto result = trainer.trainStep(makeGroup({0, 1, 0, 1, 1}), task);
            REQUIRE(result.trained);

            bool sawLoss = false, sawValidation = false;
            for (const auto &datum : result.toUpdateData())
            {
                sawLoss = sawLoss || datum.name == "loss";
                sawValidation = sawValidation || datum.name == "val_perplexity";
            }
            CHECK(sawLoss);
            CHECK(sawValidation);
        }

        SUBCASE("The step counter survives save and load")
        {
            auto path = (std::filesystem::temp_directory_path() / "glimpserl_group_state.pt").string();
            GroupRelativeTrainer trainer(policy, chatTemplate, GroupTrainerConfig(), metrics);
            trainer.trainStep(makeGroup({0, 1, 1}), task);
            trainer.trainStep(makeGroup({1, 0, 1}), task);
            trainer.saveState(path);

            GroupRelativeTrainer resumed(policy, chatTemplate, GroupTrainerConfig(), metrics);
            resumed.loadState(path);
            CHECK(resumed.getTrainSteps() == trainer.getTrainSteps());

            std::filesystem::remove(path);
        }
    }
}
