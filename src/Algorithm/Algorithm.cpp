//
// Shared trainer plumbing: update sessions, optimizer steps and trainer state.
//

#include<filesystem>
#include<stdexcept>

#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../../include/Algorithms/Algorithm.hpp"
#include"../../include/Model/VisionLanguagePolicy.hpp"
#include"../../include/Model/modelUtils.hpp"

#include<doctest/doctest.h>

namespace Glimpse
{
    UpdateSession::UpdateSession(SharedPolicy &policy) : lock(policy.acquire()), model(policy.get())
    {
        model.train();
        model.zero_grad();
    }

    UpdateSession::~UpdateSession()
    {
        model.eval();
    }

    PolicyTrainer::PolicyTrainer(SharedPolicy &policy,
                                 const ChatTemplate &chatTemplate,
                                 double learningRate,
                                 double weightDecay,
                                 double maxGradNorm,
                                 std::shared_ptr<MetricsLogger> metricsLogger) :
    policy(policy),
    chatTemplate(chatTemplate),
    parameters(trainableParameters(policy.get())),
    metricsLogger(metricsLogger ? std::move(metricsLogger) : std::make_shared<MetricsLogger>()),
    maxGradNorm(maxGradNorm)
    {
        if (parameters.empty())
        {
            throw std::invalid_argument("Policy has no trainable parameters");
        }
        optimizer = std::make_unique<torch::optim::AdamW>(
            parameters,
            torch::optim::AdamWOptions(learningRate).weight_decay(weightDecay));
    }

    TokenizedDialogue PolicyTrainer::encodeEntries(const std::vector<TrajectoryEntry> &entries,
                                                   const std::string &task) const
    {
        return chatTemplate.encode(buildDialogue(entries, task));
    }

    torch::Tensor PolicyTrainer::sequenceLoss(const TokenizedDialogue &dialogue, const torch::Tensor &mask)
    {
        auto logits = policy->forward(dialogue);
        return maskedTokenLoss(logits, dialogue.inputIds, mask);
    }

    StepNorms PolicyTrainer::clipAndStep()
    {
        StepNorms norms;
        norms.raw = torch::nn::utils::clip_grad_norm_(parameters, maxGradNorm);
        norms.clipped = gradientNorm(parameters);
        optimizer->step();
        optimizerStepped = true;
        return norms;
    }

    void PolicyTrainer::logMetrics(const std::string &event, const nlohmann::json &payload)
    {
        metricsLogger->log(event, payload);
    }

    void PolicyTrainer::saveState(const std::string &path) const
    {
        torch::serialize::OutputArchive archive;
        archive.write("hasOptimizerState", torch::tensor(optimizerStepped));
        if (optimizerStepped)
        {
            torch::serialize::OutputArchive optimizerArchive;
            optimizer->save(optimizerArchive);
            archive.write("optimizer", optimizerArchive);
        }
        saveCounters(archive);

        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent);
        }
        archive.save_to(path);
        spdlog::debug("Saved trainer state to {}", path);
    }

    void PolicyTrainer::loadState(const std::string &path)
    {
        if (!std::filesystem::exists(path))
        {
            throw std::runtime_error("Trainer state " + path + " does not exist");
        }

        torch::serialize::InputArchive archive;
        archive.load_from(path);

        torch::Tensor hasOptimizerState;
        archive.read("hasOptimizerState", hasOptimizerState);
        if (hasOptimizerState.item<bool>())
        {
            torch::serialize::InputArchive optimizerArchive;
            archive.read("optimizer", optimizerArchive);
            optimizer->load(optimizerArchive);
            optimizerStepped = true;
        }
        loadCounters(archive);
        spdlog::debug("Loaded trainer state from {}", path);
    }

    std::vector<UpdateDatum> toUpdateData(const nlohmann::json &record)
    {
        std::vector<UpdateDatum> data;
        for (const auto &field : record.items())
        {
            const auto &value = field.value();
            if (value.is_boolean())
            {
                data.push_back({field.key(), value.get<bool>() ? 1.f : 0.f});
            }
            else if (value.is_number())
            {
                data.push_back({field.key(), value.get<float>()});
            }
        }
        return data;
    }

    TEST_CASE("UpdateSession")
    {
        ByteTokenizer tokenizer;
        SharedPolicy policy(std::make_shared<VisionLanguagePolicy>(tokenizer.vocabularySize(),
                                                                   tokenizer.specialTokenId(ByteTokenizer::Image),
                                                                   3, 8, 16));

        SUBCASE("The model trains inside the session and evaluates after it")
        {
            CHECK_FALSE(policy->is_training());
            {
                UpdateSession session(policy);
                CHECK(policy->is_training());
            }
            CHECK_FALSE(policy->is_training());
        }

        SUBCASE("Stale gradients are cleared on entry")
        {
            for (auto &parameter : policy->parameters())
            {
                parameter.mutable_grad() = torch::ones_like(parameter);
            }
            UpdateSession session(policy);
            CHECK(gradientNorm(policy->parameters()) == doctest::Approx(0));
        }

        SUBCASE("Evaluation mode is restored when the call throws")
        {
            auto failingCall = [&policy]()
            {
                UpdateSession session(policy);
                throw std::runtime_error("forward failed");
            };
            CHECK_THROWS_AS(failingCall(), std::runtime_error);
            CHECK_FALSE(policy->is_training());
        }
    }

    TEST_CASE("toUpdateData()")
    {
        nlohmann::json record = {{"trained", true},
                                 {"loss", 0.25},
                                 {"reason", "ignored"},
                                 {"rewards", {1, 2}},
                                 {"train_steps", 3}};
        auto data = toUpdateData(record);

        REQUIRE(data.size() == 3);
        for (const auto &datum : data)
        {
            if (datum.name == "trained")
            {
                CHECK(datum.value == 1.f);
            }
            else if (datum.name == "loss")
            {
                CHECK(datum.value == doctest::Approx(0.25));
            }
            else
            {
                CHECK(datum.name == "train_steps");
                CHECK(datum.value == 3.f);
            }
        }
    }
}
