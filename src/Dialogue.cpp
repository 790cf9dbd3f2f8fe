#include<stdexcept>

#include<spdlog/fmt/fmt.h>

#include"../include/Dialogue.hpp"

#include<doctest/doctest.h>

namespace Glimpse
{
    const char *roleName(Role role)
    {
        switch (role)
        {
            case Role::System:
                return "system";
            case Role::User:
                return "user";
            case Role::Assistant:
                return "assistant";
        }
        return "unknown";
    }

    std::string systemInstruction(const std::string &task)
    {
        return "You control a browser. Each turn you see a screenshot.\n"
               "\n"
               "First describe what you see, then choose an action.\n"
               "\n"
               "Output format (exactly two lines):\n"
               "SEE: <brief description of visible elements, their labels, positions, and any changes from last frame>\n"
               "ACTION: <one action>\n"
               "\n"
               "Actions (normalized 0-1000 coordinates):\n"
               "- CLICK x y - Click at coordinates\n"
               "- TYPE text - Type text into focused input\n"
               "- KEY keyname - Press key (enter, tab, escape, etc)\n"
               "- SCROLL dy - Scroll (positive=down, negative=up)\n"
               "- WAIT - Wait and observe (nothing to do yet)\n"
               "- DONE - Task complete\n"
               "\n"
               "Task: " + task;
    }

    Dialogue buildDialogue(const std::vector<TrajectoryEntry> &entries, const std::string &task)
    {
        Dialogue dialogue;
        dialogue.reserve(entries.size() + 1);
        dialogue.push_back({Role::System, systemInstruction(task), torch::Tensor()});

        const double startTime = entries.empty() ? 0.0 : entries.front().timestamp;
        for (const auto &entry : entries)
        {
            if (entry.isObservation())
            {
                if (!entry.frame.defined())
                {
                    throw std::invalid_argument("Observation at t=" + std::to_string(entry.timestamp) +
                                                " has no frame");
                }
                dialogue.push_back({Role::User,
                                    fmt::format("[t={:.2f}s]", entry.timestamp - startTime),
                                    entry.frame});
            }
            else
            {
                dialogue.push_back({Role::Assistant, entry.text, torch::Tensor()});
            }
        }
        return dialogue;
    }

    ChatTemplate::ChatTemplate(const Tokenizer &tokenizer) :
    tokenizer(tokenizer),
    turnStartId(tokenizer.specialTokenId(ByteTokenizer::TurnStart)),
    turnEndId(tokenizer.specialTokenId(ByteTokenizer::TurnEnd)),
    imageId(tokenizer.specialTokenId(ByteTokenizer::Image))
    {
    }

    TokenizedDialogue ChatTemplate::encode(const Dialogue &dialogue) const
    {
        TokenizedDialogue result;
        std::vector<int64_t> ids;
        const auto newline = tokenizer.encode("\n");

        auto append = [&ids](const std::vector<int64_t> &tokens)
        {
            ids.insert(ids.end(), tokens.begin(), tokens.end());
        };

        for (const auto &turn : dialogue)
        {
            ids.push_back(turnStartId);
            append(tokenizer.encode(std::string(roleName(turn.role)) + "\n"));

            TurnSpan span{turn.role, static_cast<int64_t>(ids.size()), 0};
            if (turn.frame.defined())
            {
                result.imagePositions.push_back(static_cast<int64_t>(ids.size()));
                result.frames.push_back(turn.frame);
                ids.push_back(imageId);
            }
            append(tokenizer.encode(turn.text));
            span.end = static_cast<int64_t>(ids.size());
            result.turns.push_back(span);

            ids.push_back(turnEndId);
            append(newline);
        }

        result.inputIds = torch::tensor(ids, torch::TensorOptions(torch::kLong));
        return result;
    }

    DecisionMarker ChatTemplate::decisionMarker() const
    {
        return {turnStartId, tokenizer.encode(std::string(roleName(Role::Assistant)) + "\n"), turnEndId};
    }

    /**
     * @brief Builds a three-step browsing trajectory with 3x8x8 frames
     */
    static Trajectory sampleTrajectory(const std::vector<std::string> &decisions)
    {
        Trajectory trajectory;
        double time = 10.0;
        for (const auto &decision : decisions)
        {
            trajectory.observe(torch::rand({3, 8, 8}), time);
            trajectory.decide(decision, time + 0.5);
            time += 1.25;
        }
        return trajectory;
    }

    TEST_CASE("buildDialogue()")
    {
        auto trajectory = sampleTrajectory({"CLICK 100 200", "TYPE hello"});
        auto dialogue = buildDialogue(trajectory.getEntries(), "Log in");

        SUBCASE("One system turn, then one turn per entry")
        {
            REQUIRE(dialogue.size() == 5);
            CHECK(dialogue[0].role == Role::System);
            CHECK(dialogue[1].role == Role::User);
            CHECK(dialogue[2].role == Role::Assistant);
            CHECK(dialogue[2].text == "CLICK 100 200");
            CHECK(dialogue[4].text == "TYPE hello");
        }

        SUBCASE("The system turn ends with the task")
        {
            const auto &text = dialogue[0].text;
            CHECK(text.substr(text.size() - 12) == "Task: Log in");
        }

        SUBCASE("Observation turns carry the frame and the time offset")
        {
            CHECK(dialogue[1].frame.defined());
            CHECK(dialogue[1].text == "[t=0.00s]");
            CHECK(dialogue[3].text == "[t=1.25s]");
            CHECK_FALSE(dialogue[2].frame.defined());
        }

        SUBCASE("An observation without a frame is rejected")
        {
            Trajectory broken;
            broken.observe(torch::Tensor(), 0.0).decide("WAIT", 0.1);
            CHECK_THROWS_AS(buildDialogue(broken.getEntries(), "task"), std::invalid_argument);
        }
    }

    TEST_CASE("ChatTemplate")
    {
        ByteTokenizer tokenizer;
        ChatTemplate chatTemplate(tokenizer);

        std::vector<std::string> decisions{"CLICK 100 200", "TYPE hello", "DONE"};
        auto trajectory = sampleTrajectory(decisions);
        auto tokenized = chatTemplate.encode(buildDialogue(trajectory.getEntries(), "Fill the form"));

        SUBCASE("Turn spans cover exactly the turn content")
        {
            REQUIRE(tokenized.turns.size() == 7);
            auto ids = tokenized.inputIds;
            const auto &decisionSpan = tokenized.turns[2];
            CHECK(decisionSpan.role == Role::Assistant);

            std::vector<int64_t> content(ids.data_ptr<int64_t>() + decisionSpan.begin,
                                         ids.data_ptr<int64_t>() + decisionSpan.end);
            CHECK(tokenizer.decode(content) == "CLICK 100 200");
            CHECK(ids[decisionSpan.end].item<int64_t>() == tokenizer.specialTokenId(ByteTokenizer::TurnEnd));
        }

        SUBCASE("Every frame has an image token")
        {
            REQUIRE(tokenized.frames.size() == 3);
            REQUIRE(tokenized.imagePositions.size() == 3);
            for (auto position : tokenized.imagePositions)
            {
                CHECK(tokenized.inputIds[position].item<int64_t>() == chatTemplate.getImageTokenId());
            }
        }

        SUBCASE("All-decisions mask equals the sum of the decision lengths")
        {
            auto mask = maskAllDecisions(tokenized.inputIds, chatTemplate.decisionMarker());

            int64_t expected = 0;
            for (const auto &decision : decisions)
            {
                expected += static_cast<int64_t>(tokenizer.encode(decision).size());
            }
            CHECK(maskedTokenCount(mask) == expected);
        }

        SUBCASE("All-decisions mask agrees with the structural assistant spans")
        {
            auto mask = maskAllDecisions(tokenized.inputIds, chatTemplate.decisionMarker());
            auto structural = torch::zeros_like(mask);
            for (const auto &span : tokenized.turns)
            {
                if (span.role == Role::Assistant)
                {
                    structural.narrow(0, span.begin, span.end - span.begin).fill_(1.f);
                }
            }
            CHECK(torch::equal(mask, structural));
        }

        SUBCASE("Final-occurrence mask selects the repeated action's last turn")
        {
            auto repeated = sampleTrajectory({"CLICK 500 500", "CLICK 500 500"});
            auto encoded = chatTemplate.encode(buildDialogue(repeated.getEntries(), "Click twice"));
            auto mask = maskFinalOccurrence(encoded.inputIds, tokenizer.encode("CLICK 500 500"));

            const auto &first = encoded.turns[2];
            const auto &last = encoded.turns[4];
            REQUIRE(last.role == Role::Assistant);
            CHECK(maskedTokenCount(mask) == last.end - last.begin);
            CHECK(mask.narrow(0, last.begin, last.end - last.begin).sum().item<float>() ==
                  doctest::Approx(last.end - last.begin));
            CHECK(mask.narrow(0, first.begin, first.end - first.begin).sum().item<float>() == 0.f);
        }

        SUBCASE("An action that only appears in the instructions still targets its own turn")
        {
            auto done = sampleTrajectory({"DONE"});
            auto encoded = chatTemplate.encode(buildDialogue(done.getEntries(), "Finish"));
            auto mask = maskFinalOccurrence(encoded.inputIds, tokenizer.encode("DONE"));
            const auto &decision = encoded.turns[2];
            CHECK(maskedTokenCount(mask) == 4);
            CHECK(mask[decision.begin].item<float>() == 1.f);
        }
    }
}
