#include<chrono>
#include<filesystem>
#include<fstream>
#include<stdexcept>

#include<spdlog/sinks/basic_file_sink.h>

#include"../include/MetricsLogger.hpp"

#include<doctest/doctest.h>

namespace Glimpse
{
    MetricsLogger::MetricsLogger(const std::string &path, bool echoToConsole) :
    path(path),
    echoToConsole(echoToConsole)
    {
        if (path.empty())
        {
            return;
        }

        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent);
        }

        // Not registered globally, so several loggers may share one process
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
        fileLogger = std::make_shared<spdlog::logger>("metrics:" + path, sink);
        fileLogger->set_pattern("%v");
        fileLogger->set_level(spdlog::level::info);
        fileLogger->flush_on(spdlog::level::info);
    }

    nlohmann::json MetricsLogger::log(const std::string &event, const nlohmann::json &payload)
    {
        if (!payload.is_object())
        {
            throw std::invalid_argument("Metrics payload for '" + event + "' must be a JSON object");
        }

        auto now = std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch());
        nlohmann::json record = {{"timestamp", now.count()}, {"event", event}};
        for (const auto &field : payload.items())
        {
            record[field.key()] = field.value();
        }

        auto line = record.dump();
        if (echoToConsole)
        {
            spdlog::info("{}", line);
        }
        if (fileLogger)
        {
            fileLogger->info("{}", line);
        }
        return record;
    }

    TEST_CASE("MetricsLogger")
    {
        SUBCASE("Records carry timestamp and event ahead of the payload")
        {
            MetricsLogger logger("", false);
            auto record = logger.log("grpo_train", {{"loss", 0.5}, {"trained", true}});

            CHECK(record["event"] == "grpo_train");
            CHECK(record["timestamp"].get<double>() > 0);
            CHECK(record["loss"].get<double>() == doctest::Approx(0.5));
            CHECK(record["trained"].get<bool>());
        }

        SUBCASE("Non-object payloads are rejected")
        {
            MetricsLogger logger("", false);
            CHECK_THROWS_AS(logger.log("bad", nlohmann::json::array({1, 2})), std::invalid_argument);
        }

        SUBCASE("Records are appended to the file one per line")
        {
            auto directory = std::filesystem::temp_directory_path() / "glimpserl_metrics_test";
            std::filesystem::remove_all(directory);
            auto file = directory / "nested" / "metrics.jsonl";
            {
                MetricsLogger logger(file.string(), false);
                logger.log("trajectory_train", {{"examples", 3}});
                logger.log("correction_inject", {{"loss", 1.25}});
            }

            std::ifstream input(file);
            std::string first, second;
            REQUIRE(static_cast<bool>(std::getline(input, first)));
            REQUIRE(static_cast<bool>(std::getline(input, second)));

            auto parsed = nlohmann::json::parse(first);
            CHECK(parsed["event"] == "trajectory_train");
            CHECK(parsed["examples"] == 3);
            CHECK(nlohmann::json::parse(second)["event"] == "correction_inject");

            input.close();
            std::filesystem::remove_all(directory);
        }
    }
}
