#pragma once

#ifndef GLIMPSERL_METRICSLOGGER_HPP
#define GLIMPSERL_METRICSLOGGER_HPP

#include<memory>
#include<string>

#include<nlohmann/json.hpp>
#include<spdlog/spdlog.h>

namespace Glimpse
{
    /**
     * @brief JSON-lines structured metrics
     *
     * Every record is one JSON object `{"timestamp": <unix seconds>,
     * "event": <name>, ...payload}` on its own line. Records go to the
     * default spdlog logger at info level and, when a path is given, are
     * appended to that file through a dedicated file sink.
     */
    class MetricsLogger
    {
    private:
        std::string path;
        bool echoToConsole;
        std::shared_ptr<spdlog::logger> fileLogger;

    public:
        /**
         * @param path JSON-lines file to append to, empty for console only;
         *             missing parent directories are created
         * @param echoToConsole Also emit every record through spdlog::info
         * @throws spdlog::spdlog_ex if the file cannot be opened
         */
        explicit MetricsLogger(const std::string &path = "", bool echoToConsole = true);

        /**
         * @brief Writes one record
         *
         * @param payload JSON object whose fields are merged after
         *                `timestamp` and `event`
         * @return The record as written
         * @throws std::invalid_argument if `payload` is not an object
         */
        nlohmann::json log(const std::string &event, const nlohmann::json &payload);

        inline const std::string &getPath() const
        {
            return path;
        }
    };
}

#endif //GLIMPSERL_METRICSLOGGER_HPP
