#include<cmath>
#include<stdexcept>
#include<string>

#include<spdlog/fmt/fmt.h>

#include"../include/Config.hpp"

#include<doctest/doctest.h>

namespace Glimpse
{
    namespace
    {
        void requirePositive(const char *name, double value)
        {
            if (!std::isfinite(value) || value <= 0)
            {
                throw std::invalid_argument(fmt::format("{} must be positive, got {}", name, value));
            }
        }

        void requireNonNegative(const char *name, double value)
        {
            if (!std::isfinite(value) || value < 0)
            {
                throw std::invalid_argument(fmt::format("{} must not be negative, got {}", name, value));
            }
        }
    }

    void TrajectoryTrainerConfig::validate() const
    {
        requirePositive("learningRate", learningRate);
        requireNonNegative("weightDecay", weightDecay);
        requirePositive("maxGradNorm", maxGradNorm);
        if (windowSize < 1)
        {
            throw std::invalid_argument(fmt::format("windowSize must be at least 1, got {}", windowSize));
        }
    }

    void GroupTrainerConfig::validate() const
    {
        requirePositive("learningRate", learningRate);
        requireNonNegative("weightDecay", weightDecay);
        requirePositive("advantageThreshold", advantageThreshold);
        requireNonNegative("minAdvantageStd", minAdvantageStd);
        requirePositive("maxGradNorm", maxGradNorm);
        if (!(validationFraction >= 0 && validationFraction <= 0.9))
        {
            throw std::invalid_argument(fmt::format("validationFraction must lie in [0, 0.9], got {}",
                                                    validationFraction));
        }
    }

    void CorrectionTrainerConfig::validate() const
    {
        requirePositive("learningRate", learningRate);
        requireNonNegative("weightDecay", weightDecay);
        requireNonNegative("correctWeight", correctWeight);
        requireNonNegative("wrongWeight", wrongWeight);
        requirePositive("maxGradNorm", maxGradNorm);
    }

    TEST_CASE("Trainer configuration")
    {
        SUBCASE("Defaults are valid")
        {
            CHECK_NOTHROW(TrajectoryTrainerConfig().validate());
            CHECK_NOTHROW(GroupTrainerConfig().validate());
            CHECK_NOTHROW(CorrectionTrainerConfig().validate());
        }

        SUBCASE("A window shorter than one pair is rejected")
        {
            TrajectoryTrainerConfig config;
            config.windowSize = 0;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);
        }

        SUBCASE("Learning rate and clip norm must be positive")
        {
            GroupTrainerConfig config;
            config.learningRate = 0;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);

            config = GroupTrainerConfig();
            config.maxGradNorm = -1;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);

            CorrectionTrainerConfig correction;
            correction.learningRate = std::nan("");
            CHECK_THROWS_AS(correction.validate(), std::invalid_argument);
        }

        SUBCASE("Validation fraction is bounded to [0, 0.9]")
        {
            GroupTrainerConfig config;
            config.validationFraction = 0;
            CHECK_NOTHROW(config.validate());
            config.validationFraction = 0.9;
            CHECK_NOTHROW(config.validate());
            config.validationFraction = 0.95;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);
            config.validationFraction = -0.1;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);
        }

        SUBCASE("Thresholds that are zero or negative are rejected")
        {
            GroupTrainerConfig config;
            config.advantageThreshold = -0.5;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);
            config.advantageThreshold = 0;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);

            config = GroupTrainerConfig();
            config.minAdvantageStd = 0;
            CHECK_NOTHROW(config.validate());

            CorrectionTrainerConfig correction;
            correction.wrongWeight = -1;
            CHECK_THROWS_AS(correction.validate(), std::invalid_argument);
        }
    }
}
