#include "EngineConfig.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

using namespace opstrend;

TEST(EngineConfig, DefaultsAreTheDashboardHeuristics)
{
    const EngineConfig config;
    EXPECT_DOUBLE_EQ(config.noise_threshold, 0.01);
    EXPECT_DOUBLE_EQ(config.volatility_cap, 100.0);
    EXPECT_DOUBLE_EQ(config.crossover_base_confidence, 60.0);
    EXPECT_DOUBLE_EQ(config.crossover_max_confidence, 95.0);
    EXPECT_DOUBLE_EQ(config.threshold_multiplier, 1.25);
    EXPECT_EQ(config.threshold_period, 14);
    EXPECT_EQ(config.short_period, 7);
    EXPECT_EQ(config.long_period, 21);
    EXPECT_EQ(config.trend_lookback, 2);

    std::string error;
    EXPECT_TRUE(EngineConfigLoader::validate(config, error)) << error;
}

TEST(EngineConfigLoader, EmptyObjectKeepsDefaults)
{
    const auto result = EngineConfigLoader::parse_string("{}");
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_DOUBLE_EQ(result.config.noise_threshold, 0.01);
    EXPECT_EQ(result.config.log_level, LogLevel::Warn);
}

TEST(EngineConfigLoader, ReadsAllGroups)
{
    const std::string json = R"({
        "trend": { "noise_threshold": 0.02, "lookback": 3 },
        "volatility": { "cap": 80 },
        "crossover": { "base_confidence": 55, "max_confidence": 90, "gap_scale": 50 },
        "threshold": { "period": 10, "multiplier": 1.5, "confidence_floor": 40, "decimals": 1 },
        "analysis": { "short_period": 5, "long_period": 15 },
        "summary": { "period": 6, "decimals": 1 },
        "logging": { "level": "debug", "format": "structured" }
    })";

    const auto result = EngineConfigLoader::parse_string(json);
    ASSERT_TRUE(result.success) << result.error_message;
    const auto& c = result.config;
    EXPECT_DOUBLE_EQ(c.noise_threshold, 0.02);
    EXPECT_EQ(c.trend_lookback, 3);
    EXPECT_DOUBLE_EQ(c.volatility_cap, 80.0);
    EXPECT_DOUBLE_EQ(c.crossover_base_confidence, 55.0);
    EXPECT_DOUBLE_EQ(c.crossover_max_confidence, 90.0);
    EXPECT_DOUBLE_EQ(c.crossover_gap_scale, 50.0);
    EXPECT_EQ(c.threshold_period, 10);
    EXPECT_DOUBLE_EQ(c.threshold_multiplier, 1.5);
    EXPECT_DOUBLE_EQ(c.threshold_confidence_floor, 40.0);
    EXPECT_EQ(c.threshold_decimals, 1);
    EXPECT_EQ(c.short_period, 5);
    EXPECT_EQ(c.long_period, 15);
    EXPECT_EQ(c.summary_period, 6);
    EXPECT_EQ(c.summary_decimals, 1);
    EXPECT_EQ(c.log_level, LogLevel::Debug);
    EXPECT_EQ(c.log_format, LogFormat::Structured);
}

TEST(EngineConfigLoader, RejectsMalformedJson)
{
    const auto result = EngineConfigLoader::parse_string("{ \"trend\": ");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error_message.find("Invalid JSON"), std::string::npos);
}

TEST(EngineConfigLoader, RejectsNonObjectRoot)
{
    EXPECT_FALSE(EngineConfigLoader::parse_string("[1, 2]").success);
}

TEST(EngineConfigLoader, RejectsWrongTypes)
{
    auto result = EngineConfigLoader::parse_string(R"({ "trend": { "noise_threshold": "high" } })");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error_message.find("trend.noise_threshold"), std::string::npos);

    result = EngineConfigLoader::parse_string(R"({ "threshold": { "period": 2.5 } })");
    EXPECT_FALSE(result.success);

    result = EngineConfigLoader::parse_string(R"({ "threshold": 14 })");
    EXPECT_FALSE(result.success);

    result = EngineConfigLoader::parse_string(R"({ "logging": { "level": "verbose" } })");
    EXPECT_FALSE(result.success);
}

TEST(EngineConfigLoader, RejectsOutOfRangeValues)
{
    EXPECT_FALSE(EngineConfigLoader::parse_string(R"({ "trend": { "noise_threshold": -0.1 } })").success);
    EXPECT_FALSE(EngineConfigLoader::parse_string(R"({ "threshold": { "multiplier": 0 } })").success);
    EXPECT_FALSE(EngineConfigLoader::parse_string(R"({ "threshold": { "period": 0 } })").success);
    EXPECT_FALSE(EngineConfigLoader::parse_string(R"({ "volatility": { "cap": 150 } })").success);
    EXPECT_FALSE(EngineConfigLoader::parse_string(
        R"({ "crossover": { "base_confidence": 96, "max_confidence": 95 } })").success);
    EXPECT_FALSE(EngineConfigLoader::parse_string(
        R"({ "analysis": { "short_period": 30, "long_period": 21 } })").success);
}

TEST(EngineConfigLoader, ParseFile)
{
    const std::string path = ::testing::TempDir() + "opstrend_engine_config.json";
    {
        std::ofstream out(path);
        out << R"({ "analysis": { "short_period": 3, "long_period": 9 } })";
    }

    const auto result = EngineConfigLoader::parse_file(path);
    std::remove(path.c_str());

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.config.short_period, 3);
    EXPECT_EQ(result.config.long_period, 9);
}

TEST(EngineConfigLoader, MissingFile)
{
    const auto result = EngineConfigLoader::parse_file("/nonexistent/opstrend.json");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error_message.find("Cannot open file"), std::string::npos);
}
