#include "TrendSignals.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <vector>

using namespace opstrend;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInf = std::numeric_limits<double>::infinity();

} // namespace

TEST(TrendDirection, ChangeAboveNoiseIsUp)
{
    const std::vector<double> data{100, 100, 103};
    EXPECT_EQ(trend_direction(data, 2), TrendDirection::Up);
}

TEST(TrendDirection, ChangeBelowNoiseIsNeutral)
{
    const std::vector<double> data{100, 100, 99.5};
    EXPECT_EQ(trend_direction(data), TrendDirection::Neutral);
}

TEST(TrendDirection, ChangeExactlyAtNoiseIsNeutral)
{
    const std::vector<double> data{200, 202};
    EXPECT_EQ(trend_direction(data), TrendDirection::Neutral);
}

TEST(TrendDirection, DecreaseIsDown)
{
    const std::vector<double> data{100, 98};
    EXPECT_EQ(trend_direction(data), TrendDirection::Down);
}

TEST(TrendDirection, ShortSeriesIsNeutral)
{
    const std::vector<double> three{1, 2, 3};
    EXPECT_EQ(trend_direction(three, 5), TrendDirection::Neutral);

    const std::vector<double> one{5};
    EXPECT_EQ(trend_direction(one, 1), TrendDirection::Neutral);
    EXPECT_EQ(trend_direction({}, 2), TrendDirection::Neutral);
}

TEST(TrendDirection, ComparesFiniteValuesInsideLookbackWindow)
{
    const std::vector<double> data{kNaN, 100, kInf, 120};
    EXPECT_EQ(trend_direction(data, 4), TrendDirection::Neutral);

    const std::vector<double> gapped{kNaN, 100, 90, kInf, 120};
    EXPECT_EQ(trend_direction(gapped, 3), TrendDirection::Up);
    EXPECT_EQ(trend_direction(gapped, 2), TrendDirection::Neutral);
}

TEST(TrendDirection, NonFiniteTailIsNeutral)
{
    const std::vector<double> data{1, 2, kNaN};
    EXPECT_EQ(trend_direction(data, 2), TrendDirection::Neutral);

    const std::vector<double> spaced{kNaN, 100, kInf, 120};
    EXPECT_EQ(trend_direction(spaced, 2), TrendDirection::Neutral);
}

TEST(TrendDirection, UsesConfiguredNoiseThreshold)
{
    EngineConfig config;
    config.noise_threshold = 0.05;
    const std::vector<double> data{100, 103};
    EXPECT_EQ(trend_direction(data, 2, config), TrendDirection::Neutral);
    config.noise_threshold = 0.0;
    EXPECT_EQ(trend_direction(data, 2, config), TrendDirection::Up);
}

TEST(TrendDirection, ZeroPreviousValueAcceptsAnyMove)
{
    const std::vector<double> data{0.0, 0.001};
    EXPECT_EQ(trend_direction(data), TrendDirection::Up);
}

TEST(VolatilityScore, ConstantSeriesIsZero)
{
    const std::vector<double> data(30, 17.25);
    EXPECT_EQ(volatility_score(data), 0.0);
}

TEST(VolatilityScore, TooFewPointsIsZero)
{
    EXPECT_EQ(volatility_score({}), 0.0);
    const std::vector<double> one{5, kNaN};
    EXPECT_EQ(volatility_score(one), 0.0);
}

TEST(VolatilityScore, ZeroMeanIsZero)
{
    const std::vector<double> data{-1, 1};
    EXPECT_EQ(volatility_score(data), 0.0);
}

TEST(VolatilityScore, CoefficientOfVariationRounded)
{
    // mean 15, population stddev 5
    const std::vector<double> data{10, 20};
    EXPECT_EQ(volatility_score(data), 33.0);

    const std::vector<double> negative{-10, -20};
    EXPECT_EQ(volatility_score(negative), 33.0);
}

TEST(VolatilityScore, CappedAtConfiguredMaximum)
{
    // mean 2.5, stddev 7.5 -> 300%
    const std::vector<double> data{-5, 10};
    EXPECT_EQ(volatility_score(data), 100.0);

    EngineConfig config;
    config.volatility_cap = 50.0;
    EXPECT_EQ(volatility_score(data, config), 50.0);
}

TEST(VolatilityScore, IgnoresNonFiniteValues)
{
    const std::vector<double> data{10, kNaN, 20, kInf};
    EXPECT_EQ(volatility_score(data), 33.0);
}

TEST(CrossoverSignal, ShortCrossingAboveIsBullish)
{
    const std::vector<double> short_ma{9, 11};
    const std::vector<double> long_ma{10, 10};
    const auto result = crossover_signal(short_ma, long_ma);
    EXPECT_EQ(result.signal, CrossoverSignal::Bullish);
    EXPECT_EQ(result.confidence, 70.0);
}

TEST(CrossoverSignal, ShortCrossingBelowIsBearish)
{
    const std::vector<double> short_ma{11, 9};
    const std::vector<double> long_ma{10, 10};
    const auto result = crossover_signal(short_ma, long_ma);
    EXPECT_EQ(result.signal, CrossoverSignal::Bearish);
    EXPECT_EQ(result.confidence, 70.0);
}

TEST(CrossoverSignal, TouchingFromBelowCounts)
{
    const std::vector<double> short_ma{10, 10.5};
    const std::vector<double> long_ma{10, 10};
    EXPECT_EQ(crossover_signal(short_ma, long_ma).signal, CrossoverSignal::Bullish);
}

TEST(CrossoverSignal, NoCrossingIsNeutral)
{
    const std::vector<double> short_ma{11, 12};
    const std::vector<double> long_ma{10, 10};
    const auto result = crossover_signal(short_ma, long_ma);
    EXPECT_EQ(result.signal, CrossoverSignal::Neutral);
    EXPECT_EQ(result.confidence, 0.0);

    const std::vector<double> equal{10, 10};
    EXPECT_EQ(crossover_signal(equal, equal).signal, CrossoverSignal::Neutral);
}

TEST(CrossoverSignal, ConfidenceIsCapped)
{
    const std::vector<double> short_ma{1, 20};
    const std::vector<double> long_ma{10, 10};
    EXPECT_EQ(crossover_signal(short_ma, long_ma).confidence, 95.0);
}

TEST(CrossoverSignal, ZeroLongAverageSaturates)
{
    const std::vector<double> short_ma{-1, 1};
    const std::vector<double> long_ma{0, 0};
    const auto result = crossover_signal(short_ma, long_ma);
    EXPECT_EQ(result.signal, CrossoverSignal::Bullish);
    EXPECT_EQ(result.confidence, 95.0);
}

TEST(CrossoverSignal, ShortInputsAreNeutral)
{
    const std::vector<double> one{1};
    const std::vector<double> two{1, 2};
    EXPECT_EQ(crossover_signal(one, two).signal, CrossoverSignal::Neutral);
    EXPECT_EQ(crossover_signal(two, one).confidence, 0.0);
    EXPECT_EQ(crossover_signal({}, {}).signal, CrossoverSignal::Neutral);
}

TEST(CrossoverSignal, UsesConfiguredHeuristics)
{
    EngineConfig config;
    config.crossover_base_confidence = 40.0;
    config.crossover_gap_scale = 50.0;
    const std::vector<double> short_ma{9, 11};
    const std::vector<double> long_ma{10, 10};
    EXPECT_EQ(crossover_signal(short_ma, long_ma, config).confidence, 45.0);
}
