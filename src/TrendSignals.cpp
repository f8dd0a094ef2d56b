#include "TrendSignals.hpp"

#include "MathUtils.hpp"
#include "Sanitizer.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace opstrend {

TrendDirection trend_direction(std::span<const double> series, int lookback,
                               const EngineConfig& config, const Logger* logger)
{
    const auto valid = sanitize(series);
    const std::size_t required = static_cast<std::size_t>(std::max(lookback, 2));
    if (valid.size() < required) {
        log_warn(logger, "Trend direction: " + std::to_string(valid.size())
                 + " valid points, need " + std::to_string(required));
        return TrendDirection::Neutral;
    }

    // Only the last `lookback` observations take part in the comparison.
    const std::size_t window = lookback > 0 ? std::min(series.size(), static_cast<std::size_t>(lookback))
                                            : series.size();
    const auto recent = sanitize(series.last(window));
    if (recent.size() < 2) {
        log_debug(logger, "Trend direction: fewer than 2 valid points in the last "
                  + std::to_string(window) + " observations");
        return TrendDirection::Neutral;
    }

    const double current = recent[recent.size() - 1];
    const double previous = recent[recent.size() - 2];
    const double change_threshold = std::abs(previous) * config.noise_threshold;
    const double difference = current - previous;

    if (!std::isfinite(difference) || std::abs(difference) <= change_threshold) {
        return TrendDirection::Neutral;
    }
    return difference > 0.0 ? TrendDirection::Up : TrendDirection::Down;
}

double volatility_score(std::span<const double> series, const EngineConfig& config, const Logger* logger)
{
    const auto valid = sanitize(series);
    if (valid.size() < 2) {
        log_warn(logger, "Volatility score: fewer than 2 valid points");
        return 0.0;
    }

    const SampleMoments moments = population_moments(valid);
    if (moments.mean == 0.0) {
        return 0.0;
    }

    const double score = moments.stddev / std::abs(moments.mean) * 100.0;
    if (!std::isfinite(score)) {
        log_warn(logger, "Volatility score: non-finite dispersion, reporting 0");
        return 0.0;
    }
    return round_to(std::min(score, config.volatility_cap));
}

CrossoverResult crossover_signal(std::span<const double> short_series, std::span<const double> long_series,
                                 const EngineConfig& config, const Logger* logger)
{
    CrossoverResult result;
    if (short_series.size() < 2 || long_series.size() < 2) {
        log_warn(logger, "Crossover signal: each average needs at least 2 points (short="
                 + std::to_string(short_series.size()) + ", long=" + std::to_string(long_series.size()) + ")");
        return result;
    }

    const double short_current = short_series[short_series.size() - 1];
    const double short_previous = short_series[short_series.size() - 2];
    const double long_current = long_series[long_series.size() - 1];
    const double long_previous = long_series[long_series.size() - 2];

    if (!is_valid(short_current) || !is_valid(short_previous)
        || !is_valid(long_current) || !is_valid(long_previous)) {
        log_warn(logger, "Crossover signal: non-finite average values");
        return result;
    }

    if (short_previous <= long_previous && short_current > long_current) {
        result.signal = CrossoverSignal::Bullish;
    } else if (short_previous >= long_previous && short_current < long_current) {
        result.signal = CrossoverSignal::Bearish;
    } else {
        return result;
    }

    // A crossing over a zero long average is as strong as it gets.
    double confidence = config.crossover_max_confidence;
    if (long_current != 0.0) {
        const double relative_gap = std::abs(short_current - long_current) / std::abs(long_current);
        confidence = std::min(config.crossover_max_confidence,
                              config.crossover_base_confidence + relative_gap * config.crossover_gap_scale);
    }
    result.confidence = round_to(confidence);
    return result;
}

} // namespace opstrend
