#pragma once

#include "EngineConfig.hpp"
#include "Logger.hpp"
#include "Series.hpp"

#include <span>

namespace opstrend {

struct CrossoverResult {
    CrossoverSignal signal{CrossoverSignal::Neutral};
    double confidence{0.0};
};

/// Direction of the last step of `series`.
///
/// Compares the last two finite values. A move of at most noise_threshold * |previous|
/// is Neutral. Series with fewer than max(lookback, 2) finite values are Neutral.
TrendDirection trend_direction(std::span<const double> series, int lookback = 2,
                               const EngineConfig& config = {}, const Logger* logger = nullptr);

/// Coefficient of variation (population stddev / |mean|) as a rounded percentage,
/// capped at config.volatility_cap. Zero mean or fewer than two finite values give 0.
double volatility_score(std::span<const double> series,
                        const EngineConfig& config = {}, const Logger* logger = nullptr);

/// Crossing of a short-window average over a long-window average on the last step.
///
/// Bullish when short moves from <= long to > long, Bearish on the mirror move.
/// Confidence = min(max, base + |short - long| / |long| * gap_scale), rounded.
CrossoverResult crossover_signal(std::span<const double> short_series, std::span<const double> long_series,
                                 const EngineConfig& config = {}, const Logger* logger = nullptr);

} // namespace opstrend
