#pragma once

#include "EngineConfig.hpp"
#include "Logger.hpp"
#include "Series.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace opstrend {

/// Everything the dashboard shows for one metric history.
/// A default-constructed report is the "could not compute" report.
struct TrendReport {
    std::vector<double> short_ma;
    std::vector<double> long_ma;
    std::vector<double> ema_short;
    std::vector<double> ema_long;
    TrendDirection trend_direction{TrendDirection::Neutral};
    double volatility_score{0.0};
    CrossoverSignal crossover_signal{CrossoverSignal::Neutral};
    double confidence{0.0};
};

/// Compact KPI trend: direction of EMA(period) plus its latest value.
struct MetricTrendSummary {
    int period{0};
    TrendDirection direction{TrendDirection::Neutral};
    std::optional<double> latest_average;          // rounded; absent when the EMA is empty
    std::optional<std::size_t> last_source_index;  // raw index of the last finite observation
};

/// Short/long SMA and EMA, trend of the short EMA, volatility of the raw series and
/// the SMA crossover. Never throws; internal failures yield the default report.
TrendReport trend_analysis(std::span<const double> series, int short_period = 7, int long_period = 21,
                           const EngineConfig& config = {}, const Logger* logger = nullptr);

/// EMA(period) of a KPI history reduced to its direction and latest value.
/// Counts use decimals = 0, rates typically decimals = 1.
MetricTrendSummary summarize_metric(std::span<const double> series, int period = 7, int decimals = 0,
                                    const EngineConfig& config = {}, const Logger* logger = nullptr);

} // namespace opstrend
