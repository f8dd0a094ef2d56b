#pragma once

#include "AdaptiveThreshold.hpp"
#include "EngineConfig.hpp"
#include "Logger.hpp"
#include "MovingAverages.hpp"
#include "TrendAnalysis.hpp"
#include "TrendSignals.hpp"

#include <span>
#include <string>
#include <vector>

namespace opstrend {

/// One named metric history to analyze
struct MetricRequest {
    std::string name;
    std::vector<double> values;
};

/// Everything computed for one MetricRequest
struct MetricAnalysis {
    std::string name;
    TrendReport report;
    AdaptiveThreshold threshold;
    MetricTrendSummary summary;
    double computation_time_ms = 0.0;
};

struct ExecutionOptions {
    bool parallel{true};
};

/// Engine facade: binds a configuration and a logger to the free functions.
/// Holds no mutable state, so one instance can serve many threads.
class TrendEngine {
public:
    explicit TrendEngine(EngineConfig config = {}, const Logger* logger = nullptr);

    const EngineConfig& config() const noexcept { return config_; }
    const Logger* logger() const noexcept { return logger_; }

    std::vector<double> moving_average(std::span<const double> series, int period) const;
    std::vector<double> exponential_moving_average(std::span<const double> series, int period) const;
    std::vector<double> smoothed_moving_average(std::span<const double> series, int period, int times = 1) const;
    std::vector<double> weighted_moving_average(std::span<const double> series, int period) const;
    std::vector<double> dynamic_moving_average(std::span<const double> series, const DmaAlpha& alpha,
                                               bool no_head = false) const;

    // Overloads without window arguments use the configured defaults.
    TrendDirection trend_direction(std::span<const double> series) const;
    TrendDirection trend_direction(std::span<const double> series, int lookback) const;
    double volatility_score(std::span<const double> series) const;
    CrossoverResult crossover_signal(std::span<const double> short_series,
                                     std::span<const double> long_series) const;
    AdaptiveThreshold adaptive_threshold(std::span<const double> series) const;
    AdaptiveThreshold adaptive_threshold(std::span<const double> series, int period, double multiplier) const;
    TrendReport trend_analysis(std::span<const double> series) const;
    TrendReport trend_analysis(std::span<const double> series, int short_period, int long_period) const;
    MetricTrendSummary summarize_metric(std::span<const double> series) const;

    MetricAnalysis analyze(const MetricRequest& request) const;

    /// Analyze many metrics; results keep the order of `requests`.
    std::vector<MetricAnalysis> analyze(const std::vector<MetricRequest>& requests,
                                        ExecutionOptions options = {}) const;

private:
    EngineConfig config_;
    const Logger* logger_;
};

} // namespace opstrend
