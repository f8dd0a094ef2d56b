#include "TrendEngine.hpp"

#include <chrono>
#include <future>
#include <utility>

namespace opstrend {

TrendEngine::TrendEngine(EngineConfig config, const Logger* logger)
    : config_(std::move(config))
    , logger_(logger)
{
}

std::vector<double> TrendEngine::moving_average(std::span<const double> series, int period) const
{
    return opstrend::moving_average(series, period, logger_);
}

std::vector<double> TrendEngine::exponential_moving_average(std::span<const double> series, int period) const
{
    return opstrend::exponential_moving_average(series, period, logger_);
}

std::vector<double> TrendEngine::smoothed_moving_average(std::span<const double> series, int period, int times) const
{
    return opstrend::smoothed_moving_average(series, period, times, logger_);
}

std::vector<double> TrendEngine::weighted_moving_average(std::span<const double> series, int period) const
{
    return opstrend::weighted_moving_average(series, period, logger_);
}

std::vector<double> TrendEngine::dynamic_moving_average(std::span<const double> series, const DmaAlpha& alpha,
                                                        bool no_head) const
{
    return opstrend::dynamic_moving_average(series, alpha, no_head, logger_);
}

TrendDirection TrendEngine::trend_direction(std::span<const double> series) const
{
    return trend_direction(series, config_.trend_lookback);
}

TrendDirection TrendEngine::trend_direction(std::span<const double> series, int lookback) const
{
    return opstrend::trend_direction(series, lookback, config_, logger_);
}

double TrendEngine::volatility_score(std::span<const double> series) const
{
    return opstrend::volatility_score(series, config_, logger_);
}

CrossoverResult TrendEngine::crossover_signal(std::span<const double> short_series,
                                              std::span<const double> long_series) const
{
    return opstrend::crossover_signal(short_series, long_series, config_, logger_);
}

AdaptiveThreshold TrendEngine::adaptive_threshold(std::span<const double> series) const
{
    return adaptive_threshold(series, config_.threshold_period, config_.threshold_multiplier);
}

AdaptiveThreshold TrendEngine::adaptive_threshold(std::span<const double> series, int period,
                                                  double multiplier) const
{
    return opstrend::adaptive_threshold(series, period, multiplier, config_, logger_);
}

TrendReport TrendEngine::trend_analysis(std::span<const double> series) const
{
    return trend_analysis(series, config_.short_period, config_.long_period);
}

TrendReport TrendEngine::trend_analysis(std::span<const double> series, int short_period, int long_period) const
{
    return opstrend::trend_analysis(series, short_period, long_period, config_, logger_);
}

MetricTrendSummary TrendEngine::summarize_metric(std::span<const double> series) const
{
    return opstrend::summarize_metric(series, config_.summary_period, config_.summary_decimals, config_, logger_);
}

MetricAnalysis TrendEngine::analyze(const MetricRequest& request) const
{
    const auto start = std::chrono::steady_clock::now();

    MetricAnalysis analysis;
    analysis.name = request.name;
    analysis.report = trend_analysis(request.values);
    analysis.threshold = adaptive_threshold(request.values);
    analysis.summary = summarize_metric(request.values);

    const auto end = std::chrono::steady_clock::now();
    analysis.computation_time_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return analysis;
}

std::vector<MetricAnalysis> TrendEngine::analyze(const std::vector<MetricRequest>& requests,
                                                 ExecutionOptions options) const
{
    ScopedTimer timer(logger_, "analyze " + std::to_string(requests.size()) + " metrics");
    std::vector<MetricAnalysis> results(requests.size());

    if (options.parallel && requests.size() > 1) {
        std::vector<std::future<void>> tasks;
        tasks.reserve(requests.size());
        for (std::size_t i = 0; i < requests.size(); ++i) {
            tasks.emplace_back(std::async(std::launch::async, [&, i]() {
                results[i] = analyze(requests[i]);
            }));
        }
        for (auto& task : tasks) {
            task.get();
        }
    } else {
        for (std::size_t i = 0; i < requests.size(); ++i) {
            results[i] = analyze(requests[i]);
        }
    }

    return results;
}

} // namespace opstrend
