#include "TrendAnalysis.hpp"

#include "MathUtils.hpp"
#include "MovingAverages.hpp"
#include "Sanitizer.hpp"
#include "TrendSignals.hpp"

#include <exception>
#include <string>

namespace opstrend {

TrendReport trend_analysis(std::span<const double> series, int short_period, int long_period,
                           const EngineConfig& config, const Logger* logger)
{
    try {
        TrendReport report;
        report.short_ma = moving_average(series, short_period, logger);
        report.long_ma = moving_average(series, long_period, logger);
        report.ema_short = exponential_moving_average(series, short_period, logger);
        report.ema_long = exponential_moving_average(series, long_period, logger);

        report.trend_direction = trend_direction(report.ema_short, config.trend_lookback, config, logger);
        report.volatility_score = volatility_score(series, config, logger);

        const CrossoverResult crossover = crossover_signal(report.short_ma, report.long_ma, config, logger);
        report.crossover_signal = crossover.signal;
        report.confidence = crossover.confidence;
        return report;
    } catch (const std::exception& e) {
        log_error(logger, std::string("Enhanced trend analysis failed: ") + e.what());
        return TrendReport{};
    }
}

MetricTrendSummary summarize_metric(std::span<const double> series, int period, int decimals,
                                    const EngineConfig& config, const Logger* logger)
{
    MetricTrendSummary summary;
    summary.period = period;

    const auto ema = exponential_moving_average(series, period, logger);
    summary.direction = trend_direction(ema, config.trend_lookback, config, logger);
    if (ema.empty()) {
        return summary;
    }

    summary.latest_average = round_to(ema.back(), decimals);
    const auto indexed = sanitize_indexed(series);
    if (!indexed.empty()) {
        summary.last_source_index = indexed.source_index.back();
    }
    return summary;
}

} // namespace opstrend
