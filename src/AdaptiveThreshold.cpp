#include "AdaptiveThreshold.hpp"

#include "MathUtils.hpp"
#include "MovingAverages.hpp"
#include "TrendSignals.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace opstrend {

AdaptiveThreshold adaptive_threshold(std::span<const double> series, int period, double multiplier,
                                     const EngineConfig& config, const Logger* logger)
{
    AdaptiveThreshold threshold;
    if (series.empty()) {
        log_warn(logger, "Adaptive threshold: Empty data provided");
        return threshold;
    }

    if (!std::isfinite(multiplier) || multiplier <= 0.0) {
        log_warn(logger, "Adaptive threshold: Invalid multiplier " + std::to_string(multiplier));
        return threshold;
    }

    const auto ema = exponential_moving_average(series, period, logger);
    if (ema.empty()) {
        return threshold;
    }

    const double baseline = ema.back();
    const double upper = baseline * multiplier;
    const double lower = baseline / multiplier;
    if (!std::isfinite(upper) || !std::isfinite(lower)) {
        log_warn(logger, "Adaptive threshold: bounds overflow for baseline " + std::to_string(baseline));
        return threshold;
    }

    // The EMA succeeded, so period is in [1, series.size()]. The window covers raw
    // observations; volatility_score drops the non-finite ones inside it.
    const double volatility = volatility_score(series.last(static_cast<std::size_t>(period)), config, logger);

    threshold.baseline = round_to(baseline, config.threshold_decimals);
    threshold.upper_threshold = round_to(upper, config.threshold_decimals);
    threshold.lower_threshold = round_to(lower, config.threshold_decimals);
    threshold.confidence = round_to(std::max(config.threshold_confidence_floor, 100.0 - volatility));
    return threshold;
}

} // namespace opstrend
