#pragma once

#include "EngineConfig.hpp"
#include "Logger.hpp"

#include <span>

namespace opstrend {

/// Anomaly band around an EMA baseline. All fields zero means "could not compute".
struct AdaptiveThreshold {
    double baseline{0.0};
    double upper_threshold{0.0};
    double lower_threshold{0.0};
    double confidence{0.0};
};

/**
 * @brief Derive anomaly bounds from the latest EMA of a series
 *
 * baseline = last EMA(period) value, upper = baseline * multiplier,
 * lower = baseline / multiplier. Confidence falls with the volatility of the last
 * `period` finite values but never below config.threshold_confidence_floor.
 * Bounds are rounded to config.threshold_decimals, confidence to an integer.
 *
 * @param series Raw observations
 * @param period EMA window and volatility tail length
 * @param multiplier Band width, must be positive and finite
 * @return Threshold, or the all-zero threshold when the EMA is empty or the multiplier is invalid
 */
AdaptiveThreshold adaptive_threshold(std::span<const double> series, int period = 14, double multiplier = 1.25,
                                     const EngineConfig& config = {}, const Logger* logger = nullptr);

} // namespace opstrend
