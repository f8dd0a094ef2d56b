#pragma once

#include "Logger.hpp"

#include <string>

namespace opstrend {

/// Heuristic constants and default windows used by the engine.
/// The defaults reproduce the dashboard's historical behaviour; none of them was fitted.
struct EngineConfig {
    // Trend classifier
    double noise_threshold = 0.01;          // fraction of the previous value treated as noise
    int trend_lookback = 2;

    // Volatility scorer
    double volatility_cap = 100.0;

    // Crossover detector: min(max, base + gap * scale)
    double crossover_base_confidence = 60.0;
    double crossover_max_confidence = 95.0;
    double crossover_gap_scale = 100.0;

    // Adaptive threshold
    int threshold_period = 14;
    double threshold_multiplier = 1.25;
    double threshold_confidence_floor = 50.0;
    int threshold_decimals = 2;

    // Orchestrator windows
    int short_period = 7;
    int long_period = 21;

    // Metric summary
    int summary_period = 7;
    int summary_decimals = 0;

    // Logging
    LogLevel log_level = LogLevel::Warn;
    LogFormat log_format = LogFormat::Plain;
};

/// Result of loading a config file
struct ConfigLoadResult {
    bool success = false;
    EngineConfig config;
    std::string error_message;
};

/// Reads EngineConfig from JSON.
///
/// Example:
///   {
///     "trend":      { "noise_threshold": 0.02, "lookback": 2 },
///     "volatility": { "cap": 100 },
///     "crossover":  { "base_confidence": 60, "max_confidence": 95, "gap_scale": 100 },
///     "threshold":  { "period": 10, "multiplier": 1.5, "confidence_floor": 50, "decimals": 2 },
///     "analysis":   { "short_period": 7, "long_period": 21 },
///     "summary":    { "period": 7, "decimals": 0 },
///     "logging":    { "level": "debug", "format": "structured" }
///   }
///
/// Keys that are absent keep their defaults. Unknown keys are ignored.
class EngineConfigLoader {
public:
    static ConfigLoadResult parse_file(const std::string& file_path);
    static ConfigLoadResult parse_string(const std::string& text);

    /// Range checks shared by the loader and programmatic callers.
    static bool validate(const EngineConfig& config, std::string& error);
};

} // namespace opstrend
