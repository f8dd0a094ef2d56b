#pragma once

#include "AdaptiveThreshold.hpp"
#include "TrendAnalysis.hpp"
#include "TrendEngine.hpp"

#include <json/json.h>

#include <string>
#include <vector>

namespace opstrend {

/// JSON rendering of engine results for the dashboard layer.
/// Field names follow the dashboard's camelCase payloads.
class ReportWriter {
public:
    static Json::Value to_json(const TrendReport& report);
    static Json::Value to_json(const AdaptiveThreshold& threshold);
    static Json::Value to_json(const MetricTrendSummary& summary);
    static Json::Value to_json(const MetricAnalysis& analysis);
    static Json::Value to_json(const std::vector<MetricAnalysis>& analyses);

    /// Two-space indented JSON text
    static std::string to_json_string(const Json::Value& value);

    /// Write `value` to `output_path`. Returns false and fills `error` on I/O failure.
    static bool write_file(const std::string& output_path, const Json::Value& value, std::string& error);
};

} // namespace opstrend
