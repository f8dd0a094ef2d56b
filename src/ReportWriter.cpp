#include "ReportWriter.hpp"

#include <fstream>

namespace opstrend {

namespace {

Json::Value to_json_array(const std::vector<double>& values)
{
    Json::Value array(Json::arrayValue);
    for (double v : values) {
        array.append(v);
    }
    return array;
}

} // namespace

Json::Value ReportWriter::to_json(const TrendReport& report)
{
    Json::Value root(Json::objectValue);
    root["shortMA"] = to_json_array(report.short_ma);
    root["longMA"] = to_json_array(report.long_ma);
    root["emaShort"] = to_json_array(report.ema_short);
    root["emaLong"] = to_json_array(report.ema_long);
    root["trendDirection"] = std::string(to_string(report.trend_direction));
    root["volatilityScore"] = report.volatility_score;
    root["crossoverSignal"] = std::string(to_string(report.crossover_signal));
    root["confidence"] = report.confidence;
    return root;
}

Json::Value ReportWriter::to_json(const AdaptiveThreshold& threshold)
{
    Json::Value root(Json::objectValue);
    root["baseline"] = threshold.baseline;
    root["upperThreshold"] = threshold.upper_threshold;
    root["lowerThreshold"] = threshold.lower_threshold;
    root["confidence"] = threshold.confidence;
    return root;
}

Json::Value ReportWriter::to_json(const MetricTrendSummary& summary)
{
    Json::Value root(Json::objectValue);
    root["period"] = summary.period;
    root["trend"] = std::string(to_string(summary.direction));
    // Optional fields are omitted, not null.
    if (summary.latest_average) {
        root["latestAverage"] = *summary.latest_average;
    }
    if (summary.last_source_index) {
        root["lastSourceIndex"] = static_cast<Json::UInt64>(*summary.last_source_index);
    }
    return root;
}

Json::Value ReportWriter::to_json(const MetricAnalysis& analysis)
{
    Json::Value root(Json::objectValue);
    root["name"] = analysis.name;
    root["trendAnalysis"] = to_json(analysis.report);
    root["adaptiveThreshold"] = to_json(analysis.threshold);
    root["summary"] = to_json(analysis.summary);
    root["computationTimeMs"] = analysis.computation_time_ms;
    return root;
}

Json::Value ReportWriter::to_json(const std::vector<MetricAnalysis>& analyses)
{
    Json::Value root(Json::objectValue);
    Json::Value metrics(Json::arrayValue);
    for (const auto& analysis : analyses) {
        metrics.append(to_json(analysis));
    }
    root["metrics"] = metrics;
    return root;
}

std::string ReportWriter::to_json_string(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

bool ReportWriter::write_file(const std::string& output_path, const Json::Value& value, std::string& error)
{
    std::ofstream file(output_path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        error = "Unable to open output file: " + output_path;
        return false;
    }

    file << to_json_string(value) << '\n';
    if (!file.good()) {
        error = "Failed to write output file: " + output_path;
        return false;
    }
    return true;
}

} // namespace opstrend
