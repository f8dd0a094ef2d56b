#include "EngineConfig.hpp"

#include <json/json.h>

#include <cmath>
#include <fstream>
#include <memory>
#include <sstream>

namespace opstrend {

namespace {

bool read_double(const Json::Value& group, const char* key, const std::string& path,
                 double& out, std::string& error)
{
    if (!group.isMember(key)) {
        return true;
    }
    const Json::Value& value = group[key];
    if (!value.isNumeric()) {
        error = "'" + path + "." + key + "' must be a number.";
        return false;
    }
    out = value.asDouble();
    return true;
}

bool read_int(const Json::Value& group, const char* key, const std::string& path,
              int& out, std::string& error)
{
    if (!group.isMember(key)) {
        return true;
    }
    const Json::Value& value = group[key];
    if (!value.isInt()) {
        error = "'" + path + "." + key + "' must be an integer.";
        return false;
    }
    out = value.asInt();
    return true;
}

bool read_group(const Json::Value& root, const char* key, const Json::Value*& group,
                std::string& error)
{
    group = nullptr;
    if (!root.isMember(key)) {
        return true;
    }
    const Json::Value& value = root[key];
    if (!value.isObject()) {
        error = std::string("'") + key + "' must be an object.";
        return false;
    }
    group = &value;
    return true;
}

bool populate_config_from_json(const Json::Value& root, EngineConfig& config, std::string& error)
{
    if (!root.isObject()) {
        error = "Config JSON must be an object.";
        return false;
    }

    const Json::Value* group = nullptr;

    if (!read_group(root, "trend", group, error)) return false;
    if (group) {
        if (!read_double(*group, "noise_threshold", "trend", config.noise_threshold, error)) return false;
        if (!read_int(*group, "lookback", "trend", config.trend_lookback, error)) return false;
    }

    if (!read_group(root, "volatility", group, error)) return false;
    if (group) {
        if (!read_double(*group, "cap", "volatility", config.volatility_cap, error)) return false;
    }

    if (!read_group(root, "crossover", group, error)) return false;
    if (group) {
        if (!read_double(*group, "base_confidence", "crossover", config.crossover_base_confidence, error)) return false;
        if (!read_double(*group, "max_confidence", "crossover", config.crossover_max_confidence, error)) return false;
        if (!read_double(*group, "gap_scale", "crossover", config.crossover_gap_scale, error)) return false;
    }

    if (!read_group(root, "threshold", group, error)) return false;
    if (group) {
        if (!read_int(*group, "period", "threshold", config.threshold_period, error)) return false;
        if (!read_double(*group, "multiplier", "threshold", config.threshold_multiplier, error)) return false;
        if (!read_double(*group, "confidence_floor", "threshold", config.threshold_confidence_floor, error)) return false;
        if (!read_int(*group, "decimals", "threshold", config.threshold_decimals, error)) return false;
    }

    if (!read_group(root, "analysis", group, error)) return false;
    if (group) {
        if (!read_int(*group, "short_period", "analysis", config.short_period, error)) return false;
        if (!read_int(*group, "long_period", "analysis", config.long_period, error)) return false;
    }

    if (!read_group(root, "summary", group, error)) return false;
    if (group) {
        if (!read_int(*group, "period", "summary", config.summary_period, error)) return false;
        if (!read_int(*group, "decimals", "summary", config.summary_decimals, error)) return false;
    }

    if (!read_group(root, "logging", group, error)) return false;
    if (group) {
        if (group->isMember("level")) {
            const Json::Value& level = (*group)["level"];
            if (!level.isString() || !parse_log_level(level.asString(), config.log_level)) {
                error = "'logging.level' must be one of error, warn, info, debug.";
                return false;
            }
        }
        if (group->isMember("format")) {
            const Json::Value& format = (*group)["format"];
            if (!format.isString() || !parse_log_format(format.asString(), config.log_format)) {
                error = "'logging.format' must be plain or structured.";
                return false;
            }
        }
    }

    return true;
}

bool is_confidence(double value)
{
    return std::isfinite(value) && value >= 0.0 && value <= 100.0;
}

} // namespace

ConfigLoadResult EngineConfigLoader::parse_file(const std::string& file_path)
{
    std::ifstream file(file_path);
    if (!file.is_open()) {
        ConfigLoadResult result;
        result.error_message = "Cannot open file: " + file_path;
        return result;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    ConfigLoadResult result = parse_string(buffer.str());
    if (!result.success) {
        result.error_message = file_path + ": " + result.error_message;
    }
    return result;
}

ConfigLoadResult EngineConfigLoader::parse_string(const std::string& text)
{
    ConfigLoadResult result;

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string parse_errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &parse_errors)) {
        result.error_message = "Invalid JSON: " + parse_errors;
        return result;
    }

    EngineConfig config;
    if (!populate_config_from_json(root, config, result.error_message)) {
        return result;
    }
    if (!validate(config, result.error_message)) {
        return result;
    }

    result.config = config;
    result.success = true;
    return result;
}

bool EngineConfigLoader::validate(const EngineConfig& config, std::string& error)
{
    if (!std::isfinite(config.noise_threshold) || config.noise_threshold < 0.0) {
        error = "noise_threshold must be a non-negative number.";
        return false;
    }
    if (config.trend_lookback < 1) {
        error = "trend lookback must be at least 1.";
        return false;
    }
    if (!is_confidence(config.volatility_cap)) {
        error = "volatility cap must lie in [0, 100].";
        return false;
    }
    if (!is_confidence(config.crossover_base_confidence) || !is_confidence(config.crossover_max_confidence)) {
        error = "crossover confidences must lie in [0, 100].";
        return false;
    }
    if (config.crossover_base_confidence > config.crossover_max_confidence) {
        error = "crossover base confidence exceeds its maximum.";
        return false;
    }
    if (!std::isfinite(config.crossover_gap_scale) || config.crossover_gap_scale < 0.0) {
        error = "crossover gap scale must be a non-negative number.";
        return false;
    }
    if (config.threshold_period < 1) {
        error = "threshold period must be at least 1.";
        return false;
    }
    if (!std::isfinite(config.threshold_multiplier) || config.threshold_multiplier <= 0.0) {
        error = "threshold multiplier must be positive.";
        return false;
    }
    if (!is_confidence(config.threshold_confidence_floor)) {
        error = "threshold confidence floor must lie in [0, 100].";
        return false;
    }
    if (config.threshold_decimals < 0 || config.threshold_decimals > 10
        || config.summary_decimals < 0 || config.summary_decimals > 10) {
        error = "decimals must lie in [0, 10].";
        return false;
    }
    if (config.short_period < 1 || config.long_period < 1 || config.summary_period < 1) {
        error = "periods must be at least 1.";
        return false;
    }
    if (config.short_period > config.long_period) {
        error = "short period must not exceed long period.";
        return false;
    }
    return true;
}

} // namespace opstrend
