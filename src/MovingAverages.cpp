#include "MovingAverages.hpp"

#include "Sanitizer.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace opstrend {

namespace {

/// Shared guard of the windowed calculators. Fills `valid` and returns true when a
/// window of `period` fits into the sanitized series.
bool prepare_window(std::span<const double> series, int period, const char* label,
                    const Logger* logger, std::vector<double>& valid)
{
    if (series.empty()) {
        log_warn(logger, std::string(label) + " calculation: Empty or invalid data provided");
        return false;
    }

    if (period <= 0 || static_cast<std::size_t>(period) > series.size()) {
        log_warn(logger, std::string(label) + " calculation: Invalid period " + std::to_string(period)
                 + " for data length " + std::to_string(series.size()));
        return false;
    }

    valid = sanitize(series);
    if (valid.size() < static_cast<std::size_t>(period)) {
        log_warn(logger, std::string(label) + " calculation: Insufficient valid data points ("
                 + std::to_string(valid.size()) + " < " + std::to_string(period) + ")");
        return false;
    }
    return true;
}

// Callers guarantee 1 <= period <= values.size().
std::vector<double> rolling_mean(const std::vector<double>& values, std::size_t period)
{
    std::vector<double> out;
    out.reserve(values.size() - period + 1);

    // Terms are scaled before summing so values near the double range stay finite.
    const double scale = 1.0 / static_cast<double>(period);
    double mean = 0.0;
    for (std::size_t i = 0; i < period; ++i) {
        mean += values[i] * scale;
    }
    out.push_back(mean);

    for (std::size_t i = period; i < values.size(); ++i) {
        mean += values[i] * scale - values[i - period] * scale;
        out.push_back(mean);
    }
    return out;
}

template <typename AlphaAt>
std::vector<double> exponential_smoothing(const std::vector<double>& values, AlphaAt alpha_at, bool no_head)
{
    std::vector<double> out;
    if (values.empty()) {
        return out;
    }
    out.reserve(values.size());

    double s = values.front();
    out.push_back(no_head ? 0.0 : s);
    for (std::size_t i = 1; i < values.size(); ++i) {
        const double a = alpha_at(i);
        s = a * values[i] + (1.0 - a) * s;
        out.push_back(s);
    }
    return out;
}

bool is_unit_weight(double a) noexcept
{
    return std::isfinite(a) && a >= 0.0 && a <= 1.0;
}

} // namespace

std::vector<double> moving_average(std::span<const double> series, int period, const Logger* logger)
{
    std::vector<double> valid;
    if (!prepare_window(series, period, "MA", logger, valid)) {
        return {};
    }
    return rolling_mean(valid, static_cast<std::size_t>(period));
}

std::vector<double> exponential_moving_average(std::span<const double> series, int period, const Logger* logger)
{
    std::vector<double> valid;
    if (!prepare_window(series, period, "EMA", logger, valid)) {
        return {};
    }
    const double alpha = 2.0 / (static_cast<double>(period) + 1.0);
    return exponential_smoothing(valid, [alpha](std::size_t) { return alpha; }, false);
}

std::vector<double> smoothed_moving_average(std::span<const double> series, int period, int times,
                                            const Logger* logger)
{
    if (times <= 0) {
        log_warn(logger, "SMA calculation: Invalid times parameter " + std::to_string(times));
        return {};
    }

    std::vector<double> current;
    if (!prepare_window(series, period, "SMA", logger, current)) {
        return {};
    }

    const auto window = static_cast<std::size_t>(period);
    for (int pass = 0; pass < times; ++pass) {
        if (current.size() < window) {
            log_warn(logger, "SMA calculation: Pass " + std::to_string(pass + 1) + " has "
                     + std::to_string(current.size()) + " points, fewer than period "
                     + std::to_string(period));
            return {};
        }
        current = rolling_mean(current, window);
    }
    return current;
}

std::vector<double> weighted_moving_average(std::span<const double> series, int period, const Logger* logger)
{
    std::vector<double> valid;
    if (!prepare_window(series, period, "WMA", logger, valid)) {
        return {};
    }

    const auto window = static_cast<std::size_t>(period);
    const double denominator = static_cast<double>(window) * static_cast<double>(window + 1) / 2.0;

    std::vector<double> out;
    out.reserve(valid.size() - window + 1);
    for (std::size_t end = window; end <= valid.size(); ++end) {
        const std::size_t start = end - window;
        double weighted = 0.0;
        for (std::size_t k = 0; k < window; ++k) {
            weighted += static_cast<double>(k + 1) / denominator * valid[start + k];
        }
        out.push_back(weighted);
    }
    return out;
}

std::vector<double> dynamic_moving_average(std::span<const double> series, const DmaAlpha& alpha,
                                           bool no_head, const Logger* logger)
{
    if (series.empty()) {
        log_warn(logger, "DMA calculation: Empty or invalid data provided");
        return {};
    }

    if (const auto* scalar = std::get_if<double>(&alpha)) {
        if (!is_unit_weight(*scalar)) {
            log_warn(logger, "DMA calculation: Invalid alpha value " + std::to_string(*scalar));
            return {};
        }

        const auto valid = sanitize(series);
        if (valid.empty()) {
            log_warn(logger, "DMA calculation: No valid data points");
            return {};
        }
        const double a = *scalar;
        return exponential_smoothing(valid, [a](std::size_t) { return a; }, no_head);
    }

    const auto& weights = std::get<std::vector<double>>(alpha);
    if (weights.size() != series.size()) {
        log_warn(logger, "DMA calculation: Alpha array length " + std::to_string(weights.size())
                 + " does not match data length " + std::to_string(series.size()));
        return {};
    }
    if (!std::all_of(weights.begin(), weights.end(), is_unit_weight)) {
        log_warn(logger, "DMA calculation: Invalid alpha array values");
        return {};
    }

    const auto valid = sanitize_indexed(series);
    if (valid.empty()) {
        log_warn(logger, "DMA calculation: No valid data points");
        return {};
    }
    return exponential_smoothing(
        valid.values,
        [&](std::size_t i) { return weights[valid.source_index[i]]; },
        no_head);
}

} // namespace opstrend
