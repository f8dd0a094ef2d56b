#pragma once

#include "Logger.hpp"

#include <span>
#include <variant>
#include <vector>

namespace opstrend {

/// Weight of the newest observation in the dynamic moving average.
/// Either one scalar for every step or one weight per raw observation.
using DmaAlpha = std::variant<double, std::vector<double>>;

// Every calculator sanitizes its input first and returns an empty vector, after a
// warning on `logger`, when the window cannot be computed. None of them throws.

/// Rolling arithmetic mean. Output length is n - period + 1.
std::vector<double> moving_average(std::span<const double> series, int period,
                                   const Logger* logger = nullptr);

/// Exponential moving average with alpha = 2 / (period + 1), seeded with the first
/// valid value. Output length is n.
std::vector<double> exponential_moving_average(std::span<const double> series, int period,
                                               const Logger* logger = nullptr);

/// moving_average() applied `times` times in a row. Each pass shortens the output by
/// period - 1 values.
std::vector<double> smoothed_moving_average(std::span<const double> series, int period, int times = 1,
                                            const Logger* logger = nullptr);

/// Linearly weighted rolling mean, newest value weighted `period`, oldest weighted 1.
/// Output length is n - period + 1.
std::vector<double> weighted_moving_average(std::span<const double> series, int period,
                                            const Logger* logger = nullptr);

/// y[0] = x[0], y[i] = a * x[i] + (1 - a) * y[i - 1].
///
/// With a per-step alpha, alpha[i] belongs to series[i] and is dropped together with it
/// when series[i] is not finite; alpha[0] is never used. With `no_head` the seed is not
/// emitted verbatim and position 0 holds 0.0 instead. Output length is n.
std::vector<double> dynamic_moving_average(std::span<const double> series, const DmaAlpha& alpha,
                                           bool no_head = false, const Logger* logger = nullptr);

} // namespace opstrend
