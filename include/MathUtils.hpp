#pragma once

#include <cstddef>
#include <span>

namespace opstrend {

/**
 * @brief Round half up to a number of decimals
 *
 * Ties go towards +infinity (2.5 -> 3, -2.5 -> -2), which is how the dashboard
 * rounded every score it displayed.
 *
 * @param value Value to round
 * @param decimals Number of decimal places (0 rounds to an integer)
 * @return Rounded value, or the input unchanged if it is not finite
 */
double round_to(double value, int decimals = 0) noexcept;

/// Population mean and standard deviation of a finite sample
struct SampleMoments {
    std::size_t count = 0;
    double mean = 0.0;
    double variance = 0.0;
    double stddev = 0.0;
};

/**
 * @brief Compute mean and population variance
 * @param values Finite values (callers sanitize first)
 * @return Moments; all zero for an empty input
 */
SampleMoments population_moments(std::span<const double> values);

} // namespace opstrend
