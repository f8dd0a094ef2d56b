#pragma once

#include "Series.hpp"

#include <cmath>
#include <span>
#include <vector>

namespace opstrend {

/// Finite values of `series` in their original order. NaN and +-Inf are dropped.
std::vector<double> sanitize(std::span<const double> series);

/// Same filtering as sanitize(), keeping the raw position of every surviving value.
SanitizedSeries sanitize_indexed(std::span<const double> series);

inline bool is_valid(double value) noexcept
{
    return std::isfinite(value);
}

} // namespace opstrend
