#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace opstrend {

enum class TrendDirection {
    Up,
    Down,
    Neutral
};

enum class CrossoverSignal {
    Bullish,
    Bearish,
    Neutral
};

std::string_view to_string(TrendDirection direction);
std::string_view to_string(CrossoverSignal signal);

/// Finite observations of a raw series together with the raw position each came from.
struct SanitizedSeries {
    std::vector<double> values;
    std::vector<std::size_t> source_index;

    std::size_t size() const noexcept { return values.size(); }
    bool empty() const noexcept { return values.empty(); }
};

} // namespace opstrend
