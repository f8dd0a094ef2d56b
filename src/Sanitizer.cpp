#include "Sanitizer.hpp"

#include <algorithm>
#include <iterator>

namespace opstrend {

std::vector<double> sanitize(std::span<const double> series)
{
    std::vector<double> values;
    values.reserve(series.size());
    std::copy_if(series.begin(), series.end(), std::back_inserter(values), is_valid);
    return values;
}

SanitizedSeries sanitize_indexed(std::span<const double> series)
{
    SanitizedSeries out;
    out.values.reserve(series.size());
    out.source_index.reserve(series.size());
    for (std::size_t i = 0; i < series.size(); ++i) {
        if (is_valid(series[i])) {
            out.values.push_back(series[i]);
            out.source_index.push_back(i);
        }
    }
    return out;
}

} // namespace opstrend
