#include "MathUtils.hpp"

#include <Eigen/Dense>

#include <cmath>

namespace opstrend {

double round_to(double value, int decimals) noexcept
{
    if (!std::isfinite(value)) {
        return value;
    }
    const double scale = std::pow(10.0, decimals);
    const double rounded = std::floor(value * scale + 0.5) / scale;
    return std::isfinite(rounded) ? rounded : value;
}

SampleMoments population_moments(std::span<const double> values)
{
    SampleMoments moments;
    moments.count = values.size();
    if (values.empty()) {
        return moments;
    }

    const Eigen::Map<const Eigen::VectorXd> v(values.data(), static_cast<Eigen::Index>(values.size()));
    moments.mean = v.mean();
    moments.variance = (v.array() - moments.mean).square().mean();
    moments.stddev = std::sqrt(moments.variance);
    return moments;
}

} // namespace opstrend
