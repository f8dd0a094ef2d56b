#include "Series.hpp"

namespace opstrend {

std::string_view to_string(TrendDirection direction)
{
    switch (direction) {
        case TrendDirection::Up: return "up";
        case TrendDirection::Down: return "down";
        case TrendDirection::Neutral: return "neutral";
    }
    return "neutral";
}

std::string_view to_string(CrossoverSignal signal)
{
    switch (signal) {
        case CrossoverSignal::Bullish: return "bullish";
        case CrossoverSignal::Bearish: return "bearish";
        case CrossoverSignal::Neutral: return "neutral";
    }
    return "neutral";
}

} // namespace opstrend
