#pragma once

#include "TrendEngine.hpp"

#include <string>
#include <vector>

namespace opstrend {
namespace validation {

/**
 * @brief Result of parsing a metric history file
 */
struct SeriesParseResult {
    bool success = false;
    std::vector<MetricRequest> metrics;   // One entry per header column, in column order
    std::string error_message;

    // Statistics
    int total_lines = 0;
    int data_rows = 0;
    int comment_lines = 0;
    int blank_lines = 0;
    int invalid_values = 0;              // Tokens that were not numbers (kept as NaN)
};

/**
 * @brief Parser for column-oriented metric history files
 *
 * Format: first non-comment line names the metrics, each further line holds one
 * observation per metric. Columns are separated by whitespace or commas.
 * Lines starting with # or ; are comments.
 *
 * Example:
 *   inventory_level, sla_percent, daily_orders
 *   1200, 97.5, 310
 *   1185, 96.8, n/a
 *
 * Cells that are not numbers become NaN and are dropped later by the sanitizer.
 */
class SeriesFileParser {
public:
    static SeriesParseResult parse_file(const std::string& filepath);
    static SeriesParseResult parse_string(const std::string& text);

private:
    static std::vector<std::string> tokenize(const std::string& line);
    static double parse_value(const std::string& token, bool& ok);
};

} // namespace validation
} // namespace opstrend
