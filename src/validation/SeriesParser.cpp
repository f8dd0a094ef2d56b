#include "validation/SeriesParser.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace opstrend {
namespace validation {

SeriesParseResult SeriesFileParser::parse_file(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open()) {
        SeriesParseResult result;
        result.error_message = "Failed to open file: " + filepath;
        return result;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_string(buffer.str());
}

SeriesParseResult SeriesFileParser::parse_string(const std::string& text)
{
    SeriesParseResult result;
    std::istringstream input(text);

    std::string line;
    int line_num = 0;
    bool header_parsed = false;

    while (std::getline(input, line)) {
        ++line_num;
        ++result.total_lines;

        // Trim whitespace
        line.erase(0, line.find_first_not_of(" \t\r\n"));
        line.erase(line.find_last_not_of(" \t\r\n") + 1);

        if (line.empty()) {
            ++result.blank_lines;
            continue;
        }

        if (line[0] == '#' || line[0] == ';') {
            ++result.comment_lines;
            continue;
        }

        auto tokens = tokenize(line);

        if (!header_parsed) {
            for (auto& name : tokens) {
                MetricRequest metric;
                metric.name = std::move(name);
                result.metrics.push_back(std::move(metric));
            }
            header_parsed = true;
            continue;
        }

        if (tokens.size() != result.metrics.size()) {
            result.error_message = "Parse error at line " + std::to_string(line_num) + ": expected "
                                 + std::to_string(result.metrics.size()) + " values, found "
                                 + std::to_string(tokens.size());
            result.metrics.clear();
            return result;
        }

        for (std::size_t col = 0; col < tokens.size(); ++col) {
            bool ok = false;
            const double value = parse_value(tokens[col], ok);
            if (!ok) {
                ++result.invalid_values;
            }
            result.metrics[col].values.push_back(value);
        }
        ++result.data_rows;
    }

    if (!header_parsed) {
        result.error_message = "No header line found";
        return result;
    }

    result.success = true;
    return result;
}

std::vector<std::string> SeriesFileParser::tokenize(const std::string& line)
{
    std::vector<std::string> tokens;
    std::string current;
    for (char c : line) {
        if (c == ',' || c == ' ' || c == '\t') {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

double SeriesFileParser::parse_value(const std::string& token, bool& ok)
{
    char* end = nullptr;
    const double value = std::strtod(token.c_str(), &end);
    ok = end != token.c_str() && *end == '\0';
    return ok ? value : std::numeric_limits<double>::quiet_NaN();
}

} // namespace validation
} // namespace opstrend
