/// Command-line tool for batch trend analysis of metric histories
///
/// Usage:
///   compute_trends <series_file> [options]
///
/// Options:
///   --config <file>      JSON engine config (heuristics, windows, logging)
///   --output <file>      Write the JSON report to a file instead of stdout
///   --sequential         Analyze metrics one after another
///   --verbose            Log at debug level
///   --structured-logs    Emit log lines as JSON objects
///
/// Example:
///   compute_trends kpis.csv --config engine.json --output trends.json

#include "EngineConfig.hpp"
#include "Logger.hpp"
#include "ReportWriter.hpp"
#include "TrendEngine.hpp"
#include "validation/SeriesParser.hpp"

#include <iostream>
#include <string>

using namespace opstrend;

namespace {

void print_usage(const char* program_name)
{
    std::cout << "Usage: " << program_name << " <series_file> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>     JSON engine config\n";
    std::cout << "  --output <file>     Write JSON report to file (default: stdout)\n";
    std::cout << "  --sequential        Run sequentially instead of parallel\n";
    std::cout << "  --verbose           Log at debug level\n";
    std::cout << "  --structured-logs   Emit JSON log lines\n";
    std::cout << "  --help              Show this help message\n\n";
    std::cout << "Series file format:\n";
    std::cout << "  inventory_level, sla_percent, daily_orders\n";
    std::cout << "  1200, 97.5, 310\n";
    std::cout << "  1185, 96.8, 295\n";
}

} // anonymous namespace

int main(int argc, char** argv)
{
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string series_file;
    std::string config_file;
    std::string output_file;
    bool parallel = true;
    bool verbose = false;
    bool structured_logs = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_file = argv[++i];
        } else if (arg == "--sequential") {
            parallel = false;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--structured-logs") {
            structured_logs = true;
        } else if (!arg.empty() && arg[0] != '-' && series_file.empty()) {
            series_file = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (series_file.empty()) {
        std::cerr << "Missing series file\n";
        print_usage(argv[0]);
        return 1;
    }

    EngineConfig config;
    if (!config_file.empty()) {
        auto loaded = EngineConfigLoader::parse_file(config_file);
        if (!loaded.success) {
            std::cerr << "ERROR: " << loaded.error_message << "\n";
            return 1;
        }
        config = loaded.config;
    }

    Logger logger(verbose ? LogLevel::Debug : config.log_level,
                  structured_logs ? LogFormat::Structured : config.log_format);

    auto parsed = validation::SeriesFileParser::parse_file(series_file);
    if (!parsed.success) {
        std::cerr << "ERROR: " << parsed.error_message << "\n";
        return 1;
    }
    logger.info("Loaded " + std::to_string(parsed.metrics.size()) + " metrics, "
                + std::to_string(parsed.data_rows) + " rows from " + series_file);
    if (parsed.invalid_values > 0) {
        logger.warn(std::to_string(parsed.invalid_values) + " non-numeric cells will be ignored");
    }

    TrendEngine engine(config, &logger);
    ExecutionOptions options;
    options.parallel = parallel;

    std::vector<MetricAnalysis> analyses;
    {
        ScopedTimer timer(&logger, "compute_trends " + series_file);
        analyses = engine.analyze(parsed.metrics, options);
    }

    const Json::Value report = ReportWriter::to_json(analyses);
    if (output_file.empty()) {
        std::cout << ReportWriter::to_json_string(report) << "\n";
        return 0;
    }

    std::string error;
    if (!ReportWriter::write_file(output_file, report, error)) {
        std::cerr << "ERROR: " << error << "\n";
        return 1;
    }
    logger.info("Wrote report to " + output_file);
    return 0;
}
