//
// Result Analyzer
// Statistics, rankings and filters over a saved multi-asset result file
//

#include <charconv>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include <asset_matrix/common/env_loader.h>
#include <asset_matrix/config/run_config.h>
#include <asset_matrix/report/ranking_reporter.h>
#include <asset_matrix/report/result_store.h>

namespace fs = std::filesystem;
using namespace asset_matrix;

struct AnalyzerArgs {
    fs::path results_file;
    report::FilterCriteria criteria;
    size_t top = ANALYSIS_TOP_N;
    std::optional<fs::path> report;
};

void PrintUsage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " <results.json> [options]\n"
              << "Options:\n"
              << "  --min-sharpe N   Minimum Sharpe Ratio for the filtered list\n"
              << "  --min-return N   Minimum return % for the filtered list\n"
              << "  --min-trades N   Minimum number of trades for the filtered list\n"
              << "  --top N          Size of the top list (default: " << ANALYSIS_TOP_N << ")\n"
              << "  --report FILE    Also write the report to FILE\n"
              << "  --help           Show this help\n";
}

[[noreturn]] void InvalidValue(const char* flag, const std::string& value, const char* expected,
                               const char* prog_name) {
    std::cerr << "Invalid value for " << flag << ": '" << value << "' (expected " << expected
              << ")\n";
    PrintUsage(prog_name);
    exit(2);
}

double ParseThreshold(const char* flag, const std::string& value, const char* prog_name) {
    double parsed = 0.0;
    const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (value.empty() || ec != std::errc{} || end != value.data() + value.size()) {
        InvalidValue(flag, value, "a number", prog_name);
    }
    return parsed;
}

AnalyzerArgs ParseArgs(int argc, char* argv[]) {
    AnalyzerArgs args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            exit(0);
        } else if (arg == "--min-sharpe" && i + 1 < argc) {
            args.criteria.min_sharpe = ParseThreshold("--min-sharpe", argv[++i], argv[0]);
        } else if (arg == "--min-return" && i + 1 < argc) {
            args.criteria.min_return = ParseThreshold("--min-return", argv[++i], argv[0]);
        } else if (arg == "--min-trades" && i + 1 < argc) {
            args.criteria.min_trades = ParseThreshold("--min-trades", argv[++i], argv[0]);
        } else if (arg == "--top" && i + 1 < argc) {
            const std::string value = argv[++i];
            if (auto top = config::ParsePositiveInteger(value)) {
                args.top = static_cast<size_t>(*top);
            } else {
                InvalidValue("--top", value, "a positive integer", argv[0]);
            }
        } else if (arg == "--report" && i + 1 < argc) {
            args.report = argv[++i];
        } else if (!arg.starts_with("--") && args.results_file.empty()) {
            args.results_file = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            PrintUsage(argv[0]);
            exit(2);
        }
    }

    if (args.results_file.empty()) {
        PrintUsage(argv[0]);
        exit(2);
    }
    return args;
}

void PrintFiltered(const TestResultList& filtered) {
    std::cout << std::format("\nFound {} results matching criteria\n", filtered.size());
    size_t rank = 1;
    for (const auto& entry : filtered) {
        const auto& metrics = entry.GetMetrics();
        std::cout << std::format("  {}. {} @ {} - Sharpe: {}, Return: {}\n", rank++,
                                 entry.GetStrategy(), entry.GetAsset(),
                                 metrics.sharpe ? std::format("{:.2f}", *metrics.sharpe) : "N/A",
                                 metrics.return_pct ? std::format("{:.2f}%", *metrics.return_pct) : "N/A");
    }
}

int main(int argc, char* argv[]) {
    const auto level = ASSET_MATRIX_ENV(ENV_LOG_LEVEL);
    spdlog::set_level(level.empty() ? spdlog::level::info : spdlog::level::from_str(level));

    try {
        const auto args = ParseArgs(argc, argv);
        const auto file = report::ReadResultFile(args.results_file);

        const auto generatedAt = std::format(
            "{:%Y-%m-%d %H:%M:%S}",
            std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
        const auto text = report::RenderAnalysisReport(
            file.results, args.results_file.filename().string(), generatedAt, args.top);
        std::cout << text;

        if (args.report) {
            if (args.report->has_parent_path()) {
                fs::create_directories(args.report->parent_path());
            }
            std::ofstream out(*args.report);
            if (!out.is_open()) {
                throw std::runtime_error("Failed to open file for writing: " + args.report->string());
            }
            out << text;
            SPDLOG_INFO("Report saved to {}", args.report->string());
        }

        if (!args.criteria.Empty()) {
            PrintFiltered(report::FilterSuccessful(file.results, args.criteria));
        }
        return 0;
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Result analysis failed: {}", e.what());
        return 1;
    }
}
