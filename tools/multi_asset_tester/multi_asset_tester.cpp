//
// Multi-Asset Tester
// Runs one strategy against every dataset in a directory and ranks the assets
//

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include <asset_matrix/catalog/asset_catalog.h>
#include <asset_matrix/common/env_loader.h>
#include <asset_matrix/config/run_config.h>
#include <asset_matrix/report/ranking_reporter.h>
#include <asset_matrix/report/result_store.h>

#include "runner/conda_process_runner.h"
#include "runtime/orchestrator.h"

namespace fs = std::filesystem;
using namespace asset_matrix;

struct TesterArgs {
    fs::path strategy;
    std::optional<fs::path> data_dir;
    std::optional<size_t> workers;
    std::optional<long> timeout;
    std::optional<fs::path> output;
    std::optional<std::string> env;
    std::optional<fs::path> config;
};

namespace {
std::atomic<runtime::MatrixOrchestrator*> g_orchestrator{nullptr};

extern "C" void HandleInterrupt(int) {
    if (auto* orchestrator = g_orchestrator.load()) {
        orchestrator->Cancel();
    }
}
} // namespace

void PrintUsage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " <strategy_file.py> [options]\n"
              << "Options:\n"
              << "  --data-dir PATH     Dataset directory (default: " << DEFAULT_DATA_DIR << ")\n"
              << "  --workers N         Number of parallel workers (default: CPU count)\n"
              << "  --timeout SECONDS   Timeout per test (default: " << DEFAULT_TASK_TIMEOUT.count() << ")\n"
              << "  --output FILE       Save results to this JSON file\n"
              << "                      (default: <results_dir>/<strategy>_<timestamp>.json)\n"
              << "  --env NAME          Conda environment (default: " << DEFAULT_CONDA_ENV << ")\n"
              << "  --config FILE       YAML run configuration\n"
              << "  --help              Show this help\n"
              << "Environment: " << ENV_DATA_DIR << ", " << ENV_RESULTS_DIR << ", "
              << ENV_CONDA_ENV << ", " << ENV_WORKERS << ", " << ENV_TIMEOUT << ", "
              << ENV_PYTHON << ", " << ENV_LOG_LEVEL << "\n";
}

long ParseCount(const char* flag, const std::string& value, const char* prog_name) {
    if (auto parsed = config::ParsePositiveInteger(value)) {
        return *parsed;
    }
    std::cerr << "Invalid value for " << flag << ": '" << value
              << "' (expected a positive integer)\n";
    PrintUsage(prog_name);
    exit(2);
}

TesterArgs ParseArgs(int argc, char* argv[]) {
    TesterArgs args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            exit(0);
        } else if (arg == "--data-dir" && i + 1 < argc) {
            args.data_dir = argv[++i];
        } else if (arg == "--workers" && i + 1 < argc) {
            args.workers = static_cast<size_t>(ParseCount("--workers", argv[++i], argv[0]));
        } else if (arg == "--timeout" && i + 1 < argc) {
            args.timeout = ParseCount("--timeout", argv[++i], argv[0]);
        } else if (arg == "--output" && i + 1 < argc) {
            args.output = argv[++i];
        } else if (arg == "--env" && i + 1 < argc) {
            args.env = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config = argv[++i];
        } else if (!arg.starts_with("--") && args.strategy.empty()) {
            args.strategy = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            PrintUsage(argv[0]);
            exit(2);
        }
    }

    if (args.strategy.empty()) {
        PrintUsage(argv[0]);
        exit(2);
    }
    return args;
}

void ConfigureLogging() {
    const auto level = ASSET_MATRIX_ENV(ENV_LOG_LEVEL);
    spdlog::set_level(level.empty() ? spdlog::level::info : spdlog::level::from_str(level));
}

int main(int argc, char* argv[]) {
    ConfigureLogging();

    try {
        const auto args = ParseArgs(argc, argv);

        if (!fs::is_regular_file(args.strategy)) {
            SPDLOG_ERROR("Strategy file not found: {}", args.strategy.string());
            return 1;
        }

        auto config = config::LoadRunConfig(args.config);
        if (args.data_dir) config.data_dir = *args.data_dir;
        if (args.workers) config.workers = *args.workers;
        if (args.timeout) config.timeout = std::chrono::seconds{*args.timeout};
        if (args.env) config.conda_env = *args.env;
        config.Validate();

        const auto assets = catalog::DiscoverAssets(config.data_dir, config.extension);

        auto runner = std::make_shared<runner::CondaProcessRunner>(config.python);
        runtime::MatrixOrchestrator orchestrator(runner);
        orchestrator.OnEvent(
            [](const runtime::events::OrchestratorEvent& event) {
                const auto& progress = std::get<runtime::events::ProgressEvent>(event);
                SPDLOG_INFO("Progress: {}/{} ({:.1f}%) - last: {}", progress.tasks_completed,
                            progress.tasks_total, progress.progress_percent, progress.last_asset);
            },
            runtime::events::EventFilter::ProgressOnly());

        g_orchestrator.store(&orchestrator);
        std::signal(SIGINT, HandleInterrupt);

        const auto options = config.ToRunOptions();
        auto results = orchestrator.Run(args.strategy, assets, options);

        std::signal(SIGINT, SIG_DFL);
        g_orchestrator.store(nullptr);

        std::cout << report::RenderSummary(report::Summarize(results));

        const auto strategyName = args.strategy.stem().string();
        report::ResultFile file{
            .timestamp = NowIsoTimestamp(),
            .strategy = strategyName,
            .total_tests = results.size(),
            .assets_tested = catalog::Symbols(assets),
            .max_workers = options.concurrency,
            .timeout = options.timeout.count(),
            .conda_env = options.environment_name,
            .results = std::move(results)};

        const auto outputPath = args.output.value_or(report::DefaultResultPath(
            config.results_dir, strategyName, std::chrono::system_clock::now()));
        report::WriteResultFile(outputPath, file, config.keep_output);

        if (orchestrator.IsCancellationRequested()) {
            SPDLOG_WARN("Run interrupted, partial results saved");
            return 130;
        }
        return 0;
    } catch (const std::exception& e) {
        g_orchestrator.store(nullptr);
        SPDLOG_ERROR("Multi-asset test failed: {}", e.what());
        return 1;
    }
}
