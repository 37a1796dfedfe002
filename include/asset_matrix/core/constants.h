//
// Defaults shared by the orchestrator, the runner and the command-line tools
//

#pragma once
#include <chrono>
#include <cstddef>
#include <string_view>

namespace asset_matrix {

constexpr std::string_view DEFAULT_DATASET_EXTENSION = ".csv";
constexpr std::string_view DEFAULT_DATA_DIR = "src/data/ohlcv";
constexpr std::string_view DEFAULT_RESULTS_DIR = "src/data/multi_asset_results";
constexpr std::string_view DEFAULT_CONDA_ENV = "tflow";
constexpr std::string_view DEFAULT_PYTHON = "python";
constexpr std::chrono::seconds DEFAULT_TASK_TIMEOUT{300};

// Upper bound on worker threads for a single run
constexpr size_t MAX_CONCURRENCY = 256;

// mkdtemp template prefix, the strategy name is appended
constexpr std::string_view TEMP_DIR_PREFIX = "asset_matrix_";

// Thresholds for the "premium" section of the analysis report
constexpr double PREMIUM_MIN_SHARPE = 2.0;
constexpr double PREMIUM_MIN_RETURN = 0.0;

constexpr size_t ANALYSIS_TOP_N = 20;

// Longest prefix of an output line searched for metrics
constexpr size_t MAX_METRIC_LINE_LENGTH = 2048;

} // namespace asset_matrix
