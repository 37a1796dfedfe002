#pragma once
//
// JSON persistence of matrix runs
//

#include <asset_matrix/core/test_result.h>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace asset_matrix::report {

struct ResultFile {
  std::string timestamp;
  std::string strategy;
  size_t total_tests{0};
  std::vector<std::string> assets_tested;
  size_t max_workers{0};
  int64_t timeout{0};
  std::string conda_env;
  TestResultList results;
};

// Absent metrics and absent error/output fields are omitted from the JSON.
// keepOutput = false drops captured stdout/stderr.
std::string SerializeResultFile(const ResultFile &file, bool keepOutput = true);

// Throws std::runtime_error with the parser's error text
ResultFile ParseResultFile(const std::string &json);

// Creates parent directories as needed
void WriteResultFile(const std::filesystem::path &path, const ResultFile &file,
                     bool keepOutput = true);

ResultFile ReadResultFile(const std::filesystem::path &path);

// <resultsDir>/<strategy>_<YYYYmmdd_HHMMSS>.json, UTC
std::filesystem::path DefaultResultPath(const std::filesystem::path &resultsDir,
                                        const std::string &strategy,
                                        std::chrono::system_clock::time_point now);

} // namespace asset_matrix::report
