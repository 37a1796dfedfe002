//
// JSON persistence of matrix runs
//
#include <asset_matrix/report/result_store.h>
#include <format>
#include <fstream>
#include <glaze/glaze.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace asset_matrix {

// Wire shape of one TestResult, status as a lowercase string
struct TestResultJson {
  std::string strategy;
  std::string asset;
  std::string data_path;
  std::string status;
  std::optional<std::string> error;
  MetricsRecord metrics;
  double execution_time{0.0};
  std::string timestamp;
  std::optional<std::string> stdout_text;
  std::optional<std::string> stderr_text;

  static TestResultJson From(const TestResult &result, bool keepOutput) {
    TestResultJson json{
        .strategy = result.m_strategy,
        .asset = result.m_asset,
        .data_path = result.m_dataPath,
        .status = std::string{TestStatusToString(result.m_status)},
        .error = result.m_error,
        .metrics = result.m_metrics,
        .execution_time = result.m_executionTime,
        .timestamp = result.m_timestamp,
        .stdout_text = std::nullopt,
        .stderr_text = std::nullopt};
    if (keepOutput) {
      json.stdout_text = result.m_stdout;
      json.stderr_text = result.m_stderr;
    }
    return json;
  }

  [[nodiscard]] TestResult ToResult() const {
    TestResult result;
    result.m_strategy = strategy;
    result.m_asset = asset;
    result.m_dataPath = data_path;
    result.m_status = TestStatusFromString(status);
    result.m_error = error;
    // metrics only ever accompany a success
    if (result.m_status == TestStatus::Success) {
      result.m_metrics = metrics;
    }
    result.m_executionTime = execution_time;
    result.m_timestamp = timestamp;
    result.m_stdout = stdout_text;
    result.m_stderr = stderr_text;
    return result;
  }
};

namespace report::detail {
struct ResultFileJson {
  std::string timestamp;
  std::string strategy;
  size_t total_tests{0};
  std::vector<std::string> assets_tested;
  size_t max_workers{0};
  int64_t timeout{0};
  std::string conda_env;
  std::vector<TestResultJson> results;
};
} // namespace report::detail

} // namespace asset_matrix

namespace glz {
template <>
struct meta<asset_matrix::MetricsRecord> {
  using T = asset_matrix::MetricsRecord;
  static constexpr auto value = object(
      "return", &T::return_pct,
      "sharpe", &T::sharpe,
      "max_drawdown", &T::max_drawdown,
      "trades", &T::trades,
      "win_rate", &T::win_rate);
};

template <>
struct meta<asset_matrix::TestResultJson> {
  using T = asset_matrix::TestResultJson;
  static constexpr auto value = object(
      "strategy", &T::strategy,
      "asset", &T::asset,
      "data_path", &T::data_path,
      "status", &T::status,
      "error", &T::error,
      "metrics", &T::metrics,
      "execution_time", &T::execution_time,
      "timestamp", &T::timestamp,
      "stdout", &T::stdout_text,
      "stderr", &T::stderr_text);
};
} // namespace glz

namespace asset_matrix::report {

std::string SerializeResultFile(const ResultFile &file, bool keepOutput) {
  detail::ResultFileJson json{
      .timestamp = file.timestamp,
      .strategy = file.strategy,
      .total_tests = file.total_tests,
      .assets_tested = file.assets_tested,
      .max_workers = file.max_workers,
      .timeout = file.timeout,
      .conda_env = file.conda_env,
      .results = {}};
  json.results.reserve(file.results.size());
  for (const auto &result : file.results) {
    json.results.push_back(TestResultJson::From(result, keepOutput));
  }

  std::string buffer;
  auto ec = glz::write<glz::opts{.prettify = true}>(json, buffer);
  if (ec) {
    throw std::runtime_error(std::format("Failed to serialize results of {} to JSON",
                                         file.strategy));
  }
  return buffer;
}

ResultFile ParseResultFile(const std::string &json) {
  detail::ResultFileJson parsed;
  auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(parsed, json);
  if (ec) {
    throw std::runtime_error("Failed to parse result file: " + glz::format_error(ec, json));
  }

  ResultFile file{
      .timestamp = std::move(parsed.timestamp),
      .strategy = std::move(parsed.strategy),
      .total_tests = parsed.total_tests,
      .assets_tested = std::move(parsed.assets_tested),
      .max_workers = parsed.max_workers,
      .timeout = parsed.timeout,
      .conda_env = std::move(parsed.conda_env),
      .results = {}};
  file.results.reserve(parsed.results.size());
  for (const auto &entry : parsed.results) {
    file.results.push_back(entry.ToResult());
  }
  return file;
}

void WriteResultFile(const std::filesystem::path &path, const ResultFile &file,
                     bool keepOutput) {
  const auto content = SerializeResultFile(file, keepOutput);
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream out(path);
  if (!out.is_open()) {
    throw std::runtime_error("Failed to open file for writing: " + path.string());
  }
  out << content;
  if (!out) {
    throw std::runtime_error("Failed to write results to " + path.string());
  }
  SPDLOG_INFO("Results saved to {}", path.string());
}

ResultFile ReadResultFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Results file not found: " + path.string());
  }
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("Failed to open file for reading: " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  auto file = ParseResultFile(buffer.str());
  if (file.results.empty()) {
    SPDLOG_WARN("No results found in {}", path.string());
  } else {
    SPDLOG_INFO("Loaded {} test results from {}", file.results.size(), path.string());
  }
  return file;
}

std::filesystem::path DefaultResultPath(const std::filesystem::path &resultsDir,
                                        const std::string &strategy,
                                        std::chrono::system_clock::time_point now) {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(now);
  return resultsDir / std::format("{}_{:%Y%m%d_%H%M%S}.json", strategy, seconds);
}

} // namespace asset_matrix::report
