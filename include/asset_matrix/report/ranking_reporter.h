#pragma once
//
// Ranking and analysis of matrix results
//

#include <asset_matrix/core/constants.h>
#include <asset_matrix/core/test_result.h>
#include <optional>
#include <string>
#include <vector>

namespace asset_matrix::report {

struct RunSummary {
  std::string strategy;
  size_t total_tests{0};
  size_t succeeded{0};
  // failed and error outcomes
  size_t failed{0};
  size_t timed_out{0};

  // Successes carrying a Sharpe ratio, non-increasing by Sharpe, ties in input order
  TestResultList ranking;

  std::optional<double> mean_sharpe;
  // Over the ranked entries that carry a return
  std::optional<double> mean_return;

  [[nodiscard]] const TestResult *Best() const {
    return ranking.empty() ? nullptr : &ranking.front();
  }
  [[nodiscard]] const TestResult *Worst() const {
    return ranking.empty() ? nullptr : &ranking.back();
  }
  [[nodiscard]] double SuccessRate() const {
    return total_tests == 0 ? 0.0 : 100.0 * static_cast<double>(succeeded) /
                                        static_cast<double>(total_tests);
  }
};

RunSummary Summarize(const TestResultList &results);

std::string RenderSummary(const RunSummary &summary);

struct FilterCriteria {
  std::optional<double> min_sharpe;
  std::optional<double> min_return;
  std::optional<double> min_trades;

  [[nodiscard]] bool Empty() const {
    return !min_sharpe && !min_return && !min_trades;
  }
};

/**
 * @brief Successes meeting every given threshold (inclusive).
 *
 * A threshold on a metric the result does not carry excludes the result.
 * Sorted by Sharpe descending, entries without Sharpe last, stable.
 */
TestResultList FilterSuccessful(const TestResultList &results,
                                const FilterCriteria &criteria);

// The n successes with the highest value of metric, results lacking it excluded
TestResultList TopBy(const TestResultList &results, MetricName metric, size_t n);

struct DescriptiveStats {
  size_t count{0};
  double mean{0.0};
  double median{0.0};
  double max{0.0};
  double min{0.0};
  // Sample standard deviation, absent below two values
  std::optional<double> std_dev;
};

std::optional<DescriptiveStats> Describe(std::vector<double> values);

// Values of metric over the successful results that carry it
std::vector<double> CollectMetric(const TestResultList &results, MetricName metric);

std::string RenderAnalysisReport(const TestResultList &results,
                                 const std::string &sourceName,
                                 const std::string &generatedAt,
                                 size_t topN = ANALYSIS_TOP_N);

} // namespace asset_matrix::report
