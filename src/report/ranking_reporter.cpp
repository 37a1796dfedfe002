//
// Ranking and analysis of matrix results
//
#include <asset_matrix/report/ranking_reporter.h>
#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>
#include <sstream>

namespace asset_matrix::report {

namespace {

const std::string RULE_HEAVY(80, '=');
const std::string RULE_LIGHT(80, '-');

std::string FormatMetric(const std::optional<double> &value, int precision) {
  if (!value) {
    return "N/A";
  }
  return std::format("{:.{}f}", *value, precision);
}

std::string FormatCount(const std::optional<double> &value) {
  if (!value) {
    return "N/A";
  }
  return std::format("{}", static_cast<long long>(*value));
}

// Sort by metric descending, results lacking it after all others, stable
void SortByMetricDescending(TestResultList &results, MetricName metric) {
  std::stable_sort(results.begin(), results.end(),
                   [metric](const TestResult &lhs, const TestResult &rhs) {
                     const auto l = lhs.GetMetrics().Get(metric);
                     const auto r = rhs.GetMetrics().Get(metric);
                     if (l && r) return *l > *r;
                     return l.has_value() && !r.has_value();
                   });
}

std::optional<double> Mean(const std::vector<double> &values) {
  if (values.empty()) {
    return std::nullopt;
  }
  return std::accumulate(values.begin(), values.end(), 0.0) /
         static_cast<double>(values.size());
}

} // namespace

RunSummary Summarize(const TestResultList &results) {
  RunSummary summary;
  summary.total_tests = results.size();
  if (!results.empty()) {
    summary.strategy = results.front().GetStrategy();
  }

  for (const auto &result : results) {
    switch (result.GetStatus()) {
    case TestStatus::Success:
      ++summary.succeeded;
      if (result.GetMetrics().sharpe) {
        summary.ranking.push_back(result);
      }
      break;
    case TestStatus::Failed:
    case TestStatus::Error:
      ++summary.failed;
      break;
    case TestStatus::Timeout:
      ++summary.timed_out;
      break;
    case TestStatus::Unknown:
      break;
    }
  }

  SortByMetricDescending(summary.ranking, MetricName::Sharpe);

  std::vector<double> sharpes, returns;
  for (const auto &entry : summary.ranking) {
    sharpes.push_back(*entry.GetMetrics().sharpe);
    if (const auto ret = entry.GetMetrics().return_pct) {
      returns.push_back(*ret);
    }
  }
  summary.mean_sharpe = Mean(sharpes);
  summary.mean_return = Mean(returns);
  return summary;
}

std::string RenderSummary(const RunSummary &summary) {
  if (summary.total_tests == 0) {
    return "No results to summarize\n";
  }

  std::ostringstream out;
  out << RULE_HEAVY << '\n'
      << "MULTI-ASSET TEST SUMMARY\n"
      << RULE_HEAVY << '\n'
      << std::format("Strategy: {}\n", summary.strategy)
      << std::format("Total tests: {}\n", summary.total_tests)
      << std::format("Successful: {} ({:.1f}%)\n", summary.succeeded, summary.SuccessRate())
      << std::format("Failed: {}\n", summary.failed);
  if (summary.timed_out > 0) {
    out << std::format("Timed out: {}\n", summary.timed_out);
  }
  out << '\n';

  if (summary.ranking.empty()) {
    out << "No successful tests with metrics found\n" << RULE_HEAVY << '\n';
    return out.str();
  }

  out << "ASSET RANKING (by Sharpe Ratio):\n"
      << RULE_LIGHT << '\n'
      << std::format("{:<6} {:<15} {:<10} {:<12} {:<10} {:<10}\n", "Rank", "Asset",
                     "Sharpe", "Return%", "Trades", "Win%")
      << RULE_LIGHT << '\n';

  size_t rank = 1;
  for (const auto &entry : summary.ranking) {
    const auto &metrics = entry.GetMetrics();
    out << std::format("{:<6} {:<15} {:<10} {:<12} {:<10} {:<10}\n", rank++,
                       entry.GetAsset(), FormatMetric(metrics.sharpe, 2),
                       FormatMetric(metrics.return_pct, 2), FormatCount(metrics.trades),
                       FormatMetric(metrics.win_rate, 1));
  }
  out << '\n';

  const auto *best = summary.Best();
  const auto *worst = summary.Worst();
  out << std::format("Best Asset: {} (Sharpe: {}, Return: {}%)\n", best->GetAsset(),
                     FormatMetric(best->GetMetrics().sharpe, 2),
                     FormatMetric(best->GetMetrics().return_pct, 2))
      << std::format("Worst Asset: {} (Sharpe: {}, Return: {}%)\n", worst->GetAsset(),
                     FormatMetric(worst->GetMetrics().sharpe, 2),
                     FormatMetric(worst->GetMetrics().return_pct, 2))
      << '\n'
      << "Average Performance Across Assets:\n"
      << std::format("   Avg Sharpe: {}\n", FormatMetric(summary.mean_sharpe, 2))
      << std::format("   Avg Return: {}%\n", FormatMetric(summary.mean_return, 2))
      << RULE_HEAVY << '\n';
  return out.str();
}

TestResultList FilterSuccessful(const TestResultList &results,
                                const FilterCriteria &criteria) {
  const auto passes = [](const std::optional<double> &value,
                         const std::optional<double> &threshold) {
    return !threshold || (value && *value >= *threshold);
  };

  TestResultList filtered;
  for (const auto &result : results) {
    if (!result.IsSuccess()) continue;
    const auto &metrics = result.GetMetrics();
    if (passes(metrics.sharpe, criteria.min_sharpe) &&
        passes(metrics.return_pct, criteria.min_return) &&
        passes(metrics.trades, criteria.min_trades)) {
      filtered.push_back(result);
    }
  }
  SortByMetricDescending(filtered, MetricName::Sharpe);
  return filtered;
}

TestResultList TopBy(const TestResultList &results, MetricName metric, size_t n) {
  TestResultList candidates;
  for (const auto &result : results) {
    if (result.IsSuccess() && result.GetMetrics().Get(metric)) {
      candidates.push_back(result);
    }
  }
  SortByMetricDescending(candidates, metric);
  if (candidates.size() > n) {
    candidates.erase(candidates.begin() + static_cast<std::ptrdiff_t>(n), candidates.end());
  }
  return candidates;
}

std::vector<double> CollectMetric(const TestResultList &results, MetricName metric) {
  std::vector<double> values;
  for (const auto &result : results) {
    if (!result.IsSuccess()) continue;
    if (const auto value = result.GetMetrics().Get(metric)) {
      values.push_back(*value);
    }
  }
  return values;
}

std::optional<DescriptiveStats> Describe(std::vector<double> values) {
  if (values.empty()) {
    return std::nullopt;
  }
  std::sort(values.begin(), values.end());

  DescriptiveStats stats;
  stats.count = values.size();
  stats.min = values.front();
  stats.max = values.back();
  stats.mean = *Mean(values);

  const size_t mid = values.size() / 2;
  stats.median = values.size() % 2 == 0 ? (values[mid - 1] + values[mid]) / 2.0 : values[mid];

  if (values.size() > 1) {
    double squares = 0.0;
    for (double v : values) {
      squares += (v - stats.mean) * (v - stats.mean);
    }
    stats.std_dev = std::sqrt(squares / static_cast<double>(values.size() - 1));
  }
  return stats;
}

std::string RenderAnalysisReport(const TestResultList &results,
                                 const std::string &sourceName,
                                 const std::string &generatedAt,
                                 size_t topN) {
  std::ostringstream out;
  out << RULE_HEAVY << '\n'
      << "BACKTEST RESULTS ANALYSIS REPORT\n"
      << RULE_HEAVY << '\n'
      << std::format("Generated: {}\n", generatedAt)
      << std::format("Source file: {}\n\n", sourceName);

  size_t succeeded = 0, failed = 0, errors = 0, timeouts = 0;
  for (const auto &result : results) {
    switch (result.GetStatus()) {
    case TestStatus::Success: ++succeeded; break;
    case TestStatus::Failed: ++failed; break;
    case TestStatus::Error: ++errors; break;
    case TestStatus::Timeout: ++timeouts; break;
    case TestStatus::Unknown: break;
    }
  }
  const double successRate =
      results.empty() ? 0.0
                      : 100.0 * static_cast<double>(succeeded) / static_cast<double>(results.size());

  out << "OVERALL STATISTICS\n"
      << RULE_LIGHT << '\n'
      << std::format("Total tests:          {}\n", results.size())
      << std::format("Successful:           {} ({:.1f}%)\n", succeeded, successRate)
      << std::format("Failed:               {}\n", failed)
      << std::format("Errors:               {}\n", errors)
      << std::format("Timeouts:             {}\n\n", timeouts);

  if (succeeded > 0) {
    out << "PERFORMANCE METRICS (successful tests only)\n" << RULE_LIGHT << '\n';

    if (const auto sharpe = Describe(CollectMetric(results, MetricName::Sharpe))) {
      out << "Sharpe Ratio:\n"
          << std::format("  Mean:      {:.2f}\n", sharpe->mean)
          << std::format("  Median:    {:.2f}\n", sharpe->median)
          << std::format("  Max:       {:.2f}\n", sharpe->max)
          << std::format("  Min:       {:.2f}\n", sharpe->min)
          << std::format("  Std Dev:   {}\n\n", FormatMetric(sharpe->std_dev, 2));
    }
    if (const auto returns = Describe(CollectMetric(results, MetricName::Return))) {
      out << "Return %:\n"
          << std::format("  Mean:      {:.2f}%\n", returns->mean)
          << std::format("  Median:    {:.2f}%\n", returns->median)
          << std::format("  Max:       {:.2f}%\n", returns->max)
          << std::format("  Min:       {:.2f}%\n", returns->min)
          << std::format("  Std Dev:   {}%\n\n", FormatMetric(returns->std_dev, 2));
    }
    if (const auto trades = Describe(CollectMetric(results, MetricName::Trades))) {
      out << "Number of Trades:\n"
          << std::format("  Mean:      {:.0f}\n", trades->mean)
          << std::format("  Median:    {:.0f}\n", trades->median)
          << std::format("  Max:       {:.0f}\n", trades->max)
          << std::format("  Min:       {:.0f}\n\n", trades->min);
    }

    const auto top = TopBy(results, MetricName::Sharpe, topN);
    if (!top.empty()) {
      out << std::format("TOP {} STRATEGIES (by Sharpe Ratio)\n", topN)
          << RULE_LIGHT << '\n'
          << std::format("{:<6} {:<40} {:<10} {:<12} {:<10}\n", "Rank", "Strategy @ Asset",
                         "Sharpe", "Return%", "Trades")
          << RULE_LIGHT << '\n';
      size_t rank = 1;
      for (const auto &entry : top) {
        auto name = std::format("{} @ {}", entry.GetStrategy(), entry.GetAsset());
        if (name.size() > 38) name.resize(38);
        const auto &metrics = entry.GetMetrics();
        out << std::format("{:<6} {:<40} {:<10} {:<12} {:<10}\n", rank++, name,
                           FormatMetric(metrics.sharpe, 2), FormatMetric(metrics.return_pct, 2),
                           FormatCount(metrics.trades));
      }
      out << '\n';
    }

    const auto premium = FilterSuccessful(
        results, FilterCriteria{.min_sharpe = PREMIUM_MIN_SHARPE,
                                .min_return = PREMIUM_MIN_RETURN,
                                .min_trades = std::nullopt});
    if (!premium.empty()) {
      out << std::format("PREMIUM STRATEGIES (Sharpe > {:.1f}, Return > {:.0f}%): {}\n",
                         PREMIUM_MIN_SHARPE, PREMIUM_MIN_RETURN, premium.size())
          << RULE_LIGHT << '\n';
      for (size_t i = 0; i < std::min<size_t>(premium.size(), 10); ++i) {
        const auto &entry = premium[i];
        out << std::format("  {}. {} @ {} - Sharpe: {}, Return: {}%\n", i + 1,
                           entry.GetStrategy(), entry.GetAsset(),
                           FormatMetric(entry.GetMetrics().sharpe, 2),
                           FormatMetric(entry.GetMetrics().return_pct, 2));
      }
      out << '\n';
    }
  }

  out << RULE_HEAVY << '\n';
  return out.str();
}

} // namespace asset_matrix::report
