#pragma once
//
// Tolerant extraction of performance metrics from free-form backtest output
//

#include <asset_matrix/core/test_result.h>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace asset_matrix::metrics {

struct MetricPatterns {
  MetricName metric;
  // Tried in order, first match whose capture parses as a number wins
  std::vector<std::regex> patterns;
};

const std::vector<MetricPatterns> &DefaultMetricPatterns();

// Never throws. Matching is per line, so '.' and '\s' never cross a newline;
// lines longer than MAX_METRIC_LINE_LENGTH are searched on their prefix only.
// Metrics that are not found are absent from the record.
MetricsRecord ExtractMetrics(const std::string &rawText);

MetricsRecord ExtractMetrics(const std::string &rawText,
                             const std::vector<MetricPatterns> &patterns);

// Locale-independent parse of a full capture; nullopt if not a finite number
std::optional<double> ParseNumber(const std::string &capture) noexcept;

} // namespace asset_matrix::metrics
