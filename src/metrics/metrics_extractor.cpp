//
// Tolerant extraction of performance metrics from free-form backtest output
//
#include <asset_matrix/core/constants.h>
#include <asset_matrix/metrics/metrics_extractor.h>
#include <algorithm>
#include <charconv>
#include <cmath>
#include <spdlog/spdlog.h>
#include <string_view>

namespace asset_matrix::metrics {

namespace {
std::regex Pattern(const char *expr) {
  return std::regex(expr, std::regex_constants::ECMAScript | std::regex_constants::icase);
}

using LineRange = std::pair<std::string::const_iterator, std::string::const_iterator>;

// Lines of the text, each clipped to MAX_METRIC_LINE_LENGTH. libstdc++ matches
// recursively, so an unbounded line can exhaust a worker thread's stack.
std::vector<LineRange> SplitLines(const std::string &text) {
  std::vector<LineRange> lines;
  auto begin = text.cbegin();
  while (begin != text.cend()) {
    auto end = std::find(begin, text.cend(), '\n');
    const auto length = static_cast<size_t>(end - begin);
    lines.emplace_back(begin, begin + static_cast<std::ptrdiff_t>(
                                          std::min(length, MAX_METRIC_LINE_LENGTH)));
    begin = end == text.cend() ? end : end + 1;
  }
  return lines;
}

// First line the pattern matches, searched top to bottom
std::optional<std::string> FirstCapture(const std::vector<LineRange> &lines,
                                        const std::regex &pattern) {
  for (const auto &[begin, end] : lines) {
    std::match_results<std::string::const_iterator> match;
    if (std::regex_search(begin, end, match, pattern) && match.size() >= 2) {
      return match[1].str();
    }
  }
  return std::nullopt;
}
} // namespace

const std::vector<MetricPatterns> &DefaultMetricPatterns() {
  static const std::vector<MetricPatterns> patterns{
      {MetricName::Return,
       {Pattern(R"(Return\s*\[%\]\s*([+-]?\d+\.?\d*))"),
        Pattern(R"(Total Return.*?([+-]?\d+\.?\d*)%)"),
        Pattern(R"(Return.*?([+-]?\d+\.?\d*))")}},
      {MetricName::Sharpe,
       {Pattern(R"(Sharpe Ratio\s*([+-]?\d+\.?\d*))"),
        Pattern(R"(Sharpe\s*([+-]?\d+\.?\d*))")}},
      {MetricName::MaxDrawdown,
       {Pattern(R"(Max\.?\s*Drawdown\s*\[%\]\s*([+-]?\d+\.?\d*))"),
        Pattern(R"(Max\.?\s*DD.*?([+-]?\d+\.?\d*))")}},
      {MetricName::Trades,
       {Pattern(R"(# Trades\s*(\d+))"),
        Pattern(R"(Trades\s*(\d+))"),
        Pattern(R"(Number of trades.*?(\d+))")}},
      {MetricName::WinRate,
       {Pattern(R"(Win Rate\s*\[%\]\s*(\d+\.?\d*))"),
        Pattern(R"(Win Rate.*?(\d+\.?\d*)%)")}},
  };
  return patterns;
}

std::optional<double> ParseNumber(const std::string &capture) noexcept {
  std::string_view text{capture};
  // from_chars does not accept an explicit plus sign
  if (text.starts_with('+') && !text.substr(1).starts_with('-')) {
    text.remove_prefix(1);
  }

  double value = 0.0;
  const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || end != text.data() + text.size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

MetricsRecord ExtractMetrics(const std::string &rawText) {
  return ExtractMetrics(rawText, DefaultMetricPatterns());
}

MetricsRecord ExtractMetrics(const std::string &rawText,
                             const std::vector<MetricPatterns> &patterns) {
  MetricsRecord record;
  if (rawText.empty()) {
    return record;
  }

  const auto lines = SplitLines(rawText);
  for (const auto &[metric, candidates] : patterns) {
    for (const auto &pattern : candidates) {
      std::optional<std::string> capture;
      try {
        capture = FirstCapture(lines, pattern);
      } catch (const std::regex_error &exp) {
        SPDLOG_DEBUG("Metric pattern for {} failed: {}", MetricNameToString(metric),
                     exp.what());
        continue;
      }

      if (!capture) {
        continue;
      }
      if (auto value = ParseNumber(*capture)) {
        record.Set(metric, *value);
        break;
      }
    }
  }
  return record;
}

} // namespace asset_matrix::metrics
