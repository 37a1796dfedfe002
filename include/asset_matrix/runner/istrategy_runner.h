#pragma once
//
// Execution of one strategy variant in an isolated environment
//

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace asset_matrix::runner {

struct RunOutcome {
  bool success{false};
  bool timed_out{false};
  std::string stdout_text;
  std::string stderr_text;
  std::optional<std::string> error;
};

/**
 * @brief Blocking executor for a strategy variant.
 *
 * Implementations must return within roughly @p timeout; a run that exceeds
 * it is reported with timed_out = true rather than by blocking further.
 * Implementations are called concurrently from the worker pool.
 */
struct IStrategyRunner {
  using Ptr = std::shared_ptr<IStrategyRunner>;

  virtual RunOutcome Execute(const std::filesystem::path &variantPath,
                             const std::string &environmentName,
                             std::chrono::seconds timeout) = 0;

  virtual ~IStrategyRunner() = default;
};

} // namespace asset_matrix::runner
