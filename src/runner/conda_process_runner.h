#pragma once
//
// Runs strategy variants as child processes inside a conda environment
//

#include <asset_matrix/core/constants.h>
#include <asset_matrix/runner/istrategy_runner.h>
#include <vector>

namespace asset_matrix::runner {

class CondaProcessRunner final : public IStrategyRunner {
public:
  // Token in the launcher replaced by the environment name
  static constexpr std::string_view ENV_TOKEN = "{env}";

  explicit CondaProcessRunner(std::string python = std::string{DEFAULT_PYTHON});

  // argv prefix placed before the variant path,
  // default: conda run -n {env} <python>
  void SetLauncher(std::vector<std::string> launcher);

  void SetPollInterval(std::chrono::milliseconds interval) { m_pollInterval = interval; }

  RunOutcome Execute(const std::filesystem::path &variantPath,
                     const std::string &environmentName,
                     std::chrono::seconds timeout) override;

  [[nodiscard]] std::vector<std::string>
  BuildCommand(const std::filesystem::path &variantPath,
               const std::string &environmentName) const;

private:
  std::vector<std::string> m_launcher;
  std::chrono::milliseconds m_pollInterval{50};
};

// Last non-blank line of a process' stderr, typically the exception message
std::string LastNonBlankLine(const std::string &text);

} // namespace asset_matrix::runner
