#pragma once
//
// Run configuration: defaults < environment < YAML file < command line
//

#include <asset_matrix/core/constants.h>
#include <asset_matrix/runtime/iorchestrator.h>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <yaml-cpp/yaml.h>

namespace asset_matrix::config {

struct RunConfig {
  std::filesystem::path data_dir{DEFAULT_DATA_DIR};
  std::filesystem::path results_dir{DEFAULT_RESULTS_DIR};
  size_t workers{runtime::DefaultConcurrency()};
  std::chrono::seconds timeout{DEFAULT_TASK_TIMEOUT};
  std::string conda_env{DEFAULT_CONDA_ENV};
  std::string extension{DEFAULT_DATASET_EXTENSION};
  std::string python{DEFAULT_PYTHON};
  bool keep_output{true};

  [[nodiscard]] runtime::RunOptions ToRunOptions() const {
    return runtime::RunOptions{workers, timeout, conda_env};
  }

  // Throws std::invalid_argument on a non-positive worker count or timeout
  void Validate() const;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

// Overrides fields from ASSET_MATRIX_* variables; unparsable numbers are
// logged and ignored
void ApplyEnvironment(RunConfig &config, const EnvLookup &lookup);

// Overrides the fields present in node. Unknown keys throw std::runtime_error.
void ApplyYaml(RunConfig &config, const YAML::Node &node);

// Defaults, then the process environment (.env.local included), then the
// optional YAML file
RunConfig LoadRunConfig(const std::optional<std::filesystem::path> &yamlPath);

// Whole-string decimal integer greater than zero, otherwise nullopt
std::optional<long> ParsePositiveInteger(std::string_view value);

// Normalizes "csv" to ".csv"
std::string NormalizeExtension(std::string extension);

} // namespace asset_matrix::config

namespace YAML {
template <>
struct convert<asset_matrix::config::RunConfig> {
  static Node encode(const asset_matrix::config::RunConfig &rhs);

  static bool decode(const Node &node, asset_matrix::config::RunConfig &rhs) {
    asset_matrix::config::ApplyYaml(rhs, node);
    return true;
  }
};
} // namespace YAML
