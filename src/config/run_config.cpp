//
// Run configuration loading
//
#include <asset_matrix/common/env_loader.h>
#include <asset_matrix/config/run_config.h>
#include <algorithm>
#include <array>
#include <charconv>
#include <format>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace asset_matrix::config {

namespace {

constexpr std::array<std::string_view, 8> KNOWN_KEYS{
    "data_dir", "results_dir", "workers", "timeout",
    "conda_env", "extension", "python", "keep_output"};

} // namespace

std::optional<long> ParsePositiveInteger(std::string_view value) {
  long parsed = 0;
  const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (value.empty() || ec != std::errc{} || end != value.data() + value.size() || parsed <= 0) {
    return std::nullopt;
  }
  return parsed;
}

std::string NormalizeExtension(std::string extension) {
  if (!extension.empty() && extension.front() != '.') {
    extension.insert(extension.begin(), '.');
  }
  return extension;
}

void RunConfig::Validate() const {
  if (workers == 0) {
    throw std::invalid_argument("workers must be at least 1");
  }
  if (workers > MAX_CONCURRENCY) {
    throw std::invalid_argument(
        std::format("workers must be at most {}, got {}", MAX_CONCURRENCY, workers));
  }
  if (timeout.count() <= 0) {
    throw std::invalid_argument(std::format("timeout must be positive, got {}s", timeout.count()));
  }
  if (extension.empty()) {
    throw std::invalid_argument("extension must not be empty");
  }
}

void ApplyEnvironment(RunConfig &config, const EnvLookup &lookup) {
  if (auto value = lookup(ENV_DATA_DIR)) config.data_dir = *value;
  if (auto value = lookup(ENV_RESULTS_DIR)) config.results_dir = *value;
  if (auto value = lookup(ENV_CONDA_ENV)) config.conda_env = *value;
  if (auto value = lookup(ENV_PYTHON)) config.python = *value;

  if (auto value = lookup(ENV_WORKERS)) {
    if (auto workers = ParsePositiveInteger(*value)) {
      config.workers = static_cast<size_t>(*workers);
    } else {
      SPDLOG_WARN("Ignoring {}='{}': not a positive integer", ENV_WORKERS, *value);
    }
  }
  if (auto value = lookup(ENV_TIMEOUT)) {
    if (auto timeout = ParsePositiveInteger(*value)) {
      config.timeout = std::chrono::seconds{*timeout};
    } else {
      SPDLOG_WARN("Ignoring {}='{}': not a positive integer", ENV_TIMEOUT, *value);
    }
  }
}

void ApplyYaml(RunConfig &config, const YAML::Node &node) {
  if (!node || node.IsNull()) {
    return;
  }
  if (!node.IsMap()) {
    throw std::runtime_error("Run configuration must be a YAML mapping");
  }

  for (const auto &entry : node) {
    const auto key = entry.first.as<std::string>();
    if (std::find(KNOWN_KEYS.begin(), KNOWN_KEYS.end(), key) == KNOWN_KEYS.end()) {
      throw std::runtime_error(std::format("Unknown run configuration key: {}", key));
    }
  }

  if (node["data_dir"]) config.data_dir = node["data_dir"].as<std::string>();
  if (node["results_dir"]) config.results_dir = node["results_dir"].as<std::string>();
  if (node["workers"]) config.workers = node["workers"].as<size_t>();
  if (node["timeout"]) config.timeout = std::chrono::seconds{node["timeout"].as<int64_t>()};
  if (node["conda_env"]) config.conda_env = node["conda_env"].as<std::string>();
  if (node["extension"]) config.extension = NormalizeExtension(node["extension"].as<std::string>());
  if (node["python"]) config.python = node["python"].as<std::string>();
  if (node["keep_output"]) config.keep_output = node["keep_output"].as<bool>();
}

RunConfig LoadRunConfig(const std::optional<std::filesystem::path> &yamlPath) {
  RunConfig config;
  ApplyEnvironment(config, [](const std::string &key) {
    return EnvLoader::instance().find(key);
  });

  if (yamlPath) {
    SPDLOG_INFO("Loading run configuration from {}", yamlPath->string());
    ApplyYaml(config, YAML::LoadFile(yamlPath->string()));
  }
  return config;
}

} // namespace asset_matrix::config

namespace YAML {
Node convert<asset_matrix::config::RunConfig>::encode(
    const asset_matrix::config::RunConfig &rhs) {
  Node node;
  node["data_dir"] = rhs.data_dir.string();
  node["results_dir"] = rhs.results_dir.string();
  node["workers"] = rhs.workers;
  node["timeout"] = static_cast<int64_t>(rhs.timeout.count());
  node["conda_env"] = rhs.conda_env;
  node["extension"] = rhs.extension;
  node["python"] = rhs.python;
  node["keep_output"] = rhs.keep_output;
  return node;
}
} // namespace YAML
