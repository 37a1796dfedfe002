#pragma once
//
// Fan-out of one strategy across a catalog of assets
//
#include <asset_matrix/catalog/asset_catalog.h>
#include <asset_matrix/core/constants.h>
#include <asset_matrix/core/test_result.h>
#include <asset_matrix/runner/istrategy_runner.h>
#include <chrono>
#include <memory>

namespace asset_matrix::runtime {

// std::thread::hardware_concurrency(), at least 1
size_t DefaultConcurrency();

struct RunOptions {
  size_t concurrency{DefaultConcurrency()};
  std::chrono::seconds timeout{DEFAULT_TASK_TIMEOUT};
  std::string environment_name{DEFAULT_CONDA_ENV};
};

struct IMatrixOrchestrator {
  using Ptr = std::unique_ptr<IMatrixOrchestrator>;

  /**
   * @brief Run the strategy once per cataloged asset.
   *
   * Returns exactly one TestResult per released task, in completion order.
   * Task failures are recorded in the results; only failing to set up the
   * run (temp directory, worker pool) throws.
   */
  virtual TestResultList Run(const std::filesystem::path &strategyPath,
                             const catalog::AssetMap &catalog,
                             const RunOptions &options) = 0;

  virtual ~IMatrixOrchestrator() = default;
};

IMatrixOrchestrator::Ptr
CreateMatrixOrchestrator(runner::IStrategyRunner::Ptr runner);

} // namespace asset_matrix::runtime
