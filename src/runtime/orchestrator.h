//
// Matrix orchestrator: one strategy, every asset, bounded worker pool
//

#pragma once
#include <asset_matrix/runtime/iorchestrator.h>
#include <asset_matrix/variant/variant_generator.h>
#include "events/cancellation_token.h"
#include "events/event_dispatcher.h"
#include <atomic>

namespace asset_matrix::runtime {

class MatrixOrchestrator final : public IMatrixOrchestrator {
public:
  explicit MatrixOrchestrator(runner::IStrategyRunner::Ptr runner,
                              variant::VariantGenerator generator = {});

  TestResultList Run(const std::filesystem::path &strategyPath,
                     const catalog::AssetMap &catalog,
                     const RunOptions &options) override;

  // ====================================================================
  // Event Subscription API
  // ====================================================================

  boost::signals2::connection OnEvent(
      events::OrchestratorEventSlot handler,
      events::EventFilter filter = events::EventFilter::All());

  events::IEventDispatcherPtr GetEventDispatcher() const;

  // ====================================================================
  // Cancellation API
  // ====================================================================

  // Stops releasing further tasks. In-flight tasks run to completion or
  // timeout and Run returns the results of the released tasks.
  // Safe to call from any thread. Stays set until ResetCancellation.
  void Cancel();

  [[nodiscard]] bool IsCancellationRequested() const;

  void ResetCancellation();

  // The run's temp directory is created under this root (default: system temp)
  void SetTempRoot(std::filesystem::path root) { m_tempRoot = std::move(root); }

private:
  runner::IStrategyRunner::Ptr m_runner;
  variant::VariantGenerator m_generator;
  std::filesystem::path m_tempRoot;

  events::IEventDispatcherPtr m_eventDispatcher;
  events::CancellationTokenPtr m_cancellationToken;

  std::atomic<size_t> m_tasksCompleted{0};

  TestResult ExecuteTask(const TestTask &task, const std::string &strategyName,
                         const RunOptions &options) const;

  void RecordCompletion(const TestResult &result, size_t total);
};

} // namespace asset_matrix::runtime
