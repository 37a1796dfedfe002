//
// Matrix orchestrator implementation
//

#include "orchestrator.h"
#include "scoped_temp_dir.h"
#include <asset_matrix/metrics/metrics_extractor.h>
#include <algorithm>
#include <format>
#include <spdlog/spdlog.h>
#include <tbb/flow_graph.h>
#include <tbb/global_control.h>
#include <tbb/task_arena.h>
#include <thread>

namespace fs = std::filesystem;

namespace asset_matrix::runtime {

size_t DefaultConcurrency() {
  return std::clamp<size_t>(std::thread::hardware_concurrency(), 1, MAX_CONCURRENCY);
}

IMatrixOrchestrator::Ptr
CreateMatrixOrchestrator(runner::IStrategyRunner::Ptr runner) {
  return std::make_unique<MatrixOrchestrator>(std::move(runner));
}

MatrixOrchestrator::MatrixOrchestrator(runner::IStrategyRunner::Ptr runner,
                                       variant::VariantGenerator generator)
    : m_runner(std::move(runner)), m_generator(std::move(generator)),
      m_tempRoot(fs::temp_directory_path()),
      m_eventDispatcher(events::MakeEventDispatcher()),
      m_cancellationToken(events::MakeCancellationToken()) {
  if (!m_runner) {
    throw std::invalid_argument("MatrixOrchestrator requires a strategy runner");
  }
}

TestResultList MatrixOrchestrator::Run(const fs::path &strategyPath,
                                       const catalog::AssetMap &catalog,
                                       const RunOptions &options) {
  const auto strategyName = strategyPath.stem().string();

  if (catalog.empty()) {
    SPDLOG_WARN("No assets available for testing {}", strategyName);
    return {};
  }
  if (options.concurrency == 0) {
    throw std::invalid_argument("Run concurrency must be at least 1");
  }
  if (options.concurrency > MAX_CONCURRENCY) {
    throw std::invalid_argument(std::format("Run concurrency {} exceeds the maximum of {}",
                                            options.concurrency, MAX_CONCURRENCY));
  }

  auto startTime = events::Now();
  m_tasksCompleted.store(0);

  ScopedTempDir tempDir(std::format("{}{}_", TEMP_DIR_PREFIX, strategyName), m_tempRoot);

  std::vector<TestTask> tasks;
  tasks.reserve(catalog.size());
  for (const auto &asset : catalog::ToAssets(catalog)) {
    tasks.push_back(TestTask{strategyPath, asset, tempDir.Path()});
  }
  const size_t total = tasks.size();

  SPDLOG_INFO("Multi-asset testing for {}: {} assets, {} workers, timeout {}s, env {}",
              strategyName, total, options.concurrency, options.timeout.count(),
              options.environment_name);
  SPDLOG_INFO("Temp directory: {}", tempDir.Path().string());

  m_eventDispatcher->Emit(events::RunStartedEvent{
      .timestamp = startTime,
      .strategy = strategyName,
      .total_tasks = total,
      .concurrency = options.concurrency,
      .asset_symbols = catalog::Symbols(catalog)
  });

  TestResultList results;
  results.reserve(total);
  size_t released = 0;

  // Tasks mostly wait on child processes, so concurrency may exceed the core
  // count. The global limit defaults to the hardware threads and would cap
  // the arena; the extra slot is the thread calling Run.
  tbb::global_control parallelism(tbb::global_control::max_allowed_parallelism,
                                  options.concurrency + 1);
  tbb::task_arena arena(static_cast<int>(options.concurrency));
  arena.execute([&] {
    tbb::flow::graph graph;

    // Called serially by TBB; stops releasing once cancelled
    tbb::flow::input_node<TestTask> source(graph, [&](tbb::flow_control &fc) -> TestTask {
      if (released >= tasks.size() || m_cancellationToken->IsCancelled()) {
        fc.stop();
        return {};
      }
      return tasks[released++];
    });

    // Rejecting policy: no internal queue, so the source only releases a
    // task when a worker slot is free
    tbb::flow::function_node<TestTask, TestResult, tbb::flow::rejecting> worker(
        graph, options.concurrency,
        [&](const TestTask &task) { return ExecuteTask(task, strategyName, options); });

    tbb::flow::function_node<TestResult> aggregator(
        graph, tbb::flow::serial, [&](const TestResult &result) {
          results.push_back(result);
          RecordCompletion(result, total);
          return tbb::flow::continue_msg{};
        });

    tbb::flow::make_edge(source, worker);
    tbb::flow::make_edge(worker, aggregator);
    source.activate();
    graph.wait_for_all();
  });

  if (m_cancellationToken->IsCancelled()) {
    SPDLOG_WARN("Run of {} cancelled after {}/{} tasks", strategyName, results.size(), total);
    m_eventDispatcher->Emit(events::RunCancelledEvent{
        .timestamp = events::Now(),
        .elapsed = events::ToMillis(events::Now() - startTime),
        .tasks_completed = results.size(),
        .tasks_total = total
    });
    return results;
  }

  size_t succeeded = 0, failed = 0, errored = 0, timedOut = 0;
  for (const auto &result : results) {
    switch (result.GetStatus()) {
    case TestStatus::Success:
      ++succeeded;
      break;
    case TestStatus::Failed:
      ++failed;
      break;
    case TestStatus::Timeout:
      ++timedOut;
      break;
    default:
      ++errored;
      break;
    }
  }

  SPDLOG_INFO("Testing complete! {} tests finished", results.size());
  m_eventDispatcher->Emit(events::RunCompletedEvent{
      .timestamp = events::Now(),
      .duration = events::ToMillis(events::Now() - startTime),
      .tasks_succeeded = succeeded,
      .tasks_failed = failed,
      .tasks_errored = errored,
      .tasks_timed_out = timedOut
  });
  return results;
}

TestResult MatrixOrchestrator::ExecuteTask(const TestTask &task,
                                           const std::string &strategyName,
                                           const RunOptions &options) const {
  const auto tag = std::format("[{} @ {}]", strategyName, task.asset.symbol);
  const auto startTime = events::Now();
  TestResult result(strategyName, task.asset);

  m_eventDispatcher->Emit(events::TaskStartedEvent{
      .timestamp = startTime,
      .strategy = strategyName,
      .asset = task.asset.symbol
  });

  try {
    SPDLOG_INFO("{} Starting backtest...", tag);
    const auto source = variant::ReadSourceFile(task.strategy_path);
    const auto variant =
        m_generator.Generate(source, task.strategy_path, task.asset, task.temp_dir);

    auto outcome = m_runner->Execute(variant.path, options.environment_name, options.timeout);

    if (outcome.success) {
      auto metrics = metrics::ExtractMetrics(outcome.stdout_text);
      result.MarkSucceeded(std::move(metrics), std::move(outcome.stdout_text),
                           std::move(outcome.stderr_text));
    } else if (outcome.timed_out) {
      result.MarkTimedOut(
          outcome.error.value_or(std::format("Timed out after {}s", options.timeout.count())),
          std::move(outcome.stderr_text));
    } else {
      auto error = outcome.error.value_or(outcome.stderr_text);
      result.MarkFailed(std::move(error), std::move(outcome.stderr_text));
    }
  } catch (const std::exception &exp) {
    result.MarkError(exp.what());
  } catch (...) {
    result.MarkError("Unknown exception");
  }

  const auto elapsed = events::Now() - startTime;
  result.SetExecutionTime(std::chrono::duration<double>(elapsed).count());
  result.SetTimestamp(NowIsoTimestamp());

  if (result.IsSuccess()) {
    const auto &metrics = result.GetMetrics();
    SPDLOG_INFO("{} Success ({:.1f}s) - Sharpe: {}, Return: {}%", tag,
                result.GetExecutionTime(),
                metrics.sharpe ? std::format("{:.2f}", *metrics.sharpe) : "N/A",
                metrics.return_pct ? std::format("{:.2f}", *metrics.return_pct) : "N/A");
    m_eventDispatcher->Emit(events::TaskCompletedEvent{
        .timestamp = events::Now(),
        .strategy = strategyName,
        .asset = task.asset.symbol,
        .duration = events::ToMillis(elapsed),
        .sharpe = metrics.sharpe
    });
  } else {
    const auto &error = result.GetError().value_or("");
    if (result.GetStatus() == TestStatus::Error) {
      SPDLOG_ERROR("{} Exception: {}", tag, error);
    } else {
      SPDLOG_WARN("{} {}: {}", tag, TestStatusToString(result.GetStatus()), error);
    }
    m_eventDispatcher->Emit(events::TaskFailedEvent{
        .timestamp = events::Now(),
        .strategy = strategyName,
        .asset = task.asset.symbol,
        .status = result.GetStatus(),
        .error_message = error
    });
  }
  return result;
}

void MatrixOrchestrator::RecordCompletion(const TestResult &result, size_t total) {
  const size_t completed = m_tasksCompleted.fetch_add(1) + 1;
  const double percent = static_cast<double>(completed) / static_cast<double>(total) * 100.0;
  SPDLOG_DEBUG("Progress: {}/{} ({:.1f}%)", completed, total, percent);
  m_eventDispatcher->Emit(events::ProgressEvent{
      .timestamp = events::Now(),
      .tasks_completed = completed,
      .tasks_total = total,
      .progress_percent = percent,
      .last_asset = result.GetAsset()
  });
}

// ============================================================================
// Event Subscription API Implementation
// ============================================================================

boost::signals2::connection MatrixOrchestrator::OnEvent(
    events::OrchestratorEventSlot handler,
    events::EventFilter filter) {
  return m_eventDispatcher->Subscribe(std::move(handler), std::move(filter));
}

events::IEventDispatcherPtr MatrixOrchestrator::GetEventDispatcher() const {
  return m_eventDispatcher;
}

// ============================================================================
// Cancellation API Implementation
// ============================================================================

void MatrixOrchestrator::Cancel() {
  m_cancellationToken->Cancel();
}

bool MatrixOrchestrator::IsCancellationRequested() const {
  return m_cancellationToken->IsCancelled();
}

void MatrixOrchestrator::ResetCancellation() {
  m_cancellationToken->Reset();
}

} // namespace asset_matrix::runtime
