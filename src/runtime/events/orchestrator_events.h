#pragma once
//
// Matrix Run Event Types for Progress Tracking
// Uses std::variant for type-safe event handling with boost::signals2
//

#include <asset_matrix/core/test_result.h>
#include <boost/signals2/signal.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace asset_matrix::runtime::events {

using Timestamp = std::chrono::steady_clock::time_point;

// ============================================================================
// Run Events
// ============================================================================

struct RunStartedEvent {
    Timestamp timestamp;
    std::string strategy;
    size_t total_tasks;
    size_t concurrency;
    std::vector<std::string> asset_symbols;
};

struct RunCompletedEvent {
    Timestamp timestamp;
    std::chrono::milliseconds duration;
    size_t tasks_succeeded;
    size_t tasks_failed;
    size_t tasks_errored;
    size_t tasks_timed_out;
};

struct RunCancelledEvent {
    Timestamp timestamp;
    std::chrono::milliseconds elapsed;
    size_t tasks_completed;
    size_t tasks_total;
};

// ============================================================================
// Task Events (one strategy on one asset)
// ============================================================================

struct TaskStartedEvent {
    Timestamp timestamp;
    std::string strategy;
    std::string asset;
};

struct TaskCompletedEvent {
    Timestamp timestamp;
    std::string strategy;
    std::string asset;
    std::chrono::milliseconds duration;
    std::optional<double> sharpe;
};

// Emitted for failed, error and timeout outcomes
struct TaskFailedEvent {
    Timestamp timestamp;
    std::string strategy;
    std::string asset;
    TestStatus status;
    std::string error_message;
};

// ============================================================================
// Progress (emitted after every completion)
// ============================================================================

struct ProgressEvent {
    Timestamp timestamp;
    size_t tasks_completed;
    size_t tasks_total;
    double progress_percent;
    std::string last_asset;
};

// ============================================================================
// Unified Event Variant
// ============================================================================

using OrchestratorEvent = std::variant<
    RunStartedEvent,
    RunCompletedEvent,
    RunCancelledEvent,
    TaskStartedEvent,
    TaskCompletedEvent,
    TaskFailedEvent,
    ProgressEvent
>;

enum class EventType : uint8_t {
    RunStarted,
    RunCompleted,
    RunCancelled,
    TaskStarted,
    TaskCompleted,
    TaskFailed,
    Progress
};

template<typename T>
struct EventTypeFor;

template<> struct EventTypeFor<RunStartedEvent> {
    static constexpr EventType value = EventType::RunStarted;
};
template<> struct EventTypeFor<RunCompletedEvent> {
    static constexpr EventType value = EventType::RunCompleted;
};
template<> struct EventTypeFor<RunCancelledEvent> {
    static constexpr EventType value = EventType::RunCancelled;
};
template<> struct EventTypeFor<TaskStartedEvent> {
    static constexpr EventType value = EventType::TaskStarted;
};
template<> struct EventTypeFor<TaskCompletedEvent> {
    static constexpr EventType value = EventType::TaskCompleted;
};
template<> struct EventTypeFor<TaskFailedEvent> {
    static constexpr EventType value = EventType::TaskFailed;
};
template<> struct EventTypeFor<ProgressEvent> {
    static constexpr EventType value = EventType::Progress;
};

inline EventType GetEventType(const OrchestratorEvent& event) {
    return std::visit([](const auto& e) -> EventType {
        return EventTypeFor<std::decay_t<decltype(e)>>::value;
    }, event);
}

// ============================================================================
// Signal Types
// ============================================================================

using OrchestratorEventSignal = boost::signals2::signal<void(const OrchestratorEvent&)>;
using OrchestratorEventSlot = OrchestratorEventSignal::slot_type;

inline Timestamp Now() {
    return std::chrono::steady_clock::now();
}

template<typename Duration>
inline std::chrono::milliseconds ToMillis(Duration d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d);
}

} // namespace asset_matrix::runtime::events
