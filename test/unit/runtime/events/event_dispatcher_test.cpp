//
// Unit tests for EventDispatcher
//

#include <catch2/catch_test_macros.hpp>

#include "runtime/events/event_dispatcher.h"
#include "runtime/events/orchestrator_events.h"

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace asset_matrix;
using namespace asset_matrix::runtime::events;

TEST_CASE("EventDispatcher basic functionality", "[events][dispatcher]") {

    SECTION("Single subscriber receives events in emission order") {
        EventDispatcher dispatcher;
        std::vector<EventType> received;

        dispatcher.Subscribe([&](const OrchestratorEvent& e) {
            received.push_back(GetEventType(e));
        });

        dispatcher.Emit(RunStartedEvent{.timestamp = Now(), .total_tasks = 3});
        dispatcher.Emit(TaskStartedEvent{.timestamp = Now(), .asset = "BTC"});
        dispatcher.Emit(RunCompletedEvent{.timestamp = Now()});

        REQUIRE(received == std::vector<EventType>{
            EventType::RunStarted, EventType::TaskStarted, EventType::RunCompleted});
    }

    SECTION("Multiple subscribers all receive events") {
        EventDispatcher dispatcher;
        int count1 = 0, count2 = 0;

        dispatcher.Subscribe([&](const auto&) { count1++; });
        dispatcher.Subscribe([&](const auto&) { count2++; });

        dispatcher.Emit(ProgressEvent{});

        REQUIRE(count1 == 1);
        REQUIRE(count2 == 1);
    }

    SECTION("Event data is preserved") {
        EventDispatcher dispatcher;
        RunStartedEvent received{};

        dispatcher.Subscribe([&](const OrchestratorEvent& e) {
            if (auto* p = std::get_if<RunStartedEvent>(&e)) {
                received = *p;
            }
        });

        dispatcher.Emit(RunStartedEvent{
            .timestamp = Now(),
            .strategy = "MomentumStrategy_BT",
            .total_tasks = 2,
            .concurrency = 4,
            .asset_symbols = {"BTC", "ETH"}});

        REQUIRE(received.strategy == "MomentumStrategy_BT");
        REQUIRE(received.total_tasks == 2);
        REQUIRE(received.concurrency == 4);
        REQUIRE(received.asset_symbols == std::vector<std::string>{"BTC", "ETH"});
    }
}

TEST_CASE("EventDispatcher filtering", "[events][dispatcher]") {
    EventDispatcher dispatcher;
    std::vector<EventType> terminalEvents;
    std::vector<size_t> progress;
    int noneCount = 0;

    dispatcher.Subscribe(
        [&](const OrchestratorEvent& e) { terminalEvents.push_back(GetEventType(e)); },
        EventFilter::Only({EventType::TaskFailed, EventType::RunCancelled}));
    dispatcher.Subscribe(
        [&](const OrchestratorEvent& e) {
            progress.push_back(std::get<ProgressEvent>(e).tasks_completed);
        },
        EventFilter::ProgressOnly());
    dispatcher.Subscribe([&](const auto&) { noneCount++; }, EventFilter::Only({}));

    dispatcher.Emit(RunStartedEvent{});
    dispatcher.Emit(TaskStartedEvent{});
    dispatcher.Emit(TaskFailedEvent{.status = TestStatus::Failed});
    dispatcher.Emit(ProgressEvent{.tasks_completed = 1});
    dispatcher.Emit(RunCancelledEvent{});

    REQUIRE(terminalEvents == std::vector<EventType>{EventType::TaskFailed, EventType::RunCancelled});
    REQUIRE(progress == std::vector<size_t>{1});
    REQUIRE(noneCount == 0);
}

TEST_CASE("EventDispatcher isolates throwing handlers", "[events][dispatcher]") {
    EventDispatcher dispatcher;
    std::vector<std::string> seen;

    dispatcher.Subscribe([](const OrchestratorEvent& e) {
        if (std::holds_alternative<TaskStartedEvent>(e)) {
            throw std::runtime_error("handler bug");
        }
    });
    dispatcher.Subscribe([](const OrchestratorEvent&) { throw 42; },
                         EventFilter::ProgressOnly());
    dispatcher.SubscribeTo<TaskStartedEvent>([&](const TaskStartedEvent& e) {
        seen.push_back(e.asset);
    });

    REQUIRE_NOTHROW(dispatcher.Emit(TaskStartedEvent{.asset = "BTC"}));
    REQUIRE_NOTHROW(dispatcher.Emit(ProgressEvent{}));
    REQUIRE_NOTHROW(dispatcher.Emit(TaskStartedEvent{.asset = "ETH"}));

    // later subscribers still run after an earlier one throws
    REQUIRE(seen == std::vector<std::string>{"BTC", "ETH"});
}

TEST_CASE("EventDispatcher subscription management", "[events][dispatcher]") {

    SECTION("Unsubscribe via connection disconnection") {
        EventDispatcher dispatcher;
        int count = 0;

        auto conn = dispatcher.Subscribe([&](const auto&) { count++; });
        dispatcher.Emit(ProgressEvent{});
        conn.disconnect();
        dispatcher.Emit(ProgressEvent{});

        REQUIRE(count == 1);
        REQUIRE_FALSE(conn.connected());
        REQUIRE_NOTHROW(conn.disconnect());
    }

    SECTION("SubscriberCount tracks connections") {
        EventDispatcher dispatcher;
        REQUIRE(dispatcher.SubscriberCount() == 0);

        auto c1 = dispatcher.Subscribe([](const auto&) {});
        auto c2 = dispatcher.Subscribe([](const auto&) {});
        REQUIRE(dispatcher.SubscriberCount() == 2);

        c1.disconnect();
        REQUIRE(dispatcher.SubscriberCount() == 1);
        c2.disconnect();
        REQUIRE(dispatcher.SubscriberCount() == 0);
    }
}

TEST_CASE("EventDispatcher typed subscription", "[events][dispatcher]") {
    auto dispatcher = MakeEventDispatcher();
    std::vector<std::string> failedAssets;
    double lastPercent = 0.0;

    dispatcher->SubscribeTo<TaskFailedEvent>([&](const TaskFailedEvent& e) {
        failedAssets.push_back(e.asset);
    });
    dispatcher->SubscribeTo<ProgressEvent>([&](const ProgressEvent& e) {
        lastPercent = e.progress_percent;
    });

    dispatcher->Emit(TaskCompletedEvent{.asset = "BTC"});
    dispatcher->Emit(TaskFailedEvent{.asset = "ETH", .status = TestStatus::Failed});
    dispatcher->Emit(ProgressEvent{.tasks_completed = 2, .tasks_total = 2, .progress_percent = 100.0});

    REQUIRE(failedAssets == std::vector<std::string>{"ETH"});
    REQUIRE(lastPercent == 100.0);
}

TEST_CASE("EventDispatcher thread safety", "[events][dispatcher][threading]") {
    EventDispatcher dispatcher;
    std::atomic<int> received{0};
    dispatcher.Subscribe([&](const auto&) { received.fetch_add(1, std::memory_order_relaxed); });

    constexpr int THREADS = 4;
    constexpr int EVENTS_PER_THREAD = 250;
    std::vector<std::thread> emitters;
    for (int t = 0; t < THREADS; ++t) {
        emitters.emplace_back([&]() {
            for (int i = 0; i < EVENTS_PER_THREAD; ++i) {
                dispatcher.Emit(ProgressEvent{.tasks_completed = static_cast<size_t>(i)});
            }
        });
    }
    for (auto& t : emitters) {
        t.join();
    }

    REQUIRE(received.load() == THREADS * EVENTS_PER_THREAD);
}
