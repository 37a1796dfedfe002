//
// Unit tests for EventFilter
//

#include <catch2/catch_test_macros.hpp>

#include "runtime/events/event_dispatcher.h"
#include "runtime/events/orchestrator_events.h"

using namespace asset_matrix;
using namespace asset_matrix::runtime::events;

namespace {
const std::vector<EventType> ALL_TYPES{
    EventType::RunStarted,  EventType::RunCompleted,  EventType::RunCancelled,
    EventType::TaskStarted, EventType::TaskCompleted, EventType::TaskFailed,
    EventType::Progress};

size_t AcceptedCount(const EventFilter& filter) {
    size_t count = 0;
    for (auto type : ALL_TYPES) {
        count += filter.Accepts(type) ? 1 : 0;
    }
    return count;
}
} // namespace

TEST_CASE("EventFilter factory methods", "[events][filter]") {

    SECTION("All() accepts every event type") {
        REQUIRE(AcceptedCount(EventFilter::All()) == ALL_TYPES.size());
    }

    SECTION("Only() accepts listed types only") {
        auto filter = EventFilter::Only({EventType::TaskFailed, EventType::RunCancelled});

        REQUIRE(filter.Accepts(EventType::TaskFailed));
        REQUIRE(filter.Accepts(EventType::RunCancelled));
        REQUIRE_FALSE(filter.Accepts(EventType::TaskCompleted));
        REQUIRE(AcceptedCount(filter) == 2);
    }

    SECTION("Only() with no types rejects everything") {
        REQUIRE(AcceptedCount(EventFilter::Only({})) == 0);
    }

    SECTION("ProgressOnly() accepts progress only") {
        auto filter = EventFilter::ProgressOnly();
        REQUIRE(filter.Accepts(EventType::Progress));
        REQUIRE(AcceptedCount(filter) == 1);
    }
}

TEST_CASE("EventFilter on event values", "[events][filter]") {
    auto filter = EventFilter::Only({EventType::TaskFailed});
    REQUIRE(filter.Accepts(OrchestratorEvent{TaskFailedEvent{.status = TestStatus::Timeout}}));
    REQUIRE_FALSE(filter.Accepts(OrchestratorEvent{ProgressEvent{}}));
    REQUIRE(EventFilter::ProgressOnly().Accepts(OrchestratorEvent{ProgressEvent{}}));
}
