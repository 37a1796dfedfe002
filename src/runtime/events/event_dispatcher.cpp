//
// Event Dispatcher Implementation
//

#include "event_dispatcher.h"
#include <spdlog/spdlog.h>

namespace asset_matrix::runtime::events {

EventFilter::EventFilter(std::set<EventType> types)
    : m_types(std::move(types)) {}

EventFilter EventFilter::All() {
    return Only({
        EventType::RunStarted,
        EventType::RunCompleted,
        EventType::RunCancelled,
        EventType::TaskStarted,
        EventType::TaskCompleted,
        EventType::TaskFailed,
        EventType::Progress
    });
}

EventFilter EventFilter::Only(std::initializer_list<EventType> types) {
    return EventFilter(std::set<EventType>(types));
}

EventFilter EventFilter::ProgressOnly() {
    return Only({EventType::Progress});
}

bool EventFilter::Accepts(EventType type) const {
    return m_types.contains(type);
}

bool EventFilter::Accepts(const OrchestratorEvent& event) const {
    return Accepts(GetEventType(event));
}

void EventDispatcher::Emit(OrchestratorEvent event) {
    m_signal(event);
}

boost::signals2::connection EventDispatcher::Subscribe(
    OrchestratorEventSlot handler,
    EventFilter filter) {

    auto filteredHandler = [filter = std::move(filter),
                            handler = std::move(handler)]
                           (const OrchestratorEvent& event) {
        if (!filter.Accepts(event)) {
            return;
        }
        try {
            handler(event);
        } catch (const std::exception& exp) {
            SPDLOG_ERROR("Event handler failed on event {}: {}",
                         static_cast<int>(GetEventType(event)), exp.what());
        } catch (...) {
            SPDLOG_ERROR("Event handler failed on event {}: unknown exception",
                         static_cast<int>(GetEventType(event)));
        }
    };

    return m_signal.connect(std::move(filteredHandler));
}

size_t EventDispatcher::SubscriberCount() const {
    return m_signal.num_slots();
}

} // namespace asset_matrix::runtime::events
