#pragma once
//
// Event Dispatcher
// Thread-safe event emission using boost::signals2
//

#include "orchestrator_events.h"
#include <functional>
#include <memory>
#include <set>

namespace asset_matrix::runtime::events {

// Set of event types a subscriber receives
class EventFilter {
public:
    static EventFilter All();
    static EventFilter Only(std::initializer_list<EventType> types);
    static EventFilter ProgressOnly();

    [[nodiscard]] bool Accepts(EventType type) const;
    [[nodiscard]] bool Accepts(const OrchestratorEvent& event) const;

private:
    std::set<EventType> m_types;

    explicit EventFilter(std::set<EventType> types);
};

class IEventDispatcher {
public:
    virtual ~IEventDispatcher() = default;

    // Safe to call from any worker thread. A handler that throws is logged
    // and skipped, it never reaches the emitter.
    virtual void Emit(OrchestratorEvent event) = 0;

    virtual boost::signals2::connection Subscribe(
        OrchestratorEventSlot handler,
        EventFilter filter = EventFilter::All()) = 0;

    // Typed subscription helper - only receives events of type T
    template<typename T>
    boost::signals2::connection SubscribeTo(std::function<void(const T&)> handler) {
        return Subscribe(
            [handler = std::move(handler)](const OrchestratorEvent& event) {
                if (const auto* typed = std::get_if<T>(&event)) {
                    handler(*typed);
                }
            },
            EventFilter::Only({EventTypeFor<T>::value})
        );
    }
};

using IEventDispatcherPtr = std::shared_ptr<IEventDispatcher>;

class EventDispatcher : public IEventDispatcher {
public:
    EventDispatcher() = default;

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    void Emit(OrchestratorEvent event) override;

    boost::signals2::connection Subscribe(
        OrchestratorEventSlot handler,
        EventFilter filter = EventFilter::All()) override;

    [[nodiscard]] size_t SubscriberCount() const;

private:
    OrchestratorEventSignal m_signal;
};

inline IEventDispatcherPtr MakeEventDispatcher() {
    return std::make_shared<EventDispatcher>();
}

} // namespace asset_matrix::runtime::events
