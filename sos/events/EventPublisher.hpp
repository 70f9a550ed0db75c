#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

#include "EventBus.hpp"
#include "../core/Clock.hpp"
#include "../core/Types.hpp"
#include "../sched/TaskScheduler.hpp"
#include "../store/EmergencyStore.hpp"

namespace sos {
namespace events {

// Builds domain events and moves them from the store's outbox to the bus.
// Callers stage an event in the same store commit as its transition, then
// call flush() once the commit returned. Events the bus refuses stay staged
// and are retried on a capped backoff timer; nothing is dropped.
class EventPublisher {
public:
    EventPublisher(EventBus& bus,
                   store::EmergencyStore& store,
                   sched::TaskScheduler& scheduler,
                   core::Clock& clock);
    ~EventPublisher();

    EventPublisher(const EventPublisher&) = delete;
    EventPublisher& operator=(const EventPublisher&) = delete;

    DomainEvent emergency_created(const core::Emergency& e) const;
    DomainEvent emergency_cancelled(const core::Emergency& e, const std::string& reason) const;
    DomainEvent emergency_resolved(const core::Emergency& e) const;
    DomainEvent contact_acknowledged(const core::Emergency& e, const core::Acknowledgment& ack) const;
    DomainEvent escalation_triggered(const core::Emergency& e,
                                     const core::EscalationState& state,
                                     bool renotify) const;

    static store::OutboxEntry stage(const DomainEvent& event);

    // Publishes the emergency's staged events in the order they were
    // committed. Stops at the first one the bus refuses. Returns true when
    // nothing is left staged for the emergency.
    bool flush(const std::string& emergency_id);

    // Publishes every staged event. Returns how many reached the bus.
    size_t flush_all();

    size_t pending() const { return m_store.pending_event_count(); }

private:
    DomainEvent make(EventType type, const core::Emergency& e, uint64_t version) const;
    bool deliver(const store::OutboxEntry& entry);
    void schedule_retry_locked();
    void on_retry();

    EventBus& m_bus;
    store::EmergencyStore& m_store;
    sched::TaskScheduler& m_scheduler;
    core::Clock& m_clock;

    // Held while delivering so staged order survives concurrent flushes.
    std::mutex m_mutex;
    sched::TaskId m_retry_task = 0;
    uint32_t m_retry_attempt = 0;
};

} // namespace events
} // namespace sos
