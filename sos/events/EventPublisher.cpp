#include "EventPublisher.hpp"
#include "../core/Errors.hpp"
#include "../core/JsonCodec.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <iostream>
#include <thread>
#include <unordered_set>

namespace sos {
namespace events {

// Bus journal hiccups are retried briefly in-line before the event is left
// in the outbox for the retry timer.
static constexpr uint64_t PUBLISH_RETRY_MS[] = {10, 50, 250};
static constexpr uint64_t OUTBOX_RETRY_BASE_MS = 1'000;
static constexpr uint64_t OUTBOX_RETRY_CAP_MS = 30'000;

EventPublisher::EventPublisher(EventBus& bus,
                               store::EmergencyStore& store,
                               sched::TaskScheduler& scheduler,
                               core::Clock& clock)
    : m_bus(bus), m_store(store), m_scheduler(scheduler), m_clock(clock) {}

EventPublisher::~EventPublisher() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_retry_task != 0)
        m_scheduler.cancel(m_retry_task);
}

DomainEvent EventPublisher::make(EventType type, const core::Emergency& e, uint64_t version) const {
    DomainEvent ev;
    ev.type = type;
    ev.emergency_id = e.id;
    ev.user_id = e.user_id;
    ev.transition_version = version;
    ev.occurred_at_ms = m_clock.now_ms();
    ev.payload = {
        {"emergency_id", e.id},
        {"user_id", e.user_id},
        {"emergency_type", core::to_string(e.type)},
        {"status", core::to_string(e.status)}
    };
    return ev;
}

store::OutboxEntry EventPublisher::stage(const DomainEvent& event) {
    store::OutboxEntry entry;
    entry.key = event.dedupe_key();
    entry.emergency_id = event.emergency_id;
    entry.topic = topic_for(event.type);
    entry.event = to_json(event);
    return entry;
}

bool EventPublisher::deliver(const store::OutboxEntry& entry) {
    const DomainEvent event = event_from_json(entry.event);

    for (size_t attempt = 0;; ++attempt) {
        try {
            m_bus.publish(entry.topic, event);
            break;
        } catch (const core::TransientStoreError& ex) {
            if (attempt >= std::size(PUBLISH_RETRY_MS)) {
                std::cerr << "[Events] Deferred " << entry.key << ": " << ex.what() << "\n";
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(PUBLISH_RETRY_MS[attempt]));
        }
    }

    std::cout << "[Events] " << to_string(event.type) << " id=" << event.emergency_id
              << " v=" << event.transition_version << "\n";

    try {
        m_store.mark_published(entry.key);
    } catch (const core::TransientStoreError& ex) {
        // Stays staged and goes out again; consumers dedupe on the key.
        std::cerr << "[Events] " << entry.key << " published but not marked: " << ex.what() << "\n";
    }
    return true;
}

bool EventPublisher::flush(const std::string& emergency_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& entry : m_store.pending_events(emergency_id)) {
        if (!deliver(entry)) {
            schedule_retry_locked();
            return false;
        }
    }
    return true;
}

size_t EventPublisher::flush_all() {
    std::lock_guard<std::mutex> lock(m_mutex);

    size_t delivered = 0;
    std::unordered_set<std::string> blocked;
    for (const auto& entry : m_store.pending_events()) {
        // Later events of an emergency wait behind its first refused one.
        if (blocked.count(entry.emergency_id))
            continue;
        if (deliver(entry))
            ++delivered;
        else
            blocked.insert(entry.emergency_id);
    }

    if (blocked.empty())
        m_retry_attempt = 0;
    else
        schedule_retry_locked();
    return delivered;
}

void EventPublisher::schedule_retry_locked() {
    if (m_retry_task != 0)
        return;

    m_retry_attempt += 1;
    uint64_t delay = OUTBOX_RETRY_BASE_MS;
    for (uint32_t i = 1; i < m_retry_attempt && delay < OUTBOX_RETRY_CAP_MS; ++i)
        delay *= 2;
    delay = std::min(delay, OUTBOX_RETRY_CAP_MS);

    std::cerr << "[Events] " << m_store.pending_event_count() << " staged events, retry "
              << m_retry_attempt << " in " << delay << "ms\n";
    m_retry_task = m_scheduler.schedule_at(m_clock.now_ms() + delay, "outbox retry",
                                           [this] { on_retry(); });
}

void EventPublisher::on_retry() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_retry_task = 0;
    }
    flush_all();
}

DomainEvent EventPublisher::emergency_created(const core::Emergency& e) const {
    DomainEvent ev = make(EventType::CREATED, e, e.version);
    ev.payload["tier"] = 1;
    ev.payload["location"] = core::to_json(e.location);
    ev.payload["countdown_seconds"] = e.countdown_seconds;
    ev.payload["auto_triggered"] = e.auto_triggered;
    ev.payload["triggered_by"] = e.triggered_by;
    if (e.initial_message) ev.payload["initial_message"] = *e.initial_message;
    if (e.activated_at_ms) ev.payload["activated_at"] = *e.activated_at_ms;
    return ev;
}

DomainEvent EventPublisher::emergency_cancelled(const core::Emergency& e, const std::string& reason) const {
    DomainEvent ev = make(EventType::CANCELLED, e, e.version);
    ev.payload["reason"] = reason;
    if (e.cancelled_at_ms) ev.payload["cancelled_at"] = *e.cancelled_at_ms;
    return ev;
}

DomainEvent EventPublisher::emergency_resolved(const core::Emergency& e) const {
    DomainEvent ev = make(EventType::RESOLVED, e, e.version);
    if (e.resolution_notes) ev.payload["resolution_notes"] = *e.resolution_notes;
    if (e.resolved_at_ms) ev.payload["resolved_at"] = *e.resolved_at_ms;
    if (e.activated_at_ms && e.resolved_at_ms && *e.resolved_at_ms >= *e.activated_at_ms)
        ev.payload["duration_seconds"] = (*e.resolved_at_ms - *e.activated_at_ms) / 1000;
    return ev;
}

// Version is the acknowledgment's sequence so every distinct contact's
// acknowledgment gets its own dedupe key.
DomainEvent EventPublisher::contact_acknowledged(const core::Emergency& e, const core::Acknowledgment& ack) const {
    DomainEvent ev = make(EventType::CONTACT_ACKNOWLEDGED, e, ack.sequence);
    ev.payload["contact_id"] = ack.contact_id;
    ev.payload["contact_name"] = ack.contact_name;
    ev.payload["acknowledged_at"] = ack.acknowledged_at_ms;
    if (ack.location) ev.payload["location"] = core::to_json(*ack.location);
    if (ack.message) ev.payload["message"] = *ack.message;
    return ev;
}

DomainEvent EventPublisher::escalation_triggered(const core::Emergency& e,
                                                 const core::EscalationState& state,
                                                 bool renotify) const {
    DomainEvent ev = make(EventType::ESCALATION_TRIGGERED, e, state.sequence);
    ev.payload["tier"] = state.current_tier;
    ev.payload["renotify"] = renotify;
    ev.payload["location"] = core::to_json(e.location);
    ev.payload["tier_deadline"] = state.tier_deadline_ms;
    return ev;
}

} // namespace events
} // namespace sos
