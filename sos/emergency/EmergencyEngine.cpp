#include "EmergencyEngine.hpp"
#include "../core/Crypto.hpp"
#include "../core/Errors.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

namespace sos {
namespace emergency {

using core::Emergency;
using core::EmergencyStatus;

static constexpr size_t MAX_PAGE_SIZE = 100;
static const char* const CANCEL_REASON = "User cancelled";

EmergencyEngine::EmergencyEngine(const core::EmergencyConfig& cfg,
                                 const escalation::EscalationConfig& escalation_cfg,
                                 store::EmergencyStore& store,
                                 sched::TaskScheduler& scheduler,
                                 events::EventPublisher& publisher,
                                 core::Clock& clock,
                                 const identity::DeviceIdentityGateway* devices)
    : m_cfg(cfg)
    , m_store(store)
    , m_publisher(publisher)
    , m_clock(clock)
    , m_devices(devices)
    , m_countdowns(scheduler, [this](const std::string& id, uint64_t generation) {
          on_countdown_fired(id, generation);
      })
    , m_monitor(escalation_cfg, store, scheduler, clock, m_stripes,
                [this](const Emergency& e, const core::EscalationState& s, bool renotify) {
                    return events::EventPublisher::stage(m_publisher.escalation_triggered(e, s, renotify));
                },
                [this](const std::string& id) { m_publisher.flush(id); })
    , m_acks(store)
    , m_sweeper(store, m_countdowns, m_monitor, m_stripes, clock,
                [this](const std::string& id) {
                    m_countdowns.cancel(id);
                    on_countdown_fired(id, 0);
                }) {}

Emergency EmergencyEngine::trigger(const TriggerRequest& req) {
    if (req.user_id.empty())
        throw core::ValidationError("user id is required");
    if (!core::is_well_formed(req.location))
        throw core::ValidationError("location is malformed");

    int countdown = req.countdown_seconds.value_or(m_cfg.default_countdown_seconds);
    if (countdown < m_cfg.min_countdown_seconds || countdown > m_cfg.max_countdown_seconds)
        throw core::ValidationError("countdown_seconds must be between " +
                                    std::to_string(m_cfg.min_countdown_seconds) + " and " +
                                    std::to_string(m_cfg.max_countdown_seconds));

    Emergency e;
    e.user_id = req.user_id;
    e.type = req.type;
    e.location = req.location;
    e.countdown_seconds = countdown;
    e.triggered_by = "user";
    e.initial_message = req.initial_message;
    return create_and_arm(std::move(e));
}

Emergency EmergencyEngine::auto_trigger(const AutoTriggerRequest& req) {
    if (!m_devices)
        throw core::AuthorizationError("device triggers are disabled");

    std::string bound_user = m_devices->authenticate(req.device_id, req.device_token);
    if (req.user_id && *req.user_id != bound_user)
        throw core::AuthorizationError("device " + req.device_id + " is not bound to this user");

    if (!core::is_well_formed(req.location))
        throw core::ValidationError("location is malformed");
    if (req.confidence && (*req.confidence < 0.0 || *req.confidence > 1.0))
        throw core::ValidationError("confidence must be within [0, 1]");

    Emergency e;
    e.user_id = bound_user;
    e.type = req.type;
    e.location = req.location;
    e.countdown_seconds = m_cfg.auto_countdown_seconds;
    e.auto_triggered = true;
    e.triggered_by = "device:" + req.device_id;
    e.confidence = req.confidence;
    e.initial_message = req.initial_message;
    return create_and_arm(std::move(e));
}

// Serialized per user so two concurrent triggers cannot both pass the
// open-emergency check.
Emergency EmergencyEngine::create_and_arm(Emergency e) {
    std::lock_guard<std::mutex> stripe(m_stripes.for_key("user:" + e.user_id));

    auto open = m_store.open_for_user(e.user_id);
    if (static_cast<int>(open.size()) >= m_cfg.max_open_per_user)
        throw core::StateConflict("user already has an open emergency " + open.front().id,
                                  open.front().status);

    e.id = core::Crypto::random_uuid();
    e.status = EmergencyStatus::PENDING;
    e.created_at_ms = m_clock.now_ms();
    e.version = 1;

    m_store.create(e);
    m_countdowns.start(e.id, e.countdown_deadline_ms());

    std::cout << "[Emergency] id=" << e.id << " user=" << e.user_id
              << " type=" << core::to_string(e.type)
              << " countdown=" << e.countdown_seconds << "s"
              << " by=" << e.triggered_by << "\n";
    return e;
}

Emergency EmergencyEngine::load_owned(const std::string& emergency_id, const std::string& user_id) const {
    auto e = m_store.find(emergency_id);
    if (!e)
        throw core::NotFound("emergency " + emergency_id + " not found");
    if (e->user_id != user_id)
        throw core::AuthorizationError("emergency " + emergency_id + " belongs to another user");
    return *e;
}

Emergency EmergencyEngine::cancel(const std::string& emergency_id, const std::string& user_id) {
    std::lock_guard<std::mutex> stripe(m_stripes.for_key(emergency_id));

    load_owned(emergency_id, user_id);

    const uint64_t now = m_clock.now_ms();
    auto r = m_store.transition(emergency_id, {EmergencyStatus::PENDING}, EmergencyStatus::CANCELLED,
                                [now](Emergency& e) { e.cancelled_at_ms = now; },
                                [this](const Emergency& next) {
                                    return events::EventPublisher::stage(
                                        m_publisher.emergency_cancelled(next, CANCEL_REASON));
                                });
    if (!r.applied)
        throw core::StateConflict(std::string("emergency is ") + core::to_string(r.current) +
                                  ", only PENDING can be cancelled", r.current);

    m_countdowns.cancel(emergency_id);
    m_monitor.stop(emergency_id);

    std::cout << "[Emergency] id=" << emergency_id << " CANCELLED\n";
    m_publisher.flush(emergency_id);
    return r.record;
}

Emergency EmergencyEngine::resolve(const std::string& emergency_id,
                                   const std::string& user_id,
                                   const std::optional<std::string>& notes) {
    std::lock_guard<std::mutex> stripe(m_stripes.for_key(emergency_id));

    Emergency before = load_owned(emergency_id, user_id);
    if (core::is_terminal(before.status))
        throw core::StateConflict(std::string("emergency is already ") + core::to_string(before.status),
                                  before.status);

    // Timers go first; they come back if the commit fails.
    m_countdowns.cancel(emergency_id);
    bool monitored = m_monitor.suspend(emergency_id);

    const uint64_t now = m_clock.now_ms();
    store::TransitionResult r;
    try {
        r = m_store.transition(emergency_id,
                               {EmergencyStatus::PENDING, EmergencyStatus::ACTIVE},
                               EmergencyStatus::RESOLVED,
                               [now, &notes](Emergency& e) {
                                   e.resolved_at_ms = now;
                                   e.resolution_notes = notes;
                               },
                               [this](const Emergency& next) {
                                   return events::EventPublisher::stage(m_publisher.emergency_resolved(next));
                               });
    } catch (const core::TransientStoreError&) {
        if (before.status == EmergencyStatus::PENDING)
            m_countdowns.start(emergency_id, before.countdown_deadline_ms());
        if (monitored) {
            if (auto state = m_store.find_escalation(emergency_id))
                m_monitor.resume(*state);
        }
        throw;
    }

    if (!r.applied)
        throw core::StateConflict(std::string("emergency is already ") + core::to_string(r.current),
                                  r.current);

    m_monitor.stop(emergency_id);

    std::cout << "[Emergency] id=" << emergency_id << " RESOLVED\n";
    m_publisher.flush(emergency_id);
    return r.record;
}

AckResponse EmergencyEngine::acknowledge(const AcknowledgeRequest& req) {
    if (req.contact_id.empty())
        throw core::ValidationError("contact id is required");
    if (req.location && !core::is_well_formed(*req.location))
        throw core::ValidationError("location is malformed");

    std::lock_guard<std::mutex> stripe(m_stripes.for_key(req.emergency_id));

    auto e = m_store.find(req.emergency_id);
    if (!e)
        throw core::NotFound("emergency " + req.emergency_id + " not found");
    if (e->status != EmergencyStatus::ACTIVE)
        throw core::StateConflict(std::string("emergency is ") + core::to_string(e->status) +
                                  ", only ACTIVE emergencies accept acknowledgments", e->status);

    core::Acknowledgment ack;
    ack.emergency_id = req.emergency_id;
    ack.contact_id = req.contact_id;
    ack.contact_name = req.contact_name.empty() ? req.contact_id : req.contact_name;
    ack.acknowledged_at_ms = m_clock.now_ms();
    ack.location = req.location;
    ack.message = req.message;

    const Emergency& owner = *e;
    AckRecordResult result = m_acks.record(ack, [this, &owner](const core::Acknowledgment& stored) {
        return events::EventPublisher::stage(m_publisher.contact_acknowledged(owner, stored));
    });
    if (!result.recorded) {
        AckResponse dup;
        dup.outcome = AckOutcome::DUPLICATE;
        dup.ack = result.ack;
        for (const auto& existing : m_store.acknowledgments(req.emergency_id))
            if (existing.contact_id == req.contact_id)
                dup.ack = existing;
        return dup;
    }

    if (result.first_for_emergency)
        m_monitor.stop(req.emergency_id);

    std::cout << "[Emergency] id=" << req.emergency_id << " acknowledged by "
              << result.ack.contact_id << " seq=" << result.ack.sequence << "\n";
    m_publisher.flush(req.emergency_id);

    AckResponse out;
    out.outcome = AckOutcome::RECORDED;
    out.ack = result.ack;
    return out;
}

EmergencyView EmergencyEngine::get(const std::string& emergency_id) const {
    auto e = m_store.find(emergency_id);
    if (!e)
        throw core::NotFound("emergency " + emergency_id + " not found");

    EmergencyView view;
    view.emergency = *e;
    view.acknowledgments = m_store.acknowledgments(emergency_id);
    view.escalation = m_store.find_escalation(emergency_id);
    return view;
}

store::HistoryPage EmergencyEngine::history(const store::HistoryQuery& query) const {
    if (query.user_id.empty())
        throw core::ValidationError("user id is required");
    if (query.page < 1)
        throw core::ValidationError("page must be >= 1");
    if (query.page_size < 1 || query.page_size > MAX_PAGE_SIZE)
        throw core::ValidationError("page_size must be between 1 and " + std::to_string(MAX_PAGE_SIZE));
    return m_store.history(query);
}

// Also republishes events committed while the bus was unreachable, under
// their original dedupe keys.
ReconcileReport EmergencyEngine::reconcile() {
    ReconcileReport report = m_sweeper.run();
    report.events_republished = m_publisher.flush_all();
    return report;
}

uint64_t EmergencyEngine::fire_retry_delay(uint32_t attempt) const {
    uint64_t delay = m_cfg.fire_retry_base_ms;
    for (uint32_t i = 1; i < attempt && delay < m_cfg.fire_retry_cap_ms; ++i)
        delay *= 2;
    return std::min(delay, m_cfg.fire_retry_cap_ms);
}

void EmergencyEngine::on_countdown_fired(const std::string& emergency_id, uint64_t generation) {
    std::lock_guard<std::mutex> stripe(m_stripes.for_key(emergency_id));

    auto registered = m_countdowns.forget(emergency_id, generation);
    if (!registered) {
        // Replaced by a newer countdown while this one was being handed out.
        std::cout << "[Countdown] id=" << emergency_id << " superseded, ignored\n";
        return;
    }
    const uint32_t attempt = *registered;
    const uint64_t now = m_clock.now_ms();

    store::TransitionResult r;
    try {
        r = m_store.transition(emergency_id, {EmergencyStatus::PENDING}, EmergencyStatus::ACTIVE,
                               [now](Emergency& e) { e.activated_at_ms = now; },
                               [this](const Emergency& next) {
                                   return events::EventPublisher::stage(m_publisher.emergency_created(next));
                               });
    } catch (const core::TransientStoreError& ex) {
        uint64_t delay = fire_retry_delay(attempt + 1);
        std::cerr << "[Countdown] id=" << emergency_id << " activation not committed ("
                  << ex.what() << "), retrying in " << delay << "ms\n";
        m_countdowns.start(emergency_id, now + delay, attempt + 1);
        return;
    } catch (const core::NotFound&) {
        std::cerr << "[Countdown] id=" << emergency_id << " fired for an unknown emergency\n";
        return;
    }

    if (!r.applied) {
        // Cancelled or resolved first.
        std::cout << "[Countdown] id=" << emergency_id << " fired after "
                  << core::to_string(r.current) << ", ignored\n";
        return;
    }

    std::cout << "[Emergency] id=" << emergency_id << " ACTIVE\n";
    m_publisher.flush(emergency_id);
    m_monitor.start(r.record);
}

} // namespace emergency
} // namespace sos
