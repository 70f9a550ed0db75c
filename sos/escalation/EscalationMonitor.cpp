#include "EscalationMonitor.hpp"
#include "../core/Errors.hpp"

#include <algorithm>
#include <iostream>
#include <optional>

namespace sos {
namespace escalation {

using core::EmergencyStatus;
using core::EscalationState;

EscalationMonitor::EscalationMonitor(const EscalationConfig& cfg,
                                     store::EmergencyStore& store,
                                     sched::TaskScheduler& scheduler,
                                     core::Clock& clock,
                                     core::StripedMutex& stripes,
                                     EscalationStager stage,
                                     EscalationSink sink)
    : m_cfg(cfg)
    , m_store(store)
    , m_scheduler(scheduler)
    , m_clock(clock)
    , m_stripes(stripes)
    , m_stage(std::move(stage))
    , m_sink(std::move(sink)) {}

EscalationMonitor::~EscalationMonitor() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& [id, slot] : m_slots)
        m_scheduler.cancel(slot.task);
    m_slots.clear();
}

uint64_t EscalationMonitor::window_for(uint32_t tier) const {
    if (tier == 0 || tier > m_cfg.tier_windows_ms.size())
        return 0;
    return m_cfg.tier_windows_ms[tier - 1];
}

EscalationState EscalationMonitor::initial_state(const core::Emergency& e) const {
    EscalationState s;
    s.emergency_id = e.id;
    s.current_tier = 1;
    s.tier_entered_at_ms = e.activated_at_ms.value_or(m_clock.now_ms());
    s.tier_deadline_ms = s.tier_entered_at_ms + window_for(1);
    s.stopped = false;
    s.sequence = 0;
    return s;
}

// Next wake-up: the re-notify interval, cut short by the end of the current
// tier's window when there is a further tier to escalate into.
uint64_t EscalationMonitor::next_deadline(const EscalationState& s, uint64_t now) const {
    uint64_t deadline = now + m_cfg.renotify_interval_ms;
    if (s.current_tier < m_cfg.tier_count())
        deadline = std::min(deadline, s.tier_entered_at_ms + window_for(s.current_tier));
    return deadline;
}

uint64_t EscalationMonitor::retry_delay(uint32_t attempt) const {
    uint64_t delay = m_cfg.retry_base_ms;
    for (uint32_t i = 1; i < attempt && delay < m_cfg.retry_cap_ms; ++i)
        delay *= 2;
    return std::min(delay, m_cfg.retry_cap_ms);
}

void EscalationMonitor::arm(const std::string& id, uint64_t deadline_ms, uint32_t retry_attempt) {
    std::lock_guard<std::mutex> lock(m_mutex);

    Slot& slot = m_slots[id];
    if (slot.task != 0)
        m_scheduler.cancel(slot.task);

    slot.generation = m_next_generation++;
    slot.retry_attempt = retry_attempt;

    const uint64_t generation = slot.generation;
    slot.task = m_scheduler.schedule_at(deadline_ms, "escalation " + id,
        [this, id, generation] { tick(id, generation); });
}

void EscalationMonitor::start(const core::Emergency& e) {
    EscalationState s = initial_state(e);
    try {
        m_store.save_escalation(s);
    } catch (const core::TransientStoreError& ex) {
        // The tick rebuilds tier 1 from the emergency record when no state
        // was persisted.
        std::cerr << "[Escalation] id=" << e.id << " could not persist tier 1: " << ex.what() << "\n";
        arm(e.id, m_clock.now_ms() + retry_delay(1), 1);
        return;
    }

    std::cout << "[Escalation] id=" << e.id << " tier=1 deadline=" << s.tier_deadline_ms << "\n";
    arm(e.id, s.tier_deadline_ms, 0);
}

bool EscalationMonitor::suspend(const std::string& emergency_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_slots.find(emergency_id);
    if (it == m_slots.end())
        return false;
    m_scheduler.cancel(it->second.task);
    m_slots.erase(it);
    return true;
}

bool EscalationMonitor::stop(const std::string& emergency_id) {
    bool was_live = suspend(emergency_id);

    auto state = m_store.find_escalation(emergency_id);
    if (state && !state->stopped) {
        state->stopped = true;
        try {
            m_store.save_escalation(*state);
        } catch (const core::TransientStoreError& ex) {
            // A resumed monitor still checks acknowledgments and status
            // before it emits anything.
            std::cerr << "[Escalation] id=" << emergency_id << " stop not persisted: " << ex.what() << "\n";
        }
    }

    if (was_live)
        std::cout << "[Escalation] id=" << emergency_id << " stopped\n";
    return was_live;
}

void EscalationMonitor::resume(const EscalationState& state) {
    if (state.stopped)
        return;
    std::cout << "[Escalation] id=" << state.emergency_id << " resuming tier=" << state.current_tier
              << " deadline=" << state.tier_deadline_ms << "\n";
    arm(state.emergency_id, state.tier_deadline_ms, 0);
}

bool EscalationMonitor::is_active(const std::string& emergency_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.count(emergency_id) > 0;
}

size_t EscalationMonitor::active() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.size();
}

void EscalationMonitor::tick(const std::string& id, uint64_t generation) {
    std::lock_guard<std::mutex> stripe(m_stripes.for_key(id));

    uint32_t retry_attempt = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_slots.find(id);
        if (it == m_slots.end() || it->second.generation != generation)
            return;  // stopped or re-armed since this task was scheduled
        retry_attempt = it->second.retry_attempt;
    }

    try {
        advance(id);
    } catch (const core::TransientStoreError& ex) {
        uint32_t attempt = retry_attempt + 1;
        uint64_t delay = retry_delay(attempt);
        std::cerr << "[Escalation] id=" << id << " store unavailable (" << ex.what()
                  << "), retry " << attempt << " in " << delay << "ms\n";
        arm(id, m_clock.now_ms() + delay, attempt);
    } catch (const std::exception& ex) {
        std::cerr << "[Escalation] id=" << id << " tick failed: " << ex.what() << "\n";
        arm(id, m_clock.now_ms() + m_cfg.renotify_interval_ms, 0);
    }
}

void EscalationMonitor::advance(const std::string& id) {
    auto e = m_store.find(id);
    if (!e || e->status != EmergencyStatus::ACTIVE) {
        suspend(id);
        return;
    }

    if (m_store.acknowledgment_count(id) > 0) {
        stop(id);
        return;
    }

    auto current = m_store.find_escalation(id);
    if (!current) {
        EscalationState s = initial_state(*e);
        m_store.save_escalation(s);
        arm(id, s.tier_deadline_ms, 0);
        return;
    }
    if (current->stopped) {
        suspend(id);
        return;
    }

    const uint64_t now = m_clock.now_ms();
    if (now < current->tier_deadline_ms) {
        arm(id, current->tier_deadline_ms, 0);
        return;
    }

    EscalationState next = *current;
    bool renotify = true;
    if (next.current_tier < m_cfg.tier_count() &&
        now >= next.tier_entered_at_ms + window_for(next.current_tier)) {
        next.current_tier += 1;
        next.tier_entered_at_ms = now;
        renotify = false;
    }
    next.sequence += 1;
    next.tier_deadline_ms = next_deadline(next, now);

    std::optional<store::OutboxEntry> staged;
    if (m_stage)
        staged = m_stage(*e, next, renotify);
    m_store.save_escalation(next, staged);

    std::cout << "[Escalation] id=" << id << (renotify ? " renotify" : " escalated")
              << " tier=" << next.current_tier << " seq=" << next.sequence
              << " next=" << next.tier_deadline_ms << "\n";

    if (m_sink)
        m_sink(id);

    arm(id, next.tier_deadline_ms, 0);
}

} // namespace escalation
} // namespace sos
