#include "ReconciliationSweeper.hpp"

#include <iostream>
#include <mutex>

namespace sos {
namespace emergency {

using core::EmergencyStatus;

ReconciliationSweeper::ReconciliationSweeper(store::EmergencyStore& store,
                                             CountdownScheduler& countdowns,
                                             escalation::EscalationMonitor& monitor,
                                             core::StripedMutex& stripes,
                                             core::Clock& clock,
                                             FireFn fire_countdown)
    : m_store(store)
    , m_countdowns(countdowns)
    , m_monitor(monitor)
    , m_stripes(stripes)
    , m_clock(clock)
    , m_fire(std::move(fire_countdown)) {}

ReconcileReport ReconciliationSweeper::run() {
    ReconcileReport report;
    const uint64_t now = m_clock.now_ms();

    for (const auto& e : m_store.with_status(EmergencyStatus::PENDING)) {
        uint64_t deadline = e.countdown_deadline_ms();
        if (deadline <= now) {
            // Expired while we were down: fire in the sweep itself.
            m_fire(e.id);
            ++report.countdowns_fired;
        } else if (m_countdowns.start(e.id, deadline)) {
            ++report.countdowns_rearmed;
        }
    }

    for (const auto& e : m_store.with_status(EmergencyStatus::ACTIVE)) {
        std::lock_guard<std::mutex> stripe(m_stripes.for_key(e.id));
        if (m_monitor.is_active(e.id))
            continue;

        auto state = m_store.find_escalation(e.id);
        size_t acks = m_store.acknowledgment_count(e.id);

        if (acks > 0) {
            if (state && !state->stopped) {
                m_monitor.stop(e.id);
                ++report.escalations_stopped;
            }
        } else if (!state) {
            m_monitor.start(e);
            ++report.escalations_started;
        } else if (!state->stopped) {
            m_monitor.resume(*state);
            ++report.escalations_resumed;
        }
    }

    for (const auto& state : m_store.escalations()) {
        if (state.stopped)
            continue;
        auto e = m_store.find(state.emergency_id);
        if (e && core::is_terminal(e->status)) {
            std::lock_guard<std::mutex> stripe(m_stripes.for_key(state.emergency_id));
            m_monitor.stop(state.emergency_id);
            ++report.escalations_stopped;
        }
    }

    std::cout << "[Reconcile] countdowns fired=" << report.countdowns_fired
              << " rearmed=" << report.countdowns_rearmed
              << " escalations resumed=" << report.escalations_resumed
              << " started=" << report.escalations_started
              << " stopped=" << report.escalations_stopped << "\n";
    return report;
}

} // namespace emergency
} // namespace sos
