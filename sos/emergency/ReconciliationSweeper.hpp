#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "CountdownScheduler.hpp"
#include "../core/Clock.hpp"
#include "../core/StripedMutex.hpp"
#include "../escalation/EscalationMonitor.hpp"
#include "../store/EmergencyStore.hpp"

namespace sos {
namespace emergency {

struct ReconcileReport {
    size_t countdowns_fired = 0;
    size_t countdowns_rearmed = 0;
    size_t escalations_resumed = 0;
    size_t escalations_started = 0;
    size_t escalations_stopped = 0;
    size_t events_republished = 0;
};

// Startup pass that rebuilds the process-local timer registries from the
// store: PENDING countdowns, ACTIVE escalations, and stray escalation state
// left live on emergencies that already ended.
class ReconciliationSweeper {
public:
    using FireFn = std::function<void(const std::string& emergency_id)>;

    ReconciliationSweeper(store::EmergencyStore& store,
                          CountdownScheduler& countdowns,
                          escalation::EscalationMonitor& monitor,
                          core::StripedMutex& stripes,
                          core::Clock& clock,
                          FireFn fire_countdown);

    ReconcileReport run();

private:
    store::EmergencyStore& m_store;
    CountdownScheduler& m_countdowns;
    escalation::EscalationMonitor& m_monitor;
    core::StripedMutex& m_stripes;
    core::Clock& m_clock;
    FireFn m_fire;
};

} // namespace emergency
} // namespace sos
