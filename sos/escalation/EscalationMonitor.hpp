#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

#include "EscalationConfig.hpp"
#include "../core/Clock.hpp"
#include "../core/StripedMutex.hpp"
#include "../core/Types.hpp"
#include "../sched/TaskScheduler.hpp"
#include "../store/EmergencyStore.hpp"

namespace sos {
namespace escalation {

// Builds the event journaled together with an escalation step.
using EscalationStager = std::function<store::OutboxEntry(const core::Emergency&,
                                                          const core::EscalationState&,
                                                          bool renotify)>;

// Called under the emergency's stripe after the step and its event are
// persisted.
using EscalationSink = std::function<void(const std::string& emergency_id)>;

// One recurring timer per ACTIVE emergency. Tier 1 waits out its window;
// each timeout without an acknowledgment advances a tier and from then on
// re-notifies every renotify interval. start/stop/resume must be called
// with the emergency's stripe held; ticks take it themselves.
class EscalationMonitor {
public:
    EscalationMonitor(const EscalationConfig& cfg,
                      store::EmergencyStore& store,
                      sched::TaskScheduler& scheduler,
                      core::Clock& clock,
                      core::StripedMutex& stripes,
                      EscalationStager stage,
                      EscalationSink sink);

    ~EscalationMonitor();

    EscalationMonitor(const EscalationMonitor&) = delete;
    EscalationMonitor& operator=(const EscalationMonitor&) = delete;

    // Enters tier 1 for a freshly activated emergency.
    void start(const core::Emergency& e);

    // Cancels the timer and persists stopped=true. Returns true if the
    // monitor was live for this emergency.
    bool stop(const std::string& emergency_id);

    // Cancels the timer only; persisted state is left for resume().
    bool suspend(const std::string& emergency_id);

    // Re-arms from persisted state after a restart. A deadline already in
    // the past fires immediately.
    void resume(const core::EscalationState& state);

    bool is_active(const std::string& emergency_id) const;
    size_t active() const;

    uint64_t window_for(uint32_t tier) const;

private:
    struct Slot {
        sched::TaskId task = 0;
        uint64_t generation = 0;
        uint32_t retry_attempt = 0;
    };

    core::EscalationState initial_state(const core::Emergency& e) const;
    uint64_t next_deadline(const core::EscalationState& s, uint64_t now) const;

    void arm(const std::string& id, uint64_t deadline_ms, uint32_t retry_attempt);
    void tick(const std::string& id, uint64_t generation);
    void advance(const std::string& id);
    uint64_t retry_delay(uint32_t attempt) const;

    EscalationConfig m_cfg;
    store::EmergencyStore& m_store;
    sched::TaskScheduler& m_scheduler;
    core::Clock& m_clock;
    core::StripedMutex& m_stripes;
    EscalationStager m_stage;
    EscalationSink m_sink;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Slot> m_slots;
    uint64_t m_next_generation = 1;
};

} // namespace escalation
} // namespace sos
