#pragma once

#include <optional>
#include <string>
#include <vector>

#include "AcknowledgmentTracker.hpp"
#include "CountdownScheduler.hpp"
#include "ReconciliationSweeper.hpp"
#include "../core/Clock.hpp"
#include "../core/Config.hpp"
#include "../core/StripedMutex.hpp"
#include "../core/Types.hpp"
#include "../escalation/EscalationMonitor.hpp"
#include "../events/EventPublisher.hpp"
#include "../identity/DeviceIdentityGateway.hpp"
#include "../sched/TaskScheduler.hpp"
#include "../store/EmergencyStore.hpp"

namespace sos {
namespace emergency {

struct TriggerRequest {
    std::string user_id;
    core::EmergencyType type = core::EmergencyType::OTHER;
    core::Location location;
    std::optional<int> countdown_seconds;
    std::optional<std::string> initial_message;
};

struct AutoTriggerRequest {
    std::string device_id;
    std::string device_token;
    // When given it must match the user the device is bound to.
    std::optional<std::string> user_id;
    core::EmergencyType type = core::EmergencyType::FALL;
    core::Location location;
    std::optional<double> confidence;
    std::optional<std::string> initial_message;
};

struct AcknowledgeRequest {
    std::string emergency_id;
    std::string contact_id;
    std::string contact_name;
    std::optional<core::Location> location;
    std::optional<std::string> message;
};

enum class AckOutcome : uint8_t {
    RECORDED = 0,
    DUPLICATE = 1
};

struct AckResponse {
    AckOutcome outcome = AckOutcome::RECORDED;
    core::Acknowledgment ack;
};

struct EmergencyView {
    core::Emergency emergency;
    std::vector<core::Acknowledgment> acknowledgments;
    std::optional<core::EscalationState> escalation;
};

// Owns the emergency state machine. Every transition on one emergency runs
// under that emergency's stripe and commits through a store compare-and-set;
// events are published only after the commit.
class EmergencyEngine {
public:
    EmergencyEngine(const core::EmergencyConfig& cfg,
                    const escalation::EscalationConfig& escalation_cfg,
                    store::EmergencyStore& store,
                    sched::TaskScheduler& scheduler,
                    events::EventPublisher& publisher,
                    core::Clock& clock,
                    const identity::DeviceIdentityGateway* devices);

    EmergencyEngine(const EmergencyEngine&) = delete;
    EmergencyEngine& operator=(const EmergencyEngine&) = delete;

    core::Emergency trigger(const TriggerRequest& req);
    core::Emergency auto_trigger(const AutoTriggerRequest& req);

    core::Emergency cancel(const std::string& emergency_id, const std::string& user_id);
    core::Emergency resolve(const std::string& emergency_id,
                            const std::string& user_id,
                            const std::optional<std::string>& notes);

    AckResponse acknowledge(const AcknowledgeRequest& req);

    EmergencyView get(const std::string& emergency_id) const;
    store::HistoryPage history(const store::HistoryQuery& query) const;

    ReconcileReport reconcile();

    size_t live_countdowns() const { return m_countdowns.active(); }
    size_t live_escalations() const { return m_monitor.active(); }
    size_t unpublished_events() const { return m_publisher.pending(); }

private:
    core::Emergency create_and_arm(core::Emergency e);
    // generation 0 fires outside any registered countdown (reconciliation).
    void on_countdown_fired(const std::string& emergency_id, uint64_t generation);
    uint64_t fire_retry_delay(uint32_t attempt) const;

    core::Emergency load_owned(const std::string& emergency_id, const std::string& user_id) const;

    core::EmergencyConfig m_cfg;
    store::EmergencyStore& m_store;
    events::EventPublisher& m_publisher;
    core::Clock& m_clock;
    const identity::DeviceIdentityGateway* m_devices;

    core::StripedMutex m_stripes;
    CountdownScheduler m_countdowns;
    escalation::EscalationMonitor m_monitor;
    AcknowledgmentTracker m_acks;
    ReconciliationSweeper m_sweeper;
};

} // namespace emergency
} // namespace sos
