#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ChannelSender.hpp"
#include "ContactDirectory.hpp"
#include "NotificationTypes.hpp"
#include "NotifyConfig.hpp"
#include "RetryPolicy.hpp"
#include "../core/Clock.hpp"
#include "../events/DeliveryDeduper.hpp"
#include "../events/EventBus.hpp"
#include "../sched/TaskScheduler.hpp"

namespace sos {
namespace notify {

// Consumes Created and EscalationTriggered events and turns each into one
// job per contact of the tier. Jobs run independently on the scheduler;
// failures fall back to the next channel once and retry on the backoff
// schedule until max_attempts, then end FAILED. Never touches emergency
// state. Finished jobs are evicted oldest first once past the retention
// window or the finished-job cap.
class NotificationDispatcher {
public:
    NotificationDispatcher(const NotifyConfig& cfg,
                           const ContactDirectory& directory,
                           sched::TaskScheduler& scheduler,
                           core::Clock& clock);

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    void register_sender(ChannelSender& sender);

    // Subscribes to emergency-created and escalation-triggered.
    void attach(events::EventBus& bus);

    void on_event(const events::DomainEvent& event);

    // Provider receipt: SENT -> DELIVERED. Throws NotFound for an unknown
    // job; returns false if the job is not in SENT.
    bool mark_delivered(const std::string& job_id);

    std::optional<NotificationJob> job(const std::string& job_id) const;
    std::vector<NotificationJob> jobs_for(const std::string& emergency_id) const;
    size_t queued() const;
    // Jobs currently held, queued and finished.
    size_t tracked() const;

private:
    std::optional<Channel> first_channel(const ContactRoute& contact) const;
    std::string enqueue(NotificationJob job, uint64_t run_at_ms);
    void run_job(const std::string& job_id);
    void finish_locked(const std::string& job_id, uint64_t now);
    void prune_locked(uint64_t now);

    RetryPolicy m_policy;
    const ContactDirectory& m_directory;
    sched::TaskScheduler& m_scheduler;
    core::Clock& m_clock;
    events::DeliveryDeduper m_dedupe;
    uint64_t m_retention_ms;
    size_t m_max_finished;

    std::map<Channel, ChannelSender*> m_senders;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, NotificationJob> m_jobs;
    std::unordered_map<std::string, std::vector<std::string>> m_by_emergency;
    std::deque<std::pair<uint64_t, std::string>> m_finished;  // (finished_at, job id)
    size_t m_queued = 0;
};

} // namespace notify
} // namespace sos
