#include "NotificationDispatcher.hpp"
#include "../core/Crypto.hpp"
#include "../core/Errors.hpp"

#include <algorithm>
#include <iostream>

namespace sos {
namespace notify {

using events::DomainEvent;
using events::EventType;

NotificationDispatcher::NotificationDispatcher(const NotifyConfig& cfg,
                                               const ContactDirectory& directory,
                                               sched::TaskScheduler& scheduler,
                                               core::Clock& clock)
    : m_policy(cfg)
    , m_directory(directory)
    , m_scheduler(scheduler)
    , m_clock(clock)
    , m_dedupe(cfg.dedupe_capacity)
    , m_retention_ms(cfg.job_retention_ms)
    , m_max_finished(cfg.max_finished_jobs) {}

void NotificationDispatcher::register_sender(ChannelSender& sender) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_senders[sender.channel()] = &sender;
}

void NotificationDispatcher::attach(events::EventBus& bus) {
    auto handler = [this](const DomainEvent& ev) { on_event(ev); };
    bus.subscribe(events::topic_for(EventType::CREATED), handler);
    bus.subscribe(events::topic_for(EventType::ESCALATION_TRIGGERED), handler);
}

std::optional<Channel> NotificationDispatcher::first_channel(const ContactRoute& contact) const {
    for (Channel c : channel_order()) {
        if (m_senders.count(c) == 0)
            continue;
        if (contact.accepts(c))
            return c;
        if (contact.channels.empty() && !contact.destination(c).empty())
            return c;
    }
    return std::nullopt;
}

void NotificationDispatcher::on_event(const DomainEvent& event) {
    if (event.type != EventType::CREATED && event.type != EventType::ESCALATION_TRIGGERED)
        return;

    AlertContent alert;
    alert.emergency_id = event.emergency_id;
    alert.user_id = event.user_id;
    alert.emergency_type = event.payload.value("emergency_type", std::string("OTHER"));
    alert.location = event.payload.value("location", nlohmann::json::object());
    alert.tier = event.payload.value("tier", 1u);
    alert.renotify = event.payload.value("renotify", false);
    if (event.payload.contains("initial_message"))
        alert.initial_message = event.payload["initial_message"].get<std::string>();

    // Lookup first: a throw here leaves the key unregistered so the bus
    // redelivery is not mistaken for a duplicate.
    std::vector<ContactRoute> contacts = m_directory.prioritized_contacts(alert.user_id, alert.tier);

    if (!m_dedupe.register_key(event.dedupe_key())) {
        std::cout << "[Dispatcher] Duplicate " << event.dedupe_key() << " ignored\n";
        return;
    }

    if (contacts.empty()) {
        std::cerr << "[Dispatcher] No contacts for user=" << alert.user_id
                  << " tier=" << alert.tier << " emergency=" << alert.emergency_id << "\n";
        return;
    }

    const uint64_t now = m_clock.now_ms();
    size_t created = 0;

    for (const auto& contact : contacts) {
        std::optional<Channel> channel;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            channel = first_channel(contact);
        }
        if (!channel) {
            std::cerr << "[Dispatcher] Contact " << contact.contact_id << " has no usable channel\n";
            continue;
        }

        NotificationJob job;
        job.emergency_id = alert.emergency_id;
        job.recipient_id = contact.contact_id;
        job.channel = *channel;
        job.tier = alert.tier;
        job.contact = contact;
        job.alert = alert;
        enqueue(std::move(job), now);
        ++created;
    }

    std::cout << "[Dispatcher] " << events::to_string(event.type) << " emergency=" << alert.emergency_id
              << " tier=" << alert.tier << " jobs=" << created << "\n";
}

std::string NotificationDispatcher::enqueue(NotificationJob job, uint64_t run_at_ms) {
    job.id = core::Crypto::random_uuid();
    job.status = JobStatus::QUEUED;
    job.next_attempt_at_ms = run_at_ms;

    const std::string id = job.id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        prune_locked(m_clock.now_ms());
        m_by_emergency[job.emergency_id].push_back(id);
        m_jobs.emplace(id, std::move(job));
        ++m_queued;
    }

    m_scheduler.schedule_at(run_at_ms, "notify " + id, [this, id] { run_job(id); });
    return id;
}

void NotificationDispatcher::run_job(const std::string& job_id) {
    NotificationJob snapshot;
    ChannelSender* sender = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_jobs.find(job_id);
        if (it == m_jobs.end() || it->second.status != JobStatus::QUEUED)
            return;

        NotificationJob& job = it->second;
        job.attempt += 1;
        job.next_attempt_at_ms.reset();
        snapshot = job;

        auto s = m_senders.find(job.channel);
        if (s != m_senders.end())
            sender = s->second;
    }

    bool ok = false;
    std::string provider_id;
    std::string code;
    std::string message;

    if (!sender) {
        code = "NO_PROVIDER";
        message = std::string("no sender registered for ") + to_string(snapshot.channel);
    } else {
        try {
            provider_id = sender->send(snapshot);
            ok = true;
        } catch (const core::DeliveryError& e) {
            code = e.code();
            message = e.what();
        } catch (const std::exception& e) {
            code = "PROVIDER_ERROR";
            message = e.what();
        }
    }

    const uint64_t now = m_clock.now_ms();
    std::optional<NotificationJob> fallback;
    std::optional<uint64_t> retry_at;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_jobs.find(job_id);
        if (it == m_jobs.end())
            return;
        NotificationJob& job = it->second;

        if (ok) {
            job.status = JobStatus::SENT;
            job.provider_message_id = provider_id;
            job.last_error.reset();
            std::cout << "[Dispatcher] job=" << job_id << " " << to_string(job.channel)
                      << " SENT to=" << job.recipient_id << " attempt=" << job.attempt << "\n";
            finish_locked(job_id, now);
            return;
        }

        job.last_error = code + ": " + message;

        // The next channel is tried at once, in parallel with this job's
        // own retries, and only for the first failure.
        if (!job.fallback_spawned) {
            job.fallback_spawned = true;
            auto next = RetryPolicy::fallback_for(job.channel);
            if (next && m_senders.count(*next) && !job.contact.destination(*next).empty()) {
                NotificationJob f;
                f.emergency_id = job.emergency_id;
                f.recipient_id = job.recipient_id;
                f.channel = *next;
                f.tier = job.tier;
                f.contact = job.contact;
                f.alert = job.alert;
                fallback = std::move(f);
            }
        }

        if (m_policy.should_retry(job.attempt, code)) {
            job.status = JobStatus::QUEUED;
            retry_at = now + m_policy.delay_after(job.attempt);
            job.next_attempt_at_ms = retry_at;
        } else {
            job.status = JobStatus::FAILED;
        }

        std::cerr << "[Dispatcher] job=" << job_id << " " << to_string(job.channel)
                  << " attempt=" << job.attempt << "/" << m_policy.max_attempts()
                  << " failed code=" << code << " -> " << to_string(job.status);
        if (retry_at) std::cerr << " retry_at=" << *retry_at;
        std::cerr << "\n";

        if (job.status == JobStatus::FAILED)
            finish_locked(job_id, now);
    }

    if (fallback) {
        std::string fid = enqueue(std::move(*fallback), now);
        std::cout << "[Dispatcher] job=" << job_id << " fallback job=" << fid << "\n";
    }
    if (retry_at)
        m_scheduler.schedule_at(*retry_at, "notify " + job_id, [this, job_id] { run_job(job_id); });
}

void NotificationDispatcher::finish_locked(const std::string& job_id, uint64_t now) {
    if (m_queued > 0)
        --m_queued;
    m_finished.emplace_back(now, job_id);
    prune_locked(now);
}

void NotificationDispatcher::prune_locked(uint64_t now) {
    while (!m_finished.empty()) {
        const bool expired = m_finished.front().first + m_retention_ms <= now;
        if (!expired && m_finished.size() <= m_max_finished)
            break;

        const std::string id = m_finished.front().second;
        m_finished.pop_front();

        auto it = m_jobs.find(id);
        if (it == m_jobs.end())
            continue;
        auto by = m_by_emergency.find(it->second.emergency_id);
        if (by != m_by_emergency.end()) {
            auto& ids = by->second;
            ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
            if (ids.empty())
                m_by_emergency.erase(by);
        }
        m_jobs.erase(it);
    }
}

bool NotificationDispatcher::mark_delivered(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(job_id);
    if (it == m_jobs.end())
        throw core::NotFound("notification job " + job_id + " not found");
    if (it->second.status != JobStatus::SENT)
        return false;
    it->second.status = JobStatus::DELIVERED;
    return true;
}

std::optional<NotificationJob> NotificationDispatcher::job(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(job_id);
    if (it == m_jobs.end())
        return std::nullopt;
    return it->second;
}

std::vector<NotificationJob> NotificationDispatcher::jobs_for(const std::string& emergency_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<NotificationJob> out;
    auto it = m_by_emergency.find(emergency_id);
    if (it == m_by_emergency.end())
        return out;
    for (const auto& id : it->second) {
        auto j = m_jobs.find(id);
        if (j != m_jobs.end())
            out.push_back(j->second);
    }
    return out;
}

size_t NotificationDispatcher::queued() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queued;
}

size_t NotificationDispatcher::tracked() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs.size();
}

} // namespace notify
} // namespace sos
