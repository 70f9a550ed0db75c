/**
 * @file test_notification_dispatcher.cpp
 * @brief Fan-out, channel fallback, retry schedule and receipts
 */

#include <unity.h>

#include <string>

#include "mocks/ManualScheduler.h"
#include "mocks/MockClock.h"
#include "mocks/ScriptedChannelSender.h"
#include "mocks/TestHelpers.h"
#include "sos/core/Errors.hpp"
#include "sos/notify/ContactDirectory.hpp"
#include "sos/notify/NotificationDispatcher.hpp"
#include "sos/notify/RetryPolicy.hpp"

using sos::notify::Channel;
using sos::notify::JobStatus;
using sos::notify::NotificationJob;

static sos::notify::JsonContactDirectory make_directory() {
    return sos::notify::JsonContactDirectory::from_json(nlohmann::json::parse(R"({
      "users": {
        "user-1": {
          "tiers": [
            [ {"contact_id": "anna", "name": "Anna", "channels": ["PUSH", "SMS"],
               "push_token": "tok-anna", "phone": "+100"} ],
            [ {"contact_id": "ben", "name": "Ben", "channels": ["SMS", "EMAIL"],
               "phone": "+200", "email": "ben@example.org"},
              {"contact_id": "cleo", "name": "Cleo", "channels": ["PUSH"],
               "push_token": "tok-cleo"} ]
          ]
        }
      }
    })"));
}

static sos::events::DomainEvent make_event(sos::events::EventType type, uint32_t tier, uint64_t version) {
    sos::events::DomainEvent ev;
    ev.type = type;
    ev.emergency_id = "em-1";
    ev.user_id = "user-1";
    ev.transition_version = version;
    ev.payload = {
        {"emergency_id", "em-1"},
        {"user_id", "user-1"},
        {"emergency_type", "MEDICAL"},
        {"status", "ACTIVE"},
        {"tier", tier},
        {"location", {{"latitude", 1.0}, {"longitude", 2.0}}}
    };
    if (type == sos::events::EventType::ESCALATION_TRIGGERED)
        ev.payload["renotify"] = false;
    return ev;
}

struct DispatchRig {
    explicit DispatchRig(const sos::notify::NotifyConfig& cfg = {})
        : scheduler(clock)
        , directory(make_directory())
        , push(Channel::PUSH, clock)
        , sms(Channel::SMS, clock)
        , email(Channel::EMAIL, clock)
        , dispatcher(cfg, directory, scheduler, clock) {
        dispatcher.register_sender(push);
        dispatcher.register_sender(sms);
        dispatcher.register_sender(email);
    }

    const NotificationJob* find(const std::vector<NotificationJob>& jobs, Channel c, const std::string& who) {
        for (const auto& j : jobs)
            if (j.channel == c && j.recipient_id == who)
                return &j;
        return nullptr;
    }

    MockClock clock;
    ManualScheduler scheduler;
    sos::notify::JsonContactDirectory directory;
    ScriptedChannelSender push;
    ScriptedChannelSender sms;
    ScriptedChannelSender email;
    sos::notify::NotificationDispatcher dispatcher;
};

void test_created_event_notifies_tier_one_on_preferred_channel() {
    DispatchRig rig;
    rig.dispatcher.on_event(make_event(sos::events::EventType::CREATED, 1, 2));
    TEST_ASSERT_EQUAL_UINT32(1, rig.dispatcher.queued());

    rig.scheduler.run_due();

    auto jobs = rig.dispatcher.jobs_for("em-1");
    TEST_ASSERT_EQUAL_UINT32(1, jobs.size());
    TEST_ASSERT_EQUAL(static_cast<int>(Channel::PUSH), static_cast<int>(jobs[0].channel));
    TEST_ASSERT_EQUAL(static_cast<int>(JobStatus::SENT), static_cast<int>(jobs[0].status));
    TEST_ASSERT_EQUAL_UINT32(1, jobs[0].attempt);
    TEST_ASSERT_EQUAL_STRING("anna", jobs[0].recipient_id.c_str());
    TEST_ASSERT_TRUE(jobs[0].provider_message_id.has_value());
    TEST_ASSERT_EQUAL_UINT32(0, rig.sms.calls().size());
}

void test_escalation_event_notifies_that_tier() {
    DispatchRig rig;
    rig.dispatcher.on_event(make_event(sos::events::EventType::ESCALATION_TRIGGERED, 2, 1));
    rig.scheduler.run_due();

    auto jobs = rig.dispatcher.jobs_for("em-1");
    TEST_ASSERT_EQUAL_UINT32(2, jobs.size());
    TEST_ASSERT_NOT_NULL(rig.find(jobs, Channel::SMS, "ben"));
    TEST_ASSERT_NOT_NULL(rig.find(jobs, Channel::PUSH, "cleo"));

    // Tiers past the directory reuse its last list.
    rig.dispatcher.on_event(make_event(sos::events::EventType::ESCALATION_TRIGGERED, 5, 2));
    TEST_ASSERT_EQUAL_UINT32(4, rig.dispatcher.jobs_for("em-1").size());
}

void test_failed_push_falls_back_to_sms_and_retries_on_schedule() {
    DispatchRig rig;
    rig.push.fail_always("TIMEOUT");
    const uint64_t t0 = rig.clock.now_ms();

    rig.dispatcher.on_event(make_event(sos::events::EventType::CREATED, 1, 2));
    rig.scheduler.run_due();

    auto jobs = rig.dispatcher.jobs_for("em-1");
    TEST_ASSERT_EQUAL_UINT32(2, jobs.size());
    const NotificationJob* sms = rig.find(jobs, Channel::SMS, "anna");
    TEST_ASSERT_NOT_NULL(sms);
    TEST_ASSERT_EQUAL(static_cast<int>(JobStatus::SENT), static_cast<int>(sms->status));

    const NotificationJob* push = rig.find(jobs, Channel::PUSH, "anna");
    TEST_ASSERT_EQUAL(static_cast<int>(JobStatus::QUEUED), static_cast<int>(push->status));
    TEST_ASSERT_EQUAL_UINT64(t0 + 5'000, *push->next_attempt_at_ms);

    rig.scheduler.advance_by(5'000);
    rig.scheduler.advance_by(15'000);

    auto calls = rig.push.calls();
    TEST_ASSERT_EQUAL_UINT32(3, calls.size());
    TEST_ASSERT_EQUAL_UINT64(t0, calls[0].at_ms);
    TEST_ASSERT_EQUAL_UINT64(t0 + 5'000, calls[1].at_ms);
    TEST_ASSERT_EQUAL_UINT64(t0 + 20'000, calls[2].at_ms);
    TEST_ASSERT_EQUAL_UINT32(3, calls[2].attempt);

    jobs = rig.dispatcher.jobs_for("em-1");
    push = rig.find(jobs, Channel::PUSH, "anna");
    TEST_ASSERT_EQUAL(static_cast<int>(JobStatus::FAILED), static_cast<int>(push->status));
    TEST_ASSERT_EQUAL_UINT32(3, push->attempt);
    TEST_ASSERT_TRUE(push->last_error.has_value());

    // Only the first failure spawns a fallback.
    TEST_ASSERT_EQUAL_UINT32(2, jobs.size());
    TEST_ASSERT_EQUAL_UINT32(1, rig.sms.calls().size());

    rig.scheduler.advance_by(600'000);
    TEST_ASSERT_EQUAL_UINT32(3, rig.push.calls().size());
}

void test_permanent_error_fails_without_retry() {
    DispatchRig rig;
    rig.push.script({"INVALID_TOKEN"});
    rig.sms.script({"INVALID_PHONE_NUMBER"});

    rig.dispatcher.on_event(make_event(sos::events::EventType::CREATED, 1, 2));
    rig.scheduler.run_due();
    rig.scheduler.advance_by(120'000);

    auto jobs = rig.dispatcher.jobs_for("em-1");
    TEST_ASSERT_EQUAL_UINT32(2, jobs.size());
    for (const auto& j : jobs) {
        TEST_ASSERT_EQUAL(static_cast<int>(JobStatus::FAILED), static_cast<int>(j.status));
        TEST_ASSERT_EQUAL_UINT32(1, j.attempt);
    }
    // Anna has no email address, so the chain ends at SMS.
    TEST_ASSERT_EQUAL_UINT32(0, rig.email.calls().size());
}

void test_finished_jobs_are_evicted_after_retention() {
    sos::notify::NotifyConfig cfg;
    cfg.job_retention_ms = 60'000;
    DispatchRig rig(cfg);

    rig.dispatcher.on_event(make_event(sos::events::EventType::ESCALATION_TRIGGERED, 2, 1));
    rig.scheduler.run_due();
    auto first = rig.dispatcher.jobs_for("em-1");
    TEST_ASSERT_EQUAL_UINT32(2, first.size());
    TEST_ASSERT_EQUAL_UINT32(2, rig.dispatcher.tracked());
    TEST_ASSERT_EQUAL_UINT32(0, rig.dispatcher.queued());

    // An unacknowledged emergency keeps re-notifying every 30 s.
    for (uint64_t v = 2; v <= 10; ++v) {
        rig.scheduler.advance_by(30'000);
        rig.dispatcher.on_event(make_event(sos::events::EventType::ESCALATION_TRIGGERED, 2, v));
        rig.scheduler.run_due();
    }

    // Only the rounds finished within the last minute remain.
    TEST_ASSERT_EQUAL_UINT32(4, rig.dispatcher.tracked());
    TEST_ASSERT_EQUAL_UINT32(4, rig.dispatcher.jobs_for("em-1").size());
    TEST_ASSERT_FALSE(rig.dispatcher.job(first[0].id).has_value());

    bool threw = false;
    try {
        rig.dispatcher.mark_delivered(first[0].id);
    } catch (const sos::core::NotFound&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
}

void test_finished_jobs_are_capped() {
    sos::notify::NotifyConfig cfg;
    cfg.max_finished_jobs = 3;
    DispatchRig rig(cfg);

    rig.dispatcher.on_event(make_event(sos::events::EventType::ESCALATION_TRIGGERED, 2, 1));
    rig.scheduler.run_due();
    rig.dispatcher.on_event(make_event(sos::events::EventType::ESCALATION_TRIGGERED, 2, 2));
    TEST_ASSERT_EQUAL_UINT32(4, rig.dispatcher.tracked());
    TEST_ASSERT_EQUAL_UINT32(2, rig.dispatcher.queued());

    rig.scheduler.run_due();
    TEST_ASSERT_EQUAL_UINT32(3, rig.dispatcher.tracked());
    TEST_ASSERT_EQUAL_UINT32(0, rig.dispatcher.queued());
}

void test_redelivered_event_is_dispatched_once() {
    DispatchRig rig;
    auto ev = make_event(sos::events::EventType::CREATED, 1, 2);
    rig.dispatcher.on_event(ev);
    rig.dispatcher.on_event(ev);
    rig.scheduler.run_due();

    TEST_ASSERT_EQUAL_UINT32(1, rig.dispatcher.jobs_for("em-1").size());
    TEST_ASSERT_EQUAL_UINT32(1, rig.push.calls().size());
}

void test_other_event_types_are_ignored() {
    DispatchRig rig;
    rig.dispatcher.on_event(make_event(sos::events::EventType::RESOLVED, 1, 3));
    rig.dispatcher.on_event(make_event(sos::events::EventType::CONTACT_ACKNOWLEDGED, 1, 1));
    TEST_ASSERT_EQUAL_UINT32(0, rig.dispatcher.jobs_for("em-1").size());
}

void test_delivery_receipt_only_from_sent() {
    DispatchRig rig;
    rig.push.script({"TIMEOUT"});
    rig.dispatcher.on_event(make_event(sos::events::EventType::CREATED, 1, 2));
    rig.scheduler.run_due();

    auto jobs = rig.dispatcher.jobs_for("em-1");
    const NotificationJob* sms = rig.find(jobs, Channel::SMS, "anna");
    const NotificationJob* push = rig.find(jobs, Channel::PUSH, "anna");

    TEST_ASSERT_TRUE(rig.dispatcher.mark_delivered(sms->id));
    TEST_ASSERT_EQUAL(static_cast<int>(JobStatus::DELIVERED),
                      static_cast<int>(rig.dispatcher.job(sms->id)->status));
    TEST_ASSERT_FALSE(rig.dispatcher.mark_delivered(sms->id));
    TEST_ASSERT_FALSE(rig.dispatcher.mark_delivered(push->id));

    bool threw = false;
    try {
        rig.dispatcher.mark_delivered("no-such-job");
    } catch (const sos::core::NotFound&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
}

void test_retry_policy_schedule_and_codes() {
    sos::notify::RetryPolicy policy{sos::notify::NotifyConfig{}};
    TEST_ASSERT_EQUAL_UINT64(5'000, policy.delay_after(1));
    TEST_ASSERT_EQUAL_UINT64(15'000, policy.delay_after(2));
    TEST_ASSERT_EQUAL_UINT64(45'000, policy.delay_after(3));
    TEST_ASSERT_EQUAL_UINT64(45'000, policy.delay_after(9));

    TEST_ASSERT_TRUE(policy.should_retry(1, "TIMEOUT"));
    TEST_ASSERT_TRUE(policy.should_retry(2, "TIMEOUT"));
    TEST_ASSERT_FALSE(policy.should_retry(3, "TIMEOUT"));
    TEST_ASSERT_FALSE(policy.should_retry(1, "BLACKLISTED"));
    TEST_ASSERT_FALSE(policy.should_retry(1, "UNREGISTERED"));
    TEST_ASSERT_FALSE(policy.should_retry(1, "PERMISSION_DENIED"));

    TEST_ASSERT_TRUE(sos::notify::RetryPolicy::fallback_for(Channel::PUSH) == Channel::SMS);
    TEST_ASSERT_TRUE(sos::notify::RetryPolicy::fallback_for(Channel::SMS) == Channel::EMAIL);
    TEST_ASSERT_FALSE(sos::notify::RetryPolicy::fallback_for(Channel::EMAIL).has_value());
}

void test_activation_notifies_contacts_end_to_end() {
    EngineHarness h;
    sos::notify::JsonContactDirectory directory = make_directory();
    ScriptedChannelSender push(Channel::PUSH, h.clock);
    ScriptedChannelSender sms(Channel::SMS, h.clock);
    sos::notify::NotificationDispatcher dispatcher(sos::notify::NotifyConfig{}, directory, h.scheduler, h.clock);
    dispatcher.register_sender(push);
    dispatcher.register_sender(sms);
    dispatcher.attach(h.bus);

    sos::core::Emergency e = h.activate("user-1");
    h.scheduler.run_due();
    TEST_ASSERT_EQUAL_UINT32(1, push.calls().size());
    TEST_ASSERT_EQUAL_STRING("anna", push.calls()[0].recipient_id.c_str());

    // Tier 2 at +120 s, then a re-notify of the same tier at +150 s.
    h.scheduler.advance_by(150'000);
    auto jobs = dispatcher.jobs_for(e.id);
    TEST_ASSERT_EQUAL_UINT32(5, jobs.size());
    TEST_ASSERT_EQUAL_UINT32(2, sms.calls().size());
    TEST_ASSERT_EQUAL_UINT32(3, push.calls().size());
}
