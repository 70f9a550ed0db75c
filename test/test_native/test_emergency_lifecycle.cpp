/**
 * @file test_emergency_lifecycle.cpp
 * @brief Emergency state machine: trigger, countdown, cancel, resolve
 */

#include <unity.h>

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

#include "mocks/ManualScheduler.h"
#include "mocks/MockClock.h"
#include "mocks/TestHelpers.h"
#include "sos/core/Errors.hpp"
#include "sos/emergency/CountdownScheduler.hpp"

using sos::core::EmergencyStatus;
using sos::events::EventType;

void test_transition_table_only_allows_forward_edges() {
    using sos::core::is_valid_transition;
    TEST_ASSERT_TRUE(is_valid_transition(EmergencyStatus::PENDING, EmergencyStatus::ACTIVE));
    TEST_ASSERT_TRUE(is_valid_transition(EmergencyStatus::PENDING, EmergencyStatus::CANCELLED));
    TEST_ASSERT_TRUE(is_valid_transition(EmergencyStatus::PENDING, EmergencyStatus::RESOLVED));
    TEST_ASSERT_TRUE(is_valid_transition(EmergencyStatus::ACTIVE, EmergencyStatus::RESOLVED));

    TEST_ASSERT_FALSE(is_valid_transition(EmergencyStatus::ACTIVE, EmergencyStatus::CANCELLED));
    TEST_ASSERT_FALSE(is_valid_transition(EmergencyStatus::ACTIVE, EmergencyStatus::PENDING));
    TEST_ASSERT_FALSE(is_valid_transition(EmergencyStatus::CANCELLED, EmergencyStatus::ACTIVE));
    TEST_ASSERT_FALSE(is_valid_transition(EmergencyStatus::RESOLVED, EmergencyStatus::ACTIVE));
    TEST_ASSERT_FALSE(is_valid_transition(EmergencyStatus::RESOLVED, EmergencyStatus::CANCELLED));
}

void test_trigger_creates_pending_with_countdown() {
    EngineHarness h;
    sos::core::Emergency e = h.trigger("user-1", 10);

    TEST_ASSERT_FALSE(e.id.empty());
    TEST_ASSERT_EQUAL(static_cast<int>(EmergencyStatus::PENDING), static_cast<int>(e.status));
    TEST_ASSERT_EQUAL_INT(10, e.countdown_seconds);
    TEST_ASSERT_EQUAL_UINT64(1, e.version);
    TEST_ASSERT_EQUAL_STRING("user", e.triggered_by.c_str());
    TEST_ASSERT_EQUAL_UINT32(1, h.engine->live_countdowns());
    TEST_ASSERT_EQUAL_UINT32(0, h.bus.events().size());
}

void test_trigger_uses_default_countdown() {
    EngineHarness h;
    sos::emergency::TriggerRequest req;
    req.user_id = "user-1";
    req.type = sos::core::EmergencyType::FIRE;
    req.location = test_location();
    sos::core::Emergency e = h.engine->trigger(req);
    TEST_ASSERT_EQUAL_INT(10, e.countdown_seconds);
}

void test_trigger_rejects_countdown_out_of_range() {
    EngineHarness h;
    bool threw = false;
    try {
        h.trigger("user-1", 4);
    } catch (const sos::core::ValidationError&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);

    threw = false;
    try {
        h.trigger("user-1", 31);
    } catch (const sos::core::ValidationError&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
    TEST_ASSERT_EQUAL_UINT32(0, h.store.size());
}

void test_trigger_rejects_malformed_location() {
    EngineHarness h;
    sos::emergency::TriggerRequest req;
    req.user_id = "user-1";
    req.location.latitude = 123.0;
    req.location.longitude = 10.0;
    bool threw = false;
    try {
        h.engine->trigger(req);
    } catch (const sos::core::ValidationError&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
}

void test_second_open_emergency_for_user_conflicts() {
    EngineHarness h;
    sos::core::Emergency first = h.trigger("user-1");

    bool threw = false;
    try {
        h.trigger("user-1");
    } catch (const sos::core::StateConflict& c) {
        threw = true;
        TEST_ASSERT_EQUAL(static_cast<int>(EmergencyStatus::PENDING), static_cast<int>(c.current_status()));
    }
    TEST_ASSERT_TRUE(threw);

    // Another user is unaffected; a closed emergency frees the slot.
    h.trigger("user-2");
    h.engine->cancel(first.id, "user-1");
    h.trigger("user-1");
    TEST_ASSERT_EQUAL_UINT32(3, h.store.size());
}

void test_countdown_expiry_activates_and_publishes_created() {
    EngineHarness h;
    sos::core::Emergency e = h.trigger("user-1", 10);

    h.scheduler.advance_by(9'999);
    TEST_ASSERT_EQUAL(static_cast<int>(EmergencyStatus::PENDING), static_cast<int>(h.status(e.id)));

    h.scheduler.advance_by(1);
    sos::core::Emergency active = *h.store.find(e.id);
    TEST_ASSERT_EQUAL(static_cast<int>(EmergencyStatus::ACTIVE), static_cast<int>(active.status));
    TEST_ASSERT_TRUE(active.activated_at_ms.has_value());
    TEST_ASSERT_EQUAL_UINT64(e.created_at_ms + 10'000, *active.activated_at_ms);
    TEST_ASSERT_EQUAL_UINT64(2, active.version);

    auto created = h.bus.of_type(EventType::CREATED);
    TEST_ASSERT_EQUAL_UINT32(1, created.size());
    TEST_ASSERT_EQUAL_STRING(e.id.c_str(), created[0].emergency_id.c_str());
    TEST_ASSERT_EQUAL_UINT64(2, created[0].transition_version);
    TEST_ASSERT_EQUAL_INT(1, created[0].payload["tier"].get<int>());
    TEST_ASSERT_EQUAL_STRING("MEDICAL", created[0].payload["emergency_type"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_UINT32(0, h.engine->live_countdowns());
    TEST_ASSERT_EQUAL_UINT32(1, h.engine->live_escalations());
}

void test_cancel_during_countdown_stops_everything() {
    EngineHarness h;
    sos::core::Emergency e = h.trigger("user-1", 10);
    h.scheduler.advance_by(3'000);

    sos::core::Emergency c = h.engine->cancel(e.id, "user-1");
    TEST_ASSERT_EQUAL(static_cast<int>(EmergencyStatus::CANCELLED), static_cast<int>(c.status));
    TEST_ASSERT_TRUE(c.cancelled_at_ms.has_value());
    TEST_ASSERT_EQUAL_UINT32(0, h.engine->live_countdowns());

    h.scheduler.advance_by(600'000);
    TEST_ASSERT_EQUAL(static_cast<int>(EmergencyStatus::CANCELLED), static_cast<int>(h.status(e.id)));
    TEST_ASSERT_EQUAL_UINT32(0, h.bus.of_type(EventType::CREATED).size());
    TEST_ASSERT_EQUAL_UINT32(0, h.bus.of_type(EventType::ESCALATION_TRIGGERED).size());

    auto cancelled = h.bus.of_type(EventType::CANCELLED);
    TEST_ASSERT_EQUAL_UINT32(1, cancelled.size());
    TEST_ASSERT_EQUAL_STRING("User cancelled", cancelled[0].payload["reason"].get<std::string>().c_str());
}

void test_cancel_after_activation_reports_active() {
    EngineHarness h;
    sos::core::Emergency e = h.activate("user-1");

    bool threw = false;
    try {
        h.engine->cancel(e.id, "user-1");
    } catch (const sos::core::StateConflict& c) {
        threw = true;
        TEST_ASSERT_EQUAL(static_cast<int>(EmergencyStatus::ACTIVE), static_cast<int>(c.current_status()));
    }
    TEST_ASSERT_TRUE(threw);
    TEST_ASSERT_EQUAL(static_cast<int>(EmergencyStatus::ACTIVE), static_cast<int>(h.status(e.id)));
}

void test_cancel_by_other_user_is_forbidden() {
    EngineHarness h;
    sos::core::Emergency e = h.trigger("user-1");
    bool threw = false;
    try {
        h.engine->cancel(e.id, "user-2");
    } catch (const sos::core::AuthorizationError&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
    TEST_ASSERT_EQUAL(static_cast<int>(EmergencyStatus::PENDING), static_cast<int>(h.status(e.id)));
}

void test_cancel_unknown_emergency_not_found() {
    EngineHarness h;
    bool threw = false;
    try {
        h.engine->cancel("does-not-exist", "user-1");
    } catch (const sos::core::NotFound&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
}

void test_resolve_pending_skips_activation() {
    EngineHarness h;
    sos::core::Emergency e = h.trigger("user-1", 10);

    sos::core::Emergency r = h.engine->resolve(e.id, "user-1", std::string("false alarm"));
    TEST_ASSERT_EQUAL(static_cast<int>(EmergencyStatus::RESOLVED), static_cast<int>(r.status));
    TEST_ASSERT_EQUAL_STRING("false alarm", r.resolution_notes->c_str());

    h.scheduler.advance_by(60'000);
    TEST_ASSERT_EQUAL(static_cast<int>(EmergencyStatus::RESOLVED), static_cast<int>(h.status(e.id)));
    TEST_ASSERT_EQUAL_UINT32(0, h.bus.of_type(EventType::CREATED).size());
    TEST_ASSERT_EQUAL_UINT32(1, h.bus.of_type(EventType::RESOLVED).size());
}

void test_resolve_active_reports_duration() {
    EngineHarness h;
    sos::core::Emergency e = h.activate("user-1");
    h.scheduler.advance_by(42'000);

    h.engine->resolve(e.id, "user-1", std::nullopt);

    auto resolved = h.bus.of_type(EventType::RESOLVED);
    TEST_ASSERT_EQUAL_UINT32(1, resolved.size());
    TEST_ASSERT_EQUAL_UINT64(42, resolved[0].payload["duration_seconds"].get<uint64_t>());
    TEST_ASSERT_EQUAL_UINT64(3, resolved[0].transition_version);
    TEST_ASSERT_EQUAL_UINT32(0, h.engine->live_escalations());
}

void test_terminal_states_are_final() {
    EngineHarness h;
    sos::core::Emergency e = h.activate("user-1");
    h.engine->resolve(e.id, "user-1", std::nullopt);

    bool threw = false;
    try {
        h.engine->resolve(e.id, "user-1", std::nullopt);
    } catch (const sos::core::StateConflict& c) {
        threw = true;
        TEST_ASSERT_EQUAL(static_cast<int>(EmergencyStatus::RESOLVED), static_cast<int>(c.current_status()));
    }
    TEST_ASSERT_TRUE(threw);

    threw = false;
    try {
        h.engine->cancel(e.id, "user-1");
    } catch (const sos::core::StateConflict&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
    TEST_ASSERT_EQUAL_UINT32(1, h.bus.of_type(EventType::RESOLVED).size());
}

void test_activation_retries_after_store_failure() {
    EngineHarness h;
    sos::core::Emergency e = h.trigger("user-1", 10);

    h.store.journal().fail_next_appends(1);
    h.scheduler.advance_by(10'000);
    TEST_ASSERT_EQUAL(static_cast<int>(EmergencyStatus::PENDING), static_cast<int>(h.status(e.id)));
    TEST_ASSERT_EQUAL_UINT32(1, h.engine->live_countdowns());

    // fire_retry_base_ms defaults to one second.
    h.scheduler.advance_by(1'000);
    TEST_ASSERT_EQUAL(static_cast<int>(EmergencyStatus::ACTIVE), static_cast<int>(h.status(e.id)));
    TEST_ASSERT_EQUAL_UINT32(1, h.bus.of_type(EventType::CREATED).size());
}

void test_failed_cancel_leaves_emergency_pending() {
    EngineHarness h;
    sos::core::Emergency e = h.trigger("user-1", 10);

    h.store.journal().fail_next_appends(1);
    bool threw = false;
    try {
        h.engine->cancel(e.id, "user-1");
    } catch (const sos::core::TransientStoreError&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
    TEST_ASSERT_EQUAL(static_cast<int>(EmergencyStatus::PENDING), static_cast<int>(h.status(e.id)));
    TEST_ASSERT_EQUAL_UINT32(0, h.bus.of_type(EventType::CANCELLED).size());
    TEST_ASSERT_EQUAL_UINT32(1, h.engine->live_countdowns());
}

void test_failed_resolve_restores_escalation_timer() {
    EngineHarness h;
    sos::core::Emergency e = h.activate("user-1");

    h.store.journal().fail_next_appends(1);
    bool threw = false;
    try {
        h.engine->resolve(e.id, "user-1", std::nullopt);
    } catch (const sos::core::TransientStoreError&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
    TEST_ASSERT_EQUAL(static_cast<int>(EmergencyStatus::ACTIVE), static_cast<int>(h.status(e.id)));
    TEST_ASSERT_EQUAL_UINT32(1, h.engine->live_escalations());

    h.scheduler.advance_by(120'000);
    TEST_ASSERT_EQUAL_UINT32(1, h.bus.of_type(EventType::ESCALATION_TRIGGERED).size());
}

// A task already handed out when its countdown is replaced must not drop
// the replacement's registration.
void test_stale_countdown_task_keeps_newer_registration() {
    MockClock clock;
    ManualScheduler scheduler(clock);
    sos::emergency::CountdownScheduler* countdowns = nullptr;

    std::vector<bool> owned;
    bool first = true;
    sos::emergency::CountdownScheduler cd(scheduler, [&](const std::string& id, uint64_t generation) {
        if (first) {
            first = false;
            TEST_ASSERT_FALSE(countdowns->cancel(id));
            TEST_ASSERT_TRUE(countdowns->start(id, clock.now_ms() + 5'000));
        }
        owned.push_back(countdowns->forget(id, generation).has_value());
    });
    countdowns = &cd;

    TEST_ASSERT_TRUE(cd.start("em-1", clock.now_ms() + 10'000));
    scheduler.advance_by(10'000);
    TEST_ASSERT_EQUAL_UINT32(1, owned.size());
    TEST_ASSERT_FALSE(owned[0]);
    TEST_ASSERT_TRUE(cd.is_registered("em-1"));
    TEST_ASSERT_EQUAL_UINT32(1, cd.active());

    scheduler.advance_by(5'000);
    TEST_ASSERT_EQUAL_UINT32(2, owned.size());
    TEST_ASSERT_TRUE(owned[1]);
    TEST_ASSERT_EQUAL_UINT32(0, cd.active());
}

void test_history_pages_newest_first_with_filters() {
    EngineHarness h;
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        sos::core::Emergency e = h.trigger("user-1");
        ids.push_back(e.id);
        h.scheduler.advance_by(1'000);
        h.engine->cancel(e.id, "user-1");
    }
    h.trigger("user-2");

    sos::store::HistoryQuery q;
    q.user_id = "user-1";
    q.page = 1;
    q.page_size = 2;
    sos::store::HistoryPage page = h.engine->history(q);
    TEST_ASSERT_EQUAL_UINT32(5, page.total);
    TEST_ASSERT_EQUAL_UINT32(2, page.items.size());
    TEST_ASSERT_EQUAL_STRING(ids[4].c_str(), page.items[0].id.c_str());
    TEST_ASSERT_EQUAL_STRING(ids[3].c_str(), page.items[1].id.c_str());

    q.page = 3;
    page = h.engine->history(q);
    TEST_ASSERT_EQUAL_UINT32(1, page.items.size());
    TEST_ASSERT_EQUAL_STRING(ids[0].c_str(), page.items[0].id.c_str());

    q.page = 1;
    q.page_size = 20;
    q.status = EmergencyStatus::RESOLVED;
    TEST_ASSERT_EQUAL_UINT32(0, h.engine->history(q).total);

    q.status.reset();
    q.type = sos::core::EmergencyType::FIRE;
    TEST_ASSERT_EQUAL_UINT32(0, h.engine->history(q).total);

    q.page_size = 101;
    bool threw = false;
    try {
        h.engine->history(q);
    } catch (const sos::core::ValidationError&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
}

void test_history_page_far_past_the_end_is_empty() {
    EngineHarness h;
    for (int i = 0; i < 5; ++i) {
        sos::core::Emergency e = h.trigger("user-1");
        h.scheduler.advance_by(1'000);
        h.engine->cancel(e.id, "user-1");
    }

    sos::store::HistoryQuery q;
    q.user_id = "user-1";
    q.page_size = 2;
    // (page - 1) * page_size wraps to 0 for this page number.
    q.page = std::numeric_limits<size_t>::max() / 2 + 2;

    sos::store::HistoryPage page = h.engine->history(q);
    TEST_ASSERT_EQUAL_UINT32(5, page.total);
    TEST_ASSERT_EQUAL_UINT32(0, page.items.size());

    q.page = 4;
    TEST_ASSERT_EQUAL_UINT32(0, h.engine->history(q).items.size());
}

void test_get_returns_view_with_escalation() {
    EngineHarness h;
    sos::core::Emergency e = h.activate("user-1");
    h.ack(e.id, "contact-a");

    sos::emergency::EmergencyView v = h.engine->get(e.id);
    TEST_ASSERT_EQUAL_STRING(e.id.c_str(), v.emergency.id.c_str());
    TEST_ASSERT_EQUAL_UINT32(1, v.acknowledgments.size());
    TEST_ASSERT_TRUE(v.escalation.has_value());
    TEST_ASSERT_TRUE(v.escalation->stopped);
}
