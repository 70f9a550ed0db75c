/**
 * @file test_journal_store.cpp
 * @brief Hash-chained journal replay and store recovery
 */

#include <unity.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "mocks/TestHelpers.h"
#include "sos/core/Errors.hpp"
#include "sos/store/Journal.hpp"

static std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line))
        lines.push_back(line);
    return lines;
}

static void write_lines(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream out(path, std::ios::trunc);
    for (const auto& l : lines)
        out << l << "\n";
}

void test_journal_replays_records_in_order() {
    TempDir dir;
    const std::string path = dir.path() + "/j.journal";
    {
        sos::store::Journal j(path);
        TEST_ASSERT_EQUAL_UINT32(0, j.replay([](const nlohmann::json&) {}));
        for (int i = 1; i <= 3; ++i)
            j.append({{"n", i}});
        TEST_ASSERT_EQUAL_UINT32(3, j.records());
    }

    sos::store::Journal j(path);
    std::vector<int> seen;
    size_t n = j.replay([&](const nlohmann::json& r) { seen.push_back(r["n"].get<int>()); });
    TEST_ASSERT_EQUAL_UINT32(3, n);
    TEST_ASSERT_EQUAL_INT(1, seen[0]);
    TEST_ASSERT_EQUAL_INT(3, seen[2]);
}

void test_journal_cuts_tampered_tail() {
    TempDir dir;
    const std::string path = dir.path() + "/j.journal";
    {
        sos::store::Journal j(path);
        j.replay([](const nlohmann::json&) {});
        for (int i = 1; i <= 3; ++i)
            j.append({{"n", i}});
    }

    auto lines = read_lines(path);
    TEST_ASSERT_EQUAL_UINT32(3, lines.size());
    size_t pos = lines[1].find("\"n\":2");
    TEST_ASSERT_TRUE(pos != std::string::npos);
    lines[1].replace(pos, 5, "\"n\":9");
    write_lines(path, lines);

    {
        sos::store::Journal j(path);
        size_t n = j.replay([](const nlohmann::json&) {});
        TEST_ASSERT_EQUAL_UINT32(1, n);
        j.append({{"n", 4}});
    }

    // The chain continues from the last intact record.
    sos::store::Journal j(path);
    std::vector<int> seen;
    TEST_ASSERT_EQUAL_UINT32(2, j.replay([&](const nlohmann::json& r) { seen.push_back(r["n"].get<int>()); }));
    TEST_ASSERT_EQUAL_INT(1, seen[0]);
    TEST_ASSERT_EQUAL_INT(4, seen[1]);
}

void test_journal_drops_torn_last_line() {
    TempDir dir;
    const std::string path = dir.path() + "/j.journal";
    {
        sos::store::Journal j(path);
        j.replay([](const nlohmann::json&) {});
        j.append({{"n", 1}});
        j.append({{"n", 2}});
    }
    const auto intact = std::filesystem::file_size(path);
    {
        std::ofstream out(path, std::ios::app);
        out << "deadbeef\t{\"n\":";
    }

    sos::store::Journal j(path);
    TEST_ASSERT_EQUAL_UINT32(2, j.replay([](const nlohmann::json&) {}));
    TEST_ASSERT_EQUAL_UINT64(intact, std::filesystem::file_size(path));
}

void test_journal_injected_failure_throws_transient() {
    sos::store::Journal j("");
    j.replay([](const nlohmann::json&) {});
    j.fail_next_appends(2);

    int failures = 0;
    for (int i = 0; i < 3; ++i) {
        try {
            j.append({{"n", i}});
        } catch (const sos::core::TransientStoreError&) {
            ++failures;
        }
    }
    TEST_ASSERT_EQUAL_INT(2, failures);
    TEST_ASSERT_EQUAL_UINT32(1, j.records());
}

void test_store_transition_is_compare_and_set() {
    sos::store::EmergencyStore store("");
    store.open();

    sos::core::Emergency e;
    e.id = "em-1";
    e.user_id = "user-1";
    e.location = test_location();
    e.countdown_seconds = 10;
    e.created_at_ms = 1'000;
    store.create(e);

    auto r = store.transition("em-1", {sos::core::EmergencyStatus::PENDING},
                              sos::core::EmergencyStatus::ACTIVE,
                              [](sos::core::Emergency& x) { x.activated_at_ms = 11'000; });
    TEST_ASSERT_TRUE(r.applied);
    TEST_ASSERT_EQUAL_UINT64(2, r.record.version);

    r = store.transition("em-1", {sos::core::EmergencyStatus::PENDING},
                         sos::core::EmergencyStatus::CANCELLED,
                         [](sos::core::Emergency&) {});
    TEST_ASSERT_FALSE(r.applied);
    TEST_ASSERT_EQUAL(static_cast<int>(sos::core::EmergencyStatus::ACTIVE), static_cast<int>(r.current));
    TEST_ASSERT_EQUAL_UINT64(2, store.find("em-1")->version);

    bool threw = false;
    try {
        store.create(e);
    } catch (const sos::core::ValidationError&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);

    threw = false;
    try {
        store.transition("missing", {sos::core::EmergencyStatus::PENDING},
                         sos::core::EmergencyStatus::ACTIVE, [](sos::core::Emergency&) {});
    } catch (const sos::core::NotFound&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
}

void test_store_failed_write_leaves_memory_untouched() {
    sos::store::EmergencyStore store("");
    store.open();

    sos::core::Emergency e;
    e.id = "em-1";
    e.user_id = "user-1";
    store.create(e);

    store.journal().fail_next_appends(1);
    bool threw = false;
    try {
        store.transition("em-1", {sos::core::EmergencyStatus::PENDING},
                         sos::core::EmergencyStatus::CANCELLED, [](sos::core::Emergency&) {});
    } catch (const sos::core::TransientStoreError&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
    TEST_ASSERT_EQUAL(static_cast<int>(sos::core::EmergencyStatus::PENDING),
                      static_cast<int>(store.find("em-1")->status));
    TEST_ASSERT_EQUAL_UINT64(1, store.find("em-1")->version);
}

void test_store_recovers_everything_after_restart() {
    TempDir dir;
    std::string id;
    uint64_t activated = 0;
    {
        EngineHarness h(dir.path());
        sos::core::Emergency e = h.activate("user-1");
        id = e.id;
        activated = *e.activated_at_ms;
        h.ack(e.id, "contact-a");
        h.ack(e.id, "contact-b");
    }

    sos::store::EmergencyStore store(dir.path());
    store.open();
    auto e = store.find(id);
    TEST_ASSERT_TRUE(e.has_value());
    TEST_ASSERT_EQUAL(static_cast<int>(sos::core::EmergencyStatus::ACTIVE), static_cast<int>(e->status));
    TEST_ASSERT_EQUAL_UINT64(activated, *e->activated_at_ms);
    TEST_ASSERT_EQUAL_UINT64(2, e->version);
    TEST_ASSERT_EQUAL_STRING("help", e->initial_message->c_str());
    TEST_ASSERT_TRUE(e->location.latitude == 52.52);

    auto acks = store.acknowledgments(id);
    TEST_ASSERT_EQUAL_UINT32(2, acks.size());
    TEST_ASSERT_EQUAL_UINT64(2, acks[1].sequence);

    auto state = store.find_escalation(id);
    TEST_ASSERT_TRUE(state.has_value());
    TEST_ASSERT_TRUE(state->stopped);

    // Uniqueness survives the restart too.
    sos::core::Acknowledgment again;
    again.emergency_id = id;
    again.contact_id = "contact-a";
    TEST_ASSERT_FALSE(store.insert_acknowledgment(again));
    TEST_ASSERT_EQUAL_UINT32(1, store.open_for_user("user-1").size());
}
