#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Journal.hpp"
#include "../core/Types.hpp"

namespace sos {
namespace store {

struct TransitionResult {
    bool applied = false;
    core::EmergencyStatus current = core::EmergencyStatus::PENDING;
    // The record after the transition, or as found when it was refused.
    core::Emergency record;
};

struct HistoryQuery {
    std::string user_id;
    std::optional<core::EmergencyStatus> status;
    std::optional<core::EmergencyType> type;
    size_t page = 1;
    size_t page_size = 20;
};

struct HistoryPage {
    std::vector<core::Emergency> items;  // newest first
    size_t total = 0;
    size_t page = 1;
    size_t page_size = 20;
};

// An event journaled in the same record as the change that produced it.
// It stays pending until mark_published(), so a bus outage delays it but
// never loses it.
struct OutboxEntry {
    std::string key;            // consumer dedupe key of the event
    std::string emergency_id;
    std::string topic;
    nlohmann::json event;
    uint64_t sequence = 0;      // staging order, assigned by the store
};

// Builds the outbox entry from the record about to be committed.
using StageFn = std::function<OutboxEntry(const core::Emergency& next)>;
using StageAckFn = std::function<OutboxEntry(const core::Acknowledgment& ack)>;

// Durable record of emergencies, acknowledgments and escalation state.
// Sharded by emergency id; every mutation is journaled before it becomes
// visible, so a failed write leaves memory untouched and raises
// TransientStoreError.
class EmergencyStore {
public:
    // data_dir empty keeps the store in memory only.
    explicit EmergencyStore(const std::string& data_dir);

    EmergencyStore(const EmergencyStore&) = delete;
    EmergencyStore& operator=(const EmergencyStore&) = delete;

    // Rebuilds state from the journal. Call once before use.
    void open();

    // Throws ValidationError if the id is already taken.
    void create(const core::Emergency& e);

    std::optional<core::Emergency> find(const std::string& id) const;

    // Compare-and-set on status: applies only when the current status is in
    // `from`. On success the status becomes `to`, version is bumped and
    // `mutate` may fill the timestamps of the new state. `stage`, when
    // given, builds the event committed together with it. Throws NotFound
    // for an unknown id.
    TransitionResult transition(const std::string& id,
                                const std::vector<core::EmergencyStatus>& from,
                                core::EmergencyStatus to,
                                const std::function<void(core::Emergency&)>& mutate,
                                const StageFn& stage = nullptr);

    std::vector<core::Emergency> open_for_user(const std::string& user_id) const;
    HistoryPage history(const HistoryQuery& query) const;
    std::vector<core::Emergency> with_status(core::EmergencyStatus status) const;

    // Unique on (emergency_id, contact_id). Assigns ack.sequence and returns
    // true when stored; false for a duplicate.
    bool insert_acknowledgment(core::Acknowledgment& ack, const StageAckFn& stage = nullptr);
    std::vector<core::Acknowledgment> acknowledgments(const std::string& emergency_id) const;
    size_t acknowledgment_count(const std::string& emergency_id) const;

    void save_escalation(const core::EscalationState& state,
                         const std::optional<OutboxEntry>& staged = std::nullopt);
    std::optional<core::EscalationState> find_escalation(const std::string& emergency_id) const;
    std::vector<core::EscalationState> escalations() const;

    // Staged events not yet handed to the bus, oldest first.
    std::vector<OutboxEntry> pending_events() const;
    std::vector<OutboxEntry> pending_events(const std::string& emergency_id) const;
    size_t pending_event_count() const;

    // Journals that the event reached the bus. Unknown keys are ignored.
    void mark_published(const std::string& key);

    size_t size() const;

    Journal& journal() { return m_journal; }

private:
    static constexpr size_t SHARDS = 16;

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, core::Emergency> emergencies;
        std::unordered_map<std::string, std::vector<core::Acknowledgment>> acks;
        std::unordered_map<std::string, core::EscalationState> escalations;
    };

    Shard& shard_for(const std::string& id);
    const Shard& shard_for(const std::string& id) const;

    void index_user(const std::string& user_id, const std::string& id);
    std::vector<std::string> ids_for_user(const std::string& user_id) const;
    void apply_record(const nlohmann::json& record);
    void add_to_outbox(OutboxEntry entry);

    Journal m_journal;
    std::array<Shard, SHARDS> m_shards;

    mutable std::mutex m_user_mutex;
    std::unordered_map<std::string, std::vector<std::string>> m_by_user;

    mutable std::mutex m_outbox_mutex;
    std::map<uint64_t, OutboxEntry> m_outbox;
    std::unordered_map<std::string, uint64_t> m_outbox_keys;
    uint64_t m_next_outbox_sequence = 1;
};

} // namespace store
} // namespace sos
