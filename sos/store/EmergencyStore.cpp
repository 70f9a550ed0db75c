#include "EmergencyStore.hpp"
#include "../core/Errors.hpp"
#include "../core/JsonCodec.hpp"

#include <algorithm>
#include <iostream>

namespace sos {
namespace store {

using core::Acknowledgment;
using core::Emergency;
using core::EmergencyStatus;
using core::EscalationState;

static std::string journal_path(const std::string& data_dir) {
    if (data_dir.empty())
        return "";
    return data_dir + "/emergencies.journal";
}

static nlohmann::json outbox_to_json(const OutboxEntry& o) {
    return {
        {"key", o.key},
        {"emergency_id", o.emergency_id},
        {"topic", o.topic},
        {"event", o.event}
    };
}

static OutboxEntry outbox_from_json(const nlohmann::json& j) {
    OutboxEntry o;
    o.key = j.at("key").get<std::string>();
    o.emergency_id = j.at("emergency_id").get<std::string>();
    o.topic = j.at("topic").get<std::string>();
    o.event = j.at("event");
    return o;
}

EmergencyStore::EmergencyStore(const std::string& data_dir)
    : m_journal(journal_path(data_dir)) {}

EmergencyStore::Shard& EmergencyStore::shard_for(const std::string& id) {
    return m_shards[std::hash<std::string>{}(id) % SHARDS];
}

const EmergencyStore::Shard& EmergencyStore::shard_for(const std::string& id) const {
    return m_shards[std::hash<std::string>{}(id) % SHARDS];
}

void EmergencyStore::open() {
    size_t n = m_journal.replay([this](const nlohmann::json& r) { apply_record(r); });
    if (m_journal.persistent())
        std::cout << "[Store] Replayed " << n << " records from " << m_journal.path()
                  << " (" << size() << " emergencies, " << pending_event_count()
                  << " unpublished events)\n";
}

// Journal records are {"kind": ..., "data": ..., "outbox"?: ...}; emergency
// and escalation records are full snapshots, so the last one wins.
// {"kind": "published", "key": ...} clears a staged event.
void EmergencyStore::apply_record(const nlohmann::json& record) {
    const std::string kind = record.value("kind", "");
    if (kind == "published") {
        const std::string key = record.value("key", "");
        std::lock_guard<std::mutex> lock(m_outbox_mutex);
        auto it = m_outbox_keys.find(key);
        if (it != m_outbox_keys.end()) {
            m_outbox.erase(it->second);
            m_outbox_keys.erase(it);
        }
        return;
    }
    if (!record.contains("data")) {
        std::cerr << "[Store] Skipping journal record without data\n";
        return;
    }
    const nlohmann::json& data = record["data"];

    if (kind == "emergency") {
        Emergency e = core::emergency_from_json(data);
        Shard& s = shard_for(e.id);
        bool is_new;
        {
            std::lock_guard<std::mutex> lock(s.mutex);
            is_new = s.emergencies.find(e.id) == s.emergencies.end();
            s.emergencies[e.id] = e;
        }
        if (is_new)
            index_user(e.user_id, e.id);
    }
    else if (kind == "ack") {
        Acknowledgment a = core::acknowledgment_from_json(data);
        Shard& s = shard_for(a.emergency_id);
        std::lock_guard<std::mutex> lock(s.mutex);
        s.acks[a.emergency_id].push_back(a);
    }
    else if (kind == "escalation") {
        EscalationState st = core::escalation_state_from_json(data);
        Shard& s = shard_for(st.emergency_id);
        std::lock_guard<std::mutex> lock(s.mutex);
        s.escalations[st.emergency_id] = st;
    }
    else {
        std::cerr << "[Store] Skipping journal record of unknown kind '" << kind << "'\n";
        return;
    }

    if (record.contains("outbox"))
        add_to_outbox(outbox_from_json(record["outbox"]));
}

void EmergencyStore::add_to_outbox(OutboxEntry entry) {
    std::lock_guard<std::mutex> lock(m_outbox_mutex);
    auto existing = m_outbox_keys.find(entry.key);
    if (existing != m_outbox_keys.end()) {
        m_outbox.erase(existing->second);
        m_outbox_keys.erase(existing);
    }
    entry.sequence = m_next_outbox_sequence++;
    m_outbox_keys[entry.key] = entry.sequence;
    m_outbox.emplace(entry.sequence, std::move(entry));
}

void EmergencyStore::index_user(const std::string& user_id, const std::string& id) {
    std::lock_guard<std::mutex> lock(m_user_mutex);
    m_by_user[user_id].push_back(id);
}

std::vector<std::string> EmergencyStore::ids_for_user(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(m_user_mutex);
    auto it = m_by_user.find(user_id);
    if (it == m_by_user.end())
        return {};
    return it->second;
}

void EmergencyStore::create(const Emergency& e) {
    Shard& s = shard_for(e.id);
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        if (s.emergencies.count(e.id))
            throw core::ValidationError("emergency id " + e.id + " already exists");

        m_journal.append({{"kind", "emergency"}, {"data", core::to_json(e)}});
        s.emergencies.emplace(e.id, e);
    }
    index_user(e.user_id, e.id);
}

std::optional<Emergency> EmergencyStore::find(const std::string& id) const {
    const Shard& s = shard_for(id);
    std::lock_guard<std::mutex> lock(s.mutex);
    auto it = s.emergencies.find(id);
    if (it == s.emergencies.end())
        return std::nullopt;
    return it->second;
}

TransitionResult EmergencyStore::transition(const std::string& id,
                                            const std::vector<EmergencyStatus>& from,
                                            EmergencyStatus to,
                                            const std::function<void(Emergency&)>& mutate,
                                            const StageFn& stage) {
    Shard& s = shard_for(id);
    std::lock_guard<std::mutex> lock(s.mutex);

    auto it = s.emergencies.find(id);
    if (it == s.emergencies.end())
        throw core::NotFound("emergency " + id + " not found");

    TransitionResult result;
    result.current = it->second.status;

    bool allowed = std::find(from.begin(), from.end(), it->second.status) != from.end()
                && core::is_valid_transition(it->second.status, to);
    if (!allowed) {
        result.record = it->second;
        return result;
    }

    Emergency next = it->second;
    next.status = to;
    next.version += 1;
    if (mutate) mutate(next);

    std::optional<OutboxEntry> staged;
    if (stage) staged = stage(next);

    nlohmann::json record = {{"kind", "emergency"}, {"data", core::to_json(next)}};
    if (staged) record["outbox"] = outbox_to_json(*staged);
    m_journal.append(record);
    it->second = next;
    if (staged) add_to_outbox(std::move(*staged));

    result.applied = true;
    result.current = to;
    result.record = std::move(next);
    return result;
}

std::vector<Emergency> EmergencyStore::open_for_user(const std::string& user_id) const {
    std::vector<Emergency> out;
    for (const auto& id : ids_for_user(user_id)) {
        auto e = find(id);
        if (e && core::is_open(e->status))
            out.push_back(*e);
    }
    return out;
}

HistoryPage EmergencyStore::history(const HistoryQuery& query) const {
    std::vector<Emergency> matched;
    for (const auto& id : ids_for_user(query.user_id)) {
        auto e = find(id);
        if (!e) continue;
        if (query.status && e->status != *query.status) continue;
        if (query.type && e->type != *query.type) continue;
        matched.push_back(*e);
    }

    std::sort(matched.begin(), matched.end(), [](const Emergency& a, const Emergency& b) {
        if (a.created_at_ms != b.created_at_ms)
            return a.created_at_ms > b.created_at_ms;
        return a.id > b.id;
    });

    HistoryPage page;
    page.total = matched.size();
    page.page = query.page;
    page.page_size = query.page_size;

    // Compared in pages so a huge page number cannot wrap the offset.
    const size_t pages = query.page_size == 0
        ? 0 : (matched.size() + query.page_size - 1) / query.page_size;
    if (query.page >= 1 && query.page - 1 < pages) {
        size_t begin = (query.page - 1) * query.page_size;
        size_t end = std::min(matched.size(), begin + query.page_size);
        page.items.assign(std::make_move_iterator(matched.begin() + begin),
                          std::make_move_iterator(matched.begin() + end));
    }
    return page;
}

std::vector<Emergency> EmergencyStore::with_status(EmergencyStatus status) const {
    std::vector<Emergency> out;
    for (const auto& s : m_shards) {
        std::lock_guard<std::mutex> lock(s.mutex);
        for (const auto& [id, e] : s.emergencies)
            if (e.status == status)
                out.push_back(e);
    }
    return out;
}

bool EmergencyStore::insert_acknowledgment(Acknowledgment& ack, const StageAckFn& stage) {
    Shard& s = shard_for(ack.emergency_id);
    std::lock_guard<std::mutex> lock(s.mutex);

    size_t count = 0;
    auto it = s.acks.find(ack.emergency_id);
    if (it != s.acks.end()) {
        for (const auto& existing : it->second)
            if (existing.contact_id == ack.contact_id)
                return false;
        count = it->second.size();
    }

    ack.sequence = count + 1;

    std::optional<OutboxEntry> staged;
    if (stage) staged = stage(ack);

    nlohmann::json record = {{"kind", "ack"}, {"data", core::to_json(ack)}};
    if (staged) record["outbox"] = outbox_to_json(*staged);
    m_journal.append(record);
    s.acks[ack.emergency_id].push_back(ack);
    if (staged) add_to_outbox(std::move(*staged));
    return true;
}

std::vector<Acknowledgment> EmergencyStore::acknowledgments(const std::string& emergency_id) const {
    const Shard& s = shard_for(emergency_id);
    std::lock_guard<std::mutex> lock(s.mutex);
    auto it = s.acks.find(emergency_id);
    if (it == s.acks.end())
        return {};
    return it->second;
}

size_t EmergencyStore::acknowledgment_count(const std::string& emergency_id) const {
    const Shard& s = shard_for(emergency_id);
    std::lock_guard<std::mutex> lock(s.mutex);
    auto it = s.acks.find(emergency_id);
    return it == s.acks.end() ? 0 : it->second.size();
}

void EmergencyStore::save_escalation(const EscalationState& state,
                                     const std::optional<OutboxEntry>& staged) {
    Shard& s = shard_for(state.emergency_id);
    std::lock_guard<std::mutex> lock(s.mutex);

    nlohmann::json record = {{"kind", "escalation"}, {"data", core::to_json(state)}};
    if (staged) record["outbox"] = outbox_to_json(*staged);
    m_journal.append(record);
    s.escalations[state.emergency_id] = state;
    if (staged) add_to_outbox(*staged);
}

std::optional<EscalationState> EmergencyStore::find_escalation(const std::string& emergency_id) const {
    const Shard& s = shard_for(emergency_id);
    std::lock_guard<std::mutex> lock(s.mutex);
    auto it = s.escalations.find(emergency_id);
    if (it == s.escalations.end())
        return std::nullopt;
    return it->second;
}

std::vector<EscalationState> EmergencyStore::escalations() const {
    std::vector<EscalationState> out;
    for (const auto& s : m_shards) {
        std::lock_guard<std::mutex> lock(s.mutex);
        for (const auto& [id, st] : s.escalations)
            out.push_back(st);
    }
    return out;
}

std::vector<OutboxEntry> EmergencyStore::pending_events() const {
    std::lock_guard<std::mutex> lock(m_outbox_mutex);
    std::vector<OutboxEntry> out;
    out.reserve(m_outbox.size());
    for (const auto& [seq, entry] : m_outbox)
        out.push_back(entry);
    return out;
}

std::vector<OutboxEntry> EmergencyStore::pending_events(const std::string& emergency_id) const {
    std::lock_guard<std::mutex> lock(m_outbox_mutex);
    std::vector<OutboxEntry> out;
    for (const auto& [seq, entry] : m_outbox)
        if (entry.emergency_id == emergency_id)
            out.push_back(entry);
    return out;
}

size_t EmergencyStore::pending_event_count() const {
    std::lock_guard<std::mutex> lock(m_outbox_mutex);
    return m_outbox.size();
}

void EmergencyStore::mark_published(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_outbox_mutex);
    auto it = m_outbox_keys.find(key);
    if (it == m_outbox_keys.end())
        return;
    m_journal.append({{"kind", "published"}, {"key", key}});
    m_outbox.erase(it->second);
    m_outbox_keys.erase(it);
}

size_t EmergencyStore::size() const {
    size_t n = 0;
    for (const auto& s : m_shards) {
        std::lock_guard<std::mutex> lock(s.mutex);
        n += s.emergencies.size();
    }
    return n;
}

} // namespace store
} // namespace sos
