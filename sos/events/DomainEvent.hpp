#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sos {
namespace events {

enum class EventType : uint8_t {
    CREATED = 0,
    CANCELLED = 1,
    RESOLVED = 2,
    CONTACT_ACKNOWLEDGED = 3,
    ESCALATION_TRIGGERED = 4
};

const char* to_string(EventType type);
std::optional<EventType> parse_event_type(const std::string& s);

// Bus topic each event type is published on ("emergency-created", ...).
const char* topic_for(EventType type);

struct DomainEvent {
    EventType type = EventType::CREATED;
    std::string emergency_id;
    std::string user_id;
    uint64_t transition_version = 0;
    uint64_t occurred_at_ms = 0;
    nlohmann::json payload = nlohmann::json::object();

    // (emergencyId, eventType, transitionVersion). Consumers collapse
    // redeliveries on this key.
    std::string dedupe_key() const;
};

nlohmann::json to_json(const DomainEvent& e);
DomainEvent event_from_json(const nlohmann::json& j);

} // namespace events
} // namespace sos
