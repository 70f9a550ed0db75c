#include "DomainEvent.hpp"
#include "../core/Errors.hpp"

namespace sos {
namespace events {

const char* to_string(EventType type) {
    switch (type) {
        case EventType::CREATED:              return "Created";
        case EventType::CANCELLED:            return "Cancelled";
        case EventType::RESOLVED:             return "Resolved";
        case EventType::CONTACT_ACKNOWLEDGED: return "ContactAcknowledged";
        case EventType::ESCALATION_TRIGGERED: return "EscalationTriggered";
    }
    return "Unknown";
}

std::optional<EventType> parse_event_type(const std::string& s) {
    if (s == "Created")             return EventType::CREATED;
    if (s == "Cancelled")           return EventType::CANCELLED;
    if (s == "Resolved")            return EventType::RESOLVED;
    if (s == "ContactAcknowledged") return EventType::CONTACT_ACKNOWLEDGED;
    if (s == "EscalationTriggered") return EventType::ESCALATION_TRIGGERED;
    return std::nullopt;
}

const char* topic_for(EventType type) {
    switch (type) {
        case EventType::CREATED:              return "emergency-created";
        case EventType::CANCELLED:            return "emergency-cancelled";
        case EventType::RESOLVED:             return "emergency-resolved";
        case EventType::CONTACT_ACKNOWLEDGED: return "contact-acknowledged";
        case EventType::ESCALATION_TRIGGERED: return "escalation-triggered";
    }
    return "unknown";
}

std::string DomainEvent::dedupe_key() const {
    return emergency_id + "|" + to_string(type) + "|" + std::to_string(transition_version);
}

nlohmann::json to_json(const DomainEvent& e) {
    return nlohmann::json{
        {"type", to_string(e.type)},
        {"emergency_id", e.emergency_id},
        {"user_id", e.user_id},
        {"transition_version", e.transition_version},
        {"occurred_at", e.occurred_at_ms},
        {"payload", e.payload}
    };
}

DomainEvent event_from_json(const nlohmann::json& j) {
    try {
        DomainEvent e;
        auto type = parse_event_type(j.at("type").get<std::string>());
        if (!type)
            throw core::ValidationError("unknown event type " + j.at("type").get<std::string>());
        e.type = *type;
        e.emergency_id = j.at("emergency_id").get<std::string>();
        e.user_id = j.value("user_id", std::string());
        e.transition_version = j.at("transition_version").get<uint64_t>();
        e.occurred_at_ms = j.value("occurred_at", static_cast<uint64_t>(0));
        e.payload = j.value("payload", nlohmann::json::object());
        return e;
    } catch (const nlohmann::json::exception& ex) {
        throw core::ValidationError(std::string("malformed event: ") + ex.what());
    }
}

} // namespace events
} // namespace sos
