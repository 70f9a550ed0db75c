#include "JsonCodec.hpp"
#include "Errors.hpp"

namespace sos {
namespace core {

using nlohmann::json;

template<typename T>
static void put_optional(json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
}

template<typename T>
static std::optional<T> get_optional(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    return it->get<T>();
}

json to_json(const Location& location) {
    json j = {
        {"latitude", location.latitude},
        {"longitude", location.longitude}
    };
    put_optional(j, "accuracy", location.accuracy);
    return j;
}

Location location_from_json(const json& j) {
    if (!j.is_object())
        throw ValidationError("location must be an object");

    try {
        Location l;
        l.latitude = j.at("latitude").get<double>();
        l.longitude = j.at("longitude").get<double>();
        l.accuracy = get_optional<double>(j, "accuracy");
        return l;
    } catch (const json::exception& e) {
        throw ValidationError(std::string("malformed location: ") + e.what());
    }
}

json to_json(const Emergency& e) {
    json j = {
        {"id", e.id},
        {"user_id", e.user_id},
        {"emergency_type", to_string(e.type)},
        {"status", to_string(e.status)},
        {"location", to_json(e.location)},
        {"countdown_seconds", e.countdown_seconds},
        {"auto_triggered", e.auto_triggered},
        {"triggered_by", e.triggered_by},
        {"created_at", e.created_at_ms},
        {"version", e.version}
    };
    put_optional(j, "initial_message", e.initial_message);
    put_optional(j, "confidence", e.confidence);
    put_optional(j, "activated_at", e.activated_at_ms);
    put_optional(j, "cancelled_at", e.cancelled_at_ms);
    put_optional(j, "resolved_at", e.resolved_at_ms);
    put_optional(j, "resolution_notes", e.resolution_notes);
    return j;
}

Emergency emergency_from_json(const json& j) {
    try {
        Emergency e;
        e.id = j.at("id").get<std::string>();
        e.user_id = j.at("user_id").get<std::string>();

        auto type = parse_emergency_type(j.at("emergency_type").get<std::string>());
        auto status = parse_emergency_status(j.at("status").get<std::string>());
        if (!type || !status)
            throw ValidationError("unknown emergency_type or status in record " + e.id);
        e.type = *type;
        e.status = *status;

        e.location = location_from_json(j.at("location"));
        e.countdown_seconds = j.at("countdown_seconds").get<int>();
        e.auto_triggered = j.value("auto_triggered", false);
        e.triggered_by = j.value("triggered_by", std::string("user"));
        e.created_at_ms = j.at("created_at").get<uint64_t>();
        e.version = j.value("version", static_cast<uint64_t>(1));

        e.initial_message = get_optional<std::string>(j, "initial_message");
        e.confidence = get_optional<double>(j, "confidence");
        e.activated_at_ms = get_optional<uint64_t>(j, "activated_at");
        e.cancelled_at_ms = get_optional<uint64_t>(j, "cancelled_at");
        e.resolved_at_ms = get_optional<uint64_t>(j, "resolved_at");
        e.resolution_notes = get_optional<std::string>(j, "resolution_notes");
        return e;
    } catch (const json::exception& ex) {
        throw ValidationError(std::string("malformed emergency record: ") + ex.what());
    }
}

json to_json(const Acknowledgment& ack) {
    json j = {
        {"emergency_id", ack.emergency_id},
        {"contact_id", ack.contact_id},
        {"contact_name", ack.contact_name},
        {"acknowledged_at", ack.acknowledged_at_ms},
        {"sequence", ack.sequence}
    };
    if (ack.location) j["location"] = to_json(*ack.location);
    put_optional(j, "message", ack.message);
    return j;
}

Acknowledgment acknowledgment_from_json(const json& j) {
    try {
        Acknowledgment a;
        a.emergency_id = j.at("emergency_id").get<std::string>();
        a.contact_id = j.at("contact_id").get<std::string>();
        a.contact_name = j.at("contact_name").get<std::string>();
        a.acknowledged_at_ms = j.at("acknowledged_at").get<uint64_t>();
        a.sequence = j.value("sequence", static_cast<uint64_t>(0));
        if (j.contains("location") && !j["location"].is_null())
            a.location = location_from_json(j["location"]);
        a.message = get_optional<std::string>(j, "message");
        return a;
    } catch (const json::exception& ex) {
        throw ValidationError(std::string("malformed acknowledgment record: ") + ex.what());
    }
}

json to_json(const EscalationState& s) {
    return json{
        {"emergency_id", s.emergency_id},
        {"current_tier", s.current_tier},
        {"tier_deadline", s.tier_deadline_ms},
        {"tier_entered_at", s.tier_entered_at_ms},
        {"stopped", s.stopped},
        {"sequence", s.sequence}
    };
}

EscalationState escalation_state_from_json(const json& j) {
    try {
        EscalationState s;
        s.emergency_id = j.at("emergency_id").get<std::string>();
        s.current_tier = j.at("current_tier").get<uint32_t>();
        s.tier_deadline_ms = j.at("tier_deadline").get<uint64_t>();
        s.tier_entered_at_ms = j.value("tier_entered_at", static_cast<uint64_t>(0));
        s.stopped = j.at("stopped").get<bool>();
        s.sequence = j.value("sequence", static_cast<uint64_t>(0));
        return s;
    } catch (const json::exception& ex) {
        throw ValidationError(std::string("malformed escalation record: ") + ex.what());
    }
}

} // namespace core
} // namespace sos
