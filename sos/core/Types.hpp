#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sos {
namespace core {

enum class EmergencyType : uint8_t {
    MEDICAL = 0,
    FIRE = 1,
    SAFETY = 2,
    FALL = 3,
    OTHER = 4
};

enum class EmergencyStatus : uint8_t {
    PENDING = 0,
    ACTIVE = 1,
    CANCELLED = 2,
    RESOLVED = 3
};

struct Location {
    double latitude = 0.0;
    double longitude = 0.0;
    std::optional<double> accuracy;
};

struct Emergency {
    std::string id;
    std::string user_id;
    EmergencyType type = EmergencyType::OTHER;
    EmergencyStatus status = EmergencyStatus::PENDING;
    Location location;
    int countdown_seconds = 0;

    bool auto_triggered = false;
    std::string triggered_by;
    std::optional<std::string> initial_message;
    std::optional<double> confidence;

    uint64_t created_at_ms = 0;
    std::optional<uint64_t> activated_at_ms;
    std::optional<uint64_t> cancelled_at_ms;
    std::optional<uint64_t> resolved_at_ms;
    std::optional<std::string> resolution_notes;

    // Transition version: 1 at creation, +1 per committed status change.
    uint64_t version = 1;

    uint64_t countdown_deadline_ms() const {
        return created_at_ms + static_cast<uint64_t>(countdown_seconds) * 1000;
    }
};

struct Acknowledgment {
    std::string emergency_id;
    std::string contact_id;
    std::string contact_name;
    uint64_t acknowledged_at_ms = 0;
    std::optional<Location> location;
    std::optional<std::string> message;
    // Per-emergency arrival order, assigned by the store.
    uint64_t sequence = 0;
};

struct EscalationState {
    std::string emergency_id;
    uint32_t current_tier = 1;
    uint64_t tier_deadline_ms = 0;
    uint64_t tier_entered_at_ms = 0;
    bool stopped = false;
    // Escalation events emitted so far; doubles as their transition version.
    uint64_t sequence = 0;
};

const char* to_string(EmergencyType type);
const char* to_string(EmergencyStatus status);

std::optional<EmergencyType> parse_emergency_type(const std::string& s);
std::optional<EmergencyStatus> parse_emergency_status(const std::string& s);

bool is_terminal(EmergencyStatus status);
bool is_open(EmergencyStatus status);

// Only the edges PENDING->ACTIVE, PENDING->CANCELLED, PENDING->RESOLVED
// and ACTIVE->RESOLVED exist.
bool is_valid_transition(EmergencyStatus from, EmergencyStatus to);

bool is_well_formed(const Location& location);

} // namespace core
} // namespace sos
