#include "Types.hpp"

#include <cmath>

namespace sos {
namespace core {

const char* to_string(EmergencyType type) {
    switch (type) {
        case EmergencyType::MEDICAL: return "MEDICAL";
        case EmergencyType::FIRE:    return "FIRE";
        case EmergencyType::SAFETY:  return "SAFETY";
        case EmergencyType::FALL:    return "FALL";
        case EmergencyType::OTHER:   return "OTHER";
    }
    return "OTHER";
}

const char* to_string(EmergencyStatus status) {
    switch (status) {
        case EmergencyStatus::PENDING:   return "PENDING";
        case EmergencyStatus::ACTIVE:    return "ACTIVE";
        case EmergencyStatus::CANCELLED: return "CANCELLED";
        case EmergencyStatus::RESOLVED:  return "RESOLVED";
    }
    return "PENDING";
}

std::optional<EmergencyType> parse_emergency_type(const std::string& s) {
    if (s == "MEDICAL") return EmergencyType::MEDICAL;
    if (s == "FIRE")    return EmergencyType::FIRE;
    if (s == "SAFETY")  return EmergencyType::SAFETY;
    if (s == "FALL")    return EmergencyType::FALL;
    if (s == "OTHER")   return EmergencyType::OTHER;
    return std::nullopt;
}

std::optional<EmergencyStatus> parse_emergency_status(const std::string& s) {
    if (s == "PENDING")   return EmergencyStatus::PENDING;
    if (s == "ACTIVE")    return EmergencyStatus::ACTIVE;
    if (s == "CANCELLED") return EmergencyStatus::CANCELLED;
    if (s == "RESOLVED")  return EmergencyStatus::RESOLVED;
    return std::nullopt;
}

bool is_terminal(EmergencyStatus status) {
    return status == EmergencyStatus::CANCELLED || status == EmergencyStatus::RESOLVED;
}

bool is_open(EmergencyStatus status) {
    return status == EmergencyStatus::PENDING || status == EmergencyStatus::ACTIVE;
}

bool is_valid_transition(EmergencyStatus from, EmergencyStatus to) {
    switch (from) {
        case EmergencyStatus::PENDING:
            return to == EmergencyStatus::ACTIVE
                || to == EmergencyStatus::CANCELLED
                || to == EmergencyStatus::RESOLVED;
        case EmergencyStatus::ACTIVE:
            return to == EmergencyStatus::RESOLVED;
        default:
            return false;
    }
}

bool is_well_formed(const Location& location) {
    if (!std::isfinite(location.latitude) || !std::isfinite(location.longitude))
        return false;
    if (location.latitude < -90.0 || location.latitude > 90.0)
        return false;
    if (location.longitude < -180.0 || location.longitude > 180.0)
        return false;
    if (location.accuracy && (!std::isfinite(*location.accuracy) || *location.accuracy < 0.0))
        return false;
    return true;
}

} // namespace core
} // namespace sos
