#pragma once

#include <nlohmann/json.hpp>

#include "Types.hpp"

namespace sos {
namespace core {

// Shared by the store journal, event payloads and HTTP responses so all
// three agree on field names. Parsers throw ValidationError on bad input.

nlohmann::json to_json(const Location& location);
Location location_from_json(const nlohmann::json& j);

nlohmann::json to_json(const Emergency& e);
Emergency emergency_from_json(const nlohmann::json& j);

nlohmann::json to_json(const Acknowledgment& ack);
Acknowledgment acknowledgment_from_json(const nlohmann::json& j);

nlohmann::json to_json(const EscalationState& s);
EscalationState escalation_state_from_json(const nlohmann::json& j);

} // namespace core
} // namespace sos
