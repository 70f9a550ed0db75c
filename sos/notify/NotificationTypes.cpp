#include "NotificationTypes.hpp"

#include <algorithm>
#include <sstream>

namespace sos {
namespace notify {

const char* to_string(Channel c) {
    switch (c) {
        case Channel::PUSH:  return "PUSH";
        case Channel::SMS:   return "SMS";
        case Channel::EMAIL: return "EMAIL";
    }
    return "UNKNOWN";
}

const char* to_string(JobStatus s) {
    switch (s) {
        case JobStatus::QUEUED:    return "QUEUED";
        case JobStatus::SENT:      return "SENT";
        case JobStatus::DELIVERED: return "DELIVERED";
        case JobStatus::FAILED:    return "FAILED";
    }
    return "UNKNOWN";
}

std::optional<Channel> parse_channel(const std::string& s) {
    if (s == "PUSH")  return Channel::PUSH;
    if (s == "SMS")   return Channel::SMS;
    if (s == "EMAIL") return Channel::EMAIL;
    return std::nullopt;
}

const std::vector<Channel>& channel_order() {
    static const std::vector<Channel> order{Channel::PUSH, Channel::SMS, Channel::EMAIL};
    return order;
}

bool ContactRoute::accepts(Channel c) const {
    return std::find(channels.begin(), channels.end(), c) != channels.end();
}

std::string ContactRoute::destination(Channel c) const {
    switch (c) {
        case Channel::PUSH:  return push_token.value_or("");
        case Channel::SMS:   return phone.value_or("");
        case Channel::EMAIL: return email.value_or("");
    }
    return "";
}

std::string render_message(const NotificationJob& job) {
    const AlertContent& a = job.alert;
    std::ostringstream ss;

    if (a.renotify)
        ss << "REMINDER: ";
    ss << "EMERGENCY ALERT (" << a.emergency_type << ")";
    if (a.tier > 1)
        ss << " - escalated, tier " << a.tier;
    ss << ". " << job.contact.name << ", someone who listed you as an emergency contact needs help.";

    if (a.location.contains("latitude") && a.location.contains("longitude"))
        ss << " Location: " << a.location["latitude"].get<double>()
           << "," << a.location["longitude"].get<double>() << ".";
    if (a.initial_message)
        ss << " Message: \"" << *a.initial_message << "\".";

    ss << " Ref " << a.emergency_id;
    return ss.str();
}

nlohmann::json to_json(const NotificationJob& job) {
    nlohmann::json j = {
        {"id", job.id},
        {"emergency_id", job.emergency_id},
        {"recipient_id", job.recipient_id},
        {"channel", to_string(job.channel)},
        {"status", to_string(job.status)},
        {"attempt", job.attempt},
        {"tier", job.tier}
    };
    if (job.next_attempt_at_ms) j["next_attempt_at"] = *job.next_attempt_at_ms;
    if (job.last_error) j["last_error"] = *job.last_error;
    return j;
}

} // namespace notify
} // namespace sos
