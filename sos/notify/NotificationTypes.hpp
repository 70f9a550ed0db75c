#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sos {
namespace notify {

enum class Channel : uint8_t {
    PUSH = 0,
    SMS = 1,
    EMAIL = 2
};

enum class JobStatus : uint8_t {
    QUEUED = 0,
    SENT = 1,
    DELIVERED = 2,
    FAILED = 3
};

const char* to_string(Channel c);
const char* to_string(JobStatus s);
std::optional<Channel> parse_channel(const std::string& s);

// Default delivery order.
const std::vector<Channel>& channel_order();

struct ContactRoute {
    std::string contact_id;
    std::string name;
    std::vector<Channel> channels;
    std::optional<std::string> phone;
    std::optional<std::string> email;
    std::optional<std::string> push_token;

    bool accepts(Channel c) const;

    // Token, phone number or address for the channel; empty if missing.
    std::string destination(Channel c) const;
};

// What the recipient is told. Copied into every job of a fan-out.
struct AlertContent {
    std::string emergency_id;
    std::string user_id;
    std::string emergency_type;
    nlohmann::json location = nlohmann::json::object();
    uint32_t tier = 1;
    bool renotify = false;
    std::optional<std::string> initial_message;
};

struct NotificationJob {
    std::string id;
    std::string emergency_id;
    std::string recipient_id;
    Channel channel = Channel::PUSH;
    JobStatus status = JobStatus::QUEUED;
    uint32_t attempt = 0;
    std::optional<uint64_t> next_attempt_at_ms;
    uint32_t tier = 1;
    std::optional<std::string> last_error;

    ContactRoute contact;
    AlertContent alert;
    bool fallback_spawned = false;
    std::optional<std::string> provider_message_id;
};

std::string render_message(const NotificationJob& job);

nlohmann::json to_json(const NotificationJob& job);

} // namespace notify
} // namespace sos
