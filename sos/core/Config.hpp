#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

#include "../escalation/EscalationConfig.hpp"
#include "../notify/NotifyConfig.hpp"

namespace sos {
namespace core {

struct ServerConfig {
    int port = 8080;
    int recv_timeout_ms = 5'000;
};

struct EmergencyConfig {
    int default_countdown_seconds = 10;
    int min_countdown_seconds = 5;
    int max_countdown_seconds = 30;
    int auto_countdown_seconds = 30;
    int max_open_per_user = 1;

    // Backoff for a countdown fire that hit a transient store failure.
    uint64_t fire_retry_base_ms = 1'000;
    uint64_t fire_retry_cap_ms = 30'000;
};

struct StoreConfig {
    // Empty keeps everything in memory (no journal, no recovery).
    std::string data_dir = "data";
};

struct SchedulerConfig {
    size_t worker_threads = 4;
};

struct DeviceConfig {
    std::string secret;
    std::unordered_map<std::string, std::string> owners;  // deviceId -> userId
};

struct DirectoryConfig {
    std::string contacts_file = "config/contacts.json";
};

struct EngineConfig {
    ServerConfig server;
    EmergencyConfig emergency;
    escalation::EscalationConfig escalation;
    notify::NotifyConfig notify;
    StoreConfig store;
    SchedulerConfig scheduler;
    DeviceConfig device;
    DirectoryConfig directory;
};

// INI loader: [section] headers, key = value pairs, '#' or ';' comments.
// Unknown keys are ignored, missing keys keep their defaults. Throws
// ValidationError on a malformed value or an inconsistent result and
// std::runtime_error if the file cannot be opened.
EngineConfig load_config(const std::string& path);

EngineConfig parse_config(const std::string& text);

void validate_config(const EngineConfig& cfg);

} // namespace core
} // namespace sos
