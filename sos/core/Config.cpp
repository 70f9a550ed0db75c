#include "Config.hpp"
#include "Errors.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace sos {
namespace core {

static std::string trim(std::string s) {
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
    return s;
}

static long long to_integer(const std::string& section,
                            const std::string& key,
                            const std::string& val) {
    try {
        size_t used = 0;
        long long v = std::stoll(val, &used);
        if (used != val.size())
            throw std::invalid_argument(val);
        return v;
    } catch (const std::logic_error&) {
        throw ValidationError("config [" + section + "] " + key +
                              ": expected integer, got '" + val + "'");
    }
}

static uint64_t to_unsigned(const std::string& section,
                            const std::string& key,
                            const std::string& val) {
    long long v = to_integer(section, key, val);
    if (v < 0)
        throw ValidationError("config [" + section + "] " + key + " must be >= 0");
    return static_cast<uint64_t>(v);
}

// "120, 300" -> {120000, 300000}
static std::vector<uint64_t> to_seconds_list_ms(const std::string& section,
                                                const std::string& key,
                                                const std::string& val) {
    std::vector<uint64_t> out;
    std::stringstream ss(val);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) continue;
        out.push_back(to_unsigned(section, key, item) * 1000);
    }
    return out;
}

static void apply(EngineConfig& cfg,
                  const std::string& section,
                  const std::string& key,
                  const std::string& val) {
    if (section == "server") {
        if (key == "port") cfg.server.port = static_cast<int>(to_integer(section, key, val));
        if (key == "recv_timeout_ms") cfg.server.recv_timeout_ms = static_cast<int>(to_integer(section, key, val));
    }
    else if (section == "emergency") {
        EmergencyConfig& e = cfg.emergency;
        if (key == "default_countdown_seconds") e.default_countdown_seconds = static_cast<int>(to_integer(section, key, val));
        if (key == "min_countdown_seconds") e.min_countdown_seconds = static_cast<int>(to_integer(section, key, val));
        if (key == "max_countdown_seconds") e.max_countdown_seconds = static_cast<int>(to_integer(section, key, val));
        if (key == "auto_countdown_seconds") e.auto_countdown_seconds = static_cast<int>(to_integer(section, key, val));
        if (key == "max_open_per_user") e.max_open_per_user = static_cast<int>(to_integer(section, key, val));
        if (key == "fire_retry_base_ms") e.fire_retry_base_ms = to_unsigned(section, key, val);
        if (key == "fire_retry_cap_ms") e.fire_retry_cap_ms = to_unsigned(section, key, val);
    }
    else if (section == "escalation") {
        escalation::EscalationConfig& e = cfg.escalation;
        if (key == "tier_windows_sec") e.tier_windows_ms = to_seconds_list_ms(section, key, val);
        if (key == "renotify_interval_sec") e.renotify_interval_ms = to_unsigned(section, key, val) * 1000;
        if (key == "retry_base_ms") e.retry_base_ms = to_unsigned(section, key, val);
        if (key == "retry_cap_ms") e.retry_cap_ms = to_unsigned(section, key, val);
    }
    else if (section == "notify") {
        if (key == "backoff_sec") cfg.notify.backoff_ms = to_seconds_list_ms(section, key, val);
        if (key == "max_attempts") cfg.notify.max_attempts = static_cast<uint32_t>(to_unsigned(section, key, val));
        if (key == "dedupe_capacity") cfg.notify.dedupe_capacity = static_cast<size_t>(to_unsigned(section, key, val));
        if (key == "job_retention_sec") cfg.notify.job_retention_ms = to_unsigned(section, key, val) * 1000;
        if (key == "max_finished_jobs") cfg.notify.max_finished_jobs = static_cast<size_t>(to_unsigned(section, key, val));
    }
    else if (section == "store") {
        if (key == "data_dir") cfg.store.data_dir = val;
    }
    else if (section == "scheduler") {
        if (key == "worker_threads") cfg.scheduler.worker_threads = static_cast<size_t>(to_unsigned(section, key, val));
    }
    else if (section == "device") {
        if (key == "secret") cfg.device.secret = val;
    }
    else if (section == "devices") {
        cfg.device.owners[key] = val;
    }
    else if (section == "directory") {
        if (key == "contacts_file") cfg.directory.contacts_file = val;
    }
}

EngineConfig parse_config(const std::string& text) {
    EngineConfig cfg;
    std::istringstream in(text);

    std::string line;
    std::string section;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line.front() == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        apply(cfg, section, key, val);
    }

    validate_config(cfg);
    return cfg;
}

EngineConfig load_config(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("cannot open config file " + path);

    std::ostringstream ss;
    ss << f.rdbuf();
    return parse_config(ss.str());
}

void validate_config(const EngineConfig& cfg) {
    const EmergencyConfig& e = cfg.emergency;

    if (cfg.server.port <= 0 || cfg.server.port > 65535)
        throw ValidationError("config [server] port out of range");
    if (e.min_countdown_seconds < 0 || e.min_countdown_seconds > e.max_countdown_seconds)
        throw ValidationError("config [emergency] countdown range is empty");
    if (e.default_countdown_seconds < e.min_countdown_seconds ||
        e.default_countdown_seconds > e.max_countdown_seconds)
        throw ValidationError("config [emergency] default_countdown_seconds outside range");
    if (e.auto_countdown_seconds < 0)
        throw ValidationError("config [emergency] auto_countdown_seconds must be >= 0");
    if (e.max_open_per_user < 1)
        throw ValidationError("config [emergency] max_open_per_user must be >= 1");

    if (cfg.escalation.tier_windows_ms.empty())
        throw ValidationError("config [escalation] tier_windows_sec needs at least one tier window");
    if (cfg.escalation.renotify_interval_ms == 0)
        throw ValidationError("config [escalation] renotify_interval_sec must be > 0");

    if (cfg.notify.max_attempts == 0)
        throw ValidationError("config [notify] max_attempts must be >= 1");
    if (cfg.notify.backoff_ms.empty())
        throw ValidationError("config [notify] backoff_sec needs at least one delay");

    if (cfg.scheduler.worker_threads == 0)
        throw ValidationError("config [scheduler] worker_threads must be >= 1");
}

} // namespace core
} // namespace sos
