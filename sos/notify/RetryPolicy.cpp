#include "RetryPolicy.hpp"

#include <algorithm>
#include <array>

namespace sos {
namespace notify {

static const std::array<const char*, 6> PERMANENT_CODES{
    "INVALID_TOKEN",
    "INVALID_PHONE_NUMBER",
    "INVALID_EMAIL",
    "BLACKLISTED",
    "UNREGISTERED",
    "PERMISSION_DENIED"
};

RetryPolicy::RetryPolicy(const NotifyConfig& cfg) : m_cfg(cfg) {}

bool RetryPolicy::is_permanent(const std::string& error_code) {
    return std::find(PERMANENT_CODES.begin(), PERMANENT_CODES.end(), error_code) != PERMANENT_CODES.end();
}

bool RetryPolicy::should_retry(uint32_t attempts_made, const std::string& error_code) const {
    if (is_permanent(error_code))
        return false;
    return attempts_made < m_cfg.max_attempts;
}

uint64_t RetryPolicy::delay_after(uint32_t attempts_made) const {
    if (m_cfg.backoff_ms.empty() || attempts_made == 0)
        return 0;
    size_t idx = std::min<size_t>(attempts_made, m_cfg.backoff_ms.size()) - 1;
    return m_cfg.backoff_ms[idx];
}

std::optional<Channel> RetryPolicy::fallback_for(Channel c) {
    switch (c) {
        case Channel::PUSH:  return Channel::SMS;
        case Channel::SMS:   return Channel::EMAIL;
        case Channel::EMAIL: return std::nullopt;
    }
    return std::nullopt;
}

} // namespace notify
} // namespace sos
