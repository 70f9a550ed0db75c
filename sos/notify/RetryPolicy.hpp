#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "NotificationTypes.hpp"
#include "NotifyConfig.hpp"

namespace sos {
namespace notify {

class RetryPolicy {
public:
    explicit RetryPolicy(const NotifyConfig& cfg);

    // Provider codes that no retry can fix.
    static bool is_permanent(const std::string& error_code);

    bool should_retry(uint32_t attempts_made, const std::string& error_code) const;

    // Delay before the next attempt after `attempts_made` failures. Past the
    // end of the schedule the last entry repeats.
    uint64_t delay_after(uint32_t attempts_made) const;

    // PUSH -> SMS -> EMAIL.
    static std::optional<Channel> fallback_for(Channel c);

    uint32_t max_attempts() const { return m_cfg.max_attempts; }

private:
    NotifyConfig m_cfg;
};

} // namespace notify
} // namespace sos
