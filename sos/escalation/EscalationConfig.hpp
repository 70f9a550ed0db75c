#pragma once
#include <cstdint>
#include <vector>

namespace sos {
namespace escalation {

struct EscalationConfig {
    // One window per non-final tier: tier k escalates to k+1 once
    // tier_windows_ms[k-1] has elapsed without an acknowledgment.
    std::vector<uint64_t> tier_windows_ms{120'000};

    uint64_t renotify_interval_ms = 30'000;

    // Backoff for ticks that hit a transient store failure.
    uint64_t retry_base_ms = 1'000;
    uint64_t retry_cap_ms = 30'000;

    uint32_t tier_count() const {
        return static_cast<uint32_t>(tier_windows_ms.size()) + 1;
    }
};

}
}
