#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace sos {
namespace notify {

struct NotifyConfig {
    // Delay before the retry that follows the n-th failed attempt.
    std::vector<uint64_t> backoff_ms{5'000, 15'000, 45'000};
    uint32_t max_attempts = 3;

    size_t dedupe_capacity = 10'000;

    // Finished jobs (SENT, DELIVERED, FAILED) stay queryable for provider
    // receipts this long; at most max_finished_jobs are kept.
    uint64_t job_retention_ms = 15 * 60'000;
    size_t max_finished_jobs = 10'000;
};

}
}
