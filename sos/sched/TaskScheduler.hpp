#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace sos {
namespace sched {

using TaskId = uint64_t;

// Deadline-driven one-shot tasks. Deadlines are wall-clock ms (core::Clock);
// a deadline already in the past runs as soon as a worker is free.
class TaskScheduler {
public:
    virtual ~TaskScheduler() = default;

    virtual TaskId schedule_at(uint64_t deadline_ms,
                               const std::string& name,
                               std::function<void()> fn) = 0;

    // True only when the task was removed before it started. A task that is
    // already running (or done) is unaffected and false is returned.
    virtual bool cancel(TaskId id) = 0;

    virtual size_t pending() const = 0;
};

} // namespace sched
} // namespace sos
