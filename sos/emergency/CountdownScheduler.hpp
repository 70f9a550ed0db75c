#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "../sched/TaskScheduler.hpp"

namespace sos {
namespace emergency {

// Registry of the single countdown task each PENDING emergency may own.
// Firing is delegated to the engine, which serializes it against cancel.
// Each registration carries a generation so a task that was already running
// when its countdown got replaced can tell it is stale.
class CountdownScheduler {
public:
    using FireFn = std::function<void(const std::string& emergency_id, uint64_t generation)>;

    CountdownScheduler(sched::TaskScheduler& scheduler, FireFn fire);
    ~CountdownScheduler();

    CountdownScheduler(const CountdownScheduler&) = delete;
    CountdownScheduler& operator=(const CountdownScheduler&) = delete;

    // Returns false if the emergency already has a countdown.
    bool start(const std::string& emergency_id, uint64_t deadline_ms, uint32_t attempt = 0);

    // Returns true if the task was withdrawn before it ran.
    bool cancel(const std::string& emergency_id);

    // Drops the registration from inside the firing task and returns the
    // attempt number the task was scheduled with (0 when nothing is left
    // registered). Returns nullopt, leaving the registration alone, when a
    // newer countdown has replaced the task's own.
    std::optional<uint32_t> forget(const std::string& emergency_id, uint64_t generation);

    bool is_registered(const std::string& emergency_id) const;
    size_t active() const;

private:
    struct Slot {
        sched::TaskId task = 0;
        uint64_t generation = 0;
        uint32_t attempt = 0;
    };

    sched::TaskScheduler& m_scheduler;
    FireFn m_fire;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Slot> m_slots;
    uint64_t m_next_generation = 1;
};

} // namespace emergency
} // namespace sos
