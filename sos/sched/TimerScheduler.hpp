#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "TaskScheduler.hpp"
#include "../core/Clock.hpp"
#include "../core/ThreadSafeQueue.hpp"

namespace sos {
namespace sched {

// One timer thread ordering tasks by (deadline, id) and a small worker pool
// that runs them under ThreadSupervisor. The timer re-reads the clock at
// least once a second, so wall-clock jumps are picked up.
class TimerScheduler final : public TaskScheduler {
public:
    TimerScheduler(core::Clock& clock, size_t worker_threads);
    ~TimerScheduler() override;

    TimerScheduler(const TimerScheduler&) = delete;
    TimerScheduler& operator=(const TimerScheduler&) = delete;

    void start();
    void stop();

    TaskId schedule_at(uint64_t deadline_ms,
                       const std::string& name,
                       std::function<void()> fn) override;

    bool cancel(TaskId id) override;

    size_t pending() const override;

private:
    struct Task {
        TaskId id = 0;
        std::string name;
        std::function<void()> fn;
    };

    using Key = std::pair<uint64_t, TaskId>;

    void timer_loop();
    void worker_loop();

    core::Clock& m_clock;
    size_t m_worker_count;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<Key, Task> m_tasks;
    std::unordered_map<TaskId, uint64_t> m_deadline_by_id;
    TaskId m_next_id = 1;

    core::ThreadSafeQueue<Task> m_ready;

    std::atomic<bool> m_running{false};
    std::thread m_timer;
    std::vector<std::thread> m_workers;
};

} // namespace sched
} // namespace sos
