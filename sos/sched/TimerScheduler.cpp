#include "TimerScheduler.hpp"
#include "../core/ThreadSupervisor.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace sos {
namespace sched {

static constexpr uint64_t MAX_TIMER_WAIT_MS = 1'000;

TimerScheduler::TimerScheduler(core::Clock& clock, size_t worker_threads)
    : m_clock(clock), m_worker_count(std::max<size_t>(1, worker_threads)) {}

TimerScheduler::~TimerScheduler() {
    stop();
}

void TimerScheduler::start() {
    if (m_running.exchange(true))
        return;

    m_timer = std::thread(&TimerScheduler::timer_loop, this);
    for (size_t i = 0; i < m_worker_count; ++i)
        m_workers.emplace_back(&TimerScheduler::worker_loop, this);

    std::cout << "[Scheduler] Started with " << m_worker_count << " workers\n";
}

void TimerScheduler::stop() {
    if (!m_running.exchange(false))
        return;

    m_cv.notify_all();
    if (m_timer.joinable()) m_timer.join();

    // Tasks already handed to workers finish; timed ones are dropped and
    // recovered from the store on the next start.
    m_ready.close();
    for (auto& t : m_workers)
        if (t.joinable()) t.join();
    m_workers.clear();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_tasks.empty())
        std::cout << "[Scheduler] Stopped with " << m_tasks.size() << " timed tasks pending\n";
    m_tasks.clear();
    m_deadline_by_id.clear();
}

TaskId TimerScheduler::schedule_at(uint64_t deadline_ms,
                                   const std::string& name,
                                   std::function<void()> fn) {
    TaskId id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        id = m_next_id++;
        Task task;
        task.id = id;
        task.name = name;
        task.fn = std::move(fn);
        m_tasks.emplace(Key{deadline_ms, id}, std::move(task));
        m_deadline_by_id[id] = deadline_ms;
    }
    m_cv.notify_all();
    return id;
}

bool TimerScheduler::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_deadline_by_id.find(id);
    if (it == m_deadline_by_id.end())
        return false;

    m_tasks.erase(Key{it->second, id});
    m_deadline_by_id.erase(it);
    return true;
}

size_t TimerScheduler::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void TimerScheduler::timer_loop() {
    std::unique_lock<std::mutex> lock(m_mutex);

    while (m_running.load()) {
        uint64_t now = m_clock.now_ms();

        while (!m_tasks.empty() && m_tasks.begin()->first.first <= now) {
            auto node = m_tasks.extract(m_tasks.begin());
            m_deadline_by_id.erase(node.key().second);
            if (!m_ready.push(std::move(node.mapped())))
                return;
        }

        uint64_t wait_ms = MAX_TIMER_WAIT_MS;
        if (!m_tasks.empty())
            wait_ms = std::min(wait_ms, m_tasks.begin()->first.first - now);

        m_cv.wait_for(lock, std::chrono::milliseconds(wait_ms));
    }
}

void TimerScheduler::worker_loop() {
    Task task;
    while (m_ready.wait_and_pop(task)) {
        core::ThreadSupervisor::run_guarded(task.name, task.fn);
        task = Task{};
    }
}

} // namespace sched
} // namespace sos
