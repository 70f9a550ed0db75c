#include "CountdownScheduler.hpp"

#include <iostream>

namespace sos {
namespace emergency {

CountdownScheduler::CountdownScheduler(sched::TaskScheduler& scheduler, FireFn fire)
    : m_scheduler(scheduler), m_fire(std::move(fire)) {}

CountdownScheduler::~CountdownScheduler() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& [id, slot] : m_slots)
        m_scheduler.cancel(slot.task);
    m_slots.clear();
}

bool CountdownScheduler::start(const std::string& emergency_id, uint64_t deadline_ms, uint32_t attempt) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_slots.count(emergency_id) > 0)
        return false;

    Slot slot;
    slot.attempt = attempt;
    slot.generation = m_next_generation++;
    const uint64_t generation = slot.generation;
    slot.task = m_scheduler.schedule_at(deadline_ms, "countdown " + emergency_id,
        [this, emergency_id, generation] { m_fire(emergency_id, generation); });
    m_slots.emplace(emergency_id, slot);

    std::cout << "[Countdown] id=" << emergency_id << " armed deadline=" << deadline_ms;
    if (attempt > 0) std::cout << " attempt=" << attempt;
    std::cout << "\n";
    return true;
}

bool CountdownScheduler::cancel(const std::string& emergency_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_slots.find(emergency_id);
    if (it == m_slots.end())
        return false;

    bool withdrawn = m_scheduler.cancel(it->second.task);
    m_slots.erase(it);
    std::cout << "[Countdown] id=" << emergency_id << (withdrawn ? " cancelled" : " already firing") << "\n";
    return withdrawn;
}

std::optional<uint32_t> CountdownScheduler::forget(const std::string& emergency_id, uint64_t generation) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_slots.find(emergency_id);
    if (it == m_slots.end())
        return uint32_t{0};
    if (it->second.generation != generation)
        return std::nullopt;
    uint32_t attempt = it->second.attempt;
    m_slots.erase(it);
    return attempt;
}

bool CountdownScheduler::is_registered(const std::string& emergency_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.count(emergency_id) > 0;
}

size_t CountdownScheduler::active() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.size();
}

} // namespace emergency
} // namespace sos
