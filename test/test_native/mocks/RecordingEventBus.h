/**
 * @file RecordingEventBus.h
 * @brief Synchronous in-memory EventBus that keeps every published event
 */

#ifndef RECORDING_EVENT_BUS_H
#define RECORDING_EVENT_BUS_H

#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sos/core/Errors.hpp"
#include "sos/events/EventBus.hpp"

class RecordingEventBus : public sos::events::EventBus {
public:
    void publish(const std::string& topic, const sos::events::DomainEvent& event) override {
        std::vector<sos::events::EventHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_fail_next > 0) {
                --m_fail_next;
                throw sos::core::TransientStoreError("bus unavailable");
            }
            m_events.emplace_back(topic, event);
            auto it = m_handlers.find(topic);
            if (it != m_handlers.end())
                handlers = it->second;
        }
        for (const auto& h : handlers)
            h(event);
    }

    void subscribe(const std::string& topic, sos::events::EventHandler handler) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handlers[topic].push_back(std::move(handler));
    }

    void fail_next_publishes(size_t n) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_fail_next = n;
    }

    std::vector<sos::events::DomainEvent> events() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<sos::events::DomainEvent> out;
        for (const auto& e : m_events)
            out.push_back(e.second);
        return out;
    }

    std::vector<sos::events::DomainEvent> of_type(sos::events::EventType type) const {
        std::vector<sos::events::DomainEvent> out;
        for (const auto& e : events())
            if (e.type == type)
                out.push_back(e);
        return out;
    }

    std::vector<sos::events::DomainEvent> for_emergency(const std::string& id,
                                                        sos::events::EventType type) const {
        std::vector<sos::events::DomainEvent> out;
        for (const auto& e : events())
            if (e.type == type && e.emergency_id == id)
                out.push_back(e);
        return out;
    }

    std::vector<std::string> topics() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> out;
        for (const auto& e : m_events)
            out.push_back(e.first);
        return out;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::pair<std::string, sos::events::DomainEvent>> m_events;
    std::unordered_map<std::string, std::vector<sos::events::EventHandler>> m_handlers;
    size_t m_fail_next = 0;
};

#endif // RECORDING_EVENT_BUS_H
