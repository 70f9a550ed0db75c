#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "EventBus.hpp"
#include "../core/ThreadSafeQueue.hpp"
#include "../store/Journal.hpp"

namespace sos {
namespace events {

struct BusConfig {
    uint32_t handler_attempts = 3;
    uint64_t handler_retry_base_ms = 100;
};

// In-process bus backed by a hash-chained journal. publish() appends the
// event before queueing it; a single dispatch thread delivers in publish
// order and advances a cursor file once every handler has seen the event.
// After a restart recover() re-queues everything past the cursor.
class JournaledEventBus final : public EventBus {
public:
    // data_dir empty keeps the bus in memory only (no redelivery).
    JournaledEventBus(const std::string& data_dir, BusConfig cfg = BusConfig{});
    ~JournaledEventBus() override;

    JournaledEventBus(const JournaledEventBus&) = delete;
    JournaledEventBus& operator=(const JournaledEventBus&) = delete;

    void publish(const std::string& topic, const DomainEvent& event) override;
    void subscribe(const std::string& topic, EventHandler handler) override;

    // Subscribe first, then recover, then start.
    size_t recover();
    void start();
    void stop();

    // Blocks until every published event has been dispatched.
    void wait_idle();

    uint64_t published() const;
    uint64_t delivered() const;
    uint64_t dead_lettered() const { return m_dead_lettered.load(); }

    store::Journal& journal() { return m_journal; }

private:
    struct Envelope {
        uint64_t seq = 0;
        std::string topic;
        DomainEvent event;
    };

    void dispatch_loop();
    void deliver(const Envelope& env);
    uint64_t read_cursor() const;
    void write_cursor(uint64_t seq);

    BusConfig m_cfg;
    std::string m_cursor_path;
    store::Journal m_journal;

    std::mutex m_handlers_mutex;
    std::unordered_map<std::string, std::vector<EventHandler>> m_handlers;

    std::mutex m_publish_mutex;
    uint64_t m_next_seq = 1;

    core::ThreadSafeQueue<Envelope> m_queue;

    mutable std::mutex m_progress_mutex;
    std::condition_variable m_progress_cv;
    uint64_t m_published = 0;
    uint64_t m_delivered = 0;

    std::atomic<uint64_t> m_dead_lettered{0};
    std::atomic<bool> m_running{false};
    std::thread m_dispatcher;
};

} // namespace events
} // namespace sos
