#include "JournaledEventBus.hpp"
#include "../core/Errors.hpp"
#include "../core/ThreadSupervisor.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>

namespace sos {
namespace events {

JournaledEventBus::JournaledEventBus(const std::string& data_dir, BusConfig cfg)
    : m_cfg(cfg)
    , m_cursor_path(data_dir.empty() ? "" : data_dir + "/events.cursor")
    , m_journal(data_dir.empty() ? "" : data_dir + "/events.journal") {}

JournaledEventBus::~JournaledEventBus() {
    stop();
}

void JournaledEventBus::subscribe(const std::string& topic, EventHandler handler) {
    std::lock_guard<std::mutex> lock(m_handlers_mutex);
    m_handlers[topic].push_back(std::move(handler));
}

void JournaledEventBus::publish(const std::string& topic, const DomainEvent& event) {
    Envelope env;
    {
        std::lock_guard<std::mutex> lock(m_publish_mutex);
        env.seq = m_next_seq;
        env.topic = topic;
        env.event = event;

        m_journal.append({{"seq", env.seq}, {"topic", topic}, {"event", to_json(event)}});
        ++m_next_seq;

        {
            std::lock_guard<std::mutex> progress(m_progress_mutex);
            m_published = env.seq;
        }
        if (!m_queue.push(env))
            std::cerr << "[EventBus] Bus stopped; " << event.dedupe_key()
                      << " stays journaled for redelivery\n";
    }
}

size_t JournaledEventBus::recover() {
    uint64_t cursor = read_cursor();
    std::vector<Envelope> pending;
    uint64_t last_seq = 0;

    m_journal.replay([&](const nlohmann::json& r) {
        Envelope env;
        env.seq = r.at("seq").get<uint64_t>();
        env.topic = r.at("topic").get<std::string>();
        env.event = event_from_json(r.at("event"));
        last_seq = std::max(last_seq, env.seq);
        if (env.seq > cursor)
            pending.push_back(std::move(env));
    });

    {
        std::lock_guard<std::mutex> lock(m_publish_mutex);
        m_next_seq = last_seq + 1;
        std::lock_guard<std::mutex> progress(m_progress_mutex);
        m_published = last_seq;
        m_delivered = std::min(cursor, last_seq);
    }

    for (auto& env : pending)
        m_queue.push(std::move(env));

    if (m_journal.persistent())
        std::cout << "[EventBus] Recovered journal: last_seq=" << last_seq
                  << " cursor=" << cursor << " redelivering=" << pending.size() << "\n";
    return pending.size();
}

void JournaledEventBus::start() {
    if (m_running.exchange(true))
        return;
    m_dispatcher = std::thread(&JournaledEventBus::dispatch_loop, this);
}

void JournaledEventBus::stop() {
    if (!m_running.exchange(false))
        return;
    m_queue.close();
    if (m_dispatcher.joinable())
        m_dispatcher.join();
    std::cout << "[EventBus] Stopped: published=" << published()
              << " delivered=" << delivered()
              << " dead_lettered=" << m_dead_lettered.load() << "\n";
}

void JournaledEventBus::wait_idle() {
    std::unique_lock<std::mutex> lock(m_progress_mutex);
    m_progress_cv.wait(lock, [this] { return m_delivered >= m_published || !m_running.load(); });
}

uint64_t JournaledEventBus::published() const {
    std::lock_guard<std::mutex> lock(m_progress_mutex);
    return m_published;
}

uint64_t JournaledEventBus::delivered() const {
    std::lock_guard<std::mutex> lock(m_progress_mutex);
    return m_delivered;
}

void JournaledEventBus::dispatch_loop() {
    Envelope env;
    while (m_queue.wait_and_pop(env)) {
        deliver(env);
        write_cursor(env.seq);
        {
            std::lock_guard<std::mutex> lock(m_progress_mutex);
            m_delivered = std::max(m_delivered, env.seq);
        }
        m_progress_cv.notify_all();
    }
    m_progress_cv.notify_all();
}

void JournaledEventBus::deliver(const Envelope& env) {
    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(m_handlers_mutex);
        auto it = m_handlers.find(env.topic);
        if (it != m_handlers.end())
            handlers = it->second;
    }

    const std::string task = env.topic + " " + env.event.dedupe_key();

    for (const auto& handler : handlers) {
        uint64_t delay = m_cfg.handler_retry_base_ms;
        bool ok = false;
        for (uint32_t attempt = 1; attempt <= m_cfg.handler_attempts; ++attempt) {
            ok = core::ThreadSupervisor::run_guarded(task, [&] { handler(env.event); });
            if (ok) break;
            if (attempt < m_cfg.handler_attempts) {
                std::this_thread::sleep_for(std::chrono::milliseconds(delay));
                delay *= 2;
            }
        }
        if (!ok) {
            ++m_dead_lettered;
            std::cerr << "[EventBus] DEAD LETTER seq=" << env.seq << " " << task
                      << " after " << m_cfg.handler_attempts << " attempts\n";
        }
    }
}

uint64_t JournaledEventBus::read_cursor() const {
    if (m_cursor_path.empty())
        return 0;
    std::ifstream in(m_cursor_path);
    uint64_t cursor = 0;
    if (in.is_open() && !(in >> cursor))
        cursor = 0;
    return cursor;
}

void JournaledEventBus::write_cursor(uint64_t seq) {
    if (m_cursor_path.empty())
        return;

    const std::string tmp = m_cursor_path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        out << seq << "\n";
        if (!out.good()) {
            std::cerr << "[EventBus] Failed to write cursor " << tmp << "\n";
            return;
        }
    }
    if (std::rename(tmp.c_str(), m_cursor_path.c_str()) != 0)
        std::cerr << "[EventBus] Failed to move cursor into place at " << m_cursor_path << "\n";
}

} // namespace events
} // namespace sos
