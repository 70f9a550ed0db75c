/**
 * @file ScriptedChannelSender.h
 * @brief ChannelSender whose outcomes are queued up by the test
 */

#ifndef SCRIPTED_CHANNEL_SENDER_H
#define SCRIPTED_CHANNEL_SENDER_H

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "MockClock.h"
#include "sos/core/Errors.hpp"
#include "sos/notify/ChannelSender.hpp"

class ScriptedChannelSender : public sos::notify::ChannelSender {
public:
    struct Call {
        std::string job_id;
        std::string recipient_id;
        uint32_t attempt = 0;
        uint64_t at_ms = 0;
    };

    ScriptedChannelSender(sos::notify::Channel channel, const MockClock& clock)
        : m_channel(channel), m_clock(clock) {}

    sos::notify::Channel channel() const override { return m_channel; }

    std::string send(const sos::notify::NotificationJob& job) override {
        std::string code;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_calls.push_back(Call{job.id, job.recipient_id, job.attempt, m_clock.now_ms()});
            if (!m_script.empty()) {
                code = m_script.front();
                m_script.pop_front();
            } else {
                code = m_default;
            }
        }
        if (!code.empty())
            throw sos::core::DeliveryError(code, "scripted failure");
        return "msg-" + job.id;
    }

    // Empty string = success.
    void script(const std::vector<std::string>& outcomes) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_script.insert(m_script.end(), outcomes.begin(), outcomes.end());
    }

    void fail_always(const std::string& code) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_default = code;
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

private:
    sos::notify::Channel m_channel;
    const MockClock& m_clock;
    mutable std::mutex m_mutex;
    std::deque<std::string> m_script;
    std::string m_default;
    std::vector<Call> m_calls;
};

#endif // SCRIPTED_CHANNEL_SENDER_H
