#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "NotificationTypes.hpp"

namespace sos {
namespace notify {

// Delivery provider for one channel. send() returns the provider's message
// id and throws core::DeliveryError (code + message) when the provider
// rejects the job.
class ChannelSender {
public:
    virtual ~ChannelSender() = default;

    virtual Channel channel() const = 0;
    virtual std::string send(const NotificationJob& job) = 0;
};

// Logs the rendered alert instead of calling a provider. Missing
// destinations fail the way a real provider would.
class ChannelSenderStdout final : public ChannelSender {
public:
    explicit ChannelSenderStdout(Channel channel);

    Channel channel() const override { return m_channel; }
    std::string send(const NotificationJob& job) override;

private:
    Channel m_channel;
    std::atomic<uint64_t> m_sent{0};
};

} // namespace notify
} // namespace sos
