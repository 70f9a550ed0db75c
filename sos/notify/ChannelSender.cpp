#include "ChannelSender.hpp"
#include "../core/Errors.hpp"

#include <iostream>

namespace sos {
namespace notify {

static const char* missing_destination_code(Channel c) {
    switch (c) {
        case Channel::PUSH:  return "INVALID_TOKEN";
        case Channel::SMS:   return "INVALID_PHONE_NUMBER";
        case Channel::EMAIL: return "INVALID_EMAIL";
    }
    return "INVALID_DESTINATION";
}

ChannelSenderStdout::ChannelSenderStdout(Channel channel) : m_channel(channel) {}

std::string ChannelSenderStdout::send(const NotificationJob& job) {
    std::string to = job.contact.destination(m_channel);
    if (to.empty())
        throw core::DeliveryError(missing_destination_code(m_channel),
                                  "contact " + job.recipient_id + " has no " + to_string(m_channel) + " destination");

    std::cout
        << "[" << to_string(m_channel) << "]"
        << " job=" << job.id
        << " to=" << to
        << " attempt=" << job.attempt
        << " msg=\"" << render_message(job) << "\""
        << "\n";

    return std::string(to_string(m_channel)) + "-" + std::to_string(++m_sent);
}

} // namespace notify
} // namespace sos
