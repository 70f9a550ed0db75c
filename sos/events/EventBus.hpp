#pragma once

#include <functional>
#include <string>

#include "DomainEvent.hpp"

namespace sos {
namespace events {

using EventHandler = std::function<void(const DomainEvent&)>;

// At-least-once publish/subscribe. A handler may see the same event more
// than once and must dedupe on DomainEvent::dedupe_key().
class EventBus {
public:
    virtual ~EventBus() = default;

    // Durable once this returns. Throws core::TransientStoreError otherwise.
    virtual void publish(const std::string& topic, const DomainEvent& event) = 0;

    virtual void subscribe(const std::string& topic, EventHandler handler) = 0;
};

} // namespace events
} // namespace sos
