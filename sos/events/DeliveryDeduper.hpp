#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>

namespace sos {
namespace events {

// Remembers recently seen dedupe keys so a redelivered event is handled
// once. Oldest keys are evicted first once capacity is reached.
class DeliveryDeduper {
public:
    explicit DeliveryDeduper(size_t capacity);

    // Returns true if the key is new, false if it was already seen.
    bool register_key(const std::string& key);

    size_t size() const;

private:
    size_t m_capacity;
    std::unordered_set<std::string> m_seen;
    std::deque<std::string> m_order;
    mutable std::mutex m_mutex;
};

} // namespace events
} // namespace sos
