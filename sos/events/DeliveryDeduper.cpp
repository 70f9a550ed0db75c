#include "DeliveryDeduper.hpp"

namespace sos {
namespace events {

DeliveryDeduper::DeliveryDeduper(size_t capacity)
    : m_capacity(capacity == 0 ? 1 : capacity) {}

bool DeliveryDeduper::register_key(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_seen.count(key) > 0)
        return false;

    m_seen.insert(key);
    m_order.push_back(key);

    while (m_order.size() > m_capacity) {
        m_seen.erase(m_order.front());
        m_order.pop_front();
    }
    return true;
}

size_t DeliveryDeduper::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_seen.size();
}

} // namespace events
} // namespace sos
