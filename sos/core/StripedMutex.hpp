#pragma once

#include <array>
#include <functional>
#include <mutex>
#include <string>

namespace sos {
namespace core {

// Per-key serialization point without a global lock: keys hash onto a fixed
// set of mutexes. Two keys may share a stripe, so never hold one stripe
// while acquiring another.
class StripedMutex {
public:
    static constexpr size_t STRIPES = 64;

    std::mutex& for_key(const std::string& key) {
        return m_stripes[std::hash<std::string>{}(key) % STRIPES];
    }

private:
    std::array<std::mutex, STRIPES> m_stripes;
};

} // namespace core
} // namespace sos
