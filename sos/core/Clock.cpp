#include "Clock.hpp"

#include <chrono>

namespace sos {
namespace core {

uint64_t SystemClock::now_ms() const {
    auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count());
}

} // namespace core
} // namespace sos
