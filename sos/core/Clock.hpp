#pragma once

#include <cstdint>

namespace sos {
namespace core {

// Wall-clock milliseconds since the Unix epoch. Deadlines are persisted in
// this unit so they survive a restart.
class Clock {
public:
    virtual ~Clock() = default;
    virtual uint64_t now_ms() const = 0;
};

class SystemClock final : public Clock {
public:
    uint64_t now_ms() const override;
};

} // namespace core
} // namespace sos
