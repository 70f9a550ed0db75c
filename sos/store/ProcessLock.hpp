#pragma once

#include <string>

#include "platform/platform.hpp"

namespace sos {
namespace store {

// Keeps a second engine off the same data directory. Held for the lifetime
// of the object.
class ProcessLock {
public:
    explicit ProcessLock(const std::string& data_dir)
        : m_path(data_dir + "/sos_engine.lock")
        , m_fd(plat::acquire_file_lock(m_path)) {}

    ~ProcessLock() {
        plat::release_file_lock(m_fd);
    }

    ProcessLock(const ProcessLock&) = delete;
    ProcessLock& operator=(const ProcessLock&) = delete;

    bool locked() const { return m_fd != -1; }
    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    int m_fd;
};

} // namespace store
} // namespace sos
