#pragma once

#include <functional>
#include <string>

namespace sos {
namespace core {

// Keeps a failing timer task or bus handler from taking its worker thread
// (and the process) down with it.
class ThreadSupervisor {
public:
    // Returns false if fn threw; the failure is logged under task_name.
    static bool run_guarded(const std::string& task_name,
                            const std::function<void()>& fn);
};

} // namespace core
} // namespace sos
